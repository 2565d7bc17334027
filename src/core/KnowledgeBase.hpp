// ========================= src/core/KnowledgeBase.hpp =========================
#pragma once
#include "Sentence.hpp"
#include <optional>
#include <vector>

namespace ms {

    // Player-side knowledge about one board: what has been clicked, what is proven,
    // and the sentences that are not resolved yet.
    class KnowledgeBase {
    public:
        explicit KnowledgeBase(int height = 8, int width = 8);

        // Record that `cell` was revealed safely and shows `count` neighboring mines,
        // then run inference to a fixed point.
        // Throws std::invalid_argument on a bad cell/count, ContradictionError on inconsistent facts.
        void addKnowledge(const Cell& cell, int count);

        void markMine(const Cell& cell);
        void markSafe(const Cell& cell);

        std::optional<Cell> makeSafeMove() const;
        std::optional<Cell> makeRandomMove(RNG& rng) const;

        int height() const { return h; }
        int width() const { return w; }
        bool inBounds(const Cell& c) const { return ms::inBounds(c, h, w); }

        const CellSet& movesMade() const { return moves; }
        const CellSet& mines() const { return mineCells; }
        const CellSet& safes() const { return safeCells; }
        const std::vector<Sentence>& knowledge() const { return sentences; }

        long long lastPassCount() const { return passes; }
        long long maxPasses() const;

    private:
        int h{ 8 };
        int w{ 8 };
        CellSet moves;
        CellSet mineCells;
        CellSet safeCells;
        std::vector<Sentence> sentences;
        long long passes{ 0 };

        void infer();
        bool applyKnownFacts();
        bool pruneResolved();
        bool deriveSubsets();
        bool known(const Sentence& s) const;
    };

} // namespace ms
