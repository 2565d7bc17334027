// ========================= src/core/Sentence.hpp =========================
#pragma once
#include "Types.hpp"

namespace ms {

    // "Exactly count() of cells() are mines."
    // Always holds 0 <= count <= |cells|; anything that would break that throws ContradictionError.
    class Sentence {
    public:
        Sentence(CellSet cells, int count);

        const CellSet& cells() const { return members; }
        int count() const { return mineCount; }
        int size() const { return static_cast<int>(members.size()); }
        bool empty() const { return members.empty(); }
        bool contains(const Cell& c) const { return members.count(c) != 0; }

        // copies, so callers may mark them on this sentence while iterating
        CellSet knownMines() const;
        CellSet knownSafes() const;

        void markMine(const Cell& c);
        void markSafe(const Cell& c);

        bool operator==(const Sentence& o) const { return mineCount == o.mineCount && members == o.members; }
        bool operator!=(const Sentence& o) const { return !(*this == o); }

        std::string toString() const;

    private:
        CellSet members;
        int mineCount{ 0 };
    };

} // namespace ms
