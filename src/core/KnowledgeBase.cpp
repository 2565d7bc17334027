// ========================= src/core/KnowledgeBase.cpp =========================
#include "KnowledgeBase.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

namespace ms {

    // Every sentence is a subset of one cell's neighborhood, so a run of passes that only
    // derives sentences is limited by the 2^8 subsets of that neighborhood.
    static constexpr int kSubsetsPerNeighborhood = 1 << kMaxNeighbors;

    KnowledgeBase::KnowledgeBase(int height, int width) :h(height), w(width) {
        if (!fitsGrid(h, w)) {
            throw std::invalid_argument("board must be at least 1x1 and at most " + std::to_string(kMaxCells) + " cells, got " + std::to_string(h) + "x" + std::to_string(w));
        }
    }

    long long KnowledgeBase::maxPasses() const {
        return (static_cast<long long>(h) * w + 1) * kSubsetsPerNeighborhood;
    }

    void KnowledgeBase::markMine(const Cell& cell) {
        if (safeCells.count(cell)) throw ContradictionError(cell.toString() + " is already known to be safe");
        mineCells.insert(cell);
        for (auto& s : sentences) s.markMine(cell);
    }

    void KnowledgeBase::markSafe(const Cell& cell) {
        if (mineCells.count(cell)) throw ContradictionError(cell.toString() + " is already known to be a mine");
        safeCells.insert(cell);
        for (auto& s : sentences) s.markSafe(cell);
    }

    void KnowledgeBase::addKnowledge(const Cell& cell, int count) {
        if (!inBounds(cell)) {
            throw std::invalid_argument("cell " + cell.toString() + " is outside the " + std::to_string(h) + "x" + std::to_string(w) + " board");
        }
        if (moves.count(cell)) {
            throw std::invalid_argument("cell " + cell.toString() + " was already revealed");
        }
        const auto around = neighborsOf(cell, h, w);
        if (count < 0 || count > static_cast<int>(around.size())) {
            throw std::invalid_argument("cell " + cell.toString() + " cannot border " + std::to_string(count) + " mines");
        }

        moves.insert(cell);
        markSafe(cell);

        // known mines are already accounted for; known safes say nothing
        CellSet unknown; int remaining = count;
        for (const auto& n : around) {
            if (mineCells.count(n)) { --remaining; continue; }
            if (safeCells.count(n)) continue;
            unknown.insert(n);
        }
        Sentence fresh(std::move(unknown), remaining);
        spdlog::debug("[KnowledgeBase] {} shows {}: {}", cell.toString(), count, fresh.toString());
        if (!fresh.empty() && !known(fresh)) sentences.push_back(std::move(fresh));

        infer();
    }

    void KnowledgeBase::infer() {
        const long long cap = maxPasses();
        passes = 0;
        bool changed = true;
        while (changed) {
            if (passes >= cap) {
                throw ContradictionError("inference did not converge after " + std::to_string(passes) + " passes");
            }
            ++passes;
            changed = false;
            changed |= applyKnownFacts();
            changed |= pruneResolved();
            changed |= deriveSubsets();
        }
        spdlog::debug("[KnowledgeBase] fixed point after {} passes: {} sentences, {} safes, {} mines",
            passes, sentences.size(), safeCells.size(), mineCells.size());
    }

    bool KnowledgeBase::applyKnownFacts() {
        // collect first: marking rewrites the sentences being scanned
        CellSet newSafes, newMines;
        for (const auto& s : sentences) {
            for (const auto& c : s.knownSafes()) if (!safeCells.count(c)) newSafes.insert(c);
            for (const auto& c : s.knownMines()) if (!mineCells.count(c)) newMines.insert(c);
        }
        for (const auto& c : newSafes) markSafe(c);
        for (const auto& c : newMines) markMine(c);
        return !newSafes.empty() || !newMines.empty();
    }

    bool KnowledgeBase::pruneResolved() {
        std::vector<Sentence> kept; kept.reserve(sentences.size());
        for (auto& s : sentences) {
            if (s.empty()) continue;
            bool duplicate = false;
            for (const auto& k : kept) {
                if (k.cells() != s.cells()) continue;
                if (k.count() != s.count()) {
                    throw ContradictionError("conflicting sentences " + k.toString() + " and " + s.toString());
                }
                duplicate = true; break;
            }
            if (!duplicate) kept.push_back(std::move(s));
        }
        const bool changed = kept.size() != sentences.size();
        sentences.swap(kept);
        return changed;
    }

    bool KnowledgeBase::deriveSubsets() {
        std::vector<Sentence> derived;
        for (const auto& s1 : sentences) {
            if (s1.empty()) continue;
            for (const auto& s2 : sentences) {
                if (s1.size() >= s2.size()) continue; // strict subsets only
                const auto& a = s1.cells();
                const auto& b = s2.cells();
                if (!std::includes(b.begin(), b.end(), a.begin(), a.end())) continue;

                CellSet rest;
                std::set_difference(b.begin(), b.end(), a.begin(), a.end(), std::inserter(rest, rest.end()));
                Sentence candidate(std::move(rest), s2.count() - s1.count());
                if (known(candidate)) continue;
                if (std::find(derived.begin(), derived.end(), candidate) != derived.end()) continue;
                derived.push_back(std::move(candidate));
            }
        }
        for (auto& d : derived) sentences.push_back(std::move(d));
        return !derived.empty();
    }

    bool KnowledgeBase::known(const Sentence& s) const {
        return std::find(sentences.begin(), sentences.end(), s) != sentences.end();
    }

    std::optional<Cell> KnowledgeBase::makeSafeMove() const {
        for (const auto& c : safeCells) {
            if (!moves.count(c)) return c;
        }
        return std::nullopt;
    }

    std::optional<Cell> KnowledgeBase::makeRandomMove(RNG& rng) const {
        std::vector<Cell> candidates;
        for (int r = 0; r < h; ++r) {
            for (int c = 0; c < w; ++c) {
                Cell cell{ r, c };
                if (!moves.count(cell) && !mineCells.count(cell)) candidates.push_back(cell);
            }
        }
        if (candidates.empty()) return std::nullopt;
        return candidates[rng.irange(0, static_cast<int>(candidates.size()) - 1)];
    }

} // namespace ms
