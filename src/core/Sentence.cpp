// ========================= src/core/Sentence.cpp =========================
#include "Sentence.hpp"
#include <utility>

namespace ms {

    Sentence::Sentence(CellSet cells, int count) :members(std::move(cells)), mineCount(count) {
        if (mineCount < 0 || mineCount > size()) {
            throw ContradictionError("sentence " + toString() + " needs between 0 and " + std::to_string(size()) + " mines");
        }
    }

    CellSet Sentence::knownMines() const {
        if (mineCount == size()) return members;
        return {};
    }

    CellSet Sentence::knownSafes() const {
        if (mineCount == 0) return members;
        return {};
    }

    void Sentence::markMine(const Cell& c) {
        auto it = members.find(c);
        if (it == members.end()) return;
        if (mineCount == 0) {
            throw ContradictionError(c.toString() + " marked as a mine but " + toString() + " has no mines left");
        }
        members.erase(it);
        --mineCount;
    }

    void Sentence::markSafe(const Cell& c) {
        auto it = members.find(c);
        if (it == members.end()) return;
        if (mineCount == size()) {
            throw ContradictionError(c.toString() + " marked as safe but every cell of " + toString() + " is a mine");
        }
        members.erase(it);
    }

    std::string Sentence::toString() const {
        return ms::toString(members) + " = " + std::to_string(mineCount);
    }

} // namespace ms
