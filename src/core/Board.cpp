// ========================= src/core/Board.cpp =========================
#include "Board.hpp"
#include <sstream>

namespace ms {

    uint64_t RNG::next() { s ^= s << 13; s ^= s >> 7; s ^= s << 17; return s; }
    int RNG::irange(int lo, int hi) { return lo + int(next() % uint64_t(hi - lo + 1)); }

    void Board::checkParams(const Params& p) {
        if (!fitsGrid(p.height, p.width)) {
            throw std::invalid_argument("board must be at least 1x1 and at most " + std::to_string(kMaxCells) + " cells, got " + std::to_string(p.height) + "x" + std::to_string(p.width));
        }
        if (p.mines < 0 || p.mines > p.cellCount()) {
            throw std::invalid_argument(std::to_string(p.mines) + " mines do not fit on a " + std::to_string(p.height) + "x" + std::to_string(p.width) + " board");
        }
    }

    Board::Board(const Params& p_, RNG& rng) :p(p_) {
        checkParams(p);
        grid.assign(p.cellCount(), 0);
        while (static_cast<int>(mineCells.size()) != p.mines) {
            Cell c{ rng.irange(0, p.height - 1), rng.irange(0, p.width - 1) };
            if (grid[index(c)]) continue;
            grid[index(c)] = 1;
            mineCells.insert(c);
        }
    }

    Board::Board(int height, int width, const CellSet& mines) {
        p.height = height; p.width = width; p.mines = static_cast<int>(mines.size());
        checkParams(p);
        grid.assign(p.cellCount(), 0);
        for (const auto& c : mines) {
            checkBounds(c);
            grid[index(c)] = 1;
        }
        mineCells = mines;
    }

    void Board::checkBounds(const Cell& c) const {
        if (!inBounds(c)) {
            throw std::invalid_argument("cell " + c.toString() + " is outside the " + std::to_string(p.height) + "x" + std::to_string(p.width) + " board");
        }
    }

    bool Board::isMine(const Cell& c) const {
        checkBounds(c);
        return grid[index(c)] != 0;
    }

    int Board::nearbyMines(const Cell& c) const {
        checkBounds(c);
        int count = 0;
        for (const auto& n : neighborsOf(c, p.height, p.width)) {
            if (grid[index(n)]) ++count;
        }
        return count;
    }

    void Board::flag(const Cell& c) {
        checkBounds(c);
        found.insert(c);
    }

    void Board::setFlags(const CellSet& cells) {
        for (const auto& c : cells) checkBounds(c);
        found = cells;
    }

    std::string Board::toString() const {
        std::ostringstream oss;
        const std::string rule = std::string(2 * p.width, '-') + "-\n";
        for (int r = 0; r < p.height; ++r) {
            oss << rule;
            for (int c = 0; c < p.width; ++c) oss << (grid[index({ r, c })] ? "|X" : "| ");
            oss << "|\n";
        }
        oss << rule;
        return oss.str();
    }

} // namespace ms
