// ========================= src/core/Board.hpp =========================
#pragma once
#include "Types.hpp"
#include <vector>

namespace ms {

    // Ground truth for one game: where the mines are and which cells are flagged.
    class Board {
    public:
        // random layout with exactly p.mines distinct mines
        Board(const Params& p, RNG& rng);
        // fixed layout (replays, tests)
        Board(int height, int width, const CellSet& mines);

        const Params& params() const { return p; }
        int height() const { return p.height; }
        int width() const { return p.width; }
        bool inBounds(const Cell& c) const { return ms::inBounds(c, p.height, p.width); }

        bool isMine(const Cell& c) const;
        int nearbyMines(const Cell& c) const;

        const CellSet& mines() const { return mineCells; }
        const CellSet& flags() const { return found; }
        void flag(const Cell& c);
        void unflag(const Cell& c) { found.erase(c); }
        void setFlags(const CellSet& cells);

        // every mine flagged, nothing else
        bool won() const { return found == mineCells; }

        std::string toString() const;

    private:
        Params p;
        std::vector<uint8_t> grid; // 1 = mine, row-major
        CellSet mineCells;
        CellSet found;

        int index(const Cell& c) const { return c.row * p.width + c.col; }
        void checkBounds(const Cell& c) const;
        static void checkParams(const Params& p);
    };

} // namespace ms
