// ========================= src/core/Types.hpp =========================
#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace ms {

    // One board position. Row-major ordering keeps set iteration deterministic.
    struct Cell {
        int row{ 0 };
        int col{ 0 };

        bool operator==(const Cell& o) const { return row == o.row && col == o.col; }
        bool operator!=(const Cell& o) const { return !(*this == o); }
        bool operator<(const Cell& o) const { return row != o.row ? row < o.row : col < o.col; }

        std::string toString() const { return "(" + std::to_string(row) + "," + std::to_string(col) + ")"; }
    };

    using CellSet = std::set<Cell>;

    constexpr int kMaxNeighbors = 8;

    // cells are addressed with int indices
    constexpr long long kMaxCells = 0x7FFFFFFF;

    struct Params {
        int height{ 8 };   // 1..64
        int width{ 8 };    // 1..64
        int mines{ 8 };    // 0..height*width

        int cellCount() const { return height * width; }
    };

    inline bool fitsGrid(int height, int width) {
        return height > 0 && width > 0 && static_cast<long long>(height) * width <= kMaxCells;
    }

    // Thrown when the facts handed to the engine cannot all be true at once.
    class ContradictionError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    inline bool inBounds(const Cell& c, int height, int width) {
        return c.row >= 0 && c.col >= 0 && c.row < height && c.col < width;
    }

    // in-bounds cells within one row and column of c, excluding c itself
    inline std::vector<Cell> neighborsOf(const Cell& c, int height, int width) {
        std::vector<Cell> out; out.reserve(kMaxNeighbors);
        for (int dr = -1; dr <= 1; ++dr) {
            for (int dc = -1; dc <= 1; ++dc) {
                if (dr == 0 && dc == 0) continue;
                Cell n{ c.row + dr, c.col + dc };
                if (inBounds(n, height, width)) out.push_back(n);
            }
        }
        return out;
    }

    inline std::string toString(const CellSet& cells) {
        std::string out = "{";
        bool first = true;
        for (const auto& c : cells) {
            if (!first) out += ", ";
            out += c.toString(); first = false;
        }
        return out + "}";
    }

    // xorshift64; a zero state would stick at zero so seed() replaces it
    struct RNG {
        uint64_t s = 0x9E3779B97F4A7C15ULL;
        void seed(uint64_t v) { s = v ? v : 0xBADC0FFEEULL; }
        uint64_t next();
        int irange(int lo, int hi);
    };

} // namespace ms

namespace std {
    template <> struct hash<ms::Cell> {
        size_t operator()(const ms::Cell& c) const noexcept {
            return hash<uint64_t>()((uint64_t(uint32_t(c.row)) << 32) | uint32_t(c.col));
        }
    };
}
