// ========================= src/io/Csv.hpp =========================
#pragma once
#include "../core/Player.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ms {

    struct CsvRow {
        int index;              // game number
        int height;
        int width;
        int mines;
        std::string map;        // mine layout, one 0/1 digit per cell, rows joined by '#': 0100#0000#...
        bool won;
        bool lost;              // won and lost both unset: the game stalled
        int moves;
        int guesses;
        int flagged;
    };

    struct CsvIO {
        static CsvRow encode(int index, const PlayedGame& g);
        // nullopt when the layout does not match the declared size or mine count
        static std::optional<PlayedGame> decode(const CsvRow& row);

        static bool save(const std::string& path, const std::vector<CsvRow>& rows, bool appendIfExists = true);
        static std::vector<CsvRow> load(const std::string& path);
    };

} // namespace ms
