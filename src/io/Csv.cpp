// ========================= src/io/Csv.cpp =========================
#include "Csv.hpp"
#include <fstream>
#include <sstream>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace ms {

    static std::string encodeMap(const Board& b) {
        std::ostringstream oss;
        for (int r = 0; r < b.height(); ++r) {
            for (int c = 0; c < b.width(); ++c) oss << (b.isMine({ r, c }) ? '1' : '0');
            if (r + 1 < b.height()) oss << '#';
        }
        return oss.str();
    }

    static std::vector<std::string> split(const std::string& s, char sep) {
        std::vector<std::string> out; std::string cur; std::istringstream iss(s);
        while (std::getline(iss, cur, sep)) out.push_back(cur);
        return out;
    }

    CsvRow CsvIO::encode(int index, const PlayedGame& g) {
        CsvRow row;
        row.index = index;
        row.height = g.board.height();
        row.width = g.board.width();
        row.mines = static_cast<int>(g.board.mines().size());
        row.map = encodeMap(g.board);
        row.won = g.result.won;
        row.lost = g.result.lost;
        row.moves = g.result.moves;
        row.guesses = g.result.guesses;
        row.flagged = g.result.flagged;
        return row;
    }

    std::optional<PlayedGame> CsvIO::decode(const CsvRow& row) {
        if (row.height <= 0 || row.width <= 0) return std::nullopt;
        auto lines = split(row.map, '#');
        if ((int)lines.size() != row.height) return std::nullopt;

        CellSet mines;
        for (int r = 0; r < row.height; ++r) {
            const auto& line = lines[r];
            if ((int)line.size() != row.width) return std::nullopt;
            for (int c = 0; c < row.width; ++c) {
                if (line[c] == '1') mines.insert({ r, c });
                else if (line[c] != '0') return std::nullopt;
            }
        }
        if ((int)mines.size() != row.mines) return std::nullopt;

        GameResult res;
        res.won = row.won;
        res.lost = row.lost;
        res.moves = row.moves;
        res.guesses = row.guesses;
        res.flagged = row.flagged;
        return PlayedGame{ Board(row.height, row.width, mines), res };
    }

    bool CsvIO::save(const std::string& path, const std::vector<CsvRow>& rows, bool appendIfExists) {
        namespace fs = std::filesystem;
        std::error_code ec;
        bool exists = fs::exists(path, ec);
        std::ofstream f(path, std::ios::out | (appendIfExists ? std::ios::app : std::ios::trunc));
        if (!f) {
            spdlog::warn("[CsvIO] cannot open {} for writing", path);
            return false;
        }
        if (!exists || !appendIfExists) {
            f << "index,height,width,mines,map,won,lost,moves,guesses,flagged\n";
        }
        for (const auto& r : rows) {
            f << r.index << ',' << r.height << ',' << r.width << ',' << r.mines << ',' << r.map << ','
                << (r.won ? 1 : 0) << ',' << (r.lost ? 1 : 0) << ',' << r.moves << ',' << r.guesses << ',' << r.flagged << "\n";
        }
        return static_cast<bool>(f);
    }

    std::vector<CsvRow> CsvIO::load(const std::string& path) {
        std::vector<CsvRow> out; std::ifstream f(path);
        if (!f) return out;
        std::string line; bool first = true; int lineNo = 0;
        while (std::getline(f, line)) {
            ++lineNo;
            if (first) { first = false; continue; }
            if (line.empty()) continue;
            auto cells = split(line, ',');
            if (cells.size() < 10) {
                spdlog::warn("[CsvIO] {}:{} skipped: expected 10 fields, got {}", path, lineNo, cells.size());
                continue;
            }
            try {
                CsvRow r; int i = 0;
                r.index = std::stoi(cells[i++]);
                r.height = std::stoi(cells[i++]);
                r.width = std::stoi(cells[i++]);
                r.mines = std::stoi(cells[i++]);
                r.map = cells[i++];
                r.won = std::stoi(cells[i++]) != 0;
                r.lost = std::stoi(cells[i++]) != 0;
                r.moves = std::stoi(cells[i++]);
                r.guesses = std::stoi(cells[i++]);
                r.flagged = std::stoi(cells[i++]);
                out.push_back(std::move(r));
            }
            catch (const std::logic_error& e) { // stoi: invalid_argument / out_of_range
                spdlog::warn("[CsvIO] {}:{} skipped: {}", path, lineNo, e.what());
            }
        }
        return out;
    }

} // namespace ms
