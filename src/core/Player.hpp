// ========================= src/core/Player.hpp =========================
#pragma once
#include "Board.hpp"
#include "KnowledgeBase.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace ms {

    struct PlayOptions {
        uint64_t seed{ 0x5EEDF00DCAFEBEEFULL };
        int batchGames{ 100 };   // 1..10000
    };

    struct GameResult {
        bool won{ false };
        bool lost{ false };          // neither set = ran out of moves
        int moves{ 0 };
        int guesses{ 0 };            // moves taken with no known safe cell
        int flagged{ 0 };
        std::optional<Cell> hit;     // the mine that ended a lost game
    };

    inline const char* outcomeLabel(const GameResult& r) {
        if (r.won) return "Won";
        return r.lost ? "Lost" : "Stalled";
    }

    struct StepResult {
        std::optional<Cell> move;    // empty = no move left
        bool guess{ false };
        bool hitMine{ false };
        int count{ -1 };             // neighbor mines shown by a safe move
    };

    struct PlayedGame { Board board; GameResult result; };

    struct BatchResult {
        std::vector<PlayedGame> games;
        int wins{ 0 };
        int losses{ 0 };
        int stalled{ 0 };
        double winRate() const { return games.empty() ? 0.0 : double(wins) / double(games.size()); }
    };

    class Player {
    public:
        explicit Player(PlayOptions opt = {});

        // One AI move: a known safe cell if there is one, otherwise a random unknown cell.
        // A safe move is fed back into kb and the board flags follow kb.mines().
        StepResult step(Board& board, KnowledgeBase& kb);

        // Play a copy of `board` from scratch until it is won, lost or out of moves.
        GameResult playOne(const Board& board);

        // Play `games` freshly generated boards; onGame(done) after each one.
        BatchResult playBatch(const Params& p, int games, const std::function<void(int)>& onGame = {});

        RNG& random() { return rng; }

    private:
        PlayOptions opt; RNG rng;
    };

} // namespace ms
