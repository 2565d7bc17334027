// ========================= src/core/Player.cpp =========================
#include "Player.hpp"
#include <spdlog/spdlog.h>

namespace ms {

    Player::Player(PlayOptions opt_) :opt(opt_) { rng.seed(opt.seed); }

    StepResult Player::step(Board& board, KnowledgeBase& kb) {
        StepResult r;
        r.move = kb.makeSafeMove();
        if (!r.move) {
            r.move = kb.makeRandomMove(rng);
            r.guess = r.move.has_value();
        }
        if (!r.move) return r;

        if (board.isMine(*r.move)) { r.hitMine = true; return r; }
        r.count = board.nearbyMines(*r.move);
        kb.addKnowledge(*r.move, r.count);
        board.setFlags(kb.mines());
        return r;
    }

    GameResult Player::playOne(const Board& start) {
        Board board = start;
        board.setFlags({});
        KnowledgeBase kb(board.height(), board.width());
        GameResult res;

        for (;;) {
            auto st = step(board, kb);
            if (!st.move) break;
            ++res.moves;
            if (st.guess) ++res.guesses;
            if (st.hitMine) { res.lost = true; res.hit = st.move; break; }
            if (board.won()) { res.won = true; break; }
        }
        res.flagged = static_cast<int>(board.flags().size());

        if (res.lost) spdlog::debug("[Player] hit mine at {} after {} moves ({} guesses)", res.hit->toString(), res.moves, res.guesses);
        else spdlog::debug("[Player] {} after {} moves ({} guesses)", res.won ? "won" : "out of moves", res.moves, res.guesses);
        return res;
    }

    BatchResult Player::playBatch(const Params& p, int games, const std::function<void(int)>& onGame) {
        BatchResult out;
        out.games.reserve(games > 0 ? games : 0);
        for (int i = 0; i < games; ++i) {
            Board board(p, rng);
            GameResult res = playOne(board);
            if (res.won) ++out.wins;
            else if (res.lost) ++out.losses;
            else ++out.stalled;
            out.games.push_back(PlayedGame{ std::move(board), res });
            if (onGame) onGame(i + 1);
        }
        spdlog::info("[Player] {}x{} with {} mines: won {}/{} ({:.1f}%)",
            p.height, p.width, p.mines, out.wins, out.games.size(), out.winRate() * 100.0);
        return out;
    }

} // namespace ms
