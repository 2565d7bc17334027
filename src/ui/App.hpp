// ========================= src/ui/App.hpp =========================
#pragma once
#include "../core/Player.hpp"
#include "../io/Csv.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace ms {

    class AppUI {
    public:
        AppUI();
        ~AppUI();
        int run(); // SDL2 + ImGui main loop

    private:
        Params p; PlayOptions opt; Player player;

        // interactive game
        std::optional<Board> board;
        KnowledgeBase kb;
        std::unordered_map<Cell, int> revealed; // cell -> neighbor mines shown
        std::optional<Cell> lostAt;
        bool contradicted{ false };   // kb threw mid-update; frozen until New Game
        bool showMines{ false };
        bool showKnowledge{ true };

        // batches
        std::vector<PlayedGame> played;
        int currentIndex{ -1 };
        int viewIndexInput{ 1 };
        char savePath[256] = "games.csv";
        char loadPath[256] = "games.csv";

        std::thread batchThread;
        std::atomic<bool> isPlaying{ false };
        std::atomic<int> batchCompleted{ 0 };
        int batchTotal{ 0 };
        std::mutex pendingMutex;
        std::vector<PlayedGame> pendingPlayed;
        std::mutex statusMutex;
        std::string statusMessage;

        void setStatus(const std::string& msg);
        std::string getStatus();

        // UI helpers
        void drawControls();
        void drawBoard();
        void drawKnowledge();

        void newGame();
        void startFrom(const Board& b);
        bool gameOver() const;
        void reveal(const Cell& c);
        void aiMove();
        void collectPlayed();
        void ensureIndex(int idx);
    };

} // namespace ms
