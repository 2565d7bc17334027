// ========================= src/ui/App.cpp =========================
#include "App.hpp"
#include <SDL.h>
#include "imgui.h"
#include "backends/imgui_impl_sdl2.h"
#include "backends/imgui_impl_sdlrenderer2.h"
#include <spdlog/spdlog.h>
#include <algorithm> // for std::clamp
#include <cstdint>
#include <cstdio>
#include <string>

namespace ms {

    AppUI::AppUI() :p{ 8,8,8 }, opt{}, player(opt), kb(p.height, p.width) {
        newGame();
    }

    AppUI::~AppUI() {
        if (batchThread.joinable()) {
            batchThread.join();
        }
    }

    void AppUI::setStatus(const std::string& msg) {
        std::lock_guard<std::mutex> lock(statusMutex);
        statusMessage = msg;
    }

    std::string AppUI::getStatus() {
        std::lock_guard<std::mutex> lock(statusMutex);
        return statusMessage;
    }

    void AppUI::newGame() {
        startFrom(Board(p, player.random()));
    }

    void AppUI::startFrom(const Board& b) {
        board = b;
        board->setFlags({});
        kb = KnowledgeBase(b.height(), b.width());
        revealed.clear();
        lostAt.reset();
        contradicted = false;
        setStatus("");
    }

    bool AppUI::gameOver() const {
        return !board || lostAt || contradicted || board->won();
    }

    void AppUI::reveal(const Cell& c) {
        if (gameOver() || kb.movesMade().count(c)) return;
        try {
            if (board->isMine(c)) {
                lostAt = c;
                setStatus("Lost: mine at " + c.toString());
                return;
            }
            int n = board->nearbyMines(c);
            revealed[c] = n;
            kb.addKnowledge(c, n);
            if (board->won()) setStatus("Won!");
        }
        catch (const ContradictionError& e) {
            spdlog::error("[AppUI] reveal {} contradicts the knowledge base: {}", c.toString(), e.what());
            contradicted = true;
            setStatus(std::string("Contradiction, start a new game: ") + e.what());
        }
        catch (const std::exception& e) {
            spdlog::error("[AppUI] reveal {} failed: {}", c.toString(), e.what());
            setStatus(e.what());
        }
    }

    void AppUI::aiMove() {
        if (gameOver()) return;
        try {
            auto st = player.step(*board, kb);
            if (!st.move) { setStatus("No moves left to make."); return; }
            if (st.hitMine) {
                lostAt = st.move;
                setStatus("AI guessed " + st.move->toString() + " and hit a mine.");
                return;
            }
            revealed[*st.move] = st.count;
            if (board->won()) setStatus("Won!");
            else setStatus(std::string(st.guess ? "AI guessed " : "AI made safe move ") + st.move->toString());
        }
        catch (const ContradictionError& e) {
            spdlog::error("[AppUI] AI move contradicts the knowledge base: {}", e.what());
            contradicted = true;
            setStatus(std::string("Contradiction, start a new game: ") + e.what());
        }
        catch (const std::exception& e) {
            spdlog::error("[AppUI] AI move failed: {}", e.what());
            setStatus(e.what());
        }
    }

    void AppUI::ensureIndex(int idx) {
        if (idx >= 0 && idx < (int)played.size()) {
            currentIndex = idx;
            viewIndexInput = idx + 1;
        }
    }

    void AppUI::collectPlayed() {
        if (!isPlaying.load() && batchThread.joinable()) {
            batchThread.join();
            batchTotal = 0;
            batchCompleted.store(0);
        }

        std::vector<PlayedGame> newly;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            if (!pendingPlayed.empty()) {
                newly.swap(pendingPlayed);
            }
        }

        if (!newly.empty()) {
            bool hadAny = !played.empty();
            for (auto& g : newly) {
                played.push_back(std::move(g));
            }
            if (currentIndex < 0 || !hadAny) ensureIndex(0);
        }
    }

    static bool InputIntClamped(const char* label, int* value, int minValue, int maxValue, int step = 1, int stepFast = 5) {
        if (minValue > maxValue) std::swap(minValue, maxValue);
        int before = *value;
        bool interacted = ImGui::InputInt(label, value, step, stepFast);
        if (*value < minValue) *value = minValue;
        if (*value > maxValue) *value = maxValue;

        return interacted || *value != before;
    }

    void AppUI::drawControls() {
        collectPlayed();

        ImGui::Begin("Controls");
        ImGui::Text("Board");
        InputIntClamped("Height", &p.height, 1, 64);
        InputIntClamped("Width", &p.width, 1, 64);
        InputIntClamped("Mines", &p.mines, 0, p.cellCount());
        uint64_t seedValue = opt.seed;
        if (ImGui::InputScalar("Seed", ImGuiDataType_U64, &seedValue)) {
            opt.seed = seedValue;
        }
        if (ImGui::Button("Apply seed")) {
            player = Player(opt);
        }
        ImGui::Separator();

        if (ImGui::Button("New Game")) newGame();
        ImGui::SameLine();
        bool over = gameOver();
        if (over) ImGui::BeginDisabled();
        if (ImGui::Button("AI Move")) aiMove();
        if (over) ImGui::EndDisabled();
        ImGui::Checkbox("Show mines", &showMines);
        ImGui::Checkbox("Show AI knowledge", &showKnowledge);

        ImGui::Separator();
        ImGui::Text("Autoplay");
        InputIntClamped("Games (N)", &opt.batchGames, 1, 10000, 10, 100);

        bool currentlyPlaying = isPlaying.load();
        if (currentlyPlaying) ImGui::BeginDisabled();
        if (ImGui::Button("Play N")) {
            Params pCopy = p;
            PlayOptions optCopy = opt;
            optCopy.seed = player.random().next();
            int count = opt.batchGames;
            setStatus("");

            if (batchThread.joinable()) batchThread.join();
            batchTotal = count;
            batchCompleted.store(0);
            isPlaying.store(true);

            batchThread = std::thread([this, pCopy, optCopy, count]() {
                try {
                    Player localPlayer(optCopy);
                    auto batch = localPlayer.playBatch(pCopy, count, [this](int done) { batchCompleted.store(done); });
                    {
                        std::lock_guard<std::mutex> lock(pendingMutex);
                        for (auto& item : batch.games) {
                            pendingPlayed.push_back(std::move(item));
                        }
                    }
                    char buf[128];
                    std::snprintf(buf, sizeof(buf), "Won %d / %d (%.1f%%), lost %d", batch.wins, (int)batch.games.size(), batch.winRate() * 100.0, batch.losses);
                    setStatus(buf);
                }
                catch (const std::exception& e) {
                    spdlog::error("[AppUI] batch failed: {}", e.what());
                    setStatus(std::string("Batch failed: ") + e.what());
                }
                isPlaying.store(false);
                });
        }
        if (currentlyPlaying) ImGui::EndDisabled();

        if (isPlaying.load()) {
            ImGui::SameLine();
            int total = batchTotal;
            int done = batchCompleted.load();
            if (total < 1) total = 1;
            if (done > total) done = total;
            ImGui::TextColored(ImVec4(0.9f, 0.8f, 0.3f, 1.0f), "Playing... %d/%d", done, total);
        }

        std::string status = getStatus();
        if (!status.empty()) {
            ImGui::TextColored(ImVec4(0.9f, 0.6f, 0.5f, 1.0f), "%s", status.c_str());
        }

        if (ImGui::Button("Clear Memory")) {
            played.clear();
            currentIndex = -1;
            viewIndexInput = 1;
        }

        ImGui::Separator();
        ImGui::InputText("Save CSV", savePath, sizeof(savePath));
        if (ImGui::Button("Save")) {
            // append indices continuing from existing file if present
            auto rowsExisting = CsvIO::load(savePath);
            int startIdx = rowsExisting.empty() ? 0 : (rowsExisting.back().index + 1);
            std::vector<CsvRow> rows;
            for (size_t i = 0; i < played.size(); ++i) {
                rows.push_back(CsvIO::encode(startIdx + (int)i, played[i]));
            }
            if (!CsvIO::save(savePath, rows, true)) setStatus("Could not write " + std::string(savePath));
        }

        ImGui::InputText("Load CSV", loadPath, sizeof(loadPath));
        if (ImGui::Button("Load")) {
            played.clear(); currentIndex = -1; viewIndexInput = 1;
            auto rows = CsvIO::load(loadPath);
            int rejected = 0;
            for (const auto& r : rows) {
                if (auto g = CsvIO::decode(r)) played.push_back(std::move(*g));
                else ++rejected;
            }
            if (rejected) spdlog::warn("[AppUI] {} rows of {} have a malformed layout", rejected, loadPath);
            if (!played.empty()) ensureIndex(0);
        }

        ImGui::Separator();
        ImGui::Text("Played games");
        bool hasGames = !played.empty();
        int maxIndex = hasGames ? (int)played.size() : 1;
        viewIndexInput = std::clamp(viewIndexInput, 1, maxIndex);
        int inputValue = viewIndexInput;
        if (!hasGames) ImGui::BeginDisabled();
        if (InputIntClamped("Game #", &inputValue, 1, maxIndex)) {
            viewIndexInput = inputValue;
            if (hasGames) ensureIndex(viewIndexInput - 1);
        }
        if (hasGames && currentIndex >= 0) {
            const auto& r = played[currentIndex].result;
            ImGui::Text("%s  moves=%d  guesses=%d  flagged=%d", outcomeLabel(r), r.moves, r.guesses, r.flagged);
        }
        if (ImGui::Button("Replay this board") && hasGames && currentIndex >= 0) {
            startFrom(played[currentIndex].board);
        }
        if (!hasGames) ImGui::EndDisabled();

        ImGui::End();
    }

    static ImU32 colorForCount(int n) {
        static const ImU32 table[9] = {
            IM_COL32(200,200,200,255),
            IM_COL32(80,120,250,255), IM_COL32(80,180,90,255), IM_COL32(230,80,80,255), IM_COL32(120,80,200,255),
            IM_COL32(160,60,60,255), IM_COL32(60,170,170,255), IM_COL32(30,30,30,255), IM_COL32(120,120,120,255)
        };
        return table[std::clamp(n, 0, 8)];
    }

    void AppUI::drawBoard() {
        ImGui::Begin("Board");
        if (!board) { ImGui::Text("No board"); ImGui::End(); return; }
        const auto& b = *board;
        ImGui::Text("%dx%d  mines=%d  flags=%d  revealed=%d", b.height(), b.width(), (int)b.mines().size(), (int)b.flags().size(), (int)revealed.size());
        ImGui::TextDisabled("Left click: reveal   Right click: flag");

        const float cell = 26.0f;
        ImDrawList* dl = ImGui::GetWindowDrawList();
        ImVec2 origin = ImGui::GetCursorScreenPos();

        for (int r = 0; r < b.height(); ++r) {
            for (int c = 0; c < b.width(); ++c) {
                Cell at{ r, c };
                ImVec2 p0(origin.x + c * cell, origin.y + r * cell);
                ImVec2 p1(p0.x + cell - 2, p0.y + cell - 2);
                ImGui::SetCursorScreenPos(p0);
                ImGui::PushID(r * b.width() + c);
                ImGui::InvisibleButton("cell", ImVec2(cell - 2, cell - 2), ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonRight);
                if (ImGui::IsItemClicked(ImGuiMouseButton_Left)) reveal(at);
                if (ImGui::IsItemClicked(ImGuiMouseButton_Right) && !revealed.count(at)) {
                    if (b.flags().count(at)) board->unflag(at); else board->flag(at);
                }
                ImGui::PopID();

                auto shown = revealed.find(at);
                ImU32 fill = IM_COL32(90, 90, 100, 255);
                if (shown != revealed.end()) fill = IM_COL32(210, 210, 210, 255);
                else if (showKnowledge && kb.mines().count(at)) fill = IM_COL32(150, 70, 70, 255);
                else if (showKnowledge && kb.safes().count(at)) fill = IM_COL32(70, 140, 80, 255);
                if (lostAt && *lostAt == at) fill = IM_COL32(240, 40, 40, 255);
                dl->AddRectFilled(p0, p1, fill, 3.0f);

                const char* mark = nullptr; std::string num; ImU32 textCol = IM_COL32(255, 255, 255, 255);
                if (shown != revealed.end()) {
                    if (shown->second > 0) { num = std::to_string(shown->second); mark = num.c_str(); textCol = colorForCount(shown->second); }
                }
                else if (b.flags().count(at)) mark = "F";
                else if ((showMines || lostAt) && b.isMine(at)) mark = "*";
                if (mark) {
                    ImVec2 textSize = ImGui::CalcTextSize(mark);
                    dl->AddText(ImVec2(p0.x + (cell - 2 - textSize.x) * 0.5f, p0.y + (cell - 2 - textSize.y) * 0.5f), textCol, mark);
                }
            }
        }
        ImGui::SetCursorScreenPos(ImVec2(origin.x, origin.y + b.height() * cell));
        ImGui::Dummy(ImVec2(b.width() * cell, 4.0f));

        if (lostAt) ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "Lost");
        else if (contradicted) ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "Contradiction");
        else if (b.won()) ImGui::TextColored(ImVec4(0.6f, 1, 0.6f, 1), "Won");

        ImGui::End();
    }

    void AppUI::drawKnowledge() {
        ImGui::Begin("Knowledge");
        ImGui::Text("Moves made: %d", (int)kb.movesMade().size());
        ImGui::Text("Known safes: %d  Known mines: %d", (int)kb.safes().size(), (int)kb.mines().size());
        ImGui::Text("Sentences: %d  (last inference: %lld passes)", (int)kb.knowledge().size(), kb.lastPassCount());
        if (auto next = kb.makeSafeMove()) ImGui::Text("Next safe move: %s", next->toString().c_str());
        else ImGui::TextDisabled("No safe move known");
        ImGui::Separator();
        ImGui::BeginChild("sentences");
        for (const auto& s : kb.knowledge()) {
            ImGui::TextUnformatted(s.toString().c_str());
        }
        ImGui::EndChild();
        ImGui::End();
    }

    int AppUI::run() {
        // SDL2 init
        if (SDL_Init(SDL_INIT_VIDEO) != 0) {
            spdlog::error("[AppUI] SDL_Init failed: {}", SDL_GetError());
            return 1;
        }
        SDL_Window* window = SDL_CreateWindow("Minesweeper AI", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1400, 900, SDL_WINDOW_SHOWN);
        SDL_Renderer* renderer = window ? SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC) : nullptr;
        if (!renderer) {
            spdlog::error("[AppUI] cannot create window: {}", SDL_GetError());
            if (window) SDL_DestroyWindow(window);
            SDL_Quit();
            return 1;
        }

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();

        ImGuiIO& io = ImGui::GetIO(); (void)io;
        ImGui::StyleColorsDark();

        const char* font_candidates[] = {
            "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
            "C:/Windows/Fonts/segoeui.ttf",
            "/System/Library/Fonts/Supplemental/Arial.ttf"
        };
        ImFont* font = nullptr;
        for (const char* path : font_candidates) {
            SDL_RWops* probe = SDL_RWFromFile(path, "rb");
            if (!probe) continue;
            SDL_RWclose(probe);
            font = io.Fonts->AddFontFromFileTTF(path, 17.0f);
            if (font) { io.FontDefault = font; break; }
        }
        if (!font) {
            spdlog::warn("[AppUI] no TTF font found, using the built-in ImGui font");
            io.FontDefault = io.Fonts->AddFontDefault();
        }

        ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
        ImGui_ImplSDLRenderer2_Init(renderer);

        bool running = true; SDL_Event e;
        while (running) {
            while (SDL_PollEvent(&e)) {
                ImGui_ImplSDL2_ProcessEvent(&e);
                if (e.type == SDL_QUIT) running = false;
            }
            ImGui_ImplSDLRenderer2_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            drawControls();
            drawBoard();
            drawKnowledge();

            ImGui::Render();
            SDL_SetRenderDrawColor(renderer, 20, 20, 24, 255);
            SDL_RenderClear(renderer);
            ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
            SDL_RenderPresent(renderer);
        }

        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 0;
    }

} // namespace ms
