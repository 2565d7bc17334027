// ========================= src/main.cpp =========================
#include "ui/App.hpp"
#include <SDL.h>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

int main(int argc, char* argv[]) {
    (void)argc; (void)argv;
    spdlog::cfg::load_env_levels(); // SPDLOG_LEVEL=debug shows every inference pass
    ms::AppUI app;
    return app.run();
}
