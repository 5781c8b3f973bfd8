#include <cstdlib>
#include <memory>
#include <string>

#define SDL_MAIN_HANDLED
#include <SDL.h>

#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "../engine/platform/NullWindow.h"
#include "../engine/platform/SDLWindow.h"
#include "../game/ConfigLoader.h"
#include "../game/ZenApp.h"

int main(int argc, char** argv) {
    SDL_SetMainReady();

    bool headless = false;
    bool autoplay = false;
    int frames = 600;
    std::string configPath = "data/zen_config.json";
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--headless") {
            headless = true;
            autoplay = true;
        } else if (arg == "--autoplay") {
            autoplay = true;
        } else if (arg == "--frames" && i + 1 < argc) {
            frames = std::atoi(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else {
            Engine::logWarn("Unknown argument: " + arg);
        }
    }

    Zen::GameConfig gameConfig{};
    if (auto loaded = Zen::ConfigLoader::loadFromFile(configPath)) {
        gameConfig = *loaded;
    } else {
        Engine::logWarn("Failed to open " + configPath + "; using defaults.");
    }
    if (gameConfig.debugMode) {
        Engine::Logger::setMinLevel(Engine::LogLevel::Debug);
    }

    Zen::ZenApp game(gameConfig, autoplay);
    Engine::WindowPtr window;
    if (headless) {
        window = std::make_unique<Engine::NullWindow>();
    } else {
        window = std::make_unique<Engine::SDLWindow>();
    }
    Engine::WindowConfig config{};
    config.width = static_cast<int>(gameConfig.field.width);
    config.height = static_cast<int>(gameConfig.field.height);
    config.headlessFrames = frames;

    Engine::Application app(game, std::move(window), config);
    if (!app.initialize()) {
        return 1;
    }

    const Engine::RunStats stats = app.run();
    Engine::logInfo("Ran " + std::to_string(stats.frames) + " frames (" + std::to_string(stats.elapsedSeconds) +
                    " s): " + stats.quitReason);
    return 0;
}
