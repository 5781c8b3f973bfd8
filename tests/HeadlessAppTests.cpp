// Minimal sanity checks for the app loop on the null backend.
#include <cassert>
#include <cmath>
#include <memory>
#include "../engine/core/Application.h"
#include "../engine/platform/NullWindow.h"
#include "../engine/render/NullRenderDevice.h"
#include "../game/ZenApp.h"

int main() {
    {
        Zen::GameConfig cfg{};
        Zen::ZenApp game(cfg, true);
        Engine::WindowConfig config{};
        config.headlessFrames = 240;
        Engine::Application app(game, std::make_unique<Engine::NullWindow>(), config);
        assert(app.initialize());
        assert(game.ticking());
        assert(game.engine().state() == Zen::GameState::Playing);

        const Engine::RunStats stats = app.run();
        const auto& window = static_cast<const Engine::NullWindow&>(app.window());
        assert(window.framesPolled() == 241);
        assert(app.timeStep().frame == 241);
        assert(stats.frames == 241);
        assert(stats.quitReason == "NullWindow frame budget reached.");
        assert(!app.isRunning());
        assert(!window.isOpen());
        // The caption follows the session state.
        assert(window.title() == config.title + " - PLAYING");
        assert(window.titleChanges() >= 1);
        assert(game.engine().clock() > 1.0);

        const auto* device = dynamic_cast<const Engine::NullRenderDevice*>(&app.renderer());
        assert(device != nullptr);
        assert(device->rectCount() > 0);
        assert(device->lineCount() > 0);
    }
    {
        // Without autoplay the session waits in the menu and nothing ticks.
        Zen::ZenApp game(Zen::GameConfig{}, false);
        Engine::WindowConfig config{};
        config.headlessFrames = 30;
        Engine::Application app(game, std::make_unique<Engine::NullWindow>(), config);
        assert(app.initialize());
        app.run();
        assert(game.engine().state() == Zen::GameState::Menu);
        assert(app.window().title() == config.title + " - MENU");
        assert(!game.ticking());
        assert(game.engine().clock() == 0.0);
    }
    {
        // Whole steps only; a frame that owes too many drops the backlog.
        Engine::FixedStepper stepper(0.25, 3);
        assert(stepper.advance(0.1) == 0);
        assert(stepper.advance(0.2) == 1);
        assert(std::abs(stepper.backlog() - 0.05) < 1e-9);
        assert(stepper.advance(2.0) == 3);
        assert(stepper.backlog() == 0.0);
        assert(stepper.advance(0.5) == 2);
        stepper.reset();
        assert(stepper.backlog() == 0.0);
    }
    return 0;
}
