#include "ZenApp.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "../engine/core/Application.h"
#include "../engine/core/Logger.h"
#include "../engine/core/Time.h"
#include "../engine/input/InputState.h"

namespace Zen {

namespace {
constexpr double kFixedStep = 1.0 / 60.0;
constexpr int kMaxStepsPerFrame = 5;
constexpr float kImpulseRepeatSeconds = 0.2f;
constexpr float kAutoWaveInterval = 1.5f;
constexpr float kAutoImpulseInterval = 0.5f;
}  // namespace

ZenApp::ZenApp(GameConfig config, bool autoplay)
    : engine_(std::move(config)), stepper_(kFixedStep, kMaxStepsPerFrame), autoplay_(autoplay) {}

bool ZenApp::onInitialize(Engine::Application& app) {
    app_ = &app;
    engine_.setTickDriver(this);
    engine_.subscribe([this](const GameEvent& event) { logEvent(event); });
    engine_.initialize();
    if (autoplay_) {
        engine_.start();
    }
    return true;
}

void ZenApp::startTicking() {
    ticking_ = true;
    stepper_.reset();
}

void ZenApp::stopTicking() { ticking_ = false; }

void ZenApp::onUpdate(const Engine::TimeStep& step) {
    if (autoplay_) {
        runAutoplay(static_cast<float>(step.deltaSeconds));
    }
    advanceSimulation(step.deltaSeconds);
    engine_.updateField(step.deltaSeconds);
    refreshTitle();
}

void ZenApp::onRender(Engine::RenderDevice& device) {
    if (!renderer_) {
        renderer_ = std::make_unique<RenderSystem>(device);
    }
    renderer_->draw(engine_.snapshot(), engine_.field(), engine_.config());
}

void ZenApp::refreshTitle() {
    if (!app_ || engine_.state() == titledState_) return;
    titledState_ = engine_.state();
    app_->window().setTitle(app_->config().title + " - " + std::string(toString(titledState_)));
}

void ZenApp::advanceSimulation(double dt) {
    if (!ticking_) return;
    const int due = stepper_.advance(dt);
    for (int i = 0; i < due && ticking_; ++i) {
        engine_.tick(stepper_.step());
    }
}

void ZenApp::onInput(const Engine::InputState& input, const Engine::TimeStep& step) {
    using Engine::InputKey;
    const auto dt = static_cast<float>(step.deltaSeconds);
    if (input.wasPressed(InputKey::Quit)) {
        if (app_) app_->requestQuit("Quit key pressed.");
        return;
    }
    if (input.wasPressed(InputKey::CycleVisualMode)) {
        const auto mode = engine_.field().cycleMode();
        Engine::logInfo("Visual mode: " + std::string(toString(mode)));
    }

    const GameState state = engine_.state();
    if (input.wasPressed(InputKey::Restart)) {
        engine_.reset();
        return;
    }
    if (input.wasPressed(InputKey::Start) &&
        (state == GameState::Menu || state == GameState::GameOver || state == GameState::Victory)) {
        engine_.start();
        return;
    }
    if (input.wasPressed(InputKey::Pause)) {
        engine_.togglePause();
    }
    if (engine_.state() != GameState::Playing) return;

    if (input.wasPressed(InputKey::WaveCalm)) engine_.generateWave(EnergyType::Calm);
    if (input.wasPressed(InputKey::WaveVibrant)) engine_.generateWave(EnergyType::Vibrant);
    if (input.wasPressed(InputKey::WaveIntense)) engine_.generateWave(EnergyType::Intense);

    if (input.wasMouseClicked(0)) {
        const Engine::Vec2 target{static_cast<float>(input.mouseX()), static_cast<float>(input.mouseY())};
        engine_.applyImpulse(target - engine_.core().position);
    }

    Engine::Vec2 dir{};
    if (input.isDown(InputKey::Up)) dir.y -= 1.0f;
    if (input.isDown(InputKey::Down)) dir.y += 1.0f;
    if (input.isDown(InputKey::Left)) dir.x -= 1.0f;
    if (input.isDown(InputKey::Right)) dir.x += 1.0f;
    impulseRepeat_ = std::max(0.0f, impulseRepeat_ - dt);
    if (dir.lengthSquared() > 0.0f && impulseRepeat_ <= 0.0f) {
        if (engine_.applyImpulse(dir)) {
            impulseRepeat_ = kImpulseRepeatSeconds;
        }
    }
}

void ZenApp::runAutoplay(float dt) {
    const GameState state = engine_.state();
    if (state == GameState::GameOver || state == GameState::Victory) {
        engine_.start();
        return;
    }
    if (state != GameState::Playing) return;

    autoWaveTimer_ += dt;
    if (autoWaveTimer_ >= kAutoWaveInterval) {
        autoWaveTimer_ = 0.0f;
        engine_.generateWave(energyTypeFromIndex(autoWaveIndex_++));
    }
    autoImpulseTimer_ += dt;
    if (autoImpulseTimer_ >= kAutoImpulseInterval) {
        autoImpulseTimer_ = 0.0f;
        autoAngle_ += 2.4f;
        engine_.applyImpulse(Engine::Vec2{std::cos(autoAngle_), std::sin(autoAngle_)});
    }
}

void ZenApp::logEvent(const GameEvent& event) const {
    switch (event.type) {
        case GameEventType::PatternCompleted:
        case GameEventType::HarmonyIncreased:
        case GameEventType::GameEnded:
        case GameEventType::EnergyDepleted:
            Engine::logInfo(std::string(toString(event.type)) + " " + event.data.dump());
            break;
        default:
            if (engine_.config().debugMode) {
                Engine::logDebug(std::string(toString(event.type)) + " " + event.data.dump());
            }
            break;
    }
}

void ZenApp::onShutdown() {
    Engine::logInfo("Final score " + std::to_string(static_cast<int>(engine_.score())) + ", harmony level " +
                    std::to_string(engine_.core().harmonyLevel) + ".");
}

}  // namespace Zen
