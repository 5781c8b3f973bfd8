// Game layer bootstrap: maps input to engine commands, drives ticks, renders snapshots.
#pragma once

#include <memory>

#include "../engine/core/ApplicationListener.h"
#include "../engine/core/Time.h"
#include "../engine/math/Vec2.h"
#include "GameConfig.h"
#include "HarmonicsEngine.h"
#include "TickDriver.h"
#include "render/RenderSystem.h"

namespace Engine {
class Application;
class InputState;
class RenderDevice;
}  // namespace Engine

namespace Zen {

class ZenApp final : public Engine::ApplicationListener, public TickDriver {
public:
    explicit ZenApp(GameConfig config, bool autoplay = false);

    bool onInitialize(Engine::Application& app) override;
    void onInput(const Engine::InputState& input, const Engine::TimeStep& step) override;
    void onUpdate(const Engine::TimeStep& step) override;
    void onRender(Engine::RenderDevice& device) override;
    void onShutdown() override;

    void startTicking() override;
    void stopTicking() override;

    const HarmonicsEngine& engine() const { return engine_; }
    bool ticking() const { return ticking_; }

private:
    void runAutoplay(float dt);
    void refreshTitle();
    void advanceSimulation(double dt);
    void logEvent(const GameEvent& event) const;

    HarmonicsEngine engine_;
    Engine::FixedStepper stepper_;
    Engine::Application* app_{nullptr};
    std::unique_ptr<RenderSystem> renderer_;
    GameState titledState_{GameState::Loading};
    bool autoplay_{false};
    bool ticking_{false};
    float impulseRepeat_{0.0f};
    float autoWaveTimer_{0.0f};
    float autoImpulseTimer_{0.0f};
    int autoWaveIndex_{0};
    float autoAngle_{0.0f};
};

}  // namespace Zen
