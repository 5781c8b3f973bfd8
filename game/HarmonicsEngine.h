// Session facade: owns all simulation state and exposes the command surface used by presentation code.
#pragma once

#include <functional>
#include <optional>
#include <random>
#include <vector>

#include <nlohmann/json.hpp>

#include "../engine/core/EntityId.h"
#include "../engine/math/Vec2.h"
#include "../engine/status/StatusContainer.h"
#include "EngineSnapshot.h"
#include "GameConfig.h"
#include "GameStateMachine.h"
#include "TickDriver.h"
#include "events/EventBus.h"
#include "systems/AmplifierSystem.h"
#include "systems/CollisionSystem.h"
#include "systems/CoreSimulation.h"
#include "systems/DissonanceSystem.h"
#include "systems/HarmonicSystem.h"
#include "visual/FieldVisualizer.h"

namespace Zen {

// Commands return whether they took effect immediately. Commands issued from an event
// subscriber are queued and run once the current dispatch finishes.
class HarmonicsEngine {
public:
    explicit HarmonicsEngine(GameConfig config = {});

    bool initialize();
    bool start();
    bool start(const GameConfig& config);
    bool start(const nlohmann::json& overrides);
    bool pause();
    bool resume();
    bool togglePause();
    bool end();
    bool reset();

    void tick(double deltaSeconds);
    void updateField(double deltaSeconds);

    bool applyImpulse(const Engine::Vec2& direction);
    bool generateWave(EnergyType type);

    std::optional<Engine::EntityId> addResonator(const Engine::Vec2& position, EnergyType type);
    std::optional<Engine::EntityId> placeDissonance(const Engine::Vec2& position, DissonanceType type,
                                                    EnergyType countersEnergy, float disruptionLevel = 10.0f);
    std::optional<Engine::EntityId> placeAmplifier(const Engine::Vec2& position, AmplifierType type,
                                                   EnergyType energyType);

    EventBus::SubscriptionId subscribe(EventBus::Handler handler) { return bus_.subscribe(std::move(handler)); }
    bool unsubscribe(EventBus::SubscriptionId id) { return bus_.unsubscribe(id); }

    void setTickDriver(TickDriver* driver) { driver_ = driver; }

    GameState state() const { return machine_.state(); }
    const Core& core() const { return core_; }
    const std::vector<Dissonance>& dissonances() const { return dissonances_; }
    const std::vector<Amplifier>& amplifiers() const { return amplifiers_; }
    const std::vector<Resonator>& resonators() const { return harmonic_.resonators(); }
    const std::vector<Wave>& waves() const { return harmonic_.waves(); }
    const std::vector<Connection>& connections() const { return harmonic_.connections(); }
    const std::vector<Pattern>& patterns() const { return harmonic_.patterns(); }
    const Engine::Status::StatusContainer& activeEffects() const { return effects_; }
    float score() const { return score_; }
    int fps() const { return fps_; }
    double clock() const { return clock_; }
    float collisionCooldown() const { return collision_.cooldownRemaining(); }
    const GameConfig& config() const { return config_; }
    const FieldVisualizer& field() const { return field_; }
    FieldVisualizer& field() { return field_; }

    EngineSnapshot snapshot() const;

private:
    bool startWith(const GameConfig& config);
    void beginSession();
    void clearSession();
    bool finishSession(bool victory, const char* reason);
    void stepPlaying(float dt);
    void onDissonanceHit(const Dissonance& d);
    void onAmplifierCollected(const Amplifier& a);
    void checkDepletion(float energyBefore);
    void emit(GameEventType type, nlohmann::json data = nlohmann::json::object());
    bool deferIfDispatching(const char* command, std::function<void()> fn);
    void runDeferred();
    void flushEvents();
    void startDriver();
    void stopDriver();

    GameConfig config_;
    GameStateMachine machine_{};
    EventBus bus_{};
    Engine::IdGenerator ids_{};
    std::mt19937 rng_;
    TickDriver* driver_{nullptr};

    CoreSimulation coreSim_{};
    DissonanceSystem dissonanceSys_;
    AmplifierSystem amplifierSys_;
    HarmonicSystem harmonic_{};
    CollisionSystem collision_{};
    FieldVisualizer field_;

    Core core_{};
    std::vector<Dissonance> dissonances_;
    std::vector<Amplifier> amplifiers_;
    Engine::Status::StatusContainer effects_{};
    std::vector<std::function<void()>> deferred_;

    float score_{0.0f};
    int fps_{0};
    unsigned long long tickCount_{0};
    double clock_{0.0};
    bool inTick_{false};
    bool depletionHandled_{false};
};

}  // namespace Zen
