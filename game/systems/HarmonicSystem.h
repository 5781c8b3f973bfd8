// Waves, resonators, connections and pattern recognition.
#pragma once

#include <functional>
#include <vector>

#include <nlohmann/json.hpp>

#include "../../engine/core/EntityId.h"
#include "../../engine/math/Vec2.h"
#include "../GameConfig.h"
#include "../components/Connection.h"
#include "../components/Core.h"
#include "../components/Pattern.h"
#include "../components/Resonator.h"
#include "../components/Wave.h"
#include "../events/GameEvent.h"

namespace Zen {

class HarmonicSystem {
public:
    using EmitFn = std::function<void(GameEventType, nlohmann::json)>;

    void setEventSink(EmitFn sink) { emit_ = std::move(sink); }

    // Clears everything and lays out the starting resonator ring.
    void initialize(const GameConfig& cfg, Engine::IdGenerator& ids);
    void clear();

    // Returns nullptr when the resonator cap is reached.
    const Resonator* addResonator(const Engine::Vec2& position, EnergyType type, const GameConfig& cfg,
                                  Engine::IdGenerator& ids);
    // Emits from the core; speed and reach scale with core frequency and amplitude. nullptr at the wave cap.
    const Wave* generateWave(const Core& core, EnergyType type, const GameConfig& cfg, Engine::IdGenerator& ids);

    // Advances one step and returns the score earned (connections and new patterns).
    float update(Core& core, const GameConfig& cfg, Engine::IdGenerator& ids, float dt);

    const std::vector<Resonator>& resonators() const { return resonators_; }
    const std::vector<Wave>& waves() const { return waves_; }
    const std::vector<Connection>& connections() const { return connections_; }
    const std::vector<Pattern>& patterns() const { return patterns_; }
    int patternsCompleted() const { return patternsCompleted_; }

private:
    float updateWaves(const GameConfig& cfg, Engine::IdGenerator& ids, float dt);
    float activate(Resonator& resonator, Wave& wave, const GameConfig& cfg, Engine::IdGenerator& ids);
    float connect(const Resonator& resonator, const GameConfig& cfg, Engine::IdGenerator& ids);
    void updateResonators(const GameConfig& cfg, float dt);
    void updateConnections(float dt);
    void updatePatterns(float dt);
    float detectPatterns(Core& core, const GameConfig& cfg, Engine::IdGenerator& ids);

    bool hasActiveConnection(const Engine::EntityId& a, const Engine::EntityId& b) const;
    Resonator* findResonator(const Engine::EntityId& id);
    const Connection* findConnection(const Engine::EntityId& id) const;
    void raise(GameEventType type, nlohmann::json data) const;

    std::vector<Resonator> resonators_;
    std::vector<Wave> waves_;
    std::vector<Connection> connections_;
    std::vector<Pattern> patterns_;
    int patternsCompleted_{0};
    EmitFn emit_{};
};

}  // namespace Zen
