// Spawns obstacles on a timer and advances their motion, pulse and lifetime.
#pragma once

#include <random>
#include <vector>

#include "../../engine/core/EntityId.h"
#include "../../engine/math/Vec2.h"
#include "../GameConfig.h"
#include "../components/Core.h"
#include "../components/Dissonance.h"

namespace Zen {

class DissonanceSystem {
public:
    explicit DissonanceSystem(std::mt19937& rng);

    // Returns the number of dissonances spawned this step (0 or 1).
    int update(std::vector<Dissonance>& dissonances, const Core& core, const GameConfig& cfg,
               Engine::IdGenerator& ids, float dt);

    Dissonance spawn(const Core& core, const GameConfig& cfg, Engine::IdGenerator& ids);
    void advance(Dissonance& d, const GameConfig& cfg, float dt) const;

    void resetTimer() { timer_ = 0.0f; }
    float timer() const { return timer_; }

private:
    Engine::Vec2 samplePosition(const Core& core, const GameConfig& cfg, float margin);

    std::mt19937& rng_;
    float timer_{0.0f};
};

}  // namespace Zen
