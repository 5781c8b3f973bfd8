// Integrates the core: forces, speed cap, bounds, energy drain and brightness.
#pragma once

#include "../../engine/math/Vec2.h"
#include "../GameConfig.h"
#include "../components/Core.h"

namespace Zen {

class CoreSimulation {
public:
    void update(Core& core, const GameConfig& cfg, float dt) const;

    // Adds impulseForce along `direction` and charges impulseCost. Returns false for a degenerate direction.
    bool applyImpulse(Core& core, const Engine::Vec2& direction, const GameConfig& cfg) const;

    static float brightnessFor(const Core& core);
    static void clampEnergy(Core& core);
};

}  // namespace Zen
