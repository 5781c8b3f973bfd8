// The player-controlled core.
#pragma once

#include <set>
#include <string>

#include "../../engine/core/EntityId.h"
#include "../../engine/math/Vec2.h"
#include "EnergyType.h"

namespace Zen {

struct Core {
    Engine::EntityId id;
    Engine::Vec2 position{275.0f, 275.0f};
    Engine::Vec2 velocity{};
    float energy{100.0f};
    float maxEnergy{100.0f};
    float radius{25.0f};
    int harmonyLevel{1};
    float frequency{1.0f};
    float amplitude{1.0f};
    EnergyBalance energyBalance{};
    float brightness{1.0f};
    std::set<std::string> activeEffects;
    bool isActive{true};
};

}  // namespace Zen
