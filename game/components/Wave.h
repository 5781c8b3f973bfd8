// Expanding circular front emitted by the core.
#pragma once

#include <set>

#include "../../engine/core/EntityId.h"
#include "../../engine/math/Vec2.h"
#include "EnergyType.h"

namespace Zen {

struct Wave {
    Engine::EntityId id;
    Engine::Vec2 origin{};
    EnergyType energyType{EnergyType::Calm};
    float radius{0.0f};
    float maxRadius{200.0f};
    float propagationSpeed{100.0f};
    float age{0.0f};
    float maxLifeTime{3.0f};
    float opacity{0.7f};
    float baseOpacity{0.7f};
    bool isActive{true};
    std::set<Engine::EntityId> activatedResonators;  // only grows
};

}  // namespace Zen
