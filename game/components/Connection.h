// Link between two activated resonators of the same energy.
#pragma once

#include <array>

#include "../../engine/core/EntityId.h"
#include "EnergyType.h"

namespace Zen {

struct Connection {
    Engine::EntityId id;
    std::array<Engine::EntityId, 2> resonatorIds;
    EnergyType energyType{EnergyType::Calm};
    float intensity{0.8f};
    float age{0.0f};
    float duration{-1.0f};  // -1 = permanent
    bool isActive{true};

    bool links(const Engine::EntityId& a, const Engine::EntityId& b) const {
        return (resonatorIds[0] == a && resonatorIds[1] == b) || (resonatorIds[0] == b && resonatorIds[1] == a);
    }
};

}  // namespace Zen
