// Stationary node that lights up when a matching wavefront passes.
#pragma once

#include <vector>

#include "../../engine/core/EntityId.h"
#include "../../engine/math/Vec2.h"
#include "EnergyType.h"

namespace Zen {

struct Resonator {
    Engine::EntityId id;
    Engine::Vec2 position{};
    EnergyType energyType{EnergyType::Calm};
    float radius{12.0f};
    bool isActivated{false};
    bool isReceivingEnergy{false};
    float intensity{0.3f};
    float activationTime{0.0f};  // seconds since activation
    std::vector<Engine::EntityId> connections;
    float rotation{0.0f};
    float rotationSpeed{0.5f};
    float pulseFrequency{1.0f};
};

}  // namespace Zen
