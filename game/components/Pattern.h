// Recognized group of connected same-energy resonators.
#pragma once

#include <set>
#include <string>
#include <vector>

#include "../../engine/core/EntityId.h"
#include "EnergyType.h"

namespace Zen {

struct Pattern {
    Engine::EntityId id;
    std::string name;
    std::string shape;
    std::set<Engine::EntityId> resonatorIds;
    std::vector<Engine::EntityId> connectionIds;
    EnergyType dominantEnergyType{EnergyType::Calm};
    float value{0.0f};
    int complexity{1};
    bool isComplete{true};
    float activeTime{0.0f};
};

}  // namespace Zen
