// Hostile obstacle that drains the core on contact.
#pragma once

#include <optional>
#include <string_view>

#include "../../engine/core/EntityId.h"
#include "../../engine/math/Vec2.h"
#include "../../engine/render/Color.h"
#include "EnergyType.h"

namespace Zen {

enum class DissonanceType { Static = 0, Moving, Pulsating, Disruptive };
enum class DissonanceShape { Circle = 0, Square, Triangle, Irregular };

constexpr int kDissonanceTypeCount = 4;
constexpr int kDissonanceShapeCount = 4;

inline std::string_view toString(DissonanceType type) {
    switch (type) {
        case DissonanceType::Static:
            return "static";
        case DissonanceType::Moving:
            return "moving";
        case DissonanceType::Pulsating:
            return "pulsating";
        case DissonanceType::Disruptive:
        default:
            return "disruptive";
    }
}

struct Dissonance {
    Engine::EntityId id;
    DissonanceType type{DissonanceType::Static};
    DissonanceShape shape{DissonanceShape::Circle};
    Engine::Vec2 position{};
    float radius{15.0f};
    std::optional<Engine::Vec2> velocity;
    float rotation{0.0f};
    std::optional<float> rotationSpeed;
    std::optional<float> pulseFrequency;
    EnergyType countersEnergy{EnergyType::Calm};
    float disruptionLevel{10.0f};
    Engine::Color color{255, 107, 107, 255};
    float opacity{0.8f};
    float age{0.0f};
    float lifeTime{20.0f};
    bool isActive{true};
};

}  // namespace Zen
