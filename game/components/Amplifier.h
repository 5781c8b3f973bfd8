// Collectible granting an instant or timed boost to the core.
#pragma once

#include <optional>
#include <string_view>

#include "../../engine/core/EntityId.h"
#include "../../engine/math/Vec2.h"
#include "../../engine/render/Color.h"
#include "EnergyType.h"

namespace Zen {

enum class AmplifierType { Energy = 0, Frequency, Amplitude, Resonance, Balance, Clarity, Expansion, Stability };

constexpr int kAmplifierTypeCount = 8;

inline std::string_view toString(AmplifierType type) {
    switch (type) {
        case AmplifierType::Energy:
            return "energy";
        case AmplifierType::Frequency:
            return "frequency";
        case AmplifierType::Amplitude:
            return "amplitude";
        case AmplifierType::Resonance:
            return "resonance";
        case AmplifierType::Balance:
            return "balance";
        case AmplifierType::Clarity:
            return "clarity";
        case AmplifierType::Expansion:
            return "expansion";
        case AmplifierType::Stability:
        default:
            return "stability";
    }
}

inline std::optional<AmplifierType> amplifierTypeFromString(std::string_view name) {
    for (int i = 0; i < kAmplifierTypeCount; ++i) {
        const auto type = static_cast<AmplifierType>(i);
        if (toString(type) == name) return type;
    }
    return std::nullopt;
}

// Effect strength per kind.
inline float defaultAmplifierValue(AmplifierType type) {
    switch (type) {
        case AmplifierType::Energy:
            return 25.0f;
        case AmplifierType::Frequency:
            return 0.5f;
        case AmplifierType::Amplitude:
            return 0.3f;
        case AmplifierType::Resonance:
            return 0.4f;
        case AmplifierType::Balance:
            return 0.6f;
        case AmplifierType::Clarity:
            return 0.5f;
        case AmplifierType::Expansion:
            return 0.3f;
        case AmplifierType::Stability:
        default:
            return 0.7f;
    }
}

struct Amplifier {
    Engine::EntityId id;
    AmplifierType type{AmplifierType::Energy};
    EnergyType energyType{EnergyType::Calm};
    Engine::Vec2 position{};
    float value{25.0f};
    float duration{5.0f};  // effect lifetime once collected
    float radius{15.0f};
    Engine::Color color{78, 205, 196, 255};
    float opacity{0.9f};
    float age{0.0f};
    float lifeTime{10.0f};  // time on the field before it fades out
    bool isActive{true};
};

}  // namespace Zen
