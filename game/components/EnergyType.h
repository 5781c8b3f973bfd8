// Energy categories shared by waves, resonators, dissonances and the core balance.
#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace Zen {

enum class EnergyType { Calm = 0, Vibrant, Intense };

constexpr int kEnergyTypeCount = 3;
constexpr std::array<EnergyType, kEnergyTypeCount> kAllEnergyTypes{EnergyType::Calm, EnergyType::Vibrant,
                                                                   EnergyType::Intense};

inline std::string_view toString(EnergyType type) {
    switch (type) {
        case EnergyType::Calm:
            return "calm";
        case EnergyType::Vibrant:
            return "vibrant";
        case EnergyType::Intense:
        default:
            return "intense";
    }
}

inline std::optional<EnergyType> energyTypeFromString(std::string_view name) {
    for (auto type : kAllEnergyTypes) {
        if (toString(type) == name) return type;
    }
    return std::nullopt;
}

inline EnergyType energyTypeFromIndex(int index) {
    return kAllEnergyTypes[static_cast<std::size_t>(((index % kEnergyTypeCount) + kEnergyTypeCount) % kEnergyTypeCount)];
}

struct EnergyBalance {
    float calm{33.0f};
    float vibrant{33.0f};
    float intense{34.0f};

    float& operator[](EnergyType type) {
        switch (type) {
            case EnergyType::Calm:
                return calm;
            case EnergyType::Vibrant:
                return vibrant;
            case EnergyType::Intense:
            default:
                return intense;
        }
    }
    float operator[](EnergyType type) const {
        switch (type) {
            case EnergyType::Calm:
                return calm;
            case EnergyType::Vibrant:
                return vibrant;
            case EnergyType::Intense:
            default:
                return intense;
        }
    }

    float total() const { return calm + vibrant + intense; }
};

// Summed absolute deviation from the mean over the total, clamped to [0,1]; 0 for an empty balance.
inline float normalizedDeviation(const EnergyBalance& balance) {
    const float total = balance.total();
    if (total <= 1e-6f) {
        return 0.0f;
    }
    const float mean = total / 3.0f;
    const float dev = std::abs(balance.calm - mean) + std::abs(balance.vibrant - mean) +
                      std::abs(balance.intense - mean);
    const float ratio = dev / total;
    return ratio < 0.0f ? 0.0f : (ratio > 1.0f ? 1.0f : ratio);
}

}  // namespace Zen
