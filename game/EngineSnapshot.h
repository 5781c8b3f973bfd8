// Owned copy of the simulation state for presentation code, plus derived values.
#pragma once

#include <vector>

#include "GameState.h"
#include "components/Amplifier.h"
#include "components/Connection.h"
#include "components/Core.h"
#include "components/Dissonance.h"
#include "components/Pattern.h"
#include "components/Resonator.h"
#include "components/Wave.h"

namespace Zen {

struct EngineSnapshot {
    GameState state{GameState::Loading};
    Core core{};
    std::vector<Dissonance> dissonances;
    std::vector<Amplifier> amplifiers;
    std::vector<Resonator> resonators;
    std::vector<Wave> waves;
    std::vector<Connection> connections;
    std::vector<Pattern> patterns;
    float score{0.0f};
    int fps{0};
    double clock{0.0};
    float collisionCooldown{0.0f};
    int patternsCompleted{0};
};

inline float energyRatio(const EngineSnapshot& s) {
    return s.core.maxEnergy > 0.0f ? s.core.energy / s.core.maxEnergy : 0.0f;
}

inline float balanceDeviation(const EngineSnapshot& s) { return normalizedDeviation(s.core.energyBalance); }

inline bool isInvulnerable(const EngineSnapshot& s) { return s.collisionCooldown > 0.0f; }

inline int activatedResonatorCount(const EngineSnapshot& s) {
    int n = 0;
    for (const auto& r : s.resonators) {
        if (r.isActivated) ++n;
    }
    return n;
}

// Fraction of the way to the next harmony level.
inline float harmonyProgress(const EngineSnapshot& s, int patternsPerLevel) {
    if (patternsPerLevel <= 0) return 0.0f;
    return static_cast<float>(s.patternsCompleted % patternsPerLevel) / static_cast<float>(patternsPerLevel);
}

}  // namespace Zen
