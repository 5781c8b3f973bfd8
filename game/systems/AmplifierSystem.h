// Spawns collectible amplifiers and applies/reverts their effects on the core.
#pragma once

#include <random>
#include <vector>

#include "../../engine/core/EntityId.h"
#include "../../engine/status/StatusContainer.h"
#include "../GameConfig.h"
#include "../components/Amplifier.h"
#include "../components/Core.h"

namespace Zen {

inline constexpr const char* kFrequencyBoostTag = "frequency_boost";
inline constexpr const char* kAmplitudeBoostTag = "amplitude_boost";
inline constexpr const char* kBalanceBoostTag = "balance_boost";

struct EffectOutcome {
    float scoreDelta{0.0f};
    bool balanced{false};
    EnergyBalance oldBalance{};
    EnergyBalance newBalance{};
};

class AmplifierSystem {
public:
    explicit AmplifierSystem(std::mt19937& rng);

    int update(std::vector<Amplifier>& amplifiers, const GameConfig& cfg, Engine::IdGenerator& ids, float dt);

    Amplifier spawn(const GameConfig& cfg, Engine::IdGenerator& ids);
    AmplifierType sampleType();
    void advance(Amplifier& a, float dt) const;

    // Mutates the core right away; timed parts are recorded in `effects` and undone by updateEffects.
    EffectOutcome applyEffect(const Amplifier& amp, Core& core, Engine::Status::StatusContainer& effects,
                              const GameConfig& cfg) const;
    void updateEffects(Core& core, Engine::Status::StatusContainer& effects, float dt) const;

    void resetTimer() { timer_ = 0.0f; }

private:
    std::mt19937& rng_;
    float timer_{0.0f};
};

}  // namespace Zen
