#include "AmplifierSystem.h"

#include <algorithm>
#include <array>
#include <string>

#include "../../engine/core/Logger.h"
#include "../EntityFactories.h"

namespace Zen {

namespace {
struct Weighted {
    AmplifierType type;
    float weight;
};

constexpr std::array<Weighted, kAmplifierTypeCount> kSpawnTable{{
    {AmplifierType::Energy, 0.25f},
    {AmplifierType::Frequency, 0.15f},
    {AmplifierType::Amplitude, 0.15f},
    {AmplifierType::Resonance, 0.10f},
    {AmplifierType::Balance, 0.10f},
    {AmplifierType::Clarity, 0.10f},
    {AmplifierType::Expansion, 0.10f},
    {AmplifierType::Stability, 0.05f},
}};

constexpr float kSpawnMargin = 30.0f;

// A boost with no positive duration has nothing to revert, so it is not started.
bool startTimed(Core& core, Engine::Status::StatusContainer& effects, const char* tag, float magnitude,
                float duration) {
    if (!(duration > 0.0f)) return false;
    Engine::Status::StatusSpec spec;
    spec.tag = tag;
    spec.magnitude = magnitude;
    spec.duration = duration;
    effects.apply(spec);
    core.activeEffects.insert(tag);
    return true;
}
}  // namespace

AmplifierSystem::AmplifierSystem(std::mt19937& rng) : rng_(rng) {}

AmplifierType AmplifierSystem::sampleType() {
    std::uniform_real_distribution<float> u01(0.0f, 1.0f);
    const float roll = u01(rng_);
    float cumulative = 0.0f;
    for (const auto& entry : kSpawnTable) {
        cumulative += entry.weight;
        if (roll <= cumulative) return entry.type;
    }
    return kSpawnTable.back().type;
}

Amplifier AmplifierSystem::spawn(const GameConfig& cfg, Engine::IdGenerator& ids) {
    std::uniform_real_distribution<float> xs(kSpawnMargin, std::max(kSpawnMargin, cfg.field.width - kSpawnMargin));
    std::uniform_real_distribution<float> ys(kSpawnMargin, std::max(kSpawnMargin, cfg.field.height - kSpawnMargin));
    std::uniform_int_distribution<int> energyDist(0, kEnergyTypeCount - 1);
    const auto type = sampleType();
    const Engine::Vec2 pos{xs(rng_), ys(rng_)};
    return makeAmplifier(ids, pos, type, energyTypeFromIndex(energyDist(rng_)), cfg);
}

void AmplifierSystem::advance(Amplifier& a, float dt) const {
    if (!a.isActive) return;
    a.age += dt;
    const float lifeRatio = a.lifeTime > 0.0f ? 1.0f - a.age / a.lifeTime : 0.0f;
    a.opacity = std::clamp(0.9f * (lifeRatio + 0.2f), 0.2f, 1.0f);
    if (a.age >= a.lifeTime) {
        a.isActive = false;
    }
}

int AmplifierSystem::update(std::vector<Amplifier>& amplifiers, const GameConfig& cfg, Engine::IdGenerator& ids,
                            float dt) {
    int spawned = 0;
    const float rate = cfg.spawning.amplifierRate;
    if (rate > 0.0f) {
        timer_ += dt;
        const auto active = std::count_if(amplifiers.begin(), amplifiers.end(),
                                          [](const Amplifier& a) { return a.isActive; });
        if (timer_ >= 1.0f / rate && active < cfg.spawning.maxAmplifiers) {
            amplifiers.push_back(spawn(cfg, ids));
            timer_ = 0.0f;
            ++spawned;
        }
    }

    for (auto& a : amplifiers) {
        advance(a, dt);
    }
    amplifiers.erase(std::remove_if(amplifiers.begin(), amplifiers.end(),
                                    [](const Amplifier& a) { return !a.isActive; }),
                     amplifiers.end());
    return spawned;
}

EffectOutcome AmplifierSystem::applyEffect(const Amplifier& amp, Core& core, Engine::Status::StatusContainer& effects,
                                           const GameConfig& cfg) const {
    EffectOutcome out;
    switch (amp.type) {
        case AmplifierType::Energy:
            core.energy = std::min(core.maxEnergy, core.energy + amp.value);
            break;
        case AmplifierType::Frequency:
            if (startTimed(core, effects, kFrequencyBoostTag, amp.value, amp.duration)) {
                core.frequency += amp.value;
            }
            break;
        case AmplifierType::Amplitude:
            if (startTimed(core, effects, kAmplitudeBoostTag, amp.value, amp.duration)) {
                core.amplitude += amp.value;
            }
            break;
        case AmplifierType::Balance: {
            out.oldBalance = core.energyBalance;
            const float target = core.energyBalance.total() / 3.0f;
            const float pull = std::clamp(amp.value * cfg.energy.balancePullScale, 0.0f, 1.0f);
            for (auto type : kAllEnergyTypes) {
                float& c = core.energyBalance[type];
                c += (target - c) * pull;
            }
            out.newBalance = core.energyBalance;
            out.balanced = true;
            startTimed(core, effects, kBalanceBoostTag, 0.0f, amp.duration);
            if (normalizedDeviation(core.energyBalance) <= cfg.energy.imbalanceThreshold) {
                out.scoreDelta += cfg.energy.balanceBonus;
            }
            break;
        }
        case AmplifierType::Resonance:
        case AmplifierType::Clarity:
        case AmplifierType::Expansion:
        case AmplifierType::Stability:
        default:
            out.scoreDelta += cfg.collision.amplifierScore;
            break;
    }
    return out;
}

void AmplifierSystem::updateEffects(Core& core, Engine::Status::StatusContainer& effects, float dt) const {
    for (const auto& expired : effects.update(dt)) {
        const auto& tag = expired.spec.tag;
        if (tag == kFrequencyBoostTag) {
            core.frequency -= expired.spec.magnitude;
        } else if (tag == kAmplitudeBoostTag) {
            core.amplitude -= expired.spec.magnitude;
        } else if (tag != kBalanceBoostTag) {
            Engine::logWarn("Expired effect with unknown tag '" + tag + "'.");
        }
        if (effects.count(tag) == 0) {
            core.activeEffects.erase(tag);
        }
    }
}

}  // namespace Zen
