// Minimal sanity checks for collisions, amplifier effects and scoring.
#include <cassert>
#include <cmath>
#include <vector>
#include "../game/EntityFactories.h"
#include "../game/systems/AmplifierSystem.h"
#include "../game/systems/CollisionSystem.h"

using namespace Zen;

namespace {
bool near(float a, float b, float eps = 1e-4f) { return std::abs(a - b) < eps; }
}  // namespace

int main() {
    Engine::IdGenerator ids;
    std::mt19937 rng(11);
    const AmplifierSystem amplifiers(rng);
    {
        // A hit drains energy, shoves the core away and starts the cooldown.
        GameConfig cfg{};
        CollisionSystem collisions;
        Core core = makeCore(ids, cfg);
        std::vector<Dissonance> ds{
            makeDissonance(ids, core.position + Engine::Vec2{10.0f, 0.0f}, DissonanceType::Static, EnergyType::Calm, cfg),
            makeDissonance(ids, core.position - Engine::Vec2{10.0f, 0.0f}, DissonanceType::Static, EnergyType::Calm, cfg)};
        std::vector<Amplifier> as;
        int hits = 0;
        collisions.update(core, ds, as, cfg, 1.0f / 60.0f, [&](const Dissonance&) { ++hits; }, nullptr);
        assert(hits == 1);
        assert(core.energy == 90.0f);
        assert(core.velocity.x < 0.0f);
        assert(near(core.energyBalance.calm, 31.0f));
        assert(!ds[0].isActive);
        assert(ds[1].isActive);
        assert(collisions.invulnerable());
        assert(near(collisions.cooldownRemaining(), cfg.collision.cooldown));

        // Still overlapping, but invulnerable.
        for (int i = 0; i < 30; ++i) {
            collisions.update(core, ds, as, cfg, 1.0f / 60.0f, [&](const Dissonance&) { ++hits; }, nullptr);
        }
        assert(hits == 1);
        assert(core.energy == 90.0f);
    }
    {
        // Energy never goes negative; coincident centres skip the knockback.
        GameConfig cfg{};
        CollisionSystem collisions;
        Core core = makeCore(ids, cfg);
        core.energy = 4.0f;
        core.energyBalance.vibrant = 1.0f;
        std::vector<Dissonance> ds{
            makeDissonance(ids, core.position, DissonanceType::Disruptive, EnergyType::Vibrant, cfg)};
        std::vector<Amplifier> as;
        collisions.update(core, ds, as, cfg, 0.0f, nullptr, nullptr);
        assert(core.energy == 0.0f);
        assert(core.velocity.x == 0.0f && core.velocity.y == 0.0f);
        assert(core.energyBalance.vibrant == 0.0f);
    }
    {
        // Dissonances win over amplifiers in the same step; the amplifier waits for the cooldown.
        GameConfig cfg{};
        CollisionSystem collisions;
        Core core = makeCore(ids, cfg);
        std::vector<Dissonance> ds{
            makeDissonance(ids, core.position + Engine::Vec2{5.0f, 0.0f}, DissonanceType::Static, EnergyType::Calm, cfg)};
        std::vector<Amplifier> as{
            makeAmplifier(ids, core.position, AmplifierType::Energy, EnergyType::Calm, cfg)};
        int collected = 0;
        collisions.update(core, ds, as, cfg, 0.1f, nullptr, [&](const Amplifier&) { ++collected; });
        assert(collected == 0);
        assert(as[0].isActive);
        for (int i = 0; i < 8; ++i) {
            collisions.update(core, ds, as, cfg, 0.1f, nullptr, [&](const Amplifier&) { ++collected; });
        }
        assert(collected == 1);
        assert(!as[0].isActive);
    }
    {
        GameConfig cfg{};
        Core core = makeCore(ids, cfg);
        Engine::Status::StatusContainer effects;
        const Amplifier energy = makeAmplifier(ids, core.position, AmplifierType::Energy, EnergyType::Calm, cfg);
        core.energy = 50.0f;
        amplifiers.applyEffect(energy, core, effects, cfg);
        assert(core.energy == 75.0f);
        core.energy = 90.0f;
        amplifiers.applyEffect(energy, core, effects, cfg);
        assert(core.energy == 100.0f);
        assert(effects.empty());
    }
    {
        // Timed boosts stack per pickup and are reverted exactly on expiry.
        GameConfig cfg{};
        Core core = makeCore(ids, cfg);
        Engine::Status::StatusContainer effects;
        const Amplifier freq = makeAmplifier(ids, core.position, AmplifierType::Frequency, EnergyType::Calm, cfg);
        amplifiers.applyEffect(freq, core, effects, cfg);
        assert(near(core.frequency, 1.5f));
        assert(core.activeEffects.count(kFrequencyBoostTag) == 1);

        amplifiers.updateEffects(core, effects, 2.0f);
        amplifiers.applyEffect(freq, core, effects, cfg);
        assert(near(core.frequency, 2.0f));

        amplifiers.updateEffects(core, effects, 3.0f);
        assert(near(core.frequency, 1.5f));
        assert(core.activeEffects.count(kFrequencyBoostTag) == 1);

        amplifiers.updateEffects(core, effects, 2.0f);
        assert(near(core.frequency, 1.0f));
        assert(core.activeEffects.empty());
        assert(effects.empty());
    }
    {
        GameConfig cfg{};
        Core core = makeCore(ids, cfg);
        Engine::Status::StatusContainer effects;
        const Amplifier amp = makeAmplifier(ids, core.position, AmplifierType::Amplitude, EnergyType::Vibrant, cfg);
        amplifiers.applyEffect(amp, core, effects, cfg);
        assert(near(core.amplitude, 1.3f));
        amplifiers.updateEffects(core, effects, cfg.spawning.amplifierEffectDuration);
        assert(near(core.amplitude, 1.0f));
    }
    {
        // A zero-length boost is never started, so nothing is left to revert.
        GameConfig cfg{};
        cfg.spawning.amplifierEffectDuration = 0.0f;
        Core core = makeCore(ids, cfg);
        Engine::Status::StatusContainer effects;
        const Amplifier freq = makeAmplifier(ids, core.position, AmplifierType::Frequency, EnergyType::Calm, cfg);
        const Amplifier amp = makeAmplifier(ids, core.position, AmplifierType::Amplitude, EnergyType::Calm, cfg);
        amplifiers.applyEffect(freq, core, effects, cfg);
        amplifiers.applyEffect(amp, core, effects, cfg);
        for (int i = 0; i < 600; ++i) {
            amplifiers.updateEffects(core, effects, 1.0f / 60.0f);
        }
        assert(near(core.frequency, 1.0f));
        assert(near(core.amplitude, 1.0f));
        assert(effects.empty());
        assert(core.activeEffects.empty());
    }
    {
        // Balance pulls each energy toward the mean and awards the bonus once balanced.
        GameConfig cfg{};
        Core core = makeCore(ids, cfg);
        core.energyBalance = EnergyBalance{60.0f, 30.0f, 0.0f};
        Engine::Status::StatusContainer effects;
        const Amplifier bal = makeAmplifier(ids, core.position, AmplifierType::Balance, EnergyType::Calm, cfg);
        const EffectOutcome out = amplifiers.applyEffect(bal, core, effects, cfg);
        assert(out.balanced);
        assert(out.oldBalance.calm == 60.0f);
        assert(near(core.energyBalance.calm, 42.0f));
        assert(near(core.energyBalance.vibrant, 30.0f));
        assert(near(core.energyBalance.intense, 18.0f));
        assert(near(core.energyBalance.total(), 90.0f));
        assert(normalizedDeviation(core.energyBalance) <= cfg.energy.imbalanceThreshold);
        assert(out.scoreDelta == cfg.energy.balanceBonus);
        assert(core.activeEffects.count(kBalanceBoostTag) == 1);
    }
    {
        GameConfig cfg{};
        Core core = makeCore(ids, cfg);
        Engine::Status::StatusContainer effects;
        const Amplifier clarity = makeAmplifier(ids, core.position, AmplifierType::Clarity, EnergyType::Calm, cfg);
        const EffectOutcome out = amplifiers.applyEffect(clarity, core, effects, cfg);
        assert(out.scoreDelta == cfg.collision.amplifierScore);
        assert(!out.balanced);
    }
    {
        // Score accrues with harmony and shrinks with imbalance.
        Core core;
        core.harmonyLevel = 2;
        core.energyBalance = EnergyBalance{30.0f, 30.0f, 30.0f};
        assert(near(CollisionSystem::balanceMultiplier(core), 1.0f));
        assert(near(CollisionSystem::scoreFor(core, 1.0f), 1.0f));
        core.energyBalance = EnergyBalance{90.0f, 0.0f, 0.0f};
        const float skewed = CollisionSystem::scoreFor(core, 1.0f);
        assert(skewed < 1.0f && skewed >= 0.5f);
    }
    return 0;
}
