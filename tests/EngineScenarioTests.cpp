// Minimal sanity checks for full sessions driven through the engine facade.
#include <algorithm>
#include <cassert>
#include <cmath>
#include <vector>
#include "../game/HarmonicsEngine.h"

using namespace Zen;

namespace {
constexpr double kStep = 1.0 / 60.0;

GameConfig quietConfig() {
    GameConfig cfg{};
    cfg.spawning.dissonanceRate = 0.0f;
    cfg.spawning.amplifierRate = 0.0f;
    cfg.spawning.initialResonators = 0;
    return cfg;
}

int countOf(const std::vector<GameEventType>& events, GameEventType type) {
    return static_cast<int>(std::count(events.begin(), events.end(), type));
}

void placeTriangle(HarmonicsEngine& engine, EnergyType type, float distance) {
    const Engine::Vec2 center = engine.core().position;
    for (int i = 0; i < 3; ++i) {
        const float angle = static_cast<float>(i) * 2.0943951f;
        assert(engine.addResonator(center + Engine::Vec2{std::cos(angle), std::sin(angle)} * distance, type));
    }
}
}  // namespace

int main() {
    {
        // A still core only loses passive decay: 1000 ticks at 60 Hz with nothing able to spawn.
        GameConfig cfg{};
        cfg.spawning.maxDissonances = 0;
        cfg.spawning.maxAmplifiers = 0;
        cfg.spawning.initialResonators = 0;
        HarmonicsEngine engine(cfg);
        assert(engine.start());
        float lastEnergy = engine.core().energy;
        float lastScore = engine.score();
        for (int i = 0; i < 1000; ++i) {
            engine.tick(kStep);
            assert(engine.core().energy < lastEnergy);
            assert(engine.score() > lastScore);
            lastEnergy = engine.core().energy;
            lastScore = engine.score();
        }
        assert(engine.state() == GameState::Playing);
        assert(engine.dissonances().empty() && engine.amplifiers().empty());
        assert(std::abs(engine.core().energy - (100.0f - 0.1f * 1000.0f / 60.0f)) < 1e-2f);
        assert(engine.core().position.x == 275.0f && engine.core().position.y == 275.0f);
        assert(engine.fps() == 60);
        // Harmony 1 with a near-even balance earns a little under half a point per second.
        assert(engine.score() > 7.0f && engine.score() < 8.34f);
    }
    {
        // Running dry ends the session exactly once.
        GameConfig cfg = quietConfig();
        cfg.energy.decayRate = 50.0f;
        HarmonicsEngine engine(cfg);
        std::vector<GameEventType> events;
        engine.subscribe([&](const GameEvent& e) { events.push_back(e.type); });
        engine.start();
        for (int i = 0; i < 300; ++i) engine.tick(kStep);
        assert(engine.state() == GameState::GameOver);
        assert(engine.core().energy == 0.0f);
        assert(countOf(events, GameEventType::EnergyDepleted) == 1);
        assert(countOf(events, GameEventType::GameEnded) == 1);
        assert(events.back() == GameEventType::GameEnded);
    }
    {
        // Impulses are charged and can deplete the core too.
        GameConfig cfg = quietConfig();
        cfg.energy.impulseCost = 40.0f;
        HarmonicsEngine engine(cfg);
        int depleted = 0;
        engine.subscribe([&](const GameEvent& e) {
            if (e.type == GameEventType::EnergyDepleted) ++depleted;
        });
        engine.start();
        assert(engine.applyImpulse(Engine::Vec2{1.0f, 0.0f}));
        assert(engine.core().velocity.x > 0.0f);
        assert(!engine.applyImpulse(Engine::Vec2{0.0f, 0.0f}));
        assert(engine.applyImpulse(Engine::Vec2{0.0f, 1.0f}));
        assert(engine.applyImpulse(Engine::Vec2{-1.0f, 0.0f}));
        assert(engine.core().energy == 0.0f);
        assert(engine.state() == GameState::GameOver);
        assert(depleted == 1);
    }
    {
        // Waves cost energy and shift the balance toward their type.
        HarmonicsEngine engine(quietConfig());
        engine.start();
        const float calm = engine.core().energyBalance.calm;
        assert(engine.generateWave(EnergyType::Calm));
        assert(engine.core().energy == 95.0f);
        assert(engine.core().energyBalance.calm == calm + 1.0f);
        assert(engine.waves().size() == 1);
    }
    {
        // Completing a pattern at the last harmony step wins the session.
        GameConfig cfg = quietConfig();
        cfg.harmony.patternsPerHarmonyLevel = 1;
        cfg.harmony.victoryHarmonyLevel = 2;
        HarmonicsEngine engine(cfg);
        std::vector<GameEventType> events;
        engine.subscribe([&](const GameEvent& e) { events.push_back(e.type); });
        engine.start();
        placeTriangle(engine, EnergyType::Calm, 60.0f);
        assert(engine.generateWave(EnergyType::Calm));
        for (int i = 0; i < 120 && engine.state() == GameState::Playing; ++i) engine.tick(kStep);
        assert(engine.state() == GameState::Victory);
        assert(engine.core().harmonyLevel == 2);
        assert(countOf(events, GameEventType::PatternCompleted) == 1);
        assert(countOf(events, GameEventType::HarmonyIncreased) == 1);
        assert(countOf(events, GameEventType::GameEnded) == 1);
        assert(engine.score() >= 90.0f);
        assert(engine.snapshot().patternsCompleted == 1);
    }
    {
        // Placed obstacles and pickups collide through the normal tick.
        HarmonicsEngine engine(quietConfig());
        std::vector<GameEventType> events;
        engine.subscribe([&](const GameEvent& e) { events.push_back(e.type); });
        engine.start();
        const Engine::Vec2 at = engine.core().position;
        assert(engine.placeAmplifier(at, AmplifierType::Frequency, EnergyType::Calm));
        engine.tick(kStep);
        assert(countOf(events, GameEventType::PowerupCollected) == 1);
        assert(engine.amplifiers().empty());
        assert(std::abs(engine.core().frequency - 1.5f) < 1e-4f);
        assert(engine.activeEffects().hasTag(kFrequencyBoostTag));

        assert(engine.placeDissonance(at + Engine::Vec2{10.0f, 0.0f}, DissonanceType::Static, EnergyType::Calm, 15.0f));
        engine.tick(kStep);
        assert(countOf(events, GameEventType::CoreCollision) == 1);
        assert(engine.dissonances().empty());
        assert(engine.core().energy < 86.0f);
        assert(isInvulnerable(engine.snapshot()));

        // Reset returns to the menu with a fresh core and no lingering boosts.
        assert(engine.reset());
        assert(engine.state() == GameState::Menu);
        assert(engine.activeEffects().empty());
        assert(engine.core().frequency == 1.0f);
        assert(engine.core().activeEffects.empty());
        assert(engine.core().energy == 100.0f);
        assert(engine.score() == 0.0f);
        assert(engine.collisionCooldown() == 0.0f);
    }
    {
        // A balance pickup reports the shift.
        GameConfig cfg = quietConfig();
        cfg.energy.initialBalance = EnergyBalance{60.0f, 30.0f, 0.0f};
        HarmonicsEngine engine(cfg);
        nlohmann::json balanced;
        engine.subscribe([&](const GameEvent& e) {
            if (e.type == GameEventType::EnergyBalanced) balanced = e.data;
        });
        engine.start();
        engine.placeAmplifier(engine.core().position, AmplifierType::Balance, EnergyType::Calm);
        engine.tick(kStep);
        assert(balanced.is_object());
        assert(balanced["oldBalance"]["calm"].get<float>() == 60.0f);
        assert(balanced["newBalance"]["calm"].get<float>() < 60.0f);
    }
    {
        // Starting with overrides applies them to the new session.
        HarmonicsEngine engine(quietConfig());
        engine.initialize();
        const nlohmann::json overrides = nlohmann::json::parse(R"({ "mode": "resonance", "spawning": { "dissonanceRate": 0 } })");
        assert(engine.start(overrides));
        assert(engine.config().mode == GameMode::Resonance);
        assert(engine.resonators().size() == 8);
        engine.end();
        GameConfig next = quietConfig();
        next.spawning.initialResonators = 3;
        assert(engine.start(next));
        assert(engine.resonators().size() == 3);
    }
    {
        // Equal seeds replay identically.
        GameConfig cfg{};
        cfg.seed = 2024;
        cfg.spawning.dissonanceRate = 2.0f;
        HarmonicsEngine a(cfg);
        HarmonicsEngine b(cfg);
        a.start();
        b.start();
        for (int i = 0; i < 300; ++i) {
            a.tick(kStep);
            b.tick(kStep);
        }
        assert(a.dissonances().size() == b.dissonances().size());
        for (std::size_t i = 0; i < a.dissonances().size(); ++i) {
            assert(a.dissonances()[i].position.x == b.dissonances()[i].position.x);
            assert(a.dissonances()[i].type == b.dissonances()[i].type);
        }
        assert(a.core().energy == b.core().energy);
    }
    {
        // Invalid deltas are refused.
        HarmonicsEngine engine(quietConfig());
        engine.start();
        engine.tick(-1.0);
        engine.tick(std::nan(""));
        assert(engine.clock() == 0.0);
        assert(engine.core().energy == 100.0f);
    }
    return 0;
}
