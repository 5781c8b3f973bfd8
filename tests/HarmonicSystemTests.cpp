// Minimal sanity checks for waves, resonator activation, connections and patterns.
#include <algorithm>
#include <cassert>
#include <cmath>
#include <string>
#include <vector>
#include "../game/EntityFactories.h"
#include "../game/systems/HarmonicSystem.h"

using namespace Zen;

namespace {
constexpr float kStep = 1.0f / 60.0f;

GameConfig emptyField() {
    GameConfig cfg{};
    cfg.spawning.initialResonators = 0;
    return cfg;
}

// Three resonators of one energy, evenly spaced on a circle around the core.
void placeTriangle(HarmonicSystem& sys, const Core& core, EnergyType type, float distance, const GameConfig& cfg,
                   Engine::IdGenerator& ids) {
    for (int i = 0; i < 3; ++i) {
        const float angle = static_cast<float>(i) * 2.0943951f;
        sys.addResonator(core.position + Engine::Vec2{std::cos(angle), std::sin(angle)} * distance, type, cfg, ids);
    }
}

int countOf(const std::vector<GameEventType>& events, GameEventType type) {
    return static_cast<int>(std::count(events.begin(), events.end(), type));
}
}  // namespace

int main() {
    Engine::IdGenerator ids;
    {
        // Starting resonators sit on a ring with cycling energies.
        GameConfig cfg{};
        HarmonicSystem sys;
        sys.initialize(cfg, ids);
        assert(sys.resonators().size() == 5);
        const Engine::Vec2 center{275.0f, 275.0f};
        for (const auto& r : sys.resonators()) {
            assert(std::abs(Engine::distance(r.position, center) - cfg.field.resonatorRingRadius) < 1e-2f);
            assert(!r.isActivated);
        }
        assert(sys.resonators()[0].energyType == EnergyType::Calm);
        assert(sys.resonators()[1].energyType == EnergyType::Vibrant);
        assert(sys.resonators()[2].energyType == EnergyType::Intense);
        assert(sys.resonators()[3].energyType == EnergyType::Calm);

        cfg.spawning.maxResonators = 6;
        assert(sys.addResonator(Engine::Vec2{10.0f, 10.0f}, EnergyType::Calm, cfg, ids) != nullptr);
        assert(sys.addResonator(Engine::Vec2{20.0f, 20.0f}, EnergyType::Calm, cfg, ids) == nullptr);
        assert(sys.resonators().size() == 6);
    }
    {
        // Three calm resonators lit by one calm wave form a single triangle.
        GameConfig cfg = emptyField();
        cfg.energy.decayRate = 0.0f;
        HarmonicSystem sys;
        std::vector<GameEventType> events;
        std::string patternName;
        sys.setEventSink([&](GameEventType type, nlohmann::json data) {
            events.push_back(type);
            if (type == GameEventType::PatternCompleted) patternName = data["name"].get<std::string>();
        });
        sys.initialize(cfg, ids);
        Core core = makeCore(ids, cfg);
        placeTriangle(sys, core, EnergyType::Calm, 60.0f, cfg, ids);
        assert(sys.generateWave(core, EnergyType::Calm, cfg, ids) != nullptr);

        float score = 0.0f;
        for (int i = 0; i < 90; ++i) score += sys.update(core, cfg, ids, kStep);

        for (const auto& r : sys.resonators()) {
            assert(r.isActivated);
            assert(r.connections.size() == 2);
        }
        assert(sys.connections().size() == 3);
        assert(sys.patterns().size() == 1);
        assert(sys.patterns()[0].resonatorIds.size() == 3);
        assert(sys.patterns()[0].complexity == 2);
        assert(sys.patterns()[0].isComplete);
        assert(sys.patternsCompleted() == 1);
        assert(patternName == "Triangle of Water");
        assert(std::abs(score - 90.0f) < 1e-3f);
        assert(countOf(events, GameEventType::ResonatorActivated) == 3);
        assert(countOf(events, GameEventType::ResonatorConnected) == 3);
        assert(countOf(events, GameEventType::PatternCompleted) == 1);
        assert(countOf(events, GameEventType::HarmonyIncreased) == 0);
        assert(core.harmonyLevel == 1);
    }
    {
        // Waves of another energy leave resonators alone.
        GameConfig cfg = emptyField();
        HarmonicSystem sys;
        sys.initialize(cfg, ids);
        Core core = makeCore(ids, cfg);
        placeTriangle(sys, core, EnergyType::Calm, 60.0f, cfg, ids);
        sys.generateWave(core, EnergyType::Intense, cfg, ids);
        for (int i = 0; i < 90; ++i) sys.update(core, cfg, ids, kStep);
        for (const auto& r : sys.resonators()) assert(!r.isActivated);
        assert(sys.connections().empty());
    }
    {
        // Wave radius only grows; the wave retires past its reach.
        GameConfig cfg = emptyField();
        HarmonicSystem sys;
        sys.initialize(cfg, ids);
        Core core = makeCore(ids, cfg);
        core.amplitude = 0.5f;  // reach 150px
        sys.generateWave(core, EnergyType::Vibrant, cfg, ids);
        assert(sys.waves().size() == 1);
        assert(sys.waves()[0].maxRadius == 150.0f);
        float last = 0.0f;
        int ticks = 0;
        while (!sys.waves().empty() && ticks < 600) {
            sys.update(core, cfg, ids, kStep);
            if (!sys.waves().empty()) {
                assert(sys.waves()[0].radius >= last);
                assert(sys.waves()[0].opacity <= cfg.harmony.waveBaseOpacity);
                last = sys.waves()[0].radius;
            }
            ++ticks;
        }
        assert(sys.waves().empty());
        assert(ticks > 70 && ticks < 80);
    }
    {
        // The wave cap rejects extra waves.
        GameConfig cfg = emptyField();
        cfg.spawning.maxHarmonicWaves = 2;
        HarmonicSystem sys;
        sys.initialize(cfg, ids);
        const Core core = makeCore(ids, cfg);
        assert(sys.generateWave(core, EnergyType::Calm, cfg, ids));
        assert(sys.generateWave(core, EnergyType::Calm, cfg, ids));
        assert(!sys.generateWave(core, EnergyType::Calm, cfg, ids));
    }
    {
        // Separate energy groups yield distinct patterns and a harmony step per pattern here.
        GameConfig cfg = emptyField();
        cfg.harmony.patternsPerHarmonyLevel = 1;
        HarmonicSystem sys;
        std::vector<GameEventType> events;
        sys.setEventSink([&](GameEventType type, const nlohmann::json&) { events.push_back(type); });
        sys.initialize(cfg, ids);
        Core core = makeCore(ids, cfg);
        placeTriangle(sys, core, EnergyType::Calm, 60.0f, cfg, ids);
        placeTriangle(sys, core, EnergyType::Intense, 100.0f, cfg, ids);
        sys.generateWave(core, EnergyType::Calm, cfg, ids);
        sys.generateWave(core, EnergyType::Intense, cfg, ids);
        for (int i = 0; i < 120; ++i) sys.update(core, cfg, ids, kStep);

        assert(sys.patterns().size() == 2);
        assert(sys.patterns()[0].resonatorIds != sys.patterns()[1].resonatorIds);
        assert(sys.patterns()[0].dominantEnergyType != sys.patterns()[1].dominantEnergyType);
        assert(core.harmonyLevel == 3);
        assert(countOf(events, GameEventType::HarmonyIncreased) == 2);
    }
    {
        // Connections drop once an endpoint stops being active; the pattern stops counting as complete.
        GameConfig cfg = emptyField();
        cfg.harmony.resonatorActivationDuration = 0.5f;
        HarmonicSystem sys;
        sys.initialize(cfg, ids);
        Core core = makeCore(ids, cfg);
        placeTriangle(sys, core, EnergyType::Calm, 60.0f, cfg, ids);
        sys.generateWave(core, EnergyType::Calm, cfg, ids);
        for (int i = 0; i < 30; ++i) sys.update(core, cfg, ids, kStep);
        assert(sys.connections().size() == 3);
        for (int i = 0; i < 60; ++i) sys.update(core, cfg, ids, kStep);
        assert(sys.connections().empty());
        for (const auto& r : sys.resonators()) {
            assert(!r.isActivated);
            assert(r.connections.empty());
            assert(r.intensity >= 0.2f && r.intensity <= 1.0f);
        }
        assert(sys.patterns().size() == 1);
        assert(!sys.patterns()[0].isComplete);
        assert(sys.patterns()[0].activeTime == 0.0f);
    }
    {
        assert(patternShapeName(4) == "Square");
        assert(patternName(5, EnergyType::Vibrant) == "Pentagon of Forest");
        assert(patternName(9, EnergyType::Intense) == "Complex of Fire");
        assert(patternShapeName(12) == "Complex");
        assert(patternShapeName(2) == "Line");
    }
    return 0;
}
