// Minimal sanity checks for dissonance and amplifier spawning and lifetimes.
#include <array>
#include <cassert>
#include <random>
#include <vector>
#include "../game/EntityFactories.h"
#include "../game/systems/AmplifierSystem.h"
#include "../game/systems/DissonanceSystem.h"

using namespace Zen;

int main() {
    Engine::IdGenerator ids;
    {
        // Active dissonances never exceed the cap.
        std::mt19937 rng(1);
        DissonanceSystem sys(rng);
        GameConfig cfg{};
        cfg.spawning.dissonanceRate = 100.0f;
        const Core core = makeCore(ids, cfg);
        std::vector<Dissonance> list;
        for (int i = 0; i < 40; ++i) {
            sys.update(list, core, cfg, ids, 0.1f);
            assert(static_cast<int>(list.size()) <= cfg.spawning.maxDissonances);
        }
        assert(static_cast<int>(list.size()) == cfg.spawning.maxDissonances);
    }
    {
        // Rate zero spawns nothing.
        std::mt19937 rng(2);
        DissonanceSystem sys(rng);
        GameConfig cfg{};
        cfg.spawning.dissonanceRate = 0.0f;
        const Core core = makeCore(ids, cfg);
        std::vector<Dissonance> list;
        for (int i = 0; i < 600; ++i) {
            assert(sys.update(list, core, cfg, ids, 0.1f) == 0);
        }
        assert(list.empty());
    }
    {
        // The spawn interval is 1 / (rate * difficulty scale).
        std::mt19937 rng(3);
        DissonanceSystem sys(rng);
        GameConfig cfg{};
        cfg.spawning.dissonanceRate = 0.5f;
        cfg.difficulty = Difficulty::Beginner;  // interval 1 / 0.375
        const Core core = makeCore(ids, cfg);
        std::vector<Dissonance> list;
        int spawned = 0;
        for (int i = 0; i < 26; ++i) spawned += sys.update(list, core, cfg, ids, 0.1f);
        assert(spawned == 0);
        for (int i = 0; i < 2; ++i) spawned += sys.update(list, core, cfg, ids, 0.1f);
        assert(spawned == 1);
    }
    {
        // Spawns respect the minimum distance from the core and the field bounds.
        std::mt19937 rng(4);
        DissonanceSystem sys(rng);
        GameConfig cfg{};
        const Core core = makeCore(ids, cfg);
        for (int i = 0; i < 200; ++i) {
            const Dissonance d = sys.spawn(core, cfg, ids);
            assert(Engine::distance(d.position, core.position) >= cfg.spawning.minDissonanceDistance);
            assert(d.position.x >= 0.0f && d.position.x <= cfg.field.width);
            assert(d.position.y >= 0.0f && d.position.y <= cfg.field.height);
            assert(d.radius >= 15.0f && d.radius <= 25.0f);
            assert(d.disruptionLevel >= 10.0f && d.disruptionLevel < 20.0f);
            assert(d.velocity.has_value() == (d.type == DissonanceType::Moving));
            assert(d.pulseFrequency.has_value() == (d.type == DissonanceType::Pulsating));
            assert(d.rotationSpeed.has_value() == (d.type == DissonanceType::Disruptive));
        }
    }
    {
        // Moving dissonances bounce inside the field; pulsating ones stay within opacity bounds.
        std::mt19937 rng(5);
        const DissonanceSystem sys(rng);
        GameConfig cfg{};
        cfg.spawning.dissonanceLifeTime = 1000.0f;
        Dissonance mover = makeDissonance(ids, Engine::Vec2{500.0f, 40.0f}, DissonanceType::Moving,
                                          EnergyType::Calm, cfg);
        mover.velocity = Engine::Vec2{80.0f, -60.0f};
        Dissonance pulser = makeDissonance(ids, Engine::Vec2{100.0f, 100.0f}, DissonanceType::Pulsating,
                                           EnergyType::Intense, cfg);
        pulser.pulseFrequency = 3.0f;
        for (int i = 0; i < 600; ++i) {
            sys.advance(mover, cfg, 1.0f / 60.0f);
            sys.advance(pulser, cfg, 1.0f / 60.0f);
            assert(mover.position.x >= mover.radius && mover.position.x <= cfg.field.width - mover.radius);
            assert(mover.position.y >= mover.radius && mover.position.y <= cfg.field.height - mover.radius);
            assert(pulser.opacity >= 0.0f && pulser.opacity <= 0.8f + 1e-5f);
        }
        assert(mover.isActive);
    }
    {
        // Dissonances expire and are removed.
        std::mt19937 rng(6);
        DissonanceSystem sys(rng);
        GameConfig cfg{};
        cfg.spawning.dissonanceRate = 0.0f;
        cfg.spawning.dissonanceLifeTime = 1.0f;
        const Core core = makeCore(ids, cfg);
        std::vector<Dissonance> list{makeDissonance(ids, Engine::Vec2{50.0f, 50.0f}, DissonanceType::Static,
                                                    EnergyType::Vibrant, cfg)};
        sys.update(list, core, cfg, ids, 0.6f);
        assert(list.size() == 1);
        sys.update(list, core, cfg, ids, 0.6f);
        assert(list.empty());
    }
    {
        // Amplifier kinds follow the weighted table.
        std::mt19937 rng(7);
        AmplifierSystem sys(rng);
        std::array<int, kAmplifierTypeCount> counts{};
        for (int i = 0; i < 4000; ++i) {
            ++counts[static_cast<std::size_t>(sys.sampleType())];
        }
        for (int c : counts) assert(c > 0);
        assert(counts[static_cast<std::size_t>(AmplifierType::Energy)] >
               counts[static_cast<std::size_t>(AmplifierType::Stability)]);
    }
    {
        // Amplifiers respect their cap, fade, and expire.
        std::mt19937 rng(8);
        AmplifierSystem sys(rng);
        GameConfig cfg{};
        cfg.spawning.amplifierRate = 100.0f;
        std::vector<Amplifier> list;
        for (int i = 0; i < 20; ++i) {
            sys.update(list, cfg, ids, 0.1f);
            assert(static_cast<int>(list.size()) <= cfg.spawning.maxAmplifiers);
            for (const auto& a : list) {
                assert(a.opacity >= 0.2f && a.opacity <= 1.0f);
                assert(a.value == defaultAmplifierValue(a.type));
            }
        }
        cfg.spawning.amplifierRate = 0.0f;
        for (int i = 0; i < 120; ++i) sys.update(list, cfg, ids, 0.1f);
        assert(list.empty());
    }
    return 0;
}
