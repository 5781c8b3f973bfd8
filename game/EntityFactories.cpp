#include "EntityFactories.h"

#include <algorithm>
#include <cmath>

namespace Zen {

namespace {
std::string_view elementFor(EnergyType type) {
    switch (type) {
        case EnergyType::Calm:
            return "Water";
        case EnergyType::Vibrant:
            return "Forest";
        case EnergyType::Intense:
        default:
            return "Fire";
    }
}
}  // namespace

Engine::Color colorFor(EnergyType type) {
    switch (type) {
        case EnergyType::Calm:
            return Engine::Color{78, 205, 196, 255};
        case EnergyType::Vibrant:
            return Engine::Color{151, 117, 250, 255};
        case EnergyType::Intense:
        default:
            return Engine::Color{255, 107, 107, 255};
    }
}

// A dissonance wears the colour of whatever opposes the energy it punishes.
Engine::Color dissonanceColorFor(EnergyType countered) {
    switch (countered) {
        case EnergyType::Calm:
            return Engine::Color{255, 107, 107, 255};
        case EnergyType::Vibrant:
            return Engine::Color{151, 117, 250, 255};
        case EnergyType::Intense:
        default:
            return Engine::Color{78, 205, 196, 255};
    }
}

Core makeCore(Engine::IdGenerator& ids, const GameConfig& cfg) {
    Core core;
    core.id = ids.next("core");
    core.position = Engine::Vec2{cfg.field.width * 0.5f, cfg.field.height * 0.5f};
    core.energyBalance = cfg.energy.initialBalance;
    return core;
}

Dissonance makeDissonance(Engine::IdGenerator& ids, Engine::Vec2 position, DissonanceType type,
                          EnergyType countersEnergy, const GameConfig& cfg) {
    Dissonance d;
    d.id = ids.next("dissonance");
    d.type = type;
    d.position = position;
    d.countersEnergy = countersEnergy;
    d.color = dissonanceColorFor(countersEnergy);
    d.lifeTime = cfg.spawning.dissonanceLifeTime;
    return d;
}

Amplifier makeAmplifier(Engine::IdGenerator& ids, Engine::Vec2 position, AmplifierType type,
                        EnergyType energyType, const GameConfig& cfg) {
    Amplifier a;
    a.id = ids.next("amplifier");
    a.type = type;
    a.energyType = energyType;
    a.position = position;
    a.value = defaultAmplifierValue(type);
    a.duration = cfg.spawning.amplifierEffectDuration;
    a.lifeTime = cfg.spawning.amplifierLifeTime;
    a.color = colorFor(energyType);
    return a;
}

Resonator makeResonator(Engine::IdGenerator& ids, Engine::Vec2 position, EnergyType energyType) {
    Resonator r;
    r.id = ids.next("resonator");
    r.position = position;
    r.energyType = energyType;
    return r;
}

Wave makeWave(Engine::IdGenerator& ids, Engine::Vec2 origin, EnergyType energyType, float propagationSpeed,
              float maxRadius, const GameConfig& cfg) {
    Wave w;
    w.id = ids.next("wave");
    w.origin = origin;
    w.energyType = energyType;
    w.propagationSpeed = propagationSpeed;
    w.maxRadius = maxRadius;
    w.maxLifeTime = cfg.harmony.waveMaxLifeTime;
    w.baseOpacity = cfg.harmony.waveBaseOpacity;
    w.opacity = w.baseOpacity;
    return w;
}

Connection makeConnection(Engine::IdGenerator& ids, const Resonator& a, const Resonator& b, const GameConfig& cfg) {
    Connection c;
    c.id = ids.next("connection");
    c.resonatorIds = {a.id, b.id};
    c.energyType = a.energyType;
    c.duration = cfg.harmony.connectionDuration;
    return c;
}

Pattern makePattern(Engine::IdGenerator& ids, EnergyType energyType, const std::set<Engine::EntityId>& resonatorIds,
                    std::vector<Engine::EntityId> connectionIds, const GameConfig& cfg) {
    Pattern p;
    p.id = ids.next("pattern");
    p.resonatorIds = resonatorIds;
    p.connectionIds = std::move(connectionIds);
    p.dominantEnergyType = energyType;
    p.shape = patternShapeName(resonatorIds.size());
    p.name = patternName(resonatorIds.size(), energyType);
    p.value = static_cast<float>(resonatorIds.size()) * cfg.harmony.patternValuePerResonator;
    p.complexity = std::min(10, static_cast<int>(std::ceil(static_cast<double>(resonatorIds.size()) / 2.0)));
    return p;
}

std::string patternShapeName(std::size_t resonatorCount) {
    switch (resonatorCount) {
        case 3:
            return "Triangle";
        case 4:
            return "Square";
        case 5:
            return "Pentagon";
        case 6:
            return "Hexagon";
        case 7:
            return "Heptagon";
        case 8:
            return "Octagon";
        default:
            return resonatorCount > 8 ? "Complex" : "Line";
    }
}

std::string patternName(std::size_t resonatorCount, EnergyType energyType) {
    return patternShapeName(resonatorCount) + " of " + std::string(elementFor(energyType));
}

}  // namespace Zen
