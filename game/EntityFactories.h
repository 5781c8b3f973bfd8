// Default-valued constructors for simulation records. Ids come from the caller's generator.
#pragma once

#include "../engine/core/EntityId.h"
#include "../engine/math/Vec2.h"
#include "../engine/render/Color.h"
#include "GameConfig.h"
#include "components/Amplifier.h"
#include "components/Connection.h"
#include "components/Core.h"
#include "components/Dissonance.h"
#include "components/Pattern.h"
#include "components/Resonator.h"
#include "components/Wave.h"

namespace Zen {

Engine::Color colorFor(EnergyType type);
Engine::Color dissonanceColorFor(EnergyType countered);

Core makeCore(Engine::IdGenerator& ids, const GameConfig& cfg);
Dissonance makeDissonance(Engine::IdGenerator& ids, Engine::Vec2 position, DissonanceType type,
                          EnergyType countersEnergy, const GameConfig& cfg);
Amplifier makeAmplifier(Engine::IdGenerator& ids, Engine::Vec2 position, AmplifierType type,
                        EnergyType energyType, const GameConfig& cfg);
Resonator makeResonator(Engine::IdGenerator& ids, Engine::Vec2 position, EnergyType energyType);
Wave makeWave(Engine::IdGenerator& ids, Engine::Vec2 origin, EnergyType energyType, float propagationSpeed,
              float maxRadius, const GameConfig& cfg);
Connection makeConnection(Engine::IdGenerator& ids, const Resonator& a, const Resonator& b, const GameConfig& cfg);
Pattern makePattern(Engine::IdGenerator& ids, EnergyType energyType, const std::set<Engine::EntityId>& resonatorIds,
                    std::vector<Engine::EntityId> connectionIds, const GameConfig& cfg);

// "Triangle of Water", "Polygon 9 of Fire", ...
std::string patternShapeName(std::size_t resonatorCount);
std::string patternName(std::size_t resonatorCount, EnergyType energyType);

}  // namespace Zen
