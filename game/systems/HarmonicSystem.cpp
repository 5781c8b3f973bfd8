#include "HarmonicSystem.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

#include "../../engine/core/Logger.h"
#include "../EntityFactories.h"

namespace Zen {

namespace {
constexpr float kTwoPi = 6.2831853f;

nlohmann::json toJson(const Engine::Vec2& v) { return {{"x", v.x}, {"y", v.y}}; }
}  // namespace

void HarmonicSystem::raise(GameEventType type, nlohmann::json data) const {
    if (emit_) emit_(type, std::move(data));
}

void HarmonicSystem::clear() {
    resonators_.clear();
    waves_.clear();
    connections_.clear();
    patterns_.clear();
    patternsCompleted_ = 0;
}

void HarmonicSystem::initialize(const GameConfig& cfg, Engine::IdGenerator& ids) {
    clear();
    const int count = std::min(cfg.spawning.initialResonators, cfg.spawning.maxResonators);
    const Engine::Vec2 center{cfg.field.width * 0.5f, cfg.field.height * 0.5f};
    for (int i = 0; i < count; ++i) {
        const float angle = static_cast<float>(i) * kTwoPi / static_cast<float>(count);
        const Engine::Vec2 pos = center + Engine::Vec2{std::cos(angle), std::sin(angle)} * cfg.field.resonatorRingRadius;
        resonators_.push_back(makeResonator(ids, pos, energyTypeFromIndex(i)));
    }
}

const Resonator* HarmonicSystem::addResonator(const Engine::Vec2& position, EnergyType type, const GameConfig& cfg,
                                              Engine::IdGenerator& ids) {
    if (static_cast<int>(resonators_.size()) >= cfg.spawning.maxResonators) {
        Engine::logInfo("Resonator cap reached; placement ignored.");
        return nullptr;
    }
    resonators_.push_back(makeResonator(ids, position, type));
    return &resonators_.back();
}

const Wave* HarmonicSystem::generateWave(const Core& core, EnergyType type, const GameConfig& cfg,
                                         Engine::IdGenerator& ids) {
    if (static_cast<int>(waves_.size()) >= cfg.spawning.maxHarmonicWaves) {
        return nullptr;
    }
    const float speed = cfg.physics.waveSpeed * core.frequency;
    const float reach = cfg.physics.maxWaveDistance * core.amplitude;
    waves_.push_back(makeWave(ids, core.position, type, speed, reach, cfg));
    return &waves_.back();
}

float HarmonicSystem::update(Core& core, const GameConfig& cfg, Engine::IdGenerator& ids, float dt) {
    float score = updateWaves(cfg, ids, dt);
    updateResonators(cfg, dt);
    updateConnections(dt);
    updatePatterns(dt);
    waves_.erase(std::remove_if(waves_.begin(), waves_.end(), [](const Wave& w) { return !w.isActive; }),
                 waves_.end());
    score += detectPatterns(core, cfg, ids);
    return score;
}

float HarmonicSystem::updateWaves(const GameConfig& cfg, Engine::IdGenerator& ids, float dt) {
    float score = 0.0f;
    for (auto& wave : waves_) {
        if (!wave.isActive) continue;
        wave.radius += wave.propagationSpeed * dt;
        wave.age += dt;
        wave.opacity = wave.maxLifeTime > 0.0f
                           ? std::max(0.0f, wave.baseOpacity * (1.0f - wave.age / wave.maxLifeTime))
                           : 0.0f;
        if (wave.radius > wave.maxRadius || wave.age > wave.maxLifeTime) {
            wave.isActive = false;
            continue;
        }
        for (auto& res : resonators_) {
            if (res.energyType != wave.energyType || res.isActivated) continue;
            if (wave.activatedResonators.count(res.id) != 0) continue;
            const float d = Engine::distance(res.position, wave.origin);
            if (std::abs(d - wave.radius) < cfg.harmony.activationMargin) {
                score += activate(res, wave, cfg, ids);
            }
        }
    }
    return score;
}

float HarmonicSystem::activate(Resonator& resonator, Wave& wave, const GameConfig& cfg, Engine::IdGenerator& ids) {
    resonator.isActivated = true;
    resonator.intensity = 1.0f;
    resonator.activationTime = 0.0f;
    wave.activatedResonators.insert(resonator.id);
    raise(GameEventType::ResonatorActivated, {{"resonatorId", resonator.id},
                                              {"waveId", wave.id},
                                              {"energyType", std::string(toString(resonator.energyType))},
                                              {"position", toJson(resonator.position)}});
    return connect(resonator, cfg, ids);
}

float HarmonicSystem::connect(const Resonator& resonator, const GameConfig& cfg, Engine::IdGenerator& ids) {
    float score = 0.0f;
    // Index-based: connecting writes into resonators_ but never resizes it.
    for (std::size_t i = 0; i < resonators_.size(); ++i) {
        const Resonator& other = resonators_[i];
        if (other.id == resonator.id || !other.isActivated || other.energyType != resonator.energyType) continue;
        if (hasActiveConnection(resonator.id, other.id)) continue;

        Connection c = makeConnection(ids, resonator, other, cfg);
        for (auto& r : resonators_) {
            if (r.id == resonator.id || r.id == other.id) {
                r.connections.push_back(c.id);
            }
        }
        raise(GameEventType::ResonatorConnected, {{"connectionId", c.id},
                                                  {"resonatorIds", nlohmann::json::array({c.resonatorIds[0], c.resonatorIds[1]})},
                                                  {"energyType", std::string(toString(c.energyType))}});
        connections_.push_back(std::move(c));
        score += cfg.harmony.connectionScore;
    }
    return score;
}

void HarmonicSystem::updateResonators(const GameConfig& cfg, float dt) {
    const float activeFor = cfg.harmony.resonatorActivationDuration;
    for (auto& res : resonators_) {
        res.isReceivingEnergy = false;
        for (const auto& wave : waves_) {
            if (!wave.isActive || wave.energyType != res.energyType) continue;
            const float d = Engine::distance(res.position, wave.origin);
            if (std::abs(d - wave.radius) < res.radius) {
                res.isReceivingEnergy = true;
                break;
            }
        }

        if (res.isReceivingEnergy) {
            res.intensity = std::min(1.0f, res.intensity + 0.1f * dt);
        } else if (res.isActivated) {
            res.intensity = std::max(0.5f, res.intensity - 0.02f * dt);
        } else {
            res.intensity = std::max(0.2f, res.intensity - 0.05f * dt);
        }
        res.rotation = std::fmod(res.rotation + res.rotationSpeed * res.intensity * dt, kTwoPi);

        if (res.isActivated) {
            res.activationTime += dt;
            if (activeFor > 0.0f && res.activationTime >= activeFor) {
                res.isActivated = false;
                res.activationTime = 0.0f;
            }
        }
    }
}

void HarmonicSystem::updateConnections(float dt) {
    std::set<Engine::EntityId> dropped;
    for (auto& c : connections_) {
        c.age += dt;
        bool endpointsLive = true;
        for (const auto& rid : c.resonatorIds) {
            const Resonator* r = findResonator(rid);
            if (!r) {
                Engine::logWarn("Connection " + c.id + " references missing resonator " + rid + "; dropping it.");
                endpointsLive = false;
                break;
            }
            if (!r->isActivated) {
                endpointsLive = false;
            }
        }
        const bool expired = c.duration >= 0.0f && c.age >= c.duration;
        c.isActive = endpointsLive && !expired;
        if (c.isActive) {
            c.intensity = std::min(1.0f, c.intensity + 0.05f * dt);
        } else {
            dropped.insert(c.id);
        }
    }
    if (dropped.empty()) return;

    connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                      [&](const Connection& c) { return dropped.count(c.id) != 0; }),
                       connections_.end());
    for (auto& r : resonators_) {
        r.connections.erase(std::remove_if(r.connections.begin(), r.connections.end(),
                                           [&](const Engine::EntityId& id) { return dropped.count(id) != 0; }),
                            r.connections.end());
    }
}

void HarmonicSystem::updatePatterns(float dt) {
    for (auto& p : patterns_) {
        p.isComplete = !p.connectionIds.empty() &&
                       std::all_of(p.connectionIds.begin(), p.connectionIds.end(), [this](const Engine::EntityId& id) {
                           const Connection* c = findConnection(id);
                           return c && c->isActive;
                       });
        p.activeTime = p.isComplete ? p.activeTime + dt : 0.0f;
    }
}

float HarmonicSystem::detectPatterns(Core& core, const GameConfig& cfg, Engine::IdGenerator& ids) {
    std::map<EnergyType, std::vector<const Connection*>> groups;
    for (const auto& c : connections_) {
        if (c.isActive) groups[c.energyType].push_back(&c);
    }

    float score = 0.0f;
    std::vector<Pattern> found;
    for (const auto& [energy, group] : groups) {
        if (group.size() < 3) continue;
        std::set<Engine::EntityId> members;
        std::vector<Engine::EntityId> connectionIds;
        for (const Connection* c : group) {
            members.insert(c->resonatorIds.begin(), c->resonatorIds.end());
            connectionIds.push_back(c->id);
        }
        if (members.size() < 3) continue;
        const bool known = std::any_of(patterns_.begin(), patterns_.end(),
                                       [&](const Pattern& p) { return p.resonatorIds == members; });
        if (known) continue;
        found.push_back(makePattern(ids, energy, members, std::move(connectionIds), cfg));
    }

    for (auto& pattern : found) {
        score += pattern.value;
        ++patternsCompleted_;
        raise(GameEventType::PatternCompleted, {{"patternId", pattern.id},
                                                {"name", pattern.name},
                                                {"resonatorCount", pattern.resonatorIds.size()},
                                                {"energyType", std::string(toString(pattern.dominantEnergyType))},
                                                {"value", pattern.value}});
        Engine::logInfo("Pattern completed: " + pattern.name);
        patterns_.push_back(std::move(pattern));
        if (cfg.harmony.patternsPerHarmonyLevel > 0 && patternsCompleted_ % cfg.harmony.patternsPerHarmonyLevel == 0) {
            ++core.harmonyLevel;
            raise(GameEventType::HarmonyIncreased, {{"newLevel", core.harmonyLevel}});
        }
    }
    return score;
}

bool HarmonicSystem::hasActiveConnection(const Engine::EntityId& a, const Engine::EntityId& b) const {
    return std::any_of(connections_.begin(), connections_.end(),
                       [&](const Connection& c) { return c.isActive && c.links(a, b); });
}

Resonator* HarmonicSystem::findResonator(const Engine::EntityId& id) {
    for (auto& r : resonators_) {
        if (r.id == id) return &r;
    }
    return nullptr;
}

const Connection* HarmonicSystem::findConnection(const Engine::EntityId& id) const {
    for (const auto& c : connections_) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

}  // namespace Zen
