#include "DissonanceSystem.h"

#include <algorithm>
#include <cmath>

#include "../EntityFactories.h"

namespace Zen {

namespace {
constexpr float kTwoPi = 6.2831853f;
constexpr float kPi = 3.14159265f;
constexpr float kMaxDissonanceRadius = 25.0f;
}  // namespace

DissonanceSystem::DissonanceSystem(std::mt19937& rng) : rng_(rng) {}

Engine::Vec2 DissonanceSystem::samplePosition(const Core& core, const GameConfig& cfg, float margin) {
    std::uniform_real_distribution<float> xs(margin, std::max(margin, cfg.field.width - margin));
    std::uniform_real_distribution<float> ys(margin, std::max(margin, cfg.field.height - margin));
    const float minDist = cfg.spawning.minDissonanceDistance;
    const int kMaxAttempts = 50;
    Engine::Vec2 best{};
    float bestDist = -1.0f;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        Engine::Vec2 candidate{xs(rng_), ys(rng_)};
        const float d = Engine::distance(candidate, core.position);
        if (d >= minDist) return candidate;
        if (d > bestDist) {
            bestDist = d;
            best = candidate;
        }
    }
    // Field too small to honour the distance; use the farthest candidate seen.
    return best;
}

Dissonance DissonanceSystem::spawn(const Core& core, const GameConfig& cfg, Engine::IdGenerator& ids) {
    std::uniform_int_distribution<int> typeDist(0, kDissonanceTypeCount - 1);
    std::uniform_int_distribution<int> shapeDist(0, kDissonanceShapeCount - 1);
    std::uniform_int_distribution<int> energyDist(0, kEnergyTypeCount - 1);
    std::uniform_real_distribution<float> u01(0.0f, 1.0f);

    const auto type = static_cast<DissonanceType>(typeDist(rng_));
    const auto shape = static_cast<DissonanceShape>(shapeDist(rng_));
    const auto counters = energyTypeFromIndex(energyDist(rng_));

    Dissonance d = makeDissonance(ids, samplePosition(core, cfg, kMaxDissonanceRadius), type, counters, cfg);
    d.shape = shape;
    d.radius = 15.0f + u01(rng_) * 10.0f;
    d.disruptionLevel = 10.0f + std::floor(u01(rng_) * 10.0f);
    switch (type) {
        case DissonanceType::Moving:
            d.velocity = Engine::Vec2{(u01(rng_) - 0.5f) * 50.0f, (u01(rng_) - 0.5f) * 50.0f};
            break;
        case DissonanceType::Disruptive:
            d.rotationSpeed = (u01(rng_) + 0.5f) * kPi * 0.5f;
            break;
        case DissonanceType::Pulsating:
            d.pulseFrequency = 2.0f + u01(rng_) * 3.0f;
            break;
        case DissonanceType::Static:
        default:
            break;
    }
    return d;
}

void DissonanceSystem::advance(Dissonance& d, const GameConfig& cfg, float dt) const {
    if (!d.isActive) return;
    d.age += dt;

    if (d.velocity) {
        auto& v = *d.velocity;
        d.position += v * dt;
        if (d.position.x - d.radius < 0.0f || d.position.x + d.radius > cfg.field.width) {
            v.x = -v.x;
            d.position.x = std::clamp(d.position.x, d.radius, std::max(d.radius, cfg.field.width - d.radius));
        }
        if (d.position.y - d.radius < 0.0f || d.position.y + d.radius > cfg.field.height) {
            v.y = -v.y;
            d.position.y = std::clamp(d.position.y, d.radius, std::max(d.radius, cfg.field.height - d.radius));
        }
    }
    if (d.rotationSpeed) {
        d.rotation = std::fmod(d.rotation + *d.rotationSpeed * dt, kTwoPi);
    }
    if (d.pulseFrequency) {
        d.opacity = 0.4f + std::sin(d.age * *d.pulseFrequency) * 0.4f;
    }
    if (d.age >= d.lifeTime) {
        d.isActive = false;
    }
}

int DissonanceSystem::update(std::vector<Dissonance>& dissonances, const Core& core, const GameConfig& cfg,
                             Engine::IdGenerator& ids, float dt) {
    int spawned = 0;
    const float rate = cfg.spawning.dissonanceRate * difficultySpawnScale(cfg.difficulty);
    if (rate > 0.0f) {
        timer_ += dt;
        const auto active = std::count_if(dissonances.begin(), dissonances.end(),
                                          [](const Dissonance& d) { return d.isActive; });
        if (timer_ >= 1.0f / rate && active < cfg.spawning.maxDissonances) {
            dissonances.push_back(spawn(core, cfg, ids));
            timer_ = 0.0f;
            ++spawned;
        }
    }

    for (auto& d : dissonances) {
        advance(d, cfg, dt);
    }
    dissonances.erase(std::remove_if(dissonances.begin(), dissonances.end(),
                                     [](const Dissonance& d) { return !d.isActive; }),
                      dissonances.end());
    return spawned;
}

}  // namespace Zen
