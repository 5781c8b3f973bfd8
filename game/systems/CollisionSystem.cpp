#include "CollisionSystem.h"

#include <algorithm>

namespace Zen {

namespace {
template <typename T>
bool overlaps(const Core& core, const T& other) {
    const float reach = core.radius + other.radius;
    return (core.position - other.position).lengthSquared() < reach * reach;
}
}  // namespace

void CollisionSystem::update(Core& core, std::vector<Dissonance>& dissonances, std::vector<Amplifier>& amplifiers,
                             const GameConfig& cfg, float dt, const HitFn& onHit, const CollectFn& onCollect) {
    if (cooldown_ > 0.0f) {
        cooldown_ = std::max(0.0f, cooldown_ - dt);
        return;
    }

    for (auto& d : dissonances) {
        if (!d.isActive || !overlaps(core, d)) continue;
        resolveHit(core, d, cfg);
        if (onHit) onHit(d);
        return;
    }

    for (auto& a : amplifiers) {
        if (!a.isActive || !overlaps(core, a)) continue;
        a.isActive = false;
        if (onCollect) onCollect(a);
        return;
    }
}

void CollisionSystem::resolveHit(Core& core, Dissonance& d, const GameConfig& cfg) {
    core.energy = std::max(0.0f, core.energy - d.disruptionLevel);

    // Coincident centres give no direction; skip the shove rather than produce NaN.
    Engine::Vec2 away;
    if (Engine::tryNormalize(core.position - d.position, away)) {
        core.velocity += away * cfg.collision.knockbackForce;
    }

    float& countered = core.energyBalance[d.countersEnergy];
    countered = std::max(0.0f, countered - cfg.energy.counterBalanceDrain);

    d.isActive = false;
    cooldown_ = cfg.collision.cooldown;
}

float CollisionSystem::balanceMultiplier(const Core& core) {
    return 1.0f - 0.5f * normalizedDeviation(core.energyBalance);
}

float CollisionSystem::scoreFor(const Core& core, float dt) {
    return dt * static_cast<float>(core.harmonyLevel) * 0.5f * balanceMultiplier(core);
}

}  // namespace Zen
