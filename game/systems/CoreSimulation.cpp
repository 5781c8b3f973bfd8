#include "CoreSimulation.h"

#include <algorithm>
#include <cmath>

namespace Zen {

namespace {
// Friction is tuned as retention per frame at this rate.
constexpr float kReferenceFps = 60.0f;

void bounceAxis(float& pos, float& vel, float radius, float extent, float restitution) {
    if (pos - radius < 0.0f) {
        pos = radius;
        vel = std::abs(vel) * restitution;
    } else if (pos + radius > extent) {
        pos = extent - radius;
        vel = -std::abs(vel) * restitution;
    }
}
}  // namespace

void CoreSimulation::update(Core& core, const GameConfig& cfg, float dt) const {
    const auto& ph = cfg.physics;

    core.velocity.y += ph.gravity * dt;
    core.velocity *= std::pow(ph.friction, dt * kReferenceFps);

    const float speed = core.velocity.length();
    if (speed > ph.maxSpeed && speed > Engine::kVecEpsilon) {
        core.velocity *= ph.maxSpeed / speed;
    }

    core.position += core.velocity * dt;
    bounceAxis(core.position.x, core.velocity.x, core.radius, cfg.field.width, ph.bounceRestitution);
    bounceAxis(core.position.y, core.velocity.y, core.radius, cfg.field.height, ph.bounceRestitution);

    float drain = cfg.energy.decayRate * dt;
    if (normalizedDeviation(core.energyBalance) > cfg.energy.imbalanceThreshold) {
        drain += cfg.energy.imbalancePenalty * dt;
    }
    core.energy -= drain;
    clampEnergy(core);
    core.brightness = brightnessFor(core);
}

bool CoreSimulation::applyImpulse(Core& core, const Engine::Vec2& direction, const GameConfig& cfg) const {
    Engine::Vec2 dir;
    if (!Engine::tryNormalize(direction, dir)) {
        return false;
    }
    core.velocity += dir * cfg.physics.impulseForce;
    core.energy -= cfg.energy.impulseCost;
    clampEnergy(core);
    core.brightness = brightnessFor(core);
    return true;
}

float CoreSimulation::brightnessFor(const Core& core) {
    if (core.maxEnergy <= 0.0f) return 0.3f;
    return 0.3f + 0.7f * std::clamp(core.energy / core.maxEnergy, 0.0f, 1.0f);
}

void CoreSimulation::clampEnergy(Core& core) { core.energy = std::clamp(core.energy, 0.0f, core.maxEnergy); }

}  // namespace Zen
