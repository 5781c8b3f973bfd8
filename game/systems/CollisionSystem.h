// Core-vs-dissonance and core-vs-amplifier overlap, hit response and continuous score.
#pragma once

#include <functional>
#include <vector>

#include "../GameConfig.h"
#include "../components/Amplifier.h"
#include "../components/Core.h"
#include "../components/Dissonance.h"

namespace Zen {

class CollisionSystem {
public:
    using HitFn = std::function<void(const Dissonance&)>;
    using CollectFn = std::function<void(const Amplifier&)>;

    // Resolves at most one collision per call. Dissonances are checked before amplifiers.
    void update(Core& core, std::vector<Dissonance>& dissonances, std::vector<Amplifier>& amplifiers,
                const GameConfig& cfg, float dt, const HitFn& onHit, const CollectFn& onCollect);

    float cooldownRemaining() const { return cooldown_; }
    bool invulnerable() const { return cooldown_ > 0.0f; }
    void reset() { cooldown_ = 0.0f; }

    // Points earned over dt at the core's current harmony and balance.
    static float scoreFor(const Core& core, float dt);
    static float balanceMultiplier(const Core& core);

private:
    void resolveHit(Core& core, Dissonance& d, const GameConfig& cfg);

    float cooldown_{0.0f};
};

}  // namespace Zen
