// Decorative interference field and vortex particles drawn behind the play field.
#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "../../engine/math/Vec2.h"
#include "../GameConfig.h"

namespace Zen {

struct WaveSource {
    Engine::Vec2 position{};
    float frequency{0.02f};
    float amplitude{1.0f};
    float wavelength{60.0f};
    float phase{0.0f};
};

struct FieldParticle {
    Engine::Vec2 position{};
    float angle{0.0f};
    float radius{0.0f};      // current distance from the centre
    float restRadius{0.0f};  // radius the particle breathes around
    float size{2.0f};
    float opacity{1.0f};
    float life{1.0f};
    float hue{180.0f};
};

class FieldVisualizer {
public:
    explicit FieldVisualizer(std::uint32_t seed = 7u);

    // Rebuilds sources, sample grid and particle pool.
    void configure(const VisualSettings& settings, float width, float height);
    void update(float dt);

    // Feeds player input into the particle forces for a few seconds.
    void registerInteraction();

    void setMode(VisualMode mode);
    VisualMode mode() const { return settings_.mode; }
    VisualMode cycleMode();

    float sample(const Engine::Vec2& point) const;

    const std::vector<WaveSource>& sources() const { return sources_; }
    const std::vector<float>& field() const { return field_; }
    int columns() const { return columns_; }
    int rows() const { return rows_; }
    int resolution() const { return settings_.fieldResolution; }
    const std::vector<FieldParticle>& particles() const { return particles_; }
    float stability() const { return stability_; }
    float challengeIntensity() const { return challengeIntensity_; }
    double time() const { return time_; }
    Engine::Vec2 center() const { return center_; }

private:
    void buildSources();
    void computeField();
    void updateParticles(float dt);
    void updateStability();
    FieldParticle spawnParticle();

    VisualSettings settings_{};
    Engine::Vec2 center_{275.0f, 275.0f};
    float width_{550.0f};
    float height_{550.0f};
    std::vector<WaveSource> sources_;
    std::vector<float> field_;
    int columns_{0};
    int rows_{0};
    std::vector<FieldParticle> particles_;
    double time_{0.0};
    double lastInteraction_{-1.0};
    float challengeTimer_{0.0f};
    float challengeIntensity_{0.0f};
    float stability_{1.0f};
    std::mt19937 rng_;
};

}  // namespace Zen
