#include "FieldVisualizer.h"

#include <algorithm>
#include <cmath>

namespace Zen {

namespace {
constexpr float kTwoPi = 6.2831853f;
constexpr float kPi = 3.14159265f;
constexpr float kReferenceFps = 60.0f;
constexpr int kSpiralSources = 5;
constexpr float kCentripetalForce = 0.1f;
constexpr float kRespawnRadius = 400.0f;
constexpr float kMinLife = 0.1f;
constexpr float kInteractionFadeSeconds = 4.0f;
constexpr float kMaxChallengeIntensity = 3.0f;
constexpr float kChallengeRampPerSecond = 0.006f;
}  // namespace

FieldVisualizer::FieldVisualizer(std::uint32_t seed) : rng_(seed) {}

void FieldVisualizer::configure(const VisualSettings& settings, float width, float height) {
    settings_ = settings;
    settings_.fieldResolution = std::max(1, settings_.fieldResolution);
    width_ = width;
    height_ = height;
    center_ = Engine::Vec2{width * 0.5f, height * 0.5f};
    columns_ = static_cast<int>(std::ceil(width / static_cast<float>(settings_.fieldResolution)));
    rows_ = static_cast<int>(std::ceil(height / static_cast<float>(settings_.fieldResolution)));
    field_.assign(static_cast<std::size_t>(columns_) * static_cast<std::size_t>(rows_), 0.0f);
    buildSources();

    particles_.clear();
    particles_.reserve(static_cast<std::size_t>(std::max(0, settings_.particleCount)));
    for (int i = 0; i < settings_.particleCount; ++i) {
        particles_.push_back(spawnParticle());
    }
    time_ = 0.0;
    lastInteraction_ = -1.0;
    challengeTimer_ = 0.0f;
    challengeIntensity_ = 0.0f;
    stability_ = 1.0f;
    computeField();
}

void FieldVisualizer::buildSources() {
    sources_.clear();
    for (int i = 0; i < kSpiralSources; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(kSpiralSources);
        const float angle = t * kTwoPi * 1.5f;
        const float r = 100.0f + t * 150.0f;
        WaveSource s;
        s.position = center_ + Engine::Vec2{std::cos(angle), std::sin(angle)} * r;
        s.frequency = 0.02f + t * 0.01f;
        s.amplitude = 1.0f;
        s.wavelength = 60.0f + t * 30.0f;
        s.phase = t * kPi;
        sources_.push_back(s);
    }
    WaveSource centre;
    centre.position = center_;
    centre.frequency = 0.015f;
    centre.amplitude = 1.5f;
    centre.wavelength = 75.0f;
    sources_.push_back(centre);
}

FieldParticle FieldVisualizer::spawnParticle() {
    std::uniform_real_distribution<float> u01(0.0f, 1.0f);
    const float t = u01(rng_);
    FieldParticle p;
    p.angle = std::fmod(t * 20.0f * kPi, kTwoPi);
    p.restRadius = 0.1f + t * 200.0f;
    p.radius = p.restRadius;
    p.size = 1.0f + (1.0f - t) * 2.0f;
    p.opacity = 1.0f - t * 0.7f;
    p.life = 1.0f;
    p.hue = 180.0f + t * 60.0f;
    p.position = center_ + Engine::Vec2{std::cos(p.angle), std::sin(p.angle)} * p.radius;
    return p;
}

void FieldVisualizer::setMode(VisualMode mode) {
    settings_.mode = mode;
    challengeTimer_ = 0.0f;
    challengeIntensity_ = 0.0f;
}

VisualMode FieldVisualizer::cycleMode() {
    switch (settings_.mode) {
        case VisualMode::Zen:
            setMode(VisualMode::Flow);
            break;
        case VisualMode::Flow:
            setMode(VisualMode::Challenge);
            break;
        case VisualMode::Challenge:
        default:
            setMode(VisualMode::Zen);
            break;
    }
    return settings_.mode;
}

void FieldVisualizer::registerInteraction() {
    lastInteraction_ = time_;
    if (settings_.mode == VisualMode::Challenge) {
        challengeIntensity_ = std::min(kMaxChallengeIntensity, challengeIntensity_ + 0.1f);
    }
}

float FieldVisualizer::sample(const Engine::Vec2& point) const {
    // Sources tick at the reference frame rate.
    const float phaseTime = static_cast<float>(time_) * kReferenceFps;
    float total = 0.0f;
    for (const auto& s : sources_) {
        const float d = Engine::distance(point, s.position);
        const float wave = std::sin(kTwoPi * d / s.wavelength + phaseTime * s.frequency + s.phase);
        total += wave * s.amplitude * std::exp(-d / settings_.falloff);
    }
    return total;
}

void FieldVisualizer::computeField() {
    const float res = static_cast<float>(settings_.fieldResolution);
    for (int y = 0; y < rows_; ++y) {
        for (int x = 0; x < columns_; ++x) {
            field_[static_cast<std::size_t>(y) * columns_ + x] =
                sample(Engine::Vec2{static_cast<float>(x) * res, static_cast<float>(y) * res});
        }
    }
}

void FieldVisualizer::update(float dt) {
    if (dt <= 0.0f) return;
    time_ += dt;
    if (settings_.mode == VisualMode::Challenge) {
        challengeTimer_ += dt;
        challengeIntensity_ = std::max(challengeIntensity_, std::min(2.0f, challengeTimer_ * kChallengeRampPerSecond));
    }
    computeField();
    updateParticles(dt);
    updateStability();
}

void FieldVisualizer::updateParticles(float dt) {
    const float t = static_cast<float>(time_);
    const float frames = dt * kReferenceFps;

    float interaction = 0.0f;
    if (lastInteraction_ >= 0.0) {
        interaction = std::max(0.0f, 1.0f - static_cast<float>(time_ - lastInteraction_) / kInteractionFadeSeconds);
    }
    const float radialForce = settings_.mode == VisualMode::Flow ? 0.5f : -0.3f;
    const float tangentialForce = settings_.mode == VisualMode::Challenge ? 0.2f : 0.1f;

    float twistAmount = std::sin(t * 0.4f) * settings_.twistStrength;
    if (settings_.mode == VisualMode::Challenge) {
        twistAmount *= 1.0f + challengeIntensity_;
    }
    const float breathe = 1.0f + std::sin(t * 0.6f) * settings_.expansionRate;

    for (auto& p : particles_) {
        const float twist = (200.0f - p.radius) * twistAmount * 0.001f * breathe;
        p.angle = std::fmod(p.angle + twist * frames, kTwoPi);

        // The rest radius breathes slowly; the particle relaxes toward it against the centripetal pull.
        p.restRadius += p.restRadius * std::sin(t * 0.6f) * settings_.expansionRate * 0.5f * dt;
        p.radius += (p.restRadius - p.radius) * dt;
        p.radius -= p.radius * kCentripetalForce * dt;

        if (interaction > 0.0f) {
            p.radius += radialForce * interaction * (p.radius / 200.0f) * dt * 100.0f;
            p.angle += tangentialForce * interaction * dt * 100.0f / std::max(p.radius, 1.0f);
        }
        p.radius = std::clamp(p.radius, 0.0f, settings_.maxRadius);
        p.position = center_ + Engine::Vec2{std::cos(p.angle), std::sin(p.angle)} * p.radius;

        p.life *= std::pow(0.999f, frames);
        p.opacity = std::min(1.0f, p.opacity * std::pow(0.995f, frames));

        if (p.restRadius > kRespawnRadius || p.life < kMinLife) {
            p = spawnParticle();
        }
    }
}

void FieldVisualizer::updateStability() {
    if (particles_.empty()) {
        stability_ = 1.0f;
        return;
    }
    float total = 0.0f;
    for (const auto& p : particles_) {
        const float ideal = std::max(p.restRadius, 0.1f);
        const float distanceStability = 1.0f - std::abs(p.radius - ideal) / ideal;
        total += distanceStability * p.life;
    }
    stability_ = total / static_cast<float>(particles_.size());
}

}  // namespace Zen
