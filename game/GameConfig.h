// Tunable simulation parameters. Every duration is in seconds and every speed in pixels per second.
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "components/EnergyType.h"

namespace Zen {

enum class GameMode { Harmony, Resonance, Balance };
enum class Difficulty { Beginner, Adept, Master, Enlightened };
enum class VisualMode { Zen, Flow, Challenge };

struct PhysicsSettings {
    float gravity{0.0f};          // px/s^2, downward
    float friction{0.98f};        // velocity retained per 1/60 s
    float maxSpeed{300.0f};
    float impulseForce{30.0f};
    float damping{0.95f};         // carried for tuning files; the integrator uses friction only
    float waveSpeed{120.0f};
    float maxWaveDistance{300.0f};
    float bounceRestitution{0.5f};
};

struct SpawnSettings {
    float dissonanceRate{0.3f};  // spawns per second, <= 0 disables
    float amplifierRate{0.15f};
    int maxDissonances{5};
    int maxAmplifiers{3};
    int initialResonators{5};
    int maxResonators{12};
    int maxHarmonicWaves{10};
    float minDissonanceDistance{100.0f};
    float dissonanceLifeTime{20.0f};
    float amplifierLifeTime{10.0f};
    float amplifierEffectDuration{5.0f};
};

struct FieldSettings {
    float width{550.0f};
    float height{550.0f};
    float resonatorRingRadius{150.0f};
};

struct EnergySettings {
    EnergyBalance initialBalance{};
    float decayRate{0.1f};           // energy per second
    float imbalanceThreshold{0.3f};  // normalized deviation
    float imbalancePenalty{5.0f};    // extra energy per second while over threshold
    float balanceBonus{2.0f};        // score for a balance pickup that lands under threshold
    float impulseCost{2.0f};
    float waveCost{5.0f};
    float waveBalanceShift{1.0f};
    float balancePullScale{1.0f};
    float counterBalanceDrain{2.0f};
};

struct HarmonySettings {
    float activationMargin{10.0f};
    float resonatorActivationDuration{0.0f};  // 0 keeps resonators lit for the session
    float waveMaxLifeTime{3.0f};
    float waveBaseOpacity{0.7f};
    float patternValuePerResonator{25.0f};
    int patternsPerHarmonyLevel{3};
    int victoryHarmonyLevel{10};
    float connectionScore{5.0f};
    float connectionDuration{-1.0f};
};

struct CollisionSettings {
    float cooldown{0.6f};
    float knockbackForce{120.0f};
    float amplifierScore{10.0f};
};

struct VisualSettings {
    VisualMode mode{VisualMode::Zen};
    int fieldResolution{4};
    int particleCount{100};
    float falloff{250.0f};
    float maxRadius{250.0f};
    float twistStrength{2.0f};
    float expansionRate{0.8f};
};

struct GameConfig {
    PhysicsSettings physics{};
    SpawnSettings spawning{};
    FieldSettings field{};
    EnergySettings energy{};
    HarmonySettings harmony{};
    CollisionSettings collision{};
    VisualSettings visual{};
    GameMode mode{GameMode::Harmony};
    Difficulty difficulty{Difficulty::Adept};
    std::uint32_t seed{1337u};
    bool debugMode{false};
};

// Defaults with the per-mode tuning applied on top.
GameConfig makePreset(GameMode mode);

// Multiplier on the dissonance spawn rate.
float difficultySpawnScale(Difficulty difficulty);

std::string_view toString(GameMode mode);
std::string_view toString(Difficulty difficulty);
std::string_view toString(VisualMode mode);
std::optional<GameMode> gameModeFromString(std::string_view name);
std::optional<Difficulty> difficultyFromString(std::string_view name);
std::optional<VisualMode> visualModeFromString(std::string_view name);

}  // namespace Zen
