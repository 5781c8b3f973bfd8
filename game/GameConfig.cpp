#include "GameConfig.h"

namespace Zen {

GameConfig makePreset(GameMode mode) {
    GameConfig cfg{};
    cfg.mode = mode;
    switch (mode) {
        case GameMode::Harmony:
            cfg.physics.friction = 0.99f;
            cfg.physics.damping = 0.98f;
            cfg.spawning.dissonanceRate = 0.1f;
            cfg.spawning.amplifierRate = 0.2f;
            cfg.energy.decayRate = 0.05f;
            break;
        case GameMode::Resonance:
            cfg.physics.waveSpeed = 150.0f;
            cfg.spawning.initialResonators = 8;
            cfg.spawning.maxResonators = 15;
            cfg.energy.decayRate = 0.15f;
            break;
        case GameMode::Balance:
            cfg.spawning.dissonanceRate = 0.4f;
            cfg.energy.imbalanceThreshold = 0.2f;
            cfg.energy.imbalancePenalty = 8.0f;
            cfg.energy.balanceBonus = 5.0f;
            cfg.energy.decayRate = 0.2f;
            break;
    }
    return cfg;
}

float difficultySpawnScale(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Beginner:
            return 0.75f;
        case Difficulty::Adept:
            return 1.0f;
        case Difficulty::Master:
            return 1.25f;
        case Difficulty::Enlightened:
        default:
            return 1.5f;
    }
}

std::string_view toString(GameMode mode) {
    switch (mode) {
        case GameMode::Harmony:
            return "harmony";
        case GameMode::Resonance:
            return "resonance";
        case GameMode::Balance:
        default:
            return "balance";
    }
}

std::string_view toString(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Beginner:
            return "beginner";
        case Difficulty::Adept:
            return "adept";
        case Difficulty::Master:
            return "master";
        case Difficulty::Enlightened:
        default:
            return "enlightened";
    }
}

std::string_view toString(VisualMode mode) {
    switch (mode) {
        case VisualMode::Zen:
            return "zen";
        case VisualMode::Flow:
            return "flow";
        case VisualMode::Challenge:
        default:
            return "challenge";
    }
}

std::optional<GameMode> gameModeFromString(std::string_view name) {
    for (auto mode : {GameMode::Harmony, GameMode::Resonance, GameMode::Balance}) {
        if (toString(mode) == name) return mode;
    }
    return std::nullopt;
}

std::optional<Difficulty> difficultyFromString(std::string_view name) {
    for (auto d : {Difficulty::Beginner, Difficulty::Adept, Difficulty::Master, Difficulty::Enlightened}) {
        if (toString(d) == name) return d;
    }
    return std::nullopt;
}

std::optional<VisualMode> visualModeFromString(std::string_view name) {
    for (auto mode : {VisualMode::Zen, VisualMode::Flow, VisualMode::Challenge}) {
        if (toString(mode) == name) return mode;
    }
    return std::nullopt;
}

}  // namespace Zen
