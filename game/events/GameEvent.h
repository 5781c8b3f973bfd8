// Typed notifications raised by the simulation.
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace Zen {

enum class GameEventType {
    GameStarted,
    GamePaused,
    GameResumed,
    GameEnded,
    CoreCollision,
    PowerupCollected,
    ResonatorActivated,
    ResonatorConnected,
    PatternCompleted,
    HarmonyIncreased,
    EnergyBalanced,
    EnergyDepleted
};

inline std::string_view toString(GameEventType type) {
    switch (type) {
        case GameEventType::GameStarted:
            return "GAME_STARTED";
        case GameEventType::GamePaused:
            return "GAME_PAUSED";
        case GameEventType::GameResumed:
            return "GAME_RESUMED";
        case GameEventType::GameEnded:
            return "GAME_ENDED";
        case GameEventType::CoreCollision:
            return "CORE_COLLISION";
        case GameEventType::PowerupCollected:
            return "POWERUP_COLLECTED";
        case GameEventType::ResonatorActivated:
            return "RESONATOR_ACTIVATED";
        case GameEventType::ResonatorConnected:
            return "RESONATOR_CONNECTED";
        case GameEventType::PatternCompleted:
            return "PATTERN_COMPLETED";
        case GameEventType::HarmonyIncreased:
            return "HARMONY_INCREASED";
        case GameEventType::EnergyBalanced:
            return "ENERGY_BALANCED";
        case GameEventType::EnergyDepleted:
        default:
            return "ENERGY_DEPLETED";
    }
}

struct GameEvent {
    GameEventType type{GameEventType::GameStarted};
    double timestamp{0.0};  // simulation clock, seconds
    nlohmann::json data = nlohmann::json::object();
};

}  // namespace Zen
