// Lifecycle states of a session.
#pragma once

#include <string_view>

namespace Zen {

enum class GameState { Loading, Menu, Playing, Paused, GameOver, Victory };

inline std::string_view toString(GameState state) {
    switch (state) {
        case GameState::Loading:
            return "LOADING";
        case GameState::Menu:
            return "MENU";
        case GameState::Playing:
            return "PLAYING";
        case GameState::Paused:
            return "PAUSED";
        case GameState::GameOver:
            return "GAME_OVER";
        case GameState::Victory:
        default:
            return "VICTORY";
    }
}

}  // namespace Zen
