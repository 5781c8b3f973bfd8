// Guards lifecycle transitions; rejected requests are logged and leave the state unchanged.
#pragma once

#include "GameState.h"

namespace Zen {

class GameStateMachine {
public:
    GameState state() const { return state_; }
    bool isPlaying() const { return state_ == GameState::Playing; }

    bool finishLoading();
    bool start();
    bool pause();
    bool resume();
    bool end(bool victory);
    bool reset();

private:
    bool reject(const char* command) const;
    void enter(GameState next);

    GameState state_{GameState::Loading};
};

}  // namespace Zen
