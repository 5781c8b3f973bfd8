#include "GameStateMachine.h"

#include <string>

#include "../engine/core/Logger.h"

namespace Zen {

bool GameStateMachine::reject(const char* command) const {
    Engine::logInfo(std::string("Ignoring ") + command + " while " + std::string(toString(state_)) + ".");
    return false;
}

void GameStateMachine::enter(GameState next) {
    Engine::logDebug("State " + std::string(toString(state_)) + " -> " + std::string(toString(next)));
    state_ = next;
}

bool GameStateMachine::finishLoading() {
    if (state_ != GameState::Loading) return reject("finishLoading");
    enter(GameState::Menu);
    return true;
}

bool GameStateMachine::start() {
    // Starting from a finished or paused session begins a fresh one.
    if (state_ == GameState::Playing || state_ == GameState::Loading) return reject("start");
    enter(GameState::Playing);
    return true;
}

bool GameStateMachine::pause() {
    if (state_ != GameState::Playing) return reject("pause");
    enter(GameState::Paused);
    return true;
}

bool GameStateMachine::resume() {
    if (state_ != GameState::Paused) return reject("resume");
    enter(GameState::Playing);
    return true;
}

bool GameStateMachine::end(bool victory) {
    if (state_ != GameState::Playing && state_ != GameState::Paused) return reject("end");
    enter(victory ? GameState::Victory : GameState::GameOver);
    return true;
}

bool GameStateMachine::reset() {
    enter(GameState::Menu);
    return true;
}

}  // namespace Zen
