// Per-frame input snapshot (keyboard + mouse).
#pragma once

#include <array>

namespace Engine {

enum class InputKey {
    Up = 0,
    Down,
    Left,
    Right,
    WaveCalm,
    WaveVibrant,
    WaveIntense,
    Start,
    Pause,
    Restart,
    CycleVisualMode,
    Quit,
    Count
};

class InputState {
public:
    void setKeyDown(InputKey key, bool down) {
        auto& slot = keys_[static_cast<int>(key)];
        if (down && !slot) {
            pressed_[static_cast<int>(key)] = true;
        }
        slot = down;
    }
    bool isDown(InputKey key) const { return keys_[static_cast<int>(key)]; }
    // True only on the frame the key went down.
    bool wasPressed(InputKey key) const { return pressed_[static_cast<int>(key)]; }

    void setMousePosition(int x, int y) {
        mouseX_ = x;
        mouseY_ = y;
    }
    int mouseX() const { return mouseX_; }
    int mouseY() const { return mouseY_; }

    void setMouseButtonDown(int index, bool down) {
        if (index >= 0 && index < static_cast<int>(mouseButtons_.size())) {
            if (down && !mouseButtons_[index]) {
                mouseClicked_[index] = true;
            }
            mouseButtons_[index] = down;
        }
    }
    bool isMouseButtonDown(int index) const {
        if (index >= 0 && index < static_cast<int>(mouseButtons_.size())) {
            return mouseButtons_[index];
        }
        return false;
    }
    bool wasMouseClicked(int index) const {
        if (index >= 0 && index < static_cast<int>(mouseClicked_.size())) {
            return mouseClicked_[index];
        }
        return false;
    }

    void nextFrame() {
        pressed_.fill(false);
        mouseClicked_.fill(false);
    }

private:
    std::array<bool, static_cast<int>(InputKey::Count)> keys_{};
    std::array<bool, static_cast<int>(InputKey::Count)> pressed_{};
    int mouseX_{0};
    int mouseY_{0};
    std::array<bool, 3> mouseButtons_{};  // 0: left, 1: middle, 2: right
    std::array<bool, 3> mouseClicked_{};
};

}  // namespace Engine
