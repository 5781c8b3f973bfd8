// SDL2-backed window: owns the SDL video subsystem, the native window and its accelerated renderer.
#pragma once

#include <SDL.h>

#include "Window.h"
#include "../input/InputState.h"

namespace Engine {

class SDLWindow final : public Window {
public:
    SDLWindow() = default;
    ~SDLWindow() override;

    bool initialize(const WindowConfig& config) override;
    std::unique_ptr<class RenderDevice> createRenderDevice() override;
    // Translates SDL keyboard and mouse events into InputState; a close request quits the app.
    void pollEvents(Application& app, class InputState& input) override;

    // Keyboard layout: WASD/arrows move, 1-3 emit waves, Enter/Space start, P/Esc pause,
    // R/Backspace restart, V cycles the field view, Q quits.
    static bool translateKey(SDL_Keycode sym, InputKey& out);
    // Left, middle and right map to 0, 1 and 2; other buttons to -1.
    static int translateMouseButton(Uint8 button);

protected:
    void applyTitle(const std::string& title) override;

private:
    SDL_Window* window_{nullptr};
    SDL_Renderer* renderer_{nullptr};
    bool sdlInitialized_{false};
};

}  // namespace Engine
