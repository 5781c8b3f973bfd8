#include "SDLWindow.h"

#include <string>

#include <SDL.h>

#include "../core/Application.h"
#include "../core/Logger.h"
#include "../input/InputState.h"
#include "SDLRenderDevice.h"

namespace Engine {

bool SDLWindow::translateKey(SDL_Keycode sym, InputKey& out) {
    switch (sym) {
        case SDLK_w:
        case SDLK_UP:
            out = InputKey::Up;
            return true;
        case SDLK_s:
        case SDLK_DOWN:
            out = InputKey::Down;
            return true;
        case SDLK_a:
        case SDLK_LEFT:
            out = InputKey::Left;
            return true;
        case SDLK_d:
        case SDLK_RIGHT:
            out = InputKey::Right;
            return true;
        case SDLK_1:
            out = InputKey::WaveCalm;
            return true;
        case SDLK_2:
            out = InputKey::WaveVibrant;
            return true;
        case SDLK_3:
            out = InputKey::WaveIntense;
            return true;
        case SDLK_RETURN:
        case SDLK_KP_ENTER:
        case SDLK_SPACE:
            out = InputKey::Start;
            return true;
        case SDLK_p:
        case SDLK_ESCAPE:
            out = InputKey::Pause;
            return true;
        case SDLK_BACKSPACE:
        case SDLK_r:
            out = InputKey::Restart;
            return true;
        case SDLK_v:
            out = InputKey::CycleVisualMode;
            return true;
        case SDLK_q:
            out = InputKey::Quit;
            return true;
        default:
            return false;
    }
}

int SDLWindow::translateMouseButton(Uint8 button) {
    switch (button) {
        case SDL_BUTTON_LEFT:
            return 0;
        case SDL_BUTTON_MIDDLE:
            return 1;
        case SDL_BUTTON_RIGHT:
            return 2;
        default:
            return -1;
    }
}

SDLWindow::~SDLWindow() {
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
    }
    if (window_) {
        SDL_DestroyWindow(window_);
    }
    if (sdlInitialized_) {
        SDL_Quit();
    }
}

bool SDLWindow::initialize(const WindowConfig& config) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS | SDL_INIT_TIMER) != 0) {
        logError(std::string("SDL_Init failed: ") + SDL_GetError());
        return false;
    }
    sdlInitialized_ = true;

    window_ = SDL_CreateWindow(config.title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                               config.width, config.height, SDL_WINDOW_SHOWN);
    if (!window_) {
        logError(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        return false;
    }

    const auto rendererFlags = config.vsync ? SDL_RENDERER_PRESENTVSYNC : 0;
    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | rendererFlags);
    if (!renderer_) {
        logError(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        return false;
    }

    markOpen(config.title);
    logInfo("SDLWindow initialized at " + std::to_string(config.width) + "x" + std::to_string(config.height) +
            (config.vsync ? " with vsync." : "."));
    return true;
}

std::unique_ptr<RenderDevice> SDLWindow::createRenderDevice() {
    if (!renderer_) {
        return nullptr;
    }
    return std::make_unique<SDLRenderDevice>(renderer_);
}

void SDLWindow::pollEvents(Application& app, InputState& input) {
    SDL_Event evt;
    InputKey key{};
    while (SDL_PollEvent(&evt)) {
        switch (evt.type) {
            case SDL_QUIT:
                markClosed();
                app.requestQuit("Window close requested.");
                break;
            case SDL_KEYDOWN:
                if (!evt.key.repeat && translateKey(evt.key.keysym.sym, key)) {
                    input.setKeyDown(key, true);
                }
                break;
            case SDL_KEYUP:
                if (translateKey(evt.key.keysym.sym, key)) {
                    input.setKeyDown(key, false);
                }
                break;
            case SDL_MOUSEMOTION:
                input.setMousePosition(evt.motion.x, evt.motion.y);
                break;
            case SDL_MOUSEBUTTONDOWN:
                input.setMousePosition(evt.button.x, evt.button.y);
                input.setMouseButtonDown(translateMouseButton(evt.button.button), true);
                break;
            case SDL_MOUSEBUTTONUP:
                input.setMouseButtonDown(translateMouseButton(evt.button.button), false);
                break;
            default:
                break;
        }
    }
}

void SDLWindow::applyTitle(const std::string& title) {
    if (window_) {
        SDL_SetWindowTitle(window_, title.c_str());
    }
}

}  // namespace Engine
