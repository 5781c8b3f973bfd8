#include "SDLRenderDevice.h"

#include <SDL.h>

namespace Engine {

SDLRenderDevice::SDLRenderDevice(SDL_Renderer* renderer) : renderer_(renderer) {
    SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
}

void SDLRenderDevice::setColor(const Color& color) {
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
}

void SDLRenderDevice::clear(const Color& color) {
    setColor(color);
    SDL_RenderClear(renderer_);
}

void SDLRenderDevice::drawFilledRect(const Vec2& topLeft, const Vec2& size, const Color& color) {
    SDL_Rect rect{};
    rect.x = static_cast<int>(topLeft.x);
    rect.y = static_cast<int>(topLeft.y);
    rect.w = static_cast<int>(size.x);
    rect.h = static_cast<int>(size.y);
    if (rect.w <= 0 || rect.h <= 0) {
        return;
    }
    setColor(color);
    SDL_RenderFillRect(renderer_, &rect);
}

void SDLRenderDevice::drawLine(const Vec2& from, const Vec2& to, const Color& color) {
    setColor(color);
    SDL_RenderDrawLineF(renderer_, from.x, from.y, to.x, to.y);
}

void SDLRenderDevice::present() { SDL_RenderPresent(renderer_); }

}  // namespace Engine
