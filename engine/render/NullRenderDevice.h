// No-op renderer used by NullWindow or headless runs.
#pragma once

#include "RenderDevice.h"

namespace Engine {

class NullRenderDevice final : public RenderDevice {
public:
    void clear(const Color& /*color*/) override {}
    void drawFilledRect(const Vec2& /*topLeft*/, const Vec2& /*size*/, const Color& /*color*/) override {
        ++rectCount_;
    }
    void drawLine(const Vec2& /*from*/, const Vec2& /*to*/, const Color& /*color*/) override { ++lineCount_; }
    void present() override {}

    unsigned long long rectCount() const { return rectCount_; }
    unsigned long long lineCount() const { return lineCount_; }

private:
    unsigned long long rectCount_{0};
    unsigned long long lineCount_{0};
};

}  // namespace Engine
