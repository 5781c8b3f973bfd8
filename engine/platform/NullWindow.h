// Headless window: stays open for a fixed number of frames, then requests shutdown.
#pragma once

#include "Window.h"

namespace Engine {

class NullWindow final : public Window {
public:
    bool initialize(const WindowConfig& config) override;
    std::unique_ptr<class RenderDevice> createRenderDevice() override;
    void pollEvents(Application& app, class InputState& input) override;
    bool isHeadless() const override { return true; }

    int framesPolled() const { return framesPolled_; }
    int titleChanges() const { return titleChanges_; }

protected:
    void applyTitle(const std::string& /*title*/) override { ++titleChanges_; }

private:
    int frameBudget_{0};
    int framesPolled_{0};
    int titleChanges_{0};
};

}  // namespace Engine
