// Owns the window and render device and drives the listener once per frame until quit.
#pragma once

#include <memory>
#include <string>

#include "ApplicationListener.h"
#include "Time.h"
#include "../input/InputState.h"
#include "../platform/Window.h"
#include "../render/RenderDevice.h"

namespace Engine {

// Summary of one run() call.
struct RunStats {
    unsigned long long frames{0};
    double elapsedSeconds{0.0};
    std::string quitReason;
};

class Application {
public:
    Application(ApplicationListener& listener, WindowPtr window, WindowConfig config = {});
    ~Application();

    bool initialize();
    RunStats run();
    // First reason wins; later requests are ignored.
    void requestQuit(const std::string& reason);
    bool isRunning() const { return running_; }

    Window& window() { return *window_; }
    const Window& window() const { return *window_; }
    RenderDevice& renderer() { return *renderDevice_; }
    const RenderDevice& renderer() const { return *renderDevice_; }
    const WindowConfig& config() const { return config_; }
    const TimeStep& timeStep() const { return timeStep_; }

private:
    void frame(double deltaSeconds);

    ApplicationListener& listener_;
    WindowPtr window_;
    WindowConfig config_;
    RenderDevicePtr renderDevice_;
    TimeStep timeStep_{};
    InputState input_{};
    std::string quitReason_;
    bool running_{false};
    bool initialized_{false};
};

}  // namespace Engine
