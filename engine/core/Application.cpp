#include "Application.h"

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

#include "Logger.h"

namespace Engine {

Application::Application(ApplicationListener& listener, WindowPtr window, WindowConfig config)
    : listener_(listener), window_(std::move(window)), config_(std::move(config)) {}

Application::~Application() {
    if (initialized_) {
        listener_.onShutdown();
    }
}

bool Application::initialize() {
    if (!window_) {
        logError("Application requires a Window instance.");
        return false;
    }

    if (!window_->initialize(config_)) {
        logError("Failed to initialize window.");
        return false;
    }

    renderDevice_ = window_->createRenderDevice();
    if (!renderDevice_) {
        logError("Failed to create render device.");
        return false;
    }

    running_ = listener_.onInitialize(*this);
    initialized_ = running_;
    return running_;
}

RunStats Application::run() {
    using clock = std::chrono::steady_clock;
    const bool headless = window_->isHeadless();

    auto last = clock::now();
    while (running_ && window_->isOpen()) {
        const auto now = clock::now();
        const std::chrono::duration<double> dt = now - last;
        last = now;

        frame(headless ? kTargetFrameSeconds : std::min(dt.count(), kMaxStepSeconds));
        if (!running_) {
            break;
        }

        if (!headless && dt.count() < kTargetFrameSeconds) {
            std::this_thread::sleep_for(std::chrono::duration<double>(kTargetFrameSeconds - dt.count()));
        }
    }
    if (quitReason_.empty()) {
        quitReason_ = "Window closed.";
    }

    logInfo("Application loop exited after " + std::to_string(timeStep_.frame) + " frames.");
    return RunStats{timeStep_.frame, timeStep_.elapsedSeconds, quitReason_};
}

void Application::frame(double deltaSeconds) {
    timeStep_.deltaSeconds = deltaSeconds;
    timeStep_.elapsedSeconds += deltaSeconds;
    ++timeStep_.frame;

    window_->pollEvents(*this, input_);
    if (!running_) {
        return;
    }
    listener_.onInput(input_, timeStep_);
    input_.nextFrame();
    listener_.onUpdate(timeStep_);
    listener_.onRender(*renderDevice_);
    renderDevice_->present();
}

void Application::requestQuit(const std::string& reason) {
    if (!running_) {
        return;
    }
    running_ = false;
    quitReason_ = reason;
    logInfo("Shutdown requested: " + reason);
}

}  // namespace Engine
