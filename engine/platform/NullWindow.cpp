#include "NullWindow.h"

#include <string>

#include "../core/Application.h"
#include "../core/Logger.h"
#include "../render/NullRenderDevice.h"

namespace Engine {

bool NullWindow::initialize(const WindowConfig& config) {
    markOpen(config.title);
    frameBudget_ = config.headlessFrames;
    framesPolled_ = 0;
    logInfo("NullWindow active for " + std::to_string(frameBudget_) + " frames: " + config.title + " (" +
            std::to_string(config.width) + "x" + std::to_string(config.height) + ")");
    return true;
}

std::unique_ptr<RenderDevice> NullWindow::createRenderDevice() {
    return std::make_unique<NullRenderDevice>();
}

void NullWindow::pollEvents(Application& app, InputState& /*input*/) {
    if (!isOpen()) {
        return;
    }
    ++framesPolled_;
    if (framesPolled_ > frameBudget_) {
        markClosed();
        app.requestQuit("NullWindow frame budget reached.");
    }
}

}  // namespace Engine
