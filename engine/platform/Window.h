// Abstract window interface; real implementations live under /engine/platform.
#pragma once

#include <memory>
#include <string>

namespace Engine {

struct WindowConfig {
    int width{550};
    int height{550};
    std::string title{"Zen Harmonics"};
    bool vsync{true};
    int headlessFrames{600};  // frames a NullWindow stays open
};

class Application;

// The base tracks the open flag and caption; backends push them to the OS.
class Window {
public:
    virtual ~Window() = default;

    virtual bool initialize(const WindowConfig& config) = 0;
    virtual void pollEvents(Application& app, class InputState& input) = 0;
    virtual std::unique_ptr<class RenderDevice> createRenderDevice() = 0;
    // Headless windows are stepped with a fixed delta and never sleep.
    virtual bool isHeadless() const { return false; }

    bool isOpen() const { return open_; }
    const std::string& title() const { return title_; }
    void setTitle(const std::string& title) {
        if (title == title_) return;
        title_ = title;
        if (open_) applyTitle(title_);
    }

protected:
    virtual void applyTitle(const std::string& /*title*/) {}
    void markOpen(const std::string& title) {
        title_ = title;
        open_ = true;
    }
    void markClosed() { open_ = false; }

private:
    std::string title_;
    bool open_{false};
};

using WindowPtr = std::unique_ptr<Window>;

}  // namespace Engine
