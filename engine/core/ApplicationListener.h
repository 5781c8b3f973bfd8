// Per-frame callbacks the Application drives: input, then update, then render.
#pragma once

namespace Engine {

class Application;
class InputState;
class RenderDevice;
struct TimeStep;

class ApplicationListener {
public:
    virtual ~ApplicationListener() = default;

    virtual bool onInitialize(Application& app) = 0;
    // Edge-triggered keys are only valid during this call.
    virtual void onInput(const InputState& input, const TimeStep& step) = 0;
    virtual void onUpdate(const TimeStep& step) = 0;
    virtual void onRender(RenderDevice& device) = 0;
    virtual void onShutdown() = 0;
};

}  // namespace Engine
