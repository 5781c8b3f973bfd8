// Whatever calls HarmonicsEngine::tick each frame; the engine starts and stops it on lifecycle changes.
#pragma once

namespace Zen {

class TickDriver {
public:
    virtual ~TickDriver() = default;

    virtual void startTicking() = 0;
    virtual void stopTicking() = 0;
};

}  // namespace Zen
