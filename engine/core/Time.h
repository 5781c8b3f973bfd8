// Frame timing for the main loop and the fixed-step simulation clock.
#pragma once

namespace Engine {

struct TimeStep {
    double deltaSeconds{0.0};
    double elapsedSeconds{0.0};
    unsigned long long frame{0};
};

// Upper bound for a single frame delta; larger gaps (debugger stops, window drags) are clipped.
constexpr double kMaxStepSeconds = 0.1;
constexpr double kTargetFrameSeconds = 1.0 / 60.0;

// Converts variable frame time into whole fixed steps. When a frame owes more than
// `maxStepsPerFrame` steps the backlog is dropped so a slow frame cannot spiral.
class FixedStepper {
public:
    FixedStepper(double stepSeconds, int maxStepsPerFrame) : step_(stepSeconds), maxSteps_(maxStepsPerFrame) {}

    int advance(double frameSeconds) {
        accumulator_ += frameSeconds;
        int due = 0;
        while (accumulator_ >= step_ && due < maxSteps_) {
            accumulator_ -= step_;
            ++due;
        }
        if (due == maxSteps_) {
            accumulator_ = 0.0;
        }
        return due;
    }

    void reset() { accumulator_ = 0.0; }
    double step() const { return step_; }
    double backlog() const { return accumulator_; }

private:
    double step_;
    int maxSteps_;
    double accumulator_{0.0};
};

}  // namespace Engine
