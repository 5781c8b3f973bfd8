#pragma once

#include <cstdint>
#include <string>

namespace Engine::Status {

using StatusHandle = std::uint64_t;
constexpr StatusHandle kInvalidStatus = 0;

// Describes one timed modifier. The container only tracks time; the owner applies and reverts `magnitude`.
struct StatusSpec {
    std::string tag;
    float magnitude{0.0f};
    float duration{0.0f};  // <= 0 means infinite.
};

struct StatusInstance {
    StatusSpec spec;
    StatusHandle handle{kInvalidStatus};
    float remaining{0.0f};

    bool infinite() const { return spec.duration <= 0.0f; }
};

}  // namespace Engine::Status
