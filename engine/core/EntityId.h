// Monotonic id issuance for simulation records ("dissonance-17").
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace Engine {

using EntityId = std::string;

class IdGenerator {
public:
    EntityId next(std::string_view tag) {
        ++lastIssued_;
        std::string id(tag);
        id += '-';
        id += std::to_string(lastIssued_);
        return id;
    }

    std::uint64_t lastIssued() const { return lastIssued_; }

    // Ids stay unique for the lifetime of the generator; reset only alongside every record it issued.
    void reset() { lastIssued_ = 0; }

private:
    std::uint64_t lastIssued_{0};
};

}  // namespace Engine
