#pragma once

#include <string_view>
#include <vector>

#include "StatusTypes.h"

namespace Engine::Status {

// Owns timed modifiers for one target. Instances never stack or refresh: every apply is
// tracked separately so each one can be reverted by exactly the amount it added.
class StatusContainer {
public:
    StatusHandle apply(const StatusSpec& spec);
    bool remove(StatusHandle handle);
    void clear();

    // Advances timers and returns the instances that expired this step, in application order.
    std::vector<StatusInstance> update(float dt);

    bool hasTag(std::string_view tag) const;
    int count(std::string_view tag) const;
    float magnitudeTotal(std::string_view tag) const;
    bool empty() const { return statuses_.empty(); }

    const std::vector<StatusInstance>& all() const { return statuses_; }

private:
    std::vector<StatusInstance> statuses_;
    StatusHandle lastHandle_{kInvalidStatus};
};

}  // namespace Engine::Status
