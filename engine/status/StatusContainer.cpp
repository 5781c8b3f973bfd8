#include "StatusContainer.h"

#include <algorithm>

namespace Engine::Status {

StatusHandle StatusContainer::apply(const StatusSpec& spec) {
    StatusInstance inst;
    inst.spec = spec;
    inst.handle = ++lastHandle_;
    inst.remaining = spec.duration;
    statuses_.push_back(inst);
    return inst.handle;
}

bool StatusContainer::remove(StatusHandle handle) {
    const auto before = statuses_.size();
    statuses_.erase(std::remove_if(statuses_.begin(), statuses_.end(),
                                   [handle](const StatusInstance& inst) { return inst.handle == handle; }),
                    statuses_.end());
    return statuses_.size() != before;
}

void StatusContainer::clear() { statuses_.clear(); }

std::vector<StatusInstance> StatusContainer::update(float dt) {
    std::vector<StatusInstance> expired;
    for (auto& inst : statuses_) {
        if (inst.infinite()) continue;
        inst.remaining -= dt;
        if (inst.remaining <= 0.0f) {
            expired.push_back(inst);
        }
    }
    if (!expired.empty()) {
        statuses_.erase(std::remove_if(statuses_.begin(), statuses_.end(),
                                       [](const StatusInstance& inst) {
                                           return !inst.infinite() && inst.remaining <= 0.0f;
                                       }),
                        statuses_.end());
    }
    return expired;
}

bool StatusContainer::hasTag(std::string_view tag) const {
    for (const auto& inst : statuses_) {
        if (inst.spec.tag == tag) return true;
    }
    return false;
}

int StatusContainer::count(std::string_view tag) const {
    int n = 0;
    for (const auto& inst : statuses_) {
        if (inst.spec.tag == tag) ++n;
    }
    return n;
}

float StatusContainer::magnitudeTotal(std::string_view tag) const {
    float total = 0.0f;
    for (const auto& inst : statuses_) {
        if (inst.spec.tag == tag) total += inst.spec.magnitude;
    }
    return total;
}

}  // namespace Engine::Status
