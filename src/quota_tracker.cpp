#include "quota_tracker.hpp"

namespace relay {

QuotaTracker::QuotaTracker(const std::map<std::string, int>& targets) {
    for (const auto& kv : targets) {
        auto slot = std::make_unique<Slot>();
        slot->target = kv.second;
        slots_.emplace(kv.first, std::move(slot));
    }
}

const QuotaTracker::Slot* QuotaTracker::find(const std::string& country) const {
    auto it = slots_.find(country);
    return it == slots_.end() ? nullptr : it->second.get();
}

bool QuotaTracker::tracks(const std::string& country) const {
    return find(country) != nullptr;
}

bool QuotaTracker::record(const std::string& country) {
    auto it = slots_.find(country);
    if (it == slots_.end())
        return false;

    Slot& slot = *it->second;
    int cur = slot.accepted.load(std::memory_order_acquire);
    while (cur < slot.target) {
        if (slot.accepted.compare_exchange_weak(cur, cur + 1, std::memory_order_acq_rel)) {
            if (cur + 1 == slot.target)
                satisfied_.fetch_add(1, std::memory_order_acq_rel);
            return true;
        }
    }
    return false;
}

bool QuotaTracker::is_country_satisfied(const std::string& country) const {
    const Slot* slot = find(country);
    return slot && slot->accepted.load(std::memory_order_acquire) >= slot->target;
}

bool QuotaTracker::is_all_satisfied() const {
    return satisfied_.load(std::memory_order_acquire) == slots_.size();
}

int QuotaTracker::accepted(const std::string& country) const {
    const Slot* slot = find(country);
    return slot ? slot->accepted.load(std::memory_order_acquire) : 0;
}

int QuotaTracker::target(const std::string& country) const {
    const Slot* slot = find(country);
    return slot ? slot->target : 0;
}

} // namespace relay
