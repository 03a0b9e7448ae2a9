#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>

namespace relay {

// Per-country admission counters. The set of countries is fixed at
// construction, so lookups need no lock; each slot is an atomic counter that
// never exceeds its target.
class QuotaTracker {
public:
    explicit QuotaTracker(const std::map<std::string, int>& targets);

    QuotaTracker(const QuotaTracker&) = delete;
    QuotaTracker& operator=(const QuotaTracker&) = delete;

    bool tracks(const std::string& country) const;

    // Claims one slot for the country. Returns false when the country is not
    // tracked or its quota is already full. Exactly one concurrent caller wins
    // the last slot.
    bool record(const std::string& country);

    bool is_country_satisfied(const std::string& country) const;
    bool is_all_satisfied() const;

    int accepted(const std::string& country) const;
    int target(const std::string& country) const;

private:
    struct Slot {
        int target{};
        std::atomic<int> accepted{0};
    };

    const Slot* find(const std::string& country) const;

    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
    std::atomic<std::size_t> satisfied_{0};
};

} // namespace relay
