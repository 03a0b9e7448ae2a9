#include "result_store.hpp"

#include <algorithm>

namespace relay {

ResultStore::ResultStore(std::map<std::string, int> capacity) : capacity_(std::move(capacity)) {}

bool ResultStore::insert(ProbeResult r) {
    std::lock_guard<std::mutex> lock(mu_);

    auto cap = capacity_.find(r.country);
    if (cap == capacity_.end())
        return false;
    if (addresses_.count(r.address))
        return false;

    auto& bucket = buckets_[r.country];
    if (static_cast<int>(bucket.size()) >= cap->second)
        return false;

    // upper_bound places equal latencies after existing ones.
    auto pos = std::upper_bound(bucket.begin(), bucket.end(), r.latency_ms,
                                [](double ms, const ProbeResult& e) { return ms < e.latency_ms; });
    addresses_.insert(r.address);
    bucket.insert(pos, std::move(r));
    return true;
}

Buckets ResultStore::buckets() const {
    std::lock_guard<std::mutex> lock(mu_);
    return buckets_;
}

std::size_t ResultStore::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return addresses_.size();
}

} // namespace relay
