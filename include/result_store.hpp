#pragma once
#include "probe_result.hpp"

#include <map>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace relay {

using Buckets = std::map<std::string, std::vector<ProbeResult>>;

// Accepted results per country, each bucket ascending by latency. Ties keep
// arrival order. A bucket never grows past its capacity and never holds the
// same address twice.
class ResultStore {
public:
    explicit ResultStore(std::map<std::string, int> capacity);

    // False when the address is already stored, the country has no bucket,
    // or the bucket is full.
    bool insert(ProbeResult r);

    Buckets buckets() const;
    std::size_t size() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, int> capacity_;
    Buckets buckets_;
    std::unordered_set<std::string> addresses_;
};

} // namespace relay
