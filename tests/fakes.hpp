#pragma once
// Deterministic stand-ins for the network-facing interfaces.
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "candidate_source.hpp"
#include "geo_resolver.hpp"
#include "probe_scheduler.hpp"
#include "prober.hpp"

namespace relay::test {

using clk = std::chrono::steady_clock;

// Reachable addresses answer with their configured latency after sleeping
// `delay`; everything else times out after `delay`.
class FakeProber : public Prober {
public:
    std::map<std::string, double> latency;                      // address -> ms
    std::map<std::pair<std::string, int>, double> port_latency; // wins over `latency`
    std::chrono::milliseconds delay{0};

    ProbeOutcome probe(const std::string& address, int port, std::chrono::milliseconds) override {
        {
            std::lock_guard<std::mutex> lock(mu);
            starts.emplace_back(address, clk::now());
        }
        int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
        }
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);
        --in_flight;

        auto pit = port_latency.find({address, port});
        if (pit != port_latency.end())
            return ProbeOutcome::success(pit->second);
        auto it = latency.find(address);
        if (it == latency.end() || !port_latency.empty())
            return ProbeOutcome::fail(FailureKind::Timeout);
        return ProbeOutcome::success(it->second);
    }

    std::size_t probes() {
        std::lock_guard<std::mutex> lock(mu);
        return starts.size();
    }

    std::mutex mu;
    std::vector<std::pair<std::string, clk::time_point>> starts;
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
};

class MapResolver : public CountryResolver {
public:
    std::map<std::string, std::string> countries;
    std::string resolve(const std::string& ip) override {
        auto it = countries.find(ip);
        return it == countries.end() ? kUnknownCountry : it->second;
    }
};

class ThrowingResolver : public CountryResolver {
public:
    std::string resolve(const std::string&) override {
        throw std::runtime_error("geo backend down");
    }
};

// List source that notes any pull made after the scheduler began stopping.
class WatchedSource : public CandidateSource {
public:
    explicit WatchedSource(std::vector<std::string> addrs) : inner_(std::move(addrs)) {}

    std::vector<std::string> next_batch(std::size_t n) override {
        if (scheduler && scheduler->stopping())
            pulls_after_stop++;
        auto batch = inner_.next_batch(n);
        handed_out += batch.size();
        calls++;
        return batch;
    }

    const ProbeScheduler* scheduler = nullptr;
    std::atomic<int> pulls_after_stop{0};
    std::atomic<std::size_t> handed_out{0};
    std::atomic<int> calls{0};

private:
    ListCandidateSource inner_;
};

class ThrowingSource : public CandidateSource {
public:
    std::vector<std::string> next_batch(std::size_t) override {
        throw std::runtime_error("mirror unreachable");
    }
};

inline RunConfig config(std::map<std::string, int> quotas, int workers) {
    RunConfig cfg;
    for (const auto& kv : quotas)
        cfg.target_countries.push_back(kv.first);
    cfg.counts_per_country = std::move(quotas);
    cfg.max_concurrent = workers;
    cfg.ports = {443};
    cfg.timeout = std::chrono::milliseconds(200);
    return cfg;
}

inline bool bucket_ok(const std::vector<ProbeResult>& bucket) {
    for (std::size_t i = 1; i < bucket.size(); ++i)
        if (bucket[i].latency_ms < bucket[i - 1].latency_ms)
            return false;
    for (std::size_t i = 0; i < bucket.size(); ++i)
        for (std::size_t j = i + 1; j < bucket.size(); ++j)
            if (bucket[i].address == bucket[j].address)
                return false;
    return true;
}

inline std::string ip(int a, int b) {
    return "203.0." + std::to_string(a) + "." + std::to_string(b);
}

} // namespace relay::test
