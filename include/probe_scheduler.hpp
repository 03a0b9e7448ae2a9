#pragma once
#include "prober.hpp"
#include "quota_tracker.hpp"
#include "result_store.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace relay {

class CandidateSource;
class CountryResolver;
class DiagLogger;

// Invalid RunConfig; raised before any probing starts.
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// The candidate source produced nothing at all, so the run could not start.
class SourceUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RunConfig {
    std::vector<std::string> target_countries;
    std::map<std::string, int> counts_per_country;
    int max_concurrent = 30;
    std::vector<int> ports{8443};
    std::chrono::milliseconds timeout{5000};
    int64_t max_candidates_scanned = 0; // 0 = unbounded
    double max_latency_ms = 0;          // 0 = unbounded
    PortPolicy port_policy = PortPolicy::FirstSuccess;
    std::size_t progress_every = 0;     // 0 = no progress callbacks
};

// Throws ConfigError describing the first problem found.
void validate(const RunConfig& cfg);

enum class StopReason {
    None,
    AllSatisfied,
    PoolExhausted,
    ScanCapReached,
};

const char* to_string(StopReason r);

struct RunReport {
    StopReason reason = StopReason::None;
    bool all_satisfied = false;

    std::size_t scanned = 0;   // candidates dispatched to a worker
    std::size_t accepted = 0;
    std::size_t rejected = 0;  // target country already full
    std::size_t discarded = 0; // non-target or unknown country
    std::size_t failed = 0;
    std::map<std::string, std::size_t> failures; // by FailureKind name
    std::size_t max_in_flight = 0;

    std::chrono::steady_clock::time_point started;
    std::chrono::steady_clock::time_point stopped_at; // stop signal
    std::chrono::steady_clock::time_point finished;   // all workers joined

    Buckets buckets;

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(finished - started).count();
    }
};

struct Progress {
    std::size_t scanned;
    std::size_t completed;
    std::size_t accepted;
    std::size_t failed;
};

// Fixed pool of max_concurrent workers draining a shared dispatcher. Each
// worker probes a candidate, resolves its country, and admits it through the
// quota before inserting it into the result store. Dispatch ends for good on
// the first of: every quota met, source exhausted, scan cap reached.
class ProbeScheduler {
public:
    // Throws ConfigError for an invalid configuration.
    ProbeScheduler(RunConfig cfg, CandidateSource& source, Prober& prober,
                   CountryResolver& resolver, DiagLogger* diag = nullptr);

    ProbeScheduler(const ProbeScheduler&) = delete;
    ProbeScheduler& operator=(const ProbeScheduler&) = delete;

    // Called once, from the thread that runs run(), after every worker is done.
    void on_complete(std::function<void(const RunReport&)> fn) { on_complete_ = std::move(fn); }

    // Called from worker threads every progress_every completed candidates.
    void on_progress(std::function<void(const Progress&)> fn) { on_progress_ = std::move(fn); }

    // Blocks until the run is over. Throws SourceUnavailable if the source
    // never produced a candidate, std::logic_error if called twice.
    RunReport run();

    bool stopping() const { return stop_.load(std::memory_order_acquire); }
    const QuotaTracker& quota() const { return quota_; }
    const RunConfig& config() const { return cfg_; }

private:
    void worker();
    std::optional<std::string> next_candidate();
    void handle(const std::string& address);
    void signal_stop(StopReason reason);
    void signal_stop_locked(StopReason reason);

    RunConfig cfg_;
    CandidateSource& source_;
    Prober& prober_;
    CountryResolver& resolver_;
    DiagLogger* diag_;

    QuotaTracker quota_;
    ResultStore store_;

    // dispatcher state, guarded by dispatch_mu_
    std::mutex dispatch_mu_;
    std::deque<std::string> buffer_;
    std::unordered_set<std::string> seen_;
    std::size_t pulled_ = 0;
    std::size_t scanned_ = 0;
    bool exhausted_ = false;
    std::string source_error_;
    StopReason reason_ = StopReason::None;
    std::chrono::steady_clock::time_point stopped_at_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stop_{false};

    std::atomic<std::size_t> in_flight_{0};
    std::atomic<std::size_t> max_in_flight_{0};
    std::atomic<std::size_t> completed_{0};
    std::atomic<std::size_t> accepted_{0};
    std::atomic<std::size_t> rejected_{0};
    std::atomic<std::size_t> discarded_{0};
    std::atomic<std::size_t> failed_{0};
    std::array<std::atomic<std::size_t>, 7> failures_{};

    std::function<void(const RunReport&)> on_complete_;
    std::function<void(const Progress&)> on_progress_;
};

} // namespace relay
