#include "probe_scheduler.hpp"
#include "candidate_source.hpp"
#include "diag_logger.hpp"
#include "geo_resolver.hpp"

#include <algorithm>
#include <set>
#include <system_error>
#include <thread>

namespace relay {

const char* to_string(StopReason r) {
    switch (r) {
        case StopReason::None: return "none";
        case StopReason::AllSatisfied: return "all_satisfied";
        case StopReason::PoolExhausted: return "pool_exhausted";
        case StopReason::ScanCapReached: return "scan_cap_reached";
    }
    return "?";
}

void validate(const RunConfig& cfg) {
    if (cfg.target_countries.empty())
        throw ConfigError("no target countries");

    std::set<std::string> targets;
    for (const auto& c : cfg.target_countries) {
        if (c.empty() || c == kUnknownCountry)
            throw ConfigError("invalid target country '" + c + "'");
        if (!targets.insert(c).second)
            throw ConfigError("duplicate target country " + c);
        auto it = cfg.counts_per_country.find(c);
        if (it == cfg.counts_per_country.end())
            throw ConfigError("no quota for target country " + c);
        if (it->second <= 0)
            throw ConfigError("quota for " + c + " must be positive, got " + std::to_string(it->second));
    }
    for (const auto& kv : cfg.counts_per_country)
        if (!targets.count(kv.first))
            throw ConfigError("quota given for non-target country " + kv.first);

    if (cfg.max_concurrent <= 0)
        throw ConfigError("max_concurrent must be positive, got " + std::to_string(cfg.max_concurrent));
    if (cfg.ports.empty())
        throw ConfigError("no ports to probe");
    for (int p : cfg.ports)
        if (p < 1 || p > 65535)
            throw ConfigError("port out of range: " + std::to_string(p));
    if (cfg.timeout.count() <= 0)
        throw ConfigError("timeout must be positive");
    if (cfg.max_candidates_scanned < 0)
        throw ConfigError("max_candidates_scanned must not be negative");
    if (cfg.max_latency_ms < 0)
        throw ConfigError("max_latency_ms must not be negative");
}

static RunConfig checked(RunConfig cfg) {
    validate(cfg);
    return cfg;
}

ProbeScheduler::ProbeScheduler(RunConfig cfg, CandidateSource& source, Prober& prober,
                               CountryResolver& resolver, DiagLogger* diag)
    : cfg_(checked(std::move(cfg))),
      source_(source),
      prober_(prober),
      resolver_(resolver),
      diag_(diag),
      quota_(cfg_.counts_per_country),
      store_(cfg_.counts_per_country) {}

void ProbeScheduler::signal_stop_locked(StopReason reason) {
    bool expected = false;
    if (!stop_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        return;
    reason_ = reason;
    stopped_at_ = std::chrono::steady_clock::now();
    diag_log(diag_, std::string("STOP reason=") + to_string(reason) +
                        " scanned=" + std::to_string(scanned_));
}

void ProbeScheduler::signal_stop(StopReason reason) {
    if (stopping())
        return;
    std::lock_guard<std::mutex> lock(dispatch_mu_);
    signal_stop_locked(reason);
}

std::optional<std::string> ProbeScheduler::next_candidate() {
    std::lock_guard<std::mutex> lock(dispatch_mu_);
    if (stopping())
        return std::nullopt;

    const auto cap = static_cast<std::size_t>(cfg_.max_candidates_scanned);
    while (buffer_.empty()) {
        if (exhausted_)
            return std::nullopt;

        std::size_t want = static_cast<std::size_t>(cfg_.max_concurrent);
        if (cap > 0)
            want = std::min(want, cap - scanned_);

        std::vector<std::string> batch;
        try {
            batch = source_.next_batch(want);
        } catch (const std::exception& e) {
            // Nothing pulled yet means the run cannot make progress at all.
            if (pulled_ == 0)
                source_error_ = e.what();
            diag_log(diag_, std::string("SOURCE_ERROR err=") + e.what() +
                                " pulled=" + std::to_string(pulled_));
            batch.clear();
        }

        if (batch.empty()) {
            exhausted_ = true;
            signal_stop_locked(StopReason::PoolExhausted);
            return std::nullopt;
        }
        pulled_ += batch.size();
        for (auto& a : batch)
            if (seen_.insert(a).second)
                buffer_.push_back(std::move(a));
    }

    std::string next = std::move(buffer_.front());
    buffer_.pop_front();
    ++scanned_;
    if (cap > 0 && scanned_ >= cap)
        signal_stop_locked(StopReason::ScanCapReached);
    return next;
}

void ProbeScheduler::handle(const std::string& address) {
    std::size_t now_in_flight = in_flight_.fetch_add(1) + 1;
    std::size_t seen_max = max_in_flight_.load();
    while (now_in_flight > seen_max && !max_in_flight_.compare_exchange_weak(seen_max, now_in_flight)) {
    }

    CandidateProbe cp{ProbeOutcome::fail(FailureKind::Error), cfg_.ports.front()};
    try {
        cp = probe_candidate(prober_, address, cfg_.ports, cfg_.timeout,
                             cfg_.port_policy, cfg_.max_latency_ms);
    } catch (const std::exception& e) {
        diag_log(diag_, "PROBE_ERROR ip=" + address + " err=" + e.what());
    }
    in_flight_.fetch_sub(1);

    if (!cp.outcome.ok) {
        failed_++;
        failures_[static_cast<std::size_t>(cp.outcome.failure)]++;
    } else {
        std::string country;
        try {
            country = resolver_.resolve(address);
        } catch (const std::exception& e) {
            diag_log(diag_, "RESOLVE_FAIL ip=" + address + " err=" + e.what());
            country = kUnknownCountry;
        }

        const std::string where = "ip=" + address + ":" + std::to_string(cp.port) +
                                  " country=" + country +
                                  " rtt_ms=" + std::to_string(cp.outcome.latency_ms);
        if (!quota_.tracks(country)) {
            discarded_++;
            diag_log(diag_, "DISCARD " + where);
        } else if (quota_.record(country)) {
            ProbeResult r{address, cp.port, cp.outcome.latency_ms, country,
                          std::chrono::system_clock::now()};
            if (!store_.insert(std::move(r)))
                diag_log(diag_, "STORE_REFUSED " + where);
            accepted_++;
            diag_log(diag_, "ACCEPT " + where + " have=" + std::to_string(quota_.accepted(country)) +
                                "/" + std::to_string(quota_.target(country)));
        } else {
            rejected_++;
            diag_log(diag_, "REJECT " + where + " (quota full)");
        }
    }

    std::size_t done = completed_.fetch_add(1) + 1;
    if (on_progress_ && cfg_.progress_every > 0 && done % cfg_.progress_every == 0) {
        std::size_t scanned;
        {
            std::lock_guard<std::mutex> lock(dispatch_mu_);
            scanned = scanned_;
        }
        on_progress_(Progress{scanned, done, accepted_.load(), failed_.load()});
    }

    if (quota_.is_all_satisfied())
        signal_stop(StopReason::AllSatisfied);
}

void ProbeScheduler::worker() {
    while (auto address = next_candidate())
        handle(*address);
}

RunReport ProbeScheduler::run() {
    if (started_.exchange(true))
        throw std::logic_error("ProbeScheduler::run() called twice");

    RunReport report;
    report.started = std::chrono::steady_clock::now();
    diag_log(diag_, "RUN_START workers=" + std::to_string(cfg_.max_concurrent) +
                        " countries=" + std::to_string(cfg_.target_countries.size()) +
                        " cap=" + std::to_string(cfg_.max_candidates_scanned));

    std::vector<std::thread> pool;
    pool.reserve(static_cast<std::size_t>(cfg_.max_concurrent));
    try {
        for (int i = 0; i < cfg_.max_concurrent; ++i)
            pool.emplace_back([this] { worker(); });
    } catch (const std::system_error& e) {
        // Could not start every worker; let the started ones drain and bail out.
        diag_log(diag_, std::string("RUN_ABORT thread start failed: ") + e.what());
        signal_stop(StopReason::None);
        for (auto& t : pool)
            t.join();
        throw;
    }
    for (auto& t : pool)
        t.join();

    report.finished = std::chrono::steady_clock::now();

    if (pulled_ == 0) {
        std::string why = source_error_.empty() ? "candidate source is empty" : source_error_;
        diag_log(diag_, "RUN_ABORT source unavailable: " + why);
        throw SourceUnavailable("no candidates available: " + why);
    }

    report.reason = reason_;
    report.stopped_at = stopped_at_;
    report.all_satisfied = quota_.is_all_satisfied();
    report.scanned = scanned_;
    report.accepted = accepted_.load();
    report.rejected = rejected_.load();
    report.discarded = discarded_.load();
    report.failed = failed_.load();
    report.max_in_flight = max_in_flight_.load();
    for (std::size_t i = 0; i < failures_.size(); ++i) {
        if (failures_[i].load() > 0)
            report.failures[to_string(static_cast<FailureKind>(i))] = failures_[i].load();
    }
    report.buckets = store_.buckets();

    diag_log(diag_, std::string("RUN_DONE reason=") + to_string(report.reason) +
                        " scanned=" + std::to_string(report.scanned) +
                        " accepted=" + std::to_string(report.accepted) +
                        " failed=" + std::to_string(report.failed) +
                        " elapsed_ms=" + std::to_string(report.elapsed_ms()));

    if (on_complete_)
        on_complete_(report);
    return report;
}

} // namespace relay
