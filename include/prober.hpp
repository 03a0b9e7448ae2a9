#pragma once
#include "probe_result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace relay {

class DiagLogger;

// One reachability + latency measurement for one (address, port).
// Implementations must be safe to call from several workers at once.
class Prober {
public:
    virtual ~Prober() = default;
    virtual ProbeOutcome probe(const std::string& address, int port,
                               std::chrono::milliseconds timeout) = 0;
};

// Plain TCP connect; success is connection establishment, latency is
// attempt start to establishment.
class TcpConnectProber : public Prober {
public:
    explicit TcpConnectProber(DiagLogger* diag = nullptr) : diag_(diag) {}
    ProbeOutcome probe(const std::string& address, int port,
                       std::chrono::milliseconds timeout) override;

private:
    DiagLogger* diag_;
};

enum class PortPolicy {
    FirstSuccess,   // ports are a fallback chain
    AllMustSucceed, // every port must connect
};

// Runs the configured ports against one candidate.
//  FirstSuccess:   first port that connects wins; remaining ports are skipped.
//  AllMustSucceed: stops at the first failing port; the result carries the
//                  first port and the worst latency seen.
// A latency above max_latency_ms (when > 0) fails with FailureKind::TooSlow.
struct CandidateProbe {
    ProbeOutcome outcome;
    int port{};
};

CandidateProbe probe_candidate(Prober& prober, const std::string& address,
                               const std::vector<int>& ports,
                               std::chrono::milliseconds timeout,
                               PortPolicy policy, double max_latency_ms);

} // namespace relay
