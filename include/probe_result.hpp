#pragma once
#include <chrono>
#include <string>

namespace relay {

// Country code for addresses the resolver could not place.
inline const std::string kUnknownCountry = "UNKNOWN";

// Why a probe did not produce a result. Scheduling treats every kind the
// same; the distinction only feeds diagnostics.
enum class FailureKind {
    None,
    Refused,
    Timeout,
    Unreachable,
    BadAddress,
    TooSlow,
    Error,
};

const char* to_string(FailureKind k);

struct ProbeOutcome {
    bool ok{};
    double latency_ms{};
    FailureKind failure{FailureKind::None};

    static ProbeOutcome success(double ms) { return ProbeOutcome{true, ms, FailureKind::None}; }
    static ProbeOutcome fail(FailureKind k) { return ProbeOutcome{false, 0.0, k}; }
};

struct ProbeResult {
    std::string address;
    int port{};
    double latency_ms{};
    std::string country;
    std::chrono::system_clock::time_point timestamp;
};

} // namespace relay
