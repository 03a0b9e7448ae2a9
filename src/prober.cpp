#include "prober.hpp"
#include "diag_logger.hpp"
#include "dns_resolver.hpp"
#include "tcp_socket.hpp"

#include <algorithm>

namespace relay {

const char* to_string(FailureKind k) {
    switch (k) {
        case FailureKind::None: return "none";
        case FailureKind::Refused: return "refused";
        case FailureKind::Timeout: return "timeout";
        case FailureKind::Unreachable: return "unreachable";
        case FailureKind::BadAddress: return "bad_address";
        case FailureKind::TooSlow: return "too_slow";
        case FailureKind::Error: return "error";
    }
    return "?";
}

static FailureKind from_connect_status(ConnectStatus s) {
    switch (s) {
        case ConnectStatus::Refused: return FailureKind::Refused;
        case ConnectStatus::TimedOut: return FailureKind::Timeout;
        case ConnectStatus::Unreachable: return FailureKind::Unreachable;
        case ConnectStatus::SocketError: return FailureKind::Error;
        case ConnectStatus::Connected: break;
    }
    return FailureKind::None;
}

ProbeOutcome TcpConnectProber::probe(const std::string& address, int port,
                                     std::chrono::milliseconds timeout) {
    using clk = std::chrono::steady_clock;

    auto ra = DNSResolver::numeric(address, port);
    if (!ra) {
        diag_log(diag_, "PROBE_FAIL ip=" + address + " port=" + std::to_string(port) + " err=bad_address");
        return ProbeOutcome::fail(FailureKind::BadAddress);
    }

    TcpSocket sock;
    auto t0 = clk::now();
    ConnectStatus cs = sock.connectWithTimeout(*ra, static_cast<int>(timeout.count()));
    double ms = std::chrono::duration<double, std::milli>(clk::now() - t0).count();

    if (cs != ConnectStatus::Connected) {
        diag_log(diag_, "PROBE_FAIL ip=" + address + " port=" + std::to_string(port) +
                            " err=" + to_string(cs));
        return ProbeOutcome::fail(from_connect_status(cs));
    }
    diag_log(diag_, "PROBE_OK ip=" + address + " port=" + std::to_string(port) +
                        " rtt_ms=" + std::to_string(ms));
    return ProbeOutcome::success(ms);
}

CandidateProbe probe_candidate(Prober& prober, const std::string& address,
                               const std::vector<int>& ports,
                               std::chrono::milliseconds timeout,
                               PortPolicy policy, double max_latency_ms) {
    auto within_budget = [&](const ProbeOutcome& o) {
        return max_latency_ms <= 0 || o.latency_ms <= max_latency_ms;
    };

    CandidateProbe last{ProbeOutcome::fail(FailureKind::Error), ports.empty() ? 0 : ports.front()};

    if (policy == PortPolicy::FirstSuccess) {
        for (int port : ports) {
            ProbeOutcome o = prober.probe(address, port, timeout);
            if (o.ok && within_budget(o))
                return CandidateProbe{o, port};
            last = CandidateProbe{o.ok ? ProbeOutcome::fail(FailureKind::TooSlow) : o, port};
        }
        return last;
    }

    double worst = 0.0;
    for (int port : ports) {
        ProbeOutcome o = prober.probe(address, port, timeout);
        if (!o.ok)
            return CandidateProbe{o, port};
        if (!within_budget(o))
            return CandidateProbe{ProbeOutcome::fail(FailureKind::TooSlow), port};
        worst = std::max(worst, o.latency_ms);
    }
    if (ports.empty())
        return last;
    return CandidateProbe{ProbeOutcome::success(worst), ports.front()};
}

} // namespace relay
