// TCP connect prober against a loopback listener.
#include "prober.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <iostream>

using namespace relay;

// Listening socket on 127.0.0.1 with a kernel-chosen port; -1 on failure.
static int listen_loopback(int& port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
        return -1;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(fd, 16) < 0 ||
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        ::close(fd);
        return -1;
    }
    port = ntohs(addr.sin_port);
    return fd;
}

int main() {
    int open_port = 0;
    int listener = listen_loopback(open_port);
    if (listener < 0) {
        std::cerr << "cannot open loopback listener\n";
        return 1;
    }

    // Bind then close to get a port with nothing listening on it.
    int closed_port = 0;
    int tmp = listen_loopback(closed_port);
    if (tmp < 0) {
        ::close(listener);
        return 2;
    }
    ::close(tmp);

    TcpConnectProber prober;
    const auto timeout = std::chrono::milliseconds(1000);
    int rc = 0;

    ProbeOutcome ok = prober.probe("127.0.0.1", open_port, timeout);
    if (!ok.ok || ok.latency_ms < 0 || ok.latency_ms > 1000)
        rc = 3;

    ProbeOutcome refused = prober.probe("127.0.0.1", closed_port, timeout);
    if (rc == 0 && (refused.ok || refused.failure == FailureKind::None))
        rc = 4;

    ProbeOutcome bad = prober.probe("not-an-address", open_port, timeout);
    if (rc == 0 && (bad.ok || bad.failure != FailureKind::BadAddress))
        rc = 5;

    // Falls back from the dead port to the live one.
    CandidateProbe cp = probe_candidate(prober, "127.0.0.1", {closed_port, open_port}, timeout,
                                        PortPolicy::FirstSuccess, 0);
    if (rc == 0 && (!cp.outcome.ok || cp.port != open_port))
        rc = 6;

    CandidateProbe all = probe_candidate(prober, "127.0.0.1", {open_port, closed_port}, timeout,
                                         PortPolicy::AllMustSucceed, 0);
    if (rc == 0 && (all.outcome.ok || all.port != closed_port))
        rc = 7;

    ::close(listener);
    if (rc != 0) {
        std::cerr << "prober test failed with code " << rc << "\n";
        return rc;
    }
    std::cout << "prober tests passed\n";
    return 0;
}
