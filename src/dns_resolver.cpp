// ===================== src/dns_resolver.cpp =====================
#include "dns_resolver.hpp"
#include <cstring>
#include <stdexcept>

namespace relay
{
    static ResolvedAddress to_resolved(const addrinfo *p)
    {
        ResolvedAddress ra{};
        ra.family = p->ai_family;
        ra.socktype = p->ai_socktype;
        ra.protocol = p->ai_protocol;
        ra.addrlen = static_cast<socklen_t>(p->ai_addrlen);
        std::memcpy(&ra.addr, p->ai_addr, p->ai_addrlen);
        return ra;
    }

    std::vector<ResolvedAddress> DNSResolver::resolve(const std::string &host, int port)
    {
        std::vector<ResolvedAddress> results;

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo *res = nullptr;

        const std::string portStr = std::to_string(port);
        int status = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
        if (status != 0)
        {
            throw std::runtime_error(std::string("DNS resolution failed for ") + host + ": " + gai_strerror(status));
        }

        for (auto *p = res; p != nullptr; p = p->ai_next)
            results.push_back(to_resolved(p));
        freeaddrinfo(res);
        return results;
    }

    std::optional<ResolvedAddress> DNSResolver::numeric(const std::string &ip, int port)
    {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV;
        addrinfo *res = nullptr;

        const std::string portStr = std::to_string(port);
        if (getaddrinfo(ip.c_str(), portStr.c_str(), &hints, &res) != 0 || res == nullptr)
            return std::nullopt;

        ResolvedAddress ra = to_resolved(res);
        freeaddrinfo(res);
        return ra;
    }
} // namespace relay
