// ===================== include/dns_resolver.hpp =====================
#pragma once
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>

namespace relay
{
    struct ResolvedAddress
    {
        int family;
        int socktype;
        int protocol;
        sockaddr_storage addr;
        socklen_t addrlen;
    };

    class DNSResolver
    {
    public:
        // Throws std::runtime_error when the name does not resolve.
        static std::vector<ResolvedAddress> resolve(const std::string &host, int port);

        // Literal addresses only (AI_NUMERICHOST); never touches DNS.
        static std::optional<ResolvedAddress> numeric(const std::string &ip, int port);
    };
} // namespace relay
