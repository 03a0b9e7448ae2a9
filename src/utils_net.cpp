#include "utils_net.hpp"
#include <arpa/inet.h>
#include <unordered_set>

namespace relay::net {

std::optional<uint32_t> parse_ipv4(const std::string& s) {
    in_addr a{};
    if (s.empty() || inet_pton(AF_INET, s.c_str(), &a) != 1)
        return std::nullopt;
    return ntohl(a.s_addr);
}

std::string format_ipv4(uint32_t host_order) {
    in_addr a{};
    a.s_addr = htonl(host_order);
    char buf[INET_ADDRSTRLEN];
    return inet_ntop(AF_INET, &a, buf, sizeof(buf)) ? std::string(buf) : std::string();
}

static uint32_t prefix_mask(int prefix) {
    return prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
}

bool Cidr::contains(uint32_t ip) const {
    return (ip & prefix_mask(prefix)) == network;
}

std::optional<Cidr> parse_cidr(const std::string& s) {
    auto slash = s.find('/');
    auto addr = parse_ipv4(s.substr(0, slash));
    if (!addr)
        return std::nullopt;

    int prefix = 32;
    if (slash != std::string::npos) {
        const std::string bits = s.substr(slash + 1);
        if (bits.empty() || bits.size() > 2 || bits.find_first_not_of("0123456789") != std::string::npos)
            return std::nullopt;
        prefix = std::stoi(bits);
        if (prefix > 32)
            return std::nullopt;
    }
    return Cidr{*addr & prefix_mask(prefix), prefix};
}

bool is_unroutable_ipv4(uint32_t x) {
    if ((x & 0xFF000000) == 0x00000000) return true;        // 0.0.0.0/8
    if ((x & 0xFF000000) == 0x0A000000) return true;        // 10.0.0.0/8
    if ((x & 0xFFC00000) == 0x64400000) return true;        // 100.64.0.0/10 (CGNAT)
    if ((x & 0xFF000000) == 0x7F000000) return true;        // 127.0.0.0/8
    if ((x & 0xFFFF0000) == 0xA9FE0000) return true;        // 169.254.0.0/16 (link-local)
    if ((x & 0xFFF00000) == 0xAC100000) return true;        // 172.16.0.0/12
    if ((x & 0xFFFF0000) == 0xC0A80000) return true;        // 192.168.0.0/16
    if ((x & 0xF0000000) == 0xE0000000) return true;        // 224.0.0.0/4 (multicast)
    if ((x & 0xF0000000) == 0xF0000000) return true;        // 240.0.0.0/4 (reserved, broadcast)
    return false;
}

std::vector<uint32_t> sample_hosts(const Cidr& block, std::size_t count, std::mt19937& rng) {
    std::vector<uint32_t> out;
    if (count == 0)
        return out;

    // /31 and /32 have no network/broadcast pair to skip.
    if (block.prefix >= 31) {
        for (uint64_t i = 0; i < block.size() && out.size() < count; ++i)
            out.push_back(block.network + static_cast<uint32_t>(i));
        return out;
    }

    const uint64_t hosts = block.size() - 2;
    if (hosts <= count) {
        for (uint64_t i = 1; i <= hosts; ++i)
            out.push_back(block.network + static_cast<uint32_t>(i));
        return out;
    }

    std::uniform_int_distribution<uint64_t> pick(1, hosts);
    std::unordered_set<uint32_t> seen;
    std::size_t attempts = 0;
    const std::size_t max_attempts = count * 10;
    while (out.size() < count && attempts++ < max_attempts) {
        uint32_t ip = block.network + static_cast<uint32_t>(pick(rng));
        if (seen.insert(ip).second)
            out.push_back(ip);
    }
    return out;
}

} // namespace relay::net
