#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace relay::net {

// IPv4 address in host byte order.
std::optional<uint32_t> parse_ipv4(const std::string& s);
std::string format_ipv4(uint32_t host_order);

struct Cidr {
    uint32_t network{};   // host byte order, host bits cleared
    int prefix{};

    uint64_t size() const { return uint64_t{1} << (32 - prefix); }
    bool contains(uint32_t ip) const;
};

// Accepts "a.b.c.d/n" (host bits are masked off) or a bare address as /32.
std::optional<Cidr> parse_cidr(const std::string& s);

// Private, CGNAT, loopback, link-local, multicast, reserved, unspecified.
bool is_unroutable_ipv4(uint32_t ip);

// Up to `count` distinct usable hosts drawn at random from the block.
std::vector<uint32_t> sample_hosts(const Cidr& block, std::size_t count, std::mt19937& rng);

} // namespace relay::net
