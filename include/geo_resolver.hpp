//// ===================== File: include/geo_resolver.hpp =====================
#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "utils_net.hpp"

namespace relay {
class DiagLogger;

// Maps an address to an upper-case ISO country code, or kUnknownCountry.
// Implementations are called from many workers at once and may block on
// the network.
class CountryResolver {
public:
virtual ~CountryResolver() = default;
virtual std::string resolve(const std::string& ip) = 0;
};


// ip-api.com JSON lookup (plain HTTP; the free tier has no HTTPS).
class IpApiCountryResolver : public CountryResolver {
public:
explicit IpApiCountryResolver(int timeout_ms = 3000, DiagLogger* diag = nullptr);
std::string resolve(const std::string& ip) override;

// "countryCode" of a successful ip-api body, nullopt otherwise.
static std::optional<std::string> parse_body(const std::string& body);

private:
int timeout_ms_;
DiagLogger* diag_;
std::mutex mu_;
std::unordered_map<std::string, std::string> cache_;
};


// Asks the candidate itself: GET http://<ip>:<port>/cdn-cgi/trace and maps the
// reported colo (IATA airport code) to its country.
class TraceColoResolver : public CountryResolver {
public:
explicit TraceColoResolver(int port = 80, int timeout_ms = 3000, DiagLogger* diag = nullptr);
std::string resolve(const std::string& ip) override;

static std::optional<std::string> parse_colo(const std::string& body);
static std::string colo_to_country(const std::string& colo);

private:
int port_;
int timeout_ms_;
DiagLogger* diag_;
};


// Offline "CIDR COUNTRY" table; the longest matching prefix wins.
class TableCountryResolver : public CountryResolver {
public:
void add(const net::Cidr& block, const std::string& country);
std::string resolve(const std::string& ip) override;
std::size_t size() const { return entries_.size(); }

// Throws std::runtime_error if the file cannot be read or a line is malformed.
static TableCountryResolver load_file(const std::string& path);
static TableCountryResolver parse(const std::string& text);

private:
struct Entry {
net::Cidr block;
std::string country;
};
std::vector<Entry> entries_;
};
} // namespace relay
