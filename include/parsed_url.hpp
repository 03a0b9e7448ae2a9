// ===================== include/parsed_url.hpp =====================
#pragma once
#include <string>

namespace relay
{
    class ParsedURL
    {
    public:
        std::string scheme; // "http" or "https"
        std::string host;   // e.g., "raw.githubusercontent.com"
        int port = 80;      // explicit ":port" or the scheme default
        std::string path;   // e.g., "/ipverse/asn-ip/master/as/13335/ipv4-aggregated.txt"

        // Throws std::invalid_argument for unsupported schemes or bad ports.
        explicit ParsedURL(const std::string &url);
        std::string toGetRequestString() const;
        bool isHttps() const { return scheme == "https"; }
    };
} // namespace relay
