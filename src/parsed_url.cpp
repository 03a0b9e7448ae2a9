// ===================== src/parsed_url.cpp =====================
#include "parsed_url.hpp"
#include <stdexcept>

namespace relay
{
    ParsedURL::ParsedURL(const std::string &url)
    {
        scheme = "http"; // default
        path = "/";

        size_t scheme_end = url.find("://");
        size_t host_start = 0;
        if (scheme_end != std::string::npos)
        {
            scheme = url.substr(0, scheme_end);
            host_start = scheme_end + 3;
        }
        if (scheme != "http" && scheme != "https")
            throw std::invalid_argument("unsupported URL scheme: " + scheme);

        std::string authority;
        size_t path_start = url.find('/', host_start);
        if (path_start != std::string::npos)
        {
            authority = url.substr(host_start, path_start - host_start);
            path = url.substr(path_start);
        }
        else
        {
            authority = url.substr(host_start);
        }

        port = isHttps() ? 443 : 80;
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos)
        {
            const std::string digits = authority.substr(colon + 1);
            if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos ||
                digits.size() > 5)
                throw std::invalid_argument("bad port in URL: " + url);
            port = std::stoi(digits);
            if (port < 1 || port > 65535)
                throw std::invalid_argument("bad port in URL: " + url);
            authority = authority.substr(0, colon);
        }
        host = authority;
        if (host.empty())
            throw std::invalid_argument("URL has no host: " + url);
    }

    std::string ParsedURL::toGetRequestString() const
    {
        const bool default_port = (isHttps() && port == 443) || (!isHttps() && port == 80);
        const std::string host_header = default_port ? host : host + ":" + std::to_string(port);
        return std::string("GET ") + path + " HTTP/1.1\r\n" +
               "Host: " + host_header + "\r\n" +
               "User-Agent: relay_scan/1.0\r\n" +
               "Accept: */*\r\n" +
               "Connection: close\r\n\r\n";
    }
} // namespace relay
