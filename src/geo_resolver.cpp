//// ===================== File: src/geo_resolver.cpp =====================
#include "geo_resolver.hpp"
#include "diag_logger.hpp"
#include "http_client.hpp"
#include "probe_result.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace relay
{
    static std::string upper(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    // ---------------------------------------------------------------- ip-api

    IpApiCountryResolver::IpApiCountryResolver(int timeout_ms, DiagLogger *diag)
        : timeout_ms_(timeout_ms), diag_(diag) {}

    std::optional<std::string> IpApiCountryResolver::parse_body(const std::string &body)
    {
        if (body.find("\"status\":\"success\"") == std::string::npos)
            return std::nullopt;

        std::smatch m;
        static const std::regex code_re("\"countryCode\":\"([A-Za-z]{2})\"");
        if (!std::regex_search(body, m, code_re))
            return std::nullopt;
        return upper(m[1].str());
    }

    std::string IpApiCountryResolver::resolve(const std::string &ip)
    {
        {
            std::lock_guard<std::mutex> lock(mu_);
            auto it = cache_.find(ip);
            if (it != cache_.end())
                return it->second;
        }

        // Example: GET /json/8.8.8.8?fields=status,countryCode
        const std::string url = "http://ip-api.com/json/" + ip + "?fields=status,countryCode";
        std::string country = kUnknownCountry;
        try
        {
            HttpResponse resp = HttpClient::get(url, timeout_ms_, diag_);
            if (resp.status == 200)
            {
                if (auto code = parse_body(resp.body))
                    country = *code;
            }
            else
            {
                diag_log(diag_, "RESOLVE_FAIL ip=" + ip + " http_status=" + std::to_string(resp.status));
            }
        }
        catch (const std::exception &e)
        {
            diag_log(diag_, "RESOLVE_FAIL ip=" + ip + " err=" + e.what());
            return kUnknownCountry;
        }

        std::lock_guard<std::mutex> lock(mu_);
        cache_.emplace(ip, country);
        return country;
    }

    // ---------------------------------------------------------------- cdn-cgi/trace

    TraceColoResolver::TraceColoResolver(int port, int timeout_ms, DiagLogger *diag)
        : port_(port), timeout_ms_(timeout_ms), diag_(diag) {}

    std::optional<std::string> TraceColoResolver::parse_colo(const std::string &body)
    {
        std::istringstream in(body);
        std::string line;
        while (std::getline(in, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.rfind("colo=", 0) == 0 && line.size() > 5)
                return upper(line.substr(5));
        }
        return std::nullopt;
    }

    std::string TraceColoResolver::colo_to_country(const std::string &colo)
    {
        static const std::unordered_map<std::string, std::string> table = {
            // United States
            {"ATL", "US"}, {"BOS", "US"}, {"BUF", "US"}, {"CHI", "US"}, {"DEN", "US"},
            {"DFW", "US"}, {"EWR", "US"}, {"IAD", "US"}, {"LAS", "US"}, {"LAX", "US"},
            {"MIA", "US"}, {"MSP", "US"}, {"ORD", "US"}, {"PDX", "US"}, {"PHX", "US"},
            {"SAN", "US"}, {"SEA", "US"}, {"SJC", "US"}, {"STL", "US"}, {"IAH", "US"},
            {"HKG", "HK"}, {"TPE", "TW"},
            {"NRT", "JP"}, {"KIX", "JP"}, {"ITM", "JP"},
            {"ICN", "KR"}, {"GMP", "KR"},
            {"SIN", "SG"},
            {"LHR", "GB"}, {"MAN", "GB"}, {"EDI", "GB"},
            {"FRA", "DE"}, {"DUS", "DE"}, {"HAM", "DE"}, {"MUC", "DE"},
            {"CDG", "FR"}, {"MRS", "FR"},
            {"AMS", "NL"},
            {"SYD", "AU"}, {"MEL", "AU"}, {"PER", "AU"}, {"BNE", "AU"},
            {"YYZ", "CA"}, {"YVR", "CA"}, {"YUL", "CA"},
            {"GRU", "BR"}, {"GIG", "BR"},
            {"BOM", "IN"}, {"DEL", "IN"},
            {"MAD", "ES"}, {"MXP", "IT"}, {"ARN", "SE"}, {"CPH", "DK"},
            {"WAW", "PL"}, {"PRG", "CZ"}, {"VIE", "AT"}, {"ZRH", "CH"},
        };
        auto it = table.find(upper(colo.substr(0, 3)));
        return it == table.end() ? kUnknownCountry : it->second;
    }

    std::string TraceColoResolver::resolve(const std::string &ip)
    {
        const std::string url = "http://" + ip + ":" + std::to_string(port_) + "/cdn-cgi/trace";
        try
        {
            HttpResponse resp = HttpClient::get(url, timeout_ms_, diag_);
            if (resp.status != 200)
            {
                diag_log(diag_, "RESOLVE_FAIL ip=" + ip + " http_status=" + std::to_string(resp.status));
                return kUnknownCountry;
            }
            auto colo = parse_colo(resp.body);
            if (!colo)
            {
                diag_log(diag_, "RESOLVE_FAIL ip=" + ip + " err=no colo in trace");
                return kUnknownCountry;
            }
            return colo_to_country(*colo);
        }
        catch (const std::exception &e)
        {
            diag_log(diag_, "RESOLVE_FAIL ip=" + ip + " err=" + e.what());
            return kUnknownCountry;
        }
    }

    // ---------------------------------------------------------------- offline table

    void TableCountryResolver::add(const net::Cidr &block, const std::string &country)
    {
        entries_.push_back(Entry{block, upper(country)});
    }

    std::string TableCountryResolver::resolve(const std::string &ip)
    {
        auto addr = net::parse_ipv4(ip);
        if (!addr)
            return kUnknownCountry;

        const Entry *best = nullptr;
        for (const auto &e : entries_)
        {
            if (e.block.contains(*addr) && (!best || e.block.prefix > best->block.prefix))
                best = &e;
        }
        return best ? best->country : kUnknownCountry;
    }

    TableCountryResolver TableCountryResolver::parse(const std::string &text)
    {
        TableCountryResolver table;
        std::istringstream in(text);
        std::string line;
        int lineno = 0;
        while (std::getline(in, line))
        {
            ++lineno;
            line = line.substr(0, line.find('#'));
            std::istringstream fields(line);
            std::string cidr, country;
            if (!(fields >> cidr))
                continue;
            auto block = net::parse_cidr(cidr);
            if (!block || !(fields >> country) || country.size() != 2)
                throw std::runtime_error("bad country table line " + std::to_string(lineno) + ": " + line);
            table.add(*block, country);
        }
        return table;
    }

    TableCountryResolver TableCountryResolver::load_file(const std::string &path)
    {
        std::ifstream in(path);
        if (!in)
            throw std::runtime_error("cannot open country table: " + path);
        std::ostringstream ss;
        ss << in.rdbuf();
        return parse(ss.str());
    }
} // namespace relay
