#include "run_options.hpp"
#include "ip_sources.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace relay {

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string item;
    while (std::getline(in, item, ',')) {
        size_t b = item.find_first_not_of(" \t");
        if (b == std::string::npos)
            continue;
        size_t e = item.find_last_not_of(" \t");
        out.push_back(item.substr(b, e - b + 1));
    }
    return out;
}

static long long parse_int(const std::string& flag, const std::string& v, long long lo, long long hi) {
    if (v.empty() || v.find_first_not_of("-0123456789") != std::string::npos)
        throw std::invalid_argument("bad value for " + flag + ": '" + v + "'");
    long long n = 0;
    try {
        n = std::stoll(v);
    } catch (const std::exception&) {
        throw std::invalid_argument("bad value for " + flag + ": '" + v + "'");
    }
    if (n < lo || n > hi)
        throw std::invalid_argument(flag + " out of range: " + v);
    return n;
}

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Built-in quota profile; countries without an entry default to 3.
static int default_count(const std::string& country) {
    if (country == "US" || country == "HK") return 20;
    if (country == "JP" || country == "SG") return 5;
    return 3;
}

RunOptions default_options(bool ci) {
    RunOptions o;
    o.ci = ci;
    o.run.target_countries = {"US", "HK", "JP", "SG"};
    for (const auto& c : o.run.target_countries)
        o.run.counts_per_country[c] = default_count(c);
    o.run.max_concurrent = 30;
    o.run.ports = {8443};
    o.run.timeout = std::chrono::milliseconds(5000);
    o.run.max_latency_ms = 2000;
    o.run.max_candidates_scanned = 0;
    o.run.progress_every = 100;
    o.sources = default_source_names(ci);
    o.pool_limit = default_pool_limit(ci);
    o.fetch_timeout_ms = ci ? 10000 : 30000;
    return o;
}

RunOptions parse_args(const std::vector<std::string>& args, bool ci) {
    RunOptions o = default_options(ci);
    std::optional<std::vector<std::string>> countries;
    std::optional<std::vector<std::string>> counts;
    bool sources_given = false;
    const long long int_max = std::numeric_limits<int>::max();

    for (const auto& a : args) {
        if (a == "-h" || a == "--help") {
            o.show_help = true;
            continue;
        }
        auto eq = a.find('=');
        if (a.rfind("--", 0) != 0 || eq == std::string::npos)
            throw std::invalid_argument("unrecognised argument: " + a);
        const std::string key = a.substr(0, eq);
        const std::string val = a.substr(eq + 1);

        if (key == "--countries") {
            countries = split_list(val);
        } else if (key == "--counts") {
            counts = split_list(val);
        } else if (key == "--concurrency") {
            o.run.max_concurrent = static_cast<int>(parse_int(key, val, 1, 4096));
        } else if (key == "--ports") {
            o.run.ports.clear();
            for (const auto& p : split_list(val))
                o.run.ports.push_back(static_cast<int>(parse_int(key, p, 1, 65535)));
        } else if (key == "--timeout-ms") {
            o.run.timeout = std::chrono::milliseconds(parse_int(key, val, 1, int_max));
        } else if (key == "--max-latency-ms") {
            o.run.max_latency_ms = static_cast<double>(parse_int(key, val, 0, int_max));
        } else if (key == "--max-ips") {
            o.run.max_candidates_scanned = parse_int(key, val, 0, std::numeric_limits<int64_t>::max());
        } else if (key == "--port-policy") {
            if (val == "first")
                o.run.port_policy = PortPolicy::FirstSuccess;
            else if (val == "all")
                o.run.port_policy = PortPolicy::AllMustSucceed;
            else
                throw std::invalid_argument("bad port policy: " + val);
        } else if (key == "--progress-every") {
            o.run.progress_every = static_cast<std::size_t>(parse_int(key, val, 0, int_max));
        } else if (key == "--sources") {
            if (!sources_given)
                o.sources.clear();
            sources_given = true;
            for (const auto& s : split_list(val))
                o.sources.push_back(s);
        } else if (key == "--source-file") {
            if (!sources_given)
                o.sources.clear();
            sources_given = true;
            if (val.empty())
                throw std::invalid_argument("empty --source-file");
            o.sources.push_back(val);
        } else if (key == "--per-cidr") {
            o.per_cidr = static_cast<std::size_t>(parse_int(key, val, 1, 1 << 20));
        } else if (key == "--pool-limit") {
            o.pool_limit = static_cast<std::size_t>(parse_int(key, val, 0, int_max));
        } else if (key == "--fetch-timeout-ms") {
            o.fetch_timeout_ms = static_cast<int>(parse_int(key, val, 1, int_max));
        } else if (key == "--resolver") {
            if (val == "ipapi") {
                o.resolver = ResolverKind::IpApi;
            } else if (val == "trace") {
                o.resolver = ResolverKind::Trace;
            } else if (val.rfind("table:", 0) == 0 && val.size() > 6) {
                o.resolver = ResolverKind::Table;
                o.table_path = val.substr(6);
            } else {
                throw std::invalid_argument("bad resolver: " + val);
            }
        } else if (key == "--resolver-timeout-ms") {
            o.resolver_timeout_ms = static_cast<int>(parse_int(key, val, 1, int_max));
        } else if (key == "--trace-port") {
            o.trace_port = static_cast<int>(parse_int(key, val, 1, 65535));
        } else if (key == "--output") {
            if (val.empty())
                throw std::invalid_argument("empty --output");
            o.output_dir = val;
        } else if (key == "--log") {
            o.log_path = val;
        } else if (key == "--seed") {
            o.seed = static_cast<uint32_t>(parse_int(key, val, 0, std::numeric_limits<uint32_t>::max()));
        } else {
            throw std::invalid_argument("unknown flag: " + key);
        }
    }

    if (countries) {
        o.run.target_countries.clear();
        for (const auto& c : *countries)
            o.run.target_countries.push_back(upper(c));
    }
    if (countries || counts) {
        o.run.counts_per_country.clear();
        if (counts && counts->size() != o.run.target_countries.size())
            throw std::invalid_argument("--countries and --counts have different lengths");
        for (std::size_t i = 0; i < o.run.target_countries.size(); ++i) {
            const auto& c = o.run.target_countries[i];
            o.run.counts_per_country[c] =
                counts ? static_cast<int>(parse_int("--counts", (*counts)[i], 0, int_max)) : default_count(c);
        }
    }
    if (o.sources.empty())
        throw std::invalid_argument("no candidate sources");
    return o;
}

std::string usage(const std::string& argv0) {
    std::ostringstream u;
    u << "Usage:\n"
      << "  " << argv0 << " [--countries=US,HK,JP,SG] [--counts=20,20,5,5] [--ports=8443]\n"
      << "        [--concurrency=30] [--timeout-ms=5000] [--max-latency-ms=2000] [--max-ips=0]\n"
      << "        [--port-policy=first|all] [--sources=NAME|URL,...] [--source-file=PATH]\n"
      << "        [--per-cidr=N] [--pool-limit=N] [--resolver=ipapi|trace|table:PATH]\n"
      << "        [--output=ip_results] [--log=PATH] [--seed=N] [--progress-every=100]\n"
      << "\nBuilt-in sources:";
    for (const auto& s : builtin_sources())
        u << ' ' << s.name;
    u << "\n\nNotes:\n"
      << "  - --max-ips caps how many candidates are probed (0 = no cap).\n"
      << "  - --port-policy=all requires every port to connect; latency is the worst port.\n"
      << "  - GITHUB_ACTIONS=true switches to the reduced CI source list.\n";
    return u.str();
}

} // namespace relay
