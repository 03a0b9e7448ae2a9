#pragma once
#include "probe_scheduler.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relay {

enum class ResolverKind {
    IpApi, // ip-api.com lookup
    Trace, // candidate's own /cdn-cgi/trace colo
    Table, // offline CIDR table
};

// Everything relay_scan is told on its command line.
struct RunOptions {
    RunConfig run;

    std::vector<std::string> sources; // builtin names, URLs, file paths
    std::size_t per_cidr = 0;         // 0 = per-source default
    std::size_t pool_limit = 0;       // 0 = unlimited
    int fetch_timeout_ms = 30000;

    ResolverKind resolver = ResolverKind::IpApi;
    std::string table_path;
    int resolver_timeout_ms = 3000;
    int trace_port = 80;

    std::string output_dir = "ip_results";
    std::string log_path;
    std::optional<uint32_t> seed;
    bool ci = false;
    bool show_help = false;
};

// Defaults of the scan profile; `ci` selects the reduced source list and
// pool limit used on hosted runners.
RunOptions default_options(bool ci);

// Parses "--name=value" flags on top of default_options(ci). Throws
// std::invalid_argument naming the offending flag.
RunOptions parse_args(const std::vector<std::string>& args, bool ci);

std::string usage(const std::string& argv0);

// "a,b,,c" -> {"a","b","c"} (whitespace trimmed, empties dropped)
std::vector<std::string> split_list(const std::string& s);

} // namespace relay
