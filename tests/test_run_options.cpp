#include "ip_sources.hpp"
#include "run_options.hpp"

#include <iostream>
#include <stdexcept>

using namespace relay;

static bool throws(const std::vector<std::string>& args) {
    try {
        parse_args(args, false);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

static int test_defaults() {
    RunOptions o = parse_args({}, false);
    if (o.run.target_countries != std::vector<std::string>{"US", "HK", "JP", "SG"})
        return 1;
    if (o.run.counts_per_country.at("US") != 20 || o.run.counts_per_country.at("SG") != 5)
        return 2;
    if (o.run.ports != std::vector<int>{8443} || o.run.max_concurrent != 30)
        return 3;
    if (o.run.timeout.count() != 5000 || o.run.max_latency_ms != 2000 || o.run.max_candidates_scanned != 0)
        return 4;
    if (o.pool_limit != 10000 || o.sources.size() != builtin_sources().size())
        return 5;
    if (o.output_dir != "ip_results" || o.resolver != ResolverKind::IpApi || o.seed)
        return 6;
    validate(o.run);

    RunOptions ci = parse_args({}, true);
    if (ci.pool_limit != 5000 || ci.sources.size() != 4 || ci.fetch_timeout_ms != 10000)
        return 7;
    return 0;
}

static int test_flags() {
    RunOptions o = parse_args({"--countries=us,de", "--counts=3,7", "--ports=443, 2053",
                               "--concurrency=8", "--timeout-ms=900", "--max-ips=500",
                               "--port-policy=all", "--sources=official", "--source-file=extra.txt",
                               "--resolver=table:geo.txt", "--output=out", "--seed=42",
                               "--max-latency-ms=0"},
                              false);
    if (o.run.target_countries != std::vector<std::string>{"US", "DE"})
        return 11;
    if (o.run.counts_per_country.at("DE") != 7 || o.run.counts_per_country.size() != 2)
        return 12;
    if (o.run.ports != std::vector<int>{443, 2053} || o.run.max_concurrent != 8)
        return 13;
    if (o.run.timeout.count() != 900 || o.run.max_candidates_scanned != 500 || o.run.max_latency_ms != 0)
        return 14;
    if (o.run.port_policy != PortPolicy::AllMustSucceed)
        return 15;
    if (o.sources != std::vector<std::string>{"official", "extra.txt"})
        return 16;
    if (o.resolver != ResolverKind::Table || o.table_path != "geo.txt")
        return 17;
    if (o.output_dir != "out" || !o.seed || *o.seed != 42)
        return 18;

    RunOptions d = parse_args({"--countries=FR,US"}, false);
    if (d.run.counts_per_country.at("FR") != 3 || d.run.counts_per_country.at("US") != 20)
        return 19;
    if (!parse_args({"--help"}, false).show_help)
        return 20;
    return 0;
}

static int test_errors() {
    if (!throws({"--countries=US,JP", "--counts=1"}))
        return 21;
    if (!throws({"--concurrency=0"}) || !throws({"--concurrency=abc"}))
        return 22;
    if (!throws({"--ports=70000"}) || !throws({"--port-policy=some"}))
        return 23;
    if (!throws({"--bogus=1"}) || !throws({"positional"}))
        return 24;
    if (!throws({"--resolver=table:"}) || !throws({"--output="}))
        return 25;

    // Zero quotas parse but fail validation before any probing.
    RunOptions zero = parse_args({"--countries=US", "--counts=0"}, false);
    try {
        validate(zero.run);
        return 26;
    } catch (const ConfigError&) {
    }
    return 0;
}

static int test_split_list() {
    if (split_list(" a, b,,c ,") != std::vector<std::string>{"a", "b", "c"})
        return 31;
    if (!split_list("").empty())
        return 32;
    return 0;
}

int main() {
    int (*tests[])() = {
        test_defaults,
        test_flags,
        test_errors,
        test_split_list,
    };
    for (auto t : tests) {
        int rc = t();
        if (rc != 0) {
            std::cerr << "run options test failed with code " << rc << "\n";
            return rc;
        }
    }
    std::cout << "run options tests passed\n";
    return 0;
}
