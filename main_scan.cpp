/**
 * # build the scanner
 * cmake -S . -B build && cmake --build build
 * ./build/relay_scan --countries=US,JP --counts=5,5 --ports=443,8443
 *
 * Examples with options:
 *   ./build/relay_scan --sources=official,as13335 --max-ips=2000 --log=diag_scan.txt
 *   ./build/relay_scan --source-file=ips.txt --resolver=table:geo.txt --output=out
 */

#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "candidate_source.hpp"
#include "diag_logger.hpp"
#include "geo_resolver.hpp"
#include "ip_sources.hpp"
#include "probe_scheduler.hpp"
#include "prober.hpp"
#include "result_writer.hpp"
#include "run_options.hpp"

using namespace std;
using namespace relay;

static string join(const vector<string> &v, const string &sep) {
    string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

static void print_config(const RunOptions &o) {
    cout << "Target countries: ";
    for (size_t i = 0; i < o.run.target_countries.size(); ++i) {
        const auto &c = o.run.target_countries[i];
        auto it = o.run.counts_per_country.find(c);
        cout << (i ? ", " : "") << c << "=" << (it == o.run.counts_per_country.end() ? 0 : it->second);
    }
    vector<string> ports;
    for (int p : o.run.ports) ports.push_back(to_string(p));
    cout << "\nPorts: " << join(ports, ",")
         << " (" << (o.run.port_policy == PortPolicy::FirstSuccess ? "first success" : "all must succeed") << ")"
         << "\nConcurrency: " << o.run.max_concurrent
         << ", timeout " << o.run.timeout.count() << " ms"
         << ", max latency " << o.run.max_latency_ms << " ms"
         << ", max IPs " << (o.run.max_candidates_scanned ? to_string(o.run.max_candidates_scanned) : "unlimited")
         << "\nSources: " << join(o.sources, ",") << (o.ci ? " (CI profile)" : "")
         << '\n' << string(50, '-') << '\n';
}

static unique_ptr<CountryResolver> make_resolver(const RunOptions &o, DiagLogger *diag) {
    switch (o.resolver) {
    case ResolverKind::Trace:
        return make_unique<TraceColoResolver>(o.trace_port, o.resolver_timeout_ms, diag);
    case ResolverKind::Table:
        return make_unique<TableCountryResolver>(TableCountryResolver::load_file(o.table_path));
    case ResolverKind::IpApi:
        break;
    }
    return make_unique<IpApiCountryResolver>(o.resolver_timeout_ms, diag);
}

static CandidatePool build_pool(const RunOptions &o, mt19937 &rng, DiagLogger *diag) {
    CandidatePool pool(o.pool_limit);
    for (const auto &src : o.sources) {
        if (pool.full()) {
            cout << "Candidate pool reached " << pool.size() << " addresses, skipping remaining sources\n";
            break;
        }
        cout << "Fetching " << src << " ..." << flush;
        try {
            string text = load_source_text(src, o.fetch_timeout_ms, diag);
            const NamedSource *named = find_builtin_source(src);
            size_t per_cidr = o.per_cidr ? o.per_cidr : (named ? named->per_cidr : 10);
            ParseStats st = pool.add_text(text, per_cidr, rng, o.run.ports);
            cout << " +" << st.addresses << " (cidrs " << st.cidrs << ", skipped " << st.skipped
                 << ", unroutable " << st.unroutable << "), pool " << pool.size() << '\n';
        } catch (const exception &e) {
            cout << " failed\n";
            cerr << "Warning: source " << src << ": " << e.what() << '\n';
            diag_log(diag, "SOURCE_FAIL name=" + src + " err=" + e.what());
        }
    }
    return pool;
}

static void print_report(const RunOptions &o, const RunReport &r) {
    cout << string(50, '-') << '\n'
         << "Stop reason: " << to_string(r.reason)
         << (r.all_satisfied ? " (all quotas met)" : " (quotas not met)") << '\n'
         << "Scanned " << r.scanned << ", accepted " << r.accepted << ", rejected " << r.rejected
         << ", discarded " << r.discarded << ", failed " << r.failed
         << " in " << fixed << setprecision(1) << r.elapsed_ms() / 1000.0 << " s\n";
    if (!r.failures.empty()) {
        cout << "Failures:";
        for (const auto &kv : r.failures) cout << ' ' << kv.first << '=' << kv.second;
        cout << '\n';
    }
    for (const auto &c : o.run.target_countries) {
        auto it = r.buckets.find(c);
        size_t n = it == r.buckets.end() ? 0 : it->second.size();
        int want = o.run.counts_per_country.at(c);
        cout << "  " << (static_cast<int>(n) >= want ? "[done] " : "[    ] ") << c << ": " << n << "/" << want;
        if (n > 0) {
            double sum = 0;
            for (const auto &pr : it->second) sum += pr.latency_ms;
            cout << ", best " << setprecision(1) << it->second.front().latency_ms
                 << " ms, avg " << sum / n << " ms";
        }
        cout << '\n';
    }
}

int main(int argc, char *argv[]) {
    ios::sync_with_stdio(false);

    RunOptions opts;
    try {
        opts = parse_args(vector<string>(argv + 1, argv + argc), running_in_ci());
        validate(opts.run);
    } catch (const exception &e) {
        cerr << e.what() << "\n";
        cerr << usage(argv[0]);
        return 1;
    }
    if (opts.show_help) {
        cout << usage(argv[0]);
        return 0;
    }

    print_config(opts);

    // Optional diagnostics
    DiagLogger diag(opts.log_path);
    DiagLogger *dptr = (diag.ok() && !opts.log_path.empty()) ? &diag : nullptr;
    if (!opts.log_path.empty() && !diag.ok()) {
        cerr << "Warning: couldn't open log file: " << opts.log_path << "\n";
    }

    try {
        unique_ptr<CountryResolver> resolver = make_resolver(opts, dptr);

        mt19937 rng(opts.seed ? *opts.seed : random_device{}());
        CandidatePool pool = build_pool(opts, rng, dptr);
        ListCandidateSource source(pool.shuffled(rng));
        cout << "Probing up to " << source.size() << " candidates\n";

        TcpConnectProber prober(dptr);
        ProbeScheduler scheduler(opts.run, source, prober, *resolver, dptr);

        mutex out_mu;
        scheduler.on_progress([&](const Progress &p) {
            lock_guard<mutex> lock(out_mu);
            cout << "  scanned " << p.scanned << ", done " << p.completed << ", ok " << p.accepted
                 << ", failed " << p.failed << " |";
            for (const auto &c : opts.run.target_countries)
                cout << ' ' << c << ' ' << scheduler.quota().accepted(c) << '/' << scheduler.quota().target(c);
            cout << '\n' << flush;
        });

        RunReport report = scheduler.run();
        print_report(opts, report);

        auto files = write_results(opts.output_dir, report.buckets, opts.run.target_countries);
        cout << "Wrote " << files.size() << " country file(s) and summary.txt to " << opts.output_dir << '\n';
        return 0;
    } catch (const SourceUnavailable &e) {
        cerr << "Error: " << e.what() << '\n';
        return 2;
    } catch (const exception &e) {
        cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
