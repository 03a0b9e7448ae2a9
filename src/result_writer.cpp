#include "result_writer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace relay {

static std::string wall_ts() {
    auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string format_result_line(const ProbeResult& r) {
    return r.address + ":" + std::to_string(r.port) + "#" + r.country + " " +
           std::to_string(static_cast<long>(std::lround(r.latency_ms))) + "ms";
}

std::optional<ProbeResult> parse_result_line(const std::string& line) {
    static const std::regex re(R"(^\s*(\d{1,3}(?:\.\d{1,3}){3}):(\d{1,5})#([A-Z]{2})\s+(?:\S+\s+)?(\d+(?:\.\d+)?)ms\s*$)");
    std::smatch m;
    if (!std::regex_match(line, m, re))
        return std::nullopt;
    ProbeResult r;
    r.address = m[1].str();
    r.port = std::stoi(m[2].str());
    r.country = m[3].str();
    r.latency_ms = std::stod(m[4].str());
    if (r.port < 1 || r.port > 65535)
        return std::nullopt;
    return r;
}

static std::vector<std::string> ordered_countries(const Buckets& buckets,
                                                  const std::vector<std::string>& order) {
    std::vector<std::string> out;
    std::set<std::string> listed;
    for (const auto& c : order) {
        if (listed.insert(c).second)
            out.push_back(c);
    }
    for (const auto& kv : buckets)
        if (!listed.count(kv.first))
            out.push_back(kv.first);
    return out;
}

static std::ofstream open_out(const fs::path& p) {
    std::ofstream out(p, std::ios::trunc);
    if (!out)
        throw std::runtime_error("cannot write " + p.string());
    return out;
}

static void write_summary(const fs::path& dir, const Buckets& buckets,
                          const std::vector<std::string>& countries, const std::string& title) {
    std::ofstream out = open_out(dir / "summary.txt");
    out << "# " << title << "\n";
    out << "# generated: " << wall_ts() << "\n\n";

    std::size_t total = 0;
    for (const auto& c : countries) {
        auto it = buckets.find(c);
        if (it == buckets.end() || it->second.empty())
            continue;
        double sum = 0;
        for (const auto& r : it->second)
            sum += r.latency_ms;
        total += it->second.size();
        out << c << ": " << it->second.size() << " IPs, avg latency "
            << std::fixed << std::setprecision(1) << sum / it->second.size() << "ms\n";
    }
    out << "\ntotal: " << total << " IPs\n";
    if (!out)
        throw std::runtime_error("write failed: " + (dir / "summary.txt").string());
}

std::vector<std::string> write_results(const std::string& dir, const Buckets& buckets,
                                       const std::vector<std::string>& order) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        throw std::runtime_error("cannot create output directory " + dir + ": " + ec.message());

    std::vector<std::string> written;
    const auto countries = ordered_countries(buckets, order);
    for (const auto& c : countries) {
        auto it = buckets.find(c);
        if (it == buckets.end() || it->second.empty())
            continue;
        const fs::path path = fs::path(dir) / (c + "_ips.txt");
        std::ofstream out = open_out(path);
        for (const auto& r : it->second)
            out << format_result_line(r) << "\n";
        if (!out)
            throw std::runtime_error("write failed: " + path.string());
        written.push_back(path.string());
    }
    write_summary(dir, buckets, countries, "relay_scan results");
    return written;
}

Buckets merge_result_dirs(const std::vector<std::string>& input_dirs, const std::string& output_dir) {
    Buckets merged;
    std::set<std::string> seen; // "ip:port"

    for (const auto& dir : input_dirs) {
        if (!fs::is_directory(dir))
            throw std::runtime_error("not a directory: " + dir);

        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(dir)) {
            const std::string name = entry.path().filename().string();
            if (entry.is_regular_file() && name.size() > 8 &&
                name.compare(name.size() - 8, 8, "_ips.txt") == 0)
                files.push_back(entry.path());
        }
        std::sort(files.begin(), files.end());

        for (const auto& path : files) {
            std::ifstream in(path);
            if (!in)
                throw std::runtime_error("cannot read " + path.string());
            std::string line;
            while (std::getline(in, line)) {
                if (line.empty() || line[0] == '#')
                    continue;
                auto r = parse_result_line(line);
                if (!r)
                    continue;
                if (!seen.insert(r->address + ":" + std::to_string(r->port)).second)
                    continue;
                merged[r->country].push_back(std::move(*r));
            }
        }
    }

    for (auto& kv : merged) {
        std::stable_sort(kv.second.begin(), kv.second.end(),
                         [](const ProbeResult& a, const ProbeResult& b) { return a.latency_ms < b.latency_ms; });
    }

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec)
        throw std::runtime_error("cannot create output directory " + output_dir + ": " + ec.message());

    std::vector<std::string> countries;
    for (const auto& kv : merged) {
        countries.push_back(kv.first);
        const fs::path path = fs::path(output_dir) / (kv.first + "_ips.txt");
        std::ofstream out = open_out(path);
        out << "# " << kv.first << " merged results\n";
        out << "# generated: " << wall_ts() << "\n";
        out << "# count: " << kv.second.size() << "\n";
        out << "# source dirs: " << input_dirs.size() << "\n\n";
        for (const auto& r : kv.second)
            out << format_result_line(r) << "\n";
        if (!out)
            throw std::runtime_error("write failed: " + path.string());
    }
    write_summary(output_dir, merged, countries, "relay_merge results");
    return merged;
}

} // namespace relay
