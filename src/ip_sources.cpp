#include "ip_sources.hpp"
#include "diag_logger.hpp"
#include "http_client.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace relay {

const std::vector<NamedSource>& builtin_sources() {
    static const std::vector<NamedSource> sources = {
        {"official", "https://www.cloudflare.com/ips-v4/", 10},
        {"cm", "https://raw.githubusercontent.com/cmliu/cmliu/main/CF-CIDR.txt", 10},
        {"bestali", "https://raw.githubusercontent.com/ymyuuu/IPDB/refs/heads/main/BestAli/bestaliv4.txt", 5},
        {"cfip", "https://raw.githubusercontent.com/qianxiu203/cfipcaiji/refs/heads/main/ip.txt", 5},
        {"as13335", "https://raw.githubusercontent.com/ipverse/asn-ip/master/as/13335/ipv4-aggregated.txt", 10},
        {"as209242", "https://raw.githubusercontent.com/ipverse/asn-ip/master/as/209242/ipv4-aggregated.txt", 10},
        {"as24429", "https://raw.githubusercontent.com/ipverse/asn-ip/master/as/24429/ipv4-aggregated.txt", 10},
        {"as35916", "https://raw.githubusercontent.com/ipverse/asn-ip/master/as/35916/ipv4-aggregated.txt", 10},
        {"as199524", "https://raw.githubusercontent.com/ipverse/asn-ip/master/as/199524/ipv4-aggregated.txt", 10},
        {"bestcfv4", "https://raw.githubusercontent.com/ymyuuu/IPDB/refs/heads/main/BestCF/bestcfv4.txt", 5},
    };
    return sources;
}

const NamedSource* find_builtin_source(const std::string& name) {
    for (const auto& s : builtin_sources())
        if (s.name == name)
            return &s;
    return nullptr;
}

const std::string& official_fallback_cidrs() {
    static const std::string cidrs =
        "173.245.48.0/20\n"
        "103.21.244.0/22\n"
        "103.22.200.0/22\n"
        "103.31.4.0/22\n"
        "141.101.64.0/18\n"
        "108.162.192.0/18\n"
        "190.93.240.0/20\n"
        "188.114.96.0/20\n"
        "197.234.240.0/22\n"
        "198.41.128.0/17\n"
        "162.158.0.0/15\n"
        "104.16.0.0/13\n"
        "104.24.0.0/14\n"
        "172.64.0.0/13\n"
        "131.0.72.0/22\n";
    return cidrs;
}

bool running_in_ci() {
    const char* gha = std::getenv("GITHUB_ACTIONS");
    const char* runner = std::getenv("RUNNER_ENVIRONMENT");
    return (gha && std::string(gha) == "true") ||
           (runner && std::string(runner) == "github-hosted");
}

std::vector<std::string> default_source_names(bool ci) {
    if (ci)
        return {"official", "as13335", "as209242", "cm"};
    std::vector<std::string> names;
    for (const auto& s : builtin_sources())
        names.push_back(s.name);
    return names;
}

std::size_t default_pool_limit(bool ci) {
    return ci ? 5000 : 10000;
}

static bool is_url(const std::string& s) {
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

std::string load_source_text(const std::string& spec, int timeout_ms, DiagLogger* diag) {
    const NamedSource* named = find_builtin_source(spec);
    if (!named && !is_url(spec)) {
        std::ifstream in(spec);
        if (!in)
            throw std::runtime_error("cannot open source file: " + spec);
        std::ostringstream ss;
        ss << in.rdbuf();
        diag_log(diag, "SOURCE file=" + spec + " bytes=" + std::to_string(ss.str().size()));
        return ss.str();
    }

    const std::string url = named ? named->url : spec;
    try {
        HttpResponse resp = HttpClient::get(url, timeout_ms, diag);
        if (resp.status != 200)
            throw std::runtime_error("GET " + url + " returned HTTP " + std::to_string(resp.status));
        diag_log(diag, "SOURCE name=" + spec + " bytes=" + std::to_string(resp.body.size()));
        return resp.body;
    } catch (const std::runtime_error& e) {
        if (named && named->name == "official") {
            diag_log(diag, "SOURCE_FALLBACK name=official err=" + std::string(e.what()));
            return official_fallback_cidrs();
        }
        throw;
    }
}

} // namespace relay
