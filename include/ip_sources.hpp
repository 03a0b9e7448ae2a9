#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace relay {

class DiagLogger;

struct NamedSource {
    std::string name;
    std::string url;
    // Hosts sampled from each CIDR in this list; ASN aggregates are dense
    // so a few per block is plenty.
    std::size_t per_cidr;
};

const std::vector<NamedSource>& builtin_sources();
const NamedSource* find_builtin_source(const std::string& name);

// Published Cloudflare ranges, used when the "official" list cannot be fetched.
const std::string& official_fallback_cidrs();

// GITHUB_ACTIONS=true or RUNNER_ENVIRONMENT=github-hosted.
bool running_in_ci();

std::vector<std::string> default_source_names(bool ci);
std::size_t default_pool_limit(bool ci);

// Raw text of a source. `spec` is a builtin name, an http(s) URL, or a local
// file path. Throws std::runtime_error when the source cannot be read; a
// failed "official" download yields the compiled-in fallback instead.
std::string load_source_text(const std::string& spec, int timeout_ms, DiagLogger* diag);

} // namespace relay
