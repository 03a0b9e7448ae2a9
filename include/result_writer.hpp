#pragma once
#include "result_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace relay {

// One line of a <CC>_ips.txt file: "ip:port#CC 123ms".
std::string format_result_line(const ProbeResult& r);
std::optional<ProbeResult> parse_result_line(const std::string& line);

// Writes <dir>/<CC>_ips.txt for every non-empty bucket (countries listed in
// `order` first, then any others) and <dir>/summary.txt. Creates `dir` if
// needed. Throws std::runtime_error on I/O failure. Returns files written.
std::vector<std::string> write_results(const std::string& dir, const Buckets& buckets,
                                       const std::vector<std::string>& order);

// Reads every *_ips.txt under each input dir, drops repeats of the same
// ip:port, sorts each country by latency and writes the merged set to
// `output_dir`. Returns the merged buckets.
Buckets merge_result_dirs(const std::vector<std::string>& input_dirs, const std::string& output_dir);

} // namespace relay
