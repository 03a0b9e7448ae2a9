#include "candidate_source.hpp"
#include "utils_net.hpp"

#include <algorithm>
#include <sstream>

namespace relay {

ListCandidateSource::ListCandidateSource(std::vector<std::string> addresses)
    : addresses_(std::move(addresses)) {}

std::vector<std::string> ListCandidateSource::next_batch(std::size_t n) {
    std::lock_guard<std::mutex> lock(mu_);
    std::size_t end = next_ + std::min(n, addresses_.size() - next_);
    std::vector<std::string> out(addresses_.begin() + next_, addresses_.begin() + end);
    next_ = end;
    return out;
}

static std::string strip(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::optional<std::string> parse_address_line(const std::string& line, const std::vector<int>& ports) {
    std::string main = strip(line.substr(0, line.find('#')));
    if (main.empty() || main.find('/') != std::string::npos)
        return std::nullopt;

    size_t colon = main.find(':');
    if (colon != std::string::npos) {
        const std::string port = main.substr(colon + 1);
        if (port.empty() || port.size() > 5 || port.find_first_not_of("0123456789") != std::string::npos)
            return std::nullopt;
        int p = std::stoi(port);
        if (p < 1 || p > 65535)
            return std::nullopt;
        if (!ports.empty() && std::find(ports.begin(), ports.end(), p) == ports.end())
            return std::nullopt;
        main = main.substr(0, colon);
    }
    auto ip = net::parse_ipv4(main);
    if (!ip)
        return std::nullopt;
    return net::format_ipv4(*ip);
}

bool CandidatePool::add(const std::string& address) {
    if (full())
        return false;
    if (!seen_.insert(address).second)
        return false;
    order_.push_back(address);
    return true;
}

ParseStats CandidatePool::add_text(const std::string& text, std::size_t per_cidr, std::mt19937& rng,
                                   const std::vector<int>& ports) {
    ParseStats st;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line) && !full()) {
        std::string s = strip(line);
        if (s.empty() || s[0] == '#')
            continue;

        if (s.find('/') != std::string::npos) {
            auto block = net::parse_cidr(strip(s.substr(0, s.find('#'))));
            if (!block) {
                st.skipped++;
                continue;
            }
            st.cidrs++;
            for (uint32_t ip : net::sample_hosts(*block, per_cidr, rng)) {
                if (net::is_unroutable_ipv4(ip)) {
                    st.unroutable++;
                    continue;
                }
                if (add(net::format_ipv4(ip)))
                    st.addresses++;
            }
            continue;
        }

        auto addr = parse_address_line(s, ports);
        if (!addr) {
            st.skipped++;
            continue;
        }
        if (net::is_unroutable_ipv4(*net::parse_ipv4(*addr))) {
            st.unroutable++;
            continue;
        }
        if (add(*addr))
            st.addresses++;
    }
    return st;
}

std::vector<std::string> CandidatePool::shuffled(std::mt19937& rng) const {
    std::vector<std::string> out = order_;
    std::shuffle(out.begin(), out.end(), rng);
    return out;
}

} // namespace relay
