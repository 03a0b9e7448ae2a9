#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>

namespace relay {

// Supplies addresses to probe. An empty batch means the source is exhausted.
class CandidateSource {
public:
    virtual ~CandidateSource() = default;
    virtual std::vector<std::string> next_batch(std::size_t n) = 0;
};

// Fixed, already deduplicated address list handed out in order.
class ListCandidateSource : public CandidateSource {
public:
    explicit ListCandidateSource(std::vector<std::string> addresses);
    std::vector<std::string> next_batch(std::size_t n) override;
    std::size_t size() const { return addresses_.size(); }

private:
    std::mutex mu_;
    std::vector<std::string> addresses_;
    std::size_t next_ = 0;
};

// Address part of one source line: "ip", "ip:port", "ip#comment", "ip:port#comment".
// CIDR lines and garbage return nullopt, as does a line whose explicit port is
// not one of `ports` (an empty list admits any port).
std::optional<std::string> parse_address_line(const std::string& line,
                                              const std::vector<int>& ports = {});

struct ParseStats {
    std::size_t addresses = 0;
    std::size_t cidrs = 0;
    std::size_t unroutable = 0;
    std::size_t skipped = 0;
};

// Accumulates candidates from several sources with set semantics, keeping
// first-seen order. Unroutable addresses are dropped. Once `limit` addresses
// are held (0 = no limit) further input is ignored.
class CandidatePool {
public:
    explicit CandidatePool(std::size_t limit = 0) : limit_(limit) {}

    bool add(const std::string& address);

    // One address or CIDR per line; each CIDR contributes up to per_cidr
    // randomly chosen hosts. "ip:port" lines for a port outside `ports`
    // count as skipped.
    ParseStats add_text(const std::string& text, std::size_t per_cidr, std::mt19937& rng,
                        const std::vector<int>& ports = {});

    std::size_t size() const { return order_.size(); }
    bool full() const { return limit_ != 0 && order_.size() >= limit_; }

    // Shuffled copy of the pool.
    std::vector<std::string> shuffled(std::mt19937& rng) const;
    const std::vector<std::string>& addresses() const { return order_; }

private:
    std::size_t limit_;
    std::vector<std::string> order_;
    std::unordered_set<std::string> seen_;
};

} // namespace relay
