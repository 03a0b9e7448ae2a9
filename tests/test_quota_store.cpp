#include "quota_tracker.hpp"
#include "result_store.hpp"

#include <atomic>
#include <iostream>
#include <thread>
#include <vector>

using namespace relay;

// `threads` callers race on one country; returns how many got a slot.
static int race(QuotaTracker& q, const std::string& country, int threads) {
    std::atomic<bool> go{false};
    std::atomic<int> wins{0};
    std::vector<std::thread> pool;
    for (int i = 0; i < threads; ++i) {
        pool.emplace_back([&] {
            while (!go.load())
                std::this_thread::yield();
            if (q.record(country))
                wins++;
        });
    }
    go = true;
    for (auto& t : pool)
        t.join();
    return wins.load();
}

static int test_quota_race() {
    for (int round = 0; round < 20; ++round) {
        QuotaTracker q({{"US", 1}, {"JP", 5}});
        if (race(q, "US", 16) != 1)
            return 1;
        if (race(q, "JP", 64) != 5)
            return 2;
        if (q.accepted("US") != 1 || q.accepted("JP") != 5)
            return 3;
        if (!q.is_all_satisfied())
            return 4;
    }
    return 0;
}

static int test_quota_untracked() {
    QuotaTracker q({{"HK", 2}});
    if (q.tracks("UNKNOWN") || q.record("UNKNOWN"))
        return 11;
    if (q.tracks("US") || q.record("US"))
        return 12;
    if (q.accepted("US") != 0 || q.target("US") != 0)
        return 13;
    if (q.is_country_satisfied("US"))
        return 14;
    return 0;
}

static int test_quota_satisfaction() {
    QuotaTracker q({{"US", 2}, {"SG", 1}});
    if (q.is_all_satisfied() || q.target("US") != 2)
        return 21;
    if (!q.record("SG") || !q.is_country_satisfied("SG"))
        return 22;
    if (q.is_all_satisfied())
        return 23;
    if (!q.record("US") || q.is_country_satisfied("US"))
        return 24;
    if (!q.record("US") || !q.is_all_satisfied())
        return 25;
    if (q.record("US") || q.record("SG") || q.accepted("US") != 2)
        return 26;
    return 0;
}

static ProbeResult res(const std::string& ip, double ms, const std::string& cc = "US") {
    return ProbeResult{ip, 443, ms, cc, std::chrono::system_clock::now()};
}

static int test_store_order_and_ties() {
    ResultStore s({{"US", 10}});
    s.insert(res("1.0.0.1", 30));
    s.insert(res("1.0.0.2", 10));
    s.insert(res("1.0.0.3", 20));
    s.insert(res("1.0.0.4", 20));
    s.insert(res("1.0.0.5", 5));

    auto b = s.buckets()["US"];
    const char* want[] = {"1.0.0.5", "1.0.0.2", "1.0.0.3", "1.0.0.4", "1.0.0.1"};
    if (b.size() != 5)
        return 31;
    for (std::size_t i = 0; i < b.size(); ++i)
        if (b[i].address != want[i])
            return 32;
    return 0;
}

static int test_store_dedupe_and_capacity() {
    ResultStore s({{"US", 2}, {"JP", 3}});
    if (!s.insert(res("8.8.8.8", 12)))
        return 41;
    if (s.insert(res("8.8.8.8", 3)))
        return 42;
    if (s.insert(res("8.8.8.8", 3, "JP")))
        return 43;
    if (!s.insert(res("8.8.4.4", 40)))
        return 44;
    if (s.insert(res("9.9.9.9", 1)))
        return 45;
    if (s.insert(res("1.1.1.1", 1, "DE")))
        return 46;
    if (s.size() != 2 || s.buckets().count("JP"))
        return 47;
    return 0;
}

static int test_store_concurrent() {
    ResultStore s({{"US", 50}});
    std::vector<std::thread> pool;
    for (int t = 0; t < 8; ++t) {
        pool.emplace_back([&s, t] {
            for (int i = 0; i < 40; ++i)
                s.insert(res("10.0." + std::to_string(t) + "." + std::to_string(i), (i * 7 + t) % 23));
        });
    }
    for (auto& th : pool)
        th.join();

    auto b = s.buckets()["US"];
    if (b.size() != 50)
        return 51;
    for (std::size_t i = 1; i < b.size(); ++i)
        if (b[i].latency_ms < b[i - 1].latency_ms)
            return 52;
    return 0;
}

int main() {
    int (*tests[])() = {
        test_quota_race,
        test_quota_untracked,
        test_quota_satisfaction,
        test_store_order_and_ties,
        test_store_dedupe_and_capacity,
        test_store_concurrent,
    };
    for (auto t : tests) {
        int rc = t();
        if (rc != 0) {
            std::cerr << "quota/store test failed with code " << rc << "\n";
            return rc;
        }
    }
    std::cout << "quota/store tests passed\n";
    return 0;
}
