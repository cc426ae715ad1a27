#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

#include "RingCache.hpp"

using Key = std::int64_t;
using u64 = std::uint64_t;

struct Cfg {
    u64 threads = 4;
    u64 operations = 100'000;
};

static u64 parse_u64(const char* s, u64 def) {
    if (!s) return def;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 10);
    return (end && end != s && *end == '\0') ? static_cast<u64>(v) : def;
}

// Keys are random non-negative integers; -1 is the sentinel. The stored
// value of every key is the key itself, so any hit can be verified.
static std::vector<Key> make_input_stream(size_t length, std::mt19937_64& rng) {
    std::uniform_int_distribution<Key> dist(0, INT64_MAX);
    std::vector<Key> stream(length);
    for (auto& k : stream) k = dist(rng);
    return stream;
}

// Each thread loops until `operations` lookups are done. With probability
// miss_percentage it asks for a fresh key from the stream (a guaranteed
// miss); otherwise it asks for a key put about half a cache ago.
template <typename Cache>
void run_benchmark(Cache& cache, const Cfg& cfg, int miss_percentage, std::mt19937_64& rng) {
    using Clock = std::chrono::steady_clock;
    const size_t cache_size = cache.capacity();
    const size_t middle = cache_size / 2;
    const std::vector<Key> stream =
        make_input_stream(cfg.operations + cache_size + cfg.threads + 1, rng);

    std::atomic<u64> operations{0}, position{0}, hits{0}, misses{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> workers;
    workers.reserve(cfg.threads);
    for (u64 t = 0; t < cfg.threads; ++t) {
        const u64 seed = rng();
        workers.emplace_back([&, seed] {
            std::mt19937_64 local(seed);
            std::uniform_int_distribution<int> pct(0, 99);
            while (!go.load(std::memory_order_acquire)) {}
            while (operations.load(std::memory_order_relaxed) < cfg.operations) {
                Key key;
                if (pct(local) < miss_percentage) {
                    key = stream[position.fetch_add(1, std::memory_order_relaxed)];
                } else {
                    const u64 p = position.load(std::memory_order_relaxed);
                    key = p < cache_size ? stream[p / 2] : stream[p - middle];
                }
                const Key existing = cache.get(key);
                if (existing != cache.absent_value()) {
                    if (existing != key) {
                        std::cerr << "ERROR: key " << key << " returned value " << existing << "\n";
                        std::abort();
                    }
                    hits.fetch_add(1, std::memory_order_relaxed);
                } else {
                    misses.fetch_add(1, std::memory_order_relaxed);
                    cache.put(key, key);
                }
                operations.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }

    auto t0 = Clock::now();
    go.store(true, std::memory_order_release);
    for (auto& w : workers) w.join();
    auto t1 = Clock::now();

    const double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    const u64 ops = std::max<u64>(1, operations.load());
    std::cout << "\ncachesize: " << cache_size << "\n"
              << "hits: " << hits.load() << "\n"
              << "misses: " << misses.load() << "\n"
              << "time: " << std::fixed << std::setprecision(5) << (ms / double(ops))
              << " ms / operation\n";
    std::cout.unsetf(std::ios::floatfield);
}

int main(int argc, char** argv) {
    Cfg cfg;
    if (argc > 1) cfg.threads    = parse_u64(argv[1], cfg.threads);
    if (argc > 2) cfg.operations = parse_u64(argv[2], cfg.operations);
    if (cfg.threads == 0) cfg.threads = 1;

    std::cout << "threadcount: " << cfg.threads << "\n"
              << "operationsize: " << cfg.operations << "\n";

    std::random_device rd;
    std::mt19937_64 rng(rd());

    const size_t cache_sizes[] = {100, 10'000, 100'000};
    const int miss_percentages[] = {1, 20, 40, 90};

    for (int miss : miss_percentages) {
        std::cout << "----------------------------\ncachemisses: " << miss << "%\n";
        for (size_t size : cache_sizes) {
            if (size <= cfg.threads) {
                std::cout << "\ncachesize: " << size << " skipped (must exceed threadcount)\n";
                continue;
            }
            RingCache<Key, Key> cache(size, -1);
            run_benchmark(cache, cfg, miss, rng);
        }
    }
    return 0;
}
