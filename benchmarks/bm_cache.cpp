#include <benchmark/benchmark.h>
#include <cmath>
#include <cstdint>
#include <memory>
#include <random>
#include <vector>
#include "RingCache.hpp"

using Key = std::int64_t;

static std::discrete_distribution<Key> make_zipf(size_t key_space, double s) {
    std::vector<double> w(key_space);
    for (size_t i=0;i<key_space;++i) w[i] = 1.0/std::pow(double(i+1), s);
    return std::discrete_distribution<Key>(w.begin(), w.end());
}

// get-or-put loop on a Zipf key stream, single thread
static void BM_Ring_Zipf(benchmark::State& st) {
    size_t capacity = st.range(0), key_space = st.range(1);
    RingCache<Key, Key> cache(capacity, -1);
    std::mt19937 rng(123);
    auto zipf = make_zipf(key_space, 1.2);

    size_t hits=0, misses=0;
    for (auto _ : st) {
        Key k = zipf(rng);
        if (cache.get(k) != cache.absent_value()) ++hits;
        else { ++misses; cache.put(k, k); }
    }
    st.counters["hit_rate"] = double(hits)/(hits+misses);
    st.counters["ops"] = hits+misses;
}
BENCHMARK(BM_Ring_Zipf)->Args({100, 10000})->Args({1000, 10000})->Args({10000, 100000})
    ->Unit(benchmark::kNanosecond);

// Pure lookup cost of a miss: the whole ring is scanned.
static void BM_Ring_Miss(benchmark::State& st) {
    size_t capacity = st.range(0);
    RingCache<Key, Key> cache(capacity, -1);
    for (size_t i = 0; i <= capacity; ++i) cache.put(Key(i), Key(i));

    Key k = -2;
    for (auto _ : st) {
        benchmark::DoNotOptimize(cache.get(k));
    }
    st.SetItemsProcessed(st.iterations());
}
BENCHMARK(BM_Ring_Miss)->Arg(100)->Arg(10000)->Arg(100000)->Unit(benchmark::kNanosecond);

static void BM_Ring_Put(benchmark::State& st) {
    RingCache<Key, Key> cache(st.range(0), -1);
    Key k = 0;
    for (auto _ : st) {
        cache.put(k, k);
        ++k;
    }
    st.SetItemsProcessed(st.iterations());
}
BENCHMARK(BM_Ring_Put)->Arg(100)->Arg(100000)->Unit(benchmark::kNanosecond);

// One cache shared by all benchmark threads; each thread uses its own key range.
static std::unique_ptr<RingCache<Key, Key>> shared_cache;

static void BM_Ring_Shared_Zipf(benchmark::State& st) {
    if (st.thread_index() == 0) {
        shared_cache = std::make_unique<RingCache<Key, Key>>(st.range(0), -1);
    }
    const size_t key_space = st.range(1);
    const Key base = Key(st.thread_index()) * Key(key_space);
    std::mt19937 rng(123 + st.thread_index());
    auto zipf = make_zipf(key_space, 1.2);

    size_t hits=0, misses=0;
    for (auto _ : st) {
        Key k = base + zipf(rng);
        Key v = shared_cache->get(k);
        if (v != shared_cache->absent_value()) {
            if (v != k) { st.SkipWithError("value does not match key"); break; }
            ++hits;
        } else { ++misses; shared_cache->put(k, k); }
    }
    st.counters["hit_rate"] = benchmark::Counter(double(hits)/(hits+misses), benchmark::Counter::kAvgThreads);

    if (st.thread_index() == 0) {
        shared_cache.reset();
    }
}
BENCHMARK(BM_Ring_Shared_Zipf)->Args({10000, 10000})->ThreadRange(1, 8)->UseRealTime()
    ->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
