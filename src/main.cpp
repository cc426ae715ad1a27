#include <chrono>
#include <cstdint>
#include <iostream>
#include <thread>
#include <vector>
#include "RingCache.hpp"

// Memoized Fibonacci shared by several threads.
// A miss computes the value and puts it; a hit skips the whole subtree.

constexpr int fibonumber = 40;
constexpr int thread_count = 4;

static std::int64_t fibonacci(int n, RingCache<int, std::int64_t>* cache) {
    if (n <= 2) return 1;
    if (!cache) return fibonacci(n - 1, nullptr) + fibonacci(n - 2, nullptr);

    std::int64_t fibo1 = cache->get(n - 1);
    if (fibo1 == cache->absent_value()) {
        fibo1 = fibonacci(n - 1, cache);
        cache->put(n - 1, fibo1);
    }
    std::int64_t fibo2 = cache->get(n - 2);
    if (fibo2 == cache->absent_value()) {
        fibo2 = fibonacci(n - 2, cache);
        cache->put(n - 2, fibo2);
    }
    return fibo1 + fibo2;
}

static double run(RingCache<int, std::int64_t>* cache) {
    using Clock = std::chrono::steady_clock;
    std::vector<std::int64_t> results(thread_count, 0);

    auto t0 = Clock::now();
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&results, cache, i] { results[i] = fibonacci(fibonumber, cache); });
    }
    for (auto& t : threads) t.join();
    auto t1 = Clock::now();

    std::cout << "fib(" << fibonumber << ") = " << results[0] << "\n";
    return std::chrono::duration<double, std::milli>(t1 - t0).count();
}

int main() {
    // capacity must exceed the number of writer threads
    RingCache<int, std::int64_t> cache(fibonumber, -1);

    std::cout << "with cache: " << run(&cache) << " ms\n";
    std::cout << "without cache: " << run(nullptr) << " ms\n";
    return 0;
}
