#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "RingCache.hpp"

static void miss_on_empty() {
    for (size_t n : {1u, 3u, 64u}) {
        RingCache<int, int> cache(n, -1);
        for (int k = -5; k < 100; ++k) {
            assert(cache.get(k) == -1);
        }
        assert(!cache.has_wrapped());
    }
    // Keys start value-initialized; key 0 must still miss on an empty ring.
    RingCache<int, int> cache(8, -1);
    assert(cache.get(0) == -1);
    std::cout << "miss_on_empty ok\n";
}

static void write_then_read() {
    RingCache<int, int> cache(16, -1);
    cache.put(7, 70);
    assert(cache.get(7) == 70);
    cache.put(8, 80);
    assert(cache.get(7) == 70);
    assert(cache.get(8) == 80);
    assert(cache.get(9) == -1);
    assert(cache.contains(7));
    assert(!cache.contains(9));
    std::cout << "write_then_read ok\n";
}

static void sentinel_as_delete() {
    RingCache<int, int> cache(16, -1);
    cache.put(1, 10);
    cache.put(1, cache.absent_value());
    assert(cache.get(1) == -1);

    cache.put(2, 20);
    cache.erase(2);
    assert(cache.get(2) == -1);
    assert(!cache.contains(2));
    std::cout << "sentinel_as_delete ok\n";
}

static void eviction_under_overflow() {
    const int n = 10;
    RingCache<int, int> cache(n, -1);
    for (int k = 0; k <= n; ++k) cache.put(k, k * 100);

    assert(cache.has_wrapped());
    assert(cache.get(0) == -1);
    for (int k = 1; k <= n; ++k) {
        assert(cache.get(k) == k * 100);
    }
    std::cout << "eviction_under_overflow ok\n";
}

static void newest_wins() {
    RingCache<int, int> cache(16, -1);
    cache.put(5, 1);
    cache.put(5, 2);
    assert(cache.get(5) == 2);
    cache.put(6, 60);
    cache.put(5, 3);
    assert(cache.get(5) == 3);
    assert(cache.get(6) == 60);

    // Duplicates on both sides of the wrap point.
    RingCache<int, int> small(4, -1);
    small.put(1, 10);
    small.put(2, 20);
    small.put(3, 30);
    small.put(1, 11);
    small.put(1, 12); // wraps, overwriting the first put
    assert(small.has_wrapped());
    assert(small.get(1) == 12);
    assert(small.get(2) == 20);
    assert(small.get(3) == 30);
    std::cout << "newest_wins ok\n";
}

static void end_to_end_example() {
    RingCache<int, int> cache(3, -1);
    cache.put(1, 10);
    cache.put(2, 20);
    cache.put(3, 30);
    assert(!cache.has_wrapped());
    cache.put(4, 40);
    assert(cache.has_wrapped());

    assert(cache.get(1) == -1);
    assert(cache.get(2) == 20);
    assert(cache.get(3) == 30);
    assert(cache.get(4) == 40);
    std::cout << "end_to_end_example ok\n";
}

static void capacity_one() {
    RingCache<int, int> cache(1, -1);
    cache.put(1, 10);
    assert(cache.get(1) == 10);
    cache.put(2, 20);
    assert(cache.get(1) == -1);
    assert(cache.get(2) == 20);
    cache.put(3, 30);
    assert(cache.get(2) == -1);
    assert(cache.get(3) == 30);
    std::cout << "capacity_one ok\n";
}

static void many_laps() {
    const int n = 7;
    RingCache<std::uint64_t, std::uint64_t> cache(n, 0);
    for (std::uint64_t k = 1; k <= 1000; ++k) {
        cache.put(k, k * 3);
        // The last n keys are always present, anything older is gone.
        for (std::uint64_t j = 1; j <= k; ++j) {
            const std::uint64_t expected = (k - j < std::uint64_t(n)) ? j * 3 : 0;
            assert(cache.get(j) == expected);
        }
    }
    std::cout << "many_laps ok\n";
}

static void string_values() {
    RingCache<long, std::string> cache(4, "");
    cache.put(1, "one");
    cache.put(2, "two");
    assert(cache.get(1) == "one");
    assert(cache.get(2) == "two");
    assert(cache.get(3).empty());
    assert(cache.absent_value().empty());
    std::cout << "string_values ok\n";
}

static void zero_capacity_rejected() {
    bool threw = false;
    try {
        RingCache<int, int> cache(0, -1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    RingCache<int, int> cache(5, -1);
    assert(cache.capacity() == 5);
    assert(cache.absent_value() == -1);
    std::cout << "zero_capacity_rejected ok\n";
}

int main() {
    miss_on_empty();
    write_then_read();
    sentinel_as_delete();
    eviction_under_overflow();
    newest_wins();
    end_to_end_example();
    capacity_one();
    many_laps();
    string_values();
    zero_capacity_rejected();
    std::cout << "PASS: ring cache single-thread behaviour.\n";
    return 0;
}
