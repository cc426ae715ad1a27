#pragma once
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <vector>

// Fixed-capacity, thread-safe cache with FIFO (ring) replacement.
//
// Writers claim slots by atomically decrementing a shared cursor; only the
// writer that exhausts the ring takes a lock to reset it. Readers scan from
// the newest slot to the oldest and lock a slot only when its key looks like
// a match. Each slot has its own mutex, so operations on different slots run
// in parallel.
//
// capacity must be greater than the number of threads calling put()
// concurrently. This is not checked.
//
// There is no duplicate check on put(): the newest occurrence of a key is
// always found first, older ones stay until the ring overwrites them.
template <typename Key, typename Value>
class RingCache {
    static_assert(std::is_trivially_copyable<Key>::value,
                  "RingCache keys must be trivially copyable");

    public:
        RingCache(size_t capacity, const Value& absent_value)
            : capacity_(capacity), absent_(absent_value),
              keys_(capacity), values_(capacity, absent_value), locks_(capacity),
              head_(static_cast<std::ptrdiff_t>(capacity)), wrapped_(false) {
            if (capacity == 0) {
                throw std::invalid_argument("capacity must be > 0");
            }
        }

        RingCache(const RingCache&) = delete;
        RingCache& operator=(const RingCache&) = delete;

        // Stores the pair in the next ring slot, replacing its oldest entry.
        // Put absent_value() to delete a key.
        void put(const Key& key, const Value& value) {
            std::ptrdiff_t position = head_.fetch_sub(1, std::memory_order_acq_rel) - 1;
            if (position < 0) {
                std::scoped_lock wl(wrap_lock_);
                // Someone may have reset the cursor while we waited.
                position = head_.fetch_sub(1, std::memory_order_acq_rel) - 1;
                if (position < 0) {
                    position = static_cast<std::ptrdiff_t>(capacity_) - 1;
                    head_.store(position, std::memory_order_release);
                    wrapped_.store(true, std::memory_order_relaxed);
                }
            }
            const size_t i = static_cast<size_t>(position);
            std::scoped_lock sl(locks_[i]);
            keys_[i].store(key, std::memory_order_relaxed);
            values_[i] = value;
        }

        // Returns the most recently put value for key, or absent_value().
        // The cursor holds the last claimed index, so slots head..capacity-1
        // are this lap from newest to oldest, and 0..head-1 the previous lap.
        // The snapshot may be stale; that only changes which slots are seen.
        Value get(const Key& key) {
            std::ptrdiff_t head = head_.load(std::memory_order_acquire);
            if (head < 0) head = 0;
            const std::ptrdiff_t end = static_cast<std::ptrdiff_t>(capacity_);

            for (std::ptrdiff_t i = head; i < end; ++i) {
                if (auto hit = probe(static_cast<size_t>(i), key)) return *hit;
            }
            if (!wrapped_.load(std::memory_order_relaxed)) return absent_;
            for (std::ptrdiff_t i = 0; i < head; ++i) {
                if (auto hit = probe(static_cast<size_t>(i), key)) return *hit;
            }
            return absent_;
        }

        void erase(const Key& key) {
            put(key, absent_);
        }

        bool contains(const Key& key) {
            return !(get(key) == absent_);
        }

        const Value& absent_value() const {
            return absent_;
        }

        size_t capacity() const {
            return capacity_;
        }

        // True once the ring has been filled at least once. Never resets.
        bool has_wrapped() const {
            return wrapped_.load(std::memory_order_relaxed);
        }

    private:
        // Unlocked key compare first; lock and re-check only on a match.
        // nullopt means keep scanning. A key that changed before we got the
        // lock ends the lookup as a miss.
        std::optional<Value> probe(size_t i, const Key& key) {
            if (!(keys_[i].load(std::memory_order_relaxed) == key)) {
                return std::nullopt;
            }
            std::scoped_lock sl(locks_[i]);
            if (!(keys_[i].load(std::memory_order_relaxed) == key)) {
                return absent_;
            }
            return values_[i];
        }

        const size_t capacity_;
        const Value absent_;

        std::vector<std::atomic<Key>> keys_;
        std::vector<Value> values_;
        std::vector<std::mutex> locks_;

        alignas(64) std::atomic<std::ptrdiff_t> head_;
        std::mutex wrap_lock_;
        std::atomic<bool> wrapped_;
};
