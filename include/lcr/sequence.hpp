#pragma once

#include <atomic>
#include <cstdint>


namespace lcr {


// Monotonic sequence number generator, safe for concurrent producers.
// Numbers advance by a fixed step and never wrap in practice (uint64).
class alignas(64) sequence {
    std::atomic<uint64_t> next_seq_;
    uint64_t step_;
    char pad_[64 - sizeof(std::atomic<uint64_t>) - sizeof(uint64_t)];

public:
    explicit sequence(uint64_t start = 1, uint64_t step = 1) noexcept
        : next_seq_(start)
        , step_(step)
    {}
    // Disable copy/move semantics
    sequence(const sequence&) = delete;
    sequence& operator=(const sequence&) = delete;

    // Return next sequence number and advance
    inline uint64_t next() noexcept {
        return next_seq_.fetch_add(step_, std::memory_order_relaxed);
    }

    // Peek at the number the next call to next() will return
    inline uint64_t current() const noexcept {
        return next_seq_.load(std::memory_order_relaxed);
    }

    inline uint64_t step() const noexcept {
        return step_;
    }
};
static_assert(sizeof(sequence) == 64, "sequence must be cache-line sized");
static_assert(alignof(sequence) == 64, "sequence must be cache-line aligned");


} // namespace lcr
