#pragma once

#include <atomic>
#include <concepts>
#include <cstdint>
#include <ostream>


namespace lcr::metrics::atomic {

// ---------------------------------------------------------------------------
// counter
//
// Cumulative event count shared between the dispatch thread (writer) and
// any number of observers. Relaxed ordering throughout: a counter orders
// nothing, readers get a value that was true at some recent point.
//
// Each counter owns a cache line so that hot counters written by the
// dispatch thread do not false-share with fields read elsewhere.
// ---------------------------------------------------------------------------
template <std::unsigned_integral T = std::uint64_t>
class alignas(64) counter {
public:
    using value_type = T;

    constexpr counter() noexcept = default;
    constexpr explicit counter(T initial) noexcept : value_(initial) {}

    // Counters live inside telemetry blocks that are shared by reference
    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    [[nodiscard]] T load() const noexcept { return value_.load(std::memory_order_relaxed); }

    void inc() noexcept { value_.fetch_add(1, std::memory_order_relaxed); }

    // Returns the updated value
    T add(T n) noexcept { return value_.fetch_add(n, std::memory_order_relaxed) + n; }

    void store(T v) noexcept { value_.store(v, std::memory_order_relaxed); }
    void reset() noexcept { store(0); }

    // Value since the previous take(), for periodic delta reports
    [[nodiscard]] T take() noexcept { return value_.exchange(0, std::memory_order_relaxed); }

private:
    std::atomic<T> value_{0};
};

using counter64 = counter<std::uint64_t>;

template <typename T>
inline std::ostream& operator<<(std::ostream& os, const counter<T>& c) {
    return os << c.load();
}

} // namespace lcr::metrics::atomic
