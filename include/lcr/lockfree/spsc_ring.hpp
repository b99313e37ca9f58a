// -----------------------------------------------------------------------------
// Bounded SPSC ring buffer with compile-time capacity
//
// One producer thread, one consumer thread, no locks, no allocation after
// construction. Hands inbound frames and close/error events from the socket
// thread to the connection, and connection signals to the session.
//
// Indices are free-running 64-bit counters (slot = index & MASK), so all
// Capacity slots are usable. Each side keeps a private copy of the other
// side's index and only reloads the shared atomic when that copy says the
// ring is full (producer) or empty (consumer).
//
// Notes:
//   - Capacity must be a power of two
//   - push() / try_emplace() are producer-only, pop() / clear() consumer-only
//   - empty() / size() from any thread are a snapshot
// -----------------------------------------------------------------------------
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>


namespace lcr::lockfree {

template <typename T, std::size_t Capacity>
class spsc_ring {
    static_assert(Capacity >= 2 && (Capacity & (Capacity - 1)) == 0,
                  "spsc_ring capacity must be a power of two >= 2");

public:
    spsc_ring() = default;

    spsc_ring(const spsc_ring&) = delete;
    spsc_ring& operator=(const spsc_ring&) = delete;

    // -------------------------------------------------------------------------
    // Producer
    // -------------------------------------------------------------------------

    template <typename U>
    [[nodiscard]] bool push(U&& item) noexcept {
        const std::uint64_t w = producer_.write.load(std::memory_order_relaxed);
        if (!has_room_(w)) {
            return false;
        }
        slots_[w & MASK] = std::forward<U>(item);
        producer_.write.store(w + 1, std::memory_order_release);
        return true;
    }

    template <typename... Args>
    [[nodiscard]] bool try_emplace(Args&&... args) noexcept {
        return push(T(std::forward<Args>(args)...));
    }

    // -------------------------------------------------------------------------
    // Consumer
    // -------------------------------------------------------------------------

    [[nodiscard]] bool pop(T& out) noexcept {
        const std::uint64_t r = consumer_.read.load(std::memory_order_relaxed);
        if (r == consumer_.cached_write) {
            consumer_.cached_write = producer_.write.load(std::memory_order_acquire);
            if (r == consumer_.cached_write) {
                return false;
            }
        }
        out = std::move(slots_[r & MASK]);
        consumer_.read.store(r + 1, std::memory_order_release);
        return true;
    }

    // Drops everything queued so far. Returns the number of items dropped.
    std::size_t clear() noexcept {
        std::size_t dropped = 0;
        T sink;
        while (pop(sink)) {
            ++dropped;
        }
        return dropped;
    }

    // -------------------------------------------------------------------------
    // Observers
    // -------------------------------------------------------------------------

    [[nodiscard]] bool empty() const noexcept {
        return size() == 0;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        const std::uint64_t r = consumer_.read.load(std::memory_order_acquire);
        const std::uint64_t w = producer_.write.load(std::memory_order_acquire);
        return static_cast<std::size_t>(w - r);
    }

    [[nodiscard]] static constexpr std::size_t capacity() noexcept {
        return Capacity;
    }

private:
    static constexpr std::uint64_t MASK = Capacity - 1;

    bool has_room_(std::uint64_t w) noexcept {
        if (w - producer_.cached_read < Capacity) {
            return true;
        }
        producer_.cached_read = consumer_.read.load(std::memory_order_acquire);
        return w - producer_.cached_read < Capacity;
    }

    // Producer and consumer state on separate cache lines
    struct alignas(64) Producer {
        std::atomic<std::uint64_t> write{0};
        std::uint64_t cached_read{0};
    };
    struct alignas(64) Consumer {
        std::atomic<std::uint64_t> read{0};
        std::uint64_t cached_write{0};
    };

    Producer producer_;
    Consumer consumer_;
    std::array<T, Capacity> slots_{};
};

} // namespace lcr::lockfree
