#pragma once

#include <cassert>
#include <utility>


namespace lcr {

// -----------------------------------------------------------------------------
// optional<T>
//
// Present-or-absent field holder used by the schema parsers, where "key was
// missing" and "key held the default" must stay distinguishable. Storage is
// always constructed, so T must be default constructible; an absent optional
// holds T{}.
// -----------------------------------------------------------------------------
template <typename T>
class optional {
public:
    optional() = default;
    optional(const T& v) : value_(v), engaged_(true) {}
    optional(T&& v) : value_(std::move(v)), engaged_(true) {}

    optional& operator=(const T& v) {
        value_ = v;
        engaged_ = true;
        return *this;
    }

    optional& operator=(T&& v) {
        value_ = std::move(v);
        engaged_ = true;
        return *this;
    }

    [[nodiscard]] bool has() const noexcept { return engaged_; }

    [[nodiscard]] T& value() {
        assert(engaged_);
        return value_;
    }

    [[nodiscard]] const T& value() const {
        assert(engaged_);
        return value_;
    }

    [[nodiscard]] T value_or(T fallback) const {
        return engaged_ ? value_ : std::move(fallback);
    }

    // Moves the value out; *this is absent afterwards
    [[nodiscard]] T take() {
        assert(engaged_);
        engaged_ = false;
        return std::exchange(value_, T{});
    }

    void reset() {
        value_ = T{};
        engaged_ = false;
    }

private:
    T value_{};
    bool engaged_{false};
};

} // namespace lcr
