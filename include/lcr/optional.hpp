#pragma once

#include <cassert>
#include <ostream>
#include <type_traits>
#include <utility>


namespace lcr {

// Presence flag plus an always-constructed value. T must be default
// constructible; an empty optional holds T{}.
template <typename T>
class optional {
    static_assert(std::is_default_constructible_v<T>, "lcr::optional<T> requires a default constructible T");

public:
    optional() : has_(false), value_{} {}
    optional(const T& v) : has_(true), value_(v) {}
    optional(T&& v) : has_(true), value_(std::move(v)) {}

    [[nodiscard]] inline bool has() const noexcept { return has_; }

    [[nodiscard]] inline const T& value() const {
        assert(has_ && "lcr::optional::value() called when empty");
        return value_;
    }

    [[nodiscard]] inline T& value() {
        assert(has_ && "lcr::optional::value() called when empty");
        return value_;
    }

    [[nodiscard]] inline T value_or(T fallback) const {
        return has_ ? value_ : std::move(fallback);
    }

    template <typename... Args>
    inline T& emplace(Args&&... args) {
        value_ = T(std::forward<Args>(args)...);
        has_ = true;
        return value_;
    }

    inline void reset() {
        has_ = false;
        value_ = T{};
    }

    inline optional& operator=(const T& v) {
        value_ = v;
        has_ = true;
        return *this;
    }

    inline optional& operator=(T&& v) {
        value_ = std::move(v);
        has_ = true;
        return *this;
    }

    // Empty never equals a value
    template <typename U>
    [[nodiscard]] inline bool operator==(const U& v) const {
        return has_ && value_ == v;
    }

private:
    bool has_;
    T value_;
};


// Prints the value, or "null" when empty
template <typename T>
inline std::ostream& print(std::ostream& os, const optional<T>& opt) {
    if (!opt.has()) {
        return os << "null";
    }
    return os << opt.value();
}

} // namespace lcr
