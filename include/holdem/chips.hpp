#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace holdem {

/**
 * Exact count of the smallest chip unit.
 *
 * Arithmetic is checked: a result outside the int64 range throws
 * std::overflow_error and division by zero throws std::domain_error.
 */
class ChipAmount {
public:
    constexpr ChipAmount() = default;
    constexpr explicit ChipAmount(int64_t value) : value_(value) {}

    constexpr int64_t value() const { return value_; }

    constexpr bool is_zero() const { return value_ == 0; }
    constexpr bool is_positive() const { return value_ > 0; }
    constexpr bool is_negative() const { return value_ < 0; }

    ChipAmount operator+(ChipAmount other) const;
    ChipAmount operator-(ChipAmount other) const;
    ChipAmount operator*(int64_t factor) const;
    ChipAmount operator/(int64_t divisor) const;
    ChipAmount operator%(int64_t divisor) const;

    ChipAmount& operator+=(ChipAmount other) {
        *this = *this + other;
        return *this;
    }

    ChipAmount& operator-=(ChipAmount other) {
        *this = *this - other;
        return *this;
    }

    friend constexpr bool operator==(ChipAmount a, ChipAmount b) { return a.value_ == b.value_; }
    friend constexpr bool operator!=(ChipAmount a, ChipAmount b) { return a.value_ != b.value_; }
    friend constexpr bool operator<(ChipAmount a, ChipAmount b) { return a.value_ < b.value_; }
    friend constexpr bool operator<=(ChipAmount a, ChipAmount b) { return a.value_ <= b.value_; }
    friend constexpr bool operator>(ChipAmount a, ChipAmount b) { return a.value_ > b.value_; }
    friend constexpr bool operator>=(ChipAmount a, ChipAmount b) { return a.value_ >= b.value_; }

    std::string to_string() const { return std::to_string(value_); }

private:
    int64_t value_ = 0;
};

constexpr ChipAmount chips(int64_t value) {
    return ChipAmount(value);
}

constexpr ChipAmount min_chips(ChipAmount a, ChipAmount b) {
    return a < b ? a : b;
}

constexpr ChipAmount max_chips(ChipAmount a, ChipAmount b) {
    return a > b ? a : b;
}

/// -1, 0 or 1.
constexpr int compare_chips(ChipAmount a, ChipAmount b) {
    return a > b ? 1 : (a < b ? -1 : 0);
}

inline std::ostream& operator<<(std::ostream& os, ChipAmount amount) {
    return os << amount.value();
}

} // namespace holdem
