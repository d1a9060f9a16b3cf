#include "holdem/chips.hpp"

#include <stdexcept>

namespace holdem {

ChipAmount ChipAmount::operator+(ChipAmount other) const {
    int64_t result = 0;
    if (__builtin_add_overflow(value_, other.value_, &result)) {
        throw std::overflow_error("Chip addition overflow: " + to_string() + " + " + other.to_string());
    }
    return ChipAmount(result);
}

ChipAmount ChipAmount::operator-(ChipAmount other) const {
    int64_t result = 0;
    if (__builtin_sub_overflow(value_, other.value_, &result)) {
        throw std::overflow_error("Chip subtraction overflow: " + to_string() + " - " + other.to_string());
    }
    return ChipAmount(result);
}

ChipAmount ChipAmount::operator*(int64_t factor) const {
    int64_t result = 0;
    if (__builtin_mul_overflow(value_, factor, &result)) {
        throw std::overflow_error("Chip multiplication overflow: " + to_string() + " * " + std::to_string(factor));
    }
    return ChipAmount(result);
}

ChipAmount ChipAmount::operator/(int64_t divisor) const {
    if (divisor == 0) {
        throw std::domain_error("Chip division by zero");
    }
    if (divisor == -1 && value_ == INT64_MIN) {
        throw std::overflow_error("Chip division overflow");
    }
    return ChipAmount(value_ / divisor);
}

ChipAmount ChipAmount::operator%(int64_t divisor) const {
    if (divisor == 0) {
        throw std::domain_error("Chip division by zero");
    }
    if (divisor == -1) {
        return ChipAmount(0);
    }
    return ChipAmount(value_ % divisor);
}

} // namespace holdem
