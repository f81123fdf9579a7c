#ifndef AGENTTRACE_COMMON_UTILS_NUMBER_UTILS_H
#define AGENTTRACE_COMMON_UTILS_NUMBER_UTILS_H

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>

namespace agenttrace {

// Converts a JSON/attribute number to T. Non-finite values, and values
// outside a signed integer T's range, give nullopt. Fractions truncate.
template <typename T>
std::optional<T> checked_number_cast(double value) {
    static_assert(std::is_arithmetic_v<T>, "numeric target required");
    if constexpr (std::is_floating_point_v<T>) {
        if (!std::isfinite(value)) return std::nullopt;
        return static_cast<T>(value);
    } else {
        static_assert(std::is_signed_v<T>, "signed integer target required");
        // min() is a power of two, so both bounds are exact doubles.
        constexpr double lower = static_cast<double>(std::numeric_limits<T>::min());
        if (!(value >= lower && value < -lower)) return std::nullopt;
        return static_cast<T>(value);
    }
}

// a + b, pinned to the int64_t range instead of overflowing.
inline int64_t saturating_add(int64_t a, int64_t b) {
    if (b > 0 && a > std::numeric_limits<int64_t>::max() - b) return std::numeric_limits<int64_t>::max();
    if (b < 0 && a < std::numeric_limits<int64_t>::min() - b) return std::numeric_limits<int64_t>::min();
    return a + b;
}

} // namespace agenttrace

#endif // AGENTTRACE_COMMON_UTILS_NUMBER_UTILS_H
