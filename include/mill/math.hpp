#ifndef MILL_MATH_HPP
#define MILL_MATH_HPP

#include <optional>
#include <utility>

#include "types.hpp"

namespace mill {

// =============================================================================
// Checked Integer Arithmetic
// =============================================================================

template <typename T>
inline std::optional<T> checked_add(T a, T b) {
    T result;
    if (__builtin_add_overflow(a, b, &result)) return std::nullopt;
    return result;
}

template <typename T>
inline std::optional<T> checked_sub(T a, T b) {
    T result;
    if (__builtin_sub_overflow(a, b, &result)) return std::nullopt;
    return result;
}

template <typename T>
inline std::optional<T> checked_mul(T a, T b) {
    T result;
    if (__builtin_mul_overflow(a, b, &result)) return std::nullopt;
    return result;
}

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator>(const U256& other) const { return other < *this; }
    bool operator<=(const U256& other) const { return !(other < *this); }
    bool operator>=(const U256& other) const { return !(*this < other); }

    bool is_zero() const { return lo == 0 && hi == 0; }
    bool fits_u128() const { return hi == 0; }
};

// Full 256-bit product of two U128 values
U256 mul_u128(U128 a, U128 b);

std::optional<U256> checked_add(const U256& a, const U256& b);
std::optional<U256> checked_sub(const U256& a, const U256& b);
std::optional<U256> checked_mul(const U256& a, U128 b);

// Quotient and remainder of a 256-bit value by a nonzero U128
std::optional<std::pair<U256, U128>> div_rem(const U256& num, U128 denom);

// floor(sqrt(x))
U128 isqrt(const U256& x);

// =============================================================================
// Scaled Multiply/Divide
// =============================================================================

// a * b / denom with a 256-bit intermediate.
// nullopt when denom is zero or the quotient does not fit 128 bits.
std::optional<U128> mul_div(U128 a, U128 b, U128 denom, Rounding rounding);

// a / denom narrowed to 64 bits
std::optional<uint64_t> div(U128 a, U128 denom, Rounding rounding);

// =============================================================================
// Linear Segment Integration
//
// All quantities are in the normalized (SCALE) domain. An interval spans
// `width` normalized base units with a price ramp from price_0 at its left
// edge to price_1 at its right edge.
// =============================================================================

struct SegmentFill {
    U128 base;
    U128 quote;
};

// Quote for `delta_base` units starting `supply_used` units into the interval:
// delta_base * ((p1 - p0) * (delta_base + 2 * used) + 2 * p0 * width) / (2 * SCALE * width)
std::optional<U128> get_delta_quote(U128 price_0, U128 price_1, U128 width,
                                    U128 supply_used, U128 delta_base,
                                    Rounding rounding);

// Buy side: spend up to `quote_left` moving right from `supply_used`.
// Cost of a full remainder rounds up, partial base rounds down.
std::optional<SegmentFill> get_delta_base_out(U128 price_0, U128 price_1, U128 width,
                                              U128 supply_used, U128 quote_left);

// Sell side: raise up to `quote_left` moving left from `supply_available`.
// Payout of a full remainder rounds down, partial base rounds up.
std::optional<SegmentFill> get_delta_base_in(U128 price_0, U128 price_1, U128 width,
                                             U128 supply_available, U128 quote_left);

// 10^exp, nullopt past 128 bits
std::optional<U128> pow10(uint8_t exp);

} // namespace mill

#endif // MILL_MATH_HPP
