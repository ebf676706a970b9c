// =============================================================================
// math.cpp - Checked fixed-point primitives for the curve engine
// =============================================================================

#include "mill/math.hpp"

#include <algorithm>

namespace mill {

// =============================================================================
// 256-bit Arithmetic
// =============================================================================

U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate the middle column with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

std::optional<U256> checked_add(const U256& a, const U256& b) {
    U256 result;
    result.lo = a.lo + b.lo;
    U128 carry = result.lo < a.lo ? 1 : 0;

    auto hi = checked_add<U128>(a.hi, b.hi);
    if (!hi) return std::nullopt;
    hi = checked_add<U128>(*hi, carry);
    if (!hi) return std::nullopt;

    result.hi = *hi;
    return result;
}

std::optional<U256> checked_sub(const U256& a, const U256& b) {
    if (a < b) return std::nullopt;

    U256 result;
    U128 borrow = a.lo < b.lo ? 1 : 0;
    result.lo = a.lo - b.lo;  // Wraps on borrow
    result.hi = a.hi - b.hi - borrow;
    return result;
}

std::optional<U256> checked_mul(const U256& a, U128 b) {
    U256 low = mul_u128(a.lo, b);
    U256 high = mul_u128(a.hi, b);
    if (high.hi != 0) return std::nullopt;

    auto hi = checked_add<U128>(low.hi, high.lo);
    if (!hi) return std::nullopt;

    return U256(low.lo, *hi);
}

std::optional<std::pair<U256, U128>> div_rem(const U256& num, U128 denom) {
    if (denom == 0) return std::nullopt;
    if (num.hi == 0) {
        return std::make_pair(U256(num.lo / denom), num.lo % denom);
    }

    U128 quot_hi = num.hi / denom;
    U128 rem = num.hi % denom;

    // (rem:lo) / denom with rem < denom, so the quotient fits 128 bits.
    // Shifting rem may carry out of 128 bits; the modular subtraction below
    // brings it back under denom.
    U128 quot_lo = 0;
    for (int i = 127; i >= 0; --i) {
        bool overflow = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot_lo <<= 1;
        if (overflow || rem >= denom) {
            rem -= denom;
            quot_lo |= 1;
        }
    }

    return std::make_pair(U256(quot_lo, quot_hi), rem);
}

U128 isqrt(const U256& x) {
    U128 root = 0;
    for (int bit = 127; bit >= 0; --bit) {
        U128 candidate = root | (U128(1) << bit);
        if (mul_u128(candidate, candidate) <= x) {
            root = candidate;
        }
    }
    return root;
}

// =============================================================================
// Scaled Multiply/Divide
// =============================================================================

std::optional<U128> mul_div(U128 a, U128 b, U128 denom, Rounding rounding) {
    if (denom == 0) return std::nullopt;

    auto qr = div_rem(mul_u128(a, b), denom);
    if (!qr || !qr->first.fits_u128()) return std::nullopt;

    U128 result = qr->first.lo;
    if (rounding == Rounding::Up && qr->second != 0) {
        return checked_add<U128>(result, 1);
    }
    return result;
}

std::optional<uint64_t> div(U128 a, U128 denom, Rounding rounding) {
    if (denom == 0) return std::nullopt;

    U128 result = a / denom;
    if (rounding == Rounding::Up && a % denom != 0) {
        result += 1;
    }

    if (result > U128(UINT64_MAX)) return std::nullopt;
    return static_cast<uint64_t>(result);
}

std::optional<U128> pow10(uint8_t exp) {
    U128 result = 1;
    for (uint8_t i = 0; i < exp; ++i) {
        auto next = checked_mul<U128>(result, 10);
        if (!next) return std::nullopt;
        result = *next;
    }
    return result;
}

// =============================================================================
// Linear Segment Integration
// =============================================================================

std::optional<U128> get_delta_quote(U128 price_0, U128 price_1, U128 width,
                                    U128 supply_used, U128 delta_base,
                                    Rounding rounding) {
    auto price_delta = checked_sub<U128>(price_1, price_0);
    if (!price_delta) return std::nullopt;

    // (p1 - p0) * (delta_base + 2 * used)
    auto doubled_used = checked_mul<U128>(supply_used, 2);
    if (!doubled_used) return std::nullopt;
    auto span = checked_add<U128>(delta_base, *doubled_used);
    if (!span) return std::nullopt;
    auto slope_term = checked_mul<U128>(*price_delta, *span);
    if (!slope_term) return std::nullopt;

    // + 2 * p0 * width
    auto doubled_price = checked_mul<U128>(price_0, 2);
    if (!doubled_price) return std::nullopt;
    auto level_term = checked_mul<U128>(*doubled_price, width);
    if (!level_term) return std::nullopt;

    auto factor = checked_add<U128>(*slope_term, *level_term);
    if (!factor) return std::nullopt;

    auto denom = checked_mul<U128>(2 * SCALE, width);
    if (!denom) return std::nullopt;

    return mul_div(delta_base, *factor, *denom, rounding);
}

std::optional<SegmentFill> get_delta_base_out(U128 price_0, U128 price_1, U128 width,
                                              U128 supply_used, U128 quote_left) {
    if (supply_used > width || price_1 < price_0) return std::nullopt;

    U128 supply_left = width - supply_used;

    // Whole remainder of the interval is affordable
    auto max_quote = get_delta_quote(price_0, price_1, width, supply_used,
                                     supply_left, Rounding::Up);
    if (!max_quote) return std::nullopt;
    if (quote_left >= *max_quote) {
        return SegmentFill{supply_left, *max_quote};
    }

    // Solve slope * d^2 + b * d - c = 0 for d
    U128 slope = price_1 - price_0;

    auto slope_used = checked_mul<U128>(slope, supply_used);
    if (!slope_used) return std::nullopt;
    auto level = checked_mul<U128>(price_0, width);
    if (!level) return std::nullopt;
    auto half_b = checked_add<U128>(*slope_used, *level);
    if (!half_b) return std::nullopt;
    auto b = checked_mul<U128>(*half_b, 2);
    if (!b) return std::nullopt;

    auto scaled_width = checked_mul<U128>(2 * SCALE, width);
    if (!scaled_width) return std::nullopt;
    U256 c = mul_u128(*scaled_width, quote_left);

    U128 delta_base = 0;
    if (slope == 0) {
        auto qr = div_rem(c, *b);
        if (!qr) return std::nullopt;
        delta_base = qr->first.fits_u128() ? qr->first.lo : supply_left;
    } else {
        auto four_slope = checked_mul<U128>(slope, 4);
        if (!four_slope) return std::nullopt;
        auto four_ac = checked_mul(c, *four_slope);
        if (!four_ac) return std::nullopt;
        auto discriminant = checked_add(mul_u128(*b, *b), *four_ac);
        if (!discriminant) return std::nullopt;

        // Flooring the root and the quotient keeps the base at or below the
        // exact solution
        U128 root = isqrt(*discriminant);
        delta_base = (root - *b) / (2 * slope);
    }

    delta_base = std::min(delta_base, supply_left);
    return SegmentFill{delta_base, quote_left};
}

std::optional<SegmentFill> get_delta_base_in(U128 price_0, U128 price_1, U128 width,
                                             U128 supply_available, U128 quote_left) {
    if (supply_available > width || price_1 < price_0) return std::nullopt;

    // Whole lower part [0, available) covers the target
    auto max_quote = get_delta_quote(price_0, price_1, width, 0,
                                     supply_available, Rounding::Down);
    if (!max_quote) return std::nullopt;
    if (quote_left >= *max_quote) {
        return SegmentFill{supply_available, *max_quote};
    }

    // Solve slope * d^2 - b * d + c = 0 for the smaller root
    U128 slope = price_1 - price_0;

    auto slope_available = checked_mul<U128>(slope, supply_available);
    if (!slope_available) return std::nullopt;
    auto level = checked_mul<U128>(price_0, width);
    if (!level) return std::nullopt;
    auto half_b = checked_add<U128>(*slope_available, *level);
    if (!half_b) return std::nullopt;
    auto b = checked_mul<U128>(*half_b, 2);
    if (!b) return std::nullopt;

    auto scaled_width = checked_mul<U128>(2 * SCALE, width);
    if (!scaled_width) return std::nullopt;
    U256 c = mul_u128(*scaled_width, quote_left);

    U128 delta_base = 0;
    if (slope == 0) {
        auto qr = div_rem(c, *b);
        if (!qr) return std::nullopt;
        U256 quotient = qr->first;
        if (qr->second != 0) {
            auto rounded = checked_add(quotient, U256(1));
            if (!rounded) return std::nullopt;
            quotient = *rounded;
        }
        delta_base = quotient.fits_u128() ? quotient.lo : supply_available;
    } else {
        auto four_slope = checked_mul<U128>(slope, 4);
        if (!four_slope) return std::nullopt;
        auto four_ac = checked_mul(c, *four_slope);
        if (!four_ac) return std::nullopt;
        auto discriminant = checked_sub(mul_u128(*b, *b), *four_ac);
        if (!discriminant) return std::nullopt;

        // Flooring the root raises the numerator; round the quotient up too
        U128 root = isqrt(*discriminant);
        U128 numerator = *b - root;
        U128 denom = 2 * slope;
        delta_base = numerator / denom + (numerator % denom != 0 ? 1 : 0);
    }

    delta_base = std::min(delta_base, supply_available);
    return SegmentFill{delta_base, quote_left};
}

} // namespace mill
