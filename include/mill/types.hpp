#ifndef MILL_TYPES_HPP
#define MILL_TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace mill {

// =============================================================================
// Wide Integers
// =============================================================================

using U128 = unsigned __int128;

// 32-byte account identity (config, creator, mints)
using Pubkey = std::array<uint8_t, 32>;

// =============================================================================
// Curve Constants
// =============================================================================

constexpr size_t PRICES_LENGTH = 11;
constexpr uint64_t INTERVAL_NUMBER = PRICES_LENGTH - 1;

constexpr uint64_t MAX_TOTAL_SUPPLY = 1000000000000000ULL;  // 1e9 * 1e6
constexpr uint64_t MAX_PRICE = 1000000000000000000ULL;      // 1e18

constexpr uint8_t MILL_TOKEN_DECIMALS = 6;
constexpr uint64_t BASE_PRECISION = 1000000ULL;             // 1e6
constexpr U128 SCALE = 10000000000ULL;                      // 1e10

// Quote amounts normalize to SCALE exactly only up to 10 decimals
constexpr uint8_t MAX_QUOTE_TOKEN_DECIMALS = 10;

constexpr uint16_t MAX_BPS = 10000;

// Price points of one curve: INTERVAL_NUMBER intervals, left/right edges shared
using PriceCurve = std::array<uint64_t, PRICES_LENGTH>;

// =============================================================================
// Trade Direction
// =============================================================================

enum class Rounding : uint8_t {
    Down = 0,
    Up = 1
};

enum class SwapType : uint8_t {
    Buy = 0,   // base out, quote in
    Sell = 1   // base in, quote out
};

enum class SwapAmountType : uint8_t {
    ExactInput = 0,
    ExactOutput = 1
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t MATH_ERROR = -1;
constexpr int32_t INVALID_TOTAL_SUPPLY = -2;
constexpr int32_t PRICES_ALREADY_SET = -3;
constexpr int32_t BID_ASK_MISMATCH = -4;
constexpr int32_t DECREASING_PRICES = -5;
constexpr int32_t PRICE_TOO_HIGH = -6;
constexpr int32_t PRICES_NOT_SET = -7;
constexpr int32_t INVALID_FEE_SHARES = -8;
constexpr int32_t INVALID_QUOTE_DECIMALS = -9;
constexpr int32_t MARKET_ALREADY_INITIALIZED = -10;
constexpr int32_t INVALID_SWAP_FEE = -11;
constexpr int32_t INVALID_AMOUNT = -12;

constexpr const char* name(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case MATH_ERROR: return "math_error";
        case INVALID_TOTAL_SUPPLY: return "invalid_total_supply";
        case PRICES_ALREADY_SET: return "prices_already_set";
        case BID_ASK_MISMATCH: return "bid_ask_mismatch";
        case DECREASING_PRICES: return "decreasing_prices";
        case PRICE_TOO_HIGH: return "price_too_high";
        case PRICES_NOT_SET: return "prices_not_set";
        case INVALID_FEE_SHARES: return "invalid_fee_shares";
        case INVALID_QUOTE_DECIMALS: return "invalid_quote_decimals";
        case MARKET_ALREADY_INITIALIZED: return "market_already_initialized";
        case INVALID_SWAP_FEE: return "invalid_swap_fee";
        case INVALID_AMOUNT: return "invalid_amount";
    }
    return "unknown";
}
} // namespace errors

} // namespace mill

#endif // MILL_TYPES_HPP
