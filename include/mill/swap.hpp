#ifndef MILL_SWAP_HPP
#define MILL_SWAP_HPP

#include <optional>

#include "market.hpp"

namespace mill {

// =============================================================================
// Swap Parameters
// =============================================================================

struct SwapParams {
    SwapType swap_type;
    SwapAmountType amount_type;
    // Buy/ExactInput: gross quote in.   Buy/ExactOutput: base out.
    // Sell/ExactInput: base in.         Sell/ExactOutput: net quote out.
    uint64_t amount;
    uint16_t fee_bps;                           // quote-side swap fee, < MAX_BPS
    std::optional<uint16_t> referral_fee_share; // share of the non-creator, non-staking remainder
};

// =============================================================================
// Swap Result
// =============================================================================

struct SwapResult {
    int32_t error_code;
    uint64_t base_amount;    // base moved out of (buy) or into (sell) the reserve
    uint64_t quote_amount;   // quote paid by the buyer or received by the seller, fee included
    uint64_t swap_fee;
    FeeDistribution fees;
};

// Price a trade, move the reserve and distribute the fee. Nothing in `market`
// changes unless the whole swap succeeds. A trade that would move no base is
// rejected with INVALID_AMOUNT.
SwapResult swap(Market& market, const SwapParams& params);

} // namespace mill

#endif // MILL_SWAP_HPP
