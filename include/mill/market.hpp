#ifndef MILL_MARKET_HPP
#define MILL_MARKET_HPP

#include <optional>

#include "types.hpp"

namespace mill {

// =============================================================================
// Market Identity
// =============================================================================

struct MarketKeys {
    Pubkey config;
    Pubkey creator;
    Pubkey base_token_mint;
    Pubkey quote_token_mint;
};

// =============================================================================
// Results
// =============================================================================

// Settled amounts of a quote. Either side may fall short of the request when
// the curve boundary is reached.
struct SwapAmounts {
    int32_t error_code;
    uint64_t base_amount;
    uint64_t quote_amount;
};

struct FeeDistribution {
    int32_t error_code;
    uint64_t creator_fee;
    uint64_t staking_fee;
    uint64_t protocol_fee;
    uint64_t referral_fee;
};

// =============================================================================
// Market Fees
// =============================================================================

struct MarketFees {
    // creator + staking <= MAX_BPS, the rest goes to protocol and referrer
    uint16_t creator_fee_share = 0;
    uint16_t staking_fee_share = 0;

    uint64_t pending_creator_fees = 0;
    uint64_t pending_staking_fees = 0;

    // Split a quote-side swap fee. Creator and staking shares accumulate here,
    // protocol and referral shares are returned for external settlement.
    FeeDistribution distribute_fee(uint64_t swap_fee,
                                   std::optional<uint16_t> referral_fee_share);
};

// =============================================================================
// Market - Piecewise-Linear Bonding Curve
// =============================================================================

class Market {
public:
    Market() = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    int32_t initialize(const MarketKeys& keys,
                       uint8_t quote_token_decimals,
                       uint64_t total_supply,
                       uint16_t creator_fee_share,
                       uint16_t staking_fee_share);

    // One-shot; both arrays are committed only if every check passes
    int32_t check_and_set_prices(const PriceCurve& bid_prices,
                                 const PriceCurve& ask_prices);

    bool are_prices_set() const { return ask_prices_[INTERVAL_NUMBER] != 0; }

    // =========================================================================
    // Quoting
    // =========================================================================

    // Base amount known. ExactInput sells on the bid curve rounding down,
    // ExactOutput buys on the ask curve rounding up.
    SwapAmounts quote_for_base(uint64_t base_amount, SwapAmountType amount_type) const;

    // Same walk from an arbitrary supply point
    SwapAmounts quote_for_base_at(uint64_t supply, uint64_t base_amount,
                                  SwapAmountType amount_type, Rounding rounding) const;

    // Quote amount known. Buy spends it on the ask curve, Sell raises it on the
    // bid curve.
    SwapAmounts base_for_quote(uint64_t quote_amount, SwapType swap_type) const;

    SwapAmounts get_base_amount_out(uint64_t quote_amount) const;
    SwapAmounts get_base_amount_in(uint64_t quote_amount) const;

    // =========================================================================
    // Accounting
    // =========================================================================

    // Move the base reserve for a settled trade
    int32_t apply_swap(SwapType swap_type, uint64_t base_amount);

    FeeDistribution distribute_fee(uint64_t swap_fee,
                                   std::optional<uint16_t> referral_fee_share) {
        return fees_.distribute_fee(swap_fee, referral_fee_share);
    }

    // Return the pending balance and reset it
    uint64_t claim_creator_fees();
    uint64_t claim_staking_fees();

    // =========================================================================
    // Accessors
    // =========================================================================

    uint64_t circulating_supply() const;

    const MarketKeys& keys() const { return keys_; }
    uint64_t base_reserve() const { return base_reserve_; }
    uint64_t total_supply() const { return total_supply_; }
    uint64_t width_scaled() const { return width_scaled_; }
    uint8_t quote_token_decimals() const { return quote_token_decimals_; }
    const PriceCurve& bid_prices() const { return bid_prices_; }
    const PriceCurve& ask_prices() const { return ask_prices_; }
    const MarketFees& fees() const { return fees_; }

private:
    MarketKeys keys_{};

    uint64_t base_reserve_ = 0;

    PriceCurve bid_prices_{};
    PriceCurve ask_prices_{};

    uint64_t width_scaled_ = 0;
    uint64_t total_supply_ = 0;

    MarketFees fees_{};

    uint8_t quote_token_decimals_ = 0;
};

} // namespace mill

#endif // MILL_MARKET_HPP
