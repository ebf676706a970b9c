// =============================================================================
// market.cpp - Bonding curve validation, quoting and fee accounting
// =============================================================================

#include "mill/market.hpp"
#include "mill/math.hpp"

#include <algorithm>

namespace mill {

namespace {

// =============================================================================
// Interval Walk
// =============================================================================

enum class Traversal {
    Forward,   // toward total supply, consuming [position, width)
    Backward   // toward zero supply, consuming [0, position)
};

struct Segment {
    U128 price_0;   // price at the interval's left edge
    U128 price_1;   // price at the interval's right edge
    U128 width;
    U128 position;  // supply point inside the interval
};

struct Step {
    U128 consumed;  // taken from the budget
    U128 produced;  // added to the accumulator
};

inline U128 normalize_base(uint64_t amount) {
    return U128(amount) * SCALE / BASE_PRECISION;
}

// Walks the curve one interval at a time from `supply` until the budget is
// spent or the curve ends. `step` prices a single interval.
template <typename StepFn>
int32_t walk_intervals(const PriceCurve& curve, U128 width, U128 supply,
                       Traversal traversal, U128& budget, U128& produced,
                       StepFn&& step) {
    if (width == 0) return errors::MATH_ERROR;

    U128 index = supply / width;
    if (index > INTERVAL_NUMBER) return errors::MATH_ERROR;

    size_t i = static_cast<size_t>(index);
    U128 position = supply % width;

    auto advance = [&](const Segment& segment) {
        std::optional<Step> s = step(segment, budget);
        if (!s) return false;

        auto budget_left = checked_sub<U128>(budget, s->consumed);
        auto total = checked_add<U128>(produced, s->produced);
        if (!budget_left || !total) return false;

        budget = *budget_left;
        produced = *total;
        return true;
    };

    if (traversal == Traversal::Forward) {
        while (budget > 0 && i < INTERVAL_NUMBER) {
            if (!advance(Segment{curve[i], curve[i + 1], width, position})) {
                return errors::MATH_ERROR;
            }
            position = 0;
            ++i;
        }
        return errors::OK;
    }

    // Backward: i becomes the right edge of the interval holding the supply
    // point. A supply point on an edge belongs to the interval below it.
    if (position == 0) {
        position = width;
    } else {
        ++i;
        if (i > INTERVAL_NUMBER) return errors::MATH_ERROR;
    }

    while (budget > 0 && i > 0) {
        if (!advance(Segment{curve[i - 1], curve[i], width, position})) {
            return errors::MATH_ERROR;
        }
        position = width;
        --i;
    }
    return errors::OK;
}

// Quote budget known, base accumulated. Shared by both inverse directions.
template <typename StepFn>
SwapAmounts settle_inverse(const Market& market, const PriceCurve& curve,
                           Traversal traversal, Rounding rounding,
                           uint64_t quote_amount, StepFn&& step) {
    if (!market.are_prices_set()) return {errors::PRICES_NOT_SET, 0, 0};

    auto quote_precision = pow10(market.quote_token_decimals());
    if (!quote_precision) return {errors::MATH_ERROR, 0, 0};

    auto quote_normalized = mul_div(quote_amount, SCALE, *quote_precision, Rounding::Down);
    if (!quote_normalized) return {errors::MATH_ERROR, 0, 0};

    U128 quote_left = *quote_normalized;
    U128 base_total = 0;

    int32_t status = walk_intervals(curve, market.width_scaled(),
                                    normalize_base(market.circulating_supply()),
                                    traversal, quote_left, base_total, step);
    if (status != errors::OK) return {status, 0, 0};

    auto base_scaled = checked_mul<U128>(base_total, BASE_PRECISION);
    auto base_swapped = base_scaled ? div(*base_scaled, SCALE, rounding) : std::nullopt;

    auto quote_scaled = checked_mul<U128>(quote_left, *quote_precision);
    auto quote_unspent = quote_scaled ? div(*quote_scaled, SCALE, rounding) : std::nullopt;
    auto quote_swapped = quote_unspent
        ? checked_sub<uint64_t>(quote_amount, *quote_unspent)
        : std::nullopt;

    if (!base_swapped || !quote_swapped) return {errors::MATH_ERROR, 0, 0};
    return {errors::OK, *base_swapped, *quote_swapped};
}

} // anonymous namespace

// =============================================================================
// Fee Distribution
// =============================================================================

FeeDistribution MarketFees::distribute_fee(uint64_t swap_fee,
                                           std::optional<uint16_t> referral_fee_share) {
    FeeDistribution result{errors::MATH_ERROR, 0, 0, 0, 0};

    auto creator_fee = mul_div(swap_fee, creator_fee_share, MAX_BPS, Rounding::Down);
    auto staking_fee = mul_div(swap_fee, staking_fee_share, MAX_BPS, Rounding::Down);
    if (!creator_fee || !staking_fee) return result;

    auto remaining_fee = checked_sub<U128>(swap_fee, *creator_fee);
    if (remaining_fee) remaining_fee = checked_sub<U128>(*remaining_fee, *staking_fee);
    if (!remaining_fee) return result;

    std::optional<U128> referral_fee = U128(0);
    if (referral_fee_share) {
        referral_fee = mul_div(*remaining_fee, *referral_fee_share, MAX_BPS, Rounding::Down);
    }
    if (!referral_fee) return result;

    auto protocol_fee = checked_sub<U128>(*remaining_fee, *referral_fee);
    if (!protocol_fee) return result;

    // Every share is bounded by swap_fee, so narrowing is exact
    auto pending_creator = checked_add<uint64_t>(pending_creator_fees,
                                                 static_cast<uint64_t>(*creator_fee));
    auto pending_staking = checked_add<uint64_t>(pending_staking_fees,
                                                 static_cast<uint64_t>(*staking_fee));
    if (!pending_creator || !pending_staking) return result;

    pending_creator_fees = *pending_creator;
    pending_staking_fees = *pending_staking;

    result.error_code = errors::OK;
    result.creator_fee = static_cast<uint64_t>(*creator_fee);
    result.staking_fee = static_cast<uint64_t>(*staking_fee);
    result.protocol_fee = static_cast<uint64_t>(*protocol_fee);
    result.referral_fee = static_cast<uint64_t>(*referral_fee);
    return result;
}

// =============================================================================
// Lifecycle
// =============================================================================

int32_t Market::initialize(const MarketKeys& keys,
                           uint8_t quote_token_decimals,
                           uint64_t total_supply,
                           uint16_t creator_fee_share,
                           uint16_t staking_fee_share) {
    if (total_supply_ != 0) {
        return errors::MARKET_ALREADY_INITIALIZED;
    }

    uint64_t interval_supply = total_supply / INTERVAL_NUMBER;
    if (total_supply > MAX_TOTAL_SUPPLY ||
        interval_supply < BASE_PRECISION ||
        interval_supply * INTERVAL_NUMBER != total_supply) {
        return errors::INVALID_TOTAL_SUPPLY;
    }

    if (static_cast<uint32_t>(creator_fee_share) + staking_fee_share > MAX_BPS) {
        return errors::INVALID_FEE_SHARES;
    }

    if (quote_token_decimals > MAX_QUOTE_TOKEN_DECIMALS) {
        return errors::INVALID_QUOTE_DECIMALS;
    }

    auto width = mul_div(interval_supply, SCALE, BASE_PRECISION, Rounding::Down);
    if (!width || *width > U128(UINT64_MAX)) {
        return errors::MATH_ERROR;
    }

    keys_ = keys;
    quote_token_decimals_ = quote_token_decimals;
    total_supply_ = total_supply;
    base_reserve_ = total_supply;
    width_scaled_ = static_cast<uint64_t>(*width);

    fees_.creator_fee_share = creator_fee_share;
    fees_.staking_fee_share = staking_fee_share;

    return errors::OK;
}

int32_t Market::check_and_set_prices(const PriceCurve& bid_prices,
                                     const PriceCurve& ask_prices) {
    if (are_prices_set()) {
        return errors::PRICES_ALREADY_SET;
    }

    for (size_t i = 0; i < PRICES_LENGTH; ++i) {
        if (bid_prices[i] > ask_prices[i]) {
            return errors::BID_ASK_MISMATCH;
        }

        // Strictly increasing on both curves
        if (i > 0 && (ask_prices[i] <= ask_prices[i - 1] ||
                      bid_prices[i] <= bid_prices[i - 1])) {
            return errors::DECREASING_PRICES;
        }
    }

    if (ask_prices[INTERVAL_NUMBER] > MAX_PRICE) {
        return errors::PRICE_TOO_HIGH;
    }

    bid_prices_ = bid_prices;
    ask_prices_ = ask_prices;

    return errors::OK;
}

// =============================================================================
// Forward Quote (base known)
// =============================================================================

SwapAmounts Market::quote_for_base(uint64_t base_amount, SwapAmountType amount_type) const {
    uint64_t circulating = circulating_supply();

    if (amount_type == SwapAmountType::ExactInput) {
        auto supply = checked_sub<uint64_t>(circulating, base_amount);
        if (!supply) return {errors::MATH_ERROR, 0, 0};
        return quote_for_base_at(*supply, base_amount, amount_type, Rounding::Down);
    }

    return quote_for_base_at(circulating, base_amount, amount_type, Rounding::Up);
}

SwapAmounts Market::quote_for_base_at(uint64_t supply, uint64_t base_amount,
                                      SwapAmountType amount_type, Rounding rounding) const {
    if (!are_prices_set()) return {errors::PRICES_NOT_SET, 0, 0};

    const PriceCurve& price_curve = amount_type == SwapAmountType::ExactInput
        ? bid_prices_
        : ask_prices_;

    auto quote_precision = pow10(quote_token_decimals_);
    if (!quote_precision) return {errors::MATH_ERROR, 0, 0};

    U128 base_left = normalize_base(base_amount);
    U128 quote_total = 0;

    int32_t status = walk_intervals(
        price_curve, width_scaled_, normalize_base(supply), Traversal::Forward,
        base_left, quote_total,
        [rounding](const Segment& segment, U128 budget) -> std::optional<Step> {
            U128 delta_base = std::min(budget, segment.width - segment.position);
            auto delta_quote = get_delta_quote(segment.price_0, segment.price_1,
                                               segment.width, segment.position,
                                               delta_base, rounding);
            if (!delta_quote) return std::nullopt;
            return Step{delta_base, *delta_quote};
        });
    if (status != errors::OK) return {status, 0, 0};

    // Whatever the curve could not price stays unsettled
    auto base_unfilled = div(base_left * BASE_PRECISION, SCALE, rounding);
    auto base_swapped = base_unfilled
        ? checked_sub<uint64_t>(base_amount, *base_unfilled)
        : std::nullopt;

    auto quote_scaled = checked_mul<U128>(quote_total, *quote_precision);
    auto quote_swapped = quote_scaled ? div(*quote_scaled, SCALE, rounding) : std::nullopt;

    if (!base_swapped || !quote_swapped) return {errors::MATH_ERROR, 0, 0};
    return {errors::OK, *base_swapped, *quote_swapped};
}

// =============================================================================
// Inverse Quote (quote known)
// =============================================================================

SwapAmounts Market::base_for_quote(uint64_t quote_amount, SwapType swap_type) const {
    return swap_type == SwapType::Buy
        ? get_base_amount_out(quote_amount)
        : get_base_amount_in(quote_amount);
}

SwapAmounts Market::get_base_amount_out(uint64_t quote_amount) const {
    return settle_inverse(
        *this, ask_prices_, Traversal::Forward, Rounding::Down, quote_amount,
        [](const Segment& segment, U128 budget) -> std::optional<Step> {
            auto fill = get_delta_base_out(segment.price_0, segment.price_1,
                                           segment.width, segment.position, budget);
            if (!fill) return std::nullopt;
            return Step{fill->quote, fill->base};
        });
}

// Lower intervals are cheaper, so a payout target is met by consuming supply
// downward from the current point
SwapAmounts Market::get_base_amount_in(uint64_t quote_amount) const {
    return settle_inverse(
        *this, bid_prices_, Traversal::Backward, Rounding::Up, quote_amount,
        [](const Segment& segment, U128 budget) -> std::optional<Step> {
            auto fill = get_delta_base_in(segment.price_0, segment.price_1,
                                          segment.width, segment.position, budget);
            if (!fill) return std::nullopt;
            return Step{fill->quote, fill->base};
        });
}

// =============================================================================
// Accounting
// =============================================================================

int32_t Market::apply_swap(SwapType swap_type, uint64_t base_amount) {
    if (swap_type == SwapType::Buy) {
        auto reserve = checked_sub<uint64_t>(base_reserve_, base_amount);
        if (!reserve) return errors::MATH_ERROR;
        base_reserve_ = *reserve;
        return errors::OK;
    }

    auto reserve = checked_add<uint64_t>(base_reserve_, base_amount);
    if (!reserve || *reserve > total_supply_) return errors::MATH_ERROR;
    base_reserve_ = *reserve;
    return errors::OK;
}

uint64_t Market::claim_creator_fees() {
    uint64_t amount = fees_.pending_creator_fees;
    fees_.pending_creator_fees = 0;
    return amount;
}

uint64_t Market::claim_staking_fees() {
    uint64_t amount = fees_.pending_staking_fees;
    fees_.pending_staking_fees = 0;
    return amount;
}

uint64_t Market::circulating_supply() const {
    return base_reserve_ <= total_supply_ ? total_supply_ - base_reserve_ : 0;
}

} // namespace mill
