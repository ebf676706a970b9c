// =============================================================================
// swap.cpp - Trade settlement against a market curve
// =============================================================================

#include "mill/swap.hpp"
#include "mill/math.hpp"

namespace mill {

namespace {

SwapResult failed(int32_t error_code) {
    SwapResult result{};
    result.error_code = error_code;
    return result;
}

// Fee charged on the quote leg, rounded in the protocol's favour
std::optional<uint64_t> fee_on(uint64_t quote_amount, uint16_t fee_bps) {
    auto fee = mul_div(quote_amount, fee_bps, MAX_BPS, Rounding::Up);
    if (!fee || *fee > U128(UINT64_MAX)) return std::nullopt;
    return static_cast<uint64_t>(*fee);
}

} // anonymous namespace

SwapResult swap(Market& market, const SwapParams& params) {
    if (params.amount == 0) {
        return failed(errors::INVALID_AMOUNT);
    }
    if (params.fee_bps >= MAX_BPS) {
        return failed(errors::INVALID_SWAP_FEE);
    }

    // Work on a copy, commit on success
    Market next = market;

    SwapAmounts amounts{errors::OK, 0, 0};

    if (params.swap_type == SwapType::Buy) {
        if (params.amount_type == SwapAmountType::ExactOutput) {
            amounts = next.quote_for_base(params.amount, SwapAmountType::ExactOutput);
        } else {
            // Strip the fee from the gross budget before pricing
            auto budget = mul_div(params.amount, MAX_BPS,
                                  U128(MAX_BPS) + params.fee_bps, Rounding::Down);
            if (!budget) return failed(errors::MATH_ERROR);
            amounts = next.get_base_amount_out(static_cast<uint64_t>(*budget));
        }
    } else {
        if (params.amount_type == SwapAmountType::ExactInput) {
            amounts = next.quote_for_base(params.amount, SwapAmountType::ExactInput);
        } else {
            // Gross up the net payout so it survives the fee
            auto target = mul_div(params.amount, MAX_BPS,
                                  U128(MAX_BPS) - params.fee_bps, Rounding::Up);
            if (!target || *target > U128(UINT64_MAX)) return failed(errors::MATH_ERROR);
            amounts = next.get_base_amount_in(static_cast<uint64_t>(*target));
        }
    }

    if (amounts.error_code != errors::OK) {
        return failed(amounts.error_code);
    }
    // Nothing moves, so nothing is charged or paid
    if (amounts.base_amount == 0) {
        return failed(errors::INVALID_AMOUNT);
    }

    auto swap_fee = fee_on(amounts.quote_amount, params.fee_bps);
    if (!swap_fee) return failed(errors::MATH_ERROR);

    std::optional<uint64_t> quote_amount = params.swap_type == SwapType::Buy
        ? checked_add<uint64_t>(amounts.quote_amount, *swap_fee)
        : checked_sub<uint64_t>(amounts.quote_amount, *swap_fee);
    if (!quote_amount) return failed(errors::MATH_ERROR);

    int32_t status = next.apply_swap(params.swap_type, amounts.base_amount);
    if (status != errors::OK) return failed(status);

    FeeDistribution fees = next.distribute_fee(*swap_fee, params.referral_fee_share);
    if (fees.error_code != errors::OK) return failed(fees.error_code);

    market = next;

    SwapResult result{};
    result.error_code = errors::OK;
    result.base_amount = amounts.base_amount;
    result.quote_amount = *quote_amount;
    result.swap_fee = *swap_fee;
    result.fees = fees;
    return result;
}

} // namespace mill
