// Mill - Swap Settlement Tests

#include <catch2/catch.hpp>
#include <mill/swap.hpp>

#include <initializer_list>

#include "test_helpers.hpp"

using namespace mill;
using namespace mill::test;

namespace {

constexpr uint16_t FEE_BPS = 100;

SwapParams params(SwapType swap_type, SwapAmountType amount_type, uint64_t amount,
                  std::optional<uint16_t> referral_fee_share = std::nullopt) {
    return SwapParams{swap_type, amount_type, amount, FEE_BPS, referral_fee_share};
}

} // namespace

TEST_CASE("Buy swaps", "[swap]") {
    Market market = make_market();

    SECTION("Exact base out") {
        auto result = swap(market, params(SwapType::Buy, SwapAmountType::ExactOutput, INTERVAL_SUPPLY));
        REQUIRE(result.error_code == errors::OK);
        REQUIRE(result.base_amount == INTERVAL_SUPPLY);
        REQUIRE(result.swap_fee == 1500000);
        REQUIRE(result.quote_amount == 151500000);

        REQUIRE(result.fees.creator_fee == 300000);
        REQUIRE(result.fees.staking_fee == 900000);
        REQUIRE(result.fees.protocol_fee == 300000);
        REQUIRE(result.fees.referral_fee == 0);

        REQUIRE(market.circulating_supply() == INTERVAL_SUPPLY);
        REQUIRE(market.fees().pending_creator_fees == 300000);
        REQUIRE(market.fees().pending_staking_fees == 900000);
    }

    SECTION("Exact quote in") {
        auto result = swap(market, params(SwapType::Buy, SwapAmountType::ExactInput, 151500000));
        REQUIRE(result.error_code == errors::OK);
        REQUIRE(result.base_amount == INTERVAL_SUPPLY);
        REQUIRE(result.swap_fee == 1500000);
        REQUIRE(result.quote_amount == 151500000);
        REQUIRE(market.circulating_supply() == INTERVAL_SUPPLY);
    }

    SECTION("Exact quote in never spends more than offered") {
        auto result = swap(market, params(SwapType::Buy, SwapAmountType::ExactInput, 77777777));
        REQUIRE(result.error_code == errors::OK);
        REQUIRE(result.base_amount > 0);
        REQUIRE(result.quote_amount <= 77777777);
    }

    SECTION("Referral share of the protocol remainder") {
        auto result = swap(market, params(SwapType::Buy, SwapAmountType::ExactOutput,
                                          INTERVAL_SUPPLY, 5000));
        REQUIRE(result.error_code == errors::OK);
        REQUIRE(result.fees.referral_fee == 150000);
        REQUIRE(result.fees.protocol_fee == 150000);
    }

    SECTION("Buy past the end of the curve settles what is left") {
        auto result = swap(market, params(SwapType::Buy, SwapAmountType::ExactOutput, 2 * TOTAL_SUPPLY));
        REQUIRE(result.error_code == errors::OK);
        REQUIRE(result.base_amount == TOTAL_SUPPLY);
        REQUIRE(result.quote_amount == 6060000000ULL);
        REQUIRE(market.base_reserve() == 0);
    }
}

TEST_CASE("Sell swaps", "[swap]") {
    Market market = make_market();
    REQUIRE(swap(market, params(SwapType::Buy, SwapAmountType::ExactOutput, INTERVAL_SUPPLY)).error_code ==
            errors::OK);

    SECTION("Exact base in") {
        auto result = swap(market, params(SwapType::Sell, SwapAmountType::ExactInput, INTERVAL_SUPPLY));
        REQUIRE(result.error_code == errors::OK);
        REQUIRE(result.base_amount == INTERVAL_SUPPLY);
        REQUIRE(result.swap_fee == 1350000);
        REQUIRE(result.quote_amount == 133650000);
        REQUIRE(market.circulating_supply() == 0);
        REQUIRE(market.base_reserve() == TOTAL_SUPPLY);
    }

    SECTION("Exact quote out") {
        auto result = swap(market, params(SwapType::Sell, SwapAmountType::ExactOutput, 133650000));
        REQUIRE(result.error_code == errors::OK);
        REQUIRE(result.base_amount == INTERVAL_SUPPLY);
        REQUIRE(result.quote_amount == 133650000);
        REQUIRE(market.circulating_supply() == 0);
    }

    SECTION("Exact quote out always pays at least the target") {
        auto result = swap(market, params(SwapType::Sell, SwapAmountType::ExactOutput, 12345678));
        REQUIRE(result.error_code == errors::OK);
        REQUIRE(result.quote_amount >= 12345678);
        REQUIRE(result.base_amount < INTERVAL_SUPPLY);
    }

    SECTION("Selling more than circulates changes nothing") {
        Market before = market;
        auto result = swap(market, params(SwapType::Sell, SwapAmountType::ExactInput, INTERVAL_SUPPLY + 1));
        REQUIRE(result.error_code == errors::MATH_ERROR);
        REQUIRE(market.base_reserve() == before.base_reserve());
        REQUIRE(market.fees().pending_creator_fees == before.fees().pending_creator_fees);
        REQUIRE(market.fees().pending_staking_fees == before.fees().pending_staking_fees);
    }
}

TEST_CASE("Swap parameter checks", "[swap]") {
    Market market = make_market();

    SECTION("Zero amount") {
        auto result = swap(market, params(SwapType::Buy, SwapAmountType::ExactInput, 0));
        REQUIRE(result.error_code == errors::INVALID_AMOUNT);
    }

    SECTION("Fee of 100% or more") {
        SwapParams p = params(SwapType::Buy, SwapAmountType::ExactOutput, 1000);
        p.fee_bps = MAX_BPS;
        REQUIRE(swap(market, p).error_code == errors::INVALID_SWAP_FEE);
        REQUIRE(market.circulating_supply() == 0);
    }

    SECTION("Zero fee") {
        SwapParams p = params(SwapType::Buy, SwapAmountType::ExactOutput, INTERVAL_SUPPLY);
        p.fee_bps = 0;
        auto result = swap(market, p);
        REQUIRE(result.error_code == errors::OK);
        REQUIRE(result.swap_fee == 0);
        REQUIRE(result.quote_amount == 150000000);
    }

    SECTION("Prices not set") {
        Market bare;
        REQUIRE(bare.initialize(MarketKeys{}, QUOTE_DECIMALS, TOTAL_SUPPLY, 0, 0) == errors::OK);
        auto result = swap(bare, params(SwapType::Buy, SwapAmountType::ExactOutput, 1000));
        REQUIRE(result.error_code == errors::PRICES_NOT_SET);
        REQUIRE(bare.circulating_supply() == 0);
    }

    SECTION("Budget too small to buy any base") {
        Market before = market;
        auto result = swap(market, params(SwapType::Buy, SwapAmountType::ExactInput, 1));
        REQUIRE(result.error_code == errors::INVALID_AMOUNT);
        REQUIRE(result.quote_amount == 0);
        REQUIRE(market.circulating_supply() == 0);
        REQUIRE(market.base_reserve() == before.base_reserve());
    }

    SECTION("Buying from a sold out curve") {
        REQUIRE(swap(market, params(SwapType::Buy, SwapAmountType::ExactOutput, TOTAL_SUPPLY)).error_code ==
                errors::OK);
        Market before = market;
        auto result = swap(market, params(SwapType::Buy, SwapAmountType::ExactOutput, 1000));
        REQUIRE(result.error_code == errors::INVALID_AMOUNT);
        REQUIRE(market.base_reserve() == 0);
        REQUIRE(market.fees().pending_creator_fees == before.fees().pending_creator_fees);
        REQUIRE(market.fees().pending_staking_fees == before.fees().pending_staking_fees);
    }

    SECTION("Quote out with nothing circulating pays nothing") {
        for (uint8_t decimals : {QUOTE_DECIMALS, MAX_QUOTE_TOKEN_DECIMALS}) {
            Market fresh = make_market_with_decimals(decimals);
            SwapParams p = params(SwapType::Sell, SwapAmountType::ExactOutput, 9999);
            p.fee_bps = 0;
            auto result = swap(fresh, p);
            REQUIRE(result.error_code == errors::INVALID_AMOUNT);
            REQUIRE(result.base_amount == 0);
            REQUIRE(result.quote_amount == 0);
            REQUIRE(fresh.circulating_supply() == 0);
            REQUIRE(fresh.base_reserve() == TOTAL_SUPPLY);
        }
    }

    SECTION("Fee overflow rolls back the trade") {
        Market market_with_fees = make_market(10000, 0);
        REQUIRE(market_with_fees.distribute_fee(UINT64_MAX, std::nullopt).error_code == errors::OK);

        auto result = swap(market_with_fees, params(SwapType::Buy, SwapAmountType::ExactOutput,
                                                    INTERVAL_SUPPLY));
        REQUIRE(result.error_code == errors::MATH_ERROR);
        REQUIRE(market_with_fees.circulating_supply() == 0);
        REQUIRE(market_with_fees.fees().pending_creator_fees == UINT64_MAX);
    }
}

TEST_CASE("Buy then sell round trip loses the spread and fees", "[swap]") {
    Market market = make_market();

    auto buy = swap(market, params(SwapType::Buy, SwapAmountType::ExactInput, 1000000000));
    REQUIRE(buy.error_code == errors::OK);

    auto sell = swap(market, params(SwapType::Sell, SwapAmountType::ExactInput, buy.base_amount));
    REQUIRE(sell.error_code == errors::OK);
    REQUIRE(sell.quote_amount < buy.quote_amount);
    REQUIRE(market.circulating_supply() == 0);
}
