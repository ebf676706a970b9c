// Mill - Fee Distribution Tests

#include <catch2/catch.hpp>
#include <mill/market.hpp>

#include "test_helpers.hpp"

using namespace mill;

namespace {

uint64_t total(const FeeDistribution& fees) {
    return fees.creator_fee + fees.staking_fee + fees.protocol_fee + fees.referral_fee;
}

} // namespace

TEST_CASE("Fee distribution", "[fees]") {
    MarketFees fees;
    fees.creator_fee_share = 2000;
    fees.staking_fee_share = 6000;

    SECTION("Shares with a referrer") {
        auto split = fees.distribute_fee(1001, 5000);
        REQUIRE(split.error_code == errors::OK);
        REQUIRE(split.creator_fee == 200);
        REQUIRE(split.staking_fee == 600);
        REQUIRE(split.referral_fee == 100);
        REQUIRE(split.protocol_fee == 101);
        REQUIRE(total(split) == 1001);

        REQUIRE(fees.pending_creator_fees == 200);
        REQUIRE(fees.pending_staking_fees == 600);
    }

    SECTION("No referrer") {
        auto split = fees.distribute_fee(1000, std::nullopt);
        REQUIRE(split.error_code == errors::OK);
        REQUIRE(split.referral_fee == 0);
        REQUIRE(split.protocol_fee == 200);
        REQUIRE(total(split) == 1000);
    }

    SECTION("Referrer takes nothing or everything") {
        auto none = fees.distribute_fee(1000, 0);
        REQUIRE(none.referral_fee == 0);
        REQUIRE(none.protocol_fee == 200);

        auto all = fees.distribute_fee(1000, 10000);
        REQUIRE(all.referral_fee == 200);
        REQUIRE(all.protocol_fee == 0);
    }

    SECTION("Pending balances accumulate") {
        fees.distribute_fee(1000, std::nullopt);
        fees.distribute_fee(500, std::nullopt);
        REQUIRE(fees.pending_creator_fees == 300);
        REQUIRE(fees.pending_staking_fees == 900);
    }

    SECTION("Zero fee") {
        auto split = fees.distribute_fee(0, 5000);
        REQUIRE(split.error_code == errors::OK);
        REQUIRE(total(split) == 0);
    }

    SECTION("Overflowing a pending balance changes nothing") {
        fees.pending_creator_fees = UINT64_MAX - 10;
        fees.pending_staking_fees = 7;

        auto split = fees.distribute_fee(1000, std::nullopt);
        REQUIRE(split.error_code == errors::MATH_ERROR);
        REQUIRE(fees.pending_creator_fees == UINT64_MAX - 10);
        REQUIRE(fees.pending_staking_fees == 7);
    }
}

TEST_CASE("Rounding dust goes to the protocol", "[fees]") {
    MarketFees fees;
    fees.creator_fee_share = 3000;
    fees.staking_fee_share = 7000;

    auto split = fees.distribute_fee(999, std::nullopt);
    REQUIRE(split.error_code == errors::OK);
    REQUIRE(split.creator_fee == 299);
    REQUIRE(split.staking_fee == 699);
    REQUIRE(split.protocol_fee == 1);
    REQUIRE(total(split) == 999);
}

TEST_CASE("Fee shares always sum to the swap fee", "[fees]") {
    const uint16_t shares[][2] = {{0, 0}, {1, 1}, {3333, 3333}, {10000, 0}, {0, 10000}, {4999, 5001}};
    const uint64_t amounts[] = {1, 7, 999, 123456789, UINT64_MAX / 2};

    for (const auto& share : shares) {
        for (uint64_t amount : amounts) {
            MarketFees fees;
            fees.creator_fee_share = share[0];
            fees.staking_fee_share = share[1];

            auto split = fees.distribute_fee(amount, 2500);
            REQUIRE(split.error_code == errors::OK);
            REQUIRE(split.creator_fee + split.staking_fee + split.protocol_fee +
                    split.referral_fee == amount);
        }
    }
}

TEST_CASE("Claiming pending fees", "[fees]") {
    Market market = mill::test::make_market();

    REQUIRE(market.distribute_fee(1000, std::nullopt).error_code == errors::OK);
    REQUIRE(market.claim_creator_fees() == 200);
    REQUIRE(market.fees().pending_creator_fees == 0);
    REQUIRE(market.fees().pending_staking_fees == 600);

    REQUIRE(market.claim_staking_fees() == 600);
    REQUIRE(market.fees().pending_staking_fees == 0);
    REQUIRE(market.claim_creator_fees() == 0);
}
