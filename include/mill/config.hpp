#ifndef MILL_CONFIG_HPP
#define MILL_CONFIG_HPP

#include <optional>
#include <string>
#include <string_view>

#include "market.hpp"

namespace mill {

// General settings for front ends
struct GeneralConfig {
    std::string log_level = "info";  // error | info | debug
};

// Protocol fee applied to swaps
struct FeeConfig {
    uint16_t swap_fee_bps = 100;
    std::optional<uint16_t> referral_fee_share;
};

// Everything needed to create and price one market
struct MarketConfig {
    MarketKeys keys{};
    uint8_t quote_token_decimals = 9;
    uint64_t total_supply = 0;
    uint16_t creator_fee_share = 0;
    uint16_t staking_fee_share = 0;
    PriceCurve bid_prices{};
    PriceCurve ask_prices{};

    // initialize + check_and_set_prices; first failing code is returned
    int32_t apply(Market& market) const;
};

class Config {
public:
    GeneralConfig general;
    FeeConfig fees;
    MarketConfig market;

    Config() = default;

    // Throws std::runtime_error on unreadable or malformed input
    static Config from_file(std::string_view path);
    static Config from_json(std::string_view content);

    bool debug() const { return general.log_level == "debug"; }
};

} // namespace mill

#endif // MILL_CONFIG_HPP
