// =============================================================================
// config.cpp - JSON market configuration
// =============================================================================

#include "mill/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace mill {

using json = nlohmann::json;

namespace {

template <typename T>
T read_unsigned(const json& node, const char* key) {
    const json& value = node.at(key);
    if (!value.is_number_unsigned()) {
        throw std::runtime_error(std::string("Config field must be an unsigned integer: ") + key);
    }
    uint64_t raw = value.get<uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        throw std::runtime_error(std::string("Config field out of range: ") + key);
    }
    return static_cast<T>(raw);
}

PriceCurve read_curve(const json& node, const char* key) {
    const json& values = node.at(key);
    if (!values.is_array() || values.size() != PRICES_LENGTH) {
        throw std::runtime_error(std::string("Config field must hold ") +
                                 std::to_string(PRICES_LENGTH) + " prices: " + key);
    }

    PriceCurve curve{};
    for (size_t i = 0; i < PRICES_LENGTH; ++i) {
        if (!values[i].is_number_unsigned()) {
            throw std::runtime_error(std::string("Config prices must be unsigned integers: ") + key);
        }
        curve[i] = values[i].get<uint64_t>();
    }
    return curve;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Pubkey read_pubkey(const json& node, const char* key) {
    Pubkey out{};
    if (!node.contains(key)) return out;

    std::string hex = node.at(key).get<std::string>();
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }
    if (hex.size() != out.size() * 2) {
        throw std::runtime_error(std::string("Config key must be 32 hex bytes: ") + key);
    }

    for (size_t i = 0; i < out.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::runtime_error(std::string("Config key is not hex: ") + key);
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

}  // namespace

int32_t MarketConfig::apply(Market& market) const {
    int32_t result = market.initialize(keys, quote_token_decimals, total_supply,
                                       creator_fee_share, staking_fee_share);
    if (result != errors::OK) {
        return result;
    }
    return market.check_and_set_prices(bid_prices, ask_prices);
}

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    Config config;

    try {
        json root = json::parse(content);

        if (root.contains("general")) {
            const json& general = root.at("general");
            if (general.contains("log_level")) {
                config.general.log_level = general.at("log_level").get<std::string>();
            }
            const std::string& level = config.general.log_level;
            if (level != "error" && level != "info" && level != "debug") {
                throw std::runtime_error("Config log_level must be error, info or debug: " + level);
            }
        }

        if (root.contains("fees")) {
            const json& fees = root.at("fees");
            if (fees.contains("swap_fee_bps")) {
                config.fees.swap_fee_bps = read_unsigned<uint16_t>(fees, "swap_fee_bps");
            }
            if (fees.contains("referral_fee_share")) {
                config.fees.referral_fee_share = read_unsigned<uint16_t>(fees, "referral_fee_share");
            }
        }

        const json& market = root.at("market");
        config.market.quote_token_decimals = read_unsigned<uint8_t>(market, "quote_token_decimals");
        config.market.total_supply = read_unsigned<uint64_t>(market, "total_supply");
        config.market.creator_fee_share = read_unsigned<uint16_t>(market, "creator_fee_share");
        config.market.staking_fee_share = read_unsigned<uint16_t>(market, "staking_fee_share");
        config.market.bid_prices = read_curve(market, "bid_prices");
        config.market.ask_prices = read_curve(market, "ask_prices");

        if (market.contains("keys")) {
            const json& keys = market.at("keys");
            config.market.keys.config = read_pubkey(keys, "config");
            config.market.keys.creator = read_pubkey(keys, "creator");
            config.market.keys.base_token_mint = read_pubkey(keys, "base_token_mint");
            config.market.keys.quote_token_mint = read_pubkey(keys, "quote_token_mint");
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }

    return config;
}

}  // namespace mill
