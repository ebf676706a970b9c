// Mill C++ CLI Quoting Tool
// Copyright (c) 2025 Lux Partners Limited
// SPDX-License-Identifier: MIT
//
// Loads a market from a JSON config and prices trades against its curve.
// Results are printed as JSON on stdout, diagnostics go to stderr.

#include "mill/mill.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::optional<uint64_t> circulating;
    bool verbose = false;
    std::vector<std::string> command_args;
};

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::optional<uint64_t> parse_amount(const std::string& s) {
    if (s.empty()) return std::nullopt;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    try {
        return std::stoull(s);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string to_hex(const mill::Pubkey& key) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(key.size() * 2);
    for (uint8_t b : key) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

std::optional<mill::SwapType> parse_side(const std::string& s) {
    std::string side = to_lower(s);
    if (side == "buy") return mill::SwapType::Buy;
    if (side == "sell") return mill::SwapType::Sell;
    return std::nullopt;
}

std::optional<mill::SwapAmountType> parse_amount_type(const std::string& s) {
    std::string type = to_lower(s);
    if (type == "exact_input") return mill::SwapAmountType::ExactInput;
    if (type == "exact_output") return mill::SwapAmountType::ExactOutput;
    return std::nullopt;
}

[[noreturn]] void fail(const std::string& message) {
    std::cerr << message << "\n";
    std::exit(1);
}

void check(int32_t error_code, const char* what) {
    if (error_code != mill::errors::OK) {
        fail(std::string(what) + " failed: " + mill::errors::name(error_code) +
             " (" + std::to_string(error_code) + ")");
    }
}

json amounts_json(const mill::SwapAmounts& amounts) {
    return {
        {"base_amount", amounts.base_amount},
        {"quote_amount", amounts.quote_amount}
    };
}

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

json market_info(const mill::Market& market) {
    const auto& keys = market.keys();
    const auto& fees = market.fees();
    return {
        {"version", mill::version()},
        {"keys", {
            {"config", to_hex(keys.config)},
            {"creator", to_hex(keys.creator)},
            {"base_token_mint", to_hex(keys.base_token_mint)},
            {"quote_token_mint", to_hex(keys.quote_token_mint)}
        }},
        {"quote_token_decimals", market.quote_token_decimals()},
        {"total_supply", market.total_supply()},
        {"base_reserve", market.base_reserve()},
        {"circulating_supply", market.circulating_supply()},
        {"width_scaled", market.width_scaled()},
        {"creator_fee_share", fees.creator_fee_share},
        {"staking_fee_share", fees.staking_fee_share},
        {"pending_creator_fees", fees.pending_creator_fees},
        {"pending_staking_fees", fees.pending_staking_fees}
    };
}

json curve_info(const mill::Market& market) {
    json intervals = json::array();
    uint64_t interval_supply = market.total_supply() / mill::INTERVAL_NUMBER;
    const auto& bids = market.bid_prices();
    const auto& asks = market.ask_prices();

    for (size_t i = 0; i < mill::INTERVAL_NUMBER; ++i) {
        intervals.push_back({
            {"index", i},
            {"supply_start", interval_supply * i},
            {"supply_end", interval_supply * (i + 1)},
            {"bid_start", bids[i]},
            {"bid_end", bids[i + 1]},
            {"ask_start", asks[i]},
            {"ask_end", asks[i + 1]}
        });
    }
    return {
        {"circulating_supply", market.circulating_supply()},
        {"intervals", intervals}
    };
}

json run_command(mill::Market& market, const mill::Config& config,
                 const std::vector<std::string>& args) {
    std::string cmd = to_lower(args[0]);

    if (cmd == "info") {
        return market_info(market);
    }
    if (cmd == "curve") {
        return curve_info(market);
    }
    if (cmd == "quote_base") {
        if (args.size() < 3) fail("Usage: mill-cli quote_base <buy|sell> <base_amount>");
        auto side = parse_side(args[1]);
        auto amount = parse_amount(args[2]);
        if (!side) fail("Invalid side: " + args[1]);
        if (!amount) fail("Invalid amount: " + args[2]);

        auto amounts = market.quote_for_base(*amount, *side == mill::SwapType::Buy
                                                          ? mill::SwapAmountType::ExactOutput
                                                          : mill::SwapAmountType::ExactInput);
        check(amounts.error_code, "quote_base");
        return amounts_json(amounts);
    }
    if (cmd == "quote_quote") {
        if (args.size() < 3) fail("Usage: mill-cli quote_quote <buy|sell> <quote_amount>");
        auto side = parse_side(args[1]);
        auto amount = parse_amount(args[2]);
        if (!side) fail("Invalid side: " + args[1]);
        if (!amount) fail("Invalid amount: " + args[2]);

        auto amounts = market.base_for_quote(*amount, *side);
        check(amounts.error_code, "quote_quote");
        return amounts_json(amounts);
    }
    if (cmd == "swap") {
        if (args.size() < 4) {
            fail("Usage: mill-cli swap <buy|sell> <exact_input|exact_output> <amount>");
        }
        auto side = parse_side(args[1]);
        auto amount_type = parse_amount_type(args[2]);
        auto amount = parse_amount(args[3]);
        if (!side) fail("Invalid side: " + args[1]);
        if (!amount_type) fail("Invalid amount type: " + args[2]);
        if (!amount) fail("Invalid amount: " + args[3]);

        mill::SwapParams params{*side, *amount_type, *amount,
                                config.fees.swap_fee_bps, config.fees.referral_fee_share};
        auto result = mill::swap(market, params);
        check(result.error_code, "swap");

        return {
            {"base_amount", result.base_amount},
            {"quote_amount", result.quote_amount},
            {"swap_fee", result.swap_fee},
            {"fees", {
                {"creator", result.fees.creator_fee},
                {"staking", result.fees.staking_fee},
                {"protocol", result.fees.protocol_fee},
                {"referral", result.fees.referral_fee}
            }},
            {"circulating_supply", market.circulating_supply()}
        };
    }

    fail("Unknown command: " + cmd);
}

//------------------------------------------------------------------------------
// Arguments
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "Mill bonding curve quoting tool\n\n"
              << "Usage: " << prog << " -c <config> [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <path>     Market config (JSON)\n"
              << "      --circulating <n>   Start from n base units already sold\n"
              << "  -v, --verbose           Diagnostics on stderr\n"
              << "  -h, --help              Show this help message\n\n"
              << "Commands:\n"
              << "  info\n"
              << "  curve\n"
              << "  quote_base <buy|sell> <base_amount>\n"
              << "  quote_quote <buy|sell> <quote_amount>\n"
              << "  swap <buy|sell> <exact_input|exact_output> <amount>\n\n"
              << "Examples:\n"
              << "  " << prog << " -c market.json curve\n"
              << "  " << prog << " -c market.json quote_base buy 1000000000000\n"
              << "  " << prog << " -c market.json --circulating 5000000 swap sell exact_input 1000000\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) fail("Missing config argument");
            options.config_path = argv[++i];
        } else if (arg == "--circulating") {
            if (i + 1 >= argc) fail("Missing circulating supply argument");
            options.circulating = parse_amount(argv[++i]);
            if (!options.circulating) fail(std::string("Invalid circulating supply: ") + argv[i]);
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-') {
            while (i < argc) {
                options.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            fail("Unknown option: " + arg);
        }
        ++i;
    }

    if (options.config_path.empty()) fail("No config specified. Use -h for help.");
    if (options.command_args.empty()) fail("No command specified. Use -h for help.");

    return options;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    mill::Config config;
    try {
        config = mill::Config::from_file(options.config_path);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    bool verbose = options.verbose || config.debug();

    mill::Market market;
    check(config.market.apply(market), "market setup");

    if (options.circulating) {
        check(market.apply_swap(mill::SwapType::Buy, *options.circulating), "circulating supply");
    }

    if (verbose) {
        std::cerr << "Loaded " << options.config_path
                  << " (total_supply=" << market.total_supply()
                  << ", circulating=" << market.circulating_supply()
                  << ", quote_decimals=" << static_cast<int>(market.quote_token_decimals())
                  << ", swap_fee_bps=" << config.fees.swap_fee_bps << ")\n";
    }

    json out = run_command(market, config, options.command_args);
    std::cout << out.dump(2) << "\n";
    return 0;
}
