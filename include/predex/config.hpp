#ifndef PREDEX_CONFIG_HPP
#define PREDEX_CONFIG_HPP

#include <array>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace predex {

// =============================================================================
// Market Configuration
//
// EA = external asset units (6 decimals), IU = internal units (18 decimals).
// =============================================================================

struct MarketConfig {
    static constexpr uint32_t CURRENT_VERSION = 1;

    uint32_t version = CURRENT_VERSION;
    std::string name = "predex-market";

    // Identity used in the signing domain and as the market's custody account
    Address market_address = addresses::from_id(0xA0000001);
    Address authority = addresses::ZERO;
    uint64_t chain_id = 1;

    I128 scale_factor = pow10(12);                   // EA -> IU

    // Bonding curve
    I128 curve_k = pow10(12);
    I128 curve_scale = pow10(18);
    I128 migration_threshold = 50000 * pow10(6);     // EA
    I128 protocol_fee_bps = 50;

    // Virtual AMM
    I128 price_cap = 990000000000000000LL;           // 0.99 WAD

    // Leverage
    I128 min_collateral = pow10(6);                  // EA
    uint32_t max_leverage = 10;
    uint32_t default_leverage = 5;
    I128 borrow_rate_bps = 1000;
    I128 liquidation_threshold_bps = 12000;
    I128 liquidation_fee_bps = 500;
    I128 keeper_reward_bps = 500;

    // Settlement
    uint64_t claim_cooldown = 30ULL * 24 * 60 * 60;
    I128 base_yield_bps = 500;
    std::array<I128, 3> tier_multiplier_bps = {10000, 15000, 20000};

    std::string log_level = "info";

    // Threshold in internal units
    I128 migration_threshold_iu() const { return migration_threshold * scale_factor; }

    I128 tier_multiplier(UserTier tier) const {
        return tier_multiplier_bps[static_cast<size_t>(tier)];
    }

    // Throws MarketError(INVALID_CONFIG) on the first inconsistent value
    void validate() const;

    // Missing keys keep their defaults. Large integers may be given as
    // decimal strings ("50000000000").
    static MarketConfig from_json(const nlohmann::json& j);
    static MarketConfig from_json_string(std::string_view content);
    static MarketConfig from_file(std::string_view path);

    nlohmann::json to_json() const;
};

} // namespace predex

#endif // PREDEX_CONFIG_HPP
