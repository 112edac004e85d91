// =============================================================================
// config.cpp - MarketConfig loading and validation
// =============================================================================

#include "predex/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace predex {

using json = nlohmann::json;

namespace {

// Integer or decimal string
I128 as_i128(const json& v, const std::string& what) {
    if (v.is_string()) return parse_decimal(v.get<std::string>());
    if (v.is_number_unsigned()) return static_cast<I128>(v.get<uint64_t>());
    if (v.is_number_integer()) return static_cast<I128>(v.get<int64_t>());
    throw MarketError(errors::INVALID_CONFIG, "expected integer for " + what);
}

I128 read_i128(const json& j, const char* key, I128 fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    return as_i128(*it, key);
}

uint64_t read_u64(const json& j, const char* key, uint64_t fallback) {
    I128 v = read_i128(j, key, static_cast<I128>(fallback));
    if (v < 0 || v > static_cast<I128>(UINT64_MAX)) {
        throw MarketError(errors::INVALID_CONFIG, std::string("out of range: ") + key);
    }
    return static_cast<uint64_t>(v);
}

uint32_t read_u32(const json& j, const char* key, uint32_t fallback) {
    uint64_t v = read_u64(j, key, fallback);
    if (v > UINT32_MAX) {
        throw MarketError(errors::INVALID_CONFIG, std::string("out of range: ") + key);
    }
    return static_cast<uint32_t>(v);
}

std::string read_string(const json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    if (!it->is_string()) {
        throw MarketError(errors::INVALID_CONFIG, std::string("expected string for ") + key);
    }
    return it->get<std::string>();
}

Address read_address(const json& j, const char* key, const Address& fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    if (!it->is_string()) {
        throw MarketError(errors::INVALID_CONFIG, std::string("expected hex address for ") + key);
    }
    return addresses::from_hex(it->get<std::string>());
}

void require(bool condition, const char* what) {
    if (!condition) {
        throw MarketError(errors::INVALID_CONFIG, what);
    }
}

} // anonymous namespace

void MarketConfig::validate() const {
    require(version == CURRENT_VERSION, "unsupported config version");
    require(!addresses::is_zero(market_address), "market_address must be set");
    require(!addresses::is_zero(authority), "authority must be set");
    require(scale_factor > 0, "scale_factor must be positive");
    require(curve_k > 0 && curve_scale > 0, "curve parameters must be positive");
    require(migration_threshold > 0, "migration_threshold must be positive");
    require(protocol_fee_bps >= 0 && protocol_fee_bps < BPS, "protocol_fee_bps out of range");
    require(price_cap > WAD / 2 && price_cap < WAD, "price_cap must lie in (0.5, 1.0)");
    require(min_collateral > 0, "min_collateral must be positive");
    require(max_leverage >= 1, "max_leverage must be at least 1");
    require(default_leverage >= 1 && default_leverage <= max_leverage,
            "default_leverage must lie in [1, max_leverage]");
    require(borrow_rate_bps >= 0, "borrow_rate_bps must not be negative");
    require(liquidation_threshold_bps > 0, "liquidation_threshold_bps must be positive");
    require(liquidation_fee_bps >= 0 && keeper_reward_bps >= 0 &&
            liquidation_fee_bps + keeper_reward_bps <= BPS,
            "liquidation_fee_bps + keeper_reward_bps must not exceed 10000");
    require(base_yield_bps >= 0, "base_yield_bps must not be negative");
    for (I128 mult : tier_multiplier_bps) {
        require(mult >= 0, "tier multipliers must not be negative");
    }
}

MarketConfig MarketConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw MarketError(errors::INVALID_CONFIG, "config must be a JSON object");
    }

    MarketConfig c;
    c.version = read_u32(j, "version", c.version);
    c.name = read_string(j, "name", c.name);
    c.market_address = read_address(j, "market_address", c.market_address);
    c.authority = read_address(j, "authority", c.authority);
    c.chain_id = read_u64(j, "chain_id", c.chain_id);
    c.scale_factor = read_i128(j, "scale_factor", c.scale_factor);

    c.curve_k = read_i128(j, "curve_k", c.curve_k);
    c.curve_scale = read_i128(j, "curve_scale", c.curve_scale);
    c.migration_threshold = read_i128(j, "migration_threshold", c.migration_threshold);
    c.protocol_fee_bps = read_i128(j, "protocol_fee_bps", c.protocol_fee_bps);
    c.price_cap = read_i128(j, "price_cap", c.price_cap);

    c.min_collateral = read_i128(j, "min_collateral", c.min_collateral);
    c.max_leverage = read_u32(j, "max_leverage", c.max_leverage);
    c.default_leverage = read_u32(j, "default_leverage", c.default_leverage);
    c.borrow_rate_bps = read_i128(j, "borrow_rate_bps", c.borrow_rate_bps);
    c.liquidation_threshold_bps = read_i128(j, "liquidation_threshold_bps", c.liquidation_threshold_bps);
    c.liquidation_fee_bps = read_i128(j, "liquidation_fee_bps", c.liquidation_fee_bps);
    c.keeper_reward_bps = read_i128(j, "keeper_reward_bps", c.keeper_reward_bps);

    c.claim_cooldown = read_u64(j, "claim_cooldown", c.claim_cooldown);
    c.base_yield_bps = read_i128(j, "base_yield_bps", c.base_yield_bps);

    auto tiers = j.find("tier_multiplier_bps");
    if (tiers != j.end() && !tiers->is_null()) {
        // Either {"STANDARD": .., "EARLY": .., "FAN_TOKEN": ..} or a 3-element array
        if (tiers->is_array()) {
            if (tiers->size() != c.tier_multiplier_bps.size()) {
                throw MarketError(errors::INVALID_CONFIG, "tier_multiplier_bps needs 3 entries");
            }
            for (size_t i = 0; i < c.tier_multiplier_bps.size(); ++i) {
                c.tier_multiplier_bps[i] = as_i128((*tiers)[i], "tier_multiplier_bps[" + std::to_string(i) + "]");
            }
        } else if (tiers->is_object()) {
            const UserTier all[] = {UserTier::STANDARD, UserTier::EARLY, UserTier::FAN_TOKEN};
            for (UserTier tier : all) {
                size_t idx = static_cast<size_t>(tier);
                c.tier_multiplier_bps[idx] = read_i128(*tiers, to_string(tier), c.tier_multiplier_bps[idx]);
            }
        } else {
            throw MarketError(errors::INVALID_CONFIG, "tier_multiplier_bps must be an array or an object");
        }
    }

    c.log_level = read_string(j, "log_level", c.log_level);

    c.validate();
    return c;
}

MarketConfig MarketConfig::from_json_string(std::string_view content) {
    json j;
    try {
        j = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw MarketError(errors::INVALID_CONFIG, std::string("malformed config: ") + e.what());
    }
    return from_json(j);
}

MarketConfig MarketConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw MarketError(errors::INVALID_CONFIG, "Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
}

json MarketConfig::to_json() const {
    return json{
        {"version", version},
        {"name", name},
        {"market_address", addresses::to_hex(market_address)},
        {"authority", addresses::to_hex(authority)},
        {"chain_id", chain_id},
        {"scale_factor", to_decimal(scale_factor)},
        {"curve_k", to_decimal(curve_k)},
        {"curve_scale", to_decimal(curve_scale)},
        {"migration_threshold", to_decimal(migration_threshold)},
        {"protocol_fee_bps", to_decimal(protocol_fee_bps)},
        {"price_cap", to_decimal(price_cap)},
        {"min_collateral", to_decimal(min_collateral)},
        {"max_leverage", max_leverage},
        {"default_leverage", default_leverage},
        {"borrow_rate_bps", to_decimal(borrow_rate_bps)},
        {"liquidation_threshold_bps", to_decimal(liquidation_threshold_bps)},
        {"liquidation_fee_bps", to_decimal(liquidation_fee_bps)},
        {"keeper_reward_bps", to_decimal(keeper_reward_bps)},
        {"claim_cooldown", claim_cooldown},
        {"base_yield_bps", to_decimal(base_yield_bps)},
        {"tier_multiplier_bps", {
            {"STANDARD", to_decimal(tier_multiplier_bps[0])},
            {"EARLY", to_decimal(tier_multiplier_bps[1])},
            {"FAN_TOKEN", to_decimal(tier_multiplier_bps[2])}
        }},
        {"log_level", log_level}
    };
}

} // namespace predex
