// =============================================================================
// types.cpp - Address/decimal helpers and error names
// =============================================================================

#include "predex/types.hpp"
#include <algorithm>

namespace predex {

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (uint8_t b : addr) {
        out.push_back(digits[(b >> 4) & 0x0F]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

Address from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw MarketError(errors::INVALID_CONFIG, "address must have 40 hex digits: " + std::string(hex));
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw MarketError(errors::INVALID_CONFIG, "invalid hex digit in address: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// Decimal conversion
// =============================================================================

std::string to_decimal(I128 value) {
    if (value == 0) return "0";

    bool neg = value < 0;
    // Work in unsigned space so the minimum value does not overflow on negation
    U128 mag = neg ? U128(0) - static_cast<U128>(value) : static_cast<U128>(value);

    std::string out;
    while (mag != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (neg) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

I128 parse_decimal(std::string_view text) {
    if (text.empty()) {
        throw MarketError(errors::INVALID_CONFIG, "empty decimal");
    }

    bool neg = false;
    if (text[0] == '-' || text[0] == '+') {
        neg = text[0] == '-';
        text.remove_prefix(1);
    }
    if (text.empty()) {
        throw MarketError(errors::INVALID_CONFIG, "sign without digits");
    }

    constexpr U128 limit = static_cast<U128>(~U128(0) >> 1);
    U128 mag = 0;
    for (char c : text) {
        if (c == '_') continue;
        if (c < '0' || c > '9') {
            throw MarketError(errors::INVALID_CONFIG, "invalid decimal: " + std::string(text));
        }
        U128 digit = static_cast<U128>(c - '0');
        if (mag > (limit - digit) / 10) {
            throw MarketError(errors::MATH_OVERFLOW, "decimal exceeds 128 bits: " + std::string(text));
        }
        mag = mag * 10 + digit;
    }

    I128 value = static_cast<I128>(mag);
    return neg ? -value : value;
}

// =============================================================================
// Enumeration names
// =============================================================================

const char* to_string(Side side) {
    return side == Side::YES ? "YES" : "NO";
}

const char* to_string(Phase phase) {
    switch (phase) {
        case Phase::PRE_MIGRATION: return "PRE_MIGRATION";
        case Phase::PHASE2_ACTIVE: return "PHASE2_ACTIVE";
        case Phase::RESOLVED: return "RESOLVED";
    }
    return "UNKNOWN";
}

const char* to_string(ClaimKind kind) {
    return kind == ClaimKind::PHASE1 ? "PHASE1" : "PHASE2";
}

const char* to_string(UserTier tier) {
    switch (tier) {
        case UserTier::STANDARD: return "STANDARD";
        case UserTier::EARLY: return "EARLY";
        case UserTier::FAN_TOKEN: return "FAN_TOKEN";
    }
    return "UNKNOWN";
}

Side side_from_string(std::string_view text) {
    if (text == "YES" || text == "yes") return Side::YES;
    if (text == "NO" || text == "no") return Side::NO;
    throw MarketError(errors::INVALID_CONFIG, "unknown side: " + std::string(text));
}

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::ALREADY_INITIALIZED: return "ALREADY_INITIALIZED";
        case errors::NOT_INITIALIZED: return "NOT_INITIALIZED";
        case errors::MARKET_MIGRATED: return "MARKET_MIGRATED";
        case errors::MARKET_RESOLVED: return "MARKET_RESOLVED";
        case errors::MARKET_NOT_RESOLVED: return "MARKET_NOT_RESOLVED";
        case errors::PHASE2_NOT_ACTIVE: return "PHASE2_NOT_ACTIVE";
        case errors::POSITION_EXISTS: return "POSITION_EXISTS";
        case errors::NO_ACTIVE_POSITION: return "NO_ACTIVE_POSITION";
        case errors::COLLATERAL_TOO_LOW: return "COLLATERAL_TOO_LOW";
        case errors::INVALID_LEVERAGE: return "INVALID_LEVERAGE";
        case errors::LENGTH_MISMATCH: return "LENGTH_MISMATCH";
        case errors::ZERO_AMOUNT: return "ZERO_AMOUNT";
        case errors::ZERO_OUTPUT: return "ZERO_OUTPUT";
        case errors::INVALID_CONFIG: return "INVALID_CONFIG";
        case errors::SLIPPAGE_EXCEEDED: return "SLIPPAGE_EXCEEDED";
        case errors::INVALID_SIGNATURE: return "INVALID_SIGNATURE";
        case errors::DEADLINE_PASSED: return "DEADLINE_PASSED";
        case errors::COOLDOWN_ACTIVE: return "COOLDOWN_ACTIVE";
        case errors::UNAUTHORIZED: return "UNAUTHORIZED";
        case errors::REENTRANCY: return "REENTRANCY";
        case errors::POSITION_HEALTHY: return "POSITION_HEALTHY";
        case errors::NOTHING_TO_CLAIM: return "NOTHING_TO_CLAIM";
        case errors::NO_WINNING_POSITION: return "NO_WINNING_POSITION";
        case errors::ALREADY_CLAIMED: return "ALREADY_CLAIMED";
        case errors::INSURANCE_INSUFFICIENT: return "INSURANCE_INSUFFICIENT";
        case errors::INSUFFICIENT_BACKING: return "INSUFFICIENT_BACKING";
        case errors::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case errors::UTILIZATION_CAP: return "UTILIZATION_CAP";
        case errors::MATH_OVERFLOW: return "MATH_OVERFLOW";
    }
    return "UNKNOWN_ERROR";
}

} // namespace predex
