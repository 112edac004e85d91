#ifndef PREDEX_TYPES_HPP
#define PREDEX_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <stdexcept>
#include <vector>

namespace predex {

// =============================================================================
// Addresses (EVM-style 20-byte account identifiers)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Deterministic address from a small numeric id (tests, simulations)
constexpr Address from_id(uint32_t id) {
    Address addr = {};
    addr[16] = static_cast<uint8_t>((id >> 24) & 0xFF);
    addr[17] = static_cast<uint8_t>((id >> 16) & 0xFF);
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

std::string to_hex(const Address& addr);

// Accepts "0x" prefixed or bare 40-digit hex
Address from_hex(std::string_view hex);

} // namespace addresses

// =============================================================================
// Fixed-Point Arithmetic (WAD = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 WAD = 1000000000000000000LL;   // 1e18
constexpr I128 HALF_WAD = 500000000000000000LL;
constexpr I128 BPS = 10000;
constexpr uint64_t SECONDS_PER_YEAR = 365ULL * 24 * 60 * 60;

// 10^n as I128 (n <= 38)
constexpr I128 pow10(unsigned n) {
    I128 v = 1;
    for (unsigned i = 0; i < n; ++i) v *= 10;
    return v;
}

// Decimal rendering/parsing for values that do not fit a JSON number
std::string to_decimal(I128 value);
I128 parse_decimal(std::string_view text);

// =============================================================================
// Market Enumerations
// =============================================================================

enum class Side : uint8_t {
    YES = 0,
    NO = 1
};

constexpr Side opposite(Side side) {
    return side == Side::YES ? Side::NO : Side::YES;
}

constexpr size_t side_index(Side side) {
    return static_cast<size_t>(side);
}

enum class Phase : uint8_t {
    PRE_MIGRATION = 0,
    PHASE2_ACTIVE = 1,
    RESOLVED = 2
};

enum class ClaimKind : uint8_t {
    PHASE1 = 0,   // outcome-token balance
    PHASE2 = 1    // leveraged position
};

enum class UserTier : uint8_t {
    STANDARD = 0,
    EARLY = 1,
    FAN_TOKEN = 2
};

const char* to_string(Side side);
const char* to_string(Phase phase);
const char* to_string(ClaimKind kind);
const char* to_string(UserTier tier);

Side side_from_string(std::string_view text);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Lifecycle
constexpr int32_t ALREADY_INITIALIZED = -1;
constexpr int32_t NOT_INITIALIZED = -2;
constexpr int32_t MARKET_MIGRATED = -3;
constexpr int32_t MARKET_RESOLVED = -4;
constexpr int32_t MARKET_NOT_RESOLVED = -5;
constexpr int32_t PHASE2_NOT_ACTIVE = -6;
constexpr int32_t POSITION_EXISTS = -7;
constexpr int32_t NO_ACTIVE_POSITION = -8;

// Input validation
constexpr int32_t COLLATERAL_TOO_LOW = -10;
constexpr int32_t INVALID_LEVERAGE = -11;
constexpr int32_t LENGTH_MISMATCH = -12;
constexpr int32_t ZERO_AMOUNT = -13;
constexpr int32_t ZERO_OUTPUT = -14;
constexpr int32_t INVALID_CONFIG = -15;

// Guards
constexpr int32_t SLIPPAGE_EXCEEDED = -20;
constexpr int32_t INVALID_SIGNATURE = -21;
constexpr int32_t DEADLINE_PASSED = -22;
constexpr int32_t COOLDOWN_ACTIVE = -23;
constexpr int32_t UNAUTHORIZED = -24;
constexpr int32_t REENTRANCY = -25;
constexpr int32_t POSITION_HEALTHY = -26;
constexpr int32_t NOTHING_TO_CLAIM = -27;
constexpr int32_t NO_WINNING_POSITION = -28;
constexpr int32_t ALREADY_CLAIMED = -29;

// Solvency
constexpr int32_t INSURANCE_INSUFFICIENT = -30;
constexpr int32_t INSUFFICIENT_BACKING = -31;
constexpr int32_t INSUFFICIENT_BALANCE = -32;
constexpr int32_t UTILIZATION_CAP = -33;
constexpr int32_t MATH_OVERFLOW = -34;
}

// Stable reason string for an error code ("POSITION_HEALTHY", ...)
const char* error_name(int32_t code);

// Every failed market call surfaces as a MarketError
class MarketError : public std::runtime_error {
public:
    MarketError(int32_t code, const std::string& msg)
        : std::runtime_error(std::string(error_name(code)) + ": " + msg), code_(code) {}

    int32_t code() const noexcept { return code_; }
    const char* reason() const noexcept { return error_name(code_); }

private:
    int32_t code_;
};

// =============================================================================
// Signatures
// =============================================================================

using Signature = std::vector<uint8_t>;

} // namespace predex

#endif // PREDEX_TYPES_HPP
