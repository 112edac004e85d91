#ifndef PREDEX_SETTLEMENT_HPP
#define PREDEX_SETTLEMENT_HPP

#include <array>

#include "types.hpp"

namespace predex {

// =============================================================================
// Resolution Record
// =============================================================================

struct Resolution {
    bool resolved = false;
    Side winning_side = Side::YES;
    I128 settlement_price = 0;     // WAD, <= 1.0
    uint64_t resolved_at = 0;
    I128 total_liabilities = 0;    // winning shares (tokens + open interest)
    I128 outstanding_claims = 0;   // external units still owed to winners
};

// =============================================================================
// SettlementGuardian - solvency-capped settlement and claim math
//
// At resolution every winning share is promised settlement_price, which is
// par unless the backing cannot cover all winning shares, in which case all
// claims are cut by the same ratio. Claim order never changes a payout.
// =============================================================================

class SettlementGuardian {
public:
    struct Params {
        I128 scale_factor = 1;
        uint64_t claim_cooldown = 0;
        I128 base_yield_bps = 0;
        std::array<I128, 3> tier_multiplier_bps = {BPS, BPS, BPS};
    };

    SettlementGuardian() = default;
    explicit SettlementGuardian(const Params& params) : params_(params) {}

    // backing in external units, liabilities in shares.
    // Throws MARKET_RESOLVED on a second call.
    const Resolution& resolve(Side winner, I128 backing, I128 liabilities, uint64_t now);

    bool resolved() const { return state_.resolved; }
    const Resolution& state() const { return state_; }

    // Throws MARKET_NOT_RESOLVED
    void require_resolved() const;

    // Throws COOLDOWN_ACTIVE until claim_cooldown has elapsed since resolution
    void require_sweepable(uint64_t now) const;

    // shares * settlement_price / WAD, in external units
    I128 payout_for(I128 shares) const;

    // collateral * base_yield * tier / 10000^2
    I128 tier_bonus(I128 collateral, UserTier tier) const;

    // Largest part of `bonus` that keeps cash_after_claim >= the claims still
    // owed to other winners. Call after settle_claim for the current claim.
    I128 cap_bonus(I128 bonus, I128 cash_after_claim) const;

    // Remove a paid claim from the outstanding total
    void settle_claim(I128 amount);

private:
    Params params_;
    Resolution state_;
};

} // namespace predex

#endif // PREDEX_SETTLEMENT_HPP
