// =============================================================================
// settlement.cpp - Resolution and claim math
// =============================================================================

#include "predex/settlement.hpp"
#include "predex/math.hpp"
#include <algorithm>

namespace predex {

const Resolution& SettlementGuardian::resolve(Side winner, I128 backing, I128 liabilities, uint64_t now) {
    if (state_.resolved) {
        throw MarketError(errors::MARKET_RESOLVED, "market already resolved");
    }

    state_.resolved = true;
    state_.winning_side = winner;
    state_.resolved_at = now;
    state_.total_liabilities = liabilities;
    state_.settlement_price = math::settlement_price(backing * params_.scale_factor, liabilities);
    state_.outstanding_claims = payout_for(liabilities);
    return state_;
}

void SettlementGuardian::require_resolved() const {
    if (!state_.resolved) {
        throw MarketError(errors::MARKET_NOT_RESOLVED, "market not resolved");
    }
}

void SettlementGuardian::require_sweepable(uint64_t now) const {
    require_resolved();
    uint64_t opens_at = state_.resolved_at + params_.claim_cooldown;
    if (now < opens_at) {
        throw MarketError(errors::COOLDOWN_ACTIVE,
                          "sweep opens at " + std::to_string(opens_at) + ", now " + std::to_string(now));
    }
}

I128 SettlementGuardian::payout_for(I128 shares) const {
    return math::mul_div(shares, state_.settlement_price, WAD) / params_.scale_factor;
}

I128 SettlementGuardian::tier_bonus(I128 collateral, UserTier tier) const {
    I128 mult = params_.tier_multiplier_bps[static_cast<size_t>(tier)];
    return math::mul_div(collateral, params_.base_yield_bps * mult, BPS * BPS);
}

I128 SettlementGuardian::cap_bonus(I128 bonus, I128 cash_after_claim) const {
    I128 headroom = cash_after_claim - state_.outstanding_claims;
    if (headroom <= 0) return 0;
    return std::min(bonus, headroom);
}

void SettlementGuardian::settle_claim(I128 amount) {
    state_.outstanding_claims -= std::min(amount, state_.outstanding_claims);
}

} // namespace predex
