#ifndef PREDEX_CURVE_HPP
#define PREDEX_CURVE_HPP

#include "types.hpp"
#include "math.hpp"

namespace predex {

// =============================================================================
// Bonding Curve Fill
// =============================================================================

struct CurveFill {
    I128 shares;              // actually sold, <= requested
    I128 raw_cost;            // internal units
    I128 fee;                 // internal units
    bool capped;              // request cut at the migration threshold
    bool reaches_threshold;   // this fill triggers migration
};

// =============================================================================
// BondingCurve - Phase 1 sale ledger
//
// One supply counter is shared by both outcome sides. Capital raised never
// exceeds the migration threshold. A request that would cross it is cut to
// the largest amount whose cost fits and is charged the whole remaining
// budget, so a capped fill always lands exactly on the threshold. The
// residue absorbed this way is below the price of one more share unit.
// =============================================================================

class BondingCurve {
public:
    BondingCurve() = default;
    BondingCurve(const math::CurveParams& params, I128 fee_bps, I128 migration_threshold);

    // Throws ZERO_AMOUNT when nothing can be sold, MARKET_MIGRATED when closed
    CurveFill quote_buy(I128 requested_shares) const;

    // Book a fill produced by quote_buy on the current state
    void apply(const CurveFill& fill);

    // Permanently stop sales (migration or resolution)
    void close() { closed_ = true; }
    bool closed() const { return closed_; }

    I128 current_supply() const { return current_supply_; }
    I128 total_capital_raised() const { return total_capital_raised_; }
    I128 fees_collected() const { return fees_collected_; }
    I128 migration_threshold() const { return migration_threshold_; }
    I128 remaining() const { return migration_threshold_ - total_capital_raised_; }
    bool threshold_reached() const { return total_capital_raised_ >= migration_threshold_; }

    // Marginal price at the current supply
    I128 spot_price() const;

private:
    math::CurveParams params_{1, 1};
    I128 fee_bps_ = 0;
    I128 migration_threshold_ = 0;

    I128 current_supply_ = 0;
    I128 total_capital_raised_ = 0;
    I128 fees_collected_ = 0;
    bool closed_ = false;
};

} // namespace predex

#endif // PREDEX_CURVE_HPP
