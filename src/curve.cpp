// =============================================================================
// curve.cpp - Bonding curve sale ledger
// =============================================================================

#include "predex/curve.hpp"

#include <algorithm>

namespace predex {

BondingCurve::BondingCurve(const math::CurveParams& params, I128 fee_bps, I128 migration_threshold)
    : params_(params)
    , fee_bps_(fee_bps)
    , migration_threshold_(migration_threshold) {}

CurveFill BondingCurve::quote_buy(I128 requested_shares) const {
    if (closed_) {
        throw MarketError(errors::MARKET_MIGRATED, "bonding curve is closed");
    }
    if (requested_shares <= 0) {
        throw MarketError(errors::ZERO_AMOUNT, "no shares requested");
    }

    I128 left = remaining();
    if (left <= 0) {
        throw MarketError(errors::ZERO_AMOUNT, "migration threshold already reached");
    }

    // Largest amount whose exact cost fits the remaining budget
    I128 room = math::curve_shares_for_budget(current_supply_, left, params_);

    CurveFill fill{};
    if (requested_shares <= room) {
        fill.shares = requested_shares;
        fill.raw_cost = math::curve_raw_cost(current_supply_, current_supply_ + requested_shares, params_);
    } else {
        // One more unit would cross the threshold; the residue is below its price
        fill.capped = true;
        fill.shares = std::max<I128>(room, 1);
        fill.raw_cost = left;
    }

    if (fill.raw_cost <= 0) {
        throw MarketError(errors::ZERO_AMOUNT, "fill rounds to zero");
    }

    fill.fee = math::apply_bps(fill.raw_cost, fee_bps_);
    fill.reaches_threshold = total_capital_raised_ + fill.raw_cost == migration_threshold_;
    return fill;
}

void BondingCurve::apply(const CurveFill& fill) {
    current_supply_ += fill.shares;
    total_capital_raised_ += fill.raw_cost;
    fees_collected_ += fill.fee;
}

I128 BondingCurve::spot_price() const {
    return math::curve_price(current_supply_, params_);
}

} // namespace predex
