#ifndef PREDEX_MATH_HPP
#define PREDEX_MATH_HPP

#include <limits>

#include "types.hpp"
#include "uint256.hpp"

namespace predex {

// =============================================================================
// Market Math - pure, stateless routines shared by every component
//
// Conventions: all amounts are non-negative integers. Prices are WAD fixed
// point (1e18 = 1.0). Ratios are basis points (10000 = 100%). Division
// rounds toward zero unless stated otherwise.
// =============================================================================

namespace math {

constexpr I128 MAX_HEALTH_FACTOR = std::numeric_limits<I128>::max();

// floor(a * b / denom) with a 256-bit intermediate
I128 mul_div(I128 a, I128 b, I128 denom);

// amount * bps / 10000
I128 apply_bps(I128 amount, I128 bps);

// floor(sqrt(x))
I128 isqrt(I128 x);

// Non-negative a + b and a * b; MATH_OVERFLOW past the I128 range
I128 checked_add(I128 a, I128 b);
I128 checked_mul(I128 a, I128 b);

// =============================================================================
// Bonding Curve (linear price in cumulative supply)
// =============================================================================

struct CurveParams {
    I128 k;       // Slope numerator
    I128 scale;   // Slope denominator
};

struct CurveQuote {
    I128 raw_cost;
    I128 fee;
};

// Spot price K * s / SCALE
I128 curve_price(I128 supply, const CurveParams& params);

// Integral of the spot price: K * (s_end^2 - s_start^2) / (2 * SCALE^2)
I128 curve_raw_cost(I128 s_start, I128 s_end, const CurveParams& params);

// Cost and protocol fee for buying `amount` shares at supply `s_start`
CurveQuote curve_quote(I128 s_start, I128 amount, const CurveParams& params, I128 fee_bps);

// Largest share amount whose raw cost does not exceed `budget`.
// Inverse of the integral via integer square root; never overshoots.
I128 curve_shares_for_budget(I128 s_start, I128 budget, const CurveParams& params);

// =============================================================================
// Lending
// =============================================================================

// principal * rate_bps * elapsed / (10000 * year)
I128 simple_interest(I128 principal, I128 rate_bps, uint64_t elapsed_seconds);

// value * 10000 / (debt * threshold_bps / 10000). MAX_HEALTH_FACTOR when
// there is no debt.
I128 health_factor(I128 value, I128 debt, I128 threshold_bps);

// =============================================================================
// Virtual Constant-Product AMM
// =============================================================================

struct SwapResult {
    I128 new_stable;
    I128 new_side;
    I128 amount_out;   // shares for a buy, stable for a sell
};

// reserve_stable / reserve_side in WAD
I128 spot_price(I128 reserve_stable, I128 reserve_side);

SwapResult cpmm_buy(I128 reserve_stable, I128 reserve_side, const U256& invariant_k, I128 stable_in);
SwapResult cpmm_sell(I128 reserve_stable, I128 reserve_side, const U256& invariant_k, I128 shares_in);

struct RebalanceResult {
    I128 traded_price;    // after the cap
    I128 other_price;     // WAD - traded_price
    I128 other_reserve;
    bool capped;
};

// Recompute the untouched side so that the two prices sum to WAD
RebalanceResult rebalance(I128 reserve_stable, I128 traded_reserve, I128 price_cap);

struct LeveragePreview {
    I128 notional;       // external units
    I128 loan;           // external units
    I128 stable_in;      // internal units sent to the AMM
    I128 shares_out;
    I128 entry_price;    // WAD
    I128 price_after;    // WAD, traded side before the cap
};

LeveragePreview preview_leverage(I128 reserve_stable, I128 reserve_side, const U256& invariant_k,
                                 I128 collateral, uint32_t leverage, I128 scale_factor);

// =============================================================================
// Settlement
// =============================================================================

// min(WAD, backing * WAD / liabilities); WAD when there are no liabilities
I128 settlement_price(I128 backing, I128 liabilities);

} // namespace math

} // namespace predex

#endif // PREDEX_MATH_HPP
