// =============================================================================
// math.cpp - Curve, lending, AMM and settlement math
// =============================================================================

#include "predex/math.hpp"
#include <algorithm>

namespace predex {
namespace math {

namespace {

inline U128 as_u128(I128 v, const char* what) {
    if (v < 0) {
        throw MarketError(errors::MATH_OVERFLOW, std::string("negative operand: ") + what);
    }
    return static_cast<U128>(v);
}

} // anonymous namespace

I128 mul_div(I128 a, I128 b, I128 denom) {
    if (denom <= 0) {
        throw MarketError(errors::MATH_OVERFLOW, "mul_div by non-positive denominator");
    }
    U256 product = u256::mul(as_u128(a, "a"), as_u128(b, "b"));
    return u256::to_i128(u256::div(product, U256{static_cast<U128>(denom)}));
}

I128 apply_bps(I128 amount, I128 bps) {
    return mul_div(amount, bps, BPS);
}

I128 isqrt(I128 x) {
    return static_cast<I128>(u256::isqrt(U256{as_u128(x, "sqrt")}));
}

I128 checked_add(I128 a, I128 b) {
    if (a < 0 || b < 0) {
        throw MarketError(errors::MATH_OVERFLOW, "negative operand: sum");
    }
    if (a > std::numeric_limits<I128>::max() - b) {
        throw MarketError(errors::MATH_OVERFLOW, "sum exceeds 128 bits");
    }
    return a + b;
}

I128 checked_mul(I128 a, I128 b) {
    return u256::to_i128(u256::mul(as_u128(a, "a"), as_u128(b, "b")));
}

// =============================================================================
// Bonding Curve
// =============================================================================

I128 curve_price(I128 supply, const CurveParams& params) {
    return mul_div(params.k, supply, params.scale);
}

I128 curve_raw_cost(I128 s_start, I128 s_end, const CurveParams& params) {
    if (s_end < s_start) {
        throw MarketError(errors::MATH_OVERFLOW, "curve range is reversed");
    }
    // s_end^2 - s_start^2 = (s_end - s_start) * (s_end + s_start)
    U256 area = u256::mul(as_u128(s_end - s_start, "delta"), as_u128(checked_add(s_end, s_start), "sum"));
    U256 numerator = u256::mul(area, as_u128(params.k, "k"));
    U256 denominator = u256::shl(u256::mul(as_u128(params.scale, "scale"),
                                           as_u128(params.scale, "scale")), 1);
    return u256::to_i128(u256::div(numerator, denominator));
}

CurveQuote curve_quote(I128 s_start, I128 amount, const CurveParams& params, I128 fee_bps) {
    CurveQuote quote{};
    quote.raw_cost = curve_raw_cost(s_start, checked_add(s_start, amount), params);
    quote.fee = apply_bps(quote.raw_cost, fee_bps);
    return quote;
}

I128 curve_shares_for_budget(I128 s_start, I128 budget, const CurveParams& params) {
    if (budget <= 0) return 0;

    // s_end^2 = s_start^2 + budget * 2 * SCALE^2 / K
    U256 scale_sq = u256::mul(as_u128(params.scale, "scale"), as_u128(params.scale, "scale"));
    U256 growth = u256::div(u256::shl(u256::mul(scale_sq, as_u128(budget, "budget")), 1),
                            U256{as_u128(params.k, "k")});
    U256 target = u256::add(u256::mul(as_u128(s_start, "supply"), as_u128(s_start, "supply")), growth);

    I128 s_end = static_cast<I128>(u256::isqrt(target));
    return s_end > s_start ? s_end - s_start : 0;
}

// =============================================================================
// Lending
// =============================================================================

I128 simple_interest(I128 principal, I128 rate_bps, uint64_t elapsed_seconds) {
    if (principal == 0 || rate_bps == 0 || elapsed_seconds == 0) return 0;
    U256 numerator = u256::mul(u256::mul(as_u128(principal, "principal"), as_u128(rate_bps, "rate")),
                               static_cast<U128>(elapsed_seconds));
    U256 denominator = u256::mul(static_cast<U128>(BPS), static_cast<U128>(SECONDS_PER_YEAR));
    return u256::to_i128(u256::div(numerator, denominator));
}

I128 health_factor(I128 value, I128 debt, I128 threshold_bps) {
    if (debt <= 0) return MAX_HEALTH_FACTOR;
    I128 required = mul_div(debt, threshold_bps, BPS);
    if (required == 0) return MAX_HEALTH_FACTOR;
    return mul_div(value, BPS, required);
}

// =============================================================================
// Virtual AMM
// =============================================================================

I128 spot_price(I128 reserve_stable, I128 reserve_side) {
    if (reserve_side <= 0) {
        throw MarketError(errors::ZERO_OUTPUT, "empty side reserve");
    }
    return mul_div(reserve_stable, WAD, reserve_side);
}

SwapResult cpmm_buy(I128 reserve_stable, I128 reserve_side, const U256& invariant_k, I128 stable_in) {
    if (stable_in <= 0) {
        throw MarketError(errors::ZERO_AMOUNT, "buy with no stable input");
    }

    SwapResult r{};
    r.new_stable = checked_add(reserve_stable, stable_in);
    r.new_side = u256::to_i128(u256::div(invariant_k, U256{static_cast<U128>(r.new_stable)}));
    if (r.new_side >= reserve_side) {
        throw MarketError(errors::ZERO_OUTPUT, "buy mints no shares");
    }
    if (r.new_side == 0) {
        throw MarketError(errors::ZERO_OUTPUT, "buy would drain the side reserve");
    }
    r.amount_out = reserve_side - r.new_side;
    return r;
}

SwapResult cpmm_sell(I128 reserve_stable, I128 reserve_side, const U256& invariant_k, I128 shares_in) {
    if (shares_in <= 0) {
        throw MarketError(errors::ZERO_AMOUNT, "sell with no shares");
    }

    SwapResult r{};
    r.new_side = checked_add(reserve_side, shares_in);
    r.new_stable = u256::to_i128(u256::div(invariant_k, U256{static_cast<U128>(r.new_side)}));
    if (r.new_stable >= reserve_stable) {
        throw MarketError(errors::ZERO_OUTPUT, "sell returns no stable");
    }
    if (r.new_stable == 0) {
        throw MarketError(errors::ZERO_OUTPUT, "sell would drain the stable reserve");
    }
    r.amount_out = reserve_stable - r.new_stable;
    return r;
}

RebalanceResult rebalance(I128 reserve_stable, I128 traded_reserve, I128 price_cap) {
    RebalanceResult r{};
    I128 price = spot_price(reserve_stable, traded_reserve);
    r.capped = price > price_cap;
    r.traded_price = r.capped ? price_cap : price;
    r.other_price = WAD - r.traded_price;
    r.other_reserve = mul_div(reserve_stable, WAD, r.other_price);
    return r;
}

LeveragePreview preview_leverage(I128 reserve_stable, I128 reserve_side, const U256& invariant_k,
                                 I128 collateral, uint32_t leverage, I128 scale_factor) {
    LeveragePreview p{};
    p.notional = checked_mul(collateral, static_cast<I128>(leverage));
    p.loan = p.notional - collateral;
    p.stable_in = checked_mul(p.notional, scale_factor);

    SwapResult swap = cpmm_buy(reserve_stable, reserve_side, invariant_k, p.stable_in);
    p.shares_out = swap.amount_out;
    p.entry_price = mul_div(p.stable_in, WAD, p.shares_out);
    p.price_after = spot_price(swap.new_stable, swap.new_side);
    return p;
}

// =============================================================================
// Settlement
// =============================================================================

I128 settlement_price(I128 backing, I128 liabilities) {
    if (liabilities <= 0) return WAD;
    return std::min(WAD, mul_div(backing, WAD, liabilities));
}

} // namespace math
} // namespace predex
