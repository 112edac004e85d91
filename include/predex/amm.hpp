#ifndef PREDEX_AMM_HPP
#define PREDEX_AMM_HPP

#include "types.hpp"
#include "uint256.hpp"
#include "math.hpp"

namespace predex {

// =============================================================================
// AMM Trade Result
// =============================================================================

struct AmmTrade {
    Side side;
    I128 amount_in;     // stable for a buy, shares for a sell
    I128 amount_out;    // shares for a buy, stable for a sell
    I128 price_yes;     // after rebalancing
    I128 price_no;
    bool capped;        // traded side hit the price cap
};

// =============================================================================
// VirtualAmm - constant-product market on virtual reserves
//
// One stable reserve is paired with a YES and a NO reserve. The invariant is
// fixed at bootstrap. A trade moves the stable reserve and the traded side
// along the invariant, then the untouched side is recomputed so the two
// prices sum to 1.0 (with the traded price clamped at price_cap).
// =============================================================================

class VirtualAmm {
public:
    VirtualAmm() = default;
    explicit VirtualAmm(I128 price_cap) : price_cap_(price_cap) {}

    // reserve_stable = stable, both sides = 2 * stable (prices 0.5 / 0.5)
    void bootstrap(I128 stable);
    bool active() const { return active_; }

    math::SwapResult quote_buy(Side side, I128 stable_in) const;
    math::SwapResult quote_sell(Side side, I128 shares_in) const;

    AmmTrade buy(Side side, I128 stable_in);
    AmmTrade sell(Side side, I128 shares_in);

    I128 price(Side side) const;
    I128 reserve(Side side) const { return reserves_[side_index(side)]; }
    I128 reserve_stable() const { return reserve_stable_; }
    const U256& invariant() const { return invariant_k_; }
    I128 price_cap() const { return price_cap_; }

private:
    AmmTrade finish(Side side, I128 amount_in, const math::SwapResult& swap);
    void require_active() const;

    I128 price_cap_ = 0;
    bool active_ = false;
    I128 reserve_stable_ = 0;
    I128 reserves_[2] = {0, 0};
    U256 invariant_k_;
};

} // namespace predex

#endif // PREDEX_AMM_HPP
