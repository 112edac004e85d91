// =============================================================================
// amm.cpp - Virtual constant-product AMM with complementary rebalancing
// =============================================================================

#include "predex/amm.hpp"

namespace predex {

void VirtualAmm::bootstrap(I128 stable) {
    if (active_) {
        throw MarketError(errors::ALREADY_INITIALIZED, "virtual reserves already bootstrapped");
    }
    if (stable <= 0) {
        throw MarketError(errors::ZERO_AMOUNT, "cannot bootstrap empty reserves");
    }

    reserve_stable_ = stable;
    reserves_[side_index(Side::YES)] = 2 * stable;
    reserves_[side_index(Side::NO)] = 2 * stable;
    invariant_k_ = u256::mul(static_cast<U128>(stable), static_cast<U128>(2 * stable));
    active_ = true;
}

void VirtualAmm::require_active() const {
    if (!active_) {
        throw MarketError(errors::PHASE2_NOT_ACTIVE, "virtual reserves not bootstrapped");
    }
}

math::SwapResult VirtualAmm::quote_buy(Side side, I128 stable_in) const {
    require_active();
    return math::cpmm_buy(reserve_stable_, reserve(side), invariant_k_, stable_in);
}

math::SwapResult VirtualAmm::quote_sell(Side side, I128 shares_in) const {
    require_active();
    return math::cpmm_sell(reserve_stable_, reserve(side), invariant_k_, shares_in);
}

AmmTrade VirtualAmm::buy(Side side, I128 stable_in) {
    return finish(side, stable_in, quote_buy(side, stable_in));
}

AmmTrade VirtualAmm::sell(Side side, I128 shares_in) {
    return finish(side, shares_in, quote_sell(side, shares_in));
}

AmmTrade VirtualAmm::finish(Side side, I128 amount_in, const math::SwapResult& swap) {
    math::RebalanceResult rb = math::rebalance(swap.new_stable, swap.new_side, price_cap_);

    reserve_stable_ = swap.new_stable;
    reserves_[side_index(side)] = swap.new_side;
    reserves_[side_index(opposite(side))] = rb.other_reserve;

    AmmTrade trade{};
    trade.side = side;
    trade.amount_in = amount_in;
    trade.amount_out = swap.amount_out;
    trade.price_yes = price(Side::YES);
    trade.price_no = price(Side::NO);
    trade.capped = rb.capped;
    return trade;
}

I128 VirtualAmm::price(Side side) const {
    require_active();
    return math::spot_price(reserve_stable_, reserve(side));
}

} // namespace predex
