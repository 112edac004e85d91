// =============================================================================
// positions.cpp - Position ledger, debt and health
// =============================================================================

#include "predex/positions.hpp"
#include "predex/math.hpp"

namespace predex {

void PositionBook::open(const PositionKey& key, const Position& position) {
    if (has_active(key)) {
        throw MarketError(errors::POSITION_EXISTS,
                          std::string("active ") + to_string(key.side) + " position for " +
                          addresses::to_hex(key.owner));
    }

    Position record = position;
    record.active = true;
    remember(key);
    positions_[key] = record;

    open_interest_[side_index(key.side)] += record.shares;
    total_borrowed_ += record.loan_amount;
}

const Position& PositionBook::active(const PositionKey& key) const {
    auto it = positions_.find(key);
    if (it == positions_.end() || !it->second.active) {
        throw MarketError(errors::NO_ACTIVE_POSITION,
                          std::string("no active ") + to_string(key.side) + " position for " +
                          addresses::to_hex(key.owner));
    }
    return it->second;
}

bool PositionBook::has_active(const PositionKey& key) const {
    auto it = positions_.find(key);
    return it != positions_.end() && it->second.active;
}

std::optional<Position> PositionBook::find(const PositionKey& key) const {
    auto it = positions_.find(key);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

Position PositionBook::deactivate(const PositionKey& key) {
    Position before = active(key);

    remember(key);
    positions_[key].active = false;
    open_interest_[side_index(key.side)] -= before.shares;
    total_borrowed_ -= before.loan_amount;
    return before;
}

void PositionBook::remember(const PositionKey& key) {
    if (journaling_) undo_.emplace_back(key, find(key));
}

void PositionBook::begin() {
    journaling_ = true;
    undo_.clear();
    saved_open_interest_[0] = open_interest_[0];
    saved_open_interest_[1] = open_interest_[1];
    saved_total_borrowed_ = total_borrowed_;
}

void PositionBook::commit() {
    journaling_ = false;
    undo_.clear();
}

void PositionBook::rollback() {
    if (!journaling_) return;
    for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
        if (it->second) {
            positions_[it->first] = *it->second;
        } else {
            positions_.erase(it->first);
        }
    }
    open_interest_[0] = saved_open_interest_[0];
    open_interest_[1] = saved_open_interest_[1];
    total_borrowed_ = saved_total_borrowed_;
    commit();
}

size_t PositionBook::active_count() const {
    size_t n = 0;
    for (const auto& [key, pos] : positions_) {
        if (pos.active) ++n;
    }
    return n;
}

// =============================================================================
// Valuation
// =============================================================================

I128 PositionBook::interest(const Position& position, uint64_t now) const {
    uint64_t elapsed = now > position.opened_at ? now - position.opened_at : 0;
    return math::simple_interest(position.loan_amount, params_.borrow_rate_bps, elapsed);
}

I128 PositionBook::debt(const Position& position, uint64_t now) const {
    return position.loan_amount + interest(position, now);
}

I128 PositionBook::value(const Position& position, I128 price) const {
    return math::mul_div(position.shares, price, WAD) / params_.scale_factor;
}

I128 PositionBook::health_factor(const Position& position, I128 price, uint64_t now) const {
    return math::health_factor(value(position, price), debt(position, now),
                               params_.liquidation_threshold_bps);
}

bool PositionBook::liquidatable(const Position& position, I128 price, uint64_t now) const {
    return health_factor(position, price, now) < BPS;
}

DebtSettlement PositionBook::settle(const Position& position, I128 proceeds, uint64_t now) const {
    DebtSettlement s{};
    s.proceeds = proceeds;
    s.principal = position.loan_amount;
    s.interest = interest(position, now);

    I128 owed = s.principal + s.interest;
    if (proceeds >= owed) {
        s.surplus = proceeds - owed;
    } else {
        s.shortfall = owed - proceeds;
    }
    return s;
}

SurplusSplit PositionBook::split_liquidation(I128 surplus) const {
    SurplusSplit split{};
    split.insurance_fee = math::apply_bps(surplus, params_.liquidation_fee_bps);
    split.keeper_reward = math::apply_bps(surplus, params_.keeper_reward_bps);
    split.trader_refund = surplus - split.insurance_fee - split.keeper_reward;
    return split;
}

} // namespace predex
