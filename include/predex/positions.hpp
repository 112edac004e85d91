#ifndef PREDEX_POSITIONS_HPP
#define PREDEX_POSITIONS_HPP

#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "types.hpp"

namespace predex {

// =============================================================================
// Leveraged Position
// =============================================================================

struct PositionKey {
    Address owner;
    Side side;

    bool operator<(const PositionKey& other) const {
        if (owner != other.owner) return owner < other.owner;
        return side < other.side;
    }
    bool operator==(const PositionKey& other) const {
        return owner == other.owner && side == other.side;
    }
};

struct Position {
    I128 collateral;      // external units posted by the trader
    I128 loan_amount;     // external units borrowed
    I128 shares;          // AMM output at open, consumed once
    I128 entry_price;     // WAD
    uint64_t opened_at;
    bool active;
};

// Debt settlement of a position against sale proceeds (external units)
struct DebtSettlement {
    I128 proceeds;
    I128 principal;
    I128 interest;
    I128 shortfall;   // bad debt the insurance fund covers
    I128 surplus;     // left for the trader after the lender is whole
};

struct SurplusSplit {
    I128 insurance_fee;
    I128 keeper_reward;
    I128 trader_refund;
};

// =============================================================================
// PositionBook - (owner, side) keyed leveraged positions
// =============================================================================

class PositionBook {
public:
    struct Params {
        I128 scale_factor = 1;
        I128 borrow_rate_bps = 0;
        I128 liquidation_threshold_bps = 12000;
        I128 liquidation_fee_bps = 0;
        I128 keeper_reward_bps = 0;
    };

    PositionBook() = default;
    explicit PositionBook(const Params& params) : params_(params) {}

    // Throws POSITION_EXISTS when the key already holds an active position.
    // Replaces an inactive record on the same key.
    void open(const PositionKey& key, const Position& position);

    // Throws NO_ACTIVE_POSITION
    const Position& active(const PositionKey& key) const;
    bool has_active(const PositionKey& key) const;

    // Latest record on the key, active or not
    std::optional<Position> find(const PositionKey& key) const;

    // Terminal step of close, liquidation and claim. Returns the record as
    // it was before deactivation.
    Position deactivate(const PositionKey& key);

    // =========================================================================
    // Valuation
    // =========================================================================

    I128 interest(const Position& position, uint64_t now) const;
    I128 debt(const Position& position, uint64_t now) const;

    // shares * price / WAD, in external units
    I128 value(const Position& position, I128 price) const;

    I128 health_factor(const Position& position, I128 price, uint64_t now) const;
    bool liquidatable(const Position& position, I128 price, uint64_t now) const;

    DebtSettlement settle(const Position& position, I128 proceeds, uint64_t now) const;
    SurplusSplit split_liquidation(I128 surplus) const;

    // =========================================================================
    // Aggregates
    // =========================================================================

    I128 open_interest(Side side) const { return open_interest_[side_index(side)]; }
    I128 total_borrowed() const { return total_borrowed_; }
    size_t active_count() const;

    // =========================================================================
    // Journal (one open at a time; the market holds its call guard)
    // =========================================================================

    void begin();
    void commit();
    void rollback();

private:
    void remember(const PositionKey& key);

    Params params_;
    std::map<PositionKey, Position> positions_;
    I128 open_interest_[2] = {0, 0};
    I128 total_borrowed_ = 0;

    bool journaling_ = false;
    std::vector<std::pair<PositionKey, std::optional<Position>>> undo_;
    I128 saved_open_interest_[2] = {0, 0};
    I128 saved_total_borrowed_ = 0;
};

} // namespace predex

#endif // PREDEX_POSITIONS_HPP
