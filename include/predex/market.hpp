#ifndef PREDEX_MARKET_HPP
#define PREDEX_MARKET_HPP

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <utility>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "events.hpp"
#include "auth.hpp"
#include "collaborators.hpp"
#include "curve.hpp"
#include "amm.hpp"
#include "positions.hpp"
#include "settlement.hpp"

namespace predex {

// =============================================================================
// Market State (one copyable value per market)
// =============================================================================

struct MarketState {
    Phase phase = Phase::PRE_MIGRATION;
    Address authority = addresses::ZERO;

    BondingCurve curve;
    VirtualAmm amm;
    PositionBook positions;
    SettlementGuardian settlement;

    I128 cash = 0;                          // external units held by the market
    std::map<Address, uint64_t> nonces;
    std::set<Address> settled_positions;    // winning positions claimed or swept

    uint64_t nonce(const Address& account) const {
        auto it = nonces.find(account);
        return it == nonces.end() ? 0 : it->second;
    }
};

// =============================================================================
// Call Results
// =============================================================================

struct BuyResult {
    I128 shares;        // may be below the request when capped at the threshold
    I128 cost;          // internal units, excluding fee
    I128 fee;
    bool migrated;
};

struct OpenResult {
    I128 shares;
    I128 loan;          // external units
    I128 entry_price;   // WAD
};

struct CloseResult {
    I128 proceeds;      // external units from the AMM sale
    I128 debt_repaid;   // principal + interest
    I128 bad_debt;      // covered by insurance
    I128 payout;        // to the trader
    I128 pnl;           // payout - collateral
};

struct LiquidationResult {
    I128 proceeds;
    I128 debt_repaid;
    I128 bad_debt;
    I128 insurance_fee;
    I128 keeper_reward;
    I128 trader_refund;
};

struct ClaimResult {
    ClaimKind kind;
    I128 gross;         // settlement value of the claimed shares
    I128 debt_repaid;
    I128 bad_debt;
    I128 bonus;
    I128 payout;        // what the recipient received
};

// =============================================================================
// Market - three-phase prediction market engine
//
// Every mutating call is serialized, rejects same-thread re-entry with
// REENTRANCY, and is all-or-nothing: on any failure the market state and
// every collaborator journal are rolled back and no event is published.
// =============================================================================

class Market {
public:
    using Clock = std::function<uint64_t()>;   // unix seconds

    Market();
    ~Market() = default;

    // Non-copyable
    Market(const Market&) = delete;
    Market& operator=(const Market&) = delete;

    // Once per instance; throws ALREADY_INITIALIZED afterwards
    void initialize(const MarketConfig& config, const Collaborators& collaborators);
    bool initialized() const;

    // =========================================================================
    // Phase 1
    // =========================================================================

    BuyResult buy_shares(const BuyRequest& req, const Signatures& sigs);

    // =========================================================================
    // Phase 2
    // =========================================================================

    OpenResult open_position(const OpenRequest& req, const Signatures& sigs);
    CloseResult close_position(const CloseRequest& req, const Signatures& sigs);

    // Permissionless; throws POSITION_HEALTHY or NO_ACTIVE_POSITION
    LiquidationResult liquidate(const Address& keeper, const Address& trader, Side side);

    // Skips inactive and healthy entries. Returns the number liquidated.
    uint32_t bulk_liquidate(const BulkLiquidateRequest& req, const Signature& authority_sig);

    // =========================================================================
    // Resolution
    // =========================================================================

    void resolve(const Address& caller, Side winner);

    // Winning outcome tokens of `req.claimant`; the authority signs the
    // claim_tier message (the tier is not used for token claims)
    ClaimResult claim_winnings(const ClaimRequest& req, const Signature& authority_sig);

    // Winning leveraged position with tier bonus
    ClaimResult claim_leveraged(const ClaimRequest& req, const Signature& authority_sig);

    // Authority only, after the claim cooldown. Proceeds go to insurance.
    ClaimResult sweep_unclaimed(const Address& caller, const Address& user, ClaimKind kind);

    // =========================================================================
    // Administration
    // =========================================================================

    void rotate_authority(const Address& caller, const Address& next);

    void set_event_callback(EventCallback callback);
    void set_clock(Clock clock);

    // =========================================================================
    // Views
    // =========================================================================

    Phase phase() const;
    Address authority() const;
    uint64_t nonce(const Address& account) const;
    I128 price(Side side) const;
    I128 health_factor(const Address& trader, Side side) const;
    std::optional<Position> position(const Address& trader, Side side) const;
    MarketState state() const;
    const MarketConfig& config() const { return config_; }
    const Domain& domain() const { return domain_; }
    uint64_t now() const { return clock_(); }

    // Leverage 0 uses the configured default
    math::LeveragePreview preview_open(Side side, I128 collateral, uint32_t leverage = 0) const;

private:
    class CallGuard;

    // Small parts of MarketState copied at the start of a call. The position
    // book, nonces and settled set are restored from undo records instead.
    struct Checkpoint {
        Phase phase;
        Address authority;
        BondingCurve curve;
        VirtualAmm amm;
        SettlementGuardian settlement;
        I128 cash;
    };

    struct UndoLog {
        std::vector<std::pair<Address, std::optional<uint64_t>>> nonces;
        std::vector<Address> settled;
    };

    Checkpoint checkpoint();
    void restore(Checkpoint& saved);

    template <typename Fn>
    auto atomically(const char* operation, Fn&& fn) -> decltype(fn());

    template <typename Fn>
    auto read(Fn&& fn) const -> decltype(fn());

    // Guards
    void require_initialized() const;
    void require_phase2() const;
    void require_authority(const Address& caller) const;
    void check_deadline(uint64_t deadline) const;
    void verify(const TypedMessage& message, const Signature& sig, const Address& signer,
                const char* role) const;
    void consume_nonce(const Address& account);
    void mark_settled(const Address& owner);

    // Money movement (external units)
    void pay_out(const Address& to, I128 ea);
    void pay_insurance(I128 ea);
    void release_capital();
    void cover_and_repay(const DebtSettlement& debt);

    // Steps shared by several entry points
    void migrate();
    DebtSettlement unwind(const PositionKey& key, const Position& position);
    LiquidationResult liquidate_locked(const Address& keeper, const PositionKey& key);
    ClaimResult claim_position(const PositionKey& key, UserTier tier, bool sweep);
    ClaimResult claim_tokens(const Address& holder, bool sweep);

    void emit(EventType type, nlohmann::json data);
    void emit_rebalanced(const AmmTrade& trade);

    MarketConfig config_;
    Collaborators collab_;
    Domain domain_;
    bool initialized_ = false;

    MarketState state_;
    UndoLog undo_;

    mutable std::mutex mutex_;
    mutable std::atomic<std::thread::id> owner_{};

    std::vector<MarketEvent> pending_;
    EventCallback callback_;
    Clock clock_;
};

} // namespace predex

#endif // PREDEX_MARKET_HPP
