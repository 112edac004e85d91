// =============================================================================
// market.cpp - Market engine: phases, guarded calls, money routing
// =============================================================================

#include "predex/market.hpp"
#include "predex/log.hpp"

#include <chrono>
#include <type_traits>

#include <spdlog/spdlog.h>

namespace predex {

using json = nlohmann::json;

namespace {

uint64_t system_seconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

std::string hex(const Address& addr) { return addresses::to_hex(addr); }
std::string dec(I128 v) { return to_decimal(v); }

} // anonymous namespace

// =============================================================================
// Call Guard
// =============================================================================

// Serializes callers and rejects re-entry from the thread already inside
class Market::CallGuard {
public:
    CallGuard(const Market& market, const char* operation)
        : market_(market), lock_(market.mutex_, std::defer_lock) {
        if (market_.owner_.load() == std::this_thread::get_id()) {
            throw MarketError(errors::REENTRANCY, std::string("re-entrant call to ") + operation);
        }
        lock_.lock();
        market_.owner_.store(std::this_thread::get_id());
    }

    ~CallGuard() { market_.owner_.store(std::thread::id{}); }

    CallGuard(const CallGuard&) = delete;
    CallGuard& operator=(const CallGuard&) = delete;

private:
    const Market& market_;
    std::unique_lock<std::mutex> lock_;
};

Market::Checkpoint Market::checkpoint() {
    undo_ = UndoLog{};
    state_.positions.begin();
    return Checkpoint{state_.phase, state_.authority, state_.curve, state_.amm, state_.settlement, state_.cash};
}

void Market::restore(Checkpoint& saved) {
    state_.phase = saved.phase;
    state_.authority = saved.authority;
    state_.curve = std::move(saved.curve);
    state_.amm = std::move(saved.amm);
    state_.settlement = std::move(saved.settlement);
    state_.cash = saved.cash;

    for (auto it = undo_.settled.rbegin(); it != undo_.settled.rend(); ++it) {
        state_.settled_positions.erase(*it);
    }
    for (auto it = undo_.nonces.rbegin(); it != undo_.nonces.rend(); ++it) {
        if (it->second) {
            state_.nonces[it->first] = *it->second;
        } else {
            state_.nonces.erase(it->first);
        }
    }
    state_.positions.rollback();
    undo_ = UndoLog{};
}

template <typename Fn>
auto Market::atomically(const char* operation, Fn&& fn) -> decltype(fn()) {
    using Result = decltype(fn());

    std::vector<MarketEvent> published;
    EventCallback callback;
    std::optional<std::conditional_t<std::is_void_v<Result>, bool, Result>> result;

    {
        CallGuard guard(*this, operation);
        require_initialized();

        Checkpoint saved = checkpoint();
        std::vector<Journaled*> journals = collab_.journaled();
        for (Journaled* j : journals) j->begin();

        try {
            if constexpr (std::is_void_v<Result>) {
                fn();
                result = true;
            } else {
                result = fn();
            }
        } catch (...) {
            restore(saved);
            for (auto it = journals.rbegin(); it != journals.rend(); ++it) (*it)->rollback();
            pending_.clear();
            throw;
        }

        for (Journaled* j : journals) j->commit();
        state_.positions.commit();
        undo_ = UndoLog{};
        published.swap(pending_);
        callback = callback_;
    }

    // Outside the guard so listeners may call back in
    if (callback) {
        for (const auto& event : published) callback(event);
    }

    if constexpr (!std::is_void_v<Result>) {
        return std::move(*result);
    }
}

template <typename Fn>
auto Market::read(Fn&& fn) const -> decltype(fn()) {
    // A collaborator inside a call may read without deadlocking
    if (owner_.load() == std::this_thread::get_id()) {
        return fn();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return fn();
}

// =============================================================================
// Construction
// =============================================================================

Market::Market() : clock_(system_seconds) {}

void Market::initialize(const MarketConfig& config, const Collaborators& collaborators) {
    CallGuard guard(*this, "initialize");

    if (initialized_) {
        throw MarketError(errors::ALREADY_INITIALIZED, "market already initialized");
    }
    config.validate();
    if (!collaborators.complete()) {
        throw MarketError(errors::INVALID_CONFIG, "every collaborator must be provided");
    }
    if (collaborators.vault->scale_factor() != config.scale_factor) {
        throw MarketError(errors::INVALID_CONFIG, "vault scale factor differs from config");
    }
    set_log_level(config.log_level);

    config_ = config;
    collab_ = collaborators;

    domain_.name = "PredexMarket";
    domain_.version = std::to_string(config.version);
    domain_.chain_id = config.chain_id;
    domain_.verifying_contract = config.market_address;

    MarketState fresh;
    fresh.authority = config.authority;
    fresh.curve = BondingCurve(math::CurveParams{config.curve_k, config.curve_scale},
                               config.protocol_fee_bps, config.migration_threshold_iu());
    fresh.amm = VirtualAmm(config.price_cap);

    PositionBook::Params book;
    book.scale_factor = config.scale_factor;
    book.borrow_rate_bps = config.borrow_rate_bps;
    book.liquidation_threshold_bps = config.liquidation_threshold_bps;
    book.liquidation_fee_bps = config.liquidation_fee_bps;
    book.keeper_reward_bps = config.keeper_reward_bps;
    fresh.positions = PositionBook(book);

    SettlementGuardian::Params guardian;
    guardian.scale_factor = config.scale_factor;
    guardian.claim_cooldown = config.claim_cooldown;
    guardian.base_yield_bps = config.base_yield_bps;
    guardian.tier_multiplier_bps = config.tier_multiplier_bps;
    fresh.settlement = SettlementGuardian(guardian);

    state_ = std::move(fresh);
    initialized_ = true;

    logger()->info("market {} initialized at {} (threshold {} EA, authority {})",
                   config.name, hex(config.market_address), dec(config.migration_threshold),
                   hex(config.authority));
}

bool Market::initialized() const {
    return read([&] { return initialized_; });
}

void Market::set_event_callback(EventCallback callback) {
    CallGuard guard(*this, "set_event_callback");
    callback_ = std::move(callback);
}

void Market::set_clock(Clock clock) {
    CallGuard guard(*this, "set_clock");
    clock_ = std::move(clock);
}

// =============================================================================
// Guards
// =============================================================================

void Market::require_initialized() const {
    if (!initialized_) {
        throw MarketError(errors::NOT_INITIALIZED, "market not initialized");
    }
}

void Market::require_phase2() const {
    switch (state_.phase) {
        case Phase::PRE_MIGRATION:
            throw MarketError(errors::PHASE2_NOT_ACTIVE, "leverage trading opens after migration");
        case Phase::RESOLVED:
            throw MarketError(errors::MARKET_RESOLVED, "market resolved");
        case Phase::PHASE2_ACTIVE:
            break;
    }
}

void Market::require_authority(const Address& caller) const {
    if (caller != state_.authority) {
        throw MarketError(errors::UNAUTHORIZED, hex(caller) + " is not the market authority");
    }
}

void Market::check_deadline(uint64_t deadline) const {
    uint64_t t = now();
    if (t > deadline) {
        throw MarketError(errors::DEADLINE_PASSED,
                          "deadline " + std::to_string(deadline) + " passed at " + std::to_string(t));
    }
}

void Market::verify(const TypedMessage& message, const Signature& sig, const Address& signer,
                    const char* role) const {
    if (!collab_.verifier->verify(message, sig, signer)) {
        throw MarketError(errors::INVALID_SIGNATURE,
                          std::string(role) + " signature rejected for " + message.primary_type);
    }
}

void Market::consume_nonce(const Address& account) {
    auto it = state_.nonces.find(account);
    if (it == state_.nonces.end()) {
        undo_.nonces.emplace_back(account, std::nullopt);
        state_.nonces.emplace(account, 1);
    } else {
        undo_.nonces.emplace_back(account, it->second);
        ++it->second;
    }
}

void Market::mark_settled(const Address& owner) {
    if (state_.settled_positions.insert(owner).second) {
        undo_.settled.push_back(owner);
    }
}

// =============================================================================
// Money Movement
// =============================================================================

void Market::pay_out(const Address& to, I128 ea) {
    if (ea <= 0) return;
    if (ea > state_.cash) {
        throw MarketError(errors::INSUFFICIENT_BACKING,
                          "payout " + dec(ea) + " exceeds market cash " + dec(state_.cash));
    }
    state_.cash -= ea;
    collab_.vault->deposit(to, ea);
}

void Market::pay_insurance(I128 ea) {
    if (ea <= 0) return;
    if (ea > state_.cash) {
        throw MarketError(errors::INSUFFICIENT_BACKING,
                          "insurance transfer " + dec(ea) + " exceeds market cash " + dec(state_.cash));
    }
    state_.cash -= ea;
    collab_.insurance->deposit_fee(config_.market_address, ea);
}

// Phase 1 capital and fees leave custody; the fee share goes to insurance
void Market::release_capital() {
    I128 capital = state_.curve.total_capital_raised();
    I128 fees = state_.curve.fees_collected();
    if (capital + fees <= 0) return;

    state_.cash += collab_.vault->transfer_to_market_once(config_.market_address, capital + fees);
    pay_insurance(fees / config_.scale_factor);
}

void Market::cover_and_repay(const DebtSettlement& debt) {
    if (debt.shortfall > 0) {
        logger()->warn("bad debt {} EA covered by insurance", dec(debt.shortfall));
        collab_.insurance->cover_bad_debt(config_.market_address, debt.shortfall);
        state_.cash += debt.shortfall;
    }

    I128 owed = debt.principal + debt.interest;
    if (owed <= 0) return;
    if (owed > state_.cash) {
        throw MarketError(errors::INSUFFICIENT_BACKING,
                          "loan repayment " + dec(owed) + " exceeds market cash " + dec(state_.cash));
    }
    state_.cash -= owed;
    collab_.lending->repay_loan(config_.market_address, debt.principal, debt.interest);
}

// =============================================================================
// Events
// =============================================================================

void Market::emit(EventType type, json data) {
    pending_.push_back(MarketEvent{type, now(), std::move(data)});
}

void Market::emit_rebalanced(const AmmTrade& trade) {
    emit(EventType::REBALANCED, {
        {"side", to_string(trade.side)},
        {"price_yes", dec(trade.price_yes)},
        {"price_no", dec(trade.price_no)},
        {"reserve_stable", dec(state_.amm.reserve_stable())},
        {"reserve_yes", dec(state_.amm.reserve(Side::YES))},
        {"reserve_no", dec(state_.amm.reserve(Side::NO))},
        {"capped", trade.capped}
    });
}

// =============================================================================
// Phase 1: Bonding Curve
// =============================================================================

BuyResult Market::buy_shares(const BuyRequest& req, const Signatures& sigs) {
    return atomically("buy_shares", [&] {
        check_deadline(req.deadline);
        if (state_.phase == Phase::RESOLVED) {
            throw MarketError(errors::MARKET_RESOLVED, "market resolved");
        }
        if (state_.phase == Phase::PHASE2_ACTIVE) {
            throw MarketError(errors::MARKET_MIGRATED, "bonding curve closed by migration");
        }

        TypedMessage msg = messages::buy_shares(domain_, req, state_.nonce(req.buyer));
        verify(msg, sigs.user, req.buyer, "user");
        verify(msg, sigs.authority, state_.authority, "authority");
        consume_nonce(req.buyer);

        CurveFill fill = state_.curve.quote_buy(req.shares);
        collab_.vault->transfer(req.buyer, config_.market_address, fill.raw_cost + fill.fee);
        collab_.token(req.side)->mint(config_.market_address, req.buyer, fill.shares);
        state_.curve.apply(fill);

        emit(EventType::BUY_EXECUTED, {
            {"buyer", hex(req.buyer)},
            {"side", to_string(req.side)},
            {"requested", dec(req.shares)},
            {"shares", dec(fill.shares)},
            {"cost", dec(fill.raw_cost)},
            {"fee", dec(fill.fee)},
            {"capped", fill.capped},
            {"current_supply", dec(state_.curve.current_supply())},
            {"total_capital_raised", dec(state_.curve.total_capital_raised())}
        });
        logger()->debug("buy {} {} shares for {} by {}", dec(fill.shares), to_string(req.side),
                        dec(fill.raw_cost + fill.fee), hex(req.buyer));

        if (fill.reaches_threshold) {
            migrate();
        }
        return BuyResult{fill.shares, fill.raw_cost, fill.fee, fill.reaches_threshold};
    });
}

void Market::migrate() {
    I128 capital = state_.curve.total_capital_raised();

    state_.curve.close();
    release_capital();
    state_.amm.bootstrap(capital);
    state_.phase = Phase::PHASE2_ACTIVE;

    emit(EventType::MIGRATED, {
        {"capital", dec(capital)},
        {"fees", dec(state_.curve.fees_collected())},
        {"cash", dec(state_.cash)},
        {"reserve_stable", dec(state_.amm.reserve_stable())},
        {"reserve_yes", dec(state_.amm.reserve(Side::YES))},
        {"reserve_no", dec(state_.amm.reserve(Side::NO))}
    });
    emit(EventType::LEVERAGE_ACTIVATED, {
        {"price_yes", dec(state_.amm.price(Side::YES))},
        {"price_no", dec(state_.amm.price(Side::NO))},
        {"max_leverage", config_.max_leverage}
    });
    logger()->info("migrated with {} IU capital, cash {} EA", dec(capital), dec(state_.cash));
}

// =============================================================================
// Phase 2: Leveraged Positions
// =============================================================================

OpenResult Market::open_position(const OpenRequest& req, const Signatures& sigs) {
    return atomically("open_position", [&] {
        check_deadline(req.deadline);
        require_phase2();

        if (req.collateral < config_.min_collateral) {
            throw MarketError(errors::COLLATERAL_TOO_LOW,
                              "collateral " + dec(req.collateral) + " below " + dec(config_.min_collateral));
        }
        if (req.leverage < 1 || req.leverage > config_.max_leverage) {
            throw MarketError(errors::INVALID_LEVERAGE,
                              "leverage " + std::to_string(req.leverage) + " outside [1, " +
                              std::to_string(config_.max_leverage) + "]");
        }
        PositionKey key{req.trader, req.side};
        if (state_.positions.has_active(key)) {
            throw MarketError(errors::POSITION_EXISTS, "active position on this side");
        }

        TypedMessage msg = messages::open_position(domain_, req, state_.nonce(req.trader));
        verify(msg, sigs.user, req.trader, "user");
        verify(msg, sigs.authority, state_.authority, "authority");
        consume_nonce(req.trader);

        // Collateral leaves the trader's internal balance and custody
        I128 collateral_iu = math::checked_mul(req.collateral, config_.scale_factor);
        I128 notional_iu = math::checked_mul(collateral_iu, static_cast<I128>(req.leverage));
        collab_.vault->transfer(req.trader, config_.market_address, collateral_iu);
        state_.cash += collab_.vault->redeem(config_.market_address, collateral_iu);

        I128 loan = req.collateral * static_cast<I128>(req.leverage - 1);
        if (loan > 0) {
            collab_.lending->fund_loan(config_.market_address, loan);
            state_.cash += loan;
        }

        AmmTrade trade = state_.amm.buy(req.side, notional_iu);
        if (trade.amount_out < req.min_shares) {
            throw MarketError(errors::SLIPPAGE_EXCEEDED,
                              "shares " + dec(trade.amount_out) + " below minimum " + dec(req.min_shares));
        }

        Position pos{};
        pos.collateral = req.collateral;
        pos.loan_amount = loan;
        pos.shares = trade.amount_out;
        pos.entry_price = math::mul_div(notional_iu, WAD, trade.amount_out);
        pos.opened_at = now();
        pos.active = true;
        state_.positions.open(key, pos);

        emit_rebalanced(trade);
        emit(EventType::POSITION_OPENED, {
            {"trader", hex(req.trader)},
            {"side", to_string(req.side)},
            {"collateral", dec(pos.collateral)},
            {"leverage", req.leverage},
            {"loan", dec(pos.loan_amount)},
            {"shares", dec(pos.shares)},
            {"entry_price", dec(pos.entry_price)}
        });
        logger()->debug("open {} {}x {} collateral {} -> {} shares", hex(req.trader), req.leverage,
                        to_string(req.side), dec(req.collateral), dec(pos.shares));

        return OpenResult{pos.shares, pos.loan_amount, pos.entry_price};
    });
}

// Sell the shares, then make the lender whole (insurance fills any gap)
DebtSettlement Market::unwind(const PositionKey& key, const Position& position) {
    AmmTrade trade = state_.amm.sell(key.side, position.shares);
    emit_rebalanced(trade);

    I128 proceeds = trade.amount_out / config_.scale_factor;
    DebtSettlement debt = state_.positions.settle(position, proceeds, now());
    cover_and_repay(debt);
    return debt;
}

CloseResult Market::close_position(const CloseRequest& req, const Signatures& sigs) {
    return atomically("close_position", [&] {
        check_deadline(req.deadline);
        require_phase2();

        PositionKey key{req.trader, req.side};
        Position pos = state_.positions.active(key);

        TypedMessage msg = messages::close_position(domain_, req, state_.nonce(req.trader));
        verify(msg, sigs.user, req.trader, "user");
        verify(msg, sigs.authority, state_.authority, "authority");
        consume_nonce(req.trader);

        DebtSettlement debt = unwind(key, pos);
        if (req.min_payout > 0 && debt.surplus < req.min_payout) {
            throw MarketError(errors::SLIPPAGE_EXCEEDED,
                              "payout " + dec(debt.surplus) + " below minimum " + dec(req.min_payout));
        }

        state_.positions.deactivate(key);
        pay_out(req.trader, debt.surplus);

        CloseResult result{};
        result.proceeds = debt.proceeds;
        result.debt_repaid = debt.principal + debt.interest;
        result.bad_debt = debt.shortfall;
        result.payout = debt.surplus;
        result.pnl = debt.surplus - pos.collateral;

        emit(EventType::POSITION_CLOSED, {
            {"trader", hex(req.trader)},
            {"side", to_string(req.side)},
            {"proceeds", dec(result.proceeds)},
            {"debt_repaid", dec(result.debt_repaid)},
            {"bad_debt", dec(result.bad_debt)},
            {"payout", dec(result.payout)},
            {"pnl", dec(result.pnl)}
        });
        logger()->debug("close {} {} payout {} pnl {}", hex(req.trader), to_string(req.side),
                        dec(result.payout), dec(result.pnl));
        return result;
    });
}

LiquidationResult Market::liquidate_locked(const Address& keeper, const PositionKey& key) {
    Position pos = state_.positions.active(key);
    I128 hf = state_.positions.health_factor(pos, state_.amm.price(key.side), now());
    if (hf >= BPS) {
        throw MarketError(errors::POSITION_HEALTHY, "health factor " + dec(hf));
    }

    DebtSettlement debt = unwind(key, pos);
    state_.positions.deactivate(key);

    SurplusSplit split = state_.positions.split_liquidation(debt.surplus);
    pay_insurance(split.insurance_fee);
    pay_out(keeper, split.keeper_reward);
    pay_out(key.owner, split.trader_refund);

    LiquidationResult result{};
    result.proceeds = debt.proceeds;
    result.debt_repaid = debt.principal + debt.interest;
    result.bad_debt = debt.shortfall;
    result.insurance_fee = split.insurance_fee;
    result.keeper_reward = split.keeper_reward;
    result.trader_refund = split.trader_refund;

    emit(EventType::POSITION_LIQUIDATED, {
        {"trader", hex(key.owner)},
        {"side", to_string(key.side)},
        {"keeper", hex(keeper)},
        {"health_factor", dec(hf)},
        {"proceeds", dec(result.proceeds)},
        {"debt_repaid", dec(result.debt_repaid)},
        {"bad_debt", dec(result.bad_debt)},
        {"insurance_fee", dec(result.insurance_fee)},
        {"keeper_reward", dec(result.keeper_reward)},
        {"trader_refund", dec(result.trader_refund)}
    });
    logger()->info("liquidated {} {} at health factor {}", hex(key.owner), to_string(key.side), dec(hf));
    return result;
}

LiquidationResult Market::liquidate(const Address& keeper, const Address& trader, Side side) {
    return atomically("liquidate", [&] {
        require_phase2();
        return liquidate_locked(keeper, PositionKey{trader, side});
    });
}

uint32_t Market::bulk_liquidate(const BulkLiquidateRequest& req, const Signature& authority_sig) {
    return atomically("bulk_liquidate", [&] {
        check_deadline(req.deadline);
        require_phase2();
        if (req.traders.size() != req.sides.size()) {
            throw MarketError(errors::LENGTH_MISMATCH,
                              std::to_string(req.traders.size()) + " traders, " +
                              std::to_string(req.sides.size()) + " sides");
        }

        TypedMessage msg = messages::bulk_liquidate(domain_, req, state_.nonce(req.keeper));
        verify(msg, authority_sig, state_.authority, "authority");
        consume_nonce(req.keeper);

        uint32_t liquidated = 0;
        for (size_t i = 0; i < req.traders.size(); ++i) {
            PositionKey key{req.traders[i], req.sides[i]};
            if (!state_.positions.has_active(key)) {
                logger()->debug("bulk liquidation skips inactive {} {}", hex(key.owner), to_string(key.side));
                continue;
            }
            const Position& pos = state_.positions.active(key);
            if (!state_.positions.liquidatable(pos, state_.amm.price(key.side), now())) {
                logger()->warn("bulk liquidation skips healthy {} {}", hex(key.owner), to_string(key.side));
                continue;
            }
            liquidate_locked(req.keeper, key);
            ++liquidated;
        }
        return liquidated;
    });
}

// =============================================================================
// Resolution & Claims
// =============================================================================

void Market::resolve(const Address& caller, Side winner) {
    atomically("resolve", [&] {
        if (state_.phase == Phase::RESOLVED) {
            throw MarketError(errors::MARKET_RESOLVED, "market already resolved");
        }
        require_authority(caller);

        if (state_.phase == Phase::PRE_MIGRATION) {
            state_.curve.close();
            release_capital();
        }

        I128 liabilities = collab_.token(winner)->total_supply() + state_.positions.open_interest(winner);
        const Resolution& res = state_.settlement.resolve(winner, state_.cash, liabilities, now());
        state_.phase = Phase::RESOLVED;

        emit(EventType::MARKET_RESOLVED, {
            {"winning_side", to_string(winner)},
            {"settlement_price", dec(res.settlement_price)},
            {"liabilities", dec(res.total_liabilities)},
            {"backing", dec(state_.cash)},
            {"outstanding_claims", dec(res.outstanding_claims)}
        });
        logger()->info("resolved {} at settlement price {} (liabilities {}, cash {})",
                       to_string(winner), dec(res.settlement_price), dec(liabilities), dec(state_.cash));
    });
}

ClaimResult Market::claim_tokens(const Address& holder, bool sweep) {
    Side winner = state_.settlement.state().winning_side;
    IOutcomeToken* token = collab_.token(winner);

    I128 balance = token->balance_of(holder);
    if (balance <= 0) {
        throw MarketError(errors::NOTHING_TO_CLAIM, "no winning tokens held by " + hex(holder));
    }
    token->burn(config_.market_address, holder, balance);

    ClaimResult result{};
    result.kind = ClaimKind::PHASE1;
    result.gross = state_.settlement.payout_for(balance);
    result.payout = result.gross;
    state_.settlement.settle_claim(result.gross);

    if (sweep) {
        pay_insurance(result.payout);
    } else {
        pay_out(holder, result.payout);
    }
    return result;
}

ClaimResult Market::claim_position(const PositionKey& key, UserTier tier, bool sweep) {
    if (state_.settled_positions.count(key.owner) != 0) {
        throw MarketError(errors::ALREADY_CLAIMED, "winning position of " + hex(key.owner) + " already settled");
    }
    if (!state_.positions.has_active(key)) {
        throw MarketError(errors::NO_WINNING_POSITION,
                          "no active winning position for " + hex(key.owner));
    }
    const Resolution& res = state_.settlement.state();
    Position pos = state_.positions.active(key);

    // Interest stops accruing at resolution
    I128 gross = state_.settlement.payout_for(pos.shares);
    DebtSettlement debt = state_.positions.settle(pos, gross, res.resolved_at);
    cover_and_repay(debt);
    state_.positions.deactivate(key);
    state_.settlement.settle_claim(gross);
    mark_settled(key.owner);

    ClaimResult result{};
    result.kind = ClaimKind::PHASE2;
    result.gross = gross;
    result.debt_repaid = debt.principal + debt.interest;
    result.bad_debt = debt.shortfall;

    if (!sweep && debt.surplus > 0) {
        I128 bonus = state_.settlement.tier_bonus(pos.collateral, tier);
        result.bonus = state_.settlement.cap_bonus(bonus, state_.cash - debt.surplus);
    }
    result.payout = debt.surplus + result.bonus;

    if (sweep) {
        pay_insurance(result.payout);
    } else {
        pay_out(key.owner, result.payout);
    }
    return result;
}

ClaimResult Market::claim_winnings(const ClaimRequest& req, const Signature& authority_sig) {
    return atomically("claim_winnings", [&] {
        check_deadline(req.deadline);
        state_.settlement.require_resolved();

        TypedMessage msg = messages::claim_tier(domain_, req, state_.nonce(req.claimant));
        verify(msg, authority_sig, state_.authority, "authority");
        consume_nonce(req.claimant);

        const Address& claimant = req.claimant;
        ClaimResult result = claim_tokens(claimant, false);

        emit(EventType::WINNINGS_CLAIMED, {
            {"claimant", hex(claimant)},
            {"kind", to_string(result.kind)},
            {"gross", dec(result.gross)},
            {"payout", dec(result.payout)}
        });
        logger()->debug("phase 1 claim {} paid {}", hex(claimant), dec(result.payout));
        return result;
    });
}

ClaimResult Market::claim_leveraged(const ClaimRequest& req, const Signature& authority_sig) {
    return atomically("claim_leveraged", [&] {
        check_deadline(req.deadline);
        state_.settlement.require_resolved();

        TypedMessage msg = messages::claim_tier(domain_, req, state_.nonce(req.claimant));
        verify(msg, authority_sig, state_.authority, "authority");
        consume_nonce(req.claimant);

        PositionKey key{req.claimant, state_.settlement.state().winning_side};
        ClaimResult result = claim_position(key, req.tier, false);

        emit(EventType::WINNINGS_CLAIMED, {
            {"claimant", hex(req.claimant)},
            {"kind", to_string(result.kind)},
            {"tier", to_string(req.tier)},
            {"gross", dec(result.gross)},
            {"debt_repaid", dec(result.debt_repaid)},
            {"bad_debt", dec(result.bad_debt)},
            {"bonus", dec(result.bonus)},
            {"payout", dec(result.payout)}
        });
        logger()->debug("phase 2 claim {} paid {} (bonus {})", hex(req.claimant),
                        dec(result.payout), dec(result.bonus));
        return result;
    });
}

ClaimResult Market::sweep_unclaimed(const Address& caller, const Address& user, ClaimKind kind) {
    return atomically("sweep_unclaimed", [&] {
        require_authority(caller);
        state_.settlement.require_sweepable(now());

        ClaimResult result = kind == ClaimKind::PHASE1
            ? claim_tokens(user, true)
            : claim_position(PositionKey{user, state_.settlement.state().winning_side},
                             UserTier::STANDARD, true);

        emit(EventType::UNCLAIMED_SWEPT, {
            {"user", hex(user)},
            {"kind", to_string(kind)},
            {"gross", dec(result.gross)},
            {"to_insurance", dec(result.payout)}
        });
        logger()->warn("swept unclaimed {} winnings of {} ({} EA to insurance)",
                       to_string(kind), hex(user), dec(result.payout));
        return result;
    });
}

// =============================================================================
// Administration
// =============================================================================

void Market::rotate_authority(const Address& caller, const Address& next) {
    atomically("rotate_authority", [&] {
        require_authority(caller);
        if (addresses::is_zero(next)) {
            throw MarketError(errors::INVALID_CONFIG, "authority cannot be the zero address");
        }
        Address previous = state_.authority;
        state_.authority = next;

        emit(EventType::AUTHORITY_ROTATED, {
            {"previous", hex(previous)},
            {"next", hex(next)}
        });
        logger()->info("authority rotated from {} to {}", hex(previous), hex(next));
    });
}

// =============================================================================
// Views
// =============================================================================

Phase Market::phase() const {
    return read([&] { return state_.phase; });
}

Address Market::authority() const {
    return read([&] { return state_.authority; });
}

uint64_t Market::nonce(const Address& account) const {
    return read([&] { return state_.nonce(account); });
}

I128 Market::price(Side side) const {
    return read([&] { return state_.amm.price(side); });
}

I128 Market::health_factor(const Address& trader, Side side) const {
    return read([&] {
        const Position& pos = state_.positions.active(PositionKey{trader, side});
        return state_.positions.health_factor(pos, state_.amm.price(side), now());
    });
}

std::optional<Position> Market::position(const Address& trader, Side side) const {
    return read([&] { return state_.positions.find(PositionKey{trader, side}); });
}

MarketState Market::state() const {
    return read([&] { return state_; });
}

math::LeveragePreview Market::preview_open(Side side, I128 collateral, uint32_t leverage) const {
    return read([&] {
        require_initialized();
        uint32_t lev = leverage == 0 ? config_.default_leverage : leverage;
        if (lev > config_.max_leverage) {
            throw MarketError(errors::INVALID_LEVERAGE, "leverage " + std::to_string(lev) + " above maximum");
        }
        if (!state_.amm.active()) {
            throw MarketError(errors::PHASE2_NOT_ACTIVE, "no virtual reserves before migration");
        }
        return math::preview_leverage(state_.amm.reserve_stable(), state_.amm.reserve(side),
                                      state_.amm.invariant(), collateral, lev, config_.scale_factor);
    });
}

} // namespace predex
