// =============================================================================
// custody.cpp - In-memory vault, lending pool, insurance fund, outcome tokens
// =============================================================================

#include "predex/custody.hpp"
#include "predex/log.hpp"

#include <limits>

#include <spdlog/spdlog.h>

namespace predex {

namespace {

void require_positive(I128 amount, const char* what) {
    if (amount <= 0) {
        throw MarketError(errors::ZERO_AMOUNT, std::string(what) + " must be positive");
    }
}

I128 lookup(const std::map<Address, I128>& balances, const Address& account) {
    auto it = balances.find(account);
    return it == balances.end() ? 0 : it->second;
}

} // anonymous namespace

// =============================================================================
// CustodyVault
// =============================================================================

CustodyVault::CustodyVault(I128 scale_factor) : scale_factor_(scale_factor) {
    if (scale_factor <= 0) {
        throw MarketError(errors::INVALID_CONFIG, "scale factor must be positive");
    }
}

void CustodyVault::transfer(const Address& from, const Address& to, I128 iu) {
    require_positive(iu, "transfer amount");

    std::unique_lock lock(mutex_);
    I128& from_balance = state_.balances[from];
    if (from_balance < iu) {
        throw MarketError(errors::INSUFFICIENT_BALANCE,
                          addresses::to_hex(from) + " holds " + to_decimal(from_balance) +
                          ", needs " + to_decimal(iu));
    }
    from_balance -= iu;
    state_.balances[to] += iu;
    record([from, to, iu](VaultLedger& l) {
        l.balances[to] -= iu;
        l.balances[from] += iu;
    });
}

I128 CustodyVault::deposit(const Address& to, I128 ea) {
    require_positive(ea, "deposit amount");

    if (ea > std::numeric_limits<I128>::max() / scale_factor_) {
        throw MarketError(errors::MATH_OVERFLOW, "deposit of " + to_decimal(ea) + " overflows internal units");
    }

    std::unique_lock lock(mutex_);
    I128 iu = ea * scale_factor_;
    if (state_.total_internal > std::numeric_limits<I128>::max() - iu) {
        throw MarketError(errors::MATH_OVERFLOW, "vault supply would overflow");
    }
    state_.balances[to] += iu;
    state_.total_internal += iu;
    state_.external_reserve += ea;
    record([to, iu, ea](VaultLedger& l) {
        l.balances[to] -= iu;
        l.total_internal -= iu;
        l.external_reserve -= ea;
    });
    return iu;
}

// Burns whole external units only; sub-unit dust stays on the account
I128 CustodyVault::burn_for_external(const Address& account, I128 iu) {
    I128& balance = state_.balances[account];
    if (balance < iu) {
        throw MarketError(errors::INSUFFICIENT_BALANCE,
                          addresses::to_hex(account) + " holds " + to_decimal(balance) +
                          ", needs " + to_decimal(iu));
    }

    I128 ea = iu / scale_factor_;
    I128 burned = ea * scale_factor_;
    if (ea > state_.external_reserve) {
        throw MarketError(errors::INSUFFICIENT_BALANCE, "vault external reserve exhausted");
    }
    balance -= burned;
    state_.total_internal -= burned;
    state_.external_reserve -= ea;
    record([account, burned, ea](VaultLedger& l) {
        l.balances[account] += burned;
        l.total_internal += burned;
        l.external_reserve += ea;
    });
    return ea;
}

I128 CustodyVault::redeem(const Address& account, I128 iu) {
    require_positive(iu, "redeem amount");

    std::unique_lock lock(mutex_);
    return burn_for_external(account, iu);
}

I128 CustodyVault::transfer_to_market_once(const Address& market, I128 iu) {
    require_positive(iu, "release amount");

    std::unique_lock lock(mutex_);
    if (state_.released.count(market) != 0) {
        throw MarketError(errors::UNAUTHORIZED,
                          "capital of " + addresses::to_hex(market) + " already released");
    }
    I128 ea = burn_for_external(market, iu);
    state_.released.insert(market);
    record([market](VaultLedger& l) { l.released.erase(market); });
    return ea;
}

I128 CustodyVault::balance_of(const Address& account) const {
    std::shared_lock lock(mutex_);
    return lookup(state_.balances, account);
}

void CustodyVault::accrue_yield(I128 ea) {
    require_positive(ea, "yield");

    std::unique_lock lock(mutex_);
    state_.pending_yield += ea;
    record([ea](VaultLedger& l) { l.pending_yield -= ea; });
}

I128 CustodyVault::withdraw_yield() {
    std::unique_lock lock(mutex_);
    I128 amount = state_.pending_yield;
    state_.pending_yield = 0;
    record([amount](VaultLedger& l) { l.pending_yield += amount; });
    return amount;
}

I128 CustodyVault::total_internal() const {
    std::shared_lock lock(mutex_);
    return state_.total_internal;
}

I128 CustodyVault::external_reserve() const {
    std::shared_lock lock(mutex_);
    return state_.external_reserve;
}

I128 CustodyVault::pending_yield() const {
    std::shared_lock lock(mutex_);
    return state_.pending_yield;
}

bool CustodyVault::released(const Address& market) const {
    std::shared_lock lock(mutex_);
    return state_.released.count(market) != 0;
}

// =============================================================================
// LendingPool
// =============================================================================

LendingPool::LendingPool(I128 utilization_cap_bps) : utilization_cap_bps_(utilization_cap_bps) {
    if (utilization_cap_bps <= 0 || utilization_cap_bps > BPS) {
        throw MarketError(errors::INVALID_CONFIG, "utilization cap must lie in (0, 10000]");
    }
}

void LendingPool::authorize_borrower(const Address& borrower) {
    std::unique_lock lock(mutex_);
    if (state_.borrowers.insert(borrower).second) {
        record([borrower](LendingLedger& l) { l.borrowers.erase(borrower); });
    }
}

void LendingPool::require_borrower(const Address& borrower) const {
    if (state_.borrowers.count(borrower) == 0) {
        throw MarketError(errors::UNAUTHORIZED, addresses::to_hex(borrower) + " is not an authorized borrower");
    }
}

void LendingPool::supply(const Address& provider, I128 ea) {
    require_positive(ea, "supply amount");

    std::unique_lock lock(mutex_);
    state_.supplied[provider] += ea;
    state_.total_supplied += ea;
    record([provider, ea](LendingLedger& l) {
        l.supplied[provider] -= ea;
        l.total_supplied -= ea;
    });
}

void LendingPool::withdraw(const Address& provider, I128 ea) {
    require_positive(ea, "withdraw amount");

    std::unique_lock lock(mutex_);
    I128& stake = state_.supplied[provider];
    if (stake < ea) {
        throw MarketError(errors::INSUFFICIENT_BALANCE, "withdrawal exceeds supplied amount");
    }
    I128 liquidity = state_.total_supplied + state_.interest_earned - state_.total_borrowed;
    if (liquidity < ea) {
        throw MarketError(errors::UTILIZATION_CAP, "liquidity is lent out");
    }
    stake -= ea;
    state_.total_supplied -= ea;
    record([provider, ea](LendingLedger& l) {
        l.supplied[provider] += ea;
        l.total_supplied += ea;
    });
}

void LendingPool::fund_loan(const Address& borrower, I128 ea) {
    require_positive(ea, "loan amount");

    std::unique_lock lock(mutex_);
    require_borrower(borrower);

    I128 borrowed_after = state_.total_borrowed + ea;
    if (borrowed_after * BPS > state_.total_supplied * utilization_cap_bps_) {
        throw MarketError(errors::UTILIZATION_CAP,
                          "loan of " + to_decimal(ea) + " would exceed utilization cap");
    }
    state_.total_borrowed = borrowed_after;
    record([ea](LendingLedger& l) { l.total_borrowed -= ea; });
}

void LendingPool::repay_loan(const Address& borrower, I128 principal, I128 interest) {
    if (principal < 0 || interest < 0) {
        throw MarketError(errors::ZERO_AMOUNT, "negative repayment");
    }

    std::unique_lock lock(mutex_);
    require_borrower(borrower);
    if (principal > state_.total_borrowed) {
        throw MarketError(errors::INSUFFICIENT_BALANCE, "repayment exceeds outstanding loans");
    }
    state_.total_borrowed -= principal;
    state_.interest_earned += interest;
    record([principal, interest](LendingLedger& l) {
        l.total_borrowed += principal;
        l.interest_earned -= interest;
    });
}

I128 LendingPool::supplied_by(const Address& provider) const {
    std::shared_lock lock(mutex_);
    return lookup(state_.supplied, provider);
}

I128 LendingPool::total_supplied() const {
    std::shared_lock lock(mutex_);
    return state_.total_supplied;
}

I128 LendingPool::total_borrowed() const {
    std::shared_lock lock(mutex_);
    return state_.total_borrowed;
}

I128 LendingPool::interest_earned() const {
    std::shared_lock lock(mutex_);
    return state_.interest_earned;
}

I128 LendingPool::available_liquidity() const {
    std::shared_lock lock(mutex_);
    return state_.total_supplied + state_.interest_earned - state_.total_borrowed;
}

I128 LendingPool::utilization_bps() const {
    std::shared_lock lock(mutex_);
    if (state_.total_supplied == 0) return 0;
    return state_.total_borrowed * BPS / state_.total_supplied;
}

// =============================================================================
// InsuranceFund
// =============================================================================

InsuranceFund::InsuranceFund(const Address& owner) : owner_(owner) {}

void InsuranceFund::authorize_market(const Address& market) {
    std::unique_lock lock(mutex_);
    if (state_.markets.insert(market).second) {
        record([market](InsuranceLedger& l) { l.markets.erase(market); });
    }
}

void InsuranceFund::require_market(const Address& market) const {
    if (state_.markets.count(market) == 0) {
        throw MarketError(errors::UNAUTHORIZED, addresses::to_hex(market) + " is not an insured market");
    }
}

void InsuranceFund::seed(I128 ea) {
    require_positive(ea, "seed amount");

    std::unique_lock lock(mutex_);
    state_.balance += ea;
    record([ea](InsuranceLedger& l) { l.balance -= ea; });
}

void InsuranceFund::deposit_fee(const Address& market, I128 ea) {
    require_positive(ea, "fee");

    std::unique_lock lock(mutex_);
    require_market(market);
    state_.balance += ea;
    state_.total_fees += ea;
    record([ea](InsuranceLedger& l) {
        l.balance -= ea;
        l.total_fees -= ea;
    });
}

void InsuranceFund::cover_bad_debt(const Address& market, I128 ea) {
    require_positive(ea, "bad debt");

    std::unique_lock lock(mutex_);
    require_market(market);
    if (state_.balance < ea) {
        throw MarketError(errors::INSURANCE_INSUFFICIENT,
                          "fund holds " + to_decimal(state_.balance) + ", shortfall " + to_decimal(ea));
    }
    state_.balance -= ea;
    state_.total_covered += ea;
    record([ea](InsuranceLedger& l) {
        l.balance += ea;
        l.total_covered -= ea;
    });
}

I128 InsuranceFund::emergency_withdraw(const Address& caller, I128 ea) {
    require_positive(ea, "withdraw amount");

    std::unique_lock lock(mutex_);
    if (caller != owner_) {
        throw MarketError(errors::UNAUTHORIZED, "only the fund owner may withdraw");
    }
    if (state_.balance < ea) {
        throw MarketError(errors::INSURANCE_INSUFFICIENT, "withdrawal exceeds fund balance");
    }
    state_.balance -= ea;
    record([ea](InsuranceLedger& l) { l.balance += ea; });
    logger()->warn("insurance emergency withdrawal of {} by {}", to_decimal(ea), addresses::to_hex(caller));
    return ea;
}

I128 InsuranceFund::balance() const {
    std::shared_lock lock(mutex_);
    return state_.balance;
}

I128 InsuranceFund::total_fees() const {
    std::shared_lock lock(mutex_);
    return state_.total_fees;
}

I128 InsuranceFund::total_covered() const {
    std::shared_lock lock(mutex_);
    return state_.total_covered;
}

// =============================================================================
// OutcomeToken
// =============================================================================

OutcomeToken::OutcomeToken(std::string symbol, const Address& issuer)
    : symbol_(std::move(symbol)), issuer_(issuer) {}

void OutcomeToken::require_issuer(const Address& issuer) const {
    if (issuer != issuer_) {
        throw MarketError(errors::UNAUTHORIZED,
                          addresses::to_hex(issuer) + " may not mint or burn " + symbol_);
    }
}

void OutcomeToken::mint(const Address& issuer, const Address& to, I128 amount) {
    require_positive(amount, "mint amount");
    require_issuer(issuer);

    std::unique_lock lock(mutex_);
    state_.balances[to] += amount;
    state_.total_supply += amount;
    record([to, amount](TokenLedger& l) {
        l.balances[to] -= amount;
        l.total_supply -= amount;
    });
}

void OutcomeToken::burn(const Address& issuer, const Address& from, I128 amount) {
    require_positive(amount, "burn amount");
    require_issuer(issuer);

    std::unique_lock lock(mutex_);
    I128& balance = state_.balances[from];
    if (balance < amount) {
        throw MarketError(errors::INSUFFICIENT_BALANCE, "burn exceeds " + symbol_ + " balance");
    }
    balance -= amount;
    state_.total_supply -= amount;
    record([from, amount](TokenLedger& l) {
        l.balances[from] += amount;
        l.total_supply += amount;
    });
}

I128 OutcomeToken::balance_of(const Address& holder) const {
    std::shared_lock lock(mutex_);
    return lookup(state_.balances, holder);
}

I128 OutcomeToken::total_supply() const {
    std::shared_lock lock(mutex_);
    return state_.total_supply;
}

} // namespace predex
