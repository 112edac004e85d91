#ifndef PREDEX_CUSTODY_HPP
#define PREDEX_CUSTODY_HPP

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "types.hpp"
#include "collaborators.hpp"

namespace predex {

// =============================================================================
// JournaledLedger - undo journal shared by the in-memory collaborators
//
// A journal belongs to the thread that opened it. While it is open, every
// change that thread makes records its inverse; rollback() replays those in
// reverse and leaves changes made by other threads in place. Journals of
// different threads (two markets sharing a collaborator) are independent.
// Journals opened on one thread nest; only the innermost records changes.
// =============================================================================

template <typename State>
class JournaledLedger {
protected:
    using Undo = std::function<void(State&)>;
    using Journal = std::vector<Undo>;

    void journal_begin() {
        std::unique_lock lock(mutex_);
        journals_[std::this_thread::get_id()].emplace_back();
    }

    void journal_commit() {
        std::unique_lock lock(mutex_);
        pop_journal();
    }

    void journal_rollback() {
        std::unique_lock lock(mutex_);
        auto it = journals_.find(std::this_thread::get_id());
        if (it == journals_.end()) return;
        Journal& top = it->second.back();
        for (auto undo = top.rbegin(); undo != top.rend(); ++undo) {
            (*undo)(state_);
        }
        pop_journal();
    }

    // Caller holds mutex_ and has already applied the change
    void record(Undo undo) {
        auto it = journals_.find(std::this_thread::get_id());
        if (it != journals_.end()) {
            it->second.back().push_back(std::move(undo));
        }
    }

    State state_;
    mutable std::shared_mutex mutex_;

private:
    void pop_journal() {
        auto it = journals_.find(std::this_thread::get_id());
        if (it == journals_.end()) return;
        it->second.pop_back();
        if (it->second.empty()) journals_.erase(it);
    }

    std::map<std::thread::id, std::vector<Journal>> journals_;
};

// =============================================================================
// CustodyVault - external asset in, internal units out
// =============================================================================

struct VaultLedger {
    std::map<Address, I128> balances;   // internal units
    std::set<Address> released;         // markets that used transfer_to_market_once
    I128 total_internal = 0;
    I128 external_reserve = 0;          // external units held (lent to the yield venue)
    I128 pending_yield = 0;             // external units earned by the venue
};

class CustodyVault : public ICustodyVault, private JournaledLedger<VaultLedger> {
public:
    explicit CustodyVault(I128 scale_factor);

    void transfer(const Address& from, const Address& to, I128 iu) override;
    I128 deposit(const Address& to, I128 ea) override;
    I128 redeem(const Address& account, I128 iu) override;
    I128 transfer_to_market_once(const Address& market, I128 iu) override;
    I128 balance_of(const Address& account) const override;
    I128 scale_factor() const override { return scale_factor_; }

    void begin() override { journal_begin(); }
    void commit() override { journal_commit(); }
    void rollback() override { journal_rollback(); }

    // Yield from the external venue; never minted as internal units
    void accrue_yield(I128 ea);
    I128 withdraw_yield();

    I128 total_internal() const;
    I128 external_reserve() const;
    I128 pending_yield() const;
    bool released(const Address& market) const;

private:
    I128 burn_for_external(const Address& account, I128 iu);

    I128 scale_factor_;
};

// =============================================================================
// LendingPool - liquidity providers fund market leverage loans
// =============================================================================

struct LendingLedger {
    std::map<Address, I128> supplied;   // per liquidity provider
    std::set<Address> borrowers;
    I128 total_supplied = 0;
    I128 total_borrowed = 0;
    I128 interest_earned = 0;
};

class LendingPool : public ILendingPool, private JournaledLedger<LendingLedger> {
public:
    explicit LendingPool(I128 utilization_cap_bps = 8000);

    void authorize_borrower(const Address& borrower);

    void supply(const Address& provider, I128 ea);
    void withdraw(const Address& provider, I128 ea);

    void fund_loan(const Address& borrower, I128 ea) override;
    void repay_loan(const Address& borrower, I128 principal, I128 interest) override;

    void begin() override { journal_begin(); }
    void commit() override { journal_commit(); }
    void rollback() override { journal_rollback(); }

    I128 supplied_by(const Address& provider) const;
    I128 total_supplied() const;
    I128 total_borrowed() const;
    I128 interest_earned() const;
    I128 available_liquidity() const;
    I128 utilization_bps() const;
    I128 utilization_cap_bps() const { return utilization_cap_bps_; }

private:
    void require_borrower(const Address& borrower) const;

    I128 utilization_cap_bps_;
};

// =============================================================================
// InsuranceFund - collects fees, absorbs bad debt
// =============================================================================

struct InsuranceLedger {
    std::set<Address> markets;
    I128 balance = 0;
    I128 total_fees = 0;
    I128 total_covered = 0;
};

class InsuranceFund : public IInsuranceFund, private JournaledLedger<InsuranceLedger> {
public:
    explicit InsuranceFund(const Address& owner);

    void authorize_market(const Address& market);

    // Direct top-up from outside the markets
    void seed(I128 ea);

    void deposit_fee(const Address& market, I128 ea) override;
    void cover_bad_debt(const Address& market, I128 ea) override;

    // Owner only
    I128 emergency_withdraw(const Address& caller, I128 ea);

    void begin() override { journal_begin(); }
    void commit() override { journal_commit(); }
    void rollback() override { journal_rollback(); }

    I128 balance() const;
    I128 total_fees() const;
    I128 total_covered() const;
    const Address& owner() const { return owner_; }

private:
    void require_market(const Address& market) const;

    Address owner_;
};

// =============================================================================
// OutcomeToken - non-transferable outcome balance
// =============================================================================

struct TokenLedger {
    std::map<Address, I128> balances;
    I128 total_supply = 0;
};

class OutcomeToken : public IOutcomeToken, private JournaledLedger<TokenLedger> {
public:
    OutcomeToken(std::string symbol, const Address& issuer);

    void mint(const Address& issuer, const Address& to, I128 amount) override;
    void burn(const Address& issuer, const Address& from, I128 amount) override;

    I128 balance_of(const Address& holder) const override;
    I128 total_supply() const override;

    void begin() override { journal_begin(); }
    void commit() override { journal_commit(); }
    void rollback() override { journal_rollback(); }

    const std::string& symbol() const { return symbol_; }
    const Address& issuer() const { return issuer_; }

private:
    void require_issuer(const Address& issuer) const;

    std::string symbol_;
    Address issuer_;
};

} // namespace predex

#endif // PREDEX_CUSTODY_HPP
