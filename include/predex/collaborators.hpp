#ifndef PREDEX_COLLABORATORS_HPP
#define PREDEX_COLLABORATORS_HPP

#include <vector>

#include "types.hpp"
#include "auth.hpp"

namespace predex {

// =============================================================================
// Journaling
//
// The market opens a journal on every collaborator before a call and either
// commits or rolls all of them back, so a failed call leaves no effect
// anywhere. A journal covers the changes made by the thread that opened it;
// rollback never undoes another caller's changes.
// =============================================================================

class Journaled {
public:
    virtual ~Journaled() = default;

    virtual void begin() {}
    virtual void commit() {}
    virtual void rollback() {}
};

// =============================================================================
// Collaborator Interfaces
//
// Every failing call throws MarketError; the market never swallows it.
// IU = internal units (18 decimals), EA = external asset units.
// =============================================================================

class ICustodyVault : public Journaled {
public:
    // Move internal units between accounts
    virtual void transfer(const Address& from, const Address& to, I128 iu) = 0;

    // Take external units in, credit `to` with internal units. Returns IU.
    virtual I128 deposit(const Address& to, I128 ea) = 0;

    // Burn internal units of `account`, hand out external units. Returns EA.
    virtual I128 redeem(const Address& account, I128 iu) = 0;

    // Release the market's raised capital. Allowed once per market.
    virtual I128 transfer_to_market_once(const Address& market, I128 iu) = 0;

    virtual I128 balance_of(const Address& account) const = 0;
    virtual I128 scale_factor() const = 0;
};

class ILendingPool : public Journaled {
public:
    // Fails with UTILIZATION_CAP above the pool's cap
    virtual void fund_loan(const Address& borrower, I128 ea) = 0;
    virtual void repay_loan(const Address& borrower, I128 principal, I128 interest) = 0;
};

class IInsuranceFund : public Journaled {
public:
    virtual void deposit_fee(const Address& market, I128 ea) = 0;

    // Fails with INSURANCE_INSUFFICIENT when the fund is short
    virtual void cover_bad_debt(const Address& market, I128 ea) = 0;
};

// Non-transferable: balances change only through the issuer's mint and burn
class IOutcomeToken : public Journaled {
public:
    virtual void mint(const Address& issuer, const Address& to, I128 amount) = 0;
    virtual void burn(const Address& issuer, const Address& from, I128 amount) = 0;

    virtual I128 balance_of(const Address& holder) const = 0;
    virtual I128 total_supply() const = 0;
};

// Non-owning; every pointer must outlive the market
struct Collaborators {
    ICustodyVault* vault = nullptr;
    ILendingPool* lending = nullptr;
    IInsuranceFund* insurance = nullptr;
    IOutcomeToken* yes_token = nullptr;
    IOutcomeToken* no_token = nullptr;
    ISignatureVerifier* verifier = nullptr;

    IOutcomeToken* token(Side side) const {
        return side == Side::YES ? yes_token : no_token;
    }

    bool complete() const {
        return vault && lending && insurance && yes_token && no_token && verifier;
    }

    // Distinct journaled collaborators, in call order
    std::vector<Journaled*> journaled() const {
        std::vector<Journaled*> out;
        for (Journaled* j : {static_cast<Journaled*>(vault), static_cast<Journaled*>(lending),
                             static_cast<Journaled*>(insurance), static_cast<Journaled*>(yes_token),
                             static_cast<Journaled*>(no_token)}) {
            bool seen = false;
            for (Journaled* existing : out) {
                if (existing == j) seen = true;
            }
            if (j && !seen) out.push_back(j);
        }
        return out;
    }
};

} // namespace predex

#endif // PREDEX_COLLABORATORS_HPP
