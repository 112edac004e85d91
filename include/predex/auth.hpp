#ifndef PREDEX_AUTH_HPP
#define PREDEX_AUTH_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace predex {

// =============================================================================
// Typed Messages (domain-bound, structured, canonical JSON encoding)
// =============================================================================

struct Domain {
    std::string name = "PredexMarket";
    std::string version = "1";
    uint64_t chain_id = 1;
    Address verifying_contract = addresses::ZERO;

    nlohmann::ordered_json to_json() const;
};

struct TypedMessage {
    Domain domain;
    std::string primary_type;
    nlohmann::ordered_json fields;   // insertion order is the signing order

    // Canonical byte string that signers sign
    std::string encode() const;
};

// Pluggable signature scheme
class ISignatureVerifier {
public:
    virtual ~ISignatureVerifier() = default;

    virtual bool verify(const TypedMessage& message, const Signature& signature,
                        const Address& expected_signer) const = 0;
};

// Deterministic scheme for simulation and tests: a signature is the encoded
// message followed by "#" and the signer address. Not a cryptographic scheme.
class EchoVerifier : public ISignatureVerifier {
public:
    static Signature sign(const TypedMessage& message, const Address& signer);

    bool verify(const TypedMessage& message, const Signature& signature,
                const Address& expected_signer) const override;
};

// =============================================================================
// Authorized Requests
// =============================================================================

// User and authority co-sign
struct Signatures {
    Signature user;
    Signature authority;
};

struct BuyRequest {
    Address buyer;
    Side side;
    I128 shares;          // requested; may be capped at the migration threshold
    uint64_t deadline;
};

struct OpenRequest {
    Address trader;
    Side side;
    I128 collateral;      // external units
    uint32_t leverage;
    I128 min_shares;      // slippage floor
    uint64_t deadline;
};

struct CloseRequest {
    Address trader;
    Side side;
    I128 min_payout;      // external units, 0 disables the guard
    uint64_t deadline;
};

// Authority signature only; consumes the keeper's nonce
struct BulkLiquidateRequest {
    Address keeper;
    std::vector<Address> traders;
    std::vector<Side> sides;
    uint64_t deadline;
};

// Authority signature only; consumes the claimant's nonce
struct ClaimRequest {
    Address claimant;
    UserTier tier;
    uint64_t deadline;
};

namespace messages {

TypedMessage buy_shares(const Domain& domain, const BuyRequest& req, uint64_t nonce);
TypedMessage open_position(const Domain& domain, const OpenRequest& req, uint64_t nonce);
TypedMessage close_position(const Domain& domain, const CloseRequest& req, uint64_t nonce);
TypedMessage bulk_liquidate(const Domain& domain, const BulkLiquidateRequest& req, uint64_t nonce);
TypedMessage claim_tier(const Domain& domain, const ClaimRequest& req, uint64_t nonce);

} // namespace messages

} // namespace predex

#endif // PREDEX_AUTH_HPP
