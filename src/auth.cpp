// =============================================================================
// auth.cpp - Typed message construction and encoding
// =============================================================================

#include "predex/auth.hpp"

namespace predex {

using ojson = nlohmann::ordered_json;

ojson Domain::to_json() const {
    ojson j;
    j["name"] = name;
    j["version"] = version;
    j["chainId"] = chain_id;
    j["verifyingContract"] = addresses::to_hex(verifying_contract);
    return j;
}

std::string TypedMessage::encode() const {
    ojson j;
    j["domain"] = domain.to_json();
    j["primaryType"] = primary_type;
    j["message"] = fields;
    return j.dump();
}

Signature EchoVerifier::sign(const TypedMessage& message, const Address& signer) {
    std::string text = message.encode() + "#" + addresses::to_hex(signer);
    return Signature(text.begin(), text.end());
}

bool EchoVerifier::verify(const TypedMessage& message, const Signature& signature,
                          const Address& expected_signer) const {
    return signature == sign(message, expected_signer);
}

namespace messages {

namespace {

TypedMessage make(const Domain& domain, const char* type, ojson fields) {
    TypedMessage msg;
    msg.domain = domain;
    msg.primary_type = type;
    msg.fields = std::move(fields);
    return msg;
}

} // anonymous namespace

TypedMessage buy_shares(const Domain& domain, const BuyRequest& req, uint64_t nonce) {
    ojson f;
    f["buyer"] = addresses::to_hex(req.buyer);
    f["isYes"] = req.side == Side::YES;
    f["amount"] = to_decimal(req.shares);
    f["nonce"] = nonce;
    f["deadline"] = req.deadline;
    return make(domain, "BuyShares", std::move(f));
}

TypedMessage open_position(const Domain& domain, const OpenRequest& req, uint64_t nonce) {
    ojson f;
    f["trader"] = addresses::to_hex(req.trader);
    f["isYes"] = req.side == Side::YES;
    f["collateral"] = to_decimal(req.collateral);
    f["leverage"] = req.leverage;
    f["minShares"] = to_decimal(req.min_shares);
    f["nonce"] = nonce;
    f["deadline"] = req.deadline;
    return make(domain, "OpenPosition", std::move(f));
}

TypedMessage close_position(const Domain& domain, const CloseRequest& req, uint64_t nonce) {
    ojson f;
    f["trader"] = addresses::to_hex(req.trader);
    f["isYes"] = req.side == Side::YES;
    f["minPayout"] = to_decimal(req.min_payout);
    f["nonce"] = nonce;
    f["deadline"] = req.deadline;
    return make(domain, "ClosePosition", std::move(f));
}

TypedMessage bulk_liquidate(const Domain& domain, const BulkLiquidateRequest& req, uint64_t nonce) {
    ojson traders = ojson::array();
    for (const auto& t : req.traders) traders.push_back(addresses::to_hex(t));
    ojson sides = ojson::array();
    for (Side s : req.sides) sides.push_back(s == Side::YES);

    ojson f;
    f["keeper"] = addresses::to_hex(req.keeper);
    f["traders"] = std::move(traders);
    f["isYes"] = std::move(sides);
    f["nonce"] = nonce;
    f["deadline"] = req.deadline;
    return make(domain, "BulkLiquidate", std::move(f));
}

TypedMessage claim_tier(const Domain& domain, const ClaimRequest& req, uint64_t nonce) {
    ojson f;
    f["claimant"] = addresses::to_hex(req.claimant);
    f["tier"] = to_string(req.tier);
    f["nonce"] = nonce;
    f["deadline"] = req.deadline;
    return make(domain, "ClaimTier", std::move(f));
}

} // namespace messages

} // namespace predex
