// predex - shared test fixtures

#ifndef PREDEX_TEST_FIXTURES_HPP
#define PREDEX_TEST_FIXTURES_HPP

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <catch2/catch_tostring.hpp>
#include <predex/predex.hpp>

namespace Catch {
template <>
struct StringMaker<__int128> {
    static std::string convert(__int128 value) { return predex::to_decimal(value); }
};
template <>
struct StringMaker<unsigned __int128> {
    static std::string convert(unsigned __int128 value) {
        std::string out;
        do {
            out.insert(out.begin(), static_cast<char>('0' + static_cast<int>(value % 10)));
            value /= 10;
        } while (value != 0);
        return out;
    }
};
} // namespace Catch

namespace predex::test {

constexpr I128 EA = 1000000;                      // one external unit
constexpr uint64_t START = 1700000000;
constexpr uint64_t DAY = 24 * 60 * 60;

constexpr Address AUTHORITY = addresses::from_id(0xA11CE);
constexpr Address ALICE = addresses::from_id(1);
constexpr Address BOB = addresses::from_id(2);
constexpr Address CAROL = addresses::from_id(3);
constexpr Address WHALE = addresses::from_id(0xBEEF);
constexpr Address KEEPER = addresses::from_id(0xCEE);
constexpr Address LP = addresses::from_id(0xFEED);
constexpr Address FUND_OWNER = addresses::from_id(0xF00D);

// Error code of the first MarketError thrown by fn, OK when none
template <typename Fn>
int32_t error_code(Fn&& fn) {
    try {
        fn();
    } catch (const MarketError& e) {
        return e.code();
    }
    return errors::OK;
}

inline Signature sign(const TypedMessage& message, const Address& signer) {
    return EchoVerifier::sign(message, signer);
}

// Vault with a hook that runs before every transfer
class HookedVault : public CustodyVault {
public:
    using CustodyVault::CustodyVault;

    void transfer(const Address& from, const Address& to, I128 iu) override {
        if (on_transfer) on_transfer();
        CustodyVault::transfer(from, to, iu);
    }

    std::function<void()> on_transfer;
};

// Defaults with a 1,000 EA migration threshold
inline MarketConfig test_config() {
    MarketConfig config;
    config.name = "test-market";
    config.authority = AUTHORITY;
    config.migration_threshold = 1000 * EA;
    config.log_level = "off";
    return config;
}

// A market wired to the in-memory collaborators. Every trader starts with
// 10,000 EA in custody, the lending pool holds `lending_supply`.
struct MarketFixture {
    explicit MarketFixture(const MarketConfig& cfg = test_config(), I128 lending_supply = 1000000 * EA)
        : config(cfg)
        , vault(cfg.scale_factor)
        , insurance(FUND_OWNER)
        , yes_token("YES", cfg.market_address)
        , no_token("NO", cfg.market_address)
    {
        lending.authorize_borrower(config.market_address);
        insurance.authorize_market(config.market_address);
        if (lending_supply > 0) lending.supply(LP, lending_supply);

        for (const Address& who : {ALICE, BOB, CAROL, WHALE}) {
            vault.deposit(who, 10000 * EA);
        }

        market.set_clock([this] { return clock; });
        market.set_event_callback([this](const MarketEvent& e) {
            std::lock_guard<std::mutex> lock(events_mutex);
            events.push_back(e);
        });
        market.initialize(config, collaborators());
    }

    Collaborators collaborators() {
        Collaborators c;
        c.vault = &vault;
        c.lending = &lending;
        c.insurance = &insurance;
        c.yes_token = &yes_token;
        c.no_token = &no_token;
        c.verifier = &verifier;
        return c;
    }

    uint64_t deadline() const { return clock + 3600; }
    void advance(uint64_t seconds) { clock += seconds; }

    Signatures cosign(const TypedMessage& message, const Address& user) const {
        return Signatures{sign(message, user), sign(message, market.authority())};
    }

    BuyResult buy(const Address& who, Side side, I128 shares) {
        BuyRequest req{who, side, shares, deadline()};
        auto msg = messages::buy_shares(market.domain(), req, market.nonce(who));
        return market.buy_shares(req, cosign(msg, who));
    }

    // Whale buy far above the threshold; capped into migration
    BuyResult migrate() { return buy(WHALE, Side::YES, pow10(24)); }

    OpenResult open(const Address& who, Side side, I128 collateral, uint32_t leverage,
                    I128 min_shares = 0) {
        OpenRequest req{who, side, collateral, leverage, min_shares, deadline()};
        auto msg = messages::open_position(market.domain(), req, market.nonce(who));
        return market.open_position(req, cosign(msg, who));
    }

    CloseResult close(const Address& who, Side side, I128 min_payout = 0) {
        CloseRequest req{who, side, min_payout, deadline()};
        auto msg = messages::close_position(market.domain(), req, market.nonce(who));
        return market.close_position(req, cosign(msg, who));
    }

    uint32_t bulk_liquidate(const Address& keeper, std::vector<Address> traders, std::vector<Side> sides) {
        BulkLiquidateRequest req{keeper, std::move(traders), std::move(sides), deadline()};
        auto msg = messages::bulk_liquidate(market.domain(), req, market.nonce(keeper));
        return market.bulk_liquidate(req, sign(msg, market.authority()));
    }

    ClaimResult claim_winnings(const Address& who) {
        ClaimRequest req{who, UserTier::STANDARD, deadline()};
        auto msg = messages::claim_tier(market.domain(), req, market.nonce(who));
        return market.claim_winnings(req, sign(msg, market.authority()));
    }

    ClaimResult claim_leveraged(const Address& who, UserTier tier) {
        ClaimRequest req{who, tier, deadline()};
        auto msg = messages::claim_tier(market.domain(), req, market.nonce(who));
        return market.claim_leveraged(req, sign(msg, market.authority()));
    }

    size_t count(EventType type) {
        std::lock_guard<std::mutex> lock(events_mutex);
        size_t n = 0;
        for (const auto& e : events) {
            if (e.type == type) ++n;
        }
        return n;
    }

    MarketConfig config;
    HookedVault vault;
    LendingPool lending;
    InsuranceFund insurance;
    OutcomeToken yes_token;
    OutcomeToken no_token;
    EchoVerifier verifier;
    Market market;

    uint64_t clock = START;
    std::mutex events_mutex;
    std::vector<MarketEvent> events;
};

} // namespace predex::test

#endif // PREDEX_TEST_FIXTURES_HPP
