// predex - Market Engine Tests (phase 1, migration, leverage)

#include <catch2/catch_test_macros.hpp>
#include "fixtures.hpp"

#include <atomic>
#include <limits>
#include <thread>

using namespace predex;
using namespace predex::test;

namespace {

const I128 ALICE_YES_SHARES = parse_decimal("95238095238095238096");
const I128 BOB_NO_SHARES = parse_decimal("521651050898961762471");

} // anonymous namespace

// =============================================================================
// Initialization
// =============================================================================

TEST_CASE("Market initialization", "[market]") {
    SECTION("Calls before initialization fail") {
        Market market;
        REQUIRE_FALSE(market.initialized());
        BuyRequest req{ALICE, Side::YES, WAD, START};
        REQUIRE(error_code([&] { market.buy_shares(req, Signatures{}); }) == errors::NOT_INITIALIZED);
        REQUIRE(error_code([&] { market.preview_open(Side::YES, 10 * EA); }) == errors::NOT_INITIALIZED);
    }

    SECTION("Initialized once") {
        MarketFixture f;
        REQUIRE(f.market.initialized());
        REQUIRE(f.market.phase() == Phase::PRE_MIGRATION);
        REQUIRE(f.market.authority() == AUTHORITY);
        REQUIRE(f.market.domain().name == "PredexMarket");
        REQUIRE(f.market.domain().verifying_contract == f.config.market_address);
        REQUIRE_THROWS_AS(f.market.initialize(f.config, f.collaborators()), MarketError);
        REQUIRE(error_code([&] { f.market.initialize(f.config, f.collaborators()); }) ==
                errors::ALREADY_INITIALIZED);
    }

    SECTION("Every collaborator is required") {
        MarketFixture f;
        Market market;
        Collaborators partial = f.collaborators();
        partial.lending = nullptr;
        REQUIRE(error_code([&] { market.initialize(f.config, partial); }) == errors::INVALID_CONFIG);
    }

    SECTION("Vault units must match the config") {
        MarketFixture f;
        CustodyVault other(pow10(6));
        Collaborators c = f.collaborators();
        c.vault = &other;
        Market market;
        REQUIRE(error_code([&] { market.initialize(f.config, c); }) == errors::INVALID_CONFIG);
    }
}

// =============================================================================
// Phase 1
// =============================================================================

TEST_CASE("Phase 1 buys on the bonding curve", "[market][phase1]") {
    MarketFixture f;

    BuyResult r = f.buy(ALICE, Side::YES, 500 * WAD);
    REQUIRE(r.shares == 500 * WAD);
    REQUIRE(r.cost == 125000000000000000LL);
    REQUIRE(r.fee == 625000000000000LL);
    REQUIRE_FALSE(r.migrated);

    REQUIRE(f.yes_token.balance_of(ALICE) == 500 * WAD);
    REQUIRE(f.vault.balance_of(ALICE) == 10000 * WAD - 125625000000000000LL);
    REQUIRE(f.vault.balance_of(f.config.market_address) == 125625000000000000LL);
    REQUIRE(f.market.nonce(ALICE) == 1);
    REQUIRE(f.count(EventType::BUY_EXECUTED) == 1);

    SECTION("Both sides draw on one supply counter") {
        BuyResult no = f.buy(BOB, Side::NO, 1000 * WAD);
        REQUIRE(no.cost == WAD);
        REQUIRE(f.no_token.balance_of(BOB) == 1000 * WAD);
        REQUIRE(f.market.state().curve.current_supply() == 1500 * WAD);
    }

    SECTION("Failed buys leave no trace") {
        REQUIRE(error_code([&] { f.buy(ALICE, Side::YES, 0); }) == errors::ZERO_AMOUNT);
        REQUIRE(f.market.nonce(ALICE) == 1);

        const Address broke = addresses::from_id(77);
        REQUIRE(error_code([&] { f.buy(broke, Side::NO, 10 * WAD); }) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(f.market.nonce(broke) == 0);
        REQUIRE(f.no_token.total_supply() == 0);
        REQUIRE(f.market.state().curve.current_supply() == 500 * WAD);
        REQUIRE(f.count(EventType::BUY_EXECUTED) == 1);
    }
}

TEST_CASE("Phase 1 authorization", "[market][phase1][auth]") {
    MarketFixture f;
    BuyRequest req{ALICE, Side::YES, 10 * WAD, f.deadline()};
    TypedMessage msg = messages::buy_shares(f.market.domain(), req, 0);

    SECTION("Co-signed request executes once") {
        Signatures sigs{sign(msg, ALICE), sign(msg, AUTHORITY)};
        f.market.buy_shares(req, sigs);
        REQUIRE(error_code([&] { f.market.buy_shares(req, sigs); }) == errors::INVALID_SIGNATURE);
        REQUIRE(f.market.nonce(ALICE) == 1);
    }

    SECTION("User signature from someone else") {
        Signatures sigs{sign(msg, BOB), sign(msg, AUTHORITY)};
        REQUIRE(error_code([&] { f.market.buy_shares(req, sigs); }) == errors::INVALID_SIGNATURE);
    }

    SECTION("Missing authority signature") {
        Signatures sigs{sign(msg, ALICE), Signature{}};
        REQUIRE(error_code([&] { f.market.buy_shares(req, sigs); }) == errors::INVALID_SIGNATURE);
    }

    SECTION("Signed for another chain") {
        Domain other = f.market.domain();
        other.chain_id = 5;
        TypedMessage foreign = messages::buy_shares(other, req, 0);
        Signatures sigs{sign(foreign, ALICE), sign(foreign, AUTHORITY)};
        REQUIRE(error_code([&] { f.market.buy_shares(req, sigs); }) == errors::INVALID_SIGNATURE);
    }

    SECTION("Expired deadline") {
        f.advance(3601);
        Signatures sigs{sign(msg, ALICE), sign(msg, AUTHORITY)};
        REQUIRE(error_code([&] { f.market.buy_shares(req, sigs); }) == errors::DEADLINE_PASSED);
        REQUIRE(f.market.nonce(ALICE) == 0);
    }
}

// =============================================================================
// Migration
// =============================================================================

TEST_CASE("Migration fires on the buy that reaches the threshold", "[market][migration]") {
    MarketFixture f;

    BuyResult r = f.migrate();
    REQUIRE(r.migrated);
    REQUIRE(r.shares == parse_decimal("44721359549995793928183"));
    REQUIRE(r.cost == 1000 * WAD);
    REQUIRE(r.fee == 5 * WAD);

    MarketState s = f.market.state();
    REQUIRE(s.phase == Phase::PHASE2_ACTIVE);
    REQUIRE(s.curve.closed());
    REQUIRE(s.curve.total_capital_raised() == s.curve.migration_threshold());
    REQUIRE(s.cash == 1000 * EA);
    REQUIRE(s.amm.reserve_stable() == 1000 * WAD);
    REQUIRE(s.amm.reserve(Side::YES) == 2000 * WAD);
    REQUIRE(s.amm.reserve(Side::NO) == 2000 * WAD);
    REQUIRE(f.market.price(Side::YES) == HALF_WAD);
    REQUIRE(f.market.price(Side::NO) == HALF_WAD);

    // Capital left custody, fees went to insurance
    REQUIRE(f.vault.released(f.config.market_address));
    REQUIRE(f.vault.balance_of(f.config.market_address) == 0);
    REQUIRE(f.insurance.balance() == 5 * EA);
    REQUIRE(f.insurance.total_fees() == 5 * EA);

    SECTION("Events in order") {
        REQUIRE(f.events.size() == 3);
        REQUIRE(f.events[0].type == EventType::BUY_EXECUTED);
        REQUIRE(f.events[1].type == EventType::MIGRATED);
        REQUIRE(f.events[2].type == EventType::LEVERAGE_ACTIVATED);
        REQUIRE(f.events[1].data["cash"] == "1000000000");
        REQUIRE(f.events[1].data["capital"] == "1000000000000000000000");
        REQUIRE(f.events[0].data["capped"] == true);
        REQUIRE(f.events[2].to_json()["type"] == "LEVERAGE_ACTIVATED");
    }

    SECTION("The curve stays closed") {
        REQUIRE(error_code([&] { f.buy(ALICE, Side::NO, WAD); }) == errors::MARKET_MIGRATED);
        REQUIRE(f.count(EventType::MIGRATED) == 1);
    }
}

TEST_CASE("Migration after earlier buys", "[market][migration]") {
    MarketFixture f;
    f.buy(ALICE, Side::YES, 500 * WAD);
    f.buy(BOB, Side::NO, 1000 * WAD);

    BuyResult r = f.migrate();
    REQUIRE(r.migrated);
    REQUIRE(r.shares < pow10(24));

    MarketState s = f.market.state();
    REQUIRE(s.curve.total_capital_raised() == 1000 * WAD);
    REQUIRE(s.curve.fees_collected() == 5 * WAD);
    REQUIRE(s.cash == 1000 * EA);
    REQUIRE(f.insurance.balance() == 5 * EA);
}

// =============================================================================
// Leveraged Positions
// =============================================================================

TEST_CASE("Leveraged open and close", "[market][leverage]") {
    MarketFixture f;
    f.migrate();

    OpenResult opened = f.open(ALICE, Side::YES, 10 * EA, 5);
    REQUIRE(opened.shares == ALICE_YES_SHARES);
    REQUIRE(opened.loan == 40 * EA);
    REQUIRE(opened.entry_price == 524999999999999999LL);

    REQUIRE(f.market.price(Side::YES) == 551250000000000000LL);
    REQUIRE(f.market.price(Side::NO) == 448750000000000000LL);
    REQUIRE(f.market.health_factor(ALICE, Side::YES) == 10937);
    REQUIRE(f.market.state().cash == 1050 * EA);
    REQUIRE(f.market.state().positions.open_interest(Side::YES) == ALICE_YES_SHARES);
    REQUIRE(f.market.state().positions.total_borrowed() == 40 * EA);
    REQUIRE(f.lending.total_borrowed() == 40 * EA);
    REQUIRE(f.vault.balance_of(ALICE) == 9990 * WAD);
    REQUIRE(f.count(EventType::REBALANCED) == 1);
    REQUIRE(f.count(EventType::POSITION_OPENED) == 1);

    REQUIRE(error_code([&] { f.open(ALICE, Side::YES, 10 * EA, 2); }) == errors::POSITION_EXISTS);

    SECTION("Immediate close returns the collateral") {
        CloseResult closed = f.close(ALICE, Side::YES);
        REQUIRE(closed.proceeds == 50 * EA);
        REQUIRE(closed.debt_repaid == 40 * EA);
        REQUIRE(closed.bad_debt == 0);
        REQUIRE(closed.payout == 10 * EA);
        REQUIRE(closed.pnl == 0);

        REQUIRE(f.market.state().cash == 1000 * EA);
        REQUIRE(f.vault.balance_of(ALICE) == 10000 * WAD);
        REQUIRE(f.lending.total_borrowed() == 0);
        REQUIRE(f.market.price(Side::YES) == HALF_WAD);
        REQUIRE(f.market.state().positions.open_interest(Side::YES) == 0);

        auto record = f.market.position(ALICE, Side::YES);
        REQUIRE(record.has_value());
        REQUIRE_FALSE(record->active);
        REQUIRE(error_code([&] { f.close(ALICE, Side::YES); }) == errors::NO_ACTIVE_POSITION);

        // The key is free again
        f.open(ALICE, Side::YES, 2 * EA, 3);
        REQUIRE(f.market.position(ALICE, Side::YES)->active);
    }

    SECTION("Interest accrues on the loan") {
        f.advance(SECONDS_PER_YEAR);
        REQUIRE(f.market.health_factor(ALICE, Side::YES) == 9943);

        CloseResult closed = f.close(ALICE, Side::YES);
        REQUIRE(closed.debt_repaid == 44 * EA);
        REQUIRE(closed.payout == 6 * EA);
        REQUIRE(closed.pnl == -4 * EA);
        REQUIRE(f.lending.interest_earned() == 4 * EA);
        REQUIRE(f.vault.balance_of(ALICE) == 9996 * WAD);
    }

    SECTION("Payout floor") {
        REQUIRE(error_code([&] { f.close(ALICE, Side::YES, 10 * EA + 1); }) == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(f.market.position(ALICE, Side::YES)->active);
        REQUIRE(f.market.price(Side::YES) == 551250000000000000LL);
        REQUIRE(f.close(ALICE, Side::YES, 10 * EA).payout == 10 * EA);
    }
}

TEST_CASE("Open position validation", "[market][leverage]") {
    SECTION("Leverage opens after migration") {
        MarketFixture f;
        REQUIRE(error_code([&] { f.open(ALICE, Side::YES, 10 * EA, 5); }) == errors::PHASE2_NOT_ACTIVE);
        REQUIRE(error_code([&] { f.market.liquidate(KEEPER, ALICE, Side::YES); }) == errors::PHASE2_NOT_ACTIVE);
        REQUIRE(error_code([&] { f.market.preview_open(Side::YES, 10 * EA); }) == errors::PHASE2_NOT_ACTIVE);
    }

    MarketFixture f;
    f.migrate();

    SECTION("Collateral and leverage bounds") {
        REQUIRE(error_code([&] { f.open(ALICE, Side::YES, EA - 1, 5); }) == errors::COLLATERAL_TOO_LOW);
        REQUIRE(error_code([&] { f.open(ALICE, Side::YES, 10 * EA, 0); }) == errors::INVALID_LEVERAGE);
        REQUIRE(error_code([&] { f.open(ALICE, Side::YES, 10 * EA, 11); }) == errors::INVALID_LEVERAGE);
        REQUIRE(f.market.nonce(ALICE) == 0);
    }

    SECTION("Unlevered position borrows nothing") {
        OpenResult r = f.open(ALICE, Side::NO, 10 * EA, 1);
        REQUIRE(r.loan == 0);
        REQUIRE(f.lending.total_borrowed() == 0);
        REQUIRE(f.market.health_factor(ALICE, Side::NO) == math::MAX_HEALTH_FACTOR);
    }

    SECTION("Share floor rolls the whole call back") {
        size_t events_before = f.events.size();
        REQUIRE(error_code([&] { f.open(ALICE, Side::YES, 10 * EA, 5, ALICE_YES_SHARES + 1); }) ==
                errors::SLIPPAGE_EXCEEDED);

        REQUIRE(f.market.nonce(ALICE) == 0);
        REQUIRE(f.vault.balance_of(ALICE) == 10000 * WAD);
        REQUIRE(f.lending.total_borrowed() == 0);
        REQUIRE(f.market.state().cash == 1000 * EA);
        REQUIRE(f.market.price(Side::YES) == HALF_WAD);
        REQUIRE_FALSE(f.market.position(ALICE, Side::YES).has_value());
        REQUIRE(f.events.size() == events_before);
    }

    SECTION("Oversized collateral overflows cleanly") {
        const I128 huge = std::numeric_limits<I128>::max();
        REQUIRE(error_code([&] { f.open(ALICE, Side::YES, huge, 5); }) == errors::MATH_OVERFLOW);
        REQUIRE(error_code([&] { f.open(ALICE, Side::YES, huge / pow10(12), 2); }) == errors::MATH_OVERFLOW);
        REQUIRE(error_code([&] { f.market.preview_open(Side::YES, huge, 5); }) == errors::MATH_OVERFLOW);
        REQUIRE(f.market.nonce(ALICE) == 0);
        REQUIRE(f.vault.balance_of(ALICE) == 10000 * WAD);
    }

    SECTION("Preview matches execution") {
        math::LeveragePreview preview = f.market.preview_open(Side::YES, 10 * EA);
        REQUIRE(preview.loan == 40 * EA);
        REQUIRE(preview.shares_out == ALICE_YES_SHARES);
        REQUIRE(f.market.price(Side::YES) == HALF_WAD);
        REQUIRE(error_code([&] { f.market.preview_open(Side::YES, 10 * EA, 11); }) == errors::INVALID_LEVERAGE);

        OpenResult r = f.open(ALICE, Side::YES, 10 * EA, 5);
        REQUIRE(r.shares == preview.shares_out);
        REQUIRE(r.entry_price == preview.entry_price);
    }
}

TEST_CASE("Lending utilization cap blocks oversized loans", "[market][leverage]") {
    MarketFixture f(test_config(), 100 * EA);
    f.migrate();

    REQUIRE(error_code([&] { f.open(ALICE, Side::YES, 10 * EA, 10); }) == errors::UTILIZATION_CAP);
    REQUIRE(f.vault.balance_of(ALICE) == 10000 * WAD);
    REQUIRE(f.market.state().cash == 1000 * EA);

    f.open(ALICE, Side::YES, 10 * EA, 9);
    REQUIRE(f.lending.total_borrowed() == 80 * EA);
}

// =============================================================================
// Liquidation
// =============================================================================

TEST_CASE("Liquidation of an unhealthy position", "[market][liquidation]") {
    MarketFixture f;
    f.migrate();
    f.open(ALICE, Side::YES, 10 * EA, 5);
    OpenResult bob = f.open(BOB, Side::NO, 10 * EA, 5);
    REQUIRE(bob.shares == BOB_NO_SHARES);

    REQUIRE(f.market.price(Side::YES) == 395000000000000000LL);
    REQUIRE(f.market.price(Side::NO) == 605000000000000000LL);
    REQUIRE(f.market.health_factor(ALICE, Side::YES) == 7837);
    REQUIRE(f.market.health_factor(BOB, Side::NO) == 65749);
    REQUIRE(f.market.state().cash == 1100 * EA);

    REQUIRE(error_code([&] { f.market.liquidate(KEEPER, BOB, Side::NO); }) == errors::POSITION_HEALTHY);
    REQUIRE(error_code([&] { f.market.liquidate(KEEPER, CAROL, Side::NO); }) == errors::NO_ACTIVE_POSITION);

    LiquidationResult r = f.market.liquidate(KEEPER, ALICE, Side::YES);
    REQUIRE(r.proceeds == 405567182);
    REQUIRE(r.debt_repaid == 40 * EA);
    REQUIRE(r.bad_debt == 0);
    REQUIRE(r.insurance_fee == 18278359);
    REQUIRE(r.keeper_reward == 18278359);
    REQUIRE(r.trader_refund == 329010464);

    REQUIRE(f.market.state().cash == 694432818);
    REQUIRE(f.insurance.balance() == 5 * EA + 18278359);
    REQUIRE(f.vault.balance_of(KEEPER) == 18278359 * f.config.scale_factor);
    REQUIRE(f.vault.balance_of(ALICE) == 9990 * WAD + 329010464 * f.config.scale_factor);
    REQUIRE(f.lending.total_borrowed() == 40 * EA);
    REQUIRE(f.count(EventType::POSITION_LIQUIDATED) == 1);

    REQUIRE_FALSE(f.market.position(ALICE, Side::YES)->active);
    REQUIRE(f.market.position(BOB, Side::NO)->active);
    REQUIRE(error_code([&] { f.market.liquidate(KEEPER, ALICE, Side::YES); }) == errors::NO_ACTIVE_POSITION);
}

TEST_CASE("Interest alone can make a position liquidatable", "[market][liquidation]") {
    MarketFixture f;
    f.migrate();
    f.open(ALICE, Side::YES, 10 * EA, 5);

    REQUIRE(error_code([&] { f.market.liquidate(KEEPER, ALICE, Side::YES); }) == errors::POSITION_HEALTHY);
    f.advance(SECONDS_PER_YEAR);

    LiquidationResult r = f.market.liquidate(KEEPER, ALICE, Side::YES);
    REQUIRE(r.proceeds == 50 * EA);
    REQUIRE(r.debt_repaid == 44 * EA);
    REQUIRE(r.insurance_fee == 300000);
    REQUIRE(r.keeper_reward == 300000);
    REQUIRE(r.trader_refund == 5400000);
    REQUIRE(f.market.state().cash == 1000 * EA);
    REQUIRE(f.lending.interest_earned() == 4 * EA);
}

TEST_CASE("Positions on both sides of one trader are isolated", "[market][liquidation]") {
    MarketFixture f;
    f.migrate();
    f.open(ALICE, Side::YES, 10 * EA, 5);
    f.open(ALICE, Side::NO, 10 * EA, 5);

    Position no_before = *f.market.position(ALICE, Side::NO);
    REQUIRE(no_before.shares == BOB_NO_SHARES);
    REQUIRE(f.market.state().positions.active_count() == 2);

    f.market.liquidate(KEEPER, ALICE, Side::YES);

    Position no_after = *f.market.position(ALICE, Side::NO);
    REQUIRE(no_after.active);
    REQUIRE(no_after.shares == no_before.shares);
    REQUIRE(no_after.collateral == no_before.collateral);
    REQUIRE(no_after.loan_amount == no_before.loan_amount);
    REQUIRE(no_after.opened_at == no_before.opened_at);
    REQUIRE(f.market.state().positions.total_borrowed() == 40 * EA);
    REQUIRE(f.market.state().positions.open_interest(Side::NO) == BOB_NO_SHARES);
}

TEST_CASE("Bad debt is covered by the insurance fund", "[market][liquidation]") {
    MarketFixture f;
    f.migrate();

    OpenResult opened = f.open(ALICE, Side::YES, 10 * EA, 10);
    REQUIRE(opened.shares == parse_decimal("181818181818181818182"));
    REQUIRE(opened.loan == 90 * EA);
    f.advance(2 * SECONDS_PER_YEAR);

    SECTION("An empty fund blocks the close") {
        // 8 EA shortfall against 5 EA of migration fees
        REQUIRE(error_code([&] { f.close(ALICE, Side::YES); }) == errors::INSURANCE_INSUFFICIENT);

        REQUIRE(f.market.position(ALICE, Side::YES)->active);
        REQUIRE(f.market.nonce(ALICE) == 1);
        REQUIRE(f.market.state().cash == 1100 * EA);
        REQUIRE(f.market.price(Side::YES) == 605000000000000000LL);
        REQUIRE(f.insurance.balance() == 5 * EA);
        REQUIRE(f.lending.total_borrowed() == 90 * EA);
        REQUIRE(f.lending.interest_earned() == 0);
    }

    SECTION("A funded pool absorbs the shortfall") {
        f.insurance.seed(10 * EA);
        CloseResult closed = f.close(ALICE, Side::YES);
        REQUIRE(closed.proceeds == 100 * EA);
        REQUIRE(closed.debt_repaid == 108 * EA);
        REQUIRE(closed.bad_debt == 8 * EA);
        REQUIRE(closed.payout == 0);
        REQUIRE(closed.pnl == -10 * EA);

        REQUIRE(f.insurance.balance() == 7 * EA);
        REQUIRE(f.insurance.total_covered() == 8 * EA);
        REQUIRE(f.lending.total_borrowed() == 0);
        REQUIRE(f.lending.interest_earned() == 18 * EA);
        REQUIRE(f.market.state().cash == 1000 * EA);
        REQUIRE(f.vault.balance_of(ALICE) == 9990 * WAD);
    }
}

TEST_CASE("Bulk liquidation skips inactive and healthy entries", "[market][liquidation]") {
    MarketFixture f;
    f.migrate();
    f.open(ALICE, Side::YES, 10 * EA, 5);
    f.open(BOB, Side::NO, 10 * EA, 5);

    SECTION("Lists must line up") {
        REQUIRE(error_code([&] { f.bulk_liquidate(KEEPER, {ALICE, BOB}, {Side::YES}); }) ==
                errors::LENGTH_MISMATCH);
    }

    SECTION("Authority signature required") {
        BulkLiquidateRequest req{KEEPER, {ALICE}, {Side::YES}, f.deadline()};
        auto msg = messages::bulk_liquidate(f.market.domain(), req, 0);
        REQUIRE(error_code([&] { f.market.bulk_liquidate(req, sign(msg, KEEPER)); }) == errors::INVALID_SIGNATURE);
    }

    SECTION("Counts only liquidated positions") {
        uint32_t n = f.bulk_liquidate(KEEPER, {ALICE, BOB, CAROL}, {Side::YES, Side::NO, Side::YES});
        REQUIRE(n == 1);
        REQUIRE(f.market.nonce(KEEPER) == 1);
        REQUIRE_FALSE(f.market.position(ALICE, Side::YES)->active);
        REQUIRE(f.market.position(BOB, Side::NO)->active);
        REQUIRE(f.count(EventType::POSITION_LIQUIDATED) == 1);

        REQUIRE(f.bulk_liquidate(KEEPER, {ALICE}, {Side::YES}) == 0);
        REQUIRE(f.market.nonce(KEEPER) == 2);
    }
}

// =============================================================================
// Guarded Execution
// =============================================================================

TEST_CASE("Re-entrant calls from a collaborator are rejected", "[market][guard]") {
    MarketFixture f;
    f.migrate();

    SECTION("Mutating call from inside a call") {
        f.vault.on_transfer = [&] { f.market.liquidate(KEEPER, BOB, Side::NO); };
        REQUIRE(error_code([&] { f.open(ALICE, Side::YES, 10 * EA, 5); }) == errors::REENTRANCY);

        f.vault.on_transfer = nullptr;
        REQUIRE(f.market.nonce(ALICE) == 0);
        REQUIRE_FALSE(f.market.position(ALICE, Side::YES).has_value());
        REQUIRE(f.vault.balance_of(ALICE) == 10000 * WAD);
    }

    SECTION("Views stay readable from inside a call") {
        Phase seen = Phase::RESOLVED;
        f.vault.on_transfer = [&] { seen = f.market.phase(); };
        f.open(ALICE, Side::YES, 10 * EA, 5);
        REQUIRE(seen == Phase::PHASE2_ACTIVE);
    }

    SECTION("Event listeners may call back in") {
        uint64_t nonce_seen = 0;
        f.market.set_event_callback([&](const MarketEvent& e) {
            if (e.type == EventType::POSITION_OPENED) nonce_seen = f.market.nonce(ALICE);
        });
        f.open(ALICE, Side::YES, 10 * EA, 5);
        REQUIRE(nonce_seen == 1);
    }
}

TEST_CASE("Rollback keeps custody changes made by other callers", "[market][guard]") {
    MarketFixture f;
    const Address BROKE = addresses::from_id(0xB0B0);

    SECTION("Deposit from another thread during a failing buy") {
        f.vault.on_transfer = [&] { std::thread([&] { f.vault.deposit(CAROL, 500 * EA); }).join(); };
        REQUIRE(error_code([&] { f.buy(BROKE, Side::YES, WAD); }) == errors::INSUFFICIENT_BALANCE);
        f.vault.on_transfer = nullptr;

        REQUIRE(f.vault.balance_of(CAROL) == 10500 * WAD);
        REQUIRE(f.vault.balance_of(BROKE) == 0);
        REQUIRE(f.market.nonce(BROKE) == 0);
        REQUIRE(f.market.state().curve.current_supply() == 0);
    }

    SECTION("Deposit from another thread during a failing open") {
        f.migrate();
        f.vault.on_transfer = [&] { std::thread([&] { f.vault.deposit(CAROL, 500 * EA); }).join(); };
        REQUIRE(error_code([&] { f.open(ALICE, Side::YES, 10 * EA, 5, ALICE_YES_SHARES + 1); }) ==
                errors::SLIPPAGE_EXCEEDED);
        f.vault.on_transfer = nullptr;

        REQUIRE(f.vault.balance_of(ALICE) == 10000 * WAD);
        REQUIRE(f.vault.balance_of(CAROL) == 10500 * WAD);
        REQUIRE(f.lending.total_borrowed() == 0);
        REQUIRE(f.market.state().cash == 1000 * EA);
        REQUIRE_FALSE(f.market.position(ALICE, Side::YES).has_value());
    }

    SECTION("Another market commits while this one rolls back") {
        MarketConfig other_config = test_config();
        other_config.market_address = addresses::from_id(0x0DD);
        f.insurance.authorize_market(other_config.market_address);
        f.lending.authorize_borrower(other_config.market_address);
        OutcomeToken other_yes("YES", other_config.market_address);
        OutcomeToken other_no("NO", other_config.market_address);

        Collaborators c = f.collaborators();
        c.yes_token = &other_yes;
        c.no_token = &other_no;
        Market other;
        other.set_clock([&] { return f.clock; });
        other.initialize(other_config, c);

        bool fired = false;
        f.vault.on_transfer = [&] {
            if (fired) return;
            fired = true;
            std::thread([&] {
                BuyRequest req{CAROL, Side::NO, 500 * WAD, f.deadline()};
                auto msg = messages::buy_shares(other.domain(), req, other.nonce(CAROL));
                other.buy_shares(req, Signatures{sign(msg, CAROL), sign(msg, AUTHORITY)});
            }).join();
        };
        REQUIRE(error_code([&] { f.buy(BROKE, Side::YES, WAD); }) == errors::INSUFFICIENT_BALANCE);
        f.vault.on_transfer = nullptr;

        REQUIRE(fired);
        REQUIRE(other.nonce(CAROL) == 1);
        REQUIRE(other_no.balance_of(CAROL) == 500 * WAD);
        REQUIRE(f.vault.balance_of(other_config.market_address) == 125625000000000000LL);
        REQUIRE(f.vault.balance_of(CAROL) == 10000 * WAD - 125625000000000000LL);
        REQUIRE(f.market.nonce(BROKE) == 0);
    }
}

TEST_CASE("Concurrent callers are serialized", "[market][guard]") {
    MarketFixture f;
    std::atomic<int> failures{0};

    auto trader = [&](Address who, Side side) {
        for (int i = 0; i < 25; ++i) {
            try {
                f.buy(who, side, WAD);
            } catch (const MarketError&) {
                ++failures;
            }
        }
    };
    std::thread a(trader, ALICE, Side::YES);
    std::thread b(trader, BOB, Side::NO);
    a.join();
    b.join();

    REQUIRE(failures.load() == 0);
    REQUIRE(f.market.nonce(ALICE) == 25);
    REQUIRE(f.market.nonce(BOB) == 25);
    REQUIRE(f.yes_token.total_supply() == 25 * WAD);
    REQUIRE(f.no_token.total_supply() == 25 * WAD);

    MarketState s = f.market.state();
    REQUIRE(s.curve.current_supply() == 50 * WAD);
    REQUIRE(s.curve.total_capital_raised() ==
            math::curve_raw_cost(0, 50 * WAD, math::CurveParams{f.config.curve_k, f.config.curve_scale}));
    REQUIRE(f.count(EventType::BUY_EXECUTED) == 50);
}

// =============================================================================
// Administration
// =============================================================================

TEST_CASE("Authority rotation", "[market][admin]") {
    MarketFixture f;

    REQUIRE(error_code([&] { f.market.rotate_authority(BOB, CAROL); }) == errors::UNAUTHORIZED);
    REQUIRE(error_code([&] { f.market.rotate_authority(AUTHORITY, addresses::ZERO); }) == errors::INVALID_CONFIG);

    f.market.rotate_authority(AUTHORITY, CAROL);
    REQUIRE(f.market.authority() == CAROL);
    REQUIRE(f.count(EventType::AUTHORITY_ROTATED) == 1);

    // The old key no longer co-signs
    BuyRequest req{ALICE, Side::YES, WAD, f.deadline()};
    auto msg = messages::buy_shares(f.market.domain(), req, 0);
    REQUIRE(error_code([&] {
        f.market.buy_shares(req, Signatures{sign(msg, ALICE), sign(msg, AUTHORITY)});
    }) == errors::INVALID_SIGNATURE);

    REQUIRE_NOTHROW(f.buy(ALICE, Side::YES, WAD));
    REQUIRE(error_code([&] { f.market.rotate_authority(AUTHORITY, BOB); }) == errors::UNAUTHORIZED);
}
