// predex scenario runner
//
// Builds a market on the in-memory collaborators, replays a JSON list of
// actions against it and prints every market event as one JSON line.
//
//   predex-sim <config.json> [scenario.json]
//
// Without a scenario the built-in lifecycle demo runs.

#include <predex/predex.hpp>
#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using json = nlohmann::json;
using namespace predex;

namespace {

//------------------------------------------------------------------------------
// Scenario input helpers
//------------------------------------------------------------------------------

Address account_of(const json& j, const char* key) {
    const json& v = j.at(key);
    if (v.is_number()) return addresses::from_id(v.get<uint32_t>());
    return addresses::from_hex(v.get<std::string>());
}

I128 amount_of(const json& j, const char* key, I128 fallback = 0) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (it->is_string()) return parse_decimal(it->get<std::string>());
    return static_cast<I128>(it->get<int64_t>());
}

json read_json(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return json::parse(buffer.str());
}

//------------------------------------------------------------------------------
// Simulation
//------------------------------------------------------------------------------

class Simulation {
public:
    explicit Simulation(const MarketConfig& config)
        : config_(config)
        , vault_(config.scale_factor)
        , lending_(8000)
        , insurance_(config.authority)
        , yes_("YES", config.market_address)
        , no_("NO", config.market_address)
        , now_(1700000000)
    {
        lending_.authorize_borrower(config.market_address);
        insurance_.authorize_market(config.market_address);

        Collaborators c;
        c.vault = &vault_;
        c.lending = &lending_;
        c.insurance = &insurance_;
        c.yes_token = &yes_;
        c.no_token = &no_;
        c.verifier = &verifier_;

        market_.set_clock([this] { return now_; });
        market_.set_event_callback([](const MarketEvent& e) {
            std::cout << e.to_json().dump() << std::endl;
        });
        market_.initialize(config, c);
    }

    void run(const json& scenario) {
        if (scenario.contains("start_time")) now_ = scenario["start_time"].get<uint64_t>();
        I128 supply = amount_of(scenario, "lending_supply", 1000000 * pow10(6));
        if (supply > 0) lending_.supply(addresses::from_id(0xFEED), supply);
        I128 seed = amount_of(scenario, "insurance_seed");
        if (seed > 0) insurance_.seed(seed);

        const json& actions = scenario.at("actions");
        for (size_t i = 0; i < actions.size(); ++i) {
            const json& action = actions[i];
            try {
                apply(action);
            } catch (const MarketError& e) {
                std::cout << json{{"action", i}, {"op", action.value("op", "")},
                                  {"error", e.reason()}, {"message", e.what()}}.dump()
                          << std::endl;
            } catch (const json::exception& e) {
                std::cout << json{{"action", i}, {"error", "MALFORMED_ACTION"},
                                  {"message", e.what()}}.dump()
                          << std::endl;
            }
        }
        summary();
    }

private:
    uint64_t deadline() const { return now_ + 3600; }

    Signatures both(const TypedMessage& msg, const Address& user) const {
        return Signatures{EchoVerifier::sign(msg, user), EchoVerifier::sign(msg, market_.authority())};
    }

    void apply(const json& a) {
        const std::string op = a.at("op").get<std::string>();

        if (op == "deposit") {
            vault_.deposit(account_of(a, "account"), amount_of(a, "amount"));
        } else if (op == "advance") {
            now_ += a.at("seconds").get<uint64_t>();
        } else if (op == "buy") {
            BuyRequest req{account_of(a, "account"), side_from_string(a.at("side").get<std::string>()),
                           amount_of(a, "shares"), deadline()};
            auto msg = messages::buy_shares(market_.domain(), req, market_.nonce(req.buyer));
            market_.buy_shares(req, both(msg, req.buyer));
        } else if (op == "open") {
            OpenRequest req{account_of(a, "account"), side_from_string(a.at("side").get<std::string>()),
                            amount_of(a, "collateral"),
                            a.value("leverage", config_.default_leverage),
                            amount_of(a, "min_shares"), deadline()};
            auto msg = messages::open_position(market_.domain(), req, market_.nonce(req.trader));
            market_.open_position(req, both(msg, req.trader));
        } else if (op == "close") {
            CloseRequest req{account_of(a, "account"), side_from_string(a.at("side").get<std::string>()),
                             amount_of(a, "min_payout"), deadline()};
            auto msg = messages::close_position(market_.domain(), req, market_.nonce(req.trader));
            market_.close_position(req, both(msg, req.trader));
        } else if (op == "liquidate") {
            market_.liquidate(account_of(a, "keeper"), account_of(a, "account"),
                              side_from_string(a.at("side").get<std::string>()));
        } else if (op == "bulk_liquidate") {
            BulkLiquidateRequest req;
            req.keeper = account_of(a, "keeper");
            req.deadline = deadline();
            for (const auto& p : a.at("positions")) {
                req.traders.push_back(account_of(p, "account"));
                req.sides.push_back(side_from_string(p.at("side").get<std::string>()));
            }
            auto msg = messages::bulk_liquidate(market_.domain(), req, market_.nonce(req.keeper));
            market_.bulk_liquidate(req, EchoVerifier::sign(msg, market_.authority()));
        } else if (op == "resolve") {
            market_.resolve(market_.authority(), side_from_string(a.at("side").get<std::string>()));
        } else if (op == "claim") {
            ClaimRequest req{account_of(a, "account"), UserTier::STANDARD, deadline()};
            auto msg = messages::claim_tier(market_.domain(), req, market_.nonce(req.claimant));
            market_.claim_winnings(req, EchoVerifier::sign(msg, market_.authority()));
        } else if (op == "claim_leveraged") {
            UserTier tier = UserTier::STANDARD;
            std::string name = a.value("tier", "STANDARD");
            if (name == "EARLY") tier = UserTier::EARLY;
            else if (name == "FAN_TOKEN") tier = UserTier::FAN_TOKEN;
            ClaimRequest req{account_of(a, "account"), tier, deadline()};
            auto msg = messages::claim_tier(market_.domain(), req, market_.nonce(req.claimant));
            market_.claim_leveraged(req, EchoVerifier::sign(msg, market_.authority()));
        } else if (op == "sweep") {
            ClaimKind kind = a.value("kind", "PHASE1") == "PHASE2" ? ClaimKind::PHASE2 : ClaimKind::PHASE1;
            market_.sweep_unclaimed(market_.authority(), account_of(a, "account"), kind);
        } else if (op == "rotate_authority") {
            market_.rotate_authority(market_.authority(), account_of(a, "next"));
        } else {
            throw MarketError(errors::INVALID_CONFIG, "unknown op: " + op);
        }
    }

    void summary() const {
        MarketState s = market_.state();
        json out = {
            {"summary", {
                {"phase", to_string(s.phase)},
                {"current_supply", to_decimal(s.curve.current_supply())},
                {"total_capital_raised", to_decimal(s.curve.total_capital_raised())},
                {"cash", to_decimal(s.cash)},
                {"total_borrowed", to_decimal(s.positions.total_borrowed())},
                {"open_interest_yes", to_decimal(s.positions.open_interest(Side::YES))},
                {"open_interest_no", to_decimal(s.positions.open_interest(Side::NO))},
                {"insurance_balance", to_decimal(insurance_.balance())},
                {"lending_interest", to_decimal(lending_.interest_earned())}
            }}
        };
        std::cout << out.dump() << std::endl;
    }

    MarketConfig config_;
    CustodyVault vault_;
    LendingPool lending_;
    InsuranceFund insurance_;
    OutcomeToken yes_;
    OutcomeToken no_;
    EchoVerifier verifier_;
    Market market_;
    uint64_t now_;
};

// Phase 1 sale to migration, two leveraged traders, liquidation, resolution
json demo_scenario(const MarketConfig& config) {
    const I128 unit = pow10(6);
    const I128 threshold_shares = 400000 * WAD;   // more than the threshold admits

    json actions = json::array();
    for (uint32_t id : {1u, 2u, 3u, 4u}) {
        actions.push_back({{"op", "deposit"}, {"account", id},
                           {"amount", to_decimal(config.migration_threshold * 2)}});
    }
    actions.push_back({{"op", "buy"}, {"account", 1}, {"side", "YES"}, {"shares", to_decimal(1000 * WAD)}});
    actions.push_back({{"op", "buy"}, {"account", 2}, {"side", "NO"}, {"shares", to_decimal(threshold_shares)}});
    actions.push_back({{"op", "open"}, {"account", 3}, {"side", "YES"},
                       {"collateral", to_decimal(100 * unit)}, {"leverage", 5}});
    actions.push_back({{"op", "open"}, {"account", 4}, {"side", "NO"},
                       {"collateral", to_decimal(500 * unit)}, {"leverage", 5}});
    actions.push_back({{"op", "liquidate"}, {"keeper", 4}, {"account", 3}, {"side", "YES"}});
    actions.push_back({{"op", "advance"}, {"seconds", 86400}});
    actions.push_back({{"op", "resolve"}, {"side", "NO"}});
    actions.push_back({{"op", "claim"}, {"account", 2}});
    actions.push_back({{"op", "claim_leveraged"}, {"account", 4}, {"tier", "EARLY"}});
    return json{{"actions", actions}};
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <config.json> [scenario.json]" << std::endl;
        return 2;
    }

    try {
        MarketConfig config = MarketConfig::from_file(argv[1]);
        Simulation sim(config);
        sim.run(argc > 2 ? read_json(argv[2]) : demo_scenario(config));
    } catch (const MarketError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("scenario failed: {}", e.what());
        return 1;
    }
    return 0;
}
