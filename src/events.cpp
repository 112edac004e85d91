// =============================================================================
// events.cpp - Event names and JSON rendering
// =============================================================================

#include "predex/events.hpp"

namespace predex {

const char* to_string(EventType type) {
    switch (type) {
        case EventType::BUY_EXECUTED: return "BUY_EXECUTED";
        case EventType::MIGRATED: return "MIGRATED";
        case EventType::LEVERAGE_ACTIVATED: return "LEVERAGE_ACTIVATED";
        case EventType::POSITION_OPENED: return "POSITION_OPENED";
        case EventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case EventType::POSITION_LIQUIDATED: return "POSITION_LIQUIDATED";
        case EventType::REBALANCED: return "REBALANCED";
        case EventType::MARKET_RESOLVED: return "MARKET_RESOLVED";
        case EventType::WINNINGS_CLAIMED: return "WINNINGS_CLAIMED";
        case EventType::UNCLAIMED_SWEPT: return "UNCLAIMED_SWEPT";
        case EventType::AUTHORITY_ROTATED: return "AUTHORITY_ROTATED";
    }
    return "UNKNOWN";
}

nlohmann::json MarketEvent::to_json() const {
    return nlohmann::json{
        {"type", to_string(type)},
        {"timestamp", timestamp},
        {"data", data}
    };
}

} // namespace predex
