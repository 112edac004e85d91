#ifndef PREDEX_EVENTS_HPP
#define PREDEX_EVENTS_HPP

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace predex {

// =============================================================================
// Market Events
// =============================================================================

enum class EventType : uint8_t {
    BUY_EXECUTED = 0,
    MIGRATED,
    LEVERAGE_ACTIVATED,
    POSITION_OPENED,
    POSITION_CLOSED,
    POSITION_LIQUIDATED,
    REBALANCED,
    MARKET_RESOLVED,
    WINNINGS_CLAIMED,
    UNCLAIMED_SWEPT,
    AUTHORITY_ROTATED
};

const char* to_string(EventType type);

struct MarketEvent {
    EventType type;
    uint64_t timestamp;
    nlohmann::json data;   // amounts as decimal strings, addresses as hex

    nlohmann::json to_json() const;
};

using EventCallback = std::function<void(const MarketEvent&)>;

} // namespace predex

#endif // PREDEX_EVENTS_HPP
