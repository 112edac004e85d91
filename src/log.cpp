// =============================================================================
// log.cpp - Engine logger
// =============================================================================

#include "predex/log.hpp"
#include "predex/types.hpp"

#include <mutex>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace predex {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get("predex");
        if (!instance) {
            instance = spdlog::stderr_color_mt("predex");
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        }
    });
    return instance;
}

void set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        throw MarketError(errors::INVALID_CONFIG, "unknown log level: " + level);
    }
    logger()->set_level(parsed);
}

} // namespace predex
