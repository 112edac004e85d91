#ifndef PREDEX_LOG_HPP
#define PREDEX_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/fwd.h>

namespace predex {

// Shared "predex" logger (stderr). Created on first use.
std::shared_ptr<spdlog::logger> logger();

// "trace", "debug", "info", "warn", "error", "critical" or "off"
void set_log_level(const std::string& level);

} // namespace predex

#endif // PREDEX_LOG_HPP
