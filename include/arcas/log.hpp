#pragma once

/**
 * @file log.hpp
 * @brief Library logger and structured transaction log entries
 */

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace arcas::log {

inline constexpr std::string_view kLoggerName = "arcas";

/**
 * The shared "arcas" logger.
 *
 * Created on first use with a stderr color sink unless a logger with that name
 * was registered beforehand (tests register one with their own sinks).
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/**
 * Apply level and pattern to the shared logger.
 *
 * @param level spdlog level name ("trace" ... "off"); unknown names map to "off"
 * @param pattern spdlog pattern; empty keeps the current one
 */
void configure(std::string_view level, std::string_view pattern = {});

/**
 * One-line JSON rendering of a structured entry: {"event": ..., <fields>}.
 */
[[nodiscard]] std::string structured(std::string_view event, const nlohmann::json& fields);

}  // namespace arcas::log
