/**
 * @file log.cpp
 * @brief spdlog-backed library logger
 */

#include "arcas/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace arcas::log {

std::shared_ptr<spdlog::logger> logger()
{
    static std::mutex init_mutex;
    std::lock_guard lock(init_mutex);
    const std::string name(kLoggerName);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    return spdlog::stderr_color_mt(name);
}

void configure(std::string_view level, std::string_view pattern)
{
    auto target = logger();
    target->set_level(spdlog::level::from_str(std::string(level)));
    if (!pattern.empty()) {
        target->set_pattern(std::string(pattern));
    }
}

std::string structured(std::string_view event, const nlohmann::json& fields)
{
    nlohmann::json entry = fields.is_object() ? fields : nlohmann::json::object();
    entry["event"] = event;
    return entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace arcas::log
