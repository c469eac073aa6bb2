#pragma once

#include "psm/core/macros.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>

// =============================================================================
// FILE: psm/core/log.hpp
// BRIEF: Library logger (spdlog, stderr, default level warn)
// =============================================================================

namespace psm::log {

inline constexpr const char* LOGGER_NAME = "psm";

namespace detail {

inline auto create_logger() -> std::shared_ptr<spdlog::logger> {
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) {
        return existing;
    }

    auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(spdlog::level::warn);

    // PSM_LOG_LEVEL=trace|debug|info|warn|err|critical|off
    if (const char* env = std::getenv("PSM_LOG_LEVEL"); env != nullptr) {
        logger->set_level(spdlog::level::from_str(env));
    }
    return logger;
}

} // namespace detail

// Shared library logger, created on first use
inline auto logger() -> spdlog::logger& {
    static std::once_flag flag;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(flag, [] { instance = detail::create_logger(); });
    return *instance;
}

inline void set_level(spdlog::level::level_enum level) {
    logger().set_level(level);
}

} // namespace psm::log
