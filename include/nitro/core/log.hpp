#pragma once

/// @file log.hpp
/// @brief Named spdlog loggers for the nitro modules

#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace nitro_core {

// =============================================================================
// Loggers
// =============================================================================

/// Logger for the given module name, created on first use.
/// Every module logger writes to one shared stderr sink.
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger of the package layer (configuration, resolution)
std::shared_ptr<spdlog::logger> pkg_logger();

// =============================================================================
// Levels
// =============================================================================

/// Set the level of every module logger, including ones created later
void set_global_log_level(spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Parse a level name such as "debug" or "warn"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// LogScope
// =============================================================================

/// Traces entry and exit of a block with the elapsed time
class LogScope {
public:
    LogScope(std::string name, const std::string& logger_name);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace nitro_core

#define NITRO_LOG_CONCAT_INNER(a, b) a##b
#define NITRO_LOG_CONCAT(a, b) NITRO_LOG_CONCAT_INNER(a, b)

/// Trace the enclosing block on the named logger
#define NITRO_LOG_SCOPE(name, logger_name) \
    ::nitro_core::LogScope NITRO_LOG_CONCAT(nitro_log_scope_, __LINE__)(name, logger_name)
