/// @file log.cpp
/// @brief Module logger registry for nitro_core

#include <nitro/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <map>
#include <mutex>
#include <utility>

namespace nitro_core {

namespace {

struct LoggerRegistry {
    std::mutex mutex;
    spdlog::sink_ptr sink;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum level = spdlog::level::info;
};

LoggerRegistry& registry() {
    static LoggerRegistry instance;
    return instance;
}

} // anonymous namespace

// =============================================================================
// Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.loggers.find(name); it != reg.loggers.end()) {
        return it->second;
    }

    if (!reg.sink) {
        reg.sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        reg.sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
    }

    auto logger = std::make_shared<spdlog::logger>(name, reg.sink);
    logger->set_level(reg.level);
    reg.loggers.emplace(name, logger);
    return logger;
}

std::shared_ptr<spdlog::logger> pkg_logger() {
    static const std::shared_ptr<spdlog::logger> logger = get_logger("pkg");
    return logger;
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.level = level;
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(std::string name, const std::string& logger_name)
    : m_name(std::move(name))
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now()) {
    m_logger->trace("Begin {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("End {} after {}us", m_name, elapsed.count());
}

} // namespace nitro_core
