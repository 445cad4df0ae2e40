#pragma once

/// @file log.hpp
/// @brief Logging for stockpile
///
/// Every logger shares one set of sinks: a colored stderr sink and, when
/// enabled, a rotating file. stdout is left to the report.

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// =============================================================================
// Logging Macros
// =============================================================================

#define STOCKPILE_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define STOCKPILE_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define STOCKPILE_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define STOCKPILE_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define STOCKPILE_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define STOCKPILE_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace stockpile_core {

// =============================================================================
// Configuration
// =============================================================================

/// Where log output goes and how much of it
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory = "logs";
    std::string file_name = "stockpile.log";
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;
};

/// Rebuild the shared sinks and apply them to every logger, including the
/// default one behind the STOCKPILE_LOG_* macros. Safe to call more than once.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger attached to the shared sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// "stockpile_core": startup, configuration and run summaries
std::shared_ptr<spdlog::logger> core_logger();

/// "stockpile_inventory": per-inventory and per-decision detail
std::shared_ptr<spdlog::logger> inventory_logger();

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);
spdlog::level::level_enum get_global_log_level();

/// Accepts trace, debug, info, warn/warning, error/err, critical/fatal, off
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// LogScope
// =============================================================================

/// Traces entry and exit of a block, with its duration
class LogScope {
public:
    explicit LogScope(std::string name, const std::string& logger_name = "stockpile_core");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define STOCKPILE_LOG_SCOPE(name) ::stockpile_core::LogScope stockpile_log_scope_(name)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flush and drop every logger; call once before exit
void shutdown_logging();

} // namespace stockpile_core
