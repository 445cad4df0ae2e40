/// @file log.cpp
/// @brief Shared-sink logger registry for stockpile_core

#include <stockpile/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <filesystem>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace stockpile_core {

namespace {

constexpr const char* console_pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 10> level_names{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"err", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"fatal", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

// =============================================================================
// LoggerRegistry
// =============================================================================

/// Owns the sinks and every named logger created through get_logger
class LoggerRegistry {
public:
    static LoggerRegistry& instance() {
        static LoggerRegistry registry;
        return registry;
    }

    void configure(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_level = config.level;
        m_sinks = build_sinks(config);

        for (auto& [name, logger] : m_loggers) {
            attach(*logger);
        }

        auto fallback = std::make_shared<spdlog::logger>("stockpile", m_sinks.begin(), m_sinks.end());
        attach(*fallback);
        spdlog::set_default_logger(std::move(fallback));
    }

    std::shared_ptr<spdlog::logger> get(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            return it->second;
        }

        if (m_sinks.empty()) {
            m_sinks = build_sinks(LogConfig{});
        }

        auto logger = std::make_shared<spdlog::logger>(name, m_sinks.begin(), m_sinks.end());
        attach(*logger);
        m_loggers.emplace(name, logger);
        if (!spdlog::get(name)) {
            spdlog::register_logger(logger);
        }
        return logger;
    }

    void set_level(spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_level = level;
        for (auto& [name, logger] : m_loggers) {
            logger->set_level(level);
        }
        spdlog::set_level(level);
    }

    spdlog::level::level_enum level() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_level;
    }

    void flush() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
        }
        if (auto fallback = spdlog::default_logger()) {
            fallback->flush();
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
            spdlog::drop(name);
        }
        m_loggers.clear();
        m_sinks.clear();
    }

private:
    void attach(spdlog::logger& logger) const {
        logger.sinks().assign(m_sinks.begin(), m_sinks.end());
        logger.set_level(m_level);
        logger.flush_on(spdlog::level::warn);
    }

    static std::vector<spdlog::sink_ptr> build_sinks(const LogConfig& config) {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_enabled) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_pattern(console_pattern);
            sinks.push_back(std::move(console));
        }

        if (config.file_enabled) {
            auto path = std::filesystem::path(config.log_directory) / config.file_name;
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path.string(), config.max_file_size, config.max_files);
                file->set_pattern(file_pattern);
                sinks.push_back(std::move(file));
            } catch (const spdlog::spdlog_ex& e) {
                spdlog::warn("Logging to {} disabled: {}", path.string(), e.what());
            }
        }

        return sinks;
    }

    std::mutex m_mutex;
    spdlog::level::level_enum m_level = spdlog::level::info;
    std::vector<spdlog::sink_ptr> m_sinks;
    std::map<std::string, std::shared_ptr<spdlog::logger>> m_loggers;
};

} // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

void configure_logging(const LogConfig& config) {
    LoggerRegistry::instance().configure(config);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    return LoggerRegistry::instance().get(name);
}

std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("stockpile_core");
}

std::shared_ptr<spdlog::logger> inventory_logger() {
    return get_logger("stockpile_inventory");
}

void set_global_log_level(spdlog::level::level_enum level) {
    LoggerRegistry::instance().set_level(level);
}

spdlog::level::level_enum get_global_log_level() {
    return LoggerRegistry::instance().level();
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    for (const auto& [text, level] : level_names) {
        if (text == name) {
            return level;
        }
    }
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

LogScope::LogScope(std::string name, const std::string& logger_name)
    : m_name(std::move(name))
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now()) {
    m_logger->trace("begin {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("end {} ({}us)", m_name, elapsed.count());
}

void flush_all_loggers() {
    LoggerRegistry::instance().flush();
}

void shutdown_logging() {
    LoggerRegistry::instance().clear();
    spdlog::shutdown();
}

} // namespace stockpile_core
