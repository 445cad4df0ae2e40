/// @file config.hpp
/// @brief Run configuration for stockpile
///
/// Values come from named layers searched in priority order: command line,
/// environment, a JSON file, then built-in defaults. Keys are dotted paths
/// such as "stack.size_policy".

#pragma once

#include <stockpile/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stockpile_engine {

using ConfigValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// Keys read by the application
namespace config_keys {
    inline constexpr const char* LOG_LEVEL = "log.level";
    inline constexpr const char* LOG_FILE = "log.file";
    inline constexpr const char* LOG_DIRECTORY = "log.directory";
    inline constexpr const char* STACK_SIZE_POLICY = "stack.size_policy";
    inline constexpr const char* AUDIT_REPORT_UNRESOLVED = "audit.report_unresolved";
    inline constexpr const char* CONFIG_FILE = "config";
    inline constexpr const char* HELP = "help";
} // namespace config_keys

/// Lower value wins
enum class ConfigLayerPriority : std::int32_t {
    CommandLine = -1000,
    Environment = -500,
    User = 0,
    Default = 1000,
};

// =============================================================================
// ConfigLayer
// =============================================================================

/// One source of values
class ConfigLayer {
public:
    explicit ConfigLayer(std::string name, ConfigLayerPriority priority = ConfigLayerPriority::User)
        : m_name(std::move(name)), m_priority(priority) {}

    const std::string& name() const { return m_name; }
    ConfigLayerPriority priority() const { return m_priority; }

    /// Value stored under `key`, or nullptr
    const ConfigValue* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    void set(const std::string& key, ConfigValue value) { m_values[key] = std::move(value); }
    bool remove(const std::string& key) { return m_values.erase(key) > 0; }

    /// Keys in sorted order
    std::vector<std::string> keys() const;
    std::size_t size() const { return m_values.size(); }
    bool empty() const { return m_values.empty(); }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// ConfigManager
// =============================================================================

/// Merged view over every layer, plus the positional arguments of the command line
class ConfigManager {
public:
    ConfigManager() = default;

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Existing layer by name, or nullptr
    const ConfigLayer* get_layer(const std::string& name) const;
    std::size_t layer_count() const { return m_layers.size(); }

    bool contains(const std::string& key) const { return lookup(key) != nullptr; }

    /// Value from the highest priority layer that has `key`
    std::optional<ConfigValue> get(const std::string& key) const;

    /// Typed reads. A value of another type is converted when that is
    /// unambiguous ("yes" -> true, "42" -> 42); otherwise the fallback is used.
    bool get_bool(const std::string& key, bool fallback = false) const;
    std::int64_t get_int(const std::string& key, std::int64_t fallback = 0) const;
    std::string get_string(const std::string& key, const std::string& fallback = "") const;

    /// Store into the named layer, created at User priority if missing
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = "user");

    // Sources

    stockpile_core::Result<void> load_json(const std::filesystem::path& path,
                                           const std::string& layer_name = "user");

    stockpile_core::Result<void> load_json_string(const std::string& json_text,
                                                  const std::string& layer_name = "user",
                                                  const std::string& source_name = "<string>");

    /// Accepts --key=value, --key value and --flag; dashes in keys become dots
    stockpile_core::Result<void> parse_args(int argc, char** argv);
    stockpile_core::Result<void> parse_args(const std::vector<std::string>& args);

    /// Non-option arguments, in order
    const std::vector<std::string>& positional_args() const { return m_positional; }

    /// STOCKPILE_LOG_LEVEL, STOCKPILE_LOG_DIR and STOCKPILE_SIZE_POLICY
    void load_environment();

    void setup_defaults();

private:
    const ConfigValue* lookup(const std::string& key) const;
    ConfigLayer& layer(const std::string& name, ConfigLayerPriority priority);

    // Kept sorted by priority
    std::vector<ConfigLayer> m_layers;
    std::vector<std::string> m_positional;
};

/// Display form of a value; lists are comma separated
std::string config_value_to_string(const ConfigValue& value);

} // namespace stockpile_engine
