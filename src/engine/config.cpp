/// @file config.cpp
/// @brief Run configuration for stockpile

#include <stockpile/engine/config.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace stockpile_engine {

namespace {

template<typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::optional<std::int64_t> parse_int(std::string_view text) {
    std::int64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/// Command-line values are typed by their spelling
ConfigValue typed_value(std::string text) {
    if (text == "true" || text == "false") {
        return text == "true";
    }
    if (auto number = parse_int(text)) {
        return *number;
    }
    return text;
}

/// Flatten nested objects into dotted keys
stockpile_core::Result<void> flatten_json(const nlohmann::json& node, const std::string& prefix,
                                          std::vector<std::pair<std::string, ConfigValue>>& out) {
    for (const auto& entry : node.items()) {
        const std::string key = prefix.empty() ? entry.key() : prefix + "." + entry.key();
        const nlohmann::json& value = entry.value();

        switch (value.type()) {
            case nlohmann::json::value_t::object: {
                auto nested = flatten_json(value, key, out);
                if (!nested) {
                    return nested;
                }
                break;
            }
            case nlohmann::json::value_t::boolean:
                out.emplace_back(key, value.get<bool>());
                break;
            case nlohmann::json::value_t::number_integer:
            case nlohmann::json::value_t::number_unsigned:
                out.emplace_back(key, value.get<std::int64_t>());
                break;
            case nlohmann::json::value_t::number_float:
                out.emplace_back(key, value.get<double>());
                break;
            case nlohmann::json::value_t::string:
                out.emplace_back(key, value.get<std::string>());
                break;
            case nlohmann::json::value_t::array: {
                std::vector<std::string> list;
                for (const auto& element : value) {
                    if (!element.is_string()) {
                        return stockpile_core::Err(
                            stockpile_core::ConfigError::invalid_value(key, element.dump()));
                    }
                    list.push_back(element.get<std::string>());
                }
                out.emplace_back(key, std::move(list));
                break;
            }
            default:
                return stockpile_core::Err(stockpile_core::ConfigError::invalid_value(key, value.dump()));
        }
    }
    return stockpile_core::Ok();
}

} // anonymous namespace

// =============================================================================
// ConfigLayer
// =============================================================================

const ConfigValue* ConfigLayer::find(const std::string& key) const {
    auto it = m_values.find(key);
    return it == m_values.end() ? nullptr : &it->second;
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> names;
    names.reserve(m_values.size());
    std::transform(m_values.begin(), m_values.end(), std::back_inserter(names),
        [](const auto& entry) { return entry.first; });
    return names;
}

// =============================================================================
// ConfigManager
// =============================================================================

const ConfigLayer* ConfigManager::get_layer(const std::string& name) const {
    auto it = std::find_if(m_layers.begin(), m_layers.end(),
        [&name](const ConfigLayer& layer) { return layer.name() == name; });
    return it == m_layers.end() ? nullptr : &*it;
}

ConfigLayer& ConfigManager::layer(const std::string& name, ConfigLayerPriority priority) {
    auto it = std::find_if(m_layers.begin(), m_layers.end(),
        [&name](const ConfigLayer& layer) { return layer.name() == name; });
    if (it != m_layers.end()) {
        return *it;
    }

    // Insert after layers of equal priority so earlier ones keep winning ties
    auto pos = std::upper_bound(m_layers.begin(), m_layers.end(), priority,
        [](ConfigLayerPriority p, const ConfigLayer& layer) { return p < layer.priority(); });
    return *m_layers.emplace(pos, name, priority);
}

const ConfigValue* ConfigManager::lookup(const std::string& key) const {
    for (const auto& layer : m_layers) {
        if (const ConfigValue* value = layer.find(key)) {
            return value;
        }
    }
    return nullptr;
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    if (const ConfigValue* value = lookup(key)) {
        return *value;
    }
    return std::nullopt;
}

bool ConfigManager::get_bool(const std::string& key, bool fallback) const {
    const ConfigValue* value = lookup(key);
    if (!value) {
        return fallback;
    }
    return std::visit(overloaded{
        [](bool v) { return v; },
        [](std::int64_t v) { return v != 0; },
        [](const std::string& v) { return v == "true" || v == "1" || v == "yes"; },
        [fallback](const auto&) { return fallback; },
    }, *value);
}

std::int64_t ConfigManager::get_int(const std::string& key, std::int64_t fallback) const {
    const ConfigValue* value = lookup(key);
    if (!value) {
        return fallback;
    }
    return std::visit(overloaded{
        [](bool v) -> std::int64_t { return v ? 1 : 0; },
        [](std::int64_t v) { return v; },
        [](double v) { return static_cast<std::int64_t>(v); },
        [fallback](const std::string& v) { return parse_int(v).value_or(fallback); },
        [fallback](const std::vector<std::string>&) { return fallback; },
    }, *value);
}

std::string ConfigManager::get_string(const std::string& key, const std::string& fallback) const {
    const ConfigValue* value = lookup(key);
    if (!value || std::holds_alternative<std::vector<std::string>>(*value)) {
        return fallback;
    }
    return config_value_to_string(*value);
}

void ConfigManager::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    layer(layer_name, ConfigLayerPriority::User).set(key, std::move(value));
}

// =============================================================================
// JSON
// =============================================================================

stockpile_core::Result<void> ConfigManager::load_json(const std::filesystem::path& path,
                                                      const std::string& layer_name) {
    std::ifstream file(path);
    if (!file) {
        return stockpile_core::Err(stockpile_core::InputError::open_failed(path.string()));
    }

    std::ostringstream text;
    text << file.rdbuf();
    return load_json_string(text.str(), layer_name, path.string());
}

stockpile_core::Result<void> ConfigManager::load_json_string(const std::string& json_text,
                                                             const std::string& layer_name,
                                                             const std::string& source_name) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return stockpile_core::Err(stockpile_core::ConfigError::parse_failed(source_name, e.what()));
    }

    if (!root.is_object()) {
        return stockpile_core::Err(
            stockpile_core::ConfigError::parse_failed(source_name, "top level is not an object"));
    }

    // Flatten first so a bad value leaves the layer untouched
    std::vector<std::pair<std::string, ConfigValue>> values;
    auto flattened = flatten_json(root, "", values);
    if (!flattened) {
        return flattened;
    }

    ConfigLayer& target = layer(layer_name, ConfigLayerPriority::User);
    for (auto& [key, value] : values) {
        target.set(key, std::move(value));
    }
    return stockpile_core::Ok();
}

// =============================================================================
// Command Line
// =============================================================================

stockpile_core::Result<void> ConfigManager::parse_args(int argc, char** argv) {
    return parse_args(std::vector<std::string>(argv + std::min(argc, 1), argv + argc));
}

stockpile_core::Result<void> ConfigManager::parse_args(const std::vector<std::string>& args) {
    ConfigLayer& cmdline = layer("cmdline", ConfigLayerPriority::CommandLine);

    for (auto it = args.begin(); it != args.end(); ++it) {
        std::string_view arg = *it;

        if (!arg.starts_with("--")) {
            if (arg.size() > 1 && arg.front() == '-') {
                return stockpile_core::Err(stockpile_core::ConfigError::unknown_option("cmdline", *it));
            }
            m_positional.push_back(*it);
            continue;
        }

        std::string_view body = arg.substr(2);
        std::string key;
        std::string value = "true";

        if (auto eq = body.find('='); eq != std::string_view::npos) {
            key = body.substr(0, eq);
            value = body.substr(eq + 1);
        } else {
            key = body;
            auto next = std::next(it);
            if (next != args.end() && !next->starts_with("-")) {
                value = *next;
                it = next;
            }
        }

        if (key.empty()) {
            return stockpile_core::Err(stockpile_core::ConfigError::invalid_value("cmdline", *it));
        }

        std::replace(key.begin(), key.end(), '-', '.');
        cmdline.set(key, typed_value(std::move(value)));
    }

    return stockpile_core::Ok();
}

// =============================================================================
// Environment and Defaults
// =============================================================================

void ConfigManager::load_environment() {
    static constexpr std::pair<const char*, const char*> variables[] = {
        {"STOCKPILE_LOG_LEVEL", config_keys::LOG_LEVEL},
        {"STOCKPILE_LOG_DIR", config_keys::LOG_DIRECTORY},
        {"STOCKPILE_SIZE_POLICY", config_keys::STACK_SIZE_POLICY},
    };

    ConfigLayer& environment = layer("environment", ConfigLayerPriority::Environment);
    for (const auto& [variable, key] : variables) {
        if (const char* value = std::getenv(variable)) {
            environment.set(key, std::string(value));
        }
    }
}

void ConfigManager::setup_defaults() {
    ConfigLayer& defaults = layer("defaults", ConfigLayerPriority::Default);
    defaults.set(config_keys::LOG_LEVEL, std::string("info"));
    defaults.set(config_keys::LOG_FILE, false);
    defaults.set(config_keys::LOG_DIRECTORY, std::string("logs"));
    defaults.set(config_keys::STACK_SIZE_POLICY, std::string("quantity"));
    defaults.set(config_keys::AUDIT_REPORT_UNRESOLVED, false);
}

std::string config_value_to_string(const ConfigValue& value) {
    return std::visit(overloaded{
        [](bool v) -> std::string { return v ? "true" : "false"; },
        [](std::int64_t v) { return std::to_string(v); },
        [](double v) {
            std::ostringstream out;
            out << v;
            return out.str();
        },
        [](const std::string& v) { return v; },
        [](const std::vector<std::string>& v) {
            std::string joined;
            for (const auto& item : v) {
                if (!joined.empty()) {
                    joined += ',';
                }
                joined += item;
            }
            return joined;
        },
    }, value);
}

} // namespace stockpile_engine
