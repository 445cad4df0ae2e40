/// @file app.cpp
/// @brief Command-line application implementation for stockpile

#include <stockpile/engine/app.hpp>

#include <stockpile/inventory/parser.hpp>
#include <stockpile/inventory/report.hpp>
#include <stockpile/inventory/requests.hpp>

#include <ostream>

namespace stockpile_engine {

stockpile_core::Result<AppSettings> AppSettings::from_config(const ConfigManager& config) {
    const auto& positional = config.positional_args();
    if (positional.size() < 2) {
        return stockpile_core::Err<AppSettings>(stockpile_core::Error(
            stockpile_core::ErrorCode::InvalidArgument,
            "Expected items_filename and inventories_filename"));
    }

    AppSettings settings;
    settings.items_path = positional[0];
    settings.inventories_path = positional[1];

    std::string level_name = config.get_string(config_keys::LOG_LEVEL, "info");
    auto level = stockpile_core::parse_log_level(level_name);
    if (!level) {
        return stockpile_core::Err<AppSettings>(
            stockpile_core::ConfigError::unknown_option(config_keys::LOG_LEVEL, level_name));
    }
    settings.log.level = *level;
    settings.log.file_enabled = config.get_bool(config_keys::LOG_FILE, false);
    settings.log.log_directory = config.get_string(config_keys::LOG_DIRECTORY, "logs");

    settings.size_policy = config.get_string(config_keys::STACK_SIZE_POLICY, "quantity");
    if (settings.size_policy != "quantity" && settings.size_policy != "stack") {
        return stockpile_core::Err<AppSettings>(
            stockpile_core::ConfigError::unknown_option(config_keys::STACK_SIZE_POLICY, settings.size_policy));
    }

    settings.report_unresolved = config.get_bool(config_keys::AUDIT_REPORT_UNRESOLVED, false);

    return stockpile_core::Ok(std::move(settings));
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " items_filename inventories_filename"
        " [--config file.json] [--log-level level] [--log-file]"
        " [--stack.size_policy quantity|stack] [--audit.report_unresolved]";
}

bool wants_help(const ConfigManager& config) {
    return config.get_bool(config_keys::HELP, false);
}

stockpile_core::Result<void> load_configuration(ConfigManager& config, const std::vector<std::string>& args) {
    config.setup_defaults();
    config.load_environment();

    auto parsed = config.parse_args(args);
    if (!parsed) {
        return parsed;
    }

    // The file sits below the command line, which was parsed first to find it
    if (config.contains(config_keys::CONFIG_FILE)) {
        auto loaded = config.load_json(config.get_string(config_keys::CONFIG_FILE), "user");
        if (!loaded) {
            return loaded;
        }
    }

    return stockpile_core::Ok();
}

stockpile_core::Result<void> run(const AppSettings& settings, std::ostream& out) {
    namespace inv = stockpile_inventory;
    STOCKPILE_LOG_SCOPE("run");

    auto policy = inv::size_policy_from_name(settings.size_policy);
    if (!policy) {
        return stockpile_core::Err(policy.error());
    }

    auto catalog = inv::parser::read_from_file(settings.items_path, inv::parser::read_items);
    if (!catalog) {
        return stockpile_core::Err(catalog.error());
    }

    auto lines = inv::parser::read_from_file(settings.inventories_path, inv::parser::read_inventory_lines);
    if (!lines) {
        return stockpile_core::Err(lines.error());
    }

    stockpile_core::core_logger()->info("Loaded {} items and {} request lines",
        catalog->size(), lines->size());

    inv::ProcessOptions options;
    options.size_policy = std::move(policy).value();
    options.report_unresolved = settings.report_unresolved;

    auto logged = inv::process_inventory_requests(*lines, *catalog, options);

    inv::render_report(out, *catalog, logged);
    out.flush();

    return stockpile_core::Ok();
}

namespace {

int report_failure(const stockpile_core::Error& error, std::ostream& err, const std::string& usage_line) {
    stockpile_core::core_logger()->error("{}", stockpile_core::build_error_chain(error));
    if (!usage_line.empty()) {
        err << usage_line << std::endl;
    }
    stockpile_core::flush_all_loggers();
    return 1;
}

} // anonymous namespace

int run_command_line(const std::string& program, const std::vector<std::string>& args,
                     std::ostream& out, std::ostream& err) {
    ConfigManager config;
    auto loaded = load_configuration(config, args);
    if (!loaded) {
        return report_failure(loaded.error(), err, usage(program));
    }

    if (wants_help(config)) {
        out << usage(program) << std::endl;
        return 0;
    }

    auto settings = AppSettings::from_config(config);
    if (!settings) {
        return report_failure(settings.error(), err, usage(program));
    }

    stockpile_core::configure_logging(settings->log);
    stockpile_core::core_logger()->debug("Log level: {}", stockpile_core::log_level_name(settings->log.level));

    auto result = run(*settings, out);
    if (!result) {
        return report_failure(result.error(), err, {});
    }
    return 0;
}

} // namespace stockpile_engine
