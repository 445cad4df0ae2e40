/// @file app.hpp
/// @brief Command-line application for stockpile
///
/// Gathers settings from the layered configuration, reads both input files,
/// runs the request pipeline and prints the report.

#pragma once

#include "config.hpp"

#include <stockpile/core/error.hpp>
#include <stockpile/core/log.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace stockpile_engine {

// =============================================================================
// App Settings
// =============================================================================

/// Everything a run needs, resolved from configuration
struct AppSettings {
    std::string items_path;
    std::string inventories_path;
    std::string size_policy = "quantity";
    bool report_unresolved = false;
    stockpile_core::LogConfig log;

    /// Build from a configuration whose positional args hold the two input paths
    [[nodiscard]] static stockpile_core::Result<AppSettings> from_config(const ConfigManager& config);
};

/// Usage line for the executable
[[nodiscard]] std::string usage(const std::string& program);

/// True when --help was given; the caller prints usage and exits successfully
[[nodiscard]] bool wants_help(const ConfigManager& config);

/// Fill `config` from defaults, environment, an optional --config file and `args`
[[nodiscard]] stockpile_core::Result<void> load_configuration(ConfigManager& config,
                                                              const std::vector<std::string>& args);

/// Read inputs, process them and write the report to `out`
[[nodiscard]] stockpile_core::Result<void> run(const AppSettings& settings, std::ostream& out);

/// Whole command-line flow: configure, handle --help, validate, run.
/// Errors are logged through core_logger and usage goes to `err`.
/// Returns the process exit status; the caller shuts logging down.
[[nodiscard]] int run_command_line(const std::string& program, const std::vector<std::string>& args,
                                   std::ostream& out, std::ostream& err);

} // namespace stockpile_engine
