/// @file main.cpp
/// @brief stockpile entry point - fills inventories from an items file and a requests file
///
/// Usage: stockpile items_filename inventories_filename [options]
///
/// The report goes to stdout; diagnostics go to stderr (and optionally to
/// rotating log files) through spdlog.

#include <stockpile/core/log.hpp>
#include <stockpile/engine/app.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "stockpile";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    stockpile_core::configure_logging(stockpile_core::LogConfig{});

    int status = stockpile_engine::run_command_line(program, args, std::cout, std::cerr);

    stockpile_core::shutdown_logging();
    return status;
}
