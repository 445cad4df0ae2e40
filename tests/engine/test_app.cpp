// stockpile_engine application tests

#include <catch2/catch_test_macros.hpp>
#include <stockpile/engine/app.hpp>

#include "scratch_dir.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>

using namespace stockpile_engine;

using stockpile_test::ScratchDir;

namespace {

/// Sets an environment variable for the lifetime of the guard
class EnvOverride {
public:
    EnvOverride(const char* name, const char* value) : m_name(name) {
        ::setenv(m_name, value, 1);
    }

    ~EnvOverride() { ::unsetenv(m_name); }

    EnvOverride(const EnvOverride&) = delete;
    EnvOverride& operator=(const EnvOverride&) = delete;

private:
    const char* m_name;
};

} // namespace

TEST_CASE("scratch directories are distinct and removed", "[engine][app]") {
    ScratchDir first;
    ScratchDir second;
    REQUIRE(first.path() != second.path());
    REQUIRE(std::filesystem::is_directory(first.path()));

    std::filesystem::path kept;
    {
        ScratchDir third;
        kept = third.path();
        third.write("items.txt", "1 Torch\n");
    }
    REQUIRE_FALSE(std::filesystem::exists(kept));
}

TEST_CASE("AppSettings from_config", "[engine][app]") {
    ConfigManager config;
    config.setup_defaults();

    SECTION("needs both input paths") {
        REQUIRE(config.parse_args(std::vector<std::string>{"items.txt"}).is_ok());
        auto settings = AppSettings::from_config(config);
        REQUIRE(settings.is_err());
        REQUIRE(settings.error().code() == stockpile_core::ErrorCode::InvalidArgument);
    }

    SECTION("defaults") {
        REQUIRE(config.parse_args(std::vector<std::string>{"items.txt", "inventories.txt"}).is_ok());
        auto settings = AppSettings::from_config(config);
        REQUIRE(settings.is_ok());
        REQUIRE(settings->items_path == "items.txt");
        REQUIRE(settings->inventories_path == "inventories.txt");
        REQUIRE(settings->size_policy == "quantity");
        REQUIRE_FALSE(settings->report_unresolved);
        REQUIRE(settings->log.level == spdlog::level::info);
        REQUIRE_FALSE(settings->log.file_enabled);
    }

    SECTION("options") {
        REQUIRE(config.parse_args(std::vector<std::string>{
            "a", "b", "--log-level=debug", "--stack.size_policy=stack", "--audit.report_unresolved"}).is_ok());
        auto settings = AppSettings::from_config(config);
        REQUIRE(settings.is_ok());
        REQUIRE(settings->log.level == spdlog::level::debug);
        REQUIRE(settings->size_policy == "stack");
        REQUIRE(settings->report_unresolved);
    }

    SECTION("unknown log level") {
        REQUIRE(config.parse_args(std::vector<std::string>{"a", "b", "--log-level=chatty"}).is_ok());
        REQUIRE(AppSettings::from_config(config).is_err());
    }

    SECTION("unknown size policy") {
        REQUIRE(config.parse_args(std::vector<std::string>{"a", "b", "--stack.size_policy=weight"}).is_ok());
        auto settings = AppSettings::from_config(config);
        REQUIRE(settings.is_err());
        REQUIRE(settings.error().is<stockpile_core::ConfigError>());
    }
}

TEST_CASE("load_configuration", "[engine][app]") {
    ScratchDir files;
    ConfigManager config;

    SECTION("config file sits below the command line") {
        std::string json = files.write("run.json",
            R"({ "log": { "level": "warn" }, "stack": { "size_policy": "stack" } })");

        REQUIRE(load_configuration(config, {"a", "b", "--config", json, "--log-level=error"}).is_ok());
        REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "error");
        REQUIRE(config.get_string(config_keys::STACK_SIZE_POLICY) == "stack");
        REQUIRE(config.positional_args().size() == 2);
    }

    SECTION("environment sits between the command line and the config file") {
        EnvOverride policy("STOCKPILE_SIZE_POLICY", "stack");
        std::string json = files.write("run.json", R"({ "stack": { "size_policy": "quantity" } })");

        REQUIRE(load_configuration(config, {"a", "b", "--config", json}).is_ok());
        REQUIRE(config.get_string(config_keys::STACK_SIZE_POLICY) == "stack");

        ConfigManager overridden;
        REQUIRE(load_configuration(overridden,
            {"a", "b", "--config", json, "--stack.size_policy=quantity"}).is_ok());
        REQUIRE(overridden.get_string(config_keys::STACK_SIZE_POLICY) == "quantity");
    }

    SECTION("missing config file") {
        auto result = load_configuration(config, {"a", "b", "--config=missing.json"});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == stockpile_core::ErrorCode::IOError);
    }

    SECTION("bad argument") {
        REQUIRE(load_configuration(config, {"-x"}).is_err());
    }
}

TEST_CASE("wants_help", "[engine][app]") {
    ConfigManager config;

    SECTION("--help asks for usage without input paths") {
        REQUIRE(load_configuration(config, {"--help"}).is_ok());
        REQUIRE(wants_help(config));
    }

    SECTION("explicitly disabled") {
        REQUIRE(load_configuration(config, {"a", "b", "--help=false"}).is_ok());
        REQUIRE_FALSE(wants_help(config));
    }

    SECTION("absent") {
        REQUIRE(load_configuration(config, {"a", "b"}).is_ok());
        REQUIRE_FALSE(wants_help(config));
    }
}

TEST_CASE("usage", "[engine][app]") {
    std::string text = usage("stockpile");
    REQUIRE(text.starts_with("Usage: stockpile items_filename inventories_filename"));
}

TEST_CASE("run", "[engine][app]") {
    ScratchDir files;
    AppSettings settings;
    settings.items_path = files.write("items.txt", "1 Torch\n2 Rope\n");
    settings.inventories_path = files.write("inventories.txt", "# 5\n- 1 3\n- 2 3\n- 99 1\n# 10\n- 1 3\n");

    SECTION("writes the full report") {
        std::ostringstream out;
        REQUIRE(run(settings, out).is_ok());
        REQUIRE(out.str() ==
            "Processing Log:\n"
            "Stored    ( 3) Torch\n"
            "Discarded ( 3) Rope\n"
            "Stored    ( 3) Torch\n"
            "\n"
            "Item List:\n"
            "   1 Torch\n"
            "   2 Rope\n"
            "\n"
            "Storage Summary:\n"
            " -Used  3 of  5\n"
            "  ( 3) Torch\n"
            "\n"
            " -Used  3 of 10\n"
            "  ( 3) Torch\n"
            "\n");
    }

    SECTION("reports unresolved requests when asked") {
        settings.report_unresolved = true;
        std::ostringstream out;
        REQUIRE(run(settings, out).is_ok());
        REQUIRE(out.str().find("Unresolved ( 1) #99\n") != std::string::npos);
    }

    SECTION("missing items file") {
        settings.items_path = files.write("unused.txt", "") + ".missing";
        std::ostringstream out;
        auto result = run(settings, out);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == stockpile_core::ErrorCode::IOError);
        REQUIRE(out.str().empty());
    }

    SECTION("malformed items file") {
        settings.items_path = files.write("items.txt", "1 Torch\nbroken\n");
        std::ostringstream out;
        auto result = run(settings, out);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == stockpile_core::ErrorCode::ParseError);
        REQUIRE(result.error().get_context("path") != nullptr);
    }

    SECTION("unknown size policy") {
        settings.size_policy = "volume";
        std::ostringstream out;
        REQUIRE(run(settings, out).is_err());
    }
}

TEST_CASE("run_command_line", "[engine][app]") {
    ScratchDir files;
    std::string items = files.write("items.txt", "1 Torch\n");
    std::string inventories = files.write("inventories.txt", "# 5\n- 1 3\n");
    std::ostringstream out;
    std::ostringstream err;

    SECTION("help prints usage to out and succeeds") {
        REQUIRE(run_command_line("stockpile", {"--help"}, out, err) == 0);
        REQUIRE(out.str().starts_with("Usage: stockpile"));
        REQUIRE(err.str().empty());
    }

    SECTION("missing inputs print usage to err") {
        REQUIRE(run_command_line("stockpile", {items}, out, err) == 1);
        REQUIRE(out.str().empty());
        REQUIRE(err.str().starts_with("Usage: stockpile"));
    }

    SECTION("full run writes the report") {
        REQUIRE(run_command_line("stockpile", {items, inventories}, out, err) == 0);
        REQUIRE(out.str().starts_with("Processing Log:\nStored    ( 3) Torch\n"));
        REQUIRE(err.str().empty());
    }

    SECTION("run errors skip usage") {
        REQUIRE(run_command_line("stockpile", {items + ".missing", inventories}, out, err) == 1);
        REQUIRE(out.str().empty());
        REQUIRE(err.str().empty());
    }

    SECTION("configuration errors go through the core logger") {
        std::ostringstream captured;
        auto logger = stockpile_core::core_logger();
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
        logger->sinks().push_back(sink);

        REQUIRE(run_command_line("stockpile", {"-x"}, out, err) == 1);
        logger->sinks().pop_back();

        REQUIRE(captured.str().find("[ConfigError]") != std::string::npos);
        REQUIRE(captured.str().find("stockpile_core") != std::string::npos);
    }
}
