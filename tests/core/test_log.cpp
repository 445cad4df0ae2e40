// stockpile_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <stockpile/core/log.hpp>

using namespace stockpile_core;

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());
}

TEST_CASE("log_level_name round trips through parse_log_level", "[core][log]") {
    for (auto level : {spdlog::level::trace, spdlog::level::debug, spdlog::level::info,
                       spdlog::level::warn, spdlog::level::err, spdlog::level::critical}) {
        auto parsed = parse_log_level(log_level_name(level));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == level);
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns the same logger") {
        auto a = get_logger("test_named");
        auto b = get_logger("test_named");
        REQUIRE(a == b);
        REQUIRE(a->name() == "test_named");
    }

    SECTION("module accessors") {
        REQUIRE(inventory_logger()->name() == "stockpile_inventory");
        REQUIRE(core_logger()->name() == "stockpile_core");
    }

    SECTION("global level applies to existing loggers") {
        auto logger = get_logger("test_level");
        set_global_log_level(spdlog::level::warn);
        REQUIRE(logger->level() == spdlog::level::warn);
        REQUIRE(get_global_log_level() == spdlog::level::warn);
        set_global_log_level(spdlog::level::info);
        REQUIRE(logger->level() == spdlog::level::info);
    }
}

TEST_CASE("LogScope and flushing", "[core][log]") {
    {
        STOCKPILE_LOG_SCOPE("test scope");
        STOCKPILE_LOG_DEBUG("inside scope");
    }
    flush_all_loggers();
    REQUIRE(get_logger("stockpile_core") == core_logger());
}
