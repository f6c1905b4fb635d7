// relic_core logging tests

#include <catch2/catch.hpp>
#include <relic/core/log.hpp>
#include <filesystem>

using namespace relic_core;

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("info") == spdlog::level::info);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());
}

TEST_CASE("log_level_name", "[core][log]") {
    REQUIRE(std::string(log_level_name(spdlog::level::warn)) == "warn");
    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
}

TEST_CASE("Named loggers", "[core][log]") {
    auto asset = asset_logger();
    auto io = io_logger();
    auto meta = meta_logger();

    REQUIRE(asset != nullptr);
    REQUIRE(asset->name() == "relic_asset");
    REQUIRE(io->name() == "relic_io");
    REQUIRE(meta->name() == "relic_meta");

    // Cached instances
    REQUIRE(asset_logger() == asset);
    REQUIRE(get_logger("relic_asset") == asset);
}

TEST_CASE("Logger levels", "[core][log]") {
    auto previous = get_global_log_level();

    set_logger_level("relic_io", spdlog::level::err);
    REQUIRE(io_logger()->level() == spdlog::level::err);

    set_global_log_level(spdlog::level::warn);
    REQUIRE(get_global_log_level() == spdlog::level::warn);
    REQUIRE(asset_logger()->level() == spdlog::level::warn);
    REQUIRE(io_logger()->level() == spdlog::level::warn);

    set_global_log_level(previous);
}

TEST_CASE("LogScope traces without throwing", "[core][log]") {
    REQUIRE_NOTHROW([] {
        RELIC_LOG_SCOPE("scope test");
    }());
}

TEST_CASE("LogScope: several scopes in one block", "[core][log]") {
    auto logger = get_logger("relic_meta");
    auto previous = logger->level();
    logger->set_level(spdlog::level::trace);

    REQUIRE_NOTHROW([] {
        RELIC_LOG_SCOPE("outer");
        RELIC_LOG_SCOPE("inner", "relic_meta");
    }());

    logger->set_level(previous);
}

TEST_CASE("configure_logging writes rotating files", "[core][log]") {
    auto dir = std::filesystem::temp_directory_path() / "relic_test_logs";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    auto previous = get_global_log_level();

    LogConfig config;
    config.console_enabled = false;
    config.file_enabled = true;
    config.log_directory = dir.string();
    config.level = spdlog::level::debug;
    configure_logging(config);

    auto logger = get_logger("relic_log_file_test");
    logger->info("written to disk");
    logger->flush();
    REQUIRE(std::filesystem::exists(dir / "relic_log_file_test.log"));
    REQUIRE(logger->level() == spdlog::level::debug);

    // Back to console-only output for the remaining tests
    LogConfig console;
    console.level = previous;
    configure_logging(console);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
