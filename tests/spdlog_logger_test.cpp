// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────
// Tests for structured logging using spdlog

#include <catch2/catch_test_macros.hpp>

#include "mcplink/log/spdlog_logger.hpp"
#include "mcplink/log/logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace mcplink;

// ═══════════════════════════════════════════════════════════════════════════
// Basic Functionality Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger respects minimum log level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Warn);

    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));
    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Error));
}

TEST_CASE("SpdlogLogger can change log level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Info);
    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));

    logger->set_level(LogLevel::Debug);

    REQUIRE(logger->should_log(LogLevel::Debug));
    REQUIRE(logger->get_spdlog_logger()->level() == spdlog::level::debug);
}

TEST_CASE("SpdlogLogger level conversion", "[log][spdlog]") {
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Error) == spdlog::level::err);
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Off) == spdlog::level::off);
    REQUIRE(SpdlogLogger::from_spdlog_level(spdlog::level::critical) == LogLevel::Error);
    REQUIRE(SpdlogLogger::from_spdlog_level(spdlog::level::trace) == LogLevel::Trace);
}

TEST_CASE("SpdlogLogger writes messages through its sinks", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    SpdlogLogger logger(std::vector<spdlog::sink_ptr>{sink}, LogLevel::Debug);

    logger.debug_fmt("mcp.send(stdio): id={} method={}", 3, "tools/list");
    logger.info("session ready");
    logger.flush();

    const auto text = out.str();
    REQUIRE(text.find("mcp.send(stdio): id=3 method=tools/list") != std::string::npos);
    REQUIRE(text.find("[debug]") != std::string::npos);
    REQUIRE(text.find("session ready") != std::string::npos);
}

TEST_CASE("SpdlogLogger wraps an existing spdlog logger", "[log][spdlog]") {
    std::ostringstream out;
    auto inner = std::make_shared<spdlog::logger>("wrapped", std::make_shared<spdlog::sinks::ostream_sink_mt>(out));
    inner->set_level(spdlog::level::warn);

    SpdlogLogger logger(inner);
    REQUIRE_FALSE(logger.should_log(LogLevel::Info));
    REQUIRE(logger.should_log(LogLevel::Warn));

    logger.warn("from wrapper");
    logger.flush();
    REQUIRE(out.str().find("from wrapper") != std::string::npos);

    REQUIRE_THROWS_AS(SpdlogLogger(std::shared_ptr<spdlog::logger>{}), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// File and Async Logging
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger can log to file", "[log][spdlog][file]") {
    const auto path = std::filesystem::temp_directory_path() / "mcplink_spdlog_test.log";
    std::filesystem::remove(path);

    {
        auto logger = make_spdlog_console_file_logger(path.string(), LogLevel::Info);
        logger->info("written to file");
        logger->flush();
    }

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    REQUIRE(contents.str().find("written to file") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("Async console logger accepts messages", "[log][spdlog][async]") {
    auto logger = make_spdlog_async_console_logger(LogLevel::Info, 128);
    REQUIRE(logger->should_log(LogLevel::Info));
    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));

    // Should not throw
    logger->info_fmt("async {}", 1);
    logger->flush();
}

TEST_CASE("SpdlogLogger installs as the global logger", "[log][spdlog]") {
    set_logger(std::make_unique<SpdlogLogger>(LogLevel::Warn));
    REQUIRE(get_logger().should_log(LogLevel::Warn));
    REQUIRE_FALSE(get_logger().should_log(LogLevel::Info));
    set_logger(nullptr);
}
