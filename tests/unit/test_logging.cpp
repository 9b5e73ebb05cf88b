// Veritas Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/core/logging.hpp"
#include "../../src/validators/dispatch.hpp"

using namespace veritas::logging;

TEST_CASE("Log level parsing", "[logging]") {
    REQUIRE(parse_log_level("debug") == quill::LogLevel::Debug);
    REQUIRE(parse_log_level("INFO") == quill::LogLevel::Info);
    REQUIRE(parse_log_level("warning") == quill::LogLevel::Warning);
    REQUIRE(parse_log_level("warn") == quill::LogLevel::Warning);
    REQUIRE(parse_log_level("Error") == quill::LogLevel::Error);
    REQUIRE(parse_log_level("verbose") == quill::LogLevel::Info);
}

TEST_CASE("Test logger is installed", "[logging]") {
    quill::Logger* logger = get_current_logger();
    REQUIRE(logger != nullptr);
    REQUIRE(logger->get_log_level() == quill::LogLevel::Debug);
}

TEST_CASE("Dispatch logs without altering results", "[logging][dispatch]") {
    using namespace veritas::core;

    auto failure = veritas::validators::validate_input("not-a-number", InputType::numeric);
    REQUIRE(failure.error_message() == "Invalid numeric value");

    auto unknown = veritas::validators::validate_input("x", "nope");
    REQUIRE(unknown.error_message() == "Unknown input type: nope");

    auto success = veritas::validators::validate_input("12.5", InputType::numeric);
    REQUIRE(success.is_valid());
}
