#include <catch2/catch_test_macros.hpp>
#include "core/base64.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

using namespace sqlgate;

TEST_CASE("Utils: try_parse_int rejects trailing garbage", "[utils]") {
    CHECK(utils::try_parse_int<int>("8080") == 8080);
    CHECK(utils::try_parse_int<int>("-3") == -3);
    CHECK_FALSE(utils::try_parse_int<int>("80a").has_value());
    CHECK_FALSE(utils::try_parse_int<int>("").has_value());
    CHECK_FALSE(utils::try_parse_int<uint16_t>("70000").has_value());
}

TEST_CASE("Utils: in_range", "[utils]") {
    CHECK(utils::in_range<1, 65535>(1));
    CHECK(utils::in_range<1, 65535>(65535));
    CHECK_FALSE(utils::in_range<1, 65535>(0));
    CHECK_FALSE(utils::in_range<1, 65535>(int64_t{70000}));
}

TEST_CASE("Utils: trim and case helpers", "[utils]") {
    CHECK(utils::trim("  a b \n\t") == "a b");
    CHECK(utils::trim(" \f\v ").empty());
    CHECK(utils::to_lower("MiXeD") == "mixed");
    CHECK(utils::to_upper("drop") == "DROP");
}

TEST_CASE("Utils: log level names", "[utils][log]") {
    CHECK(utils::log::parse_level("DEBUG") == utils::log::Level::DEBUG);
    CHECK(utils::log::parse_level("info") == utils::log::Level::INFO);
    CHECK(utils::log::parse_level("warning") == utils::log::Level::WARN);
    CHECK(utils::log::parse_level("Error") == utils::log::Level::ERROR);
    CHECK_FALSE(utils::log::parse_level("trace").has_value());
}

TEST_CASE("Base64: padding", "[utils][base64]") {
    CHECK(base64::encode(std::vector<uint8_t>{}).empty());
    CHECK(base64::encode(std::vector<uint8_t>{'f'}) == "Zg==");
    CHECK(base64::encode(std::vector<uint8_t>{'f', 'o'}) == "Zm8=");
    CHECK(base64::encode(std::vector<uint8_t>{'f', 'o', 'o'}) == "Zm9v");
}

TEST_CASE("Result: error_from carries kind and message", "[utils][result]") {
    auto inner = Result<int>::error(ErrorKind::BOUNDS_ERROR, "too big");
    auto outer = Result<std::string>::error_from(inner);
    REQUIRE(outer.is_error());
    CHECK(outer.error_kind() == ErrorKind::BOUNDS_ERROR);
    CHECK(outer.error_message() == "too big");
    CHECK(std::string(error_kind_to_string(ErrorKind::ENGINE_ERROR)) == "engine_error");
}

TEST_CASE("error_kind_to_string names every kind", "[utils][result]") {
    CHECK(std::string(error_kind_to_string(ErrorKind::NONE)) == "none");
    CHECK(std::string(error_kind_to_string(ErrorKind::CONFIGURATION_ERROR)) == "configuration_error");
    CHECK(std::string(error_kind_to_string(ErrorKind::NOT_FOUND)) == "not_found");
    CHECK(std::string(error_kind_to_string(ErrorKind::VALIDATION_ERROR)) == "validation_error");
    CHECK(std::string(error_kind_to_string(ErrorKind::BOUNDS_ERROR)) == "bounds_error");
    CHECK(std::string(error_kind_to_string(ErrorKind::ENGINE_ERROR)) == "engine_error");
}
