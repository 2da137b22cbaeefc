#include <catch2/catch_all.hpp>
#include "ktnsync/core/util/time.hpp"

using namespace ktnsync;

TEST_CASE("ISO-8601 timestamps parse to epoch milliseconds", "[time]") {
    REQUIRE(parseIso8601("1970-01-01T00:00:00Z") == 0);
    REQUIRE(parseIso8601("1970-01-01T00:00:01.5Z") == 1500);
    REQUIRE(parseIso8601("1970-01-02") == 86400000);
    REQUIRE(parseIso8601("2024-02-29T12:00:00.000Z") == 1709208000000);
    REQUIRE(parseIso8601("2024-02-29T13:00:00+01:00") == parseIso8601("2024-02-29T12:00:00Z"));
    REQUIRE(parseIso8601("2024-02-29T11:30:00-0030") == parseIso8601("2024-02-29T12:00:00Z"));
    REQUIRE(parseIso8601("2024-02-29T12:00") == parseIso8601("2024-02-29T12:00:00Z"));
}

TEST_CASE("Invalid timestamps are rejected", "[time]") {
    REQUIRE_FALSE(parseIso8601("").has_value());
    REQUIRE_FALSE(parseIso8601("yesterday").has_value());
    REQUIRE_FALSE(parseIso8601("2023-02-29").has_value());
    REQUIRE_FALSE(parseIso8601("2024-13-01").has_value());
    REQUIRE_FALSE(parseIso8601("2024-01-01T24:00:00Z").has_value());
    REQUIRE_FALSE(parseIso8601("2024-01-01T10:00:00Zjunk").has_value());
    REQUIRE_FALSE(parseIso8601("2024-01-01T10:00:00.Z").has_value());
}

TEST_CASE("Formatting and parsing agree", "[time]") {
    REQUIRE(toIso8601(0) == "1970-01-01T00:00:00.000Z");
    REQUIRE(toIso8601(1709208000123) == "2024-02-29T12:00:00.123Z");
    REQUIRE(parseIso8601(isoNow()).has_value());
}

TEST_CASE("isStrictlyLater needs both sides to parse", "[time]") {
    REQUIRE(isStrictlyLater("2024-01-01T00:00:01Z", "2024-01-01T00:00:00Z"));
    REQUIRE_FALSE(isStrictlyLater("2024-01-01T00:00:00Z", "2024-01-01T00:00:00.000Z"));
    REQUIRE_FALSE(isStrictlyLater("2024-01-01T00:00:00Z", "2024-01-01T00:00:01Z"));
    REQUIRE_FALSE(isStrictlyLater("garbage", "2024-01-01T00:00:00Z"));
    REQUIRE_FALSE(isStrictlyLater("2024-01-01T00:00:00Z", "garbage"));
}

TEST_CASE("Base-36 rendering", "[time]") {
    REQUIRE(toBase36(0) == "0");
    REQUIRE(toBase36(35) == "z");
    REQUIRE(toBase36(36) == "10");
    REQUIRE(toBase36(1709208000000) == "lt76b9c0");
}
