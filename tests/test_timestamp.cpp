#include <catch2/catch_test_macros.hpp>
#include "core/timestamp.hpp"

using namespace dbsync;

TEST_CASE("Timestamp: PostgreSQL text form normalizes to UTC", "[timestamp]") {
    CHECK(timestamp::normalize("2024-05-01 12:00:00+00") == "2024-05-01T12:00:00.000000Z");
    CHECK(timestamp::normalize("2024-05-01 14:30:00+02") == "2024-05-01T12:30:00.000000Z");
    CHECK(timestamp::normalize("2024-05-01 07:00:00-05:00") == "2024-05-01T12:00:00.000000Z");
    CHECK(timestamp::normalize("2024-05-01 17:45:00+0545") == "2024-05-01T12:00:00.000000Z");
}

TEST_CASE("Timestamp: ISO-8601 with Z and fractional seconds", "[timestamp]") {
    CHECK(timestamp::normalize("2024-05-01T12:00:00Z") == "2024-05-01T12:00:00.000000Z");
    CHECK(timestamp::normalize("2024-05-01T12:00:00.5Z") == "2024-05-01T12:00:00.500000Z");
    CHECK(timestamp::normalize("2024-05-01T12:00:00.123456Z") == "2024-05-01T12:00:00.123456Z");
    // Digits past microseconds are truncated
    CHECK(timestamp::normalize("2024-05-01T12:00:00.1234567Z") == "2024-05-01T12:00:00.123456Z");
}

TEST_CASE("Timestamp: missing offset is UTC, missing seconds are zero", "[timestamp]") {
    CHECK(timestamp::normalize("2024-05-01 12:00:00") == "2024-05-01T12:00:00.000000Z");
    CHECK(timestamp::normalize("2024-05-01T12:00") == "2024-05-01T12:00:00.000000Z");
    CHECK(timestamp::normalize("2024-05-01") == "2024-05-01T00:00:00.000000Z");
}

TEST_CASE("Timestamp: offset crossing midnight changes the date", "[timestamp]") {
    CHECK(timestamp::normalize("2024-01-01 01:00:00+03") == "2023-12-31T22:00:00.000000Z");
    CHECK(timestamp::normalize("2024-02-28 23:00:00-02") == "2024-02-29T01:00:00.000000Z");
}

TEST_CASE("Timestamp: malformed input is rejected", "[timestamp]") {
    CHECK_FALSE(timestamp::parse_micros("").has_value());
    CHECK_FALSE(timestamp::parse_micros("not-a-date").has_value());
    CHECK_FALSE(timestamp::parse_micros("2024-13-01 00:00:00").has_value());
    CHECK_FALSE(timestamp::parse_micros("2023-02-29").has_value());
    CHECK_FALSE(timestamp::parse_micros("2024-05-01 25:00:00").has_value());
    CHECK_FALSE(timestamp::parse_micros("2024-05-01 12:00:00.").has_value());
    CHECK_FALSE(timestamp::parse_micros("2024-05-01 12:00:00 UTC").has_value());
    CHECK_FALSE(timestamp::parse_micros("2024-05-01X12:00").has_value());
}

TEST_CASE("Timestamp: instants compare regardless of the source offset", "[timestamp]") {
    const auto a = timestamp::parse_micros("2024-05-01 12:00:00+00");
    const auto b = timestamp::parse_micros("2024-05-01T14:00:00+02:00");
    const auto c = timestamp::parse_micros("2024-05-01 12:00:00.000001Z");
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(c);
    CHECK(*a == *b);
    CHECK(*c > *a);
}

TEST_CASE("Timestamp: pre-epoch values format correctly", "[timestamp]") {
    CHECK(timestamp::normalize("1969-12-31 23:59:59.5Z") == "1969-12-31T23:59:59.500000Z");
    CHECK(timestamp::format_micros(0) == "1970-01-01T00:00:00.000000Z");
}

TEST_CASE("Timestamp: normalize_date validates the calendar", "[timestamp]") {
    CHECK(timestamp::normalize_date("2024-02-29") == "2024-02-29");
    CHECK_FALSE(timestamp::normalize_date("2023-02-29").has_value());
    CHECK_FALSE(timestamp::normalize_date("2024-02-29 00:00").has_value());
    CHECK_FALSE(timestamp::normalize_date("24-02-29").has_value());
}
