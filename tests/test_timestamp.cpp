#include <doctest/doctest.h>
#include "iptrack/timestamp.hpp"
#include "test_support.hpp"

using namespace iptrack;
using iptrack_test::at_unix;
using std::chrono::milliseconds;
using std::chrono::seconds;

TEST_CASE("Report timestamps parse as UTC") {
    auto ts = parse_report_timestamp("2025-03-14 09:26:53");
    REQUIRE(ts.has_value());
    CHECK(*ts == at_unix(1741944413));

    auto y2k = parse_report_timestamp("1999-12-31 23:59:59");
    REQUIRE(y2k.has_value());
    CHECK(*y2k == at_unix(946684799));
}

TEST_CASE("Report timestamps accept a fractional-seconds suffix") {
    auto ts = parse_report_timestamp("2025-03-14 09:26:53.250");
    REQUIRE(ts.has_value());
    CHECK(*ts == at_unix(1741944413) + milliseconds(250));
}

TEST_CASE("Report timestamps check calendar ranges") {
    CHECK(parse_report_timestamp("2024-02-29 00:00:00").has_value());   // leap year
    CHECK_FALSE(parse_report_timestamp("2023-02-29 00:00:00").has_value());
    CHECK_FALSE(parse_report_timestamp("2025-02-30 12:00:00").has_value());
    CHECK_FALSE(parse_report_timestamp("2025-13-01 12:00:00").has_value());
    CHECK_FALSE(parse_report_timestamp("2025-00-10 12:00:00").has_value());
    CHECK_FALSE(parse_report_timestamp("2025-03-14 24:00:00").has_value());
    CHECK_FALSE(parse_report_timestamp("2025-03-14 09:60:00").has_value());
    CHECK_FALSE(parse_report_timestamp("2025-03-14 09:26:60").has_value());
}

TEST_CASE("Report timestamps reject other layouts") {
    CHECK_FALSE(parse_report_timestamp("").has_value());
    CHECK_FALSE(parse_report_timestamp("not-a-date").has_value());
    CHECK_FALSE(parse_report_timestamp("2025-3-14 09:26:53").has_value());
    CHECK_FALSE(parse_report_timestamp("2025-03-14T09:26:53").has_value());
    CHECK_FALSE(parse_report_timestamp("2025-03-14 09:26:53 ").has_value());
    CHECK_FALSE(parse_report_timestamp("2025-03-14 09:26").has_value());
    CHECK_FALSE(parse_report_timestamp("2025-03-14 09:26:53.").has_value());
}

TEST_CASE("RFC 3339 formatting trims the fraction") {
    CHECK(format_rfc3339(at_unix(1741944413)) == "2025-03-14T09:26:53Z");
    CHECK(format_rfc3339(at_unix(1741944413) + milliseconds(500)) == "2025-03-14T09:26:53.5Z");
    CHECK(format_rfc3339(at_unix(0)) == "1970-01-01T00:00:00Z");
}

TEST_CASE("RFC 3339 parsing honors offsets") {
    auto z = parse_rfc3339("2025-03-14T09:26:53Z");
    auto plus = parse_rfc3339("2025-03-14T11:26:53+02:00");
    auto minus = parse_rfc3339("2025-03-14T04:26:53-05:00");
    REQUIRE(z.has_value());
    REQUIRE(plus.has_value());
    REQUIRE(minus.has_value());
    CHECK(*z == at_unix(1741944413));
    CHECK(*plus == *z);
    CHECK(*minus == *z);

    auto frac = parse_rfc3339("2025-03-14T09:26:53.123456789Z");
    REQUIRE(frac.has_value());
    CHECK(format_rfc3339(*frac) == "2025-03-14T09:26:53.123456789Z");

    CHECK_FALSE(parse_rfc3339("2025-03-14T09:26:53").has_value());     // zone required
    CHECK_FALSE(parse_rfc3339("2025-03-14 09:26:53Z").has_value());
    CHECK_FALSE(parse_rfc3339("2025-03-14T09:26:53Zjunk").has_value());
}

TEST_CASE("Time-ago buckets") {
    const Timestamp now = at_unix(1741944413);
    CHECK(format_time_ago(now, now) == "just now");
    CHECK(format_time_ago(now - seconds(9), now) == "just now");
    CHECK(format_time_ago(now - seconds(10), now) == "10 seconds ago");
    CHECK(format_time_ago(now - seconds(3 * 60), now) == "3 minutes ago");
    CHECK(format_time_ago(now - seconds(2 * 3600), now) == "2 hours ago");
    CHECK(format_time_ago(now - seconds(3 * 86400), now) == "3 days ago");
    CHECK(format_time_ago(now - seconds(60 * 86400), now) == "2 months ago");
    CHECK(format_time_ago(now - seconds(400 * 86400), now) == "1 years ago");
    CHECK(format_time_ago(now + seconds(60), now) == "just now");        // clock skew
}

TEST_CASE("Well-formed instants outside the clock range are refused") {
    CHECK_FALSE(parse_report_timestamp("2300-01-01 00:00:00").has_value());
    CHECK_FALSE(parse_report_timestamp("0999-01-01 00:00:00").has_value());
    CHECK_FALSE(parse_report_timestamp("9999-12-31 23:59:59").has_value());
    CHECK_FALSE(parse_rfc3339("0001-01-01T00:00:00Z").has_value());
    CHECK_FALSE(parse_rfc3339("2300-01-01T00:00:00Z").has_value());

    // the edges of the representable range still parse
    CHECK(parse_report_timestamp("1700-01-01 00:00:00").has_value());
    CHECK(parse_report_timestamp("2200-12-31 23:59:59.999999999").has_value());
}
