#include <catch2/catch.hpp>
#include "termbar/progress/error_codes.hpp"
#include "termbar/progress/time_format.hpp"

using namespace termbar::progress;
using termbar::constants::time::MAX_REPRESENTABLE_SECONDS;

TEST_CASE("splitDuration breaks seconds into day/hour/minute/second fields", "[time_format]")
{
    DurationParts zero = splitDuration(0);
    CHECK(zero.days == 0);
    CHECK(zero.hours == 0);
    CHECK(zero.minutes == 0);
    CHECK(zero.seconds == 0);

    // 1d 2h 3m 4s
    DurationParts parts = splitDuration(93784);
    CHECK(parts.days == 1);
    CHECK(parts.hours == 2);
    CHECK(parts.minutes == 3);
    CHECK(parts.seconds == 4);

    DurationParts last = splitDuration(MAX_REPRESENTABLE_SECONDS - 1);
    CHECK(last.days == 99);
    CHECK(last.hours == 23);
    CHECK(last.minutes == 59);
    CHECK(last.seconds == 59);
}

TEST_CASE("splitDuration recombines to the original second count", "[time_format]")
{
    for (uint64_t s = 0; s < MAX_REPRESENTABLE_SECONDS; s += 7919) {
        DurationParts p = splitDuration(s);
        INFO("seconds=" << s);
        REQUIRE(p.days * 86400 + p.hours * 3600 + p.minutes * 60 + p.seconds == s);
        REQUIRE(p.hours < 24);
        REQUIRE(p.minutes < 60);
        REQUIRE(p.seconds < 60);
    }
}

TEST_CASE("splitDuration rejects durations at or above 100 days", "[time_format]")
{
    CHECK_THROWS_AS(splitDuration(MAX_REPRESENTABLE_SECONDS), ProgressError);
    CHECK_THROWS_AS(splitDuration(MAX_REPRESENTABLE_SECONDS + 12345), ProgressError);
    CHECK_THROWS_AS(formatDuration(MAX_REPRESENTABLE_SECONDS), ProgressError);

    try {
        splitDuration(8640000);
        FAIL("expected ProgressError");
    } catch (const ProgressError& e) {
        CHECK(e.code() == ProgressErrorCode::DURATION_OUT_OF_RANGE);
        CHECK(e.context().details.at("seconds") == "8640000");
    }
}

TEST_CASE("formatDuration produces a fixed-width ETA field", "[time_format]")
{
    CHECK(formatDuration(93784) == "ETA:01d02h03m04s");
    CHECK(formatDuration(0) == "ETA:00d00h00m00s");
    CHECK(formatDuration(59, "TOT:") == "TOT:00d00h00m59s");
    CHECK(formatDuration(86400 * 42 + 5, "ETA:", 3) == "ETA:042d00h00m05s");

    const size_t expected = formattedDurationLength("ETA:", 2);
    CHECK(expected == 16);
    CHECK(formatDuration(0).size() == expected);
    CHECK(formatDuration(3599).size() == expected);
    CHECK(formatDuration(MAX_REPRESENTABLE_SECONDS - 1).size() == expected);
    CHECK(formatDuration(1, "ETA:", 4).size() == formattedDurationLength("ETA:", 4));
}
