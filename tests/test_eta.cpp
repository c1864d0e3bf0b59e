#include <catch2/catch.hpp>
#include "termbar/progress/eta.hpp"

using namespace termbar::progress;
using namespace std::chrono;
using termbar::constants::time::ESTIMATING_PLACEHOLDER_SECONDS;
using termbar::constants::time::MAX_REPRESENTABLE_SECONDS;

TEST_CASE("ETA extrapolates linearly from elapsed time", "[eta]")
{
    EtaEstimator estimator(0.001);

    CHECK(estimator.remainingSeconds(seconds(10), 50, 100) == 10);
    CHECK(estimator.remainingSeconds(seconds(30), 25, 100) == 90);
    CHECK(estimator.remainingSeconds(milliseconds(1500), 3, 4) == 1);
}

TEST_CASE("ETA reports a placeholder until warmed up", "[eta]")
{
    EtaEstimator estimator(0.001);

    // no progress
    CHECK(estimator.remainingSeconds(seconds(5), 0, 1000) == ESTIMATING_PLACEHOLDER_SECONDS);
    // exactly at the warm-up fraction is not enough
    CHECK(estimator.remainingSeconds(seconds(5), 1, 1000) == ESTIMATING_PLACEHOLDER_SECONDS);
    // no time has passed
    CHECK(estimator.remainingSeconds(steady_clock::duration::zero(), 500, 1000) == ESTIMATING_PLACEHOLDER_SECONDS);

    CHECK_FALSE(estimator.isWarmedUp(seconds(5), 1, 1000));
    CHECK(estimator.isWarmedUp(seconds(5), 2, 1000));
    CHECK(estimator.remainingSeconds(seconds(2), 2, 1000) == 998);

    CHECK(ESTIMATING_PLACEHOLDER_SECONDS < MAX_REPRESENTABLE_SECONDS);
}

TEST_CASE("ETA is zero once complete", "[eta]")
{
    EtaEstimator estimator;
    CHECK(estimator.remainingSeconds(seconds(100), 100, 100) == 0);
    CHECK(estimator.remainingSeconds(seconds(100), 0, 0) == 0);
}

TEST_CASE("ETA saturates at the representable bound", "[eta]")
{
    EtaEstimator estimator(0.0);

    // 1 unit of 10 million after a day: far beyond 100 days
    CHECK(estimator.remainingSeconds(hours(24), 1, 10000000) == MAX_REPRESENTABLE_SECONDS);
}

TEST_CASE("elapsedSeconds truncates to whole seconds", "[eta]")
{
    CHECK(elapsedSeconds(milliseconds(999)) == 0);
    CHECK(elapsedSeconds(milliseconds(61500)) == 61);
    CHECK(elapsedSeconds(-seconds(3)) == 0);
}
