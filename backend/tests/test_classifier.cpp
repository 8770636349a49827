#include <catch2/catch.hpp>
#include <cmath>
#include <limits>
#include "../src/core/Classifier.hpp"

static const std::time_t T0 = 1700000000;

static SchedulingState withHistory(int reps, int interval, std::time_t lastReview) {
    SchedulingState s = SchedulingState::initial("u1", "c1", T0);
    s.repetitions = reps;
    s.interval_days = interval;
    s.last_reviewed_at = lastReview;
    s.due_date = lastReview + interval * SECONDS_PER_DAY;
    return s;
}

TEST_CASE("Maturity buckets follow repetitions and interval", "[classifier]") {
    Classifier c;
    REQUIRE(c.maturityOf(0, 0) == Maturity::NEW);
    REQUIRE(c.maturityOf(0, 30) == Maturity::NEW);
    REQUIRE(c.maturityOf(1, 1) == Maturity::LEARNING);
    REQUIRE(c.maturityOf(2, 6) == Maturity::LEARNING);
    REQUIRE(c.maturityOf(3, 7) == Maturity::YOUNG);
    REQUIRE(c.maturityOf(3, 20) == Maturity::YOUNG);
    REQUIRE(c.maturityOf(4, 21) == Maturity::MATURE);
    REQUIRE(c.maturityOf(9, 400) == Maturity::MATURE);
}

TEST_CASE("Classification is stable for the same inputs", "[classifier]") {
    Classifier c;
    SchedulingState s = withHistory(3, 15, T0 - 4 * SECONDS_PER_DAY);
    Classification a = c.classify(s, T0);
    Classification b = c.classify(s, T0);
    REQUIRE(a.maturity == b.maturity);
    REQUIRE(a.estimated_retention == b.estimated_retention);
}

TEST_CASE("Retention decays exponentially since the last review", "[classifier]") {
    Classifier c;

    SECTION("full right after a review") {
        Classification r = c.classify(withHistory(2, 6, T0), T0);
        REQUIRE(r.estimated_retention == Approx(1.0));
    }
    SECTION("one stability period later") {
        Classification r = c.classify(withHistory(2, 6, T0 - 6 * SECONDS_PER_DAY), T0);
        REQUIRE(r.estimated_retention == Approx(std::exp(-1.0)));
    }
    SECTION("longer intervals decay slower") {
        double shortCard = c.classify(withHistory(2, 2, T0 - 5 * SECONDS_PER_DAY), T0).estimated_retention;
        double longCard = c.classify(withHistory(5, 30, T0 - 5 * SECONDS_PER_DAY), T0).estimated_retention;
        REQUIRE(longCard > shortCard);
    }
    SECTION("never reviewed cards have no retention") {
        Classification r = c.classify(SchedulingState::initial("u1", "c1", T0), T0 + SECONDS_PER_DAY);
        REQUIRE(r.maturity == Maturity::NEW);
        REQUIRE(r.estimated_retention == 0.0);
    }
    SECTION("a review stamped in the future counts as just reviewed") {
        Classification r = c.classify(withHistory(1, 1, T0 + 3600), T0);
        REQUIRE(r.estimated_retention == Approx(1.0));
    }
    SECTION("stability is at least one day") {
        REQUIRE(c.estimateRetention(1.0, 0) == Approx(std::exp(-1.0)));
    }
}

TEST_CASE("Intervals format for humans", "[classifier]") {
    REQUIRE(formatInterval(0) == "Today");
    REQUIRE(formatInterval(1) == "1 day");
    REQUIRE(formatInterval(15) == "15 days");
    REQUIRE(formatInterval(29) == "29 days");
    REQUIRE(formatInterval(30) == "1 month");
    REQUIRE(formatInterval(100) == "3 months");
    REQUIRE(formatInterval(365) == "1 year");
    REQUIRE(formatInterval(900) == "2 years");
}

TEST_CASE("Daily goal divides available time by time per card", "[classifier]") {
    REQUIRE(dailyReviewGoal(20) == 120);
    REQUIRE(dailyReviewGoal(15, 45) == 20);
    REQUIRE(dailyReviewGoal(0) == 0);
    REQUIRE(dailyReviewGoal(10, 0) == 0);
    REQUIRE(dailyReviewGoal(40000000, 10) == 240000000);
    REQUIRE(dailyReviewGoal(std::numeric_limits<int>::max(), 1) == std::numeric_limits<int>::max());
}
