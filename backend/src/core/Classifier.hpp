#pragma once
#include <ctime>
#include <string>
#include "Rating.hpp"
#include "SchedulingState.hpp"

struct Classification {
    Maturity maturity = Maturity::NEW;
    double estimated_retention = 0.0;   // [0..1]
};

/*
  Maturity buckets:
    new       repetitions == 0
    learning  repetitions >= 1, interval < 7
    young     7 <= interval < 21
    mature    interval >= 21

  Retention model: R(t) = exp(-t / stability), stability = max(1, interval).
*/
class Classifier {
public:
    Classifier() = default;
    Classifier(int youngThresholdDays, int matureThresholdDays);

    Classification classify(const SchedulingState& state, std::time_t now) const;

    Maturity maturityOf(int repetitions, int intervalDays) const;
    double estimateRetention(double daysSinceLastReview, int intervalDays) const;

private:
    int young_threshold_days = 7;
    int mature_threshold_days = 21;
};

// "Today", "1 day", "12 days", "3 months", "2 years"
std::string formatInterval(int days);

// How many cards fit a daily time budget.
int dailyReviewGoal(int availableMinutesPerDay, int averageSecondsPerCard = 10);
