#include "Classifier.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

Classifier::Classifier(int youngThresholdDays, int matureThresholdDays)
    : young_threshold_days(youngThresholdDays),
    mature_threshold_days(matureThresholdDays)
{
}

Classification Classifier::classify(const SchedulingState& state, std::time_t now) const {
    Classification c;
    c.maturity = maturityOf(state.repetitions, state.interval_days);

    // Never reviewed: nothing has been learned yet.
    if (state.neverReviewed()) {
        c.estimated_retention = 0.0;
        return c;
    }

    double elapsed = daysBetween(*state.last_reviewed_at, now);
    c.estimated_retention = estimateRetention(elapsed, state.interval_days);
    return c;
}

Maturity Classifier::maturityOf(int repetitions, int intervalDays) const {
    if (repetitions <= 0) return Maturity::NEW;
    if (intervalDays < young_threshold_days) return Maturity::LEARNING;
    if (intervalDays < mature_threshold_days) return Maturity::YOUNG;
    return Maturity::MATURE;
}

double Classifier::estimateRetention(double daysSinceLastReview, int intervalDays) const {
    double stability = static_cast<double>(std::max(1, intervalDays));
    double t = std::max(0.0, daysSinceLastReview);
    double retention = std::exp(-t / stability);
    return std::clamp(retention, 0.0, 1.0);
}

std::string formatInterval(int days) {
    if (days < 1) return "Today";
    if (days == 1) return "1 day";
    if (days < 30) return std::to_string(days) + " days";
    if (days < 365) {
        long months = std::lround(days / 30.0);
        return months == 1 ? "1 month" : std::to_string(months) + " months";
    }
    long years = std::lround(days / 365.0);
    return years == 1 ? "1 year" : std::to_string(years) + " years";
}

int dailyReviewGoal(int availableMinutesPerDay, int averageSecondsPerCard) {
    if (availableMinutesPerDay <= 0 || averageSecondsPerCard <= 0) return 0;
    long long cards = (static_cast<long long>(availableMinutesPerDay) * 60) / averageSecondsPerCard;
    return static_cast<int>(std::min<long long>(cards, std::numeric_limits<int>::max()));
}
