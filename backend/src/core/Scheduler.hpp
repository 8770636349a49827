#pragma once
#include <ctime>
#include <spdlog/spdlog.h>
#include "Rating.hpp"
#include "SchedulingState.hpp"

/*
  Tuneable SM-2 policy. Defaults reproduce the classic schedule
  (1 day, 6 days, then interval * ease) with a rating multiplier applied
  after growth.
*/
struct SchedulerPolicy {
    double ease_floor = 1.3;
    double initial_ease = 2.5;
    double lapse_ease_penalty = 0.20;
    int lapse_interval_days = 1;

    int first_interval_days = 1;
    int second_interval_days = 6;

    double hard_multiplier = 0.8;
    double good_multiplier = 1.0;
    double easy_multiplier = 1.3;

    double hard_ease_delta = -0.15;
    double good_ease_delta = 0.0;
    double easy_ease_delta = 0.15;

    int max_interval_days = 36500;
};

// Interval (days) each rating would produce from a given state.
struct IntervalPreview {
    int again = 0;
    int hard = 0;
    int good = 0;
    int easy = 0;
};

class Scheduler {
public:
    explicit Scheduler(const SchedulerPolicy& policy = SchedulerPolicy{});

    // Pure: returns the state after one review at `now`. Throws InvalidStateError.
    SchedulingState advance(const SchedulingState& state, Rating rating, std::time_t now) const;

    IntervalPreview previewIntervals(const SchedulingState& state) const;

    // Throws InvalidStateError when the state breaks an invariant.
    void validate(const SchedulingState& state) const;

    const SchedulerPolicy& policy() const { return settings; }

private:
    SchedulerPolicy settings;

    int computeGrowthInterval(const SchedulingState& state, int newRepetitions) const;
    double ratingMultiplier(Rating rating) const;
    double easeDelta(Rating rating) const;
    double clampEase(double ease) const;
    int clampInterval(long interval) const;
};
