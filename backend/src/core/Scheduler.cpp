#include "Scheduler.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>

Scheduler::Scheduler(const SchedulerPolicy& policy)
    : settings(policy)
{
    spdlog::info("Scheduler (SM-2) initialized: floor={:.2f} multipliers={:.2f}/{:.2f}/{:.2f}",
        settings.ease_floor, settings.hard_multiplier, settings.good_multiplier, settings.easy_multiplier);
}

/*
  Public API:
    - advance(state, rating, now)
    - previewIntervals(state)
*/

SchedulingState Scheduler::advance(const SchedulingState& state, Rating rating, std::time_t now) const {
    validate(state);

    SchedulingState next = state;

    if (isLapse(rating)) {
        next.repetitions = 0;
        next.interval_days = std::max(1, settings.lapse_interval_days);
        next.ease_factor = clampEase(state.ease_factor - settings.lapse_ease_penalty);
    }
    else {
        next.repetitions = state.repetitions + 1;

        int growth = computeGrowthInterval(state, next.repetitions);
        long scaled = std::lround(static_cast<double>(growth) * ratingMultiplier(rating));
        next.interval_days = clampInterval(scaled);
        next.ease_factor = clampEase(state.ease_factor + easeDelta(rating));
    }

    next.last_reviewed_at = now;
    next.due_date = now + static_cast<std::time_t>(next.interval_days) * SECONDS_PER_DAY;
    next.times_reviewed = state.times_reviewed + 1;
    next.times_correct = state.times_correct + (isLapse(rating) ? 0 : 1);

    spdlog::debug("SM-2 advance: card={} rating={} reps {}->{} interval {}->{} ease {:.2f}->{:.2f}",
        state.flashcard_id, toString(rating), state.repetitions, next.repetitions,
        state.interval_days, next.interval_days, state.ease_factor, next.ease_factor);

    return next;
}

IntervalPreview Scheduler::previewIntervals(const SchedulingState& state) const {
    // now is irrelevant to the interval, only to the due date
    IntervalPreview p;
    p.again = advance(state, Rating::AGAIN, 0).interval_days;
    p.hard = advance(state, Rating::HARD, 0).interval_days;
    p.good = advance(state, Rating::GOOD, 0).interval_days;
    p.easy = advance(state, Rating::EASY, 0).interval_days;
    return p;
}

void Scheduler::validate(const SchedulingState& state) const {
    auto reject = [&](const std::string& why) {
        spdlog::error("Invalid scheduling state for card '{}' (user '{}'): {}",
            state.flashcard_id, state.user_id, why);
        throw InvalidStateError("invalid scheduling state for card '" + state.flashcard_id + "': " + why);
    };

    if (state.interval_days < 0)
        reject("negative interval");
    if (state.interval_days == 0 && (state.repetitions > 0 || !state.neverReviewed()))
        reject("zero interval on a reviewed card");
    if (!std::isfinite(state.ease_factor) || state.ease_factor < settings.ease_floor)
        reject("ease factor below floor");
    if (state.repetitions < 0 || state.times_reviewed < 0 || state.times_correct < 0)
        reject("negative counter");
    if (state.times_correct > state.times_reviewed)
        reject("more correct answers than reviews");
}

/* -------------------------
   SM-2 growth
   -------------------------
   reps' = 1 -> first interval (1 day)
   reps' = 2 -> second interval (6 days)
   reps' >= 3 -> round(interval * ease)
   The rating multiplier is applied by the caller afterwards.
*/
int Scheduler::computeGrowthInterval(const SchedulingState& state, int newRepetitions) const {
    if (newRepetitions == 1) return settings.first_interval_days;
    if (newRepetitions == 2) return settings.second_interval_days;

    long grown = std::lround(static_cast<double>(state.interval_days) * state.ease_factor);
    return clampInterval(grown);
}

double Scheduler::ratingMultiplier(Rating rating) const {
    switch (rating) {
    case Rating::HARD: return settings.hard_multiplier;
    case Rating::GOOD: return settings.good_multiplier;
    case Rating::EASY: return settings.easy_multiplier;
    default: return 1.0;
    }
}

double Scheduler::easeDelta(Rating rating) const {
    switch (rating) {
    case Rating::HARD: return settings.hard_ease_delta;
    case Rating::GOOD: return settings.good_ease_delta;
    case Rating::EASY: return settings.easy_ease_delta;
    default: return 0.0;
    }
}

// Floor applies on every write, not only on lapse.
double Scheduler::clampEase(double ease) const {
    return std::max(settings.ease_floor, ease);
}

int Scheduler::clampInterval(long interval) const {
    long capped = std::min<long>(interval, settings.max_interval_days);
    return static_cast<int>(std::max<long>(1, capped));
}
