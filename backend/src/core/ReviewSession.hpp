#pragma once
#include <ctime>
#include <string>
#include "Rating.hpp"

// Per-sitting counters owned by the caller and passed around explicitly.
struct ReviewSession {
    std::string user_id;
    std::time_t started_at = 0;
    int reviewed = 0;
    int correct = 0;
    int streak = 0;
    int best_streak = 0;

    void record(Rating rating) {
        ++reviewed;
        if (isLapse(rating)) {
            streak = 0;
            return;
        }
        ++correct;
        ++streak;
        if (streak > best_streak) best_streak = streak;
    }

    double accuracy() const {
        return reviewed > 0 ? static_cast<double>(correct) / reviewed : 0.0;
    }
};
