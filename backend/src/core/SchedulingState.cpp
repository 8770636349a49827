#include "SchedulingState.hpp"
#include <algorithm>

SchedulingState SchedulingState::initial(const std::string& userId,
    const std::string& flashcardId,
    std::time_t now,
    double initialEase)
{
    SchedulingState s;
    s.user_id = userId;
    s.flashcard_id = flashcardId;
    s.ease_factor = initialEase;
    s.interval_days = 0;
    s.repetitions = 0;
    s.due_date = now;
    return s;
}

double SchedulingState::successRate() const {
    if (times_reviewed <= 0) return 0.0;
    return static_cast<double>(times_correct) / static_cast<double>(times_reviewed);
}

int SchedulingState::daysOverdue(std::time_t now) const {
    if (now <= due_date) return 0;
    return static_cast<int>((now - due_date) / SECONDS_PER_DAY);
}

double daysBetween(std::time_t from, std::time_t to) {
    if (to <= from) return 0.0;
    return static_cast<double>(to - from) / static_cast<double>(SECONDS_PER_DAY);
}
