#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;

// Per (user, flashcard) memory parameters. Mutated only by ReviewSubmissionHandler.
class SchedulingState {
public:
    SchedulingState() = default;

    // Default "never reviewed" state, due immediately.
    static SchedulingState initial(const std::string& userId,
        const std::string& flashcardId,
        std::time_t now,
        double initialEase = 2.5);

    // Identity
    std::string user_id;
    std::string flashcard_id;

    // Scheduler state
    double ease_factor = 2.5;
    int interval_days = 0;                      // Days; 0 only before first review
    int repetitions = 0;                        // Consecutive non-lapse reviews
    std::time_t due_date = 0;                   // Seconds since epoch
    std::optional<std::time_t> last_reviewed_at;

    // Counters
    int times_reviewed = 0;
    int times_correct = 0;

    // Optimistic concurrency token; 0 = not yet stored
    std::uint64_t version = 0;

    bool neverReviewed() const { return !last_reviewed_at.has_value(); }
    double successRate() const;
    int daysOverdue(std::time_t now) const;
    bool isDue(std::time_t now) const { return due_date <= now; }
};

// Days elapsed between two timestamps as a fraction (negative spans clamp to 0).
double daysBetween(std::time_t from, std::time_t to);
