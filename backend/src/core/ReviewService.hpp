#pragma once
#include <ctime>
#include <string>
#include "Classifier.hpp"
#include "FlashcardOwnership.hpp"
#include "Rating.hpp"
#include "Scheduler.hpp"
#include "../events/ReviewEvents.hpp"
#include "../storage/StateStore.hpp"

// What the caller of a review submission gets back.
struct ReviewResponse {
    int new_interval_days = 0;
    std::time_t new_due_date = 0;
    double new_ease_factor = 0.0;
    Maturity new_maturity = Maturity::NEW;
    int times_reviewed = 0;
    double success_rate = 0.0;
};

struct ReviewOutcome {
    SchedulingState new_state;
    ReviewCompletedEvent event;
    ReviewResponse response;
    IntervalPreview next_intervals;   // what each rating would do next time
    int attempts = 1;                 // 1 unless a concurrent write forced a retry
};

/*
  The only mutating entry point of the engine.

    validate -> load (or default) -> ownership -> advance -> CAS persist
    -> publish event

  A CAS mismatch reloads and recomputes, up to max_attempts times, then
  ConcurrencyConflictError. Any failure after validation leaves storage
  untouched.
*/
class ReviewSubmissionHandler {
public:
    ReviewSubmissionHandler(StateStore* store,
        const FlashcardOwnership* ownership,
        ReviewEventSink* events,
        const Scheduler& scheduler,
        const Classifier& classifier,
        int maxAttempts = 3);

    ReviewOutcome submitReview(const std::string& userId,
        const std::string& flashcardId,
        Rating rating,
        std::time_t now);

    // Wire form: rating is "again" | "hard" | "good" | "easy".
    ReviewOutcome submitReview(const std::string& userId,
        const std::string& flashcardId,
        const std::string& rating,
        std::time_t now);

    int maxAttempts() const { return max_attempts; }

private:
    StateStore* store;
    const FlashcardOwnership* ownership;
    ReviewEventSink* events;
    Scheduler scheduler;
    Classifier classifier;
    int max_attempts;

    void validateRequest(const std::string& userId, const std::string& flashcardId, Rating rating) const;
    void requireOwnership(const std::string& userId, const std::string& flashcardId) const;
    void publish(const ReviewCompletedEvent& event) const;
};
