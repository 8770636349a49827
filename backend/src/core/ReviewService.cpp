#include "ReviewService.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

static bool isKnownRating(Rating rating) {
    switch (rating) {
    case Rating::AGAIN:
    case Rating::HARD:
    case Rating::GOOD:
    case Rating::EASY:
        return true;
    }
    return false;
}

ReviewSubmissionHandler::ReviewSubmissionHandler(StateStore* stateStore,
    const FlashcardOwnership* owners,
    ReviewEventSink* sink,
    const Scheduler& s,
    const Classifier& c,
    int maxAttempts)
    : store(stateStore),
    ownership(owners),
    events(sink),
    scheduler(s),
    classifier(c),
    max_attempts(std::max(1, maxAttempts))
{
}

ReviewOutcome ReviewSubmissionHandler::submitReview(const std::string& userId,
    const std::string& flashcardId,
    const std::string& rating,
    std::time_t now)
{
    auto parsed = parseRating(rating);
    if (!parsed) {
        spdlog::warn("Review rejected: invalid rating '{}' for card {}", rating, flashcardId);
        throw ValidationError("rating must be one of: again, hard, good, easy");
    }
    return submitReview(userId, flashcardId, *parsed, now);
}

ReviewOutcome ReviewSubmissionHandler::submitReview(const std::string& userId,
    const std::string& flashcardId,
    Rating rating,
    std::time_t now)
{
    validateRequest(userId, flashcardId, rating);

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        auto loaded = store->load(userId, flashcardId);

        // Checked on every attempt: the card may have been deleted since the last one.
        requireOwnership(userId, flashcardId);

        SchedulingState current = loaded
            ? *loaded
            : SchedulingState::initial(userId, flashcardId, now, scheduler.policy().initial_ease);
        std::uint64_t expected = loaded ? loaded->version : 0;

        SchedulingState next = scheduler.advance(current, rating, now);

        if (!store->compareAndSwap(expected, next)) {
            spdlog::warn("Concurrent update on card {} (attempt {}/{}); retrying",
                flashcardId, attempt, max_attempts);
            continue;
        }

        // A lazily created row can land after a concurrent deletion already
        // cascaded; take it back out so no row outlives its flashcard.
        if (expected == 0 && !ownership->isOwnedBy(userId, flashcardId)) {
            store->remove(userId, flashcardId);
            spdlog::warn("Review of card {} discarded: card was deleted during the review", flashcardId);
            throw NotFoundOrForbiddenError("flashcard '" + flashcardId + "' not found");
        }

        Classification cls = classifier.classify(next, now);

        ReviewOutcome outcome;
        outcome.new_state = next;
        outcome.attempts = attempt;
        outcome.next_intervals = scheduler.previewIntervals(next);

        outcome.response.new_interval_days = next.interval_days;
        outcome.response.new_due_date = next.due_date;
        outcome.response.new_ease_factor = next.ease_factor;
        outcome.response.new_maturity = cls.maturity;
        outcome.response.times_reviewed = next.times_reviewed;
        outcome.response.success_rate = next.successRate();

        outcome.event.user_id = userId;
        outcome.event.flashcard_id = flashcardId;
        outcome.event.rating = rating;
        outcome.event.maturity = cls.maturity;
        outcome.event.streak_relevant = !isLapse(rating);
        outcome.event.timestamp = now;

        spdlog::info("Review accepted: user={} card={} rating={} interval={}d ease={:.2f} v{}",
            userId, flashcardId, toString(rating), next.interval_days, next.ease_factor, next.version);

        publish(outcome.event);
        return outcome;
    }

    spdlog::error("Review of card {} by {} gave up after {} conflicting attempts",
        flashcardId, userId, max_attempts);
    throw ConcurrencyConflictError("card '" + flashcardId + "' was modified concurrently; retry the review");
}

void ReviewSubmissionHandler::validateRequest(const std::string& userId,
    const std::string& flashcardId,
    Rating rating) const
{
    if (userId.empty() || flashcardId.empty()) {
        spdlog::warn("Review rejected: userId and flashcardId are required");
        throw ValidationError("userId and flashcardId are required");
    }
    if (!isKnownRating(rating)) {
        spdlog::warn("Review rejected: rating value {} out of range", static_cast<int>(rating));
        throw ValidationError("rating must be one of: again, hard, good, easy");
    }
}

void ReviewSubmissionHandler::requireOwnership(const std::string& userId,
    const std::string& flashcardId) const
{
    if (!ownership || !ownership->isOwnedBy(userId, flashcardId)) {
        spdlog::warn("Review rejected: card {} not found or not owned by {}", flashcardId, userId);
        throw NotFoundOrForbiddenError("flashcard '" + flashcardId + "' not found");
    }
}

// Fire-and-forget: the review is already committed, so a failing sink is only logged.
void ReviewSubmissionHandler::publish(const ReviewCompletedEvent& event) const {
    if (!events) return;
    try {
        events->publish(event);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to publish review event for card {}: {}", event.flashcard_id, e.what());
    }
}
