#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "Classifier.hpp"
#include "../storage/StateStore.hpp"

struct ReviewQueueItem {
    std::string flashcard_id;
    Maturity maturity = Maturity::NEW;
    int days_overdue = 0;
    double estimated_retention = 0.0;
    int interval_days = 0;
    double ease_factor = 0.0;
    int repetitions = 0;
    int times_reviewed = 0;
    double success_rate = 0.0;
    std::time_t due_date = 0;
    std::optional<std::time_t> last_reviewed_at;
};

// Aggregates over the whole due set, not only the returned batch.
struct ReviewQueueStats {
    int total_due = 0;
    int new_cards = 0;
    int learning_cards = 0;
    int young_cards = 0;
    int mature_cards = 0;
    double average_retention = 0.0;
};

struct ReviewQueue {
    std::vector<ReviewQueueItem> items;
    ReviewQueueStats stats;
};

/*
  Read-only. Ordering:
    1. days overdue, most overdue first
    2. estimated retention, lowest first
    3. flashcard id, for a stable result
  maxSize only limits what is returned; nothing is written.
*/
class ReviewQueueBuilder {
public:
    ReviewQueueBuilder(const StateStore* store, const Classifier& classifier, std::size_t defaultMaxSize = 50);

    ReviewQueue buildQueue(const std::string& userId, std::time_t now) const;
    ReviewQueue buildQueue(const std::string& userId, std::time_t now, std::size_t maxSize) const;

    std::size_t defaultMaxSize() const { return default_max_size; }

private:
    const StateStore* store;
    Classifier classifier;
    std::size_t default_max_size;

    ReviewQueueItem describe(const SchedulingState& state, std::time_t now) const;
};
