#include "ReviewQueue.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

ReviewQueueBuilder::ReviewQueueBuilder(const StateStore* stateStore, const Classifier& c, std::size_t defaultMaxSize)
    : store(stateStore), classifier(c), default_max_size(defaultMaxSize)
{
}

ReviewQueue ReviewQueueBuilder::buildQueue(const std::string& userId, std::time_t now) const {
    return buildQueue(userId, now, default_max_size);
}

ReviewQueue ReviewQueueBuilder::buildQueue(const std::string& userId, std::time_t now, std::size_t maxSize) const {
    ReviewQueue queue;

    std::vector<SchedulingState> due = store->loadDue(userId, now);
    queue.items.reserve(due.size());

    double retentionSum = 0.0;
    for (const auto& s : due) {
        ReviewQueueItem item = describe(s, now);

        switch (item.maturity) {
        case Maturity::NEW: queue.stats.new_cards++; break;
        case Maturity::LEARNING: queue.stats.learning_cards++; break;
        case Maturity::YOUNG: queue.stats.young_cards++; break;
        case Maturity::MATURE: queue.stats.mature_cards++; break;
        }
        retentionSum += item.estimated_retention;

        queue.items.push_back(std::move(item));
    }

    queue.stats.total_due = static_cast<int>(queue.items.size());
    if (!queue.items.empty())
        queue.stats.average_retention = retentionSum / static_cast<double>(queue.items.size());

    std::sort(queue.items.begin(), queue.items.end(),
        [](const ReviewQueueItem& a, const ReviewQueueItem& b) {
            if (a.days_overdue != b.days_overdue) return a.days_overdue > b.days_overdue;
            if (a.estimated_retention != b.estimated_retention)
                return a.estimated_retention < b.estimated_retention;
            return a.flashcard_id < b.flashcard_id;
        });

    if (queue.items.size() > maxSize) queue.items.resize(maxSize);

    spdlog::info("Review queue for {}: {} due, returning {} (new={} learning={} young={} mature={} avg_retention={:.3f})",
        userId, queue.stats.total_due, queue.items.size(),
        queue.stats.new_cards, queue.stats.learning_cards, queue.stats.young_cards,
        queue.stats.mature_cards, queue.stats.average_retention);

    return queue;
}

ReviewQueueItem ReviewQueueBuilder::describe(const SchedulingState& state, std::time_t now) const {
    Classification c = classifier.classify(state, now);

    ReviewQueueItem item;
    item.flashcard_id = state.flashcard_id;
    item.maturity = c.maturity;
    item.days_overdue = state.daysOverdue(now);
    item.estimated_retention = c.estimated_retention;
    item.interval_days = state.interval_days;
    item.ease_factor = state.ease_factor;
    item.repetitions = state.repetitions;
    item.times_reviewed = state.times_reviewed;
    item.success_rate = state.successRate();
    item.due_date = state.due_date;
    item.last_reviewed_at = state.last_reviewed_at;
    return item;
}
