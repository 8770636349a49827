#include "EventDispatcher.hpp"
#include <exception>
#include <spdlog/spdlog.h>

void LoggingEventSink::publish(const ReviewCompletedEvent& event) {
    spdlog::info("Review completed: user={} card={} rating={} maturity={} streak={} at={}",
        event.user_id, event.flashcard_id, toString(event.rating), toString(event.maturity),
        event.streak_relevant, event.timestamp);
}

EventDispatcher::EventDispatcher()
    : worker(&EventDispatcher::workerLoop, this)
{
    spdlog::debug("EventDispatcher worker started");
}

EventDispatcher::~EventDispatcher() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        shutdown = true;
    }
    queue_cv.notify_all();
    if (worker.joinable()) worker.join();
    spdlog::debug("EventDispatcher stopped after {} deliveries", delivered_count);
}

void EventDispatcher::addSink(std::shared_ptr<ReviewEventSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(queue_mutex);
    sinks.push_back(std::move(sink));
}

void EventDispatcher::publish(const ReviewCompletedEvent& event) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        pending.push_back(event);
    }
    queue_cv.notify_one();
}

void EventDispatcher::flush() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle_cv.wait(lock, [this] { return pending.empty() && !busy; });
}

std::size_t EventDispatcher::delivered() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return delivered_count;
}

void EventDispatcher::workerLoop() {
    std::unique_lock<std::mutex> lock(queue_mutex);

    while (true) {
        queue_cv.wait(lock, [this] { return shutdown || !pending.empty(); });
        if (pending.empty() && shutdown) break;

        ReviewCompletedEvent event = std::move(pending.front());
        pending.pop_front();
        auto targets = sinks;
        busy = true;

        lock.unlock();
        for (auto& sink : targets) {
            try {
                sink->publish(event);
            }
            catch (const std::exception& e) {
                spdlog::error("Event sink failed for card {}: {}", event.flashcard_id, e.what());
            }
        }
        lock.lock();

        busy = false;
        ++delivered_count;
        if (pending.empty()) idle_cv.notify_all();
    }

    idle_cv.notify_all();
}
