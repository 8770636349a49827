#pragma once
#include <ctime>
#include <string>
#include "../core/Rating.hpp"

// Emitted once per accepted review. Consumers must tolerate duplicates.
struct ReviewCompletedEvent {
    std::string user_id;
    std::string flashcard_id;
    Rating rating = Rating::GOOD;
    Maturity maturity = Maturity::NEW;
    bool streak_relevant = false;   // rating != again
    std::time_t timestamp = 0;
};

class ReviewEventSink {
public:
    virtual ~ReviewEventSink() = default;

    // Must not block on downstream work.
    virtual void publish(const ReviewCompletedEvent& event) = 0;
};

// Writes every event to the default spdlog logger.
class LoggingEventSink : public ReviewEventSink {
public:
    void publish(const ReviewCompletedEvent& event) override;
};
