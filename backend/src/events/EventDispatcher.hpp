#pragma once
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "ReviewEvents.hpp"

/*
  Fire-and-forget fan-out. publish() only enqueues; a dedicated worker
  thread hands each event to every registered sink in order. A sink that
  throws is logged and skipped; delivery to the other sinks continues.
  The destructor drains the queue before joining.
*/
class EventDispatcher : public ReviewEventSink {
public:
    EventDispatcher();
    ~EventDispatcher() override;

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void addSink(std::shared_ptr<ReviewEventSink> sink);

    void publish(const ReviewCompletedEvent& event) override;

    // Blocks until every event published so far has been delivered.
    void flush();

    std::size_t delivered() const;

private:
    void workerLoop();

    mutable std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::condition_variable idle_cv;
    std::deque<ReviewCompletedEvent> pending;
    std::vector<std::shared_ptr<ReviewEventSink>> sinks;
    std::size_t delivered_count = 0;
    bool busy = false;
    bool shutdown = false;

    std::thread worker;
};
