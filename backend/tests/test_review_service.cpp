#include <catch2/catch.hpp>
#include <atomic>
#include <thread>
#include "TestSupport.hpp"
#include "../src/core/Errors.hpp"
#include "../src/core/ReviewService.hpp"

static const std::time_t NOW = 1700000000;

struct Fixture {
    InterceptingStore store;
    StaticOwnership owners;
    RecordingSink sink;
    Scheduler scheduler;
    Classifier classifier;
    ReviewSubmissionHandler handler{ &store, &owners, &sink, scheduler, classifier };

    Fixture() {
        owners.grant("alice", "card-1");
        owners.grant("bob", "card-2");
    }
};

TEST_CASE("First review of an unscheduled card creates its state", "[review]") {
    Fixture f;

    ReviewOutcome out = f.handler.submitReview("alice", "card-1", Rating::GOOD, NOW);

    REQUIRE(out.attempts == 1);
    REQUIRE(out.new_state.interval_days == 1);
    REQUIRE(out.new_state.repetitions == 1);
    REQUIRE(out.new_state.version == 1);
    REQUIRE(out.response.new_interval_days == 1);
    REQUIRE(out.response.new_due_date == NOW + SECONDS_PER_DAY);
    REQUIRE(out.response.new_ease_factor == Approx(2.5));
    REQUIRE(out.response.new_maturity == Maturity::LEARNING);
    REQUIRE(out.response.times_reviewed == 1);
    REQUIRE(out.response.success_rate == Approx(1.0));
    REQUIRE(out.next_intervals.good == 6);

    auto stored = f.store.load("alice", "card-1");
    REQUIRE(stored.has_value());
    REQUIRE(stored->times_reviewed == 1);
}

TEST_CASE("Reviews continue from the stored state", "[review]") {
    Fixture f;
    SchedulingState initial = SchedulingState::initial("alice", "card-1", NOW);
    f.store.insert(initial);

    f.handler.submitReview("alice", "card-1", Rating::GOOD, NOW);
    f.handler.submitReview("alice", "card-1", Rating::GOOD, NOW + SECONDS_PER_DAY);
    ReviewOutcome third = f.handler.submitReview("alice", "card-1", "good", NOW + 7 * SECONDS_PER_DAY);

    REQUIRE(third.new_state.interval_days == 15);
    REQUIRE(third.new_state.repetitions == 3);
    REQUIRE(third.new_state.times_reviewed == 3);
    REQUIRE(third.new_state.version == 4);
    REQUIRE(third.response.new_maturity == Maturity::YOUNG);
}

TEST_CASE("Every accepted review emits one event", "[review]") {
    Fixture f;
    f.handler.submitReview("alice", "card-1", Rating::GOOD, NOW);
    f.handler.submitReview("alice", "card-1", Rating::AGAIN, NOW + SECONDS_PER_DAY);

    auto events = f.sink.received();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].user_id == "alice");
    REQUIRE(events[0].flashcard_id == "card-1");
    REQUIRE(events[0].rating == Rating::GOOD);
    REQUIRE(events[0].streak_relevant);
    REQUIRE(events[0].timestamp == NOW);
    REQUIRE(events[1].rating == Rating::AGAIN);
    REQUIRE_FALSE(events[1].streak_relevant);
    REQUIRE(events[1].maturity == Maturity::NEW);
}

TEST_CASE("Invalid requests are rejected before anything is read", "[review]") {
    Fixture f;

    REQUIRE_THROWS_AS(f.handler.submitReview("alice", "card-1", "perfect", NOW), ValidationError);
    REQUIRE_THROWS_AS(f.handler.submitReview("alice", "card-1", "", NOW), ValidationError);
    REQUIRE_THROWS_AS(f.handler.submitReview("alice", "", Rating::GOOD, NOW), ValidationError);
    REQUIRE_THROWS_AS(f.handler.submitReview("", "card-1", Rating::GOOD, NOW), ValidationError);
    REQUIRE_THROWS_AS(f.handler.submitReview("alice", "card-1", static_cast<Rating>(9), NOW), ValidationError);

    REQUIRE(f.store.cas_calls == 0);
    REQUIRE(f.sink.received().empty());
}

TEST_CASE("Another user's card cannot be reviewed", "[review]") {
    Fixture f;
    SchedulingState bobs = SchedulingState::initial("bob", "card-2", NOW);
    f.store.insert(bobs);

    REQUIRE_THROWS_AS(f.handler.submitReview("alice", "card-2", Rating::EASY, NOW), NotFoundOrForbiddenError);
    REQUIRE_THROWS_AS(f.handler.submitReview("alice", "missing", Rating::EASY, NOW), NotFoundOrForbiddenError);

    auto stored = f.store.load("bob", "card-2");
    REQUIRE(stored->times_reviewed == 0);
    REQUIRE(stored->version == 1);
    REQUIRE_FALSE(f.store.load("alice", "card-2").has_value());
    REQUIRE(f.sink.received().empty());
}

TEST_CASE("A competing write forces one retry against the new state", "[review][concurrency]") {
    Fixture f;
    SchedulingState initial = SchedulingState::initial("alice", "card-1", NOW);
    f.store.insert(initial);

    // The competing submission read the same version and commits first.
    f.store.before_next_cas = [&](MemoryStateStore& inner) {
        SchedulingState seen = *inner.load("alice", "card-1");
        SchedulingState other = f.scheduler.advance(seen, Rating::GOOD, NOW);
        REQUIRE(inner.compareAndSwap(seen.version, other));
    };

    ReviewOutcome out = f.handler.submitReview("alice", "card-1", Rating::GOOD, NOW);

    REQUIRE(out.attempts == 2);
    REQUIRE(out.new_state.times_reviewed == 2);
    REQUIRE(out.new_state.repetitions == 2);
    REQUIRE(out.new_state.interval_days == 6);
    REQUIRE(f.store.load("alice", "card-1")->times_reviewed == 2);
}

TEST_CASE("Conflicts past the retry budget surface as transient errors", "[review][concurrency]") {
    InterceptingStore store;
    StaticOwnership owners;
    owners.grant("alice", "card-1");
    RecordingSink sink;
    ReviewSubmissionHandler handler(&store, &owners, &sink, Scheduler(), Classifier(), 3);

    SchedulingState initial = SchedulingState::initial("alice", "card-1", NOW);
    store.insert(initial);

    // Someone else always commits in between.
    std::function<void(MemoryStateStore&)> interfere = [&](MemoryStateStore& inner) {
        SchedulingState seen = *inner.load("alice", "card-1");
        SchedulingState bumped = seen;
        inner.compareAndSwap(seen.version, bumped);
        store.before_next_cas = interfere;
    };
    store.before_next_cas = interfere;

    try {
        handler.submitReview("alice", "card-1", Rating::GOOD, NOW);
        FAIL("expected a conflict");
    }
    catch (const ConcurrencyConflictError& e) {
        REQUIRE(e.transient());
    }

    REQUIRE(store.cas_calls == 3);
    REQUIRE(store.load("alice", "card-1")->times_reviewed == 0);
    REQUIRE(sink.received().empty());
}

TEST_CASE("A storage failure leaves the state unchanged", "[review]") {
    Fixture f;
    SchedulingState initial = SchedulingState::initial("alice", "card-1", NOW);
    f.store.insert(initial);
    f.store.fail_writes = true;

    try {
        f.handler.submitReview("alice", "card-1", Rating::GOOD, NOW);
        FAIL("expected a persistence failure");
    }
    catch (const PersistenceError& e) {
        REQUIRE(e.transient());
    }

    auto stored = f.store.load("alice", "card-1");
    REQUIRE(stored->times_reviewed == 0);
    REQUIRE(stored->version == 1);
    REQUIRE(f.sink.received().empty());
}

TEST_CASE("A failing event sink does not undo the review", "[review]") {
    MemoryStateStore store;
    StaticOwnership owners;
    owners.grant("alice", "card-1");
    ThrowingSink sink;
    ReviewSubmissionHandler handler(&store, &owners, &sink, Scheduler(), Classifier());

    ReviewOutcome out = handler.submitReview("alice", "card-1", Rating::EASY, NOW);
    REQUIRE(out.new_state.times_reviewed == 1);
    REQUIRE(store.load("alice", "card-1")->times_reviewed == 1);
}

TEST_CASE("Concurrent submissions for one card lose no update", "[review][concurrency]") {
    MemoryStateStore store;
    StaticOwnership owners;
    owners.grant("alice", "card-1");
    RecordingSink sink;
    ReviewSubmissionHandler handler(&store, &owners, &sink, Scheduler(), Classifier(), 1000);

    SchedulingState initial = SchedulingState::initial("alice", "card-1", NOW);
    store.insert(initial);

    const int threads = 4;
    const int perThread = 25;
    std::atomic<bool> go{ false };
    std::atomic<int> failures{ 0 };
    std::vector<std::thread> pool;

    for (int t = 0; t < threads; ++t) {
        pool.emplace_back([&] {
            while (!go.load()) std::this_thread::yield();
            for (int i = 0; i < perThread; ++i) {
                try {
                    handler.submitReview("alice", "card-1", Rating::GOOD, NOW);
                }
                catch (const SchedulingError&) {
                    ++failures;
                }
            }
        });
    }
    go = true;
    for (auto& th : pool) th.join();

    REQUIRE(failures == 0);
    auto stored = store.load("alice", "card-1");
    REQUIRE(stored->times_reviewed == threads * perThread);
    REQUIRE(stored->times_correct == threads * perThread);
    REQUIRE(stored->version == static_cast<std::uint64_t>(threads * perThread + 1));
    REQUIRE(sink.received().size() == static_cast<size_t>(threads * perThread));
}

TEST_CASE("Different cards are reviewed independently in parallel", "[review][concurrency]") {
    MemoryStateStore store;
    StaticOwnership owners;
    for (int i = 0; i < 8; ++i) owners.grant("u" + std::to_string(i), "c" + std::to_string(i));
    ReviewSubmissionHandler handler(&store, &owners, nullptr, Scheduler(), Classifier());

    std::vector<std::thread> pool;
    for (int i = 0; i < 8; ++i) {
        pool.emplace_back([&, i] {
            for (int n = 0; n < 10; ++n)
                handler.submitReview("u" + std::to_string(i), "c" + std::to_string(i), Rating::HARD, NOW);
        });
    }
    for (auto& th : pool) th.join();

    for (int i = 0; i < 8; ++i) {
        auto s = store.load("u" + std::to_string(i), "c" + std::to_string(i));
        REQUIRE(s->times_reviewed == 10);
    }
}
