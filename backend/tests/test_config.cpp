#include <catch2/catch.hpp>
#include "../src/config/EngineConfig.hpp"

TEST_CASE("Defaults match the classic schedule", "[config]") {
    EngineConfig cfg;
    REQUIRE(cfg.policy.ease_floor == Approx(1.3));
    REQUIRE(cfg.policy.initial_ease == Approx(2.5));
    REQUIRE(cfg.policy.hard_multiplier == Approx(0.8));
    REQUIRE(cfg.policy.easy_multiplier == Approx(1.3));
    REQUIRE(cfg.policy.lapse_ease_penalty == Approx(0.2));
    REQUIRE(cfg.queue_max_size == 50);
    REQUIRE(cfg.submit_max_attempts == 3);
}

TEST_CASE("Config text overrides individual keys", "[config]") {
    EngineConfig cfg;
    cfg.apply(
        "# policy\n"
        "hard_multiplier = 0.7\n"
        "easy_ease_delta=0.2   # inline comment\n"
        "queue_max_size = 20\n"
        "log_level = debug\n"
        "data_dir = /var/lib/cadence\n");

    REQUIRE(cfg.policy.hard_multiplier == Approx(0.7));
    REQUIRE(cfg.policy.easy_ease_delta == Approx(0.2));
    REQUIRE(cfg.queue_max_size == 20);
    REQUIRE(cfg.log_level == spdlog::level::debug);
    REQUIRE(cfg.data_dir == "/var/lib/cadence");
    REQUIRE(cfg.policy.good_multiplier == Approx(1.0));
}

TEST_CASE("Bad config values are ignored", "[config]") {
    EngineConfig cfg;
    cfg.apply(
        "hard_multiplier = fast\n"
        "queue_max_size = 0\n"
        "queue_max_size = 12abc\n"
        "no_equals_sign\n"
        "unknown_key = 4\n"
        "log_level = chatty\n");

    REQUIRE(cfg.policy.hard_multiplier == Approx(0.8));
    REQUIRE(cfg.queue_max_size == 50);
    REQUIRE(cfg.log_level == spdlog::level::info);
    REQUIRE_FALSE(cfg.set("unknown_key", "4"));
}

TEST_CASE("Initial ease is kept at or above the floor", "[config]") {
    EngineConfig cfg;
    REQUIRE(cfg.set("initial_ease", "1.1"));
    REQUIRE(cfg.policy.initial_ease == Approx(1.3));
}

TEST_CASE("Serialized config reads back identically", "[config]") {
    EngineConfig cfg;
    cfg.set("second_interval_days", "5");
    cfg.set("submit_max_attempts", "7");

    EngineConfig copy;
    copy.apply(cfg.serialize());
    REQUIRE(copy.policy.second_interval_days == 5);
    REQUIRE(copy.submit_max_attempts == 7);
    REQUIRE(copy.log_file == cfg.log_file);
}

TEST_CASE("A missing config file means defaults", "[config]") {
    EngineConfig cfg;
    REQUIRE(EngineConfig::loadFile("/nonexistent/cadence.conf", cfg));
    REQUIRE(cfg.queue_max_size == 50);
}
