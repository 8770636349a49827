#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include "../core/Scheduler.hpp"

/*
  Runtime settings. Text format, one "key = value" per line, '#' starts a
  comment. Every key has a default; unknown keys and bad values are logged
  and ignored.
*/
struct EngineConfig {
    SchedulerPolicy policy;

    std::size_t queue_max_size = 50;
    int submit_max_attempts = 3;
    int seconds_per_card = 10;

    std::string data_dir = ".";
    std::string log_file = "cadence.log";
    spdlog::level::level_enum log_level = spdlog::level::info;

    // Missing file -> defaults (returns false only when the file exists but cannot be read).
    static bool loadFile(const std::string& filename, EngineConfig& config);

    // Applies one body of "key = value" lines on top of the current values.
    void apply(const std::string& text);
    bool set(const std::string& key, const std::string& value);

    std::string serialize() const;
};
