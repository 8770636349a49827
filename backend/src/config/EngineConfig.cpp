#include "EngineConfig.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

static std::string trim(const std::string& s) {
    std::string t = s;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

// std::stod/stoi accept trailing garbage; require the whole value to parse.
static double toDouble(const std::string& v) {
    size_t used = 0;
    double d = std::stod(v, &used);
    if (used != v.size()) throw std::invalid_argument("trailing characters");
    return d;
}

static int toInt(const std::string& v) {
    size_t used = 0;
    int i = std::stoi(v, &used);
    if (used != v.size()) throw std::invalid_argument("trailing characters");
    return i;
}

bool EngineConfig::loadFile(const std::string& filename, EngineConfig& config) {
    std::ifstream in(filename);
    if (!in) {
        spdlog::warn("Config file '{}' not found; using defaults", filename);
        return true;
    }

    std::ostringstream body;
    body << in.rdbuf();
    if (in.bad()) {
        spdlog::error("Failed to read config file '{}'", filename);
        return false;
    }

    config.apply(body.str());
    spdlog::info("Loaded config from '{}'", filename);
    return true;
}

void EngineConfig::apply(const std::string& text) {
    std::istringstream iss(text);
    std::string line;
    int lineNo = 0;

    while (std::getline(iss, line)) {
        ++lineNo;
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            spdlog::warn("Config line {} ignored: expected key = value", lineNo);
            continue;
        }

        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));
        if (!set(key, value))
            spdlog::warn("Config line {} ignored: {} = '{}'", lineNo, key, value);
    }
}

bool EngineConfig::set(const std::string& key, const std::string& value) {
    try {
        if (key == "ease_floor") {
            double d = toDouble(value);
            if (d <= 0.0) return false;
            policy.ease_floor = d;
        }
        else if (key == "initial_ease") policy.initial_ease = toDouble(value);
        else if (key == "lapse_ease_penalty") policy.lapse_ease_penalty = toDouble(value);
        else if (key == "lapse_interval_days") policy.lapse_interval_days = std::max(1, toInt(value));
        else if (key == "first_interval_days") policy.first_interval_days = std::max(1, toInt(value));
        else if (key == "second_interval_days") policy.second_interval_days = std::max(1, toInt(value));
        else if (key == "hard_multiplier") policy.hard_multiplier = toDouble(value);
        else if (key == "good_multiplier") policy.good_multiplier = toDouble(value);
        else if (key == "easy_multiplier") policy.easy_multiplier = toDouble(value);
        else if (key == "hard_ease_delta") policy.hard_ease_delta = toDouble(value);
        else if (key == "good_ease_delta") policy.good_ease_delta = toDouble(value);
        else if (key == "easy_ease_delta") policy.easy_ease_delta = toDouble(value);
        else if (key == "max_interval_days") policy.max_interval_days = std::max(1, toInt(value));
        else if (key == "queue_max_size") {
            int n = toInt(value);
            if (n < 1) return false;
            queue_max_size = static_cast<std::size_t>(n);
        }
        else if (key == "submit_max_attempts") {
            int n = toInt(value);
            if (n < 1) return false;
            submit_max_attempts = n;
        }
        else if (key == "seconds_per_card") {
            int n = toInt(value);
            if (n < 1) return false;
            seconds_per_card = n;
        }
        else if (key == "data_dir") {
            if (value.empty()) return false;
            data_dir = value;
        }
        else if (key == "log_file") {
            if (value.empty()) return false;
            log_file = value;
        }
        else if (key == "log_level") {
            auto lvl = spdlog::level::from_str(value);
            // from_str maps unknown names to "off"
            if (lvl == spdlog::level::off && value != "off") return false;
            log_level = lvl;
        }
        else {
            return false;
        }
    }
    catch (const std::exception& e) {
        spdlog::debug("Config value for '{}' not parsed: {}", key, e.what());
        return false;
    }

    // Initial ease below the floor would make every new card invalid.
    if (policy.initial_ease < policy.ease_floor) policy.initial_ease = policy.ease_floor;
    return true;
}

std::string EngineConfig::serialize() const {
    std::ostringstream oss;
    oss << "ease_floor = " << policy.ease_floor << "\n"
        << "initial_ease = " << policy.initial_ease << "\n"
        << "lapse_ease_penalty = " << policy.lapse_ease_penalty << "\n"
        << "lapse_interval_days = " << policy.lapse_interval_days << "\n"
        << "first_interval_days = " << policy.first_interval_days << "\n"
        << "second_interval_days = " << policy.second_interval_days << "\n"
        << "hard_multiplier = " << policy.hard_multiplier << "\n"
        << "good_multiplier = " << policy.good_multiplier << "\n"
        << "easy_multiplier = " << policy.easy_multiplier << "\n"
        << "hard_ease_delta = " << policy.hard_ease_delta << "\n"
        << "good_ease_delta = " << policy.good_ease_delta << "\n"
        << "easy_ease_delta = " << policy.easy_ease_delta << "\n"
        << "max_interval_days = " << policy.max_interval_days << "\n"
        << "queue_max_size = " << queue_max_size << "\n"
        << "submit_max_attempts = " << submit_max_attempts << "\n"
        << "seconds_per_card = " << seconds_per_card << "\n"
        << "data_dir = " << data_dir << "\n"
        << "log_file = " << log_file << "\n"
        << "log_level = " << spdlog::level::to_string_view(log_level).data() << "\n";
    return oss.str();
}
