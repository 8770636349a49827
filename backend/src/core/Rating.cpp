#include "Rating.hpp"
#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

std::optional<Rating> parseRating(const std::string& text) {
    std::string t = text;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    std::transform(t.begin(), t.end(), t.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (t == "again") return Rating::AGAIN;
    if (t == "hard") return Rating::HARD;
    if (t == "good") return Rating::GOOD;
    if (t == "easy") return Rating::EASY;
    return std::nullopt;
}

std::optional<Rating> readRating(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        auto word = parseRating(line);
        if (word) return word;

        std::string t = line;
        t.erase(std::remove_if(t.begin(), t.end(), [](unsigned char c) { return std::isspace(c); }), t.end());
        if (t.size() == 1 && t[0] >= '1' && t[0] <= '4') return static_cast<Rating>(t[0] - '0');

        out << "Invalid input.\n> ";
    }
    return std::nullopt;
}

const char* toString(Rating rating) {
    switch (rating) {
    case Rating::AGAIN: return "again";
    case Rating::HARD: return "hard";
    case Rating::GOOD: return "good";
    case Rating::EASY: return "easy";
    }
    return "unknown";
}

const char* toString(Maturity maturity) {
    switch (maturity) {
    case Maturity::NEW: return "new";
    case Maturity::LEARNING: return "learning";
    case Maturity::YOUNG: return "young";
    case Maturity::MATURE: return "mature";
    }
    return "unknown";
}
