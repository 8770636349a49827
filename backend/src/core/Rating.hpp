#pragma once
#include <iosfwd>
#include <optional>
#include <string>

// Answer quality reported by the user for a single review.
enum class Rating {
    AGAIN = 1,
    HARD = 2,
    GOOD = 3,
    EASY = 4
};

// Coarse consolidation bucket derived from repetitions and interval.
enum class Maturity {
    NEW,
    LEARNING,
    YOUNG,
    MATURE
};

// Wire form is lowercase: "again", "hard", "good", "easy".
std::optional<Rating> parseRating(const std::string& text);
// Reads answer lines ("1".."4" or a wire name) until one is valid, writing
// "Invalid input." to `out` for each bad line. Empty if input ends first.
std::optional<Rating> readRating(std::istream& in, std::ostream& out);

const char* toString(Rating rating);
const char* toString(Maturity maturity);

inline bool isLapse(Rating rating) { return rating == Rating::AGAIN; }
