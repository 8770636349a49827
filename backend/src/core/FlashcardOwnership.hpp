#pragma once
#include <string>

// Answers "does this flashcard exist and belong to this user?"
class FlashcardOwnership {
public:
    virtual ~FlashcardOwnership() = default;
    virtual bool isOwnedBy(const std::string& userId, const std::string& flashcardId) const = 0;
};
