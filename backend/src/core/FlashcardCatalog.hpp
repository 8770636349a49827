#pragma once
#include <ctime>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "FlashcardOwnership.hpp"
#include "../storage/StateStore.hpp"

struct Flashcard {
    std::string id;
    std::string owner;
    std::string front;
    std::string back;
    std::time_t created_at = 0;
};

/*
  Flashcard lifecycle owner. Creating a card initializes its default
  scheduling row; removing a card deletes that row. Content is opaque here.
*/
class FlashcardCatalog : public FlashcardOwnership {
public:
    FlashcardCatalog(StateStore* store, double initialEase = 2.5);

    // Returns the new card. Throws ValidationError on empty fields.
    Flashcard create(const std::string& owner, const std::string& front,
        const std::string& back, std::time_t now);

    // Returns false if the card is missing or owned by someone else.
    bool remove(const std::string& owner, const std::string& flashcardId);

    bool isOwnedBy(const std::string& userId, const std::string& flashcardId) const override;

    std::optional<Flashcard> find(const std::string& flashcardId) const;
    std::vector<Flashcard> cardsOf(const std::string& owner) const;

    std::string serialize() const;
    // Returns false on a malformed body; previously loaded cards are kept.
    bool deserialize(const std::string& data);

    static std::string generateID();

private:
    StateStore* store;
    double initial_ease;

    mutable std::shared_mutex mutex;
    std::map<std::string, Flashcard> cards;
};
