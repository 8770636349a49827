#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sodium.h>

#include "../utils/logging.hpp"
#include "../config/EngineConfig.hpp"
#include "../core/Classifier.hpp"
#include "../core/Errors.hpp"
#include "../core/FlashcardCatalog.hpp"
#include "../core/ReviewQueue.hpp"
#include "../core/ReviewService.hpp"
#include "../core/ReviewSession.hpp"
#include "../core/Scheduler.hpp"
#include "../events/EventDispatcher.hpp"
#include "../storage/FileStateStore.hpp"
#include "../storage/Storage.hpp"

std::string saltFileFor(const EngineConfig& cfg, const std::string& username) {
    return cfg.data_dir + "/salt_" + username + ".hex";
}

std::string stateFileFor(const EngineConfig& cfg, const std::string& username) {
    return cfg.data_dir + "/state_" + username + ".dat";
}

std::string cardFileFor(const EngineConfig& cfg, const std::string& username) {
    return cfg.data_dir + "/cards_" + username + ".dat";
}

std::string formatDate(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

int readMenuChoice() {
    int choice;
    if (!(std::cin >> choice)) {
        if (std::cin.eof()) return -1;
        std::cin.clear();
        std::string dummy; std::getline(std::cin, dummy);
        return 0;
    }
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    return choice;
}

// Empty when input ends before a rating is given.
std::optional<Rating> askRating(const IntervalPreview& preview) {
    std::cout << "\nHow well did you remember?\n"
        " 1 = AGAIN (" << formatInterval(preview.again) << ")\n"
        " 2 = HARD  (" << formatInterval(preview.hard) << ")\n"
        " 3 = GOOD  (" << formatInterval(preview.good) << ")\n"
        " 4 = EASY  (" << formatInterval(preview.easy) << ")\n> ";
    return readRating(std::cin, std::cout);
}

bool saveCatalog(const FlashcardCatalog& catalog, const std::string& file, const std::vector<unsigned char>& key) {
    if (!Storage::writeEncrypted(catalog.serialize(), file, key)) {
        std::cout << "Error saving flashcards.\n";
        return false;
    }
    return true;
}

void printStats(const ReviewQueueStats& stats) {
    std::cout << "Due: " << stats.total_due
        << "  (new " << stats.new_cards
        << ", learning " << stats.learning_cards
        << ", young " << stats.young_cards
        << ", mature " << stats.mature_cards << ")\n"
        << "Average retention: " << std::fixed << std::setprecision(0)
        << stats.average_retention * 100.0 << "%\n";
    std::cout.unsetf(std::ios::fixed);
}

void listCards(const FlashcardCatalog& catalog, const StateStore& store,
    const Classifier& classifier, const std::string& user, std::time_t now)
{
    auto cards = catalog.cardsOf(user);
    std::cout << "\n===== ALL FLASHCARDS =====\n";
    if (cards.empty()) {
        std::cout << "No flashcards stored.\n";
        return;
    }

    for (size_t i = 0; i < cards.size(); ++i) {
        const Flashcard& c = cards[i];
        std::cout << i + 1 << ". " << c.front << "\n";

        auto state = store.load(user, c.id);
        if (!state) {
            std::cout << "   (no schedule yet)\n";
            continue;
        }
        Classification cls = classifier.classify(*state, now);
        std::cout << "   Maturity: " << toString(cls.maturity) << "\n"
            << "   Interval: " << formatInterval(state->interval_days) << "\n"
            << "   Ease: " << state->ease_factor << "\n"
            << "   Reviews: " << state->times_reviewed
            << " (" << static_cast<int>(state->successRate() * 100.0 + 0.5) << "% correct)\n"
            << "   Due: " << formatDate(state->due_date) << "\n";
    }
}

int chooseCard(const FlashcardCatalog& catalog, const std::string& user, std::vector<Flashcard>& cards) {
    cards = catalog.cardsOf(user);
    if (cards.empty()) {
        std::cout << "No flashcards available.\n";
        return -1;
    }
    for (size_t i = 0; i < cards.size(); ++i)
        std::cout << i + 1 << ". " << cards[i].front << "\n";
    std::cout << "Choose card number: ";

    int sel = readMenuChoice();
    if (sel < 1 || (size_t)sel > cards.size()) {
        std::cout << "Invalid selection.\n";
        return -1;
    }
    return sel - 1;
}

void reviewDue(ReviewQueueBuilder& queueBuilder, ReviewSubmissionHandler& handler,
    const FlashcardCatalog& catalog, const StateStore& store, const Scheduler& scheduler,
    ReviewSession& session)
{
    ReviewQueue queue = queueBuilder.buildQueue(session.user_id, std::time(nullptr));
    if (queue.items.empty()) {
        std::cout << "No cards due.\n";
        return;
    }
    printStats(queue.stats);

    for (const auto& item : queue.items) {
        auto card = catalog.find(item.flashcard_id);
        if (!card) continue;

        std::cout << "\n[" << toString(item.maturity);
        if (item.days_overdue > 0) std::cout << ", " << item.days_overdue << "d overdue";
        std::cout << "]\nQ: " << card->front << "\n(press Enter to reveal)";
        std::string dummy; std::getline(std::cin, dummy);
        std::cout << "A: " << card->back << "\n";

        auto state = store.load(session.user_id, item.flashcard_id);
        IntervalPreview preview = state ? scheduler.previewIntervals(*state) : IntervalPreview{};
        std::optional<Rating> answer = askRating(preview);
        if (!answer) {
            spdlog::info("Input ended before card {} was rated; review skipped", item.flashcard_id);
            break;
        }
        Rating rating = *answer;

        try {
            ReviewOutcome outcome = handler.submitReview(session.user_id, item.flashcard_id, rating, std::time(nullptr));
            session.record(rating);
            std::cout << "Next review in " << formatInterval(outcome.response.new_interval_days)
                << " (" << formatDate(outcome.response.new_due_date) << ")\n";
        }
        catch (const SchedulingError& e) {
            std::cout << "Review not saved: " << e.what()
                << (e.transient() ? " (try again)" : "") << "\n";
        }

        if (std::cin.eof()) break;
    }

    std::cout << "\nSession: " << session.reviewed << " reviewed, "
        << static_cast<int>(session.accuracy() * 100.0 + 0.5) << "% correct, best streak "
        << session.best_streak << "\n";
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    EngineConfig config;
    const char* configPath = std::getenv("CADENCE_CONFIG");
    if (!EngineConfig::loadFile(configPath ? configPath : "cadence.conf", config)) {
        std::cerr << "Failed to read configuration\n";
        return 1;
    }

    Log::init(config.log_file, config.log_level);

    // LOGIN
    std::string username, passphrase;
    std::cout << "\n===== CADENCE =====\n";
    std::cout << "Username: "; std::getline(std::cin, username);
    std::cout << "Passphrase: "; std::getline(std::cin, passphrase);
    if (username.empty() || passphrase.empty()) {
        std::cout << "Empty fields.\n";
        return 1;
    }

    std::vector<unsigned char> salt, key;
    if (!Storage::loadOrCreateSalt(saltFileFor(config, username), salt) ||
        !Storage::deriveKey(passphrase, salt, key))
    {
        std::cout << "Could not derive storage key.\n";
        return 1;
    }
    sodium_memzero(&passphrase[0], passphrase.size());

    std::unique_ptr<FileStateStore> store;
    try {
        store = std::make_unique<FileStateStore>(stateFileFor(config, username), key);
    }
    catch (const PersistenceError& e) {
        std::cout << "Cannot open your data (wrong passphrase?): " << e.what() << "\n";
        Storage::wipeKey(key);
        return 1;
    }

    FlashcardCatalog catalog(store.get(), config.policy.initial_ease);
    std::string cardsPlain;
    if (!Storage::readEncrypted(cardsPlain, cardFileFor(config, username), key) ||
        !catalog.deserialize(cardsPlain))
    {
        std::cout << "Cannot open your flashcards.\n";
        Storage::wipeKey(key);
        return 1;
    }

    Scheduler scheduler(config.policy);
    Classifier classifier;

    auto dispatcher = std::make_shared<EventDispatcher>();
    dispatcher->addSink(std::make_shared<LoggingEventSink>());

    ReviewQueueBuilder queueBuilder(store.get(), classifier, config.queue_max_size);
    ReviewSubmissionHandler handler(store.get(), &catalog, dispatcher.get(),
        scheduler, classifier, config.submit_max_attempts);

    ReviewSession session;
    session.user_id = username;
    session.started_at = std::time(nullptr);

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "User: " << username << "\n"
            "1. Add Flashcard\n"
            "2. Review Due Cards\n"
            "3. Queue Overview\n"
            "4. List All Flashcards\n"
            "5. Delete Flashcard\n"
            "6. Daily Goal\n"
            "7. Save & Exit\n> ";

        int choice = readMenuChoice();
        if (choice < 0) choice = 7;

        if (choice == 1) {
            std::string front, back;
            std::cout << "Front: "; std::getline(std::cin, front);
            std::cout << "Back: "; std::getline(std::cin, back);
            try {
                catalog.create(username, front, back, std::time(nullptr));
                saveCatalog(catalog, cardFileFor(config, username), key);
                std::cout << "Flashcard added.\n";
            }
            catch (const SchedulingError& e) {
                std::cout << "Not added: " << e.what() << "\n";
            }
        }

        else if (choice == 2) {
            reviewDue(queueBuilder, handler, catalog, *store, scheduler, session);
        }

        else if (choice == 3) {
            ReviewQueue queue = queueBuilder.buildQueue(username, std::time(nullptr));
            printStats(queue.stats);
            for (const auto& item : queue.items) {
                auto card = catalog.find(item.flashcard_id);
                std::cout << " - " << (card ? card->front : item.flashcard_id)
                    << " [" << toString(item.maturity) << ", overdue " << item.days_overdue
                    << "d, retention " << static_cast<int>(item.estimated_retention * 100.0 + 0.5) << "%]\n";
            }
        }

        else if (choice == 4) {
            listCards(catalog, *store, classifier, username, std::time(nullptr));
        }

        else if (choice == 5) {
            std::vector<Flashcard> cards;
            int idx = chooseCard(catalog, username, cards);
            if (idx < 0) continue;
            try {
                if (catalog.remove(username, cards[idx].id)) {
                    saveCatalog(catalog, cardFileFor(config, username), key);
                    std::cout << "Deleted.\n";
                }
                else {
                    std::cout << "Not found.\n";
                }
            }
            catch (const SchedulingError& e) {
                std::cout << "Not deleted: " << e.what() << "\n";
            }
        }

        else if (choice == 6) {
            std::cout << "Minutes available per day: ";
            int minutes = readMenuChoice();
            std::cout << "You can review about " << dailyReviewGoal(minutes, config.seconds_per_card)
                << " cards per day.\n";
        }

        else if (choice == 7) {
            saveCatalog(catalog, cardFileFor(config, username), key);
            dispatcher->flush();
            Storage::wipeKey(key);
            std::cout << "Goodbye!\n";
            break;
        }

        else {
            std::cout << "Invalid.\n";
        }
    }

    return 0;
}
