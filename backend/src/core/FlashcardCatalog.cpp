#include "FlashcardCatalog.hpp"
#include "Errors.hpp"
#include <chrono>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

// Single-line storage form: newlines and backslashes are escaped.
static std::string escapeLine(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\\') out += "\\\\";
        else if (c == '\n') out += "\\n";
        else out += c;
    }
    return out;
}

static std::string unescapeLine(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            char n = s[++i];
            out += (n == 'n') ? '\n' : n;
        }
        else {
            out += s[i];
        }
    }
    return out;
}

FlashcardCatalog::FlashcardCatalog(StateStore* stateStore, double initialEase)
    : store(stateStore), initial_ease(initialEase)
{
}

Flashcard FlashcardCatalog::create(const std::string& owner, const std::string& front,
    const std::string& back, std::time_t now)
{
    if (owner.empty() || front.empty()) {
        spdlog::warn("Flashcard creation rejected: owner and front are required");
        throw ValidationError("owner and front are required");
    }

    Flashcard card;
    card.id = generateID();
    card.owner = owner;
    card.front = front;
    card.back = back;
    card.created_at = now;

    std::unique_lock<std::shared_mutex> lock(mutex);

    SchedulingState initial = SchedulingState::initial(owner, card.id, now, initial_ease);
    if (store) store->insert(initial);

    cards.emplace(card.id, card);
    spdlog::info("Created flashcard: ID={}, owner={}", card.id, owner);
    return card;
}

bool FlashcardCatalog::remove(const std::string& owner, const std::string& flashcardId) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    auto it = cards.find(flashcardId);
    if (it == cards.end() || it->second.owner != owner) {
        spdlog::warn("Remove of card {} by {} refused: not found or not owned", flashcardId, owner);
        return false;
    }

    // Cascade first: if the state row cannot be deleted the card stays.
    if (store) store->remove(owner, flashcardId);
    cards.erase(it);

    spdlog::info("Removed flashcard: ID={}, owner={}", flashcardId, owner);
    return true;
}

bool FlashcardCatalog::isOwnedBy(const std::string& userId, const std::string& flashcardId) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = cards.find(flashcardId);
    return it != cards.end() && it->second.owner == userId;
}

std::optional<Flashcard> FlashcardCatalog::find(const std::string& flashcardId) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = cards.find(flashcardId);
    if (it == cards.end()) return std::nullopt;
    return it->second;
}

std::vector<Flashcard> FlashcardCatalog::cardsOf(const std::string& owner) const {
    std::vector<Flashcard> out;
    std::shared_lock<std::shared_mutex> lock(mutex);
    for (const auto& p : cards) {
        if (p.second.owner == owner) out.push_back(p.second);
    }
    return out;
}

std::string FlashcardCatalog::serialize() const {
    std::ostringstream oss;
    std::shared_lock<std::shared_mutex> lock(mutex);

    for (const auto& p : cards) {
        const Flashcard& c = p.second;
        oss << c.id << "\n"
            << escapeLine(c.owner) << "\n"
            << escapeLine(c.front) << "\n"
            << escapeLine(c.back) << "\n"
            << c.created_at << "\n"
            << "---\n";
    }
    return oss.str();
}

bool FlashcardCatalog::deserialize(const std::string& data) {
    std::istringstream iss(data);
    std::map<std::string, Flashcard> loaded;
    std::string line;

    while (std::getline(iss, line)) {
        if (line.empty()) continue;

        Flashcard c;
        c.id = line;
        std::string owner, front, back, created, sep;
        if (!std::getline(iss, owner) || !std::getline(iss, front) ||
            !std::getline(iss, back) || !std::getline(iss, created) ||
            !std::getline(iss, sep) || sep != "---")
        {
            spdlog::error("Malformed catalog entry for card '{}'", c.id);
            return false;
        }

        c.owner = unescapeLine(owner);
        c.front = unescapeLine(front);
        c.back = unescapeLine(back);

        std::istringstream css(created);
        if (!(css >> c.created_at)) {
            spdlog::error("Bad creation time for card '{}'", c.id);
            return false;
        }
        loaded.emplace(c.id, c);
    }

    std::unique_lock<std::shared_mutex> lock(mutex);
    cards = std::move(loaded);
    spdlog::info("Loaded {} flashcards", cards.size());
    return true;
}

// Simple unique ID generator (timestamp + random bits)
std::string FlashcardCatalog::generateID() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count();

    static thread_local std::mt19937_64 eng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t randPart = dist(eng);

    std::stringstream ss;
    ss << std::hex << millis << "-" << std::setw(16) << std::setfill('0') << randPart;
    return ss.str();
}
