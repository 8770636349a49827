#include "MemoryStateStore.hpp"
#include <mutex>
#include <spdlog/spdlog.h>

std::optional<SchedulingState> MemoryStateStore::load(const std::string& userId,
    const std::string& flashcardId) const
{
    std::shared_lock<std::shared_mutex> lock(mutex);

    auto user = rows_by_user.find(userId);
    if (user == rows_by_user.end()) return std::nullopt;

    auto row = user->second.find(flashcardId);
    if (row == user->second.end()) return std::nullopt;
    return row->second;
}

std::vector<SchedulingState> MemoryStateStore::loadDue(const std::string& userId, std::time_t now) const {
    std::vector<SchedulingState> due;
    std::shared_lock<std::shared_mutex> lock(mutex);

    auto user = rows_by_user.find(userId);
    if (user == rows_by_user.end()) return due;

    for (const auto& p : user->second) {
        if (p.second.isDue(now)) due.push_back(p.second);
    }
    return due;
}

std::vector<SchedulingState> MemoryStateStore::loadAll(const std::string& userId) const {
    std::vector<SchedulingState> all;
    std::shared_lock<std::shared_mutex> lock(mutex);

    auto user = rows_by_user.find(userId);
    if (user == rows_by_user.end()) return all;

    all.reserve(user->second.size());
    for (const auto& p : user->second) all.push_back(p.second);
    return all;
}

bool MemoryStateStore::compareAndSwap(std::uint64_t expectedVersion, SchedulingState& next) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    CardRows& rows = rows_by_user[next.user_id];
    auto row = rows.find(next.flashcard_id);
    std::uint64_t stored = (row == rows.end()) ? 0 : row->second.version;

    if (stored != expectedVersion) {
        spdlog::debug("CAS rejected for card {} (user {}): expected v{} found v{}",
            next.flashcard_id, next.user_id, expectedVersion, stored);
        return false;
    }

    next.version = expectedVersion + 1;
    rows[next.flashcard_id] = next;
    return true;
}

bool MemoryStateStore::insert(SchedulingState& initial) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    CardRows& rows = rows_by_user[initial.user_id];
    if (rows.count(initial.flashcard_id)) {
        spdlog::warn("State for card {} (user {}) already exists; insert ignored",
            initial.flashcard_id, initial.user_id);
        return false;
    }

    initial.version = 1;
    rows.emplace(initial.flashcard_id, initial);
    return true;
}

bool MemoryStateStore::remove(const std::string& userId, const std::string& flashcardId) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    auto user = rows_by_user.find(userId);
    if (user == rows_by_user.end()) return false;
    return user->second.erase(flashcardId) > 0;
}

std::vector<SchedulingState> MemoryStateStore::snapshot() const {
    std::vector<SchedulingState> all;
    std::shared_lock<std::shared_mutex> lock(mutex);

    for (const auto& user : rows_by_user) {
        for (const auto& p : user.second) all.push_back(p.second);
    }
    return all;
}

void MemoryStateStore::restore(const SchedulingState& state) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    rows_by_user[state.user_id][state.flashcard_id] = state;
}

void MemoryStateStore::erase(const std::string& userId, const std::string& flashcardId) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto user = rows_by_user.find(userId);
    if (user != rows_by_user.end()) user->second.erase(flashcardId);
}

void MemoryStateStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex);
    rows_by_user.clear();
}

std::size_t MemoryStateStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    std::size_t n = 0;
    for (const auto& user : rows_by_user) n += user.second.size();
    return n;
}
