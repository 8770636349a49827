#include "FileStateStore.hpp"
#include "Storage.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

FileStateStore::FileStateStore(const std::string& file, const std::vector<unsigned char>& k)
    : filename(file), key(k)
{
    std::string plain;
    if (!Storage::readEncrypted(plain, filename, key)) {
        Storage::wipeKey(key);
        throw PersistenceError("cannot open state file '" + filename + "'");
    }

    std::vector<SchedulingState> loaded;
    if (!Storage::parseStates(plain, loaded)) {
        Storage::wipeKey(key);
        throw PersistenceError("state file '" + filename + "' is corrupted");
    }

    for (const auto& s : loaded) rows.restore(s);
    spdlog::info("FileStateStore opened '{}' with {} rows", filename, loaded.size());
}

FileStateStore::~FileStateStore() {
    Storage::wipeKey(key);
}

std::optional<SchedulingState> FileStateStore::load(const std::string& userId,
    const std::string& flashcardId) const
{
    return rows.load(userId, flashcardId);
}

std::vector<SchedulingState> FileStateStore::loadDue(const std::string& userId, std::time_t now) const {
    return rows.loadDue(userId, now);
}

std::vector<SchedulingState> FileStateStore::loadAll(const std::string& userId) const {
    return rows.loadAll(userId);
}

bool FileStateStore::compareAndSwap(std::uint64_t expectedVersion, SchedulingState& next) {
    std::lock_guard<std::mutex> lock(write_mutex);

    auto current = rows.load(next.user_id, next.flashcard_id);
    std::uint64_t stored = current ? current->version : 0;
    if (stored != expectedVersion) {
        spdlog::debug("CAS rejected for card {} (user {}): expected v{} found v{}",
            next.flashcard_id, next.user_id, expectedVersion, stored);
        return false;
    }

    SchedulingState staged = next;
    staged.version = expectedVersion + 1;
    if (!flushWith(staged)) {
        throw PersistenceError("failed to persist review of card '" + next.flashcard_id + "'");
    }

    rows.restore(staged);
    next.version = staged.version;
    return true;
}

bool FileStateStore::insert(SchedulingState& initial) {
    std::lock_guard<std::mutex> lock(write_mutex);

    if (rows.load(initial.user_id, initial.flashcard_id)) {
        spdlog::warn("State for card {} (user {}) already exists; insert ignored",
            initial.flashcard_id, initial.user_id);
        return false;
    }

    SchedulingState staged = initial;
    staged.version = 1;
    if (!flushWith(staged)) {
        throw PersistenceError("failed to persist new card '" + initial.flashcard_id + "'");
    }

    rows.restore(staged);
    initial.version = staged.version;
    return true;
}

bool FileStateStore::remove(const std::string& userId, const std::string& flashcardId) {
    std::lock_guard<std::mutex> lock(write_mutex);

    if (!rows.load(userId, flashcardId)) return false;

    if (!flushWithout(userId, flashcardId)) {
        throw PersistenceError("failed to persist removal of card '" + flashcardId + "'");
    }

    rows.erase(userId, flashcardId);
    return true;
}

/* --- Staged writes: the file is written first, memory is updated only on success --- */

bool FileStateStore::flushWith(const SchedulingState& staged) {
    auto all = rows.snapshot();
    bool replaced = false;
    for (auto& s : all) {
        if (s.user_id == staged.user_id && s.flashcard_id == staged.flashcard_id) {
            s = staged;
            replaced = true;
        }
    }
    if (!replaced) all.push_back(staged);
    return write(all);
}

bool FileStateStore::flushWithout(const std::string& userId, const std::string& flashcardId) {
    auto all = rows.snapshot();
    all.erase(std::remove_if(all.begin(), all.end(), [&](const SchedulingState& s) {
        return s.user_id == userId && s.flashcard_id == flashcardId;
    }), all.end());
    return write(all);
}

bool FileStateStore::write(const std::vector<SchedulingState>& all) {
    spdlog::debug("Flushing {} state rows to '{}'", all.size(), filename);
    if (!Storage::writeEncrypted(Storage::serializeStates(all), filename, key)) {
        spdlog::error("Failed to write state file '{}'; in-memory rows left unchanged", filename);
        return false;
    }
    return true;
}
