#pragma once
#include <map>
#include <shared_mutex>
#include <unordered_map>
#include "StateStore.hpp"

// Thread-safe in-memory rows. Readers take a shared lock only long enough to copy.
class MemoryStateStore : public StateStore {
public:
    MemoryStateStore() = default;

    std::optional<SchedulingState> load(const std::string& userId,
        const std::string& flashcardId) const override;
    std::vector<SchedulingState> loadDue(const std::string& userId, std::time_t now) const override;
    std::vector<SchedulingState> loadAll(const std::string& userId) const override;

    bool compareAndSwap(std::uint64_t expectedVersion, SchedulingState& next) override;
    bool insert(SchedulingState& initial) override;
    bool remove(const std::string& userId, const std::string& flashcardId) override;

    // Every row of every user; used by the file store when writing to disk.
    std::vector<SchedulingState> snapshot() const;

    // Unconditional write of a row the file store has already persisted.
    void restore(const SchedulingState& state);
    void erase(const std::string& userId, const std::string& flashcardId);
    void clear();

    std::size_t size() const;

private:
    using CardRows = std::map<std::string, SchedulingState>;

    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, CardRows> rows_by_user;
};
