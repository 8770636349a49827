#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "../core/SchedulingState.hpp"

/*
  Persistence seam for SchedulingState rows, keyed by (user, flashcard).

  Writes are guarded by the row's version token:
    - compareAndSwap() commits only if the stored version still equals
      expectedVersion (0 means "row must not exist yet"). On success the
      committed version is written back into `next`.
    - a mismatch returns false and leaves storage untouched.
  Storage failures throw PersistenceError and are all-or-nothing.
*/
class StateStore {
public:
    virtual ~StateStore() = default;

    virtual std::optional<SchedulingState> load(const std::string& userId,
        const std::string& flashcardId) const = 0;

    // Rows with due_date <= now, copied out as a snapshot.
    virtual std::vector<SchedulingState> loadDue(const std::string& userId, std::time_t now) const = 0;
    virtual std::vector<SchedulingState> loadAll(const std::string& userId) const = 0;

    virtual bool compareAndSwap(std::uint64_t expectedVersion, SchedulingState& next) = 0;

    // Lifecycle hooks for the flashcard owner. insert() returns false if the row exists.
    virtual bool insert(SchedulingState& initial) = 0;
    virtual bool remove(const std::string& userId, const std::string& flashcardId) = 0;
};
