#pragma once
#include <stdexcept>
#include <string>

// Base of every error the scheduling engine raises.
// transient() == true means the caller may retry the whole operation.
class SchedulingError : public std::runtime_error {
public:
    SchedulingError(const std::string& what, bool transient)
        : std::runtime_error(what), is_transient(transient) {}

    bool transient() const noexcept { return is_transient; }

private:
    bool is_transient;
};

// Malformed rating or missing required field.
class ValidationError : public SchedulingError {
public:
    explicit ValidationError(const std::string& what) : SchedulingError(what, false) {}
};

// Flashcard does not exist or belongs to another user.
class NotFoundOrForbiddenError : public SchedulingError {
public:
    explicit NotFoundOrForbiddenError(const std::string& what) : SchedulingError(what, false) {}
};

// Optimistic-lock mismatch after the retry budget ran out.
class ConcurrencyConflictError : public SchedulingError {
public:
    explicit ConcurrencyConflictError(const std::string& what) : SchedulingError(what, true) {}
};

// Underlying storage failed; nothing was applied.
class PersistenceError : public SchedulingError {
public:
    explicit PersistenceError(const std::string& what) : SchedulingError(what, true) {}
};

// A stored state violates its invariants (negative interval, ease below floor, ...).
class InvalidStateError : public SchedulingError {
public:
    explicit InvalidStateError(const std::string& what) : SchedulingError(what, false) {}
};
