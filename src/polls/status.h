#pragma once

#include <optional>
#include <utility>

namespace polls {

/**
 * Outcome of an engine operation
 *
 * Every failing guard has its own value; a failed operation never changes
 * poll state.
 */
enum class Status {
    Ok,

    // Validation
    InvalidTitle,
    InvalidOptionCount,
    InvalidOptionLabel,
    InvalidWindow,
    InvalidOption,
    InvalidBallot,

    // Lookup
    PollNotFound,

    // State guards
    VotingNotOpen,
    VotingStillOpen,
    AlreadyFinalized,
    FinalizationAlreadyPending,
    AlreadyVoted,

    // Authorization
    Unauthorized,

    // Oracle protocol
    UnknownRequest,
    ResultShapeMismatch,
    OracleUnavailable,

    // Availability
    ResultsNotAvailable
};

/**
 * Convert Status to a human-readable message
 */
const char* status_to_string(Status status);

/**
 * Status plus a value on success
 */
template <typename T>
class Result {
public:
    Result(T value) : status_(Status::Ok), value_(std::move(value)) {}
    Result(Status status) : status_(status) {}

    [[nodiscard]] bool ok() const { return status_ == Status::Ok; }
    [[nodiscard]] Status status() const { return status_; }

    /**
     * Throws std::bad_optional_access if !ok()
     */
    [[nodiscard]] const T& value() const { return value_.value(); }
    [[nodiscard]] T& value() { return value_.value(); }

    const T& operator*() const { return *value_; }
    const T* operator->() const { return &*value_; }

private:
    Status status_;
    std::optional<T> value_;
};

} // namespace polls
