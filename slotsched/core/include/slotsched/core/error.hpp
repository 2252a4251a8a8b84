#pragma once

#include <stdexcept>
#include <string>

namespace slotsched::core {

/// @brief Base exception for all scheduling errors.
///
/// All exceptions thrown by the core and algo libraries derive from this
/// class, allowing callers to catch scheduling-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// A task that cannot be fully placed is *not* an error; it is reported as
/// TaskStatus::Unschedulable in the result.
///
/// @see ValidationError, InvariantViolation
/// @ingroup core
class SchedulingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when the caller's input cannot be scheduled at all.
///
/// Raised before any slot is assigned: empty task set, non-positive
/// duration, due date before start date, malformed active period, empty
/// horizon. Never leaves a partial result behind.
///
/// @see slotsched::algo::validate
/// @ingroup core
class ValidationError : public SchedulingError {
public:
    using SchedulingError::SchedulingError;
};

/// @brief Thrown when an internal invariant is broken.
///
/// Indicates an implementation bug (a doubly booked slot, a slot held
/// outside its task's working period, a triage run that failed to reach a
/// fixpoint within its proven bound). It is never caught and corrected by
/// the library.
///
/// @see Board::verify
/// @ingroup core
class InvariantViolation : public SchedulingError {
public:
    using SchedulingError::SchedulingError;
};

} // namespace slotsched::core
