#pragma once

#include <stdexcept>
#include <string>

namespace dcsim::core {

/// @brief Base exception for all simulation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch simulation-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @see SchedulingFault, InvariantViolation, SubscriberFault, KernelFault
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, running a kernel that has already aborted, or dispatching
/// a request while no allocator is installed.
///
/// @ingroup core
class InvalidStateError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when an id or index does not name an existing entity.
/// @ingroup core
class OutOfRangeError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when an argument is malformed (e.g. a bad topic pattern).
/// @ingroup core
class InvalidArgumentError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief An event could not be scheduled.
///
/// Recoverable: the queue is left untouched and the run continues.
///
/// @see InvalidTimeError
/// @ingroup core
class SchedulingFault : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Attempt to schedule an event before the current virtual time.
///
/// Raised by Kernel::schedule() when `when < now()`.
///
/// @see Kernel::schedule
/// @ingroup core
class InvalidTimeError : public SchedulingFault {
public:
    using SchedulingFault::SchedulingFault;
};

/// @brief A domain invariant would be broken by a mutation.
///
/// PM over-allocation, a second accept/reject of a terminal request, or an
/// entity transition from an invalid source state. The offending mutation
/// is discarded and the entity keeps its last valid state.
///
/// @ingroup core
class InvariantViolation : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief A subscriber failed while handling an event.
///
/// Isolated by the EventBus: dispatch continues to the remaining
/// subscribers and the fault is recorded.
///
/// @ingroup core
class SubscriberFault : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Unrecoverable kernel-level failure.
///
/// Never swallowed by the EventBus. The kernel stops immediately and
/// transitions to KernelState::Aborted, keeping partial state and the
/// event log for inspection.
///
/// @ingroup core
class KernelFault : public SimulationError {
public:
    using SimulationError::SimulationError;
};

} // namespace dcsim::core
