#pragma once

#include <dcsim/core/types.hpp>

#include <exception>
#include <string>
#include <string_view>

namespace dcsim::core {

/// @brief Category of a recorded fault.
/// @see Fault, classify_fault
/// @ingroup core
enum class FaultKind {
    SchedulingFault,     ///< Event scheduled into the past; rejected.
    InvariantViolation,  ///< Mutation discarded, entity kept its last valid state.
    SubscriberFault,     ///< Handler failed; dispatch went on.
    KernelFault          ///< Run aborted.
};

[[nodiscard]] std::string_view to_string(FaultKind kind) noexcept;

/// @brief A fault encountered during a run.
///
/// Faults are never thrown past the Kernel: they are appended to
/// Kernel::faults() and returned in every RunReport, including aborted ones.
///
/// @ingroup core
struct Fault {
    FaultKind kind;
    TimePoint time;       ///< Virtual time at which the fault occurred.
    std::string topic;    ///< Topic being dispatched, empty outside dispatch.
    std::string source;   ///< Subscriber or component that failed.
    std::string message;
};

/// @brief Map an exception caught during dispatch to a fault kind.
///
/// InvariantViolation, SchedulingFault and KernelFault keep their kind;
/// every other exception counts as a SubscriberFault.
[[nodiscard]] FaultKind classify_fault(const std::exception& error) noexcept;

} // namespace dcsim::core
