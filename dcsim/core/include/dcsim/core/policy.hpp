#pragma once

#include <dcsim/core/datacenter.hpp>
#include <dcsim/core/entities.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace dcsim::core {

class Simulation;

/// @brief Outcome of an admission decision.
/// @ingroup core_policies
struct AdmissionVerdict {
    bool admit{true};
    std::string reason;  ///< Why the request was refused.

    static AdmissionVerdict accept() { return AdmissionVerdict{true, {}}; }
    static AdmissionVerdict reject(std::string reason) {
        return AdmissionVerdict{false, std::move(reason)};
    }
};

/// @brief Gatekeeper consulted when a request arrives.
/// @ingroup core_policies
///
/// A refusal turns into `request.reject`. An admitted request still needs
/// a PM with room for its VM: the installed Allocator decides that, and a
/// request that cannot be placed is rejected too.
///
/// @see Simulation::set_admission_policy
class AdmissionPolicy {
public:
    virtual ~AdmissionPolicy() = default;

    /// @brief Decide whether @p request may proceed to placement.
    [[nodiscard]] virtual AdmissionVerdict evaluate(const Request& request,
                                                    const Datacenter& datacenter) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// @brief Gives meaning to action steps.
/// @ingroup core_policies
///
/// The kernel only sequences action steps; what a step does is up to the
/// installed interpreter, which may mutate entities through the Simulation
/// and schedule events on its kernel.
///
/// @see Simulation::set_action_interpreter, StepCommand
class ActionInterpreter {
public:
    virtual ~ActionInterpreter() = default;

    /// @brief Carry out step @p step of @p action.
    /// @throws any std::exception on failure; the failure is recorded as a
    ///         fault and the following steps still run.
    virtual void execute(const Action& action, std::size_t step, Simulation& simulation) = 0;
};

} // namespace dcsim::core
