#pragma once

#include <dcsim/core/event.hpp>
#include <dcsim/core/subscriber.hpp>

#include <string_view>

namespace dcsim::core {

class Simulation;

/// @brief Admission lifecycle of requests.
///
/// Handles `request.arrive`, `request.accept`, `request.reject` and
/// `request.stop`:
///   - arrive records the Request and its VM, consults the admission policy
///     and the allocator, holds capacity on the chosen PM, then fires
///     accept or reject;
///   - accept and reject are applied at most once per request; any further
///     attempt raises InvariantViolation and is discarded;
///   - accept creates the request's workloads and fires `vm.allocate`
///     followed by their `*.start`;
///   - rejecting a required request is a KernelFault;
///   - stop is only valid from Accepted; it stops the running workloads and
///     releases the VM.
///
/// @ingroup core_lifecycle
class RequestLifecycle : public Subscriber {
public:
    explicit RequestLifecycle(Simulation& simulation) : sim_(simulation) {}

    void handle(const Event& event) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "request-lifecycle"; }

private:
    void on_arrive(const RequestArrival& arrival);
    void on_accept(const RequestNotice& notice);
    void on_reject(const RequestNotice& notice);
    void on_stop(const RequestNotice& notice);

    Simulation& sim_;
};

/// @brief VM placement bookkeeping.
///
/// On `vm.allocate` the VM is bound to the PM carried by the event, or to
/// the one picked by the allocator. The binding is checked against the
/// resource invariant before it is committed; a rejected or missing
/// placement leaves the VM Unallocated and, if its request is still
/// undecided, fires `request.reject`. On `vm.deallocate` the VM is unbound
/// and the workloads still running on it are stopped.
///
/// @ingroup core_lifecycle
class VmLifecycle : public Subscriber {
public:
    explicit VmLifecycle(Simulation& simulation) : sim_(simulation) {}

    void handle(const Event& event) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "vm-lifecycle"; }

private:
    void on_allocate(const VmNotice& notice);
    void on_deallocate(const VmNotice& notice);

    Simulation& sim_;
};

/// @brief Start/stop transitions of apps, containers and controllers.
///
/// A start requires a Stopped workload on an Allocated VM with enough free
/// capacity; a stop requires a Running workload. A workload with a run
/// time schedules its own stop; such a stop is dropped if the workload was
/// stopped or restarted before it fires.
///
/// @ingroup core_lifecycle
class WorkloadLifecycle : public Subscriber {
public:
    explicit WorkloadLifecycle(Simulation& simulation) : sim_(simulation) {}

    void handle(const Event& event) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "workload-lifecycle"; }

private:
    void on_start(const Event& event, const WorkloadNotice& notice);
    void on_stop(const Event& event, const WorkloadNotice& notice);

    Simulation& sim_;
};

/// @brief Sequences the steps of actions.
///
/// Each `action.execute` runs one step through the installed
/// ActionInterpreter. The next step is scheduled before the current one is
/// interpreted, so a failing step does not stop the script.
///
/// @ingroup core_lifecycle
class ActionRunner : public Subscriber {
public:
    explicit ActionRunner(Simulation& simulation) : sim_(simulation) {}

    void handle(const Event& event) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "action-runner"; }

private:
    Simulation& sim_;
};

} // namespace dcsim::core
