#pragma once

#include <dcsim/core/entities.hpp>
#include <dcsim/core/entity_table.hpp>
#include <dcsim/core/types.hpp>

#include <span>
#include <string>
#include <vector>

namespace dcsim::core {

/// @brief Entity arenas of a simulation and the bookkeeping guarding them.
///
/// Every entity lives in a flat arena keyed by its id; relations (VM to
/// PM, workload to VM, replica to deployment) are id fields resolved
/// through the arenas. The capacity mutators below are the only way to
/// change PM or VM usage and they enforce the resource invariant: a
/// mutation that would overcommit throws InvariantViolation and leaves
/// every entity untouched.
///
/// @see Simulation
/// @ingroup core_entities
class Datacenter {
public:
    Datacenter() = default;

    Datacenter(const Datacenter&) = delete;
    Datacenter& operator=(const Datacenter&) = delete;

    /// @brief Add a physical machine to the pool.
    PmId add_pm(std::string name, Resources capacity);

    /// @brief All PMs, indexed by PmId::value.
    [[nodiscard]] std::span<const PhysicalMachine> pms() const noexcept { return pms_; }

    /// @throws OutOfRangeError if @p id does not name a PM.
    [[nodiscard]] const PhysicalMachine& pm(PmId id) const;

    [[nodiscard]] EntityTable<Request, RequestId>& requests() noexcept { return requests_; }
    [[nodiscard]] const EntityTable<Request, RequestId>& requests() const noexcept { return requests_; }
    [[nodiscard]] EntityTable<VirtualMachine, VmId>& vms() noexcept { return vms_; }
    [[nodiscard]] const EntityTable<VirtualMachine, VmId>& vms() const noexcept { return vms_; }
    [[nodiscard]] EntityTable<Workload, WorkloadId>& workloads() noexcept { return workloads_; }
    [[nodiscard]] const EntityTable<Workload, WorkloadId>& workloads() const noexcept { return workloads_; }
    [[nodiscard]] EntityTable<Deployment, DeploymentId>& deployments() noexcept { return deployments_; }
    [[nodiscard]] const EntityTable<Deployment, DeploymentId>& deployments() const noexcept { return deployments_; }
    [[nodiscard]] EntityTable<Action, ActionId>& actions() noexcept { return actions_; }
    [[nodiscard]] const EntityTable<Action, ActionId>& actions() const noexcept { return actions_; }

    /// @brief Create a workload on @p host and record it on the VM.
    /// @throws OutOfRangeError if @p host does not exist.
    Workload& add_workload(WorkloadId id, Workload workload);

    // -- PM capacity -----------------------------------------------------------

    /// @brief Hold @p pm capacity for an admitted VM until it is bound.
    /// @throws InvariantViolation if the VM is not Unallocated, already holds
    ///         a reservation, or does not fit in the PM's available capacity.
    void reserve_placement(VmId vm, PmId pm);

    /// @brief Drop the VM's reservation, if any.
    void release_reservation(VmId vm);

    /// @brief Bind an Unallocated VM to @p pm.
    ///
    /// A reservation held on @p pm is converted into an allocation; a
    /// reservation held elsewhere is released first.
    ///
    /// @throws InvariantViolation if the VM is not Unallocated or the PM
    ///         lacks capacity.
    void bind_vm(VmId vm, PmId pm);

    /// @brief Unbind an Allocated VM and mark it Deallocated.
    /// @throws InvariantViolation if the VM is not Allocated.
    void unbind_vm(VmId vm);

    // -- VM capacity -----------------------------------------------------------

    /// @brief Part of the VM's demand not used by running workloads.
    [[nodiscard]] Resources vm_free(VmId vm) const;

    /// @brief Mark a workload Running and consume its demand on its VM.
    /// @throws InvariantViolation if the workload is not Stopped, its VM
    ///         is not Allocated, or the demand does not fit.
    void start_workload(WorkloadId id);

    /// @brief Mark a workload Stopped and give its demand back to its VM.
    /// @throws InvariantViolation if the workload is not Running.
    void stop_workload(WorkloadId id);

    /// @brief True if no workload runs on the VM.
    [[nodiscard]] bool vm_idle(VmId vm) const;

private:
    PhysicalMachine& pm_mut(PmId id);

    std::vector<PhysicalMachine> pms_;
    EntityTable<Request, RequestId> requests_{"request"};
    EntityTable<VirtualMachine, VmId> vms_{"vm"};
    EntityTable<Workload, WorkloadId> workloads_{"workload"};
    EntityTable<Deployment, DeploymentId> deployments_{"deployment"};
    EntityTable<Action, ActionId> actions_{"action"};
};

} // namespace dcsim::core
