#include <dcsim/core/datacenter.hpp>
#include <dcsim/core/error.hpp>

#include <algorithm>
#include <utility>

namespace dcsim::core {

namespace {

std::string describe(const Resources& r) {
    return "{cpu=" + std::to_string(r.cpu) + ", ram=" + std::to_string(r.ram) +
           ", gpu=" + std::to_string(r.gpu) + "}";
}

} // namespace

PmId Datacenter::add_pm(std::string name, Resources capacity) {
    PmId id{pms_.size()};
    PhysicalMachine pm;
    pm.id = id;
    pm.name = std::move(name);
    pm.capacity = capacity;
    pms_.push_back(std::move(pm));
    return id;
}

const PhysicalMachine& Datacenter::pm(PmId id) const {
    if (id.value >= pms_.size()) {
        throw OutOfRangeError("pm id " + std::to_string(id.value) + " out of range");
    }
    return pms_[id.value];
}

PhysicalMachine& Datacenter::pm_mut(PmId id) {
    if (id.value >= pms_.size()) {
        throw OutOfRangeError("pm id " + std::to_string(id.value) + " out of range");
    }
    return pms_[id.value];
}

Workload& Datacenter::add_workload(WorkloadId id, Workload workload) {
    auto& vm = vms_.at(workload.host);
    workload.id = id;
    auto& created = workloads_.emplace(id, std::move(workload));
    vm.workloads.push_back(id);
    return created;
}

// =============================================================================
// PM capacity
// =============================================================================

void Datacenter::reserve_placement(VmId vm_id, PmId pm_id) {
    auto& vm = vms_.at(vm_id);
    auto& pm = pm_mut(pm_id);

    if (vm.status != VmStatus::Unallocated) {
        throw InvariantViolation("vm " + std::to_string(vm_id.value) + " is " +
                                 std::string(to_string(vm.status)) + ", cannot reserve");
    }
    if (vm.reservation) {
        throw InvariantViolation("vm " + std::to_string(vm_id.value) + " already holds a reservation");
    }
    if (!vm.demand.fits_in(pm.available())) {
        throw InvariantViolation("vm " + std::to_string(vm_id.value) + " demand " +
                                 describe(vm.demand) + " exceeds available capacity " +
                                 describe(pm.available()) + " of pm '" + pm.name + "'");
    }

    pm.reserved += vm.demand;
    vm.reservation = pm_id;
}

void Datacenter::release_reservation(VmId vm_id) {
    auto& vm = vms_.at(vm_id);
    if (!vm.reservation) {
        return;
    }
    pm_mut(*vm.reservation).reserved -= vm.demand;
    vm.reservation.reset();
}

void Datacenter::bind_vm(VmId vm_id, PmId pm_id) {
    auto& vm = vms_.at(vm_id);
    auto& pm = pm_mut(pm_id);

    if (vm.status != VmStatus::Unallocated) {
        throw InvariantViolation("vm " + std::to_string(vm_id.value) + " is " +
                                 std::string(to_string(vm.status)) + ", cannot allocate");
    }

    // A reservation on the target PM is already counted in its usage
    Resources headroom = pm.available();
    if (vm.reservation == pm_id) {
        headroom += vm.demand;
    }
    if (!vm.demand.fits_in(headroom)) {
        throw InvariantViolation("vm " + std::to_string(vm_id.value) + " demand " +
                                 describe(vm.demand) + " exceeds available capacity " +
                                 describe(headroom) + " of pm '" + pm.name + "'");
    }

    release_reservation(vm_id);
    pm.allocated += vm.demand;
    pm.hosted_vms.insert(vm_id);
    vm.host = pm_id;
    vm.status = VmStatus::Allocated;
}

void Datacenter::unbind_vm(VmId vm_id) {
    auto& vm = vms_.at(vm_id);
    if (vm.status != VmStatus::Allocated || !vm.host) {
        throw InvariantViolation("vm " + std::to_string(vm_id.value) + " is " +
                                 std::string(to_string(vm.status)) + ", cannot deallocate");
    }

    auto& pm = pm_mut(*vm.host);
    pm.allocated -= vm.demand;
    pm.hosted_vms.erase(vm_id);
    vm.host.reset();
    vm.status = VmStatus::Deallocated;
}

// =============================================================================
// VM capacity
// =============================================================================

Resources Datacenter::vm_free(VmId vm_id) const {
    const auto& vm = vms_.at(vm_id);
    return vm.demand - vm.used;
}

void Datacenter::start_workload(WorkloadId id) {
    auto& workload = workloads_.at(id);
    auto& vm = vms_.at(workload.host);

    if (workload.status != WorkloadStatus::Stopped) {
        throw InvariantViolation(std::string(to_string(workload.kind)) + " '" + workload.name +
                                 "' is already running");
    }
    if (vm.status != VmStatus::Allocated) {
        throw InvariantViolation(std::string(to_string(workload.kind)) + " '" + workload.name +
                                 "' cannot start: vm " + std::to_string(vm.id.value) + " is " +
                                 std::string(to_string(vm.status)));
    }
    if (!workload.demand.fits_in(vm.demand - vm.used)) {
        throw InvariantViolation(std::string(to_string(workload.kind)) + " '" + workload.name +
                                 "' demand " + describe(workload.demand) +
                                 " exceeds free capacity " + describe(vm.demand - vm.used) +
                                 " of vm " + std::to_string(vm.id.value));
    }

    vm.used += workload.demand;
    workload.status = WorkloadStatus::Running;
    ++workload.generation;
    ++workload.starts;
}

void Datacenter::stop_workload(WorkloadId id) {
    auto& workload = workloads_.at(id);
    if (workload.status != WorkloadStatus::Running) {
        throw InvariantViolation(std::string(to_string(workload.kind)) + " '" + workload.name +
                                 "' is not running");
    }

    vms_.at(workload.host).used -= workload.demand;
    workload.status = WorkloadStatus::Stopped;
}

bool Datacenter::vm_idle(VmId vm_id) const {
    const auto& vm = vms_.at(vm_id);
    return std::none_of(vm.workloads.begin(), vm.workloads.end(), [this](WorkloadId id) {
        return workloads_.at(id).status == WorkloadStatus::Running;
    });
}

} // namespace dcsim::core
