#include <dcsim/core/simulation.hpp>
#include <dcsim/core/error.hpp>

#include <unordered_set>
#include <utility>

namespace dcsim::core {

Simulation::Simulation()
    : deployments_(kernel_, datacenter_)
    , requests_(*this)
    , vms_(*this)
    , workloads_(*this)
    , actions_(*this) {
    kernel_.subscribe(TopicPattern::family("request"), requests_);
    kernel_.subscribe(TopicPattern::family("vm"), vms_);
    kernel_.subscribe(TopicPattern::family("app"), workloads_);
    kernel_.subscribe(TopicPattern::family("container"), workloads_);
    kernel_.subscribe(TopicPattern::family("controller"), workloads_);
    kernel_.subscribe(TopicKind::ActionExecute, actions_);
    kernel_.subscribe(TopicKind::ContainerStart, deployments_);
    kernel_.subscribe(TopicKind::ContainerStop, deployments_);
}

Simulation::~Simulation() = default;

PmId Simulation::add_pm(std::string name, Resources capacity) {
    return datacenter_.add_pm(std::move(name), capacity);
}

VmId Simulation::add_vm(std::string name, Resources demand) {
    VirtualMachine vm;
    vm.name = std::move(name);
    vm.demand = demand;
    VmId id = datacenter_.vms().reserve();
    vm.id = id;
    datacenter_.vms().emplace(id, std::move(vm));
    return id;
}

void Simulation::set_allocator(std::unique_ptr<Allocator> allocator) noexcept {
    allocator_ = std::move(allocator);
}

void Simulation::set_admission_policy(std::unique_ptr<AdmissionPolicy> policy) noexcept {
    admission_ = std::move(policy);
}

void Simulation::set_action_interpreter(std::unique_ptr<ActionInterpreter> interpreter) noexcept {
    interpreter_ = std::move(interpreter);
}

RequestHandle Simulation::reserve_request(std::size_t workloads) {
    RequestHandle handle;
    handle.request = datacenter_.requests().reserve();
    handle.vm = datacenter_.vms().reserve();
    handle.workloads.reserve(workloads);
    for (std::size_t i = 0; i < workloads; ++i) {
        handle.workloads.push_back(datacenter_.workloads().reserve());
    }
    return handle;
}

DeploymentId Simulation::reserve_deployment() {
    return datacenter_.deployments().reserve();
}

void Simulation::submit_request(TimePoint arrival, RequestArrival request) {
    if (request.request.value >= datacenter_.requests().capacity()) {
        throw OutOfRangeError("request id " + std::to_string(request.request.value) +
                              " was never reserved");
    }
    if (request.vm.value >= datacenter_.vms().capacity()) {
        throw OutOfRangeError("vm id " + std::to_string(request.vm.value) + " was never reserved");
    }
    std::unordered_set<WorkloadId> launch_ids;
    for (const auto& launch : request.launches) {
        if (launch.workload.value >= datacenter_.workloads().capacity()) {
            throw OutOfRangeError("workload id " + std::to_string(launch.workload.value) +
                                  " was never reserved");
        }
        if (claimed_workloads_.contains(launch.workload) ||
            datacenter_.workloads().contains(launch.workload) ||
            !launch_ids.insert(launch.workload).second) {
            throw InvariantViolation("workload id " + std::to_string(launch.workload.value) +
                                     " of request '" + request.name + "' is already in use");
        }
    }
    kernel_.schedule(TopicKind::RequestArrive, arrival, std::move(request));
    claimed_workloads_.insert(launch_ids.begin(), launch_ids.end());
}

ActionId Simulation::submit_action(TimePoint arrival, std::string name,
                                   std::vector<ActionStep> steps) {
    std::optional<TimePoint> first;
    if (!steps.empty()) {
        first = arrival + steps.front().delay;
        if (*first < kernel_.now()) {
            throw InvalidTimeError("action '" + name + "' would start in the past");
        }
    }

    Action action;
    action.name = std::move(name);
    action.arrival = arrival;
    action.steps = std::move(steps);
    ActionId id = datacenter_.actions().reserve();
    action.id = id;
    datacenter_.actions().emplace(id, std::move(action));

    if (first) {
        kernel_.schedule(TopicKind::ActionExecute, *first, ActionStepRef{id, 0});
    }
    return id;
}

RunReport Simulation::run(RunLimits limits) {
    return kernel_.run(limits);
}

} // namespace dcsim::core
