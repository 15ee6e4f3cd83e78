#include <dcsim/core/lifecycle.hpp>
#include <dcsim/core/error.hpp>
#include <dcsim/core/simulation.hpp>

#include <tracy/Tracy.hpp>

#include <string>
#include <unordered_set>
#include <utility>

namespace dcsim::core {

namespace {

std::string request_label(const Request& request) {
    return "request '" + request.name + "' (" + std::to_string(request.id.value) + ")";
}

void expect_undecided(const Request& request, std::string_view transition) {
    if (request.status != RequestStatus::Arrived) {
        throw InvariantViolation(request_label(request) + " is already " +
                                 std::string(to_string(request.status)) + "; " +
                                 std::string(transition) + " discarded");
    }
}

} // namespace

void RequestLifecycle::handle(const Event& event) {
    switch (event.topic.kind()) {
        case TopicKind::RequestArrive:
            on_arrive(payload_as<RequestArrival>(event));
            break;
        case TopicKind::RequestAccept:
            on_accept(payload_as<RequestNotice>(event));
            break;
        case TopicKind::RequestReject:
            on_reject(payload_as<RequestNotice>(event));
            break;
        case TopicKind::RequestStop:
            on_stop(payload_as<RequestNotice>(event));
            break;
        default:
            break;
    }
}

void RequestLifecycle::on_arrive(const RequestArrival& arrival) {
    auto& kernel = sim_.kernel();
    auto& dc = sim_.datacenter();
    if (dc.requests().contains(arrival.request) || dc.vms().contains(arrival.vm)) {
        throw InvariantViolation("request '" + arrival.name + "' arrived twice");
    }

    Request request;
    request.id = arrival.request;
    request.name = arrival.name;
    request.arrival_time = kernel.now();
    request.demand = arrival.demand;
    request.vm = arrival.vm;
    request.required = arrival.required;
    request.ignored = arrival.ignored;
    request.release_when_idle = arrival.release_when_idle;
    request.launches = arrival.launches;

    VirtualMachine vm;
    vm.id = arrival.vm;
    vm.name = arrival.name;
    vm.demand = arrival.demand;
    vm.request = arrival.request;

    dc.requests().emplace(arrival.request, std::move(request));
    dc.vms().emplace(arrival.vm, std::move(vm));
    const auto& recorded = dc.requests().at(arrival.request);

    if (auto* policy = sim_.admission_policy()) {
        ZoneScopedN("admission");
        auto verdict = policy->evaluate(recorded, dc);
        if (!verdict.admit) {
            kernel.schedule(TopicKind::RequestReject, kernel.now(),
                            RequestNotice{arrival.request, std::move(verdict.reason)});
            return;
        }
    }

    auto* allocator = sim_.allocator();
    if (allocator == nullptr) {
        throw InvalidStateError("no allocator installed; " + request_label(recorded) +
                                " left undecided");
    }

    std::optional<PmId> pm;
    {
        ZoneScopedN("select_pm");
        pm = allocator->select_pm(recorded.demand, dc.pms());
    }
    if (pm) {
        try {
            dc.reserve_placement(arrival.vm, *pm);
        } catch (const InvariantViolation& e) {
            kernel.report_fault(FaultKind::InvariantViolation, std::string(allocator->name()),
                                e.what());
            pm.reset();
        }
    }

    if (!pm) {
        kernel.schedule(TopicKind::RequestReject, kernel.now(),
                        RequestNotice{arrival.request, "no capacity"});
        return;
    }

    kernel.trace([&](TraceWriter& w) {
        w.type("vm_reserved");
        w.field("vm", static_cast<uint64_t>(arrival.vm.value));
        w.field("pm", static_cast<uint64_t>(pm->value));
    });
    kernel.schedule(TopicKind::RequestAccept, kernel.now(), RequestNotice{arrival.request, {}});
}

void RequestLifecycle::on_accept(const RequestNotice& notice) {
    auto& kernel = sim_.kernel();
    auto& dc = sim_.datacenter();
    auto& request = dc.requests().at(notice.request);
    expect_undecided(request, "accept");

    const VmId vm_id = request.vm;
    const auto launches = request.launches;

    // Launches are checked up front so a conflict leaves nothing half-built
    std::unordered_set<WorkloadId> seen;
    for (const auto& launch : launches) {
        if (dc.workloads().contains(launch.workload) || !seen.insert(launch.workload).second) {
            std::string reason = "workload id " + std::to_string(launch.workload.value) +
                                 " is already in use";
            kernel.report_fault(FaultKind::InvariantViolation, std::string(name()),
                                request_label(request) + ": " + reason);
            kernel.schedule(TopicKind::RequestReject, kernel.now(),
                            RequestNotice{notice.request, std::move(reason)});
            return;
        }
    }

    request.status = RequestStatus::Accepted;
    request.decided_at = kernel.now();

    for (const auto& launch : launches) {
        Workload workload;
        workload.kind = launch.kind;
        workload.name = launch.name;
        workload.host = vm_id;
        workload.demand = launch.demand;
        workload.run_for = launch.run_for;
        workload.nodes = launch.nodes;
        dc.add_workload(launch.workload, std::move(workload));
    }

    kernel.schedule(TopicKind::VmAllocate, kernel.now(),
                    VmNotice{vm_id, dc.vms().at(vm_id).reservation});
    for (const auto& launch : launches) {
        kernel.schedule(start_topic(launch.kind), kernel.now(),
                        WorkloadNotice{launch.workload, vm_id, std::nullopt});
    }
    if (request.stop_pending) {
        request.stop_pending = false;
        kernel.schedule(TopicKind::RequestStop, kernel.now(), RequestNotice{request.id, {}});
    }
}

void RequestLifecycle::on_reject(const RequestNotice& notice) {
    auto& kernel = sim_.kernel();
    auto& dc = sim_.datacenter();
    auto& request = dc.requests().at(notice.request);
    expect_undecided(request, "reject");

    request.status = RequestStatus::Rejected;
    request.stop_pending = false;
    request.reason = notice.reason;
    request.decided_at = kernel.now();
    dc.release_reservation(request.vm);

    if (request.required) {
        throw KernelFault("required " + request_label(request) + " was rejected: " +
                          notice.reason);
    }
}

void RequestLifecycle::on_stop(const RequestNotice& notice) {
    auto& kernel = sim_.kernel();
    auto& dc = sim_.datacenter();
    auto& request = dc.requests().at(notice.request);
    switch (request.status) {
        case RequestStatus::Stopped:
            return;
        case RequestStatus::Arrived:
            // Replayed once the request is accepted; dropped on reject
            request.stop_pending = true;
            return;
        default:
            break;
    }
    if (request.status != RequestStatus::Accepted) {
        throw InvariantViolation(request_label(request) + " is " +
                                 std::string(to_string(request.status)) +
                                 "; only accepted requests can stop");
    }

    request.status = RequestStatus::Stopped;
    request.stopped_at = kernel.now();

    const auto& vm = dc.vms().at(request.vm);
    for (auto id : vm.workloads) {
        const auto& workload = dc.workloads().at(id);
        if (workload.status == WorkloadStatus::Running) {
            kernel.schedule(stop_topic(workload.kind), kernel.now(),
                            WorkloadNotice{id, vm.id, std::nullopt});
        }
    }
    if (vm.status == VmStatus::Allocated) {
        kernel.schedule(TopicKind::VmDeallocate, kernel.now(), VmNotice{vm.id, vm.host});
    } else {
        dc.release_reservation(vm.id);
    }
}

} // namespace dcsim::core
