#include <dcsim/core/lifecycle.hpp>
#include <dcsim/core/error.hpp>
#include <dcsim/core/simulation.hpp>

namespace dcsim::core {

namespace {

bool is_start(TopicKind kind) noexcept {
    return kind == TopicKind::AppStart || kind == TopicKind::ContainerStart ||
           kind == TopicKind::ControllerStart;
}

bool is_stop(TopicKind kind) noexcept {
    return kind == TopicKind::AppStop || kind == TopicKind::ContainerStop ||
           kind == TopicKind::ControllerStop;
}

} // namespace

void WorkloadLifecycle::handle(const Event& event) {
    const auto kind = event.topic.kind();
    if (is_start(kind)) {
        on_start(event, payload_as<WorkloadNotice>(event));
    } else if (is_stop(kind)) {
        on_stop(event, payload_as<WorkloadNotice>(event));
    }
}

void WorkloadLifecycle::on_start(const Event& event, const WorkloadNotice& notice) {
    auto& kernel = sim_.kernel();
    auto& dc = sim_.datacenter();
    const auto& workload = dc.workloads().at(notice.workload);

    if (event.topic != start_topic(workload.kind)) {
        throw InvariantViolation("workload '" + workload.name + "' is a " +
                                 std::string(to_string(workload.kind)) + ", not started by " +
                                 std::string(event.topic.name()));
    }

    dc.start_workload(notice.workload);

    if (workload.run_for) {
        kernel.schedule_after(stop_topic(workload.kind), *workload.run_for,
                              WorkloadNotice{workload.id, workload.host, workload.generation});
    }
}

void WorkloadLifecycle::on_stop(const Event& event, const WorkloadNotice& notice) {
    auto& kernel = sim_.kernel();
    auto& dc = sim_.datacenter();
    const auto& workload = dc.workloads().at(notice.workload);

    if (event.topic != stop_topic(workload.kind)) {
        throw InvariantViolation("workload '" + workload.name + "' is a " +
                                 std::string(to_string(workload.kind)) + ", not stopped by " +
                                 std::string(event.topic.name()));
    }

    if (notice.generation && (workload.status != WorkloadStatus::Running ||
                              workload.generation != *notice.generation)) {
        // Timed stop of an earlier run
        return;
    }

    dc.stop_workload(notice.workload);

    const auto& vm = dc.vms().at(workload.host);
    if (!vm.request) {
        return;
    }
    const auto& request = dc.requests().at(*vm.request);
    if (request.release_when_idle && request.status == RequestStatus::Accepted &&
        dc.vm_idle(vm.id)) {
        kernel.schedule(TopicKind::RequestStop, kernel.now(), RequestNotice{request.id, {}});
    }
}

} // namespace dcsim::core
