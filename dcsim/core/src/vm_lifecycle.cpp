#include <dcsim/core/lifecycle.hpp>
#include <dcsim/core/error.hpp>
#include <dcsim/core/simulation.hpp>

#include <tracy/Tracy.hpp>

namespace dcsim::core {

void VmLifecycle::handle(const Event& event) {
    switch (event.topic.kind()) {
        case TopicKind::VmAllocate:
            on_allocate(payload_as<VmNotice>(event));
            break;
        case TopicKind::VmDeallocate:
            on_deallocate(payload_as<VmNotice>(event));
            break;
        default:
            break;
    }
}

void VmLifecycle::on_allocate(const VmNotice& notice) {
    auto& kernel = sim_.kernel();
    auto& dc = sim_.datacenter();
    const auto& vm = dc.vms().at(notice.vm);

    if (vm.status != VmStatus::Unallocated) {
        throw InvariantViolation("vm " + std::to_string(vm.id.value) + " is " +
                                 std::string(to_string(vm.status)) + "; allocate discarded");
    }
    if (vm.request && dc.requests().at(*vm.request).status == RequestStatus::Stopped) {
        // Released before it was ever placed
        dc.release_reservation(notice.vm);
        return;
    }

    std::optional<PmId> target = notice.pm;
    std::string_view decided_by = "reservation";
    if (!target) {
        auto* allocator = sim_.allocator();
        if (allocator == nullptr) {
            throw InvalidStateError("no allocator installed; vm " + std::to_string(vm.id.value) +
                                    " left unallocated");
        }
        ZoneScopedN("select_pm");
        target = allocator->select_pm(vm.demand, dc.pms());
        decided_by = allocator->name();
    }

    if (target) {
        try {
            dc.bind_vm(notice.vm, *target);
            kernel.trace([&](TraceWriter& w) {
                w.type("vm_placed");
                w.field("vm", static_cast<uint64_t>(notice.vm.value));
                w.field("pm", static_cast<uint64_t>(target->value));
                w.field("by", decided_by);
            });
            return;
        } catch (const InvariantViolation& e) {
            // Bookkeeping refused the placement: treat it as no capacity
            kernel.report_fault(FaultKind::InvariantViolation, std::string(decided_by), e.what());
        }
    }

    kernel.trace([&](TraceWriter& w) {
        w.type("vm_rejected");
        w.field("vm", static_cast<uint64_t>(notice.vm.value));
    });
    dc.release_reservation(notice.vm);

    if (vm.request) {
        const auto& request = dc.requests().at(*vm.request);
        if (request.status == RequestStatus::Arrived) {
            kernel.schedule(TopicKind::RequestReject, kernel.now(),
                            RequestNotice{request.id, "no capacity"});
        }
    }
}

void VmLifecycle::on_deallocate(const VmNotice& notice) {
    auto& kernel = sim_.kernel();
    auto& dc = sim_.datacenter();

    dc.unbind_vm(notice.vm);
    kernel.trace([&](TraceWriter& w) {
        w.type("vm_released");
        w.field("vm", static_cast<uint64_t>(notice.vm.value));
    });

    // Workloads lose their host along with the VM
    const auto& vm = dc.vms().at(notice.vm);
    for (auto id : vm.workloads) {
        const auto& workload = dc.workloads().at(id);
        if (workload.status == WorkloadStatus::Running) {
            kernel.schedule(stop_topic(workload.kind), kernel.now(),
                            WorkloadNotice{id, vm.id, std::nullopt});
        }
    }
}

} // namespace dcsim::core
