#include <dcsim/core/event.hpp>
#include <dcsim/core/trace_writer.hpp>

#include <type_traits>

namespace dcsim::core {

void trace_payload(TraceWriter& writer, const Payload& payload) {
    std::visit([&writer](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, RequestArrival>) {
            writer.field("request", static_cast<uint64_t>(p.request.value));
            writer.field("vm", static_cast<uint64_t>(p.vm.value));
            writer.field("name", p.name);
            writer.field("cpu", p.demand.cpu);
            writer.field("ram", p.demand.ram);
            writer.field("gpu", p.demand.gpu);
        } else if constexpr (std::is_same_v<T, RequestNotice>) {
            writer.field("request", static_cast<uint64_t>(p.request.value));
            if (!p.reason.empty()) {
                writer.field("reason", p.reason);
            }
        } else if constexpr (std::is_same_v<T, ActionStepRef>) {
            writer.field("action", static_cast<uint64_t>(p.action.value));
            writer.field("step", static_cast<uint64_t>(p.step));
        } else if constexpr (std::is_same_v<T, WorkloadNotice>) {
            writer.field("workload", static_cast<uint64_t>(p.workload.value));
            writer.field("vm", static_cast<uint64_t>(p.vm.value));
        } else if constexpr (std::is_same_v<T, DeploymentNotice>) {
            writer.field("deployment", static_cast<uint64_t>(p.deployment.value));
            writer.field("desired", p.desired);
            writer.field("current", p.current);
        } else if constexpr (std::is_same_v<T, VmNotice>) {
            writer.field("vm", static_cast<uint64_t>(p.vm.value));
            if (p.pm) {
                writer.field("pm", static_cast<uint64_t>(p.pm->value));
            }
        } else if constexpr (std::is_same_v<T, LogMessage>) {
            writer.field("source", p.source);
            writer.field("message", p.message);
        }
    }, payload);
}

} // namespace dcsim::core
