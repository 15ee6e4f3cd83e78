#include <dcsim/algo/standard_action_interpreter.hpp>
#include <dcsim/algo/control_plane.hpp>

#include <dcsim/core/simulation.hpp>

#include <type_traits>

namespace dcsim::algo {

void StandardActionInterpreter::execute(const core::Action& action, std::size_t step,
                                        core::Simulation& simulation) {
    auto& kernel = simulation.kernel();
    auto& dc = simulation.datacenter();
    const auto& command = action.steps.at(step).command;

    std::visit(
        [&](const auto& cmd) {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, core::ApplyDeployment>) {
                simulation.deployments().apply(cmd);
                reconcile(cmd.deployment);
            } else if constexpr (std::is_same_v<T, core::ScaleDeployment>) {
                simulation.deployments().scale(cmd.deployment, cmd.replicas);
                reconcile(cmd.deployment);
            } else if constexpr (std::is_same_v<T, core::DeleteDeployment>) {
                simulation.deployments().scale(cmd.deployment, 0);
                reconcile(cmd.deployment);
            } else if constexpr (std::is_same_v<T, core::StopRequest>) {
                kernel.schedule(core::TopicKind::RequestStop, kernel.now(),
                                core::RequestNotice{cmd.request, {}});
            } else if constexpr (std::is_same_v<T, core::StartWorkload>) {
                const auto& workload = dc.workloads().at(cmd.workload);
                kernel.schedule(core::start_topic(workload.kind), kernel.now(),
                                core::WorkloadNotice{workload.id, workload.host, std::nullopt});
            } else if constexpr (std::is_same_v<T, core::StopWorkload>) {
                const auto& workload = dc.workloads().at(cmd.workload);
                kernel.schedule(core::stop_topic(workload.kind), kernel.now(),
                                core::WorkloadNotice{workload.id, workload.host, std::nullopt});
            } else if constexpr (std::is_same_v<T, core::LogNote>) {
                kernel.schedule(core::TopicKind::SimLog, kernel.now(),
                                core::LogMessage{action.name, cmd.message});
            }
        },
        command);
}

void StandardActionInterpreter::reconcile(core::DeploymentId id) {
    if (control_plane_ != nullptr) {
        control_plane_->reconcile(id);
    }
}

} // namespace dcsim::algo
