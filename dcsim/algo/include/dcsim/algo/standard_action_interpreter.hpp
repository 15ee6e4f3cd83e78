#pragma once

#include <dcsim/core/policy.hpp>

namespace dcsim::algo {

class ControlPlane;

/// @brief Default meaning of the built-in action steps.
///
/// | Step           | Effect                                                   |
/// |----------------|----------------------------------------------------------|
/// | apply          | DeploymentManager::apply(), then reconcile               |
/// | scale          | DeploymentManager::scale(), then reconcile               |
/// | delete         | scale to zero, then reconcile                            |
/// | stop_request   | schedule `request.stop`                                  |
/// | start / stop   | schedule the workload's `*.start` / `*.stop`             |
/// | log            | schedule `sim.log` with the action name as source        |
///
/// Without a control plane, deployment steps only change the desired count
/// and no replica is ever placed.
///
/// @ingroup algo_policies
/// @see ControlPlane, core::StepCommand
class StandardActionInterpreter : public core::ActionInterpreter {
public:
    /// @param control_plane Replica placement (not owned, may be nullptr).
    explicit StandardActionInterpreter(ControlPlane* control_plane = nullptr)
        : control_plane_(control_plane) {}

    void execute(const core::Action& action, std::size_t step,
                 core::Simulation& simulation) override;

private:
    void reconcile(core::DeploymentId id);

    ControlPlane* control_plane_;
};

} // namespace dcsim::algo
