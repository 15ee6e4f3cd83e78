#pragma once

#include <dcsim/core/datacenter.hpp>
#include <dcsim/core/entities.hpp>
#include <dcsim/core/kernel.hpp>
#include <dcsim/core/subscriber.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace dcsim::core {

/// @brief Derive a deployment state from its replica counts.
///
/// Rules, first match wins:
///   - `desired == 0`                           -> Stopped
///   - `current == desired`                     -> Running
///   - operator scale not yet caught up         -> Scaling
///   - `current == 0`                           -> Pending
///   - `current > desired`                      -> Scaling
///   - otherwise (`0 < current < desired`)      -> Degraded
///
/// @param operator_scaling True if the last change of @p desired was an
///        operator scale (see Deployment::operator_scaling).
/// @ingroup core_deployments
[[nodiscard]] DeploymentState derive_deployment_state(uint64_t desired, uint64_t current,
                                                      bool operator_scaling) noexcept;

/// @brief Tracks replica counts and drives deployment state transitions.
///
/// The manager owns the desired side (apply/scale from operators) and
/// observes the current side through `container.start` / `container.stop`
/// events of containers bound to a deployment. A replica counts towards
/// `current` while all its containers are Running. Each state change fires
/// the matching `deployment.*` event exactly once.
///
/// Placing replicas is not its job: a control-plane policy creates the
/// containers and registers them with add_replica().
///
/// @see derive_deployment_state, Deployment
/// @ingroup core_deployments
class DeploymentManager : public Subscriber {
public:
    DeploymentManager(Kernel& kernel, Datacenter& datacenter);

    DeploymentManager(const DeploymentManager&) = delete;
    DeploymentManager& operator=(const DeploymentManager&) = delete;

    void handle(const Event& event) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "deployment-manager"; }

    /// @brief Create a deployment or update its template and desired count.
    ///
    /// Creating does not count as an operator scale. Changing the desired
    /// count of an existing deployment does.
    Deployment& apply(const ApplyDeployment& spec);

    /// @brief Operator scale to @p desired replicas.
    /// @throws OutOfRangeError if the deployment does not exist.
    void scale(DeploymentId id, uint64_t desired);

    /// @brief Register a freshly placed replica.
    /// @return Serial of the new replica.
    uint64_t add_replica(DeploymentId id, VmId node, std::vector<WorkloadId> containers);

    /// @brief Mark a replica for removal. It keeps counting until its
    ///        containers have stopped.
    void retire_replica(DeploymentId id, uint64_t serial);

    /// @brief Drop a replica immediately and re-evaluate the deployment.
    ///
    /// Replicas whose containers all ran and stopped are dropped
    /// automatically; this is for replicas that never came up.
    /// @throws OutOfRangeError if the replica does not exist.
    void remove_replica(DeploymentId id, uint64_t serial);

    /// @brief Number of replicas whose containers are all Running.
    [[nodiscard]] uint64_t ready_replicas(const Deployment& deployment) const;

    /// @brief Recount replicas and fire a transition if the state changed.
    void evaluate(DeploymentId id);

private:
    void on_container_stopped(const Workload& container);

    Kernel& kernel_;
    Datacenter& datacenter_;
};

} // namespace dcsim::core
