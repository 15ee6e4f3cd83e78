#pragma once

#include <dcsim/core/entities.hpp>
#include <dcsim/core/event_bus.hpp>
#include <dcsim/core/subscriber.hpp>
#include <dcsim/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dcsim::core {
class Simulation;
}

namespace dcsim::algo {

/// @brief Round-robin replica placement for deployments.
///
/// The control plane turns the desired replica count of each deployment
/// into containers. A replica is one container per container spec of the
/// deployment, all placed on the same worker VM. Placement only happens
/// while the deployment's controller is Running, on the controller's
/// Allocated worker VMs, cycling across them in node order; a node takes a
/// replica if its free capacity (minus containers already scheduled to
/// start there) holds the summed demand.
///
/// Shortfalls are remembered and retried when capacity appears (a
/// container stops, a VM is allocated, a controller starts). Replicas lost
/// to failures are not replaced: only reconcile(), called after an operator
/// apply or scale, recomputes the shortfall. Scale-down retires the most
/// recently created replicas first.
///
/// The control plane subscribes itself on construction and unsubscribes on
/// destruction; it must be destroyed before the Simulation.
///
/// @ingroup algo_policies
/// @see core::DeploymentManager, StandardActionInterpreter
class ControlPlane : public core::Subscriber {
public:
    explicit ControlPlane(core::Simulation& simulation);
    ~ControlPlane() override;

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    void handle(const core::Event& event) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "control-plane"; }

    /// @brief Bring the replica set of @p id towards its desired count.
    ///
    /// Retires surplus replicas (newest first), then places as many missing
    /// replicas as capacity allows and remembers the rest.
    void reconcile(core::DeploymentId id);

    /// @brief Replicas still waiting for capacity.
    [[nodiscard]] uint64_t outstanding(core::DeploymentId id) const;

private:
    struct PendingStart {
        core::VmId node;
        core::Resources demand;
    };

    void on_container_start(core::WorkloadId id);
    void on_container_stop(core::WorkloadId id);

    void retire(const core::Deployment& deployment, const core::Replica& replica);
    void sweep(core::DeploymentId id);
    void place(core::DeploymentId id, bool report);
    void retry_all();

    [[nodiscard]] std::optional<core::VmId> pick_node(const core::Deployment& deployment,
                                                      const core::Resources& demand);
    [[nodiscard]] core::Resources node_headroom(core::VmId node) const;
    [[nodiscard]] const core::Replica* find_replica(const core::Deployment& deployment,
                                                    core::WorkloadId container) const;

    core::Simulation& sim_;
    std::vector<core::SubscriptionId> subscriptions_;
    std::unordered_map<core::DeploymentId, uint64_t> outstanding_;
    std::unordered_map<core::WorkloadId, std::size_t> cursor_;  ///< Keyed by controller.
    std::unordered_map<core::WorkloadId, PendingStart> pending_;
};

} // namespace dcsim::algo
