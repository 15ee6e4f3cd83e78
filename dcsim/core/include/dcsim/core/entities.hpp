#pragma once

#include <dcsim/core/event.hpp>
#include <dcsim/core/topic.hpp>
#include <dcsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dcsim::core {

// ============================================================================
// Status enumerations
// ============================================================================

/// @brief Admission lifecycle of a request.
/// @ingroup core_entities
enum class RequestStatus {
    Arrived,   ///< Recorded, admission pending.
    Accepted,  ///< Terminal admission outcome; may still be stopped.
    Rejected,  ///< Terminal.
    Stopped    ///< Released after acceptance.
};

/// @ingroup core_entities
enum class VmStatus {
    Unallocated,
    Allocated,
    Deallocated
};

/// @ingroup core_entities
enum class WorkloadStatus {
    Stopped,
    Running
};

/// @brief Deployment state derived from replica counts.
/// @see DeploymentManager
/// @ingroup core_entities
enum class DeploymentState {
    Pending,
    Running,
    Degraded,
    Scaling,
    Stopped
};

[[nodiscard]] std::string_view to_string(RequestStatus status) noexcept;
[[nodiscard]] std::string_view to_string(VmStatus status) noexcept;
[[nodiscard]] std::string_view to_string(WorkloadStatus status) noexcept;
[[nodiscard]] std::string_view to_string(DeploymentState state) noexcept;
[[nodiscard]] std::string_view to_string(WorkloadKind kind) noexcept;

/// @brief Topic announcing that a workload of @p kind starts.
[[nodiscard]] Topic start_topic(WorkloadKind kind);

/// @brief Topic announcing that a workload of @p kind stops.
[[nodiscard]] Topic stop_topic(WorkloadKind kind);

/// @brief Topic fired when a deployment enters @p state.
[[nodiscard]] Topic deployment_topic(DeploymentState state);

// ============================================================================
// Entities
// ============================================================================

/// @brief A tenant's demand for a VM, subject to admission control.
///
/// Status goes Arrived -> Accepted|Rejected exactly once, then optionally
/// Accepted -> Stopped.
///
/// @ingroup core_entities
struct Request {
    RequestId id;
    std::string name;
    TimePoint arrival_time;
    Resources demand;
    RequestStatus status{RequestStatus::Arrived};
    VmId vm;
    bool required{false};
    bool ignored{false};
    bool release_when_idle{false};
    std::vector<WorkloadLaunch> launches;
    std::string reason;                  ///< Why the request was rejected.
    std::optional<TimePoint> decided_at;  ///< Time of accept/reject.
    std::optional<TimePoint> stopped_at;
    bool stop_pending{false};  ///< request.stop arrived before the decision.
};

/// @brief A host with fixed capacity.
///
/// `allocated` counts VMs bound to this PM; `reserved` counts VMs admitted
/// onto it whose `vm.allocate` has not been dispatched yet. Their sum never
/// exceeds `capacity`.
///
/// @ingroup core_entities
struct PhysicalMachine {
    PmId id;
    std::string name;
    Resources capacity;
    Resources allocated;
    Resources reserved;
    std::set<VmId> hosted_vms;

    /// @brief Capacity neither allocated nor reserved.
    [[nodiscard]] Resources available() const noexcept { return capacity - allocated - reserved; }
};

/// @brief A resource-demanding unit placed on exactly one PM.
///
/// `used` is the share of the VM's own demand consumed by the workloads
/// running inside it.
///
/// @ingroup core_entities
struct VirtualMachine {
    VmId id;
    std::string name;
    Resources demand;
    VmStatus status{VmStatus::Unallocated};
    std::optional<PmId> host;
    std::optional<PmId> reservation;
    std::optional<RequestId> request;
    Resources used;
    std::vector<WorkloadId> workloads;
};

/// @brief An application, container or controller running inside a VM.
///
/// `generation` is bumped on every start; timed stops carry the generation
/// they were scheduled for so that a stale one is recognised and dropped.
///
/// @ingroup core_entities
struct Workload {
    WorkloadId id;
    WorkloadKind kind{WorkloadKind::App};
    std::string name;
    VmId host;
    WorkloadStatus status{WorkloadStatus::Stopped};
    Resources demand;
    std::optional<Duration> run_for;
    std::vector<VmId> nodes;                  ///< Worker VMs (controllers only).
    std::optional<DeploymentId> deployment;   ///< Set for replica containers.
    uint64_t generation{0};
    uint64_t starts{0};
};

/// @brief Template for one container of a deployment replica.
/// @ingroup core_entities
struct ContainerSpec {
    std::string name;
    Resources demand;
};

/// @brief One replica of a deployment: a group of containers on one node.
/// @ingroup core_entities
struct Replica {
    uint64_t serial{0};                  ///< Creation order within the deployment.
    VmId node;
    std::vector<WorkloadId> containers;
    bool retiring{false};                ///< Scheduled for removal.
};

/// @brief A desired-replica-count abstraction.
///
/// `operator_scaling` records that the last change of `desired` came from
/// an operator scale, which is what separates Scaling from Degraded.
///
/// @see DeploymentManager
/// @ingroup core_entities
struct Deployment {
    DeploymentId id;
    std::string name;
    std::optional<WorkloadId> controller;
    std::vector<ContainerSpec> containers;
    uint64_t desired{0};
    uint64_t current{0};
    DeploymentState state{DeploymentState::Stopped};
    bool operator_scaling{false};
    uint64_t next_serial{0};
    std::vector<Replica> replicas;
};

// ============================================================================
// Actions
// ============================================================================

/// @brief Create a deployment, or update its template and desired count.
struct ApplyDeployment {
    DeploymentId deployment;
    std::string name;
    std::optional<WorkloadId> controller;
    uint64_t replicas{0};
    std::vector<ContainerSpec> containers;
};

/// @brief Operator scale of a deployment to an absolute replica count.
struct ScaleDeployment {
    DeploymentId deployment;
    uint64_t replicas{0};
};

/// @brief Scale a deployment to zero.
struct DeleteDeployment {
    DeploymentId deployment;
};

struct StopRequest {
    RequestId request;
};

struct StartWorkload {
    WorkloadId workload;
};

struct StopWorkload {
    WorkloadId workload;
};

/// @brief Publish a free-form `sim.log` message.
struct LogNote {
    std::string message;
};

/// @brief Data describing what one action step does.
///
/// Steps are plain data: the core never interprets them, an
/// ActionInterpreter does.
///
/// @ingroup core_entities
using StepCommand = std::variant<
    ApplyDeployment,
    ScaleDeployment,
    DeleteDeployment,
    StopRequest,
    StartWorkload,
    StopWorkload,
    LogNote
>;

[[nodiscard]] std::string_view step_name(const StepCommand& command) noexcept;

/// @ingroup core_entities
struct ActionStep {
    Duration delay;  ///< Relative to the previous step (or to the arrival).
    StepCommand command;
};

/// @brief An ordered script of steps; `action.execute` fires once per step.
/// @ingroup core_entities
struct Action {
    ActionId id;
    std::string name;
    TimePoint arrival;
    std::vector<ActionStep> steps;
    std::size_t executed{0};
};

} // namespace dcsim::core
