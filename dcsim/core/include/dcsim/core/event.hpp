#pragma once

#include <dcsim/core/error.hpp>
#include <dcsim/core/topic.hpp>
#include <dcsim/core/types.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dcsim::core {

class TraceWriter;

/// @brief Deterministic ordering key for events in the queue.
///
/// Events are ordered first by virtual time, then by insertion sequence.
/// The sequence makes same-time events fire in scheduling order, which is
/// what makes every run with a fixed input reproducible.
///
/// @see EventQueue
/// @ingroup core_events
struct EventKey {
    TimePoint time;     ///< Primary: virtual time at which the event fires.
    uint64_t sequence;  ///< Secondary: insertion order for determinism.

    /// @cond INTERNAL
    auto operator<=>(const EventKey&) const = default;
    /// @endcond
};

/// @brief Kind of workload hosted on a VM.
/// @ingroup core_entities
enum class WorkloadKind {
    App,
    Container,
    Controller
};

/// @brief Workload that a request launches inside its VM once accepted.
/// @see RequestArrival
/// @ingroup core_events
struct WorkloadLaunch {
    WorkloadId workload;            ///< Id reserved for the workload.
    WorkloadKind kind{WorkloadKind::App};
    std::string name;
    Resources demand;
    std::optional<Duration> run_for;  ///< Stops itself after this long.
    std::vector<VmId> nodes;          ///< Worker VMs (controllers only).
};

/// @brief Payload of `request.arrive`.
/// @ingroup core_events
struct RequestArrival {
    RequestId request;
    VmId vm;
    std::string name;
    Resources demand;
    bool required{false};           ///< Rejection is fatal to the run.
    bool ignored{false};            ///< Excluded from statistics.
    bool release_when_idle{false};  ///< Stop the request when its VM goes idle.
    std::vector<WorkloadLaunch> launches;
};

/// @brief Payload of `request.accept`, `request.reject` and `request.stop`.
/// @ingroup core_events
struct RequestNotice {
    RequestId request;
    std::string reason;  ///< Set on rejections.
};

/// @brief Payload of `action.execute`: which step of which action runs.
/// @ingroup core_events
struct ActionStepRef {
    ActionId action;
    std::size_t step{0};
};

/// @brief Payload of `app.*`, `container.*` and `controller.*` events.
///
/// A stop carrying a generation was scheduled by the workload itself when
/// it started; it is dropped if the workload has been stopped or restarted
/// in the meantime.
///
/// @ingroup core_events
struct WorkloadNotice {
    WorkloadId workload;
    VmId vm;
    std::optional<uint64_t> generation;
};

/// @brief Payload of `deployment.*` events.
/// @ingroup core_events
struct DeploymentNotice {
    DeploymentId deployment;
    uint64_t desired{0};
    uint64_t current{0};
};

/// @brief Payload of `vm.allocate` and `vm.deallocate`.
/// @ingroup core_events
struct VmNotice {
    VmId vm;
    std::optional<PmId> pm;  ///< Placement decided beforehand, if any.
};

/// @brief Payload of `sim.log`.
/// @ingroup core_events
struct LogMessage {
    std::string source;
    std::string message;
};

/// @brief Data carried by an event.
///
/// Payloads are plain records referencing entities by id; there are no
/// callbacks in an event, so a schedule is fully inspectable data.
///
/// @ingroup core_events
using Payload = std::variant<
    std::monostate,
    RequestArrival,
    RequestNotice,
    ActionStepRef,
    WorkloadNotice,
    DeploymentNotice,
    VmNotice,
    LogMessage
>;

/// @brief An immutable, timestamped occurrence dispatched through the bus.
///
/// The sequence is assigned by the EventQueue at insertion.
///
/// @see EventQueue, EventBus
/// @ingroup core_events
struct Event {
    Topic topic;
    TimePoint timestamp;
    uint64_t sequence{0};
    Payload payload;

    [[nodiscard]] EventKey key() const noexcept { return EventKey{timestamp, sequence}; }
};

/// @brief Append the payload fields of @p payload to the current trace record.
void trace_payload(TraceWriter& writer, const Payload& payload);

/// @brief Returns the payload as type @p T.
/// @throws InvalidArgumentError if the event carries another payload type.
template<typename T>
const T& payload_as(const Event& event) {
    if (const auto* value = std::get_if<T>(&event.payload)) {
        return *value;
    }
    throw InvalidArgumentError("unexpected payload for topic '" +
                               std::string(event.topic.name()) + "'");
}

} // namespace dcsim::core
