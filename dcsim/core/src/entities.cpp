#include <dcsim/core/entities.hpp>

#include <type_traits>

namespace dcsim::core {

std::string_view to_string(RequestStatus status) noexcept {
    switch (status) {
        case RequestStatus::Arrived:  return "Arrived";
        case RequestStatus::Accepted: return "Accepted";
        case RequestStatus::Rejected: return "Rejected";
        case RequestStatus::Stopped:  return "Stopped";
    }
    return "Unknown";
}

std::string_view to_string(VmStatus status) noexcept {
    switch (status) {
        case VmStatus::Unallocated: return "Unallocated";
        case VmStatus::Allocated:   return "Allocated";
        case VmStatus::Deallocated: return "Deallocated";
    }
    return "Unknown";
}

std::string_view to_string(WorkloadStatus status) noexcept {
    switch (status) {
        case WorkloadStatus::Stopped: return "Stopped";
        case WorkloadStatus::Running: return "Running";
    }
    return "Unknown";
}

std::string_view to_string(DeploymentState state) noexcept {
    switch (state) {
        case DeploymentState::Pending:  return "Pending";
        case DeploymentState::Running:  return "Running";
        case DeploymentState::Degraded: return "Degraded";
        case DeploymentState::Scaling:  return "Scaling";
        case DeploymentState::Stopped:  return "Stopped";
    }
    return "Unknown";
}

std::string_view to_string(WorkloadKind kind) noexcept {
    switch (kind) {
        case WorkloadKind::App:        return "app";
        case WorkloadKind::Container:  return "container";
        case WorkloadKind::Controller: return "controller";
    }
    return "unknown";
}

Topic start_topic(WorkloadKind kind) {
    switch (kind) {
        case WorkloadKind::App:        return TopicKind::AppStart;
        case WorkloadKind::Container:  return TopicKind::ContainerStart;
        case WorkloadKind::Controller: return TopicKind::ControllerStart;
    }
    return TopicKind::AppStart;
}

Topic stop_topic(WorkloadKind kind) {
    switch (kind) {
        case WorkloadKind::App:        return TopicKind::AppStop;
        case WorkloadKind::Container:  return TopicKind::ContainerStop;
        case WorkloadKind::Controller: return TopicKind::ControllerStop;
    }
    return TopicKind::AppStop;
}

Topic deployment_topic(DeploymentState state) {
    switch (state) {
        case DeploymentState::Pending:  return TopicKind::DeploymentPend;
        case DeploymentState::Running:  return TopicKind::DeploymentRun;
        case DeploymentState::Degraded: return TopicKind::DeploymentDegrade;
        case DeploymentState::Scaling:  return TopicKind::DeploymentScale;
        case DeploymentState::Stopped:  return TopicKind::DeploymentStop;
    }
    return TopicKind::DeploymentStop;
}

std::string_view step_name(const StepCommand& command) noexcept {
    return std::visit([](const auto& step) -> std::string_view {
        using T = std::decay_t<decltype(step)>;
        if constexpr (std::is_same_v<T, ApplyDeployment>) {
            return "apply";
        } else if constexpr (std::is_same_v<T, ScaleDeployment>) {
            return "scale";
        } else if constexpr (std::is_same_v<T, DeleteDeployment>) {
            return "delete";
        } else if constexpr (std::is_same_v<T, StopRequest>) {
            return "stop_request";
        } else if constexpr (std::is_same_v<T, StartWorkload>) {
            return "start";
        } else if constexpr (std::is_same_v<T, StopWorkload>) {
            return "stop";
        } else {
            return "log";
        }
    }, command);
}

} // namespace dcsim::core
