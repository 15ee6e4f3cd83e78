#include <dcsim/core/deployment_manager.hpp>
#include <dcsim/core/error.hpp>

#include <algorithm>
#include <utility>

namespace dcsim::core {

DeploymentState derive_deployment_state(uint64_t desired, uint64_t current,
                                        bool operator_scaling) noexcept {
    if (desired == 0) {
        return DeploymentState::Stopped;
    }
    if (current == desired) {
        return DeploymentState::Running;
    }
    if (operator_scaling) {
        return DeploymentState::Scaling;
    }
    if (current == 0) {
        return DeploymentState::Pending;
    }
    if (current > desired) {
        return DeploymentState::Scaling;
    }
    return DeploymentState::Degraded;
}

DeploymentManager::DeploymentManager(Kernel& kernel, Datacenter& datacenter)
    : kernel_(kernel)
    , datacenter_(datacenter) {}

void DeploymentManager::handle(const Event& event) {
    const auto& notice = payload_as<WorkloadNotice>(event);
    const auto& container = datacenter_.workloads().at(notice.workload);
    if (!container.deployment) {
        return;
    }

    if (event.topic.kind() == TopicKind::ContainerStop) {
        on_container_stopped(container);
    }
    evaluate(*container.deployment);
}

Deployment& DeploymentManager::apply(const ApplyDeployment& spec) {
    auto& table = datacenter_.deployments();
    if (!table.contains(spec.deployment)) {
        Deployment created;
        created.id = spec.deployment;
        created.name = spec.name;
        table.emplace(spec.deployment, std::move(created));
    }

    auto& deployment = table.at(spec.deployment);
    bool existed = deployment.desired != 0 || !deployment.replicas.empty();
    if (existed && deployment.desired != spec.replicas) {
        deployment.operator_scaling = true;
    }
    deployment.controller = spec.controller;
    deployment.containers = spec.containers;
    deployment.desired = spec.replicas;

    evaluate(spec.deployment);
    return deployment;
}

void DeploymentManager::scale(DeploymentId id, uint64_t desired) {
    auto& deployment = datacenter_.deployments().at(id);
    if (deployment.desired != desired) {
        deployment.desired = desired;
        deployment.operator_scaling = true;
    }
    evaluate(id);
}

uint64_t DeploymentManager::add_replica(DeploymentId id, VmId node,
                                        std::vector<WorkloadId> containers) {
    auto& deployment = datacenter_.deployments().at(id);
    for (auto container : containers) {
        datacenter_.workloads().at(container).deployment = id;
    }

    Replica replica;
    replica.serial = deployment.next_serial++;
    replica.node = node;
    replica.containers = std::move(containers);
    deployment.replicas.push_back(std::move(replica));
    return deployment.replicas.back().serial;
}

void DeploymentManager::retire_replica(DeploymentId id, uint64_t serial) {
    auto& deployment = datacenter_.deployments().at(id);
    auto it = std::find_if(deployment.replicas.begin(), deployment.replicas.end(),
                           [serial](const Replica& r) { return r.serial == serial; });
    if (it == deployment.replicas.end()) {
        throw OutOfRangeError("deployment '" + deployment.name + "' has no replica " +
                              std::to_string(serial));
    }
    it->retiring = true;
}

void DeploymentManager::remove_replica(DeploymentId id, uint64_t serial) {
    auto& deployment = datacenter_.deployments().at(id);
    auto removed = std::erase_if(deployment.replicas,
                                 [serial](const Replica& r) { return r.serial == serial; });
    if (removed == 0) {
        throw OutOfRangeError("deployment '" + deployment.name + "' has no replica " +
                              std::to_string(serial));
    }
    evaluate(id);
}

uint64_t DeploymentManager::ready_replicas(const Deployment& deployment) const {
    const auto& workloads = datacenter_.workloads();
    return static_cast<uint64_t>(std::count_if(
        deployment.replicas.begin(), deployment.replicas.end(), [&](const Replica& replica) {
            return !replica.containers.empty() &&
                   std::all_of(replica.containers.begin(), replica.containers.end(),
                               [&](WorkloadId id) {
                                   return workloads.at(id).status == WorkloadStatus::Running;
                               });
        }));
}

void DeploymentManager::on_container_stopped(const Workload& container) {
    auto& deployment = datacenter_.deployments().at(*container.deployment);
    const auto& workloads = datacenter_.workloads();

    // A replica whose containers are all down is gone for good
    std::erase_if(deployment.replicas, [&](const Replica& replica) {
        bool holds = std::find(replica.containers.begin(), replica.containers.end(),
                               container.id) != replica.containers.end();
        return holds && std::all_of(replica.containers.begin(), replica.containers.end(),
                                    [&](WorkloadId id) {
                                        const auto& w = workloads.at(id);
                                        return w.status == WorkloadStatus::Stopped && w.starts > 0;
                                    });
    });
}

void DeploymentManager::evaluate(DeploymentId id) {
    auto& deployment = datacenter_.deployments().at(id);
    deployment.current = ready_replicas(deployment);

    DeploymentState next = derive_deployment_state(deployment.desired, deployment.current,
                                                   deployment.operator_scaling);
    if (next == DeploymentState::Running || next == DeploymentState::Stopped) {
        deployment.operator_scaling = false;
    }
    if (next == deployment.state) {
        return;
    }

    deployment.state = next;
    kernel_.schedule(deployment_topic(next), kernel_.now(),
                     DeploymentNotice{id, deployment.desired, deployment.current});
}

} // namespace dcsim::core
