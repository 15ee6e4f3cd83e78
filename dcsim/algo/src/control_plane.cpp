#include <dcsim/algo/control_plane.hpp>

#include <dcsim/core/error.hpp>
#include <dcsim/core/simulation.hpp>

#include <tracy/Tracy.hpp>

#include <algorithm>
#include <utility>

namespace dcsim::algo {

namespace {

core::Resources saturating_sub(const core::Resources& lhs, const core::Resources& rhs) {
    auto sub = [](uint64_t a, uint64_t b) { return a > b ? a - b : uint64_t{0}; };
    return core::Resources{sub(lhs.cpu, rhs.cpu), sub(lhs.ram, rhs.ram), sub(lhs.gpu, rhs.gpu)};
}

core::Resources replica_demand(const core::Deployment& deployment) {
    core::Resources total;
    for (const auto& spec : deployment.containers) {
        total += spec.demand;
    }
    return total;
}

} // namespace

ControlPlane::ControlPlane(core::Simulation& simulation)
    : sim_(simulation) {
    auto& kernel = sim_.kernel();
    subscriptions_.push_back(kernel.subscribe(core::TopicKind::ContainerStart, *this));
    subscriptions_.push_back(kernel.subscribe(core::TopicKind::ContainerStop, *this));
    subscriptions_.push_back(kernel.subscribe(core::TopicKind::VmAllocate, *this));
    subscriptions_.push_back(kernel.subscribe(core::TopicKind::ControllerStart, *this));
}

ControlPlane::~ControlPlane() {
    for (auto id : subscriptions_) {
        sim_.kernel().unsubscribe(id);
    }
}

void ControlPlane::handle(const core::Event& event) {
    switch (event.topic.kind()) {
        case core::TopicKind::ContainerStart:
            on_container_start(core::payload_as<core::WorkloadNotice>(event).workload);
            break;
        case core::TopicKind::ContainerStop:
            on_container_stop(core::payload_as<core::WorkloadNotice>(event).workload);
            break;
        case core::TopicKind::VmAllocate:
        case core::TopicKind::ControllerStart:
            retry_all();
            break;
        default:
            break;
    }
}

void ControlPlane::reconcile(core::DeploymentId id) {
    ZoneScoped;

    const auto& deployment = sim_.datacenter().deployments().at(id);

    std::vector<uint64_t> live;
    for (const auto& replica : deployment.replicas) {
        if (!replica.retiring) {
            live.push_back(replica.serial);
        }
    }

    // Scale down: newest replicas go first
    uint64_t kept = live.size();
    while (kept > deployment.desired) {
        const uint64_t serial = live[kept - 1];
        auto it = std::find_if(deployment.replicas.begin(), deployment.replicas.end(),
                               [serial](const core::Replica& r) { return r.serial == serial; });
        retire(deployment, *it);
        --kept;
    }

    outstanding_[id] = deployment.desired > kept ? deployment.desired - kept : 0;
    sweep(id);
    place(id, true);
}

uint64_t ControlPlane::outstanding(core::DeploymentId id) const {
    auto it = outstanding_.find(id);
    return it == outstanding_.end() ? 0 : it->second;
}

void ControlPlane::on_container_start(core::WorkloadId id) {
    pending_.erase(id);

    auto& dc = sim_.datacenter();
    const auto& container = dc.workloads().at(id);
    if (!container.deployment) {
        return;
    }
    const auto& deployment = dc.deployments().at(*container.deployment);
    const auto* replica = find_replica(deployment, id);

    if (replica == nullptr || replica->retiring) {
        if (container.status == core::WorkloadStatus::Running) {
            sim_.kernel().schedule(core::TopicKind::ContainerStop, sim_.now(),
                                   core::WorkloadNotice{id, container.host, std::nullopt});
        }
    } else if (container.status == core::WorkloadStatus::Stopped) {
        // Start was refused: the replica can never become ready
        retire(deployment, *replica);
    }
    sweep(deployment.id);
}

void ControlPlane::on_container_stop(core::WorkloadId id) {
    pending_.erase(id);

    auto& dc = sim_.datacenter();
    const auto& container = dc.workloads().at(id);
    if (container.deployment) {
        const auto& deployment = dc.deployments().at(*container.deployment);
        const auto* replica = find_replica(deployment, id);
        if (replica != nullptr && !replica->retiring) {
            // Part of the replica is gone: take the rest down, no replacement
            retire(deployment, *replica);
        }
        sweep(deployment.id);
    }
    retry_all();
}

void ControlPlane::retire(const core::Deployment& deployment, const core::Replica& replica) {
    const core::DeploymentId id = deployment.id;
    const uint64_t serial = replica.serial;
    const core::VmId node = replica.node;
    const auto containers = replica.containers;

    sim_.deployments().retire_replica(id, serial);

    auto& kernel = sim_.kernel();
    const auto& workloads = sim_.datacenter().workloads();
    for (auto container : containers) {
        if (workloads.at(container).status == core::WorkloadStatus::Running) {
            kernel.schedule(core::TopicKind::ContainerStop, kernel.now(),
                            core::WorkloadNotice{container, node, std::nullopt});
        }
    }

    kernel.trace([&](core::TraceWriter& w) {
        w.type("replica_retired");
        w.field("deployment", static_cast<uint64_t>(id.value));
        w.field("serial", serial);
    });
}

void ControlPlane::sweep(core::DeploymentId id) {
    const auto& deployment = sim_.datacenter().deployments().at(id);
    const auto& workloads = sim_.datacenter().workloads();

    std::vector<uint64_t> finished;
    for (const auto& replica : deployment.replicas) {
        if (!replica.retiring) {
            continue;
        }
        bool down = std::all_of(replica.containers.begin(), replica.containers.end(),
                                [&](core::WorkloadId c) {
                                    return workloads.at(c).status == core::WorkloadStatus::Stopped &&
                                           !pending_.contains(c);
                                });
        if (down) {
            finished.push_back(replica.serial);
        }
    }
    for (auto serial : finished) {
        sim_.deployments().remove_replica(id, serial);
    }
}

void ControlPlane::place(core::DeploymentId id, bool report) {
    auto& dc = sim_.datacenter();
    auto& kernel = sim_.kernel();
    const auto& deployment = dc.deployments().at(id);
    auto& missing = outstanding_[id];
    if (missing == 0 || deployment.containers.empty()) {
        return;
    }

    const core::Resources demand = replica_demand(deployment);
    while (missing > 0) {
        auto node = pick_node(deployment, demand);
        if (!node) {
            if (report) {
                kernel.trace([&](core::TraceWriter& w) {
                    w.type("replica_unplaceable");
                    w.field("deployment", static_cast<uint64_t>(id.value));
                    w.field("missing", missing);
                });
            }
            return;
        }

        const uint64_t serial = deployment.next_serial;
        std::vector<core::WorkloadId> containers;
        for (const auto& spec : deployment.containers) {
            core::Workload container;
            container.kind = core::WorkloadKind::Container;
            container.name = deployment.name + "-" + std::to_string(serial) + "/" + spec.name;
            container.host = *node;
            container.demand = spec.demand;
            auto wid = dc.workloads().reserve();
            dc.add_workload(wid, std::move(container));
            pending_.emplace(wid, PendingStart{*node, spec.demand});
            containers.push_back(wid);
        }
        sim_.deployments().add_replica(id, *node, containers);
        --missing;

        kernel.trace([&](core::TraceWriter& w) {
            w.type("replica_placed");
            w.field("deployment", static_cast<uint64_t>(id.value));
            w.field("serial", serial);
            w.field("vm", static_cast<uint64_t>(node->value));
        });
        for (auto wid : containers) {
            kernel.schedule(core::TopicKind::ContainerStart, kernel.now(),
                            core::WorkloadNotice{wid, *node, std::nullopt});
        }
    }
}

void ControlPlane::retry_all() {
    std::vector<core::DeploymentId> waiting;
    sim_.datacenter().deployments().for_each([&](const core::Deployment& deployment) {
        if (outstanding(deployment.id) > 0) {
            waiting.push_back(deployment.id);
        }
    });
    for (auto id : waiting) {
        place(id, false);
    }
}

std::optional<core::VmId> ControlPlane::pick_node(const core::Deployment& deployment,
                                                  const core::Resources& demand) {
    if (!deployment.controller) {
        return std::nullopt;
    }
    const auto& dc = sim_.datacenter();
    const auto* controller = dc.workloads().find(*deployment.controller);
    if (controller == nullptr || controller->status != core::WorkloadStatus::Running ||
        controller->nodes.empty()) {
        return std::nullopt;
    }

    const auto& nodes = controller->nodes;
    auto& cursor = cursor_[controller->id];
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const std::size_t index = (cursor + i) % nodes.size();
        const auto* vm = dc.vms().find(nodes[index]);
        if (vm != nullptr && vm->status == core::VmStatus::Allocated &&
            demand.fits_in(node_headroom(vm->id))) {
            cursor = (index + 1) % nodes.size();
            return vm->id;
        }
    }
    return std::nullopt;
}

core::Resources ControlPlane::node_headroom(core::VmId node) const {
    core::Resources headroom = sim_.datacenter().vm_free(node);
    for (const auto& [container, start] : pending_) {
        if (start.node == node) {
            headroom = saturating_sub(headroom, start.demand);
        }
    }
    return headroom;
}

const core::Replica* ControlPlane::find_replica(const core::Deployment& deployment,
                                                core::WorkloadId container) const {
    for (const auto& replica : deployment.replicas) {
        if (std::find(replica.containers.begin(), replica.containers.end(), container) !=
            replica.containers.end()) {
            return &replica;
        }
    }
    return nullptr;
}

} // namespace dcsim::algo
