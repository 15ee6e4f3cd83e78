#include <dcsim/algo/control_plane.hpp>
#include <dcsim/algo/first_fit_allocator.hpp>
#include <dcsim/algo/standard_action_interpreter.hpp>

#include <dcsim/core/simulation.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace dcsim::algo;
using namespace dcsim::core;

class ControlPlaneTest : public ::testing::Test {
protected:
    ControlPlaneTest() {
        sim.set_allocator(std::make_unique<FirstFitAllocator>());
        sim.set_action_interpreter(std::make_unique<StandardActionInterpreter>(&control_plane));
        sim.add_pm("pm0", Resources{64, 65536, 0});
    }

    TimePoint time(double seconds) {
        return time_from_seconds(seconds);
    }

    /// Submit a worker VM request arriving at @p at.
    VmId worker(const std::string& name, Resources demand, double at = 0.0) {
        auto handle = sim.reserve_request();
        RequestArrival arrival;
        arrival.request = handle.request;
        arrival.vm = handle.vm;
        arrival.name = name;
        arrival.demand = demand;
        sim.submit_request(time(at), arrival);
        requests.push_back(handle.request);
        return handle.vm;
    }

    /// Submit a controller managing @p nodes, arriving at @p at.
    WorkloadId controller(std::vector<VmId> nodes, double at = 0.0,
                          std::optional<double> run_for = std::nullopt) {
        auto handle = sim.reserve_request(1);
        RequestArrival arrival;
        arrival.request = handle.request;
        arrival.vm = handle.vm;
        arrival.name = "master";
        arrival.demand = Resources{1, 1024, 0};
        WorkloadLaunch launch;
        launch.workload = handle.workloads[0];
        launch.kind = WorkloadKind::Controller;
        launch.name = "kube";
        launch.demand = Resources{1, 512, 0};
        launch.nodes = std::move(nodes);
        if (run_for) {
            launch.run_for = duration_from_seconds(*run_for);
        }
        arrival.launches.push_back(launch);
        sim.submit_request(time(at), arrival);
        return handle.workloads[0];
    }

    DeploymentId apply(double at, WorkloadId ctrl, uint64_t replicas,
                       Resources demand = Resources{1, 512, 0}) {
        DeploymentId id = sim.reserve_deployment();
        ApplyDeployment spec;
        spec.deployment = id;
        spec.name = "web";
        spec.controller = ctrl;
        spec.replicas = replicas;
        spec.containers = {ContainerSpec{"nginx", demand}};
        sim.submit_action(time(at), "apply-web", {ActionStep{Duration::zero(), spec}});
        return id;
    }

    void scale(double at, DeploymentId id, uint64_t replicas) {
        sim.submit_action(time(at), "scale-web",
                          {ActionStep{Duration::zero(), ScaleDeployment{id, replicas}}});
    }

    const Deployment& deployment(DeploymentId id) const {
        return sim.datacenter().deployments().at(id);
    }

    std::vector<VmId> replica_nodes(DeploymentId id) const {
        std::vector<VmId> nodes;
        for (const auto& replica : deployment(id).replicas) {
            nodes.push_back(replica.node);
        }
        return nodes;
    }

    std::vector<uint64_t> serials(DeploymentId id) const {
        std::vector<uint64_t> result;
        for (const auto& replica : deployment(id).replicas) {
            result.push_back(replica.serial);
        }
        return result;
    }

    std::size_t running_containers() const {
        std::size_t count = 0;
        sim.datacenter().workloads().for_each([&](const Workload& w) {
            if (w.kind == WorkloadKind::Container && w.status == WorkloadStatus::Running) {
                ++count;
            }
        });
        return count;
    }

    Simulation sim;
    ControlPlane control_plane{sim};
    std::vector<RequestId> requests;
};

TEST_F(ControlPlaneTest, ReplicasCycleAcrossNodes) {
    auto w1 = worker("w1", Resources{4, 4096, 0});
    auto w2 = worker("w2", Resources{4, 4096, 0});
    auto ctrl = controller({w1, w2});
    auto web = apply(1.0, ctrl, 4);

    auto report = sim.run();

    EXPECT_TRUE(report.faults.empty());
    EXPECT_EQ(deployment(web).state, DeploymentState::Running);
    EXPECT_EQ(deployment(web).current, 4U);
    EXPECT_EQ(replica_nodes(web), (std::vector<VmId>{w1, w2, w1, w2}));
    EXPECT_EQ(sim.datacenter().vm_free(w1), (Resources{2, 3072, 0}));
    EXPECT_EQ(control_plane.outstanding(web), 0U);

    const auto& first = sim.datacenter().workloads().at(deployment(web).replicas[0].containers[0]);
    EXPECT_EQ(first.name, "web-0/nginx");
    EXPECT_EQ(first.deployment, web);
}

TEST_F(ControlPlaneTest, WaitsForItsController) {
    auto w1 = worker("w1", Resources{8, 8192, 0});
    auto ctrl = controller({w1}, 5.0);
    auto web = apply(1.0, ctrl, 2);

    sim.run({.end_time = time(3.0)});
    EXPECT_EQ(deployment(web).state, DeploymentState::Pending);
    EXPECT_EQ(control_plane.outstanding(web), 2U);
    EXPECT_TRUE(deployment(web).replicas.empty());

    sim.run();
    EXPECT_EQ(deployment(web).state, DeploymentState::Running);
    EXPECT_EQ(control_plane.outstanding(web), 0U);
}

TEST_F(ControlPlaneTest, StoppedControllerPlacesNothing) {
    auto w1 = worker("w1", Resources{8, 8192, 0});
    auto ctrl = controller({w1}, 0.0, 2.0);
    auto web = apply(5.0, ctrl, 1);

    sim.run();

    EXPECT_EQ(deployment(web).state, DeploymentState::Pending);
    EXPECT_EQ(control_plane.outstanding(web), 1U);
}

TEST_F(ControlPlaneTest, DeploymentWithoutControllerWaits) {
    DeploymentId id = sim.reserve_deployment();
    ApplyDeployment spec;
    spec.deployment = id;
    spec.name = "orphan";
    spec.replicas = 1;
    spec.containers = {ContainerSpec{"c", Resources{1, 1, 0}}};
    sim.submit_action(time(0.0), "apply", {ActionStep{Duration::zero(), spec}});

    sim.run();

    EXPECT_EQ(deployment(id).state, DeploymentState::Pending);
    EXPECT_EQ(control_plane.outstanding(id), 1U);
}

TEST_F(ControlPlaneTest, ShortfallIsRetriedWhenNodeArrives) {
    auto w1 = worker("w1", Resources{2, 2048, 0});
    auto late = sim.reserve_request();
    auto ctrl = controller({w1, late.vm});
    auto web = apply(1.0, ctrl, 3);

    sim.run({.end_time = time(4.0)});
    EXPECT_EQ(deployment(web).current, 2U);
    EXPECT_EQ(deployment(web).state, DeploymentState::Degraded);
    EXPECT_EQ(control_plane.outstanding(web), 1U);

    RequestArrival arrival;
    arrival.request = late.request;
    arrival.vm = late.vm;
    arrival.name = "w2";
    arrival.demand = Resources{2, 2048, 0};
    sim.submit_request(time(5.0), arrival);
    sim.run();

    EXPECT_EQ(deployment(web).state, DeploymentState::Running);
    EXPECT_EQ(replica_nodes(web), (std::vector<VmId>{w1, w1, late.vm}));
}

TEST_F(ControlPlaneTest, OversizedReplicaIsNeverPlaced) {
    auto w1 = worker("w1", Resources{4, 4096, 0});
    auto ctrl = controller({w1});
    auto web = apply(1.0, ctrl, 2, Resources{8, 512, 0});

    sim.run();

    EXPECT_EQ(deployment(web).state, DeploymentState::Pending);
    EXPECT_TRUE(deployment(web).replicas.empty());
    EXPECT_EQ(control_plane.outstanding(web), 2U);
    EXPECT_EQ(running_containers(), 0U);
}

TEST_F(ControlPlaneTest, ScaleDownRetiresNewestFirst) {
    auto w1 = worker("w1", Resources{8, 8192, 0});
    auto ctrl = controller({w1});
    auto web = apply(1.0, ctrl, 4);
    scale(5.0, web, 2);

    auto report = sim.run();

    EXPECT_TRUE(report.faults.empty());
    EXPECT_EQ(serials(web), (std::vector<uint64_t>{0, 1}));
    EXPECT_EQ(deployment(web).state, DeploymentState::Running);
    EXPECT_EQ(running_containers(), 2U);
    EXPECT_EQ(sim.datacenter().vm_free(w1), (Resources{6, 7168, 0}));
}

TEST_F(ControlPlaneTest, ScaleUpAddsReplicas) {
    auto w1 = worker("w1", Resources{8, 8192, 0});
    auto ctrl = controller({w1});
    auto web = apply(1.0, ctrl, 1);
    scale(5.0, web, 3);

    sim.run();

    EXPECT_EQ(serials(web), (std::vector<uint64_t>{0, 1, 2}));
    EXPECT_EQ(deployment(web).state, DeploymentState::Running);
}

TEST_F(ControlPlaneTest, LostReplicaIsNotReplaced) {
    auto w1 = worker("w1", Resources{8, 8192, 0});
    auto ctrl = controller({w1});
    auto web = apply(1.0, ctrl, 2);
    sim.run();
    ASSERT_EQ(deployment(web).state, DeploymentState::Running);

    WorkloadId lost = deployment(web).replicas[1].containers[0];
    sim.kernel().schedule(TopicKind::ContainerStop, time(5.0), WorkloadNotice{lost, w1, std::nullopt});
    sim.run();

    EXPECT_EQ(deployment(web).state, DeploymentState::Degraded);
    EXPECT_EQ(deployment(web).replicas.size(), 1U);
    EXPECT_EQ(control_plane.outstanding(web), 0U);

    // An operator scale to the same count recomputes the shortfall
    scale(10.0, web, 2);
    sim.run();
    EXPECT_EQ(deployment(web).state, DeploymentState::Running);
    EXPECT_EQ(serials(web), (std::vector<uint64_t>{0, 2}));
}

TEST_F(ControlPlaneTest, DeleteStopsAllReplicas) {
    auto w1 = worker("w1", Resources{8, 8192, 0});
    auto ctrl = controller({w1});
    auto web = apply(1.0, ctrl, 3);
    sim.submit_action(time(4.0), "delete-web",
                      {ActionStep{Duration::zero(), DeleteDeployment{web}}});

    sim.run();

    EXPECT_EQ(deployment(web).state, DeploymentState::Stopped);
    EXPECT_TRUE(deployment(web).replicas.empty());
    EXPECT_EQ(running_containers(), 0U);
    EXPECT_TRUE(sim.datacenter().vm_idle(w1));
}

TEST_F(ControlPlaneTest, NodeReleaseTakesReplicasDown) {
    auto w1 = worker("w1", Resources{8, 8192, 0});
    auto ctrl = controller({w1});
    auto web = apply(1.0, ctrl, 2);
    sim.kernel().schedule(TopicKind::RequestStop, time(5.0), RequestNotice{requests[0], {}});

    auto report = sim.run();

    EXPECT_TRUE(report.faults.empty());
    EXPECT_EQ(sim.datacenter().vms().at(w1).status, VmStatus::Deallocated);
    EXPECT_TRUE(deployment(web).replicas.empty());
    EXPECT_EQ(deployment(web).state, DeploymentState::Pending);
    EXPECT_EQ(control_plane.outstanding(web), 0U);
}
