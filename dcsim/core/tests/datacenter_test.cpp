#include <dcsim/core/datacenter.hpp>
#include <dcsim/core/error.hpp>

#include <gtest/gtest.h>

#include <string>
#include <utility>

using namespace dcsim::core;

class DatacenterTest : public ::testing::Test {
protected:
    VmId make_vm(const std::string& name, Resources demand) {
        VmId id = dc.vms().reserve();
        VirtualMachine vm;
        vm.id = id;
        vm.name = name;
        vm.demand = demand;
        dc.vms().emplace(id, std::move(vm));
        return id;
    }

    WorkloadId make_app(VmId host, Resources demand) {
        Workload app;
        app.kind = WorkloadKind::App;
        app.name = "app" + std::to_string(dc.workloads().capacity());
        app.host = host;
        app.demand = demand;
        WorkloadId id = dc.workloads().reserve();
        dc.add_workload(id, std::move(app));
        return id;
    }

    Datacenter dc;
};

TEST_F(DatacenterTest, PmsAreIndexedById) {
    auto a = dc.add_pm("a", Resources{4, 4096, 0});
    auto b = dc.add_pm("b", Resources{8, 8192, 1});

    EXPECT_EQ(a.value, 0U);
    EXPECT_EQ(b.value, 1U);
    ASSERT_EQ(dc.pms().size(), 2U);
    EXPECT_EQ(dc.pm(b).name, "b");
    EXPECT_EQ(dc.pm(b).available(), (Resources{8, 8192, 1}));
    EXPECT_THROW((void)dc.pm(PmId{2}), OutOfRangeError);
}

TEST_F(DatacenterTest, ReservationBecomesAllocation) {
    auto pm = dc.add_pm("pm", Resources{4, 4096, 0});
    auto vm = make_vm("vm", Resources{3, 1024, 0});

    dc.reserve_placement(vm, pm);
    EXPECT_EQ(dc.pm(pm).reserved, (Resources{3, 1024, 0}));
    EXPECT_EQ(dc.pm(pm).available(), (Resources{1, 3072, 0}));

    dc.bind_vm(vm, pm);
    EXPECT_EQ(dc.pm(pm).reserved, Resources{});
    EXPECT_EQ(dc.pm(pm).allocated, (Resources{3, 1024, 0}));
    EXPECT_EQ(dc.vms().at(vm).status, VmStatus::Allocated);
    EXPECT_EQ(dc.vms().at(vm).host, pm);
    EXPECT_FALSE(dc.vms().at(vm).reservation.has_value());
    EXPECT_EQ(dc.pm(pm).hosted_vms.count(vm), 1U);
}

TEST_F(DatacenterTest, ReservationsCountAgainstCapacity) {
    auto pm = dc.add_pm("pm", Resources{4, 4096, 0});
    auto first = make_vm("first", Resources{3, 1024, 0});
    auto second = make_vm("second", Resources{2, 1024, 0});

    dc.reserve_placement(first, pm);
    EXPECT_THROW(dc.reserve_placement(second, pm), InvariantViolation);
    EXPECT_THROW(dc.bind_vm(second, pm), InvariantViolation);

    EXPECT_FALSE(dc.vms().at(second).reservation.has_value());
    EXPECT_EQ(dc.vms().at(second).status, VmStatus::Unallocated);
    EXPECT_EQ(dc.pm(pm).reserved, (Resources{3, 1024, 0}));
    EXPECT_EQ(dc.pm(pm).allocated, Resources{});
}

TEST_F(DatacenterTest, EveryComponentMustFit) {
    auto pm = dc.add_pm("pm", Resources{16, 1024, 0});
    auto gpu_vm = make_vm("gpu", Resources{1, 128, 1});
    auto ram_vm = make_vm("ram", Resources{1, 2048, 0});

    EXPECT_THROW(dc.bind_vm(gpu_vm, pm), InvariantViolation);
    EXPECT_THROW(dc.bind_vm(ram_vm, pm), InvariantViolation);
    EXPECT_EQ(dc.pm(pm).allocated, Resources{});
}

TEST_F(DatacenterTest, BindElsewhereReleasesReservation) {
    auto a = dc.add_pm("a", Resources{4, 4096, 0});
    auto b = dc.add_pm("b", Resources{4, 4096, 0});
    auto vm = make_vm("vm", Resources{2, 1024, 0});

    dc.reserve_placement(vm, a);
    dc.bind_vm(vm, b);

    EXPECT_EQ(dc.pm(a).reserved, Resources{});
    EXPECT_EQ(dc.pm(b).allocated, (Resources{2, 1024, 0}));
}

TEST_F(DatacenterTest, DoubleReservationIsRejected) {
    auto pm = dc.add_pm("pm", Resources{8, 8192, 0});
    auto vm = make_vm("vm", Resources{2, 1024, 0});

    dc.reserve_placement(vm, pm);
    EXPECT_THROW(dc.reserve_placement(vm, pm), InvariantViolation);
    EXPECT_EQ(dc.pm(pm).reserved, (Resources{2, 1024, 0}));

    dc.release_reservation(vm);
    dc.release_reservation(vm);
    EXPECT_EQ(dc.pm(pm).reserved, Resources{});
}

TEST_F(DatacenterTest, UnbindFreesCapacityOnce) {
    auto pm = dc.add_pm("pm", Resources{4, 4096, 0});
    auto vm = make_vm("vm", Resources{4, 4096, 0});

    EXPECT_THROW(dc.unbind_vm(vm), InvariantViolation);

    dc.bind_vm(vm, pm);
    dc.unbind_vm(vm);

    EXPECT_EQ(dc.vms().at(vm).status, VmStatus::Deallocated);
    EXPECT_EQ(dc.pm(pm).allocated, Resources{});
    EXPECT_TRUE(dc.pm(pm).hosted_vms.empty());
    EXPECT_THROW(dc.unbind_vm(vm), InvariantViolation);
    EXPECT_THROW(dc.bind_vm(vm, pm), InvariantViolation);
}

TEST_F(DatacenterTest, WorkloadsConsumeVmCapacity) {
    auto pm = dc.add_pm("pm", Resources{8, 8192, 0});
    auto vm = make_vm("vm", Resources{4, 4096, 0});
    auto first = make_app(vm, Resources{3, 1024, 0});
    auto second = make_app(vm, Resources{2, 1024, 0});

    // Not placed yet
    EXPECT_THROW(dc.start_workload(first), InvariantViolation);

    dc.bind_vm(vm, pm);
    dc.start_workload(first);
    EXPECT_EQ(dc.vm_free(vm), (Resources{1, 3072, 0}));
    EXPECT_FALSE(dc.vm_idle(vm));

    EXPECT_THROW(dc.start_workload(second), InvariantViolation);
    EXPECT_THROW(dc.start_workload(first), InvariantViolation);
    EXPECT_EQ(dc.workloads().at(second).status, WorkloadStatus::Stopped);

    dc.stop_workload(first);
    EXPECT_TRUE(dc.vm_idle(vm));
    EXPECT_EQ(dc.vm_free(vm), (Resources{4, 4096, 0}));
    EXPECT_THROW(dc.stop_workload(first), InvariantViolation);

    dc.start_workload(second);
    EXPECT_EQ(dc.workloads().at(second).generation, 1U);
}

TEST_F(DatacenterTest, StartBumpsGeneration) {
    auto pm = dc.add_pm("pm", Resources{8, 8192, 0});
    auto vm = make_vm("vm", Resources{4, 4096, 0});
    auto app = make_app(vm, Resources{1, 128, 0});
    dc.bind_vm(vm, pm);

    dc.start_workload(app);
    dc.stop_workload(app);
    dc.start_workload(app);

    EXPECT_EQ(dc.workloads().at(app).generation, 2U);
    EXPECT_EQ(dc.workloads().at(app).starts, 2U);
}

TEST_F(DatacenterTest, AddWorkloadRecordsItOnTheVm) {
    auto vm = make_vm("vm", Resources{4, 4096, 0});
    auto app = make_app(vm, Resources{1, 128, 0});

    ASSERT_EQ(dc.vms().at(vm).workloads.size(), 1U);
    EXPECT_EQ(dc.vms().at(vm).workloads[0], app);
    EXPECT_EQ(dc.workloads().at(app).id, app);

    Workload orphan;
    orphan.host = VmId{42};
    EXPECT_THROW(dc.add_workload(dc.workloads().reserve(), orphan), OutOfRangeError);
}

TEST_F(DatacenterTest, EntityTableTracksReservedSlots) {
    auto& requests = dc.requests();
    auto id = requests.reserve();

    EXPECT_EQ(requests.capacity(), 1U);
    EXPECT_EQ(requests.size(), 0U);
    EXPECT_FALSE(requests.contains(id));
    EXPECT_EQ(requests.find(id), nullptr);
    EXPECT_THROW((void)requests.at(id), OutOfRangeError);
    EXPECT_THROW((void)requests.at(RequestId{9}), OutOfRangeError);

    Request request;
    request.id = id;
    requests.emplace(id, request);
    EXPECT_TRUE(requests.contains(id));
    EXPECT_EQ(requests.size(), 1U);
    EXPECT_THROW(requests.emplace(id, request), InvariantViolation);
    EXPECT_THROW(requests.emplace(RequestId{5}, request), OutOfRangeError);
}
