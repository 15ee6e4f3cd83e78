#include "simulation_fixture.hpp"

#include <dcsim/core/error.hpp>
#include <dcsim/core/policy.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace dcsim::core;
using namespace dcsim::core::test_support;

namespace {

class ClosedAdmission : public AdmissionPolicy {
public:
    AdmissionVerdict evaluate(const Request&, const Datacenter&) override {
        ++consulted;
        return AdmissionVerdict::reject("closed for maintenance");
    }
    std::string_view name() const noexcept override { return "closed"; }

    int consulted{0};
};

// Always answers pm 0, full or not
class StubbornAllocator : public Allocator {
public:
    std::optional<PmId> select_pm(const Resources&, std::span<const PhysicalMachine>) override {
        return PmId{0};
    }
    std::string_view name() const noexcept override { return "stubborn"; }
};

} // namespace

class RequestLifecycleTest : public SimulationTest {};

TEST_F(RequestLifecycleTest, FullHostRejectsLaterRequestAtSameTick) {
    auto pm = sim.add_pm("pm0", Resources{4, 8192, 0});
    auto big = make_request("big", Resources{4, 1024, 0});
    auto small = make_request("small", Resources{2, 1024, 0});
    sim.submit_request(time(0.0), big);
    sim.submit_request(time(0.0), small);

    auto report = sim.run();

    EXPECT_EQ(report.state, KernelState::Drained);
    EXPECT_TRUE(report.faults.empty());
    EXPECT_EQ(topics(), (std::vector<std::string>{"request.arrive", "request.arrive",
                                                  "request.accept", "request.reject",
                                                  "vm.allocate"}));

    EXPECT_EQ(request(big).status, RequestStatus::Accepted);
    EXPECT_EQ(request(small).status, RequestStatus::Rejected);
    EXPECT_EQ(request(small).reason, "no capacity");
    EXPECT_EQ(vm(big).status, VmStatus::Allocated);
    EXPECT_EQ(vm(big).host, pm);
    EXPECT_EQ(vm(small).status, VmStatus::Unallocated);

    const auto& host = sim.datacenter().pm(pm);
    EXPECT_EQ(host.allocated, (Resources{4, 1024, 0}));
    EXPECT_EQ(host.reserved, Resources{});
}

TEST_F(RequestLifecycleTest, AdmittedRequestsSpreadOverHosts) {
    auto pm0 = sim.add_pm("pm0", Resources{4, 8192, 0});
    auto pm1 = sim.add_pm("pm1", Resources{4, 8192, 0});
    std::vector<RequestArrival> arrivals;
    for (int i = 0; i < 3; ++i) {
        arrivals.push_back(make_request("r" + std::to_string(i), Resources{3, 1024, 0}));
        sim.submit_request(time(1.0), arrivals.back());
    }

    sim.run();

    EXPECT_EQ(vm(arrivals[0]).host, pm0);
    EXPECT_EQ(vm(arrivals[1]).host, pm1);
    EXPECT_EQ(request(arrivals[2]).status, RequestStatus::Rejected);
    EXPECT_EQ(request(arrivals[0]).arrival_time, time(1.0));
    EXPECT_EQ(request(arrivals[0]).decided_at, time(1.0));
}

TEST_F(RequestLifecycleTest, SecondAcceptIsDiscarded) {
    sim.add_pm("pm0", Resources{4, 8192, 0});
    auto r = make_request("r", Resources{2, 1024, 0});
    sim.submit_request(time(0.0), r);
    sim.kernel().schedule(TopicKind::RequestAccept, time(1.0), RequestNotice{r.request, {}});
    sim.kernel().schedule(TopicKind::RequestReject, time(2.0), RequestNotice{r.request, "late"});

    auto report = sim.run();

    EXPECT_EQ(report.state, KernelState::Drained);
    EXPECT_EQ(request(r).status, RequestStatus::Accepted);
    EXPECT_EQ(request(r).decided_at, time(0.0));
    EXPECT_TRUE(request(r).reason.empty());
    ASSERT_EQ(report.faults.size(), 2U);
    EXPECT_EQ(report.faults[0].kind, FaultKind::InvariantViolation);
    EXPECT_EQ(report.faults[0].topic, "request.accept");
    EXPECT_EQ(report.faults[0].source, "request-lifecycle");
    EXPECT_EQ(report.faults[1].topic, "request.reject");

    // Only the genuine accept created work
    EXPECT_EQ(times_of(TopicKind::VmAllocate).size(), 1U);
}

TEST_F(RequestLifecycleTest, DuplicateArrivalIsDiscarded) {
    sim.add_pm("pm0", Resources{4, 8192, 0});
    auto r = make_request("r", Resources{2, 1024, 0});
    sim.submit_request(time(0.0), r);
    sim.submit_request(time(1.0), r);

    auto report = sim.run();

    EXPECT_EQ(count_faults(FaultKind::InvariantViolation), 1U);
    EXPECT_EQ(request(r).status, RequestStatus::Accepted);
    EXPECT_EQ(request(r).arrival_time, time(0.0));
    EXPECT_EQ(sim.datacenter().pm(PmId{0}).allocated, (Resources{2, 1024, 0}));
    EXPECT_EQ(report.state, KernelState::Drained);
}

TEST_F(RequestLifecycleTest, RejectedRequiredRequestAbortsRun) {
    sim.add_pm("pm0", Resources{4, 8192, 0});
    auto r = make_request("critical", Resources{8, 1024, 0});
    r.required = true;
    sim.submit_request(time(2.0), r);
    auto later = make_request("later", Resources{1, 512, 0});
    sim.submit_request(time(5.0), later);

    auto report = sim.run();

    EXPECT_EQ(report.state, KernelState::Aborted);
    EXPECT_EQ(report.time, time(2.0));
    ASSERT_FALSE(report.faults.empty());
    EXPECT_EQ(report.faults.back().kind, FaultKind::KernelFault);
    EXPECT_EQ(report.faults.back().topic, "request.reject");
    EXPECT_NE(report.faults.back().message.find("critical"), std::string::npos);
    EXPECT_EQ(request(r).status, RequestStatus::Rejected);
    EXPECT_FALSE(sim.datacenter().requests().contains(later.request));
    EXPECT_THROW(sim.run(), InvalidStateError);
}

TEST_F(RequestLifecycleTest, AdmissionPolicyRefusalRejects) {
    sim.add_pm("pm0", Resources{4, 8192, 0});
    auto policy = std::make_unique<ClosedAdmission>();
    auto* closed = policy.get();
    sim.set_admission_policy(std::move(policy));
    auto r = make_request("r", Resources{1, 512, 0});
    sim.submit_request(time(0.0), r);

    sim.run();

    EXPECT_EQ(closed->consulted, 1);
    EXPECT_EQ(request(r).status, RequestStatus::Rejected);
    EXPECT_EQ(request(r).reason, "closed for maintenance");
    EXPECT_EQ(sim.datacenter().pm(PmId{0}).reserved, Resources{});
}

TEST_F(RequestLifecycleTest, MissingAllocatorLeavesRequestUndecided) {
    sim.add_pm("pm0", Resources{4, 8192, 0});
    sim.set_allocator(nullptr);
    auto r = make_request("r", Resources{1, 512, 0});
    sim.submit_request(time(0.0), r);

    auto report = sim.run();

    EXPECT_EQ(report.state, KernelState::Drained);
    EXPECT_EQ(count_faults(FaultKind::SubscriberFault), 1U);
    EXPECT_EQ(request(r).status, RequestStatus::Arrived);
    EXPECT_EQ(vm(r).status, VmStatus::Unallocated);
}

TEST_F(RequestLifecycleTest, AllocatorCannotOvercommit) {
    sim.set_allocator(std::make_unique<StubbornAllocator>());
    sim.add_pm("pm0", Resources{2, 8192, 0});
    auto fits = make_request("fits", Resources{2, 1024, 0});
    auto overflow = make_request("overflow", Resources{1, 1024, 0});
    sim.submit_request(time(0.0), fits);
    sim.submit_request(time(0.0), overflow);

    sim.run();

    EXPECT_EQ(request(fits).status, RequestStatus::Accepted);
    EXPECT_EQ(request(overflow).status, RequestStatus::Rejected);
    ASSERT_EQ(count_faults(FaultKind::InvariantViolation), 1U);
    EXPECT_EQ(sim.kernel().faults()[0].source, "stubborn");
    EXPECT_EQ(sim.datacenter().pm(PmId{0}).allocated, (Resources{2, 1024, 0}));
}

TEST_F(RequestLifecycleTest, AcceptedRequestLaunchesItsWorkloads) {
    sim.add_pm("pm0", Resources{8, 8192, 0});
    auto r = make_request("r", Resources{4, 4096, 0}, 2);
    r.launches[0].demand = Resources{1, 512, 0};
    r.launches[1].kind = WorkloadKind::Controller;
    r.launches[1].demand = Resources{1, 256, 0};
    sim.submit_request(time(0.0), r);

    sim.run();

    EXPECT_EQ(topics(), (std::vector<std::string>{"request.arrive", "request.accept",
                                                  "vm.allocate", "app.start",
                                                  "controller.start"}));
    EXPECT_EQ(workload(r.launches[0].workload).status, WorkloadStatus::Running);
    EXPECT_EQ(workload(r.launches[1].workload).kind, WorkloadKind::Controller);
    EXPECT_EQ(vm(r).used, (Resources{2, 768, 0}));
}

TEST_F(RequestLifecycleTest, RejectedRequestLaunchesNothing) {
    sim.add_pm("pm0", Resources{1, 1024, 0});
    auto r = make_request("r", Resources{4, 4096, 0}, 1);
    sim.submit_request(time(0.0), r);

    sim.run();

    EXPECT_EQ(request(r).status, RequestStatus::Rejected);
    EXPECT_FALSE(sim.datacenter().workloads().contains(r.launches[0].workload));
    EXPECT_TRUE(times_of(TopicKind::AppStart).empty());
}

TEST_F(RequestLifecycleTest, StopReleasesEverything) {
    auto pm = sim.add_pm("pm0", Resources{8, 8192, 0});
    auto r = make_request("r", Resources{4, 4096, 0}, 1);
    r.launches[0].demand = Resources{2, 1024, 0};
    sim.submit_request(time(0.0), r);
    sim.kernel().schedule(TopicKind::RequestStop, time(5.0), RequestNotice{r.request, {}});

    auto report = sim.run();

    EXPECT_TRUE(report.faults.empty());
    EXPECT_EQ(request(r).status, RequestStatus::Stopped);
    EXPECT_EQ(request(r).stopped_at, time(5.0));
    EXPECT_EQ(workload(r.launches[0].workload).status, WorkloadStatus::Stopped);
    EXPECT_EQ(vm(r).status, VmStatus::Deallocated);
    EXPECT_EQ(sim.datacenter().pm(pm).allocated, Resources{});
    EXPECT_EQ(times_of(TopicKind::VmDeallocate), (std::vector<TimePoint>{time(5.0)}));
}

TEST_F(RequestLifecycleTest, OnlyAcceptedRequestsStop) {
    sim.add_pm("pm0", Resources{1, 1024, 0});
    auto r = make_request("r", Resources{4, 4096, 0});
    sim.submit_request(time(0.0), r);
    sim.kernel().schedule(TopicKind::RequestStop, time(1.0), RequestNotice{r.request, {}});

    sim.run();

    EXPECT_EQ(request(r).status, RequestStatus::Rejected);
    EXPECT_EQ(count_faults(FaultKind::InvariantViolation), 1U);
    EXPECT_TRUE(times_of(TopicKind::VmDeallocate).empty());
}

TEST_F(RequestLifecycleTest, UnreservedIdsAreRefused) {
    RequestArrival bogus;
    bogus.request = RequestId{3};
    EXPECT_THROW(sim.submit_request(time(0.0), bogus), OutOfRangeError);
    EXPECT_EQ(sim.kernel().pending_events(), 0U);
}

TEST_F(RequestLifecycleTest, RepeatedStopIsIgnored) {
    auto pm = sim.add_pm("pm0", Resources{8, 8192, 0});
    auto r = make_request("r", Resources{4, 4096, 0});
    sim.submit_request(time(0.0), r);
    sim.kernel().schedule(TopicKind::RequestStop, time(5.0), RequestNotice{r.request, {}});
    sim.kernel().schedule(TopicKind::RequestStop, time(5.0), RequestNotice{r.request, {}});
    sim.kernel().schedule(TopicKind::RequestStop, time(6.0), RequestNotice{r.request, {}});

    auto report = sim.run();

    EXPECT_TRUE(report.faults.empty());
    EXPECT_EQ(request(r).stopped_at, time(5.0));
    EXPECT_EQ(times_of(TopicKind::VmDeallocate).size(), 1U);
    EXPECT_EQ(sim.datacenter().pm(pm).allocated, Resources{});
}

TEST_F(RequestLifecycleTest, StopInArrivalTickWaitsForAccept) {
    auto pm = sim.add_pm("pm0", Resources{8, 8192, 0});
    auto r = make_request("r", Resources{4, 4096, 0}, 1);
    r.launches[0].demand = Resources{1, 512, 0};
    sim.submit_request(time(0.0), r);
    sim.kernel().schedule(TopicKind::RequestStop, time(0.0), RequestNotice{r.request, {}});

    auto report = sim.run();

    EXPECT_TRUE(report.faults.empty());
    EXPECT_EQ(request(r).status, RequestStatus::Stopped);
    EXPECT_EQ(request(r).stopped_at, time(0.0));
    EXPECT_FALSE(request(r).stop_pending);
    EXPECT_EQ(workload(r.launches[0].workload).status, WorkloadStatus::Stopped);
    EXPECT_EQ(sim.datacenter().pm(pm).allocated, Resources{});
    EXPECT_EQ(sim.datacenter().pm(pm).reserved, Resources{});
}

TEST_F(RequestLifecycleTest, StopInArrivalTickOfRejectedRequestIsDropped) {
    sim.add_pm("pm0", Resources{1, 1024, 0});
    auto r = make_request("r", Resources{4, 4096, 0});
    sim.submit_request(time(0.0), r);
    sim.kernel().schedule(TopicKind::RequestStop, time(0.0), RequestNotice{r.request, {}});

    auto report = sim.run();

    EXPECT_TRUE(report.faults.empty());
    EXPECT_EQ(request(r).status, RequestStatus::Rejected);
    EXPECT_FALSE(request(r).stop_pending);
    EXPECT_EQ(times_of(TopicKind::RequestStop).size(), 1U);
}

// =============================================================================
// Launch id ownership
// =============================================================================

TEST_F(RequestLifecycleTest, SharedLaunchIdIsRefusedAtSubmit) {
    sim.add_pm("pm0", Resources{8, 8192, 0});
    auto first = make_request("first", Resources{2, 1024, 0}, 1);
    auto second = make_request("second", Resources{2, 1024, 0});
    second.launches = first.launches;
    sim.submit_request(time(0.0), first);

    EXPECT_THROW(sim.submit_request(time(0.0), second), InvariantViolation);

    auto twice = make_request("twice", Resources{2, 1024, 0}, 1);
    twice.launches.push_back(twice.launches[0]);
    EXPECT_THROW(sim.submit_request(time(0.0), twice), InvariantViolation);

    EXPECT_EQ(sim.kernel().pending_events(), 1U);
}

TEST_F(RequestLifecycleTest, ConflictingLaunchRejectsAndReleasesReservation) {
    auto pm = sim.add_pm("pm0", Resources{8, 8192, 0});
    auto first = make_request("first", Resources{4, 4096, 0}, 1);
    first.launches[0].demand = Resources{1, 512, 0};
    auto second = make_request("second", Resources{4, 4096, 0});
    second.launches = first.launches;
    sim.submit_request(time(0.0), first);
    // Bypasses the submit-time check
    sim.kernel().schedule(TopicKind::RequestArrive, time(0.0), second);

    auto report = sim.run();

    EXPECT_EQ(report.state, KernelState::Drained);
    EXPECT_EQ(request(first).status, RequestStatus::Accepted);
    EXPECT_EQ(request(second).status, RequestStatus::Rejected);
    EXPECT_EQ(count_faults(FaultKind::InvariantViolation), 1U);
    EXPECT_EQ(report.faults[0].source, "request-lifecycle");

    EXPECT_EQ(vm(second).status, VmStatus::Unallocated);
    EXPECT_FALSE(vm(second).reservation.has_value());
    EXPECT_TRUE(vm(second).workloads.empty());
    EXPECT_EQ(workload(first.launches[0].workload).host, first.vm);
    EXPECT_EQ(sim.datacenter().pm(pm).reserved, Resources{});
    EXPECT_EQ(sim.datacenter().pm(pm).allocated, (Resources{4, 4096, 0}));
}
