#pragma once

#include <dcsim/core/allocator.hpp>
#include <dcsim/core/simulation.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dcsim::core::test_support {

/// Lowest-id PM with room, enough for the core tests.
class FirstAvailable : public Allocator {
public:
    std::optional<PmId> select_pm(const Resources& demand,
                                  std::span<const PhysicalMachine> pool) override {
        for (const auto& pm : pool) {
            if (demand.fits_in(pm.available())) {
                return pm.id;
            }
        }
        return std::nullopt;
    }

    std::string_view name() const noexcept override { return "first-available"; }
};

class SimulationTest : public ::testing::Test {
protected:
    SimulationTest() {
        sim.set_allocator(std::make_unique<FirstAvailable>());
    }

    TimePoint time(double seconds) {
        return time_from_seconds(seconds);
    }

    Duration seconds(double s) {
        return duration_from_seconds(s);
    }

    /// Reserve ids for a request launching @p workloads apps.
    RequestArrival make_request(std::string name, Resources demand, std::size_t workloads = 0) {
        auto handle = sim.reserve_request(workloads);
        RequestArrival arrival;
        arrival.request = handle.request;
        arrival.vm = handle.vm;
        arrival.name = std::move(name);
        arrival.demand = demand;
        for (std::size_t i = 0; i < workloads; ++i) {
            WorkloadLaunch launch;
            launch.workload = handle.workloads[i];
            launch.name = arrival.name + "/w" + std::to_string(i);
            arrival.launches.push_back(std::move(launch));
        }
        return arrival;
    }

    const Request& request(const RequestArrival& arrival) const {
        return sim.datacenter().requests().at(arrival.request);
    }

    const VirtualMachine& vm(const RequestArrival& arrival) const {
        return sim.datacenter().vms().at(arrival.vm);
    }

    const Workload& workload(WorkloadId id) const {
        return sim.datacenter().workloads().at(id);
    }

    std::vector<std::string> topics() const {
        std::vector<std::string> names;
        for (const auto& event : sim.kernel().event_log()) {
            names.emplace_back(event.topic.name());
        }
        return names;
    }

    std::vector<TimePoint> times_of(const Topic& topic) const {
        std::vector<TimePoint> times;
        for (const auto& event : sim.kernel().event_log()) {
            if (event.topic == topic) {
                times.push_back(event.timestamp);
            }
        }
        return times;
    }

    std::size_t count_faults(FaultKind kind) const {
        const auto& faults = sim.kernel().faults();
        return static_cast<std::size_t>(std::count_if(
            faults.begin(), faults.end(), [kind](const Fault& f) { return f.kind == kind; }));
    }

    Simulation sim;
};

} // namespace dcsim::core::test_support
