#pragma once

#include <dcsim/core/allocator.hpp>
#include <dcsim/core/datacenter.hpp>
#include <dcsim/core/deployment_manager.hpp>
#include <dcsim/core/entities.hpp>
#include <dcsim/core/kernel.hpp>
#include <dcsim/core/lifecycle.hpp>
#include <dcsim/core/policy.hpp>
#include <dcsim/core/types.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace dcsim::core {

/// @brief Ids reserved for a request before it arrives.
/// @see Simulation::reserve_request
/// @ingroup core_engine
struct RequestHandle {
    RequestId request;
    VmId vm;
    std::vector<WorkloadId> workloads;  ///< One per launched workload.
};

/// @brief A complete, independent simulation run.
///
/// The Simulation is the explicit context passed to everything that takes
/// part in a run: it owns the Kernel, the entity arenas, the
/// DeploymentManager, the built-in lifecycle handlers and the pluggable
/// policies. There is no global state, so several simulations can live in
/// one process.
///
/// Lifecycle handlers are subscribed at construction, before any policy,
/// so policies always observe entity state after the core has applied an
/// event.
///
/// @code
/// core::Simulation sim;
/// sim.add_pm("pm0", {.cpu = 4, .ram = 8192});
/// sim.set_allocator(std::make_unique<algo::FirstFitAllocator>());
/// auto handle = sim.reserve_request();
/// sim.submit_request(core::time_from_seconds(0.0),
///                    {.request = handle.request, .vm = handle.vm,
///                     .name = "r0", .demand = {.cpu = 2, .ram = 1024}});
/// auto report = sim.run();
/// @endcode
///
/// @ingroup core_engine
class Simulation {
public:
    Simulation();
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    Simulation(Simulation&&) = delete;
    Simulation& operator=(Simulation&&) = delete;

    [[nodiscard]] Kernel& kernel() noexcept { return kernel_; }
    [[nodiscard]] const Kernel& kernel() const noexcept { return kernel_; }
    [[nodiscard]] Datacenter& datacenter() noexcept { return datacenter_; }
    [[nodiscard]] const Datacenter& datacenter() const noexcept { return datacenter_; }
    [[nodiscard]] DeploymentManager& deployments() noexcept { return deployments_; }

    [[nodiscard]] TimePoint now() const noexcept { return kernel_.now(); }

    /// @brief Add a physical machine to the pool.
    PmId add_pm(std::string name, Resources capacity);

    /// @brief Create an Unallocated VM that belongs to no request.
    VmId add_vm(std::string name, Resources demand);

    // -- Policies --------------------------------------------------------------

    void set_allocator(std::unique_ptr<Allocator> allocator) noexcept;
    [[nodiscard]] Allocator* allocator() const noexcept { return allocator_.get(); }

    /// @brief Install an admission gate. Without one, every request goes
    ///        straight to placement.
    void set_admission_policy(std::unique_ptr<AdmissionPolicy> policy) noexcept;
    [[nodiscard]] AdmissionPolicy* admission_policy() const noexcept { return admission_.get(); }

    void set_action_interpreter(std::unique_ptr<ActionInterpreter> interpreter) noexcept;
    [[nodiscard]] ActionInterpreter* action_interpreter() const noexcept {
        return interpreter_.get();
    }

    // -- Drivers ---------------------------------------------------------------

    /// @brief Reserve ids for a request, its VM and @p workloads launches.
    RequestHandle reserve_request(std::size_t workloads = 0);

    /// @brief Reserve an id for a deployment created later by an action.
    DeploymentId reserve_deployment();

    /// @brief Schedule `request.arrive` at @p arrival.
    /// @throws OutOfRangeError if an id in @p request was not reserved.
    /// @throws InvariantViolation if a launch id is repeated or belongs to
    ///         an earlier submission.
    /// @throws InvalidTimeError if @p arrival is in the past.
    void submit_request(TimePoint arrival, RequestArrival request);

    /// @brief Register an action and schedule its first step.
    ///
    /// The first step runs at `arrival + steps[0].delay`.
    ///
    /// @throws InvalidTimeError if the first step would be in the past.
    ActionId submit_action(TimePoint arrival, std::string name, std::vector<ActionStep> steps);

    /// @brief Run the kernel.
    RunReport run(RunLimits limits = {});

private:
    Kernel kernel_;
    Datacenter datacenter_;
    DeploymentManager deployments_;
    RequestLifecycle requests_;
    VmLifecycle vms_;
    WorkloadLifecycle workloads_;
    ActionRunner actions_;

    std::unique_ptr<Allocator> allocator_;
    std::unique_ptr<AdmissionPolicy> admission_;
    std::unique_ptr<ActionInterpreter> interpreter_;

    // Launch ids handed to submitted requests
    std::unordered_set<WorkloadId> claimed_workloads_;
};

} // namespace dcsim::core
