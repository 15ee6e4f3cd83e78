#pragma once

/// @file metrics.hpp
/// @brief Post-run statistics of a simulation and their report formats.
/// @ingroup io_metrics

#include <dcsim/core/kernel.hpp>
#include <dcsim/core/simulation.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <ostream>
#include <string>
#include <string_view>

namespace dcsim::io {

/// @brief Aggregated outcome of a run.
///
/// Request counters exclude requests flagged `ignored`. Rates are rounded
/// to two decimals; the reject rate is `1 - accept_rate`, so the two always
/// add up to one when at least one request was counted.
///
/// @ingroup io_metrics
/// @see compute_metrics
struct SimulationMetrics {
    // -- Admission -----------------------------------------------------------

    uint64_t requests{0};  ///< Counted requests that arrived.
    uint64_t accepted{0};  ///< Accepted, whether stopped since or not.
    uint64_t rejected{0};
    uint64_t stopped{0};   ///< Accepted, then released.
    uint64_t pending{0};   ///< Arrived but still undecided.
    uint64_t ignored{0};   ///< Requests left out of the counters above.
    double accept_rate{0.0};
    double reject_rate{0.0};

    // -- Placement -----------------------------------------------------------

    uint64_t vm_allocations{0};    ///< VMs that were bound to a PM.
    uint64_t vm_deallocations{0};  ///< VMs released since.

    // -- Deployments ---------------------------------------------------------

    /// @brief Dispatched `deployment.*` events per topic.
    std::map<std::string, uint64_t> deployment_transitions;

    // -- Kernel --------------------------------------------------------------

    std::map<std::string, uint64_t> faults;  ///< Fault count per kind.
    uint64_t events_processed{0};
    double end_time{0.0};                    ///< Seconds.
    core::KernelState state{core::KernelState::Idle};
};

/// @brief Compute the metrics of @p simulation after a run.
/// @param report Report returned by the run.
SimulationMetrics compute_metrics(const core::Simulation& simulation,
                                  const core::RunReport& report);

/// @brief Print the admission summary.
///
/// @code
/// NAME@12.5> Accept[3 / 4] = 0.75
/// NAME@12.5> Reject[1 / 4] = 0.25
/// @endcode
void print_report(const SimulationMetrics& metrics, std::string_view name, std::ostream& out);

/// @brief Write every metric as a JSON object.
void write_metrics_json(const SimulationMetrics& metrics, std::ostream& out);

/// @brief Write every metric as JSON to a file.
/// @throws LoaderError if the file cannot be opened.
void write_metrics_json(const SimulationMetrics& metrics, const std::filesystem::path& path);

} // namespace dcsim::io
