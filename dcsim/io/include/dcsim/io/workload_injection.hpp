#pragma once

/// @file workload_injection.hpp
/// @brief Feeding loaded workload data into a simulation.
/// @ingroup io_loaders

#include <dcsim/io/workload_loader.hpp>
#include <dcsim/core/simulation.hpp>

#include <map>
#include <string>
#include <vector>

namespace dcsim::io {

/// @brief Ids assigned while injecting a workload, by entity name.
/// @ingroup io_loaders
struct InjectedWorkload {
    std::map<std::string, core::RequestHandle> requests;
    std::map<std::string, core::WorkloadId> workloads;
    std::map<std::string, core::DeploymentId> deployments;
    std::vector<core::ActionId> actions;  ///< In the order of WorkloadData::actions.
};

/// @brief Reserve ids for every entity of @p data and schedule the request
///        arrivals and action steps.
///
/// Names are resolved here: controller nodes name requests, steps name
/// deployments (created by an earlier or later `apply`), requests and
/// workloads. Requests are submitted before actions, each in file order,
/// which fixes the order of same-time arrivals.
///
/// @throws LoaderError if a name does not resolve or a controller
///         reference names a workload that is not a controller.
/// @throws core::InvalidTimeError if an arrival is before the simulation's
///         current time.
///
/// @see load_workload
InjectedWorkload inject_workload(core::Simulation& simulation, const WorkloadData& data);

} // namespace dcsim::io
