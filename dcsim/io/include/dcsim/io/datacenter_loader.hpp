#pragma once

/// @file datacenter_loader.hpp
/// @brief Loading datacenter descriptions (the PM pool) from JSON.
/// @ingroup io_loaders

#include <dcsim/core/simulation.hpp>
#include <dcsim/core/types.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dcsim::io {

/// @brief One physical machine of a datacenter description.
/// @ingroup io_loaders
struct HostSpec {
    std::string name;
    core::Resources capacity;
};

/// @brief A datacenter description: a named pool of hosts.
///
/// The JSON form is
/// @code{.json}
/// {"name": "dc",
///  "hosts": [{"name": "rack", "cpu": 16, "ram": 65536, "gpu": 0, "count": 4}]}
/// @endcode
/// A host with `count > 1` expands to `rack-0` ... `rack-3`.
///
/// @ingroup io_loaders
/// @see load_datacenter, apply_datacenter
struct DatacenterData {
    std::string name;
    std::vector<HostSpec> hosts;  ///< Expanded, in PM id order.
};

/// @brief Load a datacenter description from a JSON file.
/// @throws LoaderError if the file cannot be read or fails validation.
/// @see load_datacenter_from_string
DatacenterData load_datacenter(const std::filesystem::path& path);

/// @brief Load a datacenter description from a JSON string.
/// @throws LoaderError if the JSON is malformed or fails validation.
DatacenterData load_datacenter_from_string(std::string_view json);

/// @brief Add every host of @p data to the simulation as a PM.
void apply_datacenter(core::Simulation& simulation, const DatacenterData& data);

} // namespace dcsim::io
