#pragma once

/// @file workload_loader.hpp
/// @brief Data structures and loading of workload files (requests and
///        operator actions) from JSON.
/// @ingroup io_loaders

#include <dcsim/core/entities.hpp>
#include <dcsim/core/types.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dcsim::io {

/// @brief A workload launched inside a request's VM once it is accepted.
///
/// @ingroup io_loaders
/// @see RequestSpec
struct WorkloadSpec {
    core::WorkloadKind kind{core::WorkloadKind::App};
    std::string name;                     ///< Unique across the workload file.
    core::Resources demand;
    std::optional<core::Duration> run_for;
    std::vector<std::string> nodes;       ///< Request names (controllers only).
};

/// @brief A tenant request for one VM.
/// @ingroup io_loaders
struct RequestSpec {
    std::string name;
    core::TimePoint arrival;
    core::Resources demand;
    bool required{false};
    bool ignored{false};
    bool release_when_idle{false};
    std::vector<WorkloadSpec> workloads;
};

/// @brief Kind of an action step, as spelled in JSON.
/// @ingroup io_loaders
enum class StepKind {
    Apply,        ///< `"apply"`
    Scale,        ///< `"scale"`
    Delete,       ///< `"delete"`
    StopRequest,  ///< `"stop_request"`
    Start,        ///< `"start"`
    Stop,         ///< `"stop"`
    Log           ///< `"log"`
};

/// @brief One step of an action, with entity references still by name.
///
/// Only the fields relevant to @ref kind are meaningful.
///
/// @ingroup io_loaders
struct StepSpec {
    StepKind kind{StepKind::Log};
    core::Duration delay;                       ///< After the previous step.
    std::string deployment;                     ///< apply, scale, delete
    std::string controller;                     ///< apply (optional)
    uint64_t replicas{0};                       ///< apply, scale
    std::vector<core::ContainerSpec> containers;  ///< apply
    std::string request;                        ///< stop_request
    std::string workload;                       ///< start, stop
    std::string message;                        ///< log
};

/// @brief A timed operator script.
/// @ingroup io_loaders
struct ActionSpec {
    std::string name;
    core::TimePoint arrival;
    std::vector<StepSpec> steps;
};

/// @brief Complete workload definition.
///
/// Loaded from JSON via @ref load_workload, or built programmatically, then
/// fed to a simulation with inject_workload().
///
/// @ingroup io_loaders
struct WorkloadData {
    std::vector<RequestSpec> requests;
    std::vector<ActionSpec> actions;
};

/// @brief Parse a step kind string.
/// @throws LoaderError for unknown kinds.
[[nodiscard]] StepKind parse_step_kind(std::string_view text);

/// @brief Load a workload from a JSON file.
/// @throws LoaderError if the file cannot be read or fails validation.
/// @see load_workload_from_string, inject_workload
WorkloadData load_workload(const std::filesystem::path& path);

/// @brief Load a workload from a JSON string.
///
/// Validates structure, types, per-step fields and name uniqueness.
/// References between entities (controller nodes, step targets) are only
/// resolved at injection.
///
/// @throws LoaderError if the JSON is malformed or fails validation.
WorkloadData load_workload_from_string(std::string_view json);

} // namespace dcsim::io
