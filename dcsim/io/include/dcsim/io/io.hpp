#pragma once

/// @defgroup io I/O Library
/// @brief JSON loading, workload injection, trace output and metrics.
///
/// The I/O library handles every external format: datacenter and workload
/// JSON files, injecting a loaded workload into a simulation, writing
/// traces (JSON, textual, in-memory) and computing post-run metrics.
/// Depends on core only.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Datacenter and workload JSON loaders, workload injection.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, textual, memory, and null trace writers.

/// @defgroup io_metrics Metrics
/// @ingroup io
/// @brief Post-run admission, placement and fault statistics.

// Convenience header for the I/O library
#include <dcsim/io/error.hpp>
#include <dcsim/io/trace_writers.hpp>
#include <dcsim/io/datacenter_loader.hpp>
#include <dcsim/io/workload_loader.hpp>
#include <dcsim/io/workload_injection.hpp>
#include <dcsim/io/metrics.hpp>
