#pragma once

/// @file error.hpp
/// @brief Exception type of the dcsim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace dcsim::io {

/// @brief Exception for I/O errors (reading, parsing, validation, name
///        resolution).
///
/// Thrown by loaders when JSON input is malformed, a required field is
/// missing or has the wrong type, or a value fails validation, and by
/// inject_workload() when a name does not resolve.
///
/// @ingroup io
/// @see load_datacenter, load_workload, inject_workload
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Where it happened: file path or JSON path
    ///                 (e.g. `requests[2].workloads[0]`).
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace dcsim::io
