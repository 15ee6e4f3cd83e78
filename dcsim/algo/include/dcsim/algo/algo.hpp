#pragma once

/// @defgroup algo Algo Library
/// @brief Placement heuristics, admission and control-plane policies.
///
/// The algo library implements the pluggable policies on top of the core
/// kernel: first/best/worst-fit PM allocators, capacity-based admission,
/// the round-robin control plane placing deployment replicas, and the
/// standard interpreter for action steps. Depends on core only.

/// @defgroup algo_allocators Allocators
/// @ingroup algo
/// @brief VM-to-PM placement strategies.

/// @defgroup algo_policies Policies
/// @ingroup algo
/// @brief Admission, replica placement and action interpretation.

// Convenience header for the algo library
#include <dcsim/algo/error.hpp>
#include <dcsim/algo/first_fit_allocator.hpp>
#include <dcsim/algo/best_fit_allocator.hpp>
#include <dcsim/algo/worst_fit_allocator.hpp>
#include <dcsim/algo/capacity_admission.hpp>
#include <dcsim/algo/policy_factory.hpp>
#include <dcsim/algo/control_plane.hpp>
#include <dcsim/algo/standard_action_interpreter.hpp>
