#pragma once

/// @file policy_factory.hpp
/// @brief Construction of built-in policies by name.
/// @ingroup algo_policies

#include <dcsim/core/allocator.hpp>
#include <dcsim/core/policy.hpp>

#include <memory>
#include <string_view>
#include <vector>

namespace dcsim::algo {

/// @brief Create a PM allocator from its name.
///
/// Accepted names: `first-fit`, `best-fit`, `worst-fit`.
///
/// @throws UnknownPolicyError for any other name.
[[nodiscard]] std::unique_ptr<core::Allocator> make_allocator(std::string_view name);

/// @brief Create an admission policy from its name.
///
/// Accepted names: `capacity` (CapacityAdmission) and `none`, which returns
/// nullptr: every request goes straight to placement.
///
/// @throws UnknownPolicyError for any other name.
[[nodiscard]] std::unique_ptr<core::AdmissionPolicy> make_admission_policy(std::string_view name);

/// @brief Names accepted by make_allocator(), in display order.
[[nodiscard]] std::vector<std::string_view> allocator_names();

} // namespace dcsim::algo
