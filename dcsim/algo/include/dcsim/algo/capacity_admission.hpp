#pragma once

#include <dcsim/core/policy.hpp>

namespace dcsim::algo {

/// @brief Admission gate refusing requests no PM could ever host.
///
/// A request is admitted if its demand fits in the total capacity of at
/// least one PM, regardless of what is currently allocated. Requests that
/// pass may still be rejected for lack of free capacity at placement time.
///
/// @ingroup algo_policies
class CapacityAdmission : public core::AdmissionPolicy {
public:
    [[nodiscard]] core::AdmissionVerdict evaluate(const core::Request& request,
                                                  const core::Datacenter& datacenter) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "capacity"; }
};

} // namespace dcsim::algo
