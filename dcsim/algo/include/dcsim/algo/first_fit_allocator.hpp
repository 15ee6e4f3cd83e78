#pragma once

#include <dcsim/core/allocator.hpp>

namespace dcsim::algo {

/// @brief First-fit VM placement.
///
/// Probes the PMs in id order and returns the first one whose available
/// capacity holds the demand. First-fit favours filling the earlier PMs,
/// which leaves the later ones empty.
///
/// @ingroup algo_allocators
/// @see BestFitAllocator, WorstFitAllocator
class FirstFitAllocator : public core::Allocator {
public:
    [[nodiscard]] std::optional<core::PmId> select_pm(
        const core::Resources& demand, std::span<const core::PhysicalMachine> pool) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "first-fit"; }
};

} // namespace dcsim::algo
