#pragma once

#include <dcsim/core/allocator.hpp>

namespace dcsim::algo {

/// @brief Best-fit VM placement.
///
/// Among all PMs that can host the VM, selects the one left with the least
/// free capacity after placement (see remaining_share()). Ties are broken
/// by PM id (lower id wins).
///
/// Best-fit packs VMs tightly, consolidating load onto fewer machines.
///
/// @ingroup algo_allocators
/// @see FirstFitAllocator, WorstFitAllocator
class BestFitAllocator : public core::Allocator {
public:
    /// @brief Select the admissible PM with the least remaining capacity.
    /// @return The tightest-fitting PM, or std::nullopt if none can host
    ///         the demand.
    [[nodiscard]] std::optional<core::PmId> select_pm(
        const core::Resources& demand, std::span<const core::PhysicalMachine> pool) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "best-fit"; }
};

} // namespace dcsim::algo
