#pragma once

#include <dcsim/core/allocator.hpp>

namespace dcsim::algo {

/// @brief Worst-fit VM placement.
///
/// Among all PMs that can host the VM, selects the one left with the most
/// free capacity after placement. Ties are broken by PM id (lower id
/// wins). Worst-fit spreads load across the pool.
///
/// @ingroup algo_allocators
/// @see FirstFitAllocator, BestFitAllocator
class WorstFitAllocator : public core::Allocator {
public:
    [[nodiscard]] std::optional<core::PmId> select_pm(
        const core::Resources& demand, std::span<const core::PhysicalMachine> pool) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "worst-fit"; }
};

} // namespace dcsim::algo
