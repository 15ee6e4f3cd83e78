#include <dcsim/algo/first_fit_allocator.hpp>
#include <dcsim/algo/placement_utils.hpp>

namespace dcsim::algo {

std::optional<core::PmId> FirstFitAllocator::select_pm(
    const core::Resources& demand, std::span<const core::PhysicalMachine> pool) {
    for (const auto& pm : pool) {
        if (pm_can_host(pm, demand)) {
            return pm.id;
        }
    }
    return std::nullopt;
}

} // namespace dcsim::algo
