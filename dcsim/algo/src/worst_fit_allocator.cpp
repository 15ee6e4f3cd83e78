#include <dcsim/algo/worst_fit_allocator.hpp>
#include <dcsim/algo/placement_utils.hpp>

namespace dcsim::algo {

std::optional<core::PmId> WorstFitAllocator::select_pm(
    const core::Resources& demand, std::span<const core::PhysicalMachine> pool) {
    std::optional<core::PmId> worst;
    double worst_remaining = -1.0;

    for (const auto& pm : pool) {
        if (pm_can_host(pm, demand)) {
            double remaining = remaining_share(pm, demand);
            if (remaining > worst_remaining) {
                worst_remaining = remaining;
                worst = pm.id;
            }
        }
    }
    return worst;
}

} // namespace dcsim::algo
