#include <dcsim/algo/best_fit_allocator.hpp>
#include <dcsim/algo/placement_utils.hpp>

#include <limits>

namespace dcsim::algo {

std::optional<core::PmId> BestFitAllocator::select_pm(
    const core::Resources& demand, std::span<const core::PhysicalMachine> pool) {
    std::optional<core::PmId> best;
    double best_remaining = std::numeric_limits<double>::max();

    for (const auto& pm : pool) {
        if (pm_can_host(pm, demand)) {
            double remaining = remaining_share(pm, demand);
            if (remaining < best_remaining) {
                best_remaining = remaining;
                best = pm.id;
            }
        }
    }
    return best;
}

} // namespace dcsim::algo
