#pragma once

/// @file placement_utils.hpp
/// @brief Scoring helpers shared by the PM allocators.
/// @ingroup algo_allocators

#include <dcsim/core/entities.hpp>
#include <dcsim/core/types.hpp>

namespace dcsim::algo {

/// @brief True if @p demand fits in what @p pm has left.
inline bool pm_can_host(const core::PhysicalMachine& pm, const core::Resources& demand) {
    return demand.fits_in(pm.available());
}

/// @brief Fraction of @p pm's capacity left free after placing @p demand.
///
/// Each component contributes its free share (0 = full, 1 = empty);
/// components the PM does not have are skipped. The result is the mean over
/// the counted components, so PMs of different sizes compare on the same
/// scale.
///
/// @pre pm_can_host(pm, demand)
inline double remaining_share(const core::PhysicalMachine& pm, const core::Resources& demand) {
    const auto left = pm.available() - demand;
    double total = 0.0;
    int counted = 0;
    auto add = [&](uint64_t free, uint64_t capacity) {
        if (capacity > 0) {
            total += static_cast<double>(free) / static_cast<double>(capacity);
            ++counted;
        }
    };
    add(left.cpu, pm.capacity.cpu);
    add(left.ram, pm.capacity.ram);
    add(left.gpu, pm.capacity.gpu);
    return counted == 0 ? 0.0 : total / counted;
}

} // namespace dcsim::algo
