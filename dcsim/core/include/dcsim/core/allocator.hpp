#pragma once

#include <dcsim/core/entities.hpp>
#include <dcsim/core/types.hpp>

#include <optional>
#include <span>
#include <string_view>

namespace dcsim::core {

/// @brief Abstract interface for VM placement.
/// @ingroup core_policies
///
/// An Allocator picks the physical machine that should host a VM. It is a
/// pure decision: the kernel commits the placement itself and re-checks the
/// resource invariant, so a heuristic returning a PM that cannot hold the
/// VM is rejected rather than trusted.
///
/// Concrete heuristics live in the algo library (first-fit, best-fit,
/// worst-fit).
///
/// @see Simulation::set_allocator
class Allocator {
public:
    virtual ~Allocator() = default;

    /// @brief Choose a PM for a VM.
    ///
    /// @param demand Resources the VM needs.
    /// @param pool   Every PM of the datacenter, in id order. Capacity already
    ///               promised to other VMs is excluded from
    ///               PhysicalMachine::available().
    /// @return The chosen PM, or std::nullopt if none has capacity.
    [[nodiscard]] virtual std::optional<PmId> select_pm(
        const Resources& demand, std::span<const PhysicalMachine> pool) = 0;

    /// @brief Short identifier of the heuristic (e.g. `"first-fit"`).
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

} // namespace dcsim::core
