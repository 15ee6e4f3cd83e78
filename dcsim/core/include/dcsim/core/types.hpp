#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

namespace dcsim::core {

/// @brief Span of virtual time, counted in whole nanoseconds.
///
/// Only the bridge functions below can build a non-zero Duration, so every
/// seconds-to-ticks conversion is visible at the call site. Integer ticks
/// keep event ordering exact across platforms.
///
/// @see duration_from_seconds, duration_from_nanoseconds, TimePoint
/// @ingroup core_types
class Duration {
    int64_t ns_{0};

    explicit constexpr Duration(int64_t ns) noexcept : ns_(ns) {}

    static constexpr int64_t kMaxTicks = std::numeric_limits<int64_t>::max();
    static constexpr int64_t kMinTicks = std::numeric_limits<int64_t>::min();

    // Out-of-range input saturates, NaN maps to zero
    static constexpr int64_t round_to_ticks(double seconds) noexcept {
        const double ticks = seconds * 1e9;
        if (ticks != ticks) {
            return 0;
        }
        if (ticks >= 9.223372036854775807e18) {
            return kMaxTicks;
        }
        if (ticks <= -9.223372036854775807e18) {
            return kMinTicks;
        }
        return static_cast<int64_t>(ticks < 0.0 ? ticks - 0.5 : ticks + 0.5);
    }

    static constexpr int64_t saturating_add(int64_t a, int64_t b) noexcept {
        if (b > 0 && a > kMaxTicks - b) {
            return kMaxTicks;
        }
        if (b < 0 && a < kMinTicks - b) {
            return kMinTicks;
        }
        return a + b;
    }

    friend constexpr Duration duration_from_seconds(double s) noexcept;
    friend constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept;

public:
    constexpr Duration() noexcept = default;

    static constexpr Duration zero() noexcept { return Duration{}; }

    [[nodiscard]] constexpr double seconds() const noexcept {
        return static_cast<double>(ns_) / 1e9;
    }

    [[nodiscard]] constexpr int64_t nanoseconds() const noexcept { return ns_; }

    /// Sums saturate at the representable range instead of wrapping.
    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{saturating_add(ns_, rhs.ns_)};
    }

    constexpr Duration operator-(Duration rhs) const noexcept {
        if (rhs.ns_ == kMinTicks) {
            return Duration{saturating_add(saturating_add(ns_, kMaxTicks), 1)};
        }
        return Duration{saturating_add(ns_, -rhs.ns_)};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        ns_ = saturating_add(ns_, rhs.ns_);
        return *this;
    }

    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Instant on the simulation clock, as an offset from time zero.
///
/// Unrelated to wall-clock time. The Kernel moves it forward when it pops
/// an event.
/// @ingroup core_types
class TimePoint {
    Duration offset_;

    explicit constexpr TimePoint(Duration offset) noexcept : offset_(offset) {}

    friend constexpr TimePoint time_from_seconds(double s) noexcept;
    friend constexpr TimePoint time_from_nanoseconds(int64_t ns) noexcept;

public:
    constexpr TimePoint() noexcept = default;

    /// @brief Simulation start.
    static constexpr TimePoint epoch() noexcept { return TimePoint{}; }

    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept { return offset_; }

    constexpr TimePoint operator+(Duration d) const noexcept { return TimePoint{offset_ + d}; }
    constexpr Duration operator-(TimePoint rhs) const noexcept { return offset_ - rhs.offset_; }

    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

// ============================================================================
// Bridge functions
// ============================================================================

/// @brief Seconds to Duration, rounded half away from zero.
[[nodiscard]] constexpr Duration duration_from_seconds(double s) noexcept {
    return Duration{Duration::round_to_ticks(s)};
}

[[nodiscard]] constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept {
    return Duration{ns};
}

[[nodiscard]] constexpr double duration_to_seconds(Duration d) noexcept {
    return d.seconds();
}

/// @brief Instant @p s seconds after simulation start.
[[nodiscard]] constexpr TimePoint time_from_seconds(double s) noexcept {
    return TimePoint{duration_from_seconds(s)};
}

[[nodiscard]] constexpr TimePoint time_from_nanoseconds(int64_t ns) noexcept {
    return TimePoint{duration_from_nanoseconds(ns)};
}

[[nodiscard]] constexpr double time_to_seconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().seconds();
}

[[nodiscard]] constexpr int64_t time_to_nanoseconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().nanoseconds();
}

/// @brief Upper bound on times and delays accepted from input files and the
///        command line, about 285 years. Well inside the tick range.
inline constexpr double max_input_seconds = 9.0e9;

/// @brief True for a finite value in `[0, max_input_seconds]`.
[[nodiscard]] constexpr bool is_valid_input_seconds(double s) noexcept {
    return s >= 0.0 && s <= max_input_seconds;
}

// ============================================================================
// Resources
// ============================================================================

/// @brief Resource vector shared by PM capacity, VM demand and workload demand.
///
/// Components are whole units: CPU cores, RAM in MiB, GPU devices.
/// Comparison for placement is component-wise (see fits_in()), never a
/// lexicographic order.
///
/// @ingroup core_types
struct Resources {
    uint64_t cpu{0};  ///< CPU cores.
    uint64_t ram{0};  ///< Memory in MiB.
    uint64_t gpu{0};  ///< GPU devices.

    /// @brief True if every component is less than or equal to @p capacity's.
    [[nodiscard]] constexpr bool fits_in(const Resources& capacity) const noexcept {
        return cpu <= capacity.cpu && ram <= capacity.ram && gpu <= capacity.gpu;
    }

    /// @brief True if all components are zero.
    [[nodiscard]] constexpr bool empty() const noexcept {
        return cpu == 0 && ram == 0 && gpu == 0;
    }

    constexpr Resources operator+(const Resources& rhs) const noexcept {
        return Resources{cpu + rhs.cpu, ram + rhs.ram, gpu + rhs.gpu};
    }

    /// @brief Component-wise subtraction.
    /// @pre rhs.fits_in(*this)
    constexpr Resources operator-(const Resources& rhs) const noexcept {
        return Resources{cpu - rhs.cpu, ram - rhs.ram, gpu - rhs.gpu};
    }

    constexpr Resources& operator+=(const Resources& rhs) noexcept {
        *this = *this + rhs;
        return *this;
    }

    constexpr Resources& operator-=(const Resources& rhs) noexcept {
        *this = *this - rhs;
        return *this;
    }

    constexpr bool operator==(const Resources&) const noexcept = default;
};

// ============================================================================
// Entity identifiers
// ============================================================================

/// @brief Strongly typed index into an entity arena.
///
/// Each entity kind gets its own tag so that a VmId can never be passed
/// where a PmId is expected. Relations between entities are always stored
/// as ids and resolved through the owning arena.
///
/// @tparam Tag Empty tag type distinguishing the entity kind.
/// @see EntityTable
/// @ingroup core_types
template<typename Tag>
struct EntityId {
    std::size_t value{0};

    constexpr auto operator<=>(const EntityId&) const noexcept = default;
    constexpr bool operator==(const EntityId&) const noexcept = default;
};

struct RequestTag {};
struct PmTag {};
struct VmTag {};
struct WorkloadTag {};
struct DeploymentTag {};
struct ActionTag {};

using RequestId = EntityId<RequestTag>;
using PmId = EntityId<PmTag>;
using VmId = EntityId<VmTag>;
using WorkloadId = EntityId<WorkloadTag>;
using DeploymentId = EntityId<DeploymentTag>;
using ActionId = EntityId<ActionTag>;

} // namespace dcsim::core

template<typename Tag>
struct std::hash<dcsim::core::EntityId<Tag>> {
    std::size_t operator()(const dcsim::core::EntityId<Tag>& id) const noexcept {
        return std::hash<std::size_t>{}(id.value);
    }
};
