#pragma once

#include <dcsim/core/types.hpp>

namespace dcsim::core {

/// @brief Holds the current virtual time.
///
/// Only the Kernel advances the clock, to the timestamp of the event it is
/// about to dispatch. Time never moves backwards and is never advanced
/// speculatively.
///
/// @see Kernel
/// @ingroup core_engine
class Clock {
public:
    [[nodiscard]] TimePoint now() const noexcept { return now_; }

    /// @brief Move the clock to @p when.
    /// @throws InvalidStateError if @p when is earlier than now().
    void advance_to(TimePoint when);

private:
    TimePoint now_{};
};

} // namespace dcsim::core
