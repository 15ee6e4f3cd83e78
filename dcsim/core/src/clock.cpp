#include <dcsim/core/clock.hpp>
#include <dcsim/core/error.hpp>

namespace dcsim::core {

void Clock::advance_to(TimePoint when) {
    if (when < now_) {
        throw InvalidStateError("clock cannot move backwards");
    }
    now_ = when;
}

} // namespace dcsim::core
