#include <dcsim/core/fault.hpp>
#include <dcsim/core/error.hpp>

namespace dcsim::core {

std::string_view to_string(FaultKind kind) noexcept {
    switch (kind) {
        case FaultKind::SchedulingFault:
            return "SchedulingFault";
        case FaultKind::InvariantViolation:
            return "InvariantViolation";
        case FaultKind::SubscriberFault:
            return "SubscriberFault";
        case FaultKind::KernelFault:
            return "KernelFault";
    }
    return "Unknown";
}

FaultKind classify_fault(const std::exception& error) noexcept {
    if (dynamic_cast<const KernelFault*>(&error) != nullptr) {
        return FaultKind::KernelFault;
    }
    if (dynamic_cast<const InvariantViolation*>(&error) != nullptr) {
        return FaultKind::InvariantViolation;
    }
    if (dynamic_cast<const SchedulingFault*>(&error) != nullptr) {
        return FaultKind::SchedulingFault;
    }
    return FaultKind::SubscriberFault;
}

} // namespace dcsim::core
