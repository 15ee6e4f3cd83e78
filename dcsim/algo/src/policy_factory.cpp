#include <dcsim/algo/policy_factory.hpp>
#include <dcsim/algo/best_fit_allocator.hpp>
#include <dcsim/algo/capacity_admission.hpp>
#include <dcsim/algo/error.hpp>
#include <dcsim/algo/first_fit_allocator.hpp>
#include <dcsim/algo/worst_fit_allocator.hpp>

namespace dcsim::algo {

std::unique_ptr<core::Allocator> make_allocator(std::string_view name) {
    if (name == "first-fit") {
        return std::make_unique<FirstFitAllocator>();
    }
    if (name == "best-fit") {
        return std::make_unique<BestFitAllocator>();
    }
    if (name == "worst-fit") {
        return std::make_unique<WorstFitAllocator>();
    }
    throw UnknownPolicyError("allocator", name);
}

std::unique_ptr<core::AdmissionPolicy> make_admission_policy(std::string_view name) {
    if (name == "capacity") {
        return std::make_unique<CapacityAdmission>();
    }
    if (name == "none") {
        return nullptr;
    }
    throw UnknownPolicyError("admission policy", name);
}

std::vector<std::string_view> allocator_names() {
    return {"first-fit", "best-fit", "worst-fit"};
}

} // namespace dcsim::algo
