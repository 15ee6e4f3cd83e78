#include <dcsim/algo/capacity_admission.hpp>

namespace dcsim::algo {

core::AdmissionVerdict CapacityAdmission::evaluate(const core::Request& request,
                                                   const core::Datacenter& datacenter) {
    for (const auto& pm : datacenter.pms()) {
        if (request.demand.fits_in(pm.capacity)) {
            return core::AdmissionVerdict::accept();
        }
    }
    return core::AdmissionVerdict::reject("demand exceeds every host");
}

} // namespace dcsim::algo
