// Admission: may one more transfer start? Pure function of the store's counters.
#pragma once
#include "TransferStore.hpp"

namespace opens3 {

class AdmissionController {
public:
    // budget = maximum number of simultaneously Active items (at least 1)
    AdmissionController(const TransferStore& store, int budget)
        : store_(store), budget_(budget < 1 ? 1 : budget) {}

    bool canAdmit() const { return store_.countByStatus().active < budget_; }
    int budget() const { return budget_; }

private:
    const TransferStore& store_;
    const int budget_;
};

} // namespace opens3
