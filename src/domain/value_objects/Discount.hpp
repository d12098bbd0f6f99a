#pragma once

#include "domain/value_objects/AdjustmentType.hpp"

#include <string>

namespace olp::domain {

// One row per adjustment source, scaled to the current quantity.
// Figures are unrounded minor units.
struct Discount {
    std::string adjustment_source;
    AdjustmentType type;
    std::string description;
    double amount;
    double amount_with_tax;
};

} // namespace olp::domain
