#pragma once

#include "domain/value_objects/AdjustmentType.hpp"
#include "domain/value_objects/Money.hpp"

#include <string>

namespace olp::domain {

// A price modification recorded against an order line.
// `amount` is the total effect across max(orderPlacedQuantity, quantity) units,
// not a per-unit value. Usually negative.
struct Adjustment {
    AdjustmentType type;
    std::string adjustment_source;
    Money amount;
    std::string description;

    bool operator==(const Adjustment&) const = default;
};

} // namespace olp::domain
