#pragma once

#include "domain/aggregates/OrderLine.hpp"
#include "domain/value_objects/Discount.hpp"

#include <vector>

namespace olp::domain {

class DiscountAggregator {
public:
    // Group a line's adjustments into one Discount per adjustment source,
    // in the order sources first appear. Amounts are rescaled from the
    // recorded quantity to the current quantity and left unrounded.
    std::vector<Discount> aggregate(const OrderLine& line) const;
};

} // namespace olp::domain
