#pragma once

#include "domain/value_objects/Money.hpp"

#include <cstdint>

namespace olp::domain {

// Every derived price figure of an order line at one point in time.
struct LinePriceSnapshot {
    int64_t quantity;
    double tax_rate;

    Money unit_price;
    Money unit_price_with_tax;
    Money unit_price_change_since_added;
    Money unit_price_with_tax_change_since_added;
    Money discounted_unit_price;
    Money discounted_unit_price_with_tax;
    Money prorated_unit_price;
    Money prorated_unit_price_with_tax;
    Money unit_tax;
    Money prorated_unit_tax;

    Money line_price;
    Money line_price_with_tax;
    Money discounted_line_price;
    Money discounted_line_price_with_tax;
    Money prorated_line_price;
    Money prorated_line_price_with_tax;
    Money line_tax;
    Money prorated_line_tax;

    bool operator==(const LinePriceSnapshot&) const = default;
};

} // namespace olp::domain
