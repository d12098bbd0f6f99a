#pragma once

#include "domain/pricing/Rounding.hpp"
#include "domain/value_objects/Money.hpp"

namespace olp::domain {

// Net <-> gross conversions for a percentage tax rate (20.0 means 20%).
// All conversions share the multiplier (100 + rate) / 100.

double net_amount_of(double gross, double tax_rate);
double gross_amount_of(double net, double tax_rate);

// Rounded to whole minor units with the given mode.
Money net_price_of(Money gross, double tax_rate,
                   RoundingMode mode = RoundingMode::HALF_AWAY_FROM_ZERO);
Money gross_price_of(Money net, double tax_rate,
                     RoundingMode mode = RoundingMode::HALF_AWAY_FROM_ZERO);

} // namespace olp::domain
