#include "domain/pricing/TaxCalculations.hpp"

namespace olp::domain {

namespace {

double tax_multiplier(double tax_rate) {
    return (100.0 + tax_rate) / 100.0;
}

} // anonymous namespace

double net_amount_of(double gross, double tax_rate) {
    return gross / tax_multiplier(tax_rate);
}

double gross_amount_of(double net, double tax_rate) {
    return net * tax_multiplier(tax_rate);
}

Money net_price_of(Money gross, double tax_rate, RoundingMode mode) {
    return round_minor_units(net_amount_of(static_cast<double>(gross), tax_rate), mode);
}

Money gross_price_of(Money net, double tax_rate, RoundingMode mode) {
    return round_minor_units(gross_amount_of(static_cast<double>(net), tax_rate), mode);
}

} // namespace olp::domain
