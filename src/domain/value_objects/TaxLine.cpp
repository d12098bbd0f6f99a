#include "domain/value_objects/TaxLine.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace olp::domain {

TaxLine::TaxLine(std::string description, double tax_rate)
    : description_(std::move(description))
    , tax_rate_(tax_rate) {
    if (!std::isfinite(tax_rate) || tax_rate < 0.0) {
        throw std::out_of_range(
            "Tax rate must be a non-negative percentage, got: " + std::to_string(tax_rate));
    }
}

} // namespace olp::domain
