#pragma once

#include <string>

namespace olp::domain {

class TaxLine {
public:
    TaxLine(std::string description, double tax_rate);

    const std::string& description() const noexcept { return description_; }
    double tax_rate() const noexcept { return tax_rate_; }

    bool operator==(const TaxLine&) const = default;

private:
    std::string description_;
    double tax_rate_;  // Percentage, e.g. 20.0 for 20%
};

} // namespace olp::domain
