#pragma once

#include "config/Settings.hpp"
#include "domain/aggregates/OrderLine.hpp"
#include "domain/pricing/DiscountAggregator.hpp"
#include "domain/pricing/LinePriceCalculator.hpp"

#include <vector>

namespace olp::services {

struct LinePricing {
    olp::domain::LinePriceSnapshot prices;
    std::vector<olp::domain::Discount> discounts;
};

class LinePricingService {
public:
    // Throws std::invalid_argument for an unknown rounding mode.
    explicit LinePricingService(const olp::config::PricingSettings& settings);

    LinePricing price(const olp::domain::OrderLine& line) const;
    std::vector<LinePricing> price_all(const std::vector<olp::domain::OrderLine>& lines) const;

    olp::domain::RoundingMode rounding() const noexcept { return calculator_.rounding(); }

private:
    olp::domain::LinePriceCalculator calculator_;
    olp::domain::DiscountAggregator aggregator_;
};

} // namespace olp::services
