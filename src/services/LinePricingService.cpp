#include "services/LinePricingService.hpp"

using namespace olp::domain;

namespace olp::services {

LinePricingService::LinePricingService(const olp::config::PricingSettings& settings)
    : calculator_(rounding_mode_from_string(settings.rounding)) {}

LinePricing LinePricingService::price(const OrderLine& line) const {
    return LinePricing{calculator_.project(line), aggregator_.aggregate(line)};
}

std::vector<LinePricing> LinePricingService::price_all(const std::vector<OrderLine>& lines) const {
    std::vector<LinePricing> result;
    result.reserve(lines.size());
    for (const auto& line : lines) {
        result.push_back(price(line));
    }
    return result;
}

} // namespace olp::services
