#pragma once

#include "domain/aggregates/OrderLine.hpp"
#include "domain/pricing/Rounding.hpp"
#include "services/LinePricingService.hpp"

#include <string>
#include <vector>

namespace olp::infrastructure {

class OrderLineJsonCodec {
public:
    // Parse a single order line object, or an array of them.
    // Throws nlohmann::json::exception for malformed JSON or missing
    // required fields, std::invalid_argument for unknown adjustment types.
    std::vector<olp::domain::OrderLine> parse(const std::string& json_str) const;

    // Serialize priced lines as a JSON array. Discount figures are rounded
    // for display with `rounding`. A negative indent gives compact output.
    std::string serialize(const std::vector<olp::services::LinePricing>& pricings,
                          olp::domain::RoundingMode rounding,
                          bool include_discounts = true,
                          int indent = -1) const;
};

} // namespace olp::infrastructure
