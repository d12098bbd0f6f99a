#pragma once

#include <stdexcept>
#include <string>

namespace olp::domain {

enum class AdjustmentType { OTHER, PROMOTION, DISTRIBUTED_ORDER_PROMOTION };

inline AdjustmentType adjustment_type_from_string(const std::string& str) {
    if (str == "OTHER") return AdjustmentType::OTHER;
    if (str == "PROMOTION") return AdjustmentType::PROMOTION;
    if (str == "DISTRIBUTED_ORDER_PROMOTION") return AdjustmentType::DISTRIBUTED_ORDER_PROMOTION;
    throw std::invalid_argument("Invalid adjustment type: " + str);
}

inline std::string to_string(AdjustmentType type) {
    switch (type) {
        case AdjustmentType::OTHER: return "OTHER";
        case AdjustmentType::PROMOTION: return "PROMOTION";
        case AdjustmentType::DISTRIBUTED_ORDER_PROMOTION: return "DISTRIBUTED_ORDER_PROMOTION";
    }
    throw std::invalid_argument("Invalid adjustment type");
}

} // namespace olp::domain
