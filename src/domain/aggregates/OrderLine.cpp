#include "domain/aggregates/OrderLine.hpp"

#include <algorithm>
#include <utility>

namespace olp::domain {

OrderLine::OrderLine(int64_t quantity, Money list_price, bool list_price_includes_tax)
    : quantity_(quantity)
    , initial_list_price_(list_price)
    , list_price_(list_price)
    , list_price_includes_tax_(list_price_includes_tax) {}

void OrderLine::add_adjustment(Adjustment adjustment) {
    adjustments_.push_back(std::move(adjustment));
}

// Without a type every adjustment is removed; otherwise only those of
// that type, keeping the rest in order.
void OrderLine::clear_adjustments(std::optional<AdjustmentType> type) {
    if (!type) {
        adjustments_.clear();
        return;
    }
    adjustments_.erase(
        std::remove_if(adjustments_.begin(), adjustments_.end(),
                       [&](const Adjustment& a) { return a.type == *type; }),
        adjustments_.end());
}

double OrderLine::get_tax_rate() const noexcept {
    double total = 0.0;
    for (const auto& line : tax_lines_) {
        total += line.tax_rate();
    }
    return total;
}

int64_t OrderLine::get_adjustment_quantity() const noexcept {
    return std::max(order_placed_quantity_, quantity_);
}

} // namespace olp::domain
