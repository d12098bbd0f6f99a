#include "domain/pricing/DiscountAggregator.hpp"

#include "domain/pricing/TaxCalculations.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace olp::domain {

std::vector<Discount> DiscountAggregator::aggregate(const OrderLine& line) const {
    const bool includes_tax = line.list_price_includes_tax();
    const double tax_rate = line.get_tax_rate();
    const auto denominator = static_cast<double>(line.get_adjustment_quantity());
    const auto quantity = static_cast<double>(line.get_quantity());

    std::vector<Discount> discounts;
    std::map<std::string, size_t> index_by_source;

    for (const auto& adjustment : line.get_adjustments()) {
        // Both quantities zero: nothing to scale
        double scaled = denominator == 0.0
            ? 0.0
            : static_cast<double>(adjustment.amount) / denominator * quantity;
        double amount = includes_tax ? net_amount_of(scaled, tax_rate) : scaled;
        double amount_with_tax = includes_tax ? scaled : gross_amount_of(scaled, tax_rate);

        auto it = index_by_source.find(adjustment.adjustment_source);
        if (it != index_by_source.end()) {
            auto& group = discounts[it->second];
            group.amount += amount;
            group.amount_with_tax += amount_with_tax;
        } else {
            index_by_source.emplace(adjustment.adjustment_source, discounts.size());
            discounts.push_back(Discount{
                adjustment.adjustment_source,
                adjustment.type,
                adjustment.description,
                amount,
                amount_with_tax,
            });
        }
    }

    return discounts;
}

} // namespace olp::domain
