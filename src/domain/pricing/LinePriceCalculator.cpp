#include "domain/pricing/LinePriceCalculator.hpp"

#include "domain/pricing/TaxCalculations.hpp"

namespace olp::domain {

LinePriceCalculator::LinePriceCalculator(RoundingMode rounding)
    : rounding_(rounding) {}

Money LinePriceCalculator::excluding_tax(const OrderLine& line, Money amount) const {
    return line.list_price_includes_tax()
        ? net_price_of(amount, line.get_tax_rate(), rounding_)
        : amount;
}

Money LinePriceCalculator::including_tax(const OrderLine& line, Money amount) const {
    return line.list_price_includes_tax()
        ? amount
        : gross_price_of(amount, line.get_tax_rate(), rounding_);
}

Money LinePriceCalculator::unit_price(const OrderLine& line) const {
    return excluding_tax(line, line.get_list_price());
}

Money LinePriceCalculator::unit_price_with_tax(const OrderLine& line) const {
    return including_tax(line, line.get_list_price());
}

Money LinePriceCalculator::unit_price_change_since_added(const OrderLine& line) const {
    return unit_price(line) - excluding_tax(line, line.get_initial_list_price());
}

Money LinePriceCalculator::unit_price_with_tax_change_since_added(const OrderLine& line) const {
    return unit_price_with_tax(line) - including_tax(line, line.get_initial_list_price());
}

Money LinePriceCalculator::discounted_unit_price(const OrderLine& line) const {
    return excluding_tax(line, line.get_list_price() + adjustments_total(line, AdjustmentType::PROMOTION));
}

Money LinePriceCalculator::discounted_unit_price_with_tax(const OrderLine& line) const {
    return including_tax(line, line.get_list_price() + adjustments_total(line, AdjustmentType::PROMOTION));
}

Money LinePriceCalculator::prorated_unit_price(const OrderLine& line) const {
    return excluding_tax(line, line.get_list_price() + adjustments_total(line));
}

Money LinePriceCalculator::prorated_unit_price_with_tax(const OrderLine& line) const {
    return including_tax(line, line.get_list_price() + adjustments_total(line));
}

Money LinePriceCalculator::unit_tax(const OrderLine& line) const {
    return unit_price_with_tax(line) - unit_price(line);
}

Money LinePriceCalculator::prorated_unit_tax(const OrderLine& line) const {
    return prorated_unit_price_with_tax(line) - prorated_unit_price(line);
}

Money LinePriceCalculator::line_price(const OrderLine& line) const {
    return unit_price(line) * line.get_quantity();
}

Money LinePriceCalculator::line_price_with_tax(const OrderLine& line) const {
    return unit_price_with_tax(line) * line.get_quantity();
}

Money LinePriceCalculator::discounted_line_price(const OrderLine& line) const {
    return discounted_unit_price(line) * line.get_quantity();
}

Money LinePriceCalculator::discounted_line_price_with_tax(const OrderLine& line) const {
    return discounted_unit_price_with_tax(line) * line.get_quantity();
}

Money LinePriceCalculator::prorated_line_price(const OrderLine& line) const {
    return prorated_unit_price(line) * line.get_quantity();
}

Money LinePriceCalculator::prorated_line_price_with_tax(const OrderLine& line) const {
    return prorated_unit_price_with_tax(line) * line.get_quantity();
}

Money LinePriceCalculator::line_tax(const OrderLine& line) const {
    return unit_tax(line) * line.get_quantity();
}

Money LinePriceCalculator::prorated_line_tax(const OrderLine& line) const {
    return prorated_unit_tax(line) * line.get_quantity();
}

Money LinePriceCalculator::adjustments_total(const OrderLine& line,
                                             std::optional<AdjustmentType> type) const {
    const auto& adjustments = line.get_adjustments();
    if (adjustments.empty() || line.get_quantity() == 0) {
        return 0;
    }

    // Amounts are totals over the recorded quantity, so divide by that rather
    // than the current quantity.
    auto denominator = static_cast<double>(line.get_adjustment_quantity());
    double total = 0.0;
    for (const auto& adjustment : adjustments) {
        if (type && adjustment.type != *type) continue;
        total += static_cast<double>(adjustment.amount) / denominator;
    }
    return round_minor_units(total, rounding_);
}

LinePriceSnapshot LinePriceCalculator::project(const OrderLine& line) const {
    return LinePriceSnapshot{
        line.get_quantity(),
        line.get_tax_rate(),

        unit_price(line),
        unit_price_with_tax(line),
        unit_price_change_since_added(line),
        unit_price_with_tax_change_since_added(line),
        discounted_unit_price(line),
        discounted_unit_price_with_tax(line),
        prorated_unit_price(line),
        prorated_unit_price_with_tax(line),
        unit_tax(line),
        prorated_unit_tax(line),

        line_price(line),
        line_price_with_tax(line),
        discounted_line_price(line),
        discounted_line_price_with_tax(line),
        prorated_line_price(line),
        prorated_line_price_with_tax(line),
        line_tax(line),
        prorated_line_tax(line),
    };
}

} // namespace olp::domain
