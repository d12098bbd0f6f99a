#pragma once

#include "domain/aggregates/OrderLine.hpp"
#include "domain/pricing/LinePriceSnapshot.hpp"
#include "domain/pricing/Rounding.hpp"

#include <optional>

namespace olp::domain {

// Projects the stored state of an OrderLine into its price figures.
// Every call recomputes from the line; nothing is cached.
//
// The caller must populate tax lines and adjustments before projecting.
class LinePriceCalculator {
public:
    explicit LinePriceCalculator(RoundingMode rounding = RoundingMode::HALF_AWAY_FROM_ZERO);

    RoundingMode rounding() const noexcept { return rounding_; }

    // Unit figures
    Money unit_price(const OrderLine& line) const;
    Money unit_price_with_tax(const OrderLine& line) const;
    Money unit_price_change_since_added(const OrderLine& line) const;
    Money unit_price_with_tax_change_since_added(const OrderLine& line) const;

    // Applies PROMOTION adjustments only. This is the price to show customers;
    // it leaves out distributed order-level discounts.
    Money discounted_unit_price(const OrderLine& line) const;
    Money discounted_unit_price_with_tax(const OrderLine& line) const;

    // Applies every adjustment. This is the taxable unit price and the
    // basis for refunds.
    Money prorated_unit_price(const OrderLine& line) const;
    Money prorated_unit_price_with_tax(const OrderLine& line) const;

    Money unit_tax(const OrderLine& line) const;
    Money prorated_unit_tax(const OrderLine& line) const;

    // Line figures: unit figure * quantity
    Money line_price(const OrderLine& line) const;
    Money line_price_with_tax(const OrderLine& line) const;
    Money discounted_line_price(const OrderLine& line) const;
    Money discounted_line_price_with_tax(const OrderLine& line) const;
    Money prorated_line_price(const OrderLine& line) const;
    Money prorated_line_price_with_tax(const OrderLine& line) const;
    Money line_tax(const OrderLine& line) const;
    Money prorated_line_tax(const OrderLine& line) const;

    // Per-unit sum of adjustments (optionally of one type), rounded once
    // after summation. Zero when the quantity is zero or there are no adjustments.
    Money adjustments_total(const OrderLine& line,
                            std::optional<AdjustmentType> type = std::nullopt) const;

    LinePriceSnapshot project(const OrderLine& line) const;

private:
    // Convert a list-price-basis amount to its tax-exclusive / tax-inclusive value
    Money excluding_tax(const OrderLine& line, Money amount) const;
    Money including_tax(const OrderLine& line, Money amount) const;

    RoundingMode rounding_;
};

} // namespace olp::domain
