#pragma once

#include "domain/value_objects/Adjustment.hpp"
#include "domain/value_objects/AdjustmentType.hpp"
#include "domain/value_objects/Money.hpp"
#include "domain/value_objects/TaxLine.hpp"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace olp::domain {

// Pricing state of a single order line: one product variant at one quantity.
// Derived prices are not stored here; see LinePriceCalculator.
class OrderLine {
public:
    // initial_list_price starts out equal to list_price.
    OrderLine(int64_t quantity, Money list_price, bool list_price_includes_tax);

    // Adjustment mutators
    void add_adjustment(Adjustment adjustment);
    void clear_adjustments(std::optional<AdjustmentType> type = std::nullopt);

    // Fields maintained by order recalculation
    void set_quantity(int64_t quantity) noexcept { quantity_ = quantity; }
    void set_order_placed_quantity(int64_t quantity) noexcept { order_placed_quantity_ = quantity; }
    void set_list_price(Money price) noexcept { list_price_ = price; }
    void set_initial_list_price(Money price) noexcept { initial_list_price_ = price; }
    void set_list_price_includes_tax(bool includes_tax) noexcept { list_price_includes_tax_ = includes_tax; }
    void set_tax_lines(std::vector<TaxLine> tax_lines) { tax_lines_ = std::move(tax_lines); }

    // Queries
    int64_t get_quantity() const noexcept { return quantity_; }
    int64_t get_order_placed_quantity() const noexcept { return order_placed_quantity_; }
    Money get_initial_list_price() const noexcept { return initial_list_price_; }
    Money get_list_price() const noexcept { return list_price_; }
    bool list_price_includes_tax() const noexcept { return list_price_includes_tax_; }
    const std::vector<TaxLine>& get_tax_lines() const noexcept { return tax_lines_; }
    const std::vector<Adjustment>& get_adjustments() const noexcept { return adjustments_; }

    // Sum of all tax line rates, as a percentage.
    double get_tax_rate() const noexcept;

    // The quantity that adjustment amounts were recorded against:
    // max(order_placed_quantity, quantity).
    int64_t get_adjustment_quantity() const noexcept;

private:
    int64_t quantity_;
    int64_t order_placed_quantity_{0};
    Money initial_list_price_;
    Money list_price_;
    bool list_price_includes_tax_;
    std::vector<TaxLine> tax_lines_;
    std::vector<Adjustment> adjustments_;
};

} // namespace olp::domain
