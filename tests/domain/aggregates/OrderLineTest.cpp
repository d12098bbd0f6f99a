#include "domain/aggregates/OrderLine.hpp"

#include <gtest/gtest.h>

using namespace olp::domain;

namespace {

Adjustment promotion(const std::string& source, Money amount) {
    return Adjustment{AdjustmentType::PROMOTION, source, amount, "Promotion " + source};
}

Adjustment distributed(const std::string& source, Money amount) {
    return Adjustment{AdjustmentType::DISTRIBUTED_ORDER_PROMOTION, source, amount, "Order " + source};
}

} // namespace

TEST(OrderLine, InitialListPriceDefaultsToListPrice) {
    OrderLine line(2, 1000, false);
    EXPECT_EQ(line.get_quantity(), 2);
    EXPECT_EQ(line.get_order_placed_quantity(), 0);
    EXPECT_EQ(line.get_list_price(), 1000);
    EXPECT_EQ(line.get_initial_list_price(), 1000);
    EXPECT_FALSE(line.list_price_includes_tax());
    EXPECT_TRUE(line.get_tax_lines().empty());
    EXPECT_TRUE(line.get_adjustments().empty());
}

TEST(OrderLine, ListPriceChangeKeepsInitialPrice) {
    OrderLine line(1, 1000, false);
    line.set_list_price(1100);
    EXPECT_EQ(line.get_list_price(), 1100);
    EXPECT_EQ(line.get_initial_list_price(), 1000);
}

TEST(OrderLine, TaxRateIsZeroWithoutTaxLines) {
    OrderLine line(1, 1000, false);
    EXPECT_DOUBLE_EQ(line.get_tax_rate(), 0.0);
}

TEST(OrderLine, TaxRateSumsAllTaxLines) {
    OrderLine line(1, 1000, false);
    line.set_tax_lines({TaxLine("Federal", 5.0), TaxLine("State", 7.5)});
    EXPECT_DOUBLE_EQ(line.get_tax_rate(), 12.5);
}

TEST(OrderLine, AdjustmentQuantityIsLargerOfPlacedAndCurrent) {
    OrderLine line(1, 1000, false);
    line.set_order_placed_quantity(3);
    EXPECT_EQ(line.get_adjustment_quantity(), 3);

    line.set_quantity(5);
    EXPECT_EQ(line.get_adjustment_quantity(), 5);
}

TEST(OrderLine, AddAdjustmentAppendsWithoutDeduplicating) {
    OrderLine line(1, 1000, false);
    line.add_adjustment(promotion("P1", -100));
    line.add_adjustment(promotion("P1", -100));

    ASSERT_EQ(line.get_adjustments().size(), 2);
    EXPECT_EQ(line.get_adjustments()[0], line.get_adjustments()[1]);
}

TEST(OrderLine, AddAdjustmentAcceptsPositiveAmounts) {
    OrderLine line(1, 1000, false);
    line.add_adjustment(Adjustment{AdjustmentType::OTHER, "surcharge", 50, "Surcharge"});
    ASSERT_EQ(line.get_adjustments().size(), 1);
    EXPECT_EQ(line.get_adjustments()[0].amount, 50);
}

TEST(OrderLine, ClearAdjustmentsWithoutTypeRemovesAll) {
    OrderLine line(1, 1000, false);
    line.add_adjustment(promotion("P1", -100));
    line.add_adjustment(distributed("D1", -50));

    line.clear_adjustments();
    EXPECT_TRUE(line.get_adjustments().empty());
}

TEST(OrderLine, ClearAdjustmentsByTypePreservesOrderOfRest) {
    OrderLine line(1, 1000, false);
    line.add_adjustment(promotion("P1", -100));
    line.add_adjustment(distributed("D1", -50));
    line.add_adjustment(promotion("P2", -30));
    line.add_adjustment(distributed("D2", -20));

    line.clear_adjustments(AdjustmentType::PROMOTION);

    ASSERT_EQ(line.get_adjustments().size(), 2);
    EXPECT_EQ(line.get_adjustments()[0].adjustment_source, "D1");
    EXPECT_EQ(line.get_adjustments()[1].adjustment_source, "D2");
}

TEST(OrderLine, ClearAdjustmentsByTypeIsIdempotent) {
    OrderLine line(1, 1000, false);
    line.add_adjustment(promotion("P1", -100));
    line.add_adjustment(distributed("D1", -50));

    line.clear_adjustments(AdjustmentType::DISTRIBUTED_ORDER_PROMOTION);
    auto after_first = line.get_adjustments();
    line.clear_adjustments(AdjustmentType::DISTRIBUTED_ORDER_PROMOTION);

    EXPECT_EQ(line.get_adjustments(), after_first);
    ASSERT_EQ(line.get_adjustments().size(), 1);
    EXPECT_EQ(line.get_adjustments()[0].adjustment_source, "P1");
}

TEST(OrderLine, ClearAdjustmentsOnEmptyLineIsHarmless) {
    OrderLine line(1, 1000, false);
    line.clear_adjustments();
    line.clear_adjustments(AdjustmentType::PROMOTION);
    EXPECT_TRUE(line.get_adjustments().empty());
}
