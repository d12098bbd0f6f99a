#include "domain/value_objects/TaxLine.hpp"

#include <gtest/gtest.h>

#include <limits>

using olp::domain::TaxLine;

TEST(TaxLine, StoresDescriptionAndRate) {
    TaxLine line("Standard VAT", 20.0);
    EXPECT_EQ(line.description(), "Standard VAT");
    EXPECT_DOUBLE_EQ(line.tax_rate(), 20.0);
}

TEST(TaxLine, AllowsZeroRate) {
    TaxLine line("Zero rated", 0.0);
    EXPECT_DOUBLE_EQ(line.tax_rate(), 0.0);
}

TEST(TaxLine, ThrowsOnNegativeRate) {
    EXPECT_THROW(TaxLine("Bad", -1.0), std::out_of_range);
}

TEST(TaxLine, ThrowsOnNonFiniteRate) {
    EXPECT_THROW(TaxLine("Bad", std::numeric_limits<double>::infinity()), std::out_of_range);
    EXPECT_THROW(TaxLine("Bad", std::numeric_limits<double>::quiet_NaN()), std::out_of_range);
}

TEST(TaxLine, EqualLinesAreEqual) {
    EXPECT_EQ(TaxLine("VAT", 20.0), TaxLine("VAT", 20.0));
    EXPECT_NE(TaxLine("VAT", 20.0), TaxLine("VAT", 5.0));
}
