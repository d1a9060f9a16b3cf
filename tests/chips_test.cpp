#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include "holdem/chips.hpp"

using namespace holdem;

// =============================================================================
// ChipAmount Tests
// =============================================================================

class ChipAmountTest : public ::testing::Test {
protected:
    static constexpr int64_t MAX = std::numeric_limits<int64_t>::max();
    static constexpr int64_t MIN = std::numeric_limits<int64_t>::min();
};

TEST_F(ChipAmountTest, DefaultConstructed_ShouldBeZero) {
    ChipAmount amount;

    EXPECT_TRUE(amount.is_zero());
    EXPECT_FALSE(amount.is_positive());
    EXPECT_FALSE(amount.is_negative());
}

TEST_F(ChipAmountTest, Arithmetic_ShouldBeExact) {
    // Given two amounts
    ChipAmount a = chips(150);
    ChipAmount b = chips(40);

    // Then the integer operations should give exact results
    EXPECT_EQ(a + b, chips(190));
    EXPECT_EQ(a - b, chips(110));
    EXPECT_EQ(b - a, chips(-110));
    EXPECT_EQ(a * 3, chips(450));
    EXPECT_EQ(a / 4, chips(37));
    EXPECT_EQ(a % 4, chips(2));
}

TEST_F(ChipAmountTest, CompoundAssignment_ShouldUpdateInPlace) {
    ChipAmount stack = chips(1000);

    stack -= chips(60);
    stack += chips(15);

    EXPECT_EQ(stack.value(), 955);
}

TEST_F(ChipAmountTest, AdditionPastMaximum_ShouldThrowOverflow) {
    // Given an amount at the top of the range
    ChipAmount top(MAX);

    // When one more chip is added
    // Then the overflow should be reported rather than wrapped
    EXPECT_THROW(top + chips(1), std::overflow_error);
}

TEST_F(ChipAmountTest, SubtractionPastMinimum_ShouldThrowOverflow) {
    ChipAmount bottom(MIN);

    EXPECT_THROW(bottom - chips(1), std::overflow_error);
}

TEST_F(ChipAmountTest, MultiplicationOverflow_ShouldThrow) {
    ChipAmount large(MAX / 2 + 1);

    EXPECT_THROW(large * 2, std::overflow_error);
}

TEST_F(ChipAmountTest, DivisionByZero_ShouldThrowDomainError) {
    EXPECT_THROW(chips(10) / 0, std::domain_error);
    EXPECT_THROW(chips(10) % 0, std::domain_error);
}

TEST_F(ChipAmountTest, CompoundOverflow_ShouldLeaveValueUnchanged) {
    ChipAmount top(MAX);

    EXPECT_THROW(top += chips(1), std::overflow_error);
    EXPECT_EQ(top.value(), MAX);
}

TEST_F(ChipAmountTest, Comparisons_ShouldOrderByValue) {
    EXPECT_LT(chips(10), chips(20));
    EXPECT_LE(chips(20), chips(20));
    EXPECT_GT(chips(30), chips(20));
    EXPECT_NE(chips(1), chips(2));

    EXPECT_EQ(compare_chips(chips(5), chips(9)), -1);
    EXPECT_EQ(compare_chips(chips(9), chips(9)), 0);
    EXPECT_EQ(compare_chips(chips(9), chips(5)), 1);
}

TEST_F(ChipAmountTest, MinAndMax_ShouldPickTheRightOperand) {
    EXPECT_EQ(min_chips(chips(15), chips(50)), chips(15));
    EXPECT_EQ(max_chips(chips(15), chips(50)), chips(50));
}

TEST_F(ChipAmountTest, Formatting_ShouldPrintTheIntegerValue) {
    std::ostringstream out;
    out << chips(-25);

    EXPECT_EQ(out.str(), "-25");
    EXPECT_EQ(chips(1000).to_string(), "1000");
}
