// STAKELEDGER - Checked Arithmetic Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "stakeledger/core/checked_math.h"

#include <limits>

using namespace stakeledger;

namespace {
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();
constexpr Amount MIN_AMOUNT = std::numeric_limits<Amount>::min();
}

// ============================================================================
// Addition and Subtraction
// ============================================================================

TEST(CheckedMathTest, AddInRange) {
    EXPECT_EQ(CheckedAdd(2, 3, "add"), 5);
    EXPECT_EQ(CheckedAdd(-7, 3, "add"), -4);
    EXPECT_EQ(CheckedAdd(MAX_AMOUNT - 1, 1, "add"), MAX_AMOUNT);
}

TEST(CheckedMathTest, AddOverflowThrows) {
    EXPECT_THROW(CheckedAdd(MAX_AMOUNT, 1, "add"), ArithmeticFault);
    EXPECT_THROW(CheckedAdd(MIN_AMOUNT, -1, "add"), ArithmeticFault);
}

TEST(CheckedMathTest, SubInRange) {
    EXPECT_EQ(CheckedSub(10, 4, "sub"), 6);
    EXPECT_EQ(CheckedSub(0, 5, "sub"), -5);
    EXPECT_EQ(CheckedSub(MIN_AMOUNT + 1, 1, "sub"), MIN_AMOUNT);
}

TEST(CheckedMathTest, SubOverflowThrows) {
    EXPECT_THROW(CheckedSub(MIN_AMOUNT, 1, "sub"), ArithmeticFault);
    EXPECT_THROW(CheckedSub(MAX_AMOUNT, -1, "sub"), ArithmeticFault);
}

// ============================================================================
// Multiplication and Division
// ============================================================================

TEST(CheckedMathTest, MulInRange) {
    EXPECT_EQ(CheckedMul(1000, 1000, "mul"), 1000000);
    EXPECT_EQ(CheckedMul(-3, 4, "mul"), -12);
    EXPECT_EQ(CheckedMul(0, MAX_AMOUNT, "mul"), 0);
}

TEST(CheckedMathTest, MulOverflowThrows) {
    EXPECT_THROW(CheckedMul(MAX_AMOUNT, 2, "mul"), ArithmeticFault);
    EXPECT_THROW(CheckedMul(4000000000LL, 4000000000LL, "mul"), ArithmeticFault);
}

TEST(CheckedMathTest, DivTruncates) {
    EXPECT_EQ(CheckedDiv(7, 2, "div"), 3);
    EXPECT_EQ(CheckedDiv(1999999999, 1000000000, "div"), 1);
}

TEST(CheckedMathTest, DivInvalidThrows) {
    EXPECT_THROW(CheckedDiv(1, 0, "div"), ArithmeticFault);
    EXPECT_THROW(CheckedDiv(MIN_AMOUNT, -1, "div"), ArithmeticFault);
}

// ============================================================================
// Wide Intermediates
// ============================================================================

TEST(CheckedMathTest, WideProductBeyond64Bits) {
    WideAmount product = CheckedMulWide(1000000000, 1000000, "wide");
    product = CheckedMulWide(product, 31536000, "wide");
    EXPECT_EQ(NarrowAmount(CheckedDivWide(product, 1000000000, "wide"), "wide"),
              31536000000000LL);
}

TEST(CheckedMathTest, WideOverflowThrows) {
    WideAmount product = CheckedMulWide(MAX_AMOUNT, MAX_AMOUNT, "wide");
    EXPECT_THROW(CheckedMulWide(product, 4, "wide"), ArithmeticFault);
    EXPECT_THROW(CheckedDivWide(product, 0, "wide"), ArithmeticFault);
}

TEST(CheckedMathTest, NarrowOutsideAmountRangeThrows) {
    EXPECT_EQ(NarrowAmount(static_cast<WideAmount>(MAX_AMOUNT), "narrow"), MAX_AMOUNT);
    EXPECT_EQ(NarrowAmount(static_cast<WideAmount>(MIN_AMOUNT), "narrow"), MIN_AMOUNT);
    EXPECT_THROW(NarrowAmount(static_cast<WideAmount>(MAX_AMOUNT) + 1, "narrow"), ArithmeticFault);
    EXPECT_THROW(NarrowAmount(static_cast<WideAmount>(MIN_AMOUNT) - 1, "narrow"), ArithmeticFault);
}

TEST(CheckedMathTest, FaultMessageNamesOperand) {
    try {
        CheckedAdd(MAX_AMOUNT, MAX_AMOUNT, "total staked");
        FAIL() << "expected ArithmeticFault";
    } catch (const ArithmeticFault& e) {
        EXPECT_NE(std::string(e.what()).find("total staked"), std::string::npos);
    }
}

// ============================================================================
// Elapsed Time
// ============================================================================

TEST(CheckedMathTest, SaturatingElapsed) {
    EXPECT_EQ(SaturatingElapsed(100, 40), 60);
    EXPECT_EQ(SaturatingElapsed(40, 40), 0);
    EXPECT_EQ(SaturatingElapsed(40, 100), 0);
}
