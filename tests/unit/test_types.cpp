#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "common/types.hpp"
#include <limits>

using namespace exchange;

TEST(TypesTest, PriceScaleConstant) {
    EXPECT_EQ(PRICE_SCALE, 100);
    EXPECT_EQ(PRICE_DECIMALS, 2);
}

TEST(TypesTest, FixedPriceConversion) {
    EXPECT_EQ(to_fixed_price(150.50), 15050);
    EXPECT_EQ(to_fixed_price(0.01), 1);
    EXPECT_EQ(to_fixed_price(100.00), 10000);
    EXPECT_EQ(to_fixed_price(99.99), 9999);
    EXPECT_EQ(to_fixed_price(105.25), 10525);
    EXPECT_EQ(to_fixed_price(0.0), 0);
    EXPECT_EQ(to_fixed_price(-10.50), -1050);
}

TEST(TypesTest, FixedPriceRoundsHalfUpOnExactBinaryValue) {
    // 0.125 and 0.375 are exact in binary: true ties, rounded away from zero
    EXPECT_EQ(to_fixed_price(0.125), 13);
    EXPECT_EQ(to_fixed_price(0.375), 38);
    EXPECT_EQ(to_fixed_price(-0.125), -13);
    // 2.675 is stored as 2.67499999..., so it rounds down
    EXPECT_EQ(to_fixed_price(2.675), 267);
    // 100.005 is stored as 100.00499999...
    EXPECT_EQ(to_fixed_price(100.005), 10000);
}

TEST(TypesTest, FixedPriceTinyAndHuge) {
    EXPECT_EQ(to_fixed_price(1e-300), 0);
    EXPECT_EQ(to_fixed_price(0.004), 0);
    EXPECT_EQ(to_fixed_price(0.006), 1);
    EXPECT_THROW(to_fixed_price(1e30), InvalidArgument);
    EXPECT_THROW(to_fixed_price(std::numeric_limits<double>::quiet_NaN()), InvalidArgument);
    EXPECT_THROW(to_fixed_price(std::numeric_limits<double>::infinity()), InvalidArgument);
}

TEST(TypesTest, ParsePriceExactDecimal) {
    EXPECT_EQ(parse_price("99"), 9900);
    EXPECT_EQ(parse_price("99.5"), 9950);
    EXPECT_EQ(parse_price("99.00"), 9900);
    EXPECT_EQ(parse_price(" 101.25 "), 10125);
    EXPECT_EQ(parse_price("+0.07"), 7);
    EXPECT_EQ(parse_price(".5"), 50);
    EXPECT_EQ(parse_price("1."), 100);
}

TEST(TypesTest, ParsePriceRoundsHalfUp) {
    EXPECT_EQ(parse_price("100.005"), 10001);
    EXPECT_EQ(parse_price("100.0049999"), 10000);
    EXPECT_EQ(parse_price("2.675"), 268);
    EXPECT_EQ(parse_price("99.999"), 10000);
    EXPECT_EQ(parse_price("-1.005"), -101);
    EXPECT_EQ(parse_price("-1.004"), -100);
}

TEST(TypesTest, ParsePriceRejectsMalformed) {
    EXPECT_THROW(parse_price(""), InvalidArgument);
    EXPECT_THROW(parse_price("."), InvalidArgument);
    EXPECT_THROW(parse_price("-"), InvalidArgument);
    EXPECT_THROW(parse_price("12a"), InvalidArgument);
    EXPECT_THROW(parse_price("1.2.3"), InvalidArgument);
    EXPECT_THROW(parse_price("1e5"), InvalidArgument);
    EXPECT_THROW(parse_price("99999999999999999999"), InvalidArgument);
}

TEST(TypesTest, ParseQuantity) {
    EXPECT_EQ(parse_quantity("0"), 0u);
    EXPECT_EQ(parse_quantity("35"), 35u);
    EXPECT_EQ(parse_quantity(" 7 "), 7u);
    EXPECT_THROW(parse_quantity("-5"), InvalidArgument);
    EXPECT_THROW(parse_quantity("1.5"), InvalidArgument);
    EXPECT_THROW(parse_quantity("ten"), InvalidArgument);
    EXPECT_THROW(parse_quantity(""), InvalidArgument);
    EXPECT_THROW(parse_quantity("99999999999999999999"), InvalidArgument);
}

TEST(TypesTest, ParseQuantityHonorsOrderLimit) {
    EXPECT_EQ(MAX_ORDER_QUANTITY, 1'000'000'000'000u);
    EXPECT_EQ(parse_quantity("1000000000000"), MAX_ORDER_QUANTITY);
    EXPECT_THROW(parse_quantity("1000000000001"), InvalidArgument);
    EXPECT_THROW(parse_quantity("9223372036854775807"), InvalidArgument);
}

TEST(TypesTest, FormatPrice) {
    EXPECT_EQ(format_price(9900), "99.00");
    EXPECT_EQ(format_price(10125), "101.25");
    EXPECT_EQ(format_price(7), "0.07");
    EXPECT_EQ(format_price(0), "0.00");
    EXPECT_EQ(format_price(-101), "-1.01");
}

TEST(TypesTest, ParseSide) {
    EXPECT_EQ(parse_side("BUY"), Side::Buy);
    EXPECT_EQ(parse_side("buy"), Side::Buy);
    EXPECT_EQ(parse_side("Sell"), Side::Sell);
    EXPECT_EQ(parse_side("HOLD"), Side::Unknown);
    EXPECT_EQ(parse_side(""), Side::Unknown);
    EXPECT_EQ(parse_side("BUYER"), Side::Unknown);
}

TEST(TypesTest, SideHelpers) {
    EXPECT_STREQ(side_name(Side::Buy), "BUY");
    EXPECT_STREQ(side_name(Side::Sell), "SELL");
    EXPECT_STREQ(side_name(Side::Unknown), "UNKNOWN");
    EXPECT_TRUE(is_valid_side(Side::Buy));
    EXPECT_FALSE(is_valid_side(Side::Unknown));
    EXPECT_EQ(opposite_side(Side::Buy), Side::Sell);
    EXPECT_EQ(opposite_side(Side::Sell), Side::Buy);
}

TEST(TypesTest, NowNsReturnsIncreasingValues) {
    Timestamp t1 = now_ns();
    Timestamp t2 = now_ns();
    EXPECT_GE(t2, t1);
}
