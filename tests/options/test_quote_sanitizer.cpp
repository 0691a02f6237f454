#include <gtest/gtest.h>
#include "chain_risk/options/quote_sanitizer.hpp"

using namespace chain_risk::options;

class QuoteSanitizerTest : public ::testing::Test {};

TEST_F(QuoteSanitizerTest, PlaceholdersParseToZero) {
    EXPECT_DOUBLE_EQ(parse_numeric(""), 0.0);
    EXPECT_DOUBLE_EQ(parse_numeric("--"), 0.0);
    EXPECT_DOUBLE_EQ(parse_numeric("N/A"), 0.0);
    EXPECT_DOUBLE_EQ(parse_numeric("   "), 0.0);
    EXPECT_DOUBLE_EQ(parse_numeric(" -- "), 0.0);
}

TEST_F(QuoteSanitizerTest, CurrencyAndPercentStripped) {
    EXPECT_DOUBLE_EQ(parse_numeric("$12.50"), 12.5);
    EXPECT_DOUBLE_EQ(parse_numeric("1.5%"), 1.5);
    EXPECT_DOUBLE_EQ(parse_numeric(" $ 7.25 "), 7.25);
    EXPECT_DOUBLE_EQ(parse_numeric("-0.35%"), -0.35);
}

TEST_F(QuoteSanitizerTest, TrailingTextIgnored) {
    EXPECT_DOUBLE_EQ(parse_numeric("663.32 USD"), 663.32);
    EXPECT_DOUBLE_EQ(parse_numeric("42abc"), 42.0);
}

TEST_F(QuoteSanitizerTest, ThousandsSeparatorStopsTheScan) {
    EXPECT_DOUBLE_EQ(parse_numeric("1,234"), 1.0);
}

TEST_F(QuoteSanitizerTest, GarbageParsesToZero) {
    EXPECT_DOUBLE_EQ(parse_numeric("abc"), 0.0);
    EXPECT_DOUBLE_EQ(parse_numeric("$"), 0.0);
    EXPECT_DOUBLE_EQ(parse_numeric("inf"), 0.0);
    EXPECT_DOUBLE_EQ(parse_numeric("nan"), 0.0);
}

TEST_F(QuoteSanitizerTest, LastTradeBanner) {
    EXPECT_DOUBLE_EQ(parse_last_trade_price("LAST TRADE: $663.32 (AS OF OCT 16, 2025 1:39 PM ET)"),
                     663.32);
    EXPECT_DOUBLE_EQ(parse_last_trade_price("$99.5(delayed)"), 99.5);
    EXPECT_DOUBLE_EQ(parse_last_trade_price("$101.25"), 101.25);
}

TEST_F(QuoteSanitizerTest, LastTradeWithoutDollarIsZero) {
    EXPECT_DOUBLE_EQ(parse_last_trade_price(""), 0.0);
    EXPECT_DOUBLE_EQ(parse_last_trade_price("LAST TRADE: 663.32"), 0.0);
    EXPECT_DOUBLE_EQ(parse_last_trade_price("LAST TRADE: $ (closed)"), 0.0);
}
