#include <gtest/gtest.h>
#include "ticker_registry.hpp"
#include <string>

using namespace TickerMatch;

TEST(TickerRegistryTest, ResolveIsDeterministic) {
    TickerRegistry registry;
    TickerRegistry other;

    EXPECT_EQ(registry.resolve("AAPL"), registry.resolve("AAPL"));
    EXPECT_EQ(registry.resolve("AAPL"), other.resolve("AAPL"));
}

TEST(TickerRegistryTest, KnownHashValues) {
    TickerRegistry registry;

    // "AB" = 65 * 31 + 66 = 2081, 2081 % 1024 = 33
    EXPECT_EQ(registry.resolve("AB"), 33u);
    EXPECT_EQ(registry.resolve(""), 0u);
    EXPECT_EQ(registry.resolve("A"), 65u);
}

TEST(TickerRegistryTest, ResultAlwaysWithinBound) {
    TickerRegistry registry;
    for (const std::string symbol : {"AAPL", "GOOGL", "MSFT", "AMZN", "META", "TSLA",
                                     "NVDA", "BRK.A", "JPM", "JNJ", "A-VERY-LONG-SYMBOL-NAME-XYZ"}) {
        EXPECT_LT(registry.resolve(symbol), MAX_TICKERS) << symbol;
    }
}

TEST(TickerRegistryTest, CollisionsAreAccepted) {
    TickerRegistry registry(1);

    // A bound of one puts every symbol on the same book
    EXPECT_EQ(registry.resolve("AAPL"), 0u);
    EXPECT_EQ(registry.resolve("MSFT"), 0u);
}

TEST(TickerRegistryTest, DistinctSymbolsCanShareAnId) {
    TickerRegistry registry;

    // "Aa" and "BB" have the same 31-based hash (2112)
    EXPECT_EQ(registry.resolve("Aa"), registry.resolve("BB"));
}

TEST(TickerRegistryTest, CustomBound) {
    TickerRegistry registry(16);

    EXPECT_EQ(registry.bound(), 16u);
    EXPECT_EQ(registry.resolve("AB"), 2081u % 16u);
}
