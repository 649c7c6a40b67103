#pragma once

#include "trading_engine.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace TickerMatch {

struct FeedConfig {
    std::vector<std::string> symbols{"AAPL", "GOOGL", "MSFT", "AMZN", "META",
                                     "TSLA", "NVDA", "BRK.A", "JPM", "JNJ"};
    uint32_t producers = 8;
    uint64_t orders_per_producer = 125;
    uint64_t match_every = 10;          // Producer triggers a full pass every N orders, 0 = never
    bool pause_between_orders = true;   // Sleep 1-4 ms after each order
    uint64_t seed = 0;                  // 0 = seed from std::random_device

    FeedConfig() = default;
};

struct FeedReport {
    uint64_t orders_submitted = 0;
    uint64_t orders_accepted = 0;
    uint64_t orders_rejected = 0;
    uint64_t quantity_accepted = 0;
    std::chrono::milliseconds elapsed{0};
};

/**
 * Feed handler simulates concurrent market participants.
 * Each producer thread submits random limit orders:
 * - side: 50% buy / 50% sell
 * - quantity: 10 to 1000 in steps of 10
 * - price: uniform in [50, 1000)
 * and runs a matching pass every `match_every` orders. After all producers
 * join, one final matching pass runs before returning.
 */
class FeedHandler {
public:
    static FeedReport run(TradingEngine& engine, const FeedConfig& config = FeedConfig{});
};

} // namespace TickerMatch
