#pragma once

#include "types.hpp"
#include "ticker_registry.hpp"
#include "book.hpp"
#include "matching_engine.hpp"
#include "trade_sink.hpp"
#include <string>

namespace TickerMatch {

/**
 * Symbol-level entry point. Owns the registry, the order book and the
 * matcher for one venue; the trade sink is borrowed and must outlive it.
 * All members may be called concurrently from any number of threads.
 */
class TradingEngine {
private:
    TickerRegistry registry_;
    OrderBook book_;
    MatchingEngine matcher_;

public:
    explicit TradingEngine(TradeSink& sink, const EngineConfig& config = EngineConfig{});

    TradingEngine(const TradingEngine&) = delete;
    TradingEngine& operator=(const TradingEngine&) = delete;

    /**
     * Resolve `symbol` and admit the order. Only a zero quantity is rejected;
     * a negative integer converted to uint64_t is taken as a huge lot size,
     * so callers holding signed counts must check them first.
     */
    AddOrderResult add_order(Side side, const std::string& symbol, uint64_t quantity, double price) noexcept;
    void match_orders();

    TickerId ticker_id(const std::string& symbol) const noexcept;

    OrderBook& book() noexcept { return book_; }
    const OrderBook& book() const noexcept { return book_; }
    MatchingEngine& matcher() noexcept { return matcher_; }
};

} // namespace TickerMatch
