#pragma once

#include "types.hpp"
#include "book.hpp"
#include "trade_sink.hpp"
#include <atomic>
#include <vector>

namespace TickerMatch {

/**
 * Outcome of one ticker's matching pass
 */
struct MatchResult {
    uint64_t trades = 0;
    uint64_t quantity = 0;
    uint64_t orders_filled = 0;
    std::size_t bids_considered = 0;
    std::size_t asks_considered = 0;
};

/**
 * Counting sort by integer-truncated price, bucket count floor(max price) + 1.
 * Orders that truncate to the same bucket keep their input order; callers
 * must not read time priority into that.
 */
void sort_bids_by_price(std::vector<Order*>& orders);   // Highest bucket first
void sort_asks_by_price(std::vector<Order*>& orders);   // Lowest bucket first

/**
 * Periodic batch matcher over an OrderBook.
 *
 * Per ticker: snapshot both queues, sort them by price priority, walk the
 * best bid against the best ask executing at the ask's price until the bid
 * no longer reaches the ask, then prune filled orders from the live queues.
 *
 * Pruning happens in place, so an order pushed while the pass is running is
 * never dropped: it was either in the snapshot or is still resting for the
 * next pass. Matchers on the same ticker are serialized by the book's ticker
 * guard; add_order never waits on it.
 */
class MatchingEngine {
private:
    OrderBook& book_;
    TradeSink& sink_;

    // Statistics
    std::atomic<uint64_t> passes_completed_;
    std::atomic<uint64_t> trades_executed_;
    std::atomic<uint64_t> quantity_matched_;

    void match_range_parallel(uint32_t threads);
    void execute_trade(TickerId ticker, Order* buy_order, Order* sell_order, MatchResult& result);

public:
    MatchingEngine(OrderBook& book, TradeSink& sink);

    MatchingEngine(const MatchingEngine&) = delete;
    MatchingEngine& operator=(const MatchingEngine&) = delete;

    /**
     * Run a pass for every ticker. Tickers are independent; with
     * config().match_threads > 1 they are spread over worker threads and
     * trades from different tickers reach the sink in no particular order.
     * Returns after every ticker's pass has finished.
     */
    void match_orders();

    MatchResult match_orders_for_ticker(TickerId ticker);

    // Statistics getters
    uint64_t passes_completed() const noexcept;
    uint64_t trades_executed() const noexcept;
    uint64_t quantity_matched() const noexcept;
};

} // namespace TickerMatch
