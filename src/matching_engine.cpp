#include "matching_engine.hpp"
#include <algorithm>
#include <iostream>
#include <system_error>
#include <thread>

namespace TickerMatch {

namespace {

// Integer truncation: 10.2 and 10.9 share bucket 10
inline std::size_t price_bucket(const Order* order) noexcept {
    return static_cast<std::size_t>(order->price);
}

void counting_sort_by_price(std::vector<Order*>& orders, bool descending) {
    if (orders.size() <= 1) return;

    std::size_t max_bucket = 0;
    for (const Order* order : orders) {
        max_bucket = std::max(max_bucket, price_bucket(order));
    }

    std::vector<std::size_t> slots(max_bucket + 1, 0);
    for (const Order* order : orders) {
        ++slots[price_bucket(order)];
    }

    // Turn counts into starting offsets, walking buckets in output order
    std::size_t offset = 0;
    if (descending) {
        for (std::size_t bucket = max_bucket + 1; bucket-- > 0;) {
            const std::size_t count = slots[bucket];
            slots[bucket] = offset;
            offset += count;
        }
    } else {
        for (std::size_t bucket = 0; bucket <= max_bucket; ++bucket) {
            const std::size_t count = slots[bucket];
            slots[bucket] = offset;
            offset += count;
        }
    }

    std::vector<Order*> sorted(orders.size());
    for (Order* order : orders) {
        sorted[slots[price_bucket(order)]++] = order;
    }
    orders.swap(sorted);
}

} // namespace

void sort_bids_by_price(std::vector<Order*>& orders) {
    counting_sort_by_price(orders, true);
}

void sort_asks_by_price(std::vector<Order*>& orders) {
    counting_sort_by_price(orders, false);
}

MatchingEngine::MatchingEngine(OrderBook& book, TradeSink& sink)
    : book_(book), sink_(sink),
      passes_completed_(0), trades_executed_(0), quantity_matched_(0) {}

void MatchingEngine::match_orders() {
    const uint32_t threads = book_.config().match_threads;
    if (threads > 1) {
        match_range_parallel(threads);
        return;
    }

    for (TickerId ticker = 0; ticker < MAX_TICKERS; ++ticker) {
        match_orders_for_ticker(ticker);
    }
}

void MatchingEngine::match_range_parallel(uint32_t threads) {
    std::atomic<TickerId> next_ticker{0};
    auto drain = [this, &next_ticker]() {
        for (;;) {
            const TickerId ticker = next_ticker.fetch_add(1, std::memory_order_relaxed);
            if (ticker >= MAX_TICKERS) break;
            match_orders_for_ticker(ticker);
        }
    };

    // The calling thread is one of the workers
    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    for (uint32_t i = 1; i < threads; ++i) {
        try {
            workers.emplace_back(drain);
        } catch (const std::system_error& e) {
            std::cerr << "WARNING: Started " << workers.size() + 1 << " of " << threads
                      << " match threads: " << e.what() << "\n";
            break;
        }
    }

    try {
        drain();
    } catch (...) {
        // Stop the helpers picking up new tickers before leaving
        next_ticker.store(MAX_TICKERS, std::memory_order_relaxed);
        for (auto& worker : workers) worker.join();
        throw;
    }

    for (auto& worker : workers) {
        worker.join();
    }
}

MatchResult MatchingEngine::match_orders_for_ticker(TickerId ticker) {
    MatchResult result;
    if (ticker >= MAX_TICKERS) return result;

    ConcurrentOrderQueue& bid_queue = book_.queue(ticker, Side::BUY);
    ConcurrentOrderQueue& ask_queue = book_.queue(ticker, Side::SELL);

    // Nothing can cross with one side empty
    if (bid_queue.empty() || ask_queue.empty()) {
        passes_completed_.fetch_add(1, std::memory_order_relaxed);
        return result;
    }

    TickerMatchGuard guard(book_, ticker);

    std::vector<Order*> bids = bid_queue.snapshot();
    std::vector<Order*> asks = ask_queue.snapshot();
    result.bids_considered = bids.size();
    result.asks_considered = asks.size();

    sort_bids_by_price(bids);
    sort_asks_by_price(asks);

    std::size_t bid_index = 0;
    std::size_t ask_index = 0;

    while (bid_index < bids.size() && ask_index < asks.size()) {
        Order* buy_order = bids[bid_index];
        Order* sell_order = asks[ask_index];

        // Both sides are sorted, so no later pair can cross either
        if (buy_order->price < sell_order->price) break;

        execute_trade(ticker, buy_order, sell_order, result);

        if (buy_order->is_matched()) ++bid_index;
        if (sell_order->is_matched()) ++ask_index;
    }

    // Rebuild: drop filled orders, partial fills stay resting in place
    if (result.orders_filled > 0) {
        bid_queue.purge_filled();
        ask_queue.purge_filled();
    }

    passes_completed_.fetch_add(1, std::memory_order_relaxed);
    return result;
}

void MatchingEngine::execute_trade(TickerId ticker, Order* buy_order, Order* sell_order, MatchResult& result) {
    const uint64_t quantity = std::min(buy_order->remaining(), sell_order->remaining());
    const double price = sell_order->price;

    buy_order->fill(quantity);
    sell_order->fill(quantity);

    if (buy_order->is_matched()) ++result.orders_filled;
    if (sell_order->is_matched()) ++result.orders_filled;

    ++result.trades;
    result.quantity += quantity;

    trades_executed_.fetch_add(1, std::memory_order_relaxed);
    quantity_matched_.fetch_add(quantity, std::memory_order_relaxed);

    sink_.on_trade(Trade(ticker, buy_order->order_id, sell_order->order_id, quantity, price));
}

uint64_t MatchingEngine::passes_completed() const noexcept {
    return passes_completed_.load(std::memory_order_relaxed);
}

uint64_t MatchingEngine::trades_executed() const noexcept {
    return trades_executed_.load(std::memory_order_relaxed);
}

uint64_t MatchingEngine::quantity_matched() const noexcept {
    return quantity_matched_.load(std::memory_order_relaxed);
}

} // namespace TickerMatch
