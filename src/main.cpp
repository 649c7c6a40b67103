#include "trading_engine.hpp"
#include "feed_handler.hpp"
#include "numa_allocator.hpp"
#include "trade_sink.hpp"
#include <iostream>
#include <memory>

using namespace TickerMatch;

int main() {
    std::cout << "Concurrent Ticker Matching Engine\n";
    std::cout << "=================================\n\n";

    // Console output plus an in-memory record for the accounting check
    auto recorder = std::make_unique<RecordingTradeSink>();
    RecordingTradeSink* recording = recorder.get();

    TradeDispatcher dispatcher;
    dispatcher.add_sink(std::make_unique<ConsoleTradeSink>(true));
    dispatcher.add_sink(std::move(recorder));

    EngineConfig config;
    config.order_capacity = 1 << 16;
    config.log_orders = true;

    TradingEngine engine(dispatcher, config);

    FeedConfig feed;
    std::cout << "Starting simulation: " << feed.producers << " producers x "
              << feed.orders_per_producer << " orders\n\n";

    const FeedReport report = FeedHandler::run(engine, feed);

    // Statistics
    const OrderBook& book = engine.book();
    std::cout << "\n=== SIMULATION RESULTS ===\n";
    std::cout << "Total run time: " << report.elapsed.count() << " ms\n";
    std::cout << "Orders submitted: " << report.orders_submitted << "\n";
    std::cout << "Orders accepted: " << book.orders_accepted() << "\n";
    std::cout << "Orders rejected: " << book.orders_rejected() << "\n";
    std::cout << "Trades executed: " << engine.matcher().trades_executed() << "\n";
    std::cout << "Quantity matched: " << engine.matcher().quantity_matched() << "\n";
    std::cout << "Queue CAS restarts: " << book.queue_cas_retries() << "\n";
    std::cout << "NUMA available: " << (is_numa_available() ? "YES" : "NO")
              << " (" << numa_node_count() << " nodes)\n";

    // Every accepted unit is either consumed by a trade (on both sides) or still resting
    uint64_t resting = 0;
    for (TickerId ticker = 0; ticker < MAX_TICKERS; ++ticker) {
        resting += book.resting_quantity(ticker, Side::BUY) + book.resting_quantity(ticker, Side::SELL);
    }
    const uint64_t matched = 2 * recording->total_quantity();
    const uint64_t added = book.quantity_accepted();
    const uint64_t lost = (added > matched + resting) ? added - matched - resting : 0;

    std::cout << "\n=== CORRECTNESS CHECK ===\n";
    std::cout << "Quantity added: " << added << "\n";
    std::cout << "Quantity matched (both sides): " << matched << "\n";
    std::cout << "Quantity resting: " << resting << "\n";
    std::cout << "Quantity lost: " << lost << "\n";
    std::cout << "Conservation: " << (matched + resting == added ? "PASS" : "FAIL") << "\n";

    return (matched + resting == added) ? 0 : 1;
}
