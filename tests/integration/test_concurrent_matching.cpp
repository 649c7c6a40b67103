#include <gtest/gtest.h>
#include "trading_engine.hpp"
#include "feed_handler.hpp"
#include "trade_sink.hpp"
#include <atomic>
#include <map>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace TickerMatch;

namespace {

struct SubmittedOrder {
    OrderId order_id;
    uint64_t quantity;
};

uint64_t total_resting(const OrderBook& book) {
    uint64_t total = 0;
    for (TickerId ticker = 0; ticker < MAX_TICKERS; ++ticker) {
        total += book.resting_quantity(ticker, Side::BUY) + book.resting_quantity(ticker, Side::SELL);
    }
    return total;
}

// Submits one more sell on the traded ticker from inside the first trade
// callback, while the matcher still holds that ticker's snapshot.
class ReentrantTradeSink : public TradeSink {
public:
    void on_trade(const Trade& trade) override {
        recorder.on_trade(trade);
        if (engine && !late_order.accepted()) {
            late_order = engine->add_order(Side::SELL, "AAPL", 50, 101.0);
        }
    }

    RecordingTradeSink recorder;
    TradingEngine* engine = nullptr;
    AddOrderResult late_order{AdmissionStatus::REJECTED_INVALID_TICKER, 0};
};

// Throws for trades reported on the thread that started the pass. Trades on
// any other thread wait until that throw has happened.
class FailingOnCallerSink : public TradeSink {
public:
    explicit FailingOnCallerSink(std::thread::id caller) : caller_(caller) {}

    void on_trade(const Trade&) override {
        if (std::this_thread::get_id() == caller_) {
            failed.store(true);
            throw std::runtime_error("sink failure");
        }
        while (!failed.load()) std::this_thread::yield();
        ++helper_trades;
    }

    std::atomic<bool> failed{false};
    std::atomic<int> helper_trades{0};

private:
    std::thread::id caller_;
};

} // namespace

class ConcurrentMatchingTest : public ::testing::Test {
protected:
    void SetUp() override {
        EngineConfig config;
        config.order_capacity = 1 << 18;
        engine = std::make_unique<TradingEngine>(sink, config);
    }

    RecordingTradeSink sink;
    std::unique_ptr<TradingEngine> engine;
};

TEST_F(ConcurrentMatchingTest, ProducersAndMatchersOnOneTickerLoseNothing) {
    const int num_producers = 4;
    const int num_matchers = 3;
    const int orders_per_producer = 5000;
    const TickerId ticker = engine->ticker_id("AAPL");

    std::vector<std::vector<SubmittedOrder>> submitted(num_producers);
    std::atomic<int> producers_running{num_producers};

    std::vector<std::thread> matchers;
    for (int m = 0; m < num_matchers; ++m) {
        matchers.emplace_back([this, ticker, &producers_running]() {
            while (producers_running.load() > 0) {
                engine->matcher().match_orders_for_ticker(ticker);
            }
        });
    }

    std::vector<std::thread> producers;
    for (int p = 0; p < num_producers; ++p) {
        producers.emplace_back([this, p, &submitted, &producers_running]() {
            std::mt19937_64 gen(1000 + p);
            std::uniform_int_distribution<int> side_dist(0, 1);
            std::uniform_int_distribution<uint64_t> qty_dist(1, 50);
            std::uniform_int_distribution<int> price_dist(90, 110);

            for (int i = 0; i < orders_per_producer; ++i) {
                const Side side = side_dist(gen) == 0 ? Side::BUY : Side::SELL;
                const uint64_t qty = qty_dist(gen);
                const AddOrderResult result =
                    engine->add_order(side, "AAPL", qty, static_cast<double>(price_dist(gen)));
                if (!result.accepted()) {
                    ADD_FAILURE() << "order rejected";
                    continue;
                }
                submitted[p].push_back(SubmittedOrder{result.order_id, qty});
            }
            --producers_running;
        });
    }

    for (auto& producer : producers) producer.join();
    for (auto& matcher : matchers) matcher.join();

    engine->match_orders();

    uint64_t added = 0;
    for (const auto& orders : submitted) {
        for (const SubmittedOrder& order : orders) added += order.quantity;
    }

    std::map<OrderId, uint64_t> remaining;
    for (Side side : {Side::BUY, Side::SELL}) {
        for (const Order* order : engine->book().queue(ticker, side).snapshot()) {
            remaining[order->order_id] = order->remaining();
        }
    }

    const uint64_t matched = 2 * sink.total_quantity();
    const uint64_t resting = total_resting(engine->book());
    const uint64_t lost = added - matched - resting;

    EXPECT_EQ(added, engine->book().quantity_accepted());
    EXPECT_EQ(matched + resting, added);
    EXPECT_EQ(lost, 0u);

    // Every order is fully accounted for: filled part plus resting part
    for (const auto& orders : submitted) {
        for (const SubmittedOrder& order : orders) {
            const auto it = remaining.find(order.order_id);
            const uint64_t left = (it != remaining.end()) ? it->second : 0;
            ASSERT_EQ(sink.filled_quantity(order.order_id) + left, order.quantity)
                << "order " << order.order_id;
        }
    }

    for (const Trade& trade : sink.trades()) {
        EXPECT_EQ(trade.ticker, ticker);
        EXPECT_GT(trade.quantity, 0u);
    }

    // Nothing left to do on a quiet book
    const std::size_t trades_before = sink.trade_count();
    engine->match_orders();
    EXPECT_EQ(sink.trade_count(), trades_before);
}

TEST_F(ConcurrentMatchingTest, ConcurrentFullPassesAcrossTickers) {
    const std::vector<std::string> symbols{"AAPL", "MSFT", "GOOGL", "TSLA"};
    std::atomic<bool> producing{true};

    std::thread matcher([this, &producing]() {
        while (producing.load()) {
            engine->match_orders();
        }
    });

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([this, p, &symbols]() {
            std::mt19937_64 gen(77 + p);
            std::uniform_int_distribution<std::size_t> symbol_dist(0, symbols.size() - 1);
            std::uniform_int_distribution<int> price_dist(95, 105);
            for (int i = 0; i < 3000; ++i) {
                const Side side = (i % 2 == 0) ? Side::BUY : Side::SELL;
                ASSERT_TRUE(engine->add_order(side, symbols[symbol_dist(gen)], 10,
                                              static_cast<double>(price_dist(gen))).accepted());
            }
        });
    }

    for (auto& producer : producers) producer.join();
    producing = false;
    matcher.join();

    engine->match_orders();

    const uint64_t matched = 2 * sink.total_quantity();
    EXPECT_EQ(matched + total_resting(engine->book()), engine->book().quantity_accepted());
    EXPECT_EQ(engine->matcher().quantity_matched(), sink.total_quantity());
}

TEST(FeedHandlerTest, SimulationConservesQuantity) {
    RecordingTradeSink sink;
    EngineConfig config;
    config.order_capacity = 1 << 16;
    config.match_threads = 2;
    TradingEngine engine(sink, config);

    FeedConfig feed;
    feed.producers = 4;
    feed.orders_per_producer = 500;
    feed.pause_between_orders = false;
    feed.seed = 42;

    const FeedReport report = FeedHandler::run(engine, feed);

    EXPECT_EQ(report.orders_submitted, 2000u);
    EXPECT_EQ(report.orders_accepted, 2000u);
    EXPECT_EQ(report.orders_rejected, 0u);
    EXPECT_EQ(report.quantity_accepted, engine.book().quantity_accepted());
    EXPECT_GT(sink.trade_count(), 0u);

    EXPECT_EQ(2 * sink.total_quantity() + total_resting(engine.book()), report.quantity_accepted);

    // Only the simulated symbols' books were touched
    std::map<TickerId, bool> allowed;
    for (const std::string& symbol : feed.symbols) allowed[engine.ticker_id(symbol)] = true;
    for (const Trade& trade : sink.trades()) {
        EXPECT_TRUE(allowed.count(trade.ticker)) << "ticker " << trade.ticker;
    }
}

TEST(RebuildRaceTest, OrderAddedDuringPassStaysResting) {
    ReentrantTradeSink sink;
    EngineConfig config;
    config.order_capacity = 16;
    TradingEngine engine(sink, config);
    sink.engine = &engine;

    ASSERT_TRUE(engine.add_order(Side::BUY, "AAPL", 100, 100.0).accepted());
    ASSERT_TRUE(engine.add_order(Side::SELL, "AAPL", 100, 100.0).accepted());

    engine.match_orders();

    ASSERT_TRUE(sink.late_order.accepted());
    EXPECT_EQ(sink.recorder.trade_count(), 1u);

    // Both original orders filled and were pruned; the late sell survived it
    const TickerId ticker = engine.ticker_id("AAPL");
    const auto asks = engine.book().queue(ticker, Side::SELL).snapshot();
    ASSERT_EQ(asks.size(), 1u);
    EXPECT_EQ(asks[0]->order_id, sink.late_order.order_id);
    EXPECT_EQ(asks[0]->remaining(), 50u);
    EXPECT_TRUE(engine.book().queue(ticker, Side::BUY).empty());

    const uint64_t added = engine.book().quantity_accepted();
    const uint64_t matched = 2 * sink.recorder.total_quantity();
    EXPECT_EQ(added, 250u);
    EXPECT_EQ(matched + total_resting(engine.book()), added);

    // A later bid still finds it
    ASSERT_TRUE(engine.add_order(Side::BUY, "AAPL", 50, 101.0).accepted());
    engine.match_orders();
    const auto trades = sink.recorder.trades();
    ASSERT_EQ(trades.size(), 2u);
    EXPECT_EQ(trades[1].sell_order_id, sink.late_order.order_id);
    EXPECT_EQ(total_resting(engine.book()), 0u);
}

TEST(ParallelMatchTest, CallerFailureRethrowsAfterHelpersFinish) {
    FailingOnCallerSink sink(std::this_thread::get_id());
    EngineConfig config;
    config.order_capacity = 16;
    config.match_threads = 2;
    TradingEngine engine(sink, config);

    // Two crossing tickers: the helper can hold at most one while it waits
    for (const std::string symbol : {"AAPL", "MSFT"}) {
        ASSERT_TRUE(engine.add_order(Side::BUY, symbol, 10, 50.0).accepted());
        ASSERT_TRUE(engine.add_order(Side::SELL, symbol, 10, 50.0).accepted());
    }

    EXPECT_THROW(engine.match_orders(), std::runtime_error);
    EXPECT_TRUE(sink.failed.load());
    EXPECT_LE(sink.helper_trades.load(), 1);
}
