#pragma once

#include "types.hpp"
#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace TickerMatch {

/**
 * Receiver of trade executions. Called once per trade, in execution order
 * within a ticker's pass. Parallel matching calls it from several threads,
 * so implementations must be thread-safe.
 */
class TradeSink {
public:
    virtual ~TradeSink() = default;

    virtual void on_trade(const Trade& trade) = 0;
};

/**
 * Console-based trade sink
 */
class ConsoleTradeSink : public TradeSink {
private:
    std::mutex mutex_;
    bool verbose_;

public:
    explicit ConsoleTradeSink(bool verbose = true) : verbose_(verbose) {}

    void on_trade(const Trade& trade) override;
};

/**
 * File-based trade sink for recording. One CSV line per trade:
 * timestamp_ns,ticker,buy_order_id,sell_order_id,quantity,price
 */
class CsvTradeSink : public TradeSink {
private:
    std::mutex mutex_;
    std::ofstream file_;

public:
    /**
     * Opens `filename` for appending. Throws std::runtime_error on failure.
     */
    explicit CsvTradeSink(const std::string& filename);

    void on_trade(const Trade& trade) override;
};

/**
 * In-memory sink that keeps every trade and per-order fill totals
 */
class RecordingTradeSink : public TradeSink {
private:
    mutable std::mutex mutex_;
    std::vector<Trade> trades_;
    std::unordered_map<OrderId, uint64_t> filled_by_order_;
    uint64_t total_quantity_ = 0;

public:
    void on_trade(const Trade& trade) override;

    std::vector<Trade> trades() const;
    std::size_t trade_count() const;
    uint64_t total_quantity() const;
    uint64_t filled_quantity(OrderId order_id) const;
    void clear();
};

/**
 * Fans every trade out to a set of owned sinks
 */
class TradeDispatcher : public TradeSink {
private:
    std::vector<std::unique_ptr<TradeSink>> sinks_;
    std::atomic<bool> enabled_;

public:
    TradeDispatcher() : enabled_(true) {}

    // Register sinks before matching starts; the list is not guarded
    void add_sink(std::unique_ptr<TradeSink> sink);
    void remove_all_sinks();

    void enable() { enabled_ = true; }
    void disable() { enabled_ = false; }
    bool is_enabled() const { return enabled_; }

    void on_trade(const Trade& trade) override;
};

} // namespace TickerMatch
