#include "trade_sink.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace TickerMatch {

// Console Trade Sink Implementation
void ConsoleTradeSink::on_trade(const Trade& trade) {
    if (!verbose_) return;

    std::ostringstream line;
    line << "TRADE: ticker=" << trade.ticker
         << " buy=" << trade.buy_order_id
         << " sell=" << trade.sell_order_id
         << " qty=" << trade.quantity
         << " price=" << trade.price << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << line.str();
}

// CSV Trade Sink Implementation
CsvTradeSink::CsvTradeSink(const std::string& filename)
    : file_(filename, std::ios::app) {
    if (!file_.is_open()) {
        throw std::runtime_error("cannot open trade file: " + filename);
    }
}

void CsvTradeSink::on_trade(const Trade& trade) {
    const auto time_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        trade.timestamp.time_since_epoch()).count();

    std::lock_guard<std::mutex> lock(mutex_);
    file_ << time_ns << ","
          << trade.ticker << ","
          << trade.buy_order_id << ","
          << trade.sell_order_id << ","
          << trade.quantity << ","
          << trade.price << "\n";
    file_.flush();
}

// Recording Trade Sink Implementation
void RecordingTradeSink::on_trade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    trades_.push_back(trade);
    filled_by_order_[trade.buy_order_id] += trade.quantity;
    filled_by_order_[trade.sell_order_id] += trade.quantity;
    total_quantity_ += trade.quantity;
}

std::vector<Trade> RecordingTradeSink::trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_;
}

std::size_t RecordingTradeSink::trade_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_.size();
}

uint64_t RecordingTradeSink::total_quantity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_quantity_;
}

uint64_t RecordingTradeSink::filled_quantity(OrderId order_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = filled_by_order_.find(order_id);
    return (it != filled_by_order_.end()) ? it->second : 0;
}

void RecordingTradeSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    trades_.clear();
    filled_by_order_.clear();
    total_quantity_ = 0;
}

// Trade Dispatcher Implementation
void TradeDispatcher::add_sink(std::unique_ptr<TradeSink> sink) {
    sinks_.push_back(std::move(sink));
}

void TradeDispatcher::remove_all_sinks() {
    sinks_.clear();
}

void TradeDispatcher::on_trade(const Trade& trade) {
    if (!enabled_) return;

    for (auto& sink : sinks_) {
        sink->on_trade(trade);
    }
}

} // namespace TickerMatch
