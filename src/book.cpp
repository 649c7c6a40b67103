#include "book.hpp"
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace TickerMatch {

OrderBook::OrderBook(const EngineConfig& config)
    : config_(config),
      order_pool_(config.order_capacity, config.numa_node),
      tickers_(new TickerSlot[MAX_TICKERS]),
      next_order_id_(1),
      orders_accepted_(0),
      quantity_accepted_(0) {
    // max_price sizes the matcher's counting sort buckets
    if (!std::isfinite(config_.max_price) || config_.max_price < 0.0 || config_.max_price > PRICE_MAX) {
        std::ostringstream message;
        message << "max_price must be finite and within [0, " << PRICE_MAX << "], got " << config_.max_price;
        throw std::invalid_argument(message.str());
    }
}

AdmissionStatus OrderBook::validate(TickerId ticker, uint64_t quantity, double price) const noexcept {
    if (ticker >= MAX_TICKERS) {
        return AdmissionStatus::REJECTED_INVALID_TICKER;
    }
    if (quantity == 0) {
        return AdmissionStatus::REJECTED_INVALID_QUANTITY;
    }
    // Upper bound keeps the matcher's counting sort domain bounded
    if (!std::isfinite(price) || price < 0.0 || price > config_.max_price) {
        return AdmissionStatus::REJECTED_INVALID_PRICE;
    }
    return AdmissionStatus::ACCEPTED;
}

AddOrderResult OrderBook::reject(AdmissionStatus status, Side side, TickerId ticker,
                                 uint64_t quantity, double price) noexcept {
    rejection_counts_[static_cast<std::size_t>(status)].fetch_add(1, std::memory_order_relaxed);

    std::ostringstream line;
    line << "WARNING: Rejecting " << side_to_string(side) << " order ticker=" << ticker
         << " qty=" << quantity << " price=" << price
         << " reason=" << admission_status_to_string(status) << "\n";
    std::cerr << line.str();

    return AddOrderResult{status, 0};
}

AddOrderResult OrderBook::add_order(Side side, TickerId ticker, uint64_t quantity, double price) noexcept {
    const AdmissionStatus status = validate(ticker, quantity, price);
    if (status != AdmissionStatus::ACCEPTED) {
        return reject(status, side, ticker, quantity, price);
    }

    const OrderId order_id = next_order_id_.fetch_add(1, std::memory_order_relaxed);

    Order* order = order_pool_.allocate(order_id, side, ticker, quantity, price);
    if (!order) {
        return reject(AdmissionStatus::REJECTED_POOL_EXHAUSTED, side, ticker, quantity, price);
    }

    queue(ticker, side).push(order);

    orders_accepted_.fetch_add(1, std::memory_order_relaxed);
    quantity_accepted_.fetch_add(quantity, std::memory_order_relaxed);

    if (config_.log_orders) {
        std::ostringstream line;
        line << "ORDER: id=" << order_id << " side=" << side_to_string(side)
             << " ticker=" << ticker << " qty=" << quantity << " price=" << price << "\n";
        std::cout << line.str();
    }

    return AddOrderResult{AdmissionStatus::ACCEPTED, order_id};
}

ConcurrentOrderQueue& OrderBook::queue(TickerId ticker, Side side) noexcept {
    TickerSlot& slot = tickers_[ticker];
    return side == Side::BUY ? slot.bids : slot.asks;
}

const ConcurrentOrderQueue& OrderBook::queue(TickerId ticker, Side side) const noexcept {
    const TickerSlot& slot = tickers_[ticker];
    return side == Side::BUY ? slot.bids : slot.asks;
}

void OrderBook::lock_ticker(TickerId ticker) noexcept {
    std::atomic_flag& flag = tickers_[ticker].matching;
    while (flag.test_and_set(std::memory_order_acquire)) {
        std::this_thread::yield();
    }
}

void OrderBook::unlock_ticker(TickerId ticker) noexcept {
    tickers_[ticker].matching.clear(std::memory_order_release);
}

uint64_t OrderBook::resting_quantity(TickerId ticker, Side side) const {
    uint64_t total = 0;
    for (const Order* order : queue(ticker, side).snapshot()) {
        total += order->remaining();
    }
    return total;
}

std::size_t OrderBook::resting_orders(TickerId ticker, Side side) const {
    return queue(ticker, side).snapshot().size();
}

uint64_t OrderBook::orders_accepted() const noexcept {
    return orders_accepted_.load(std::memory_order_relaxed);
}

uint64_t OrderBook::quantity_accepted() const noexcept {
    return quantity_accepted_.load(std::memory_order_relaxed);
}

uint64_t OrderBook::orders_rejected() const noexcept {
    uint64_t total = 0;
    for (const auto& count : rejection_counts_) {
        total += count.load(std::memory_order_relaxed);
    }
    return total;
}

uint64_t OrderBook::rejection_count(AdmissionStatus reason) const noexcept {
    return rejection_counts_[static_cast<std::size_t>(reason)].load(std::memory_order_relaxed);
}

uint64_t OrderBook::queue_cas_retries() const noexcept {
    uint64_t total = 0;
    for (TickerId ticker = 0; ticker < MAX_TICKERS; ++ticker) {
        total += tickers_[ticker].bids.cas_retries() + tickers_[ticker].asks.cas_retries();
    }
    return total;
}

uint64_t OrderBook::pool_available() const noexcept {
    return order_pool_.available_count();
}

} // namespace TickerMatch
