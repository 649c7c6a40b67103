#pragma once

#include "types.hpp"
#include "order_pool.hpp"
#include "order_queue.hpp"
#include <array>
#include <atomic>
#include <memory>
#include <vector>

namespace TickerMatch {

/**
 * Order book for MAX_TICKERS tickers. Each ticker owns one buy and one sell
 * ConcurrentOrderQueue plus a guard that serializes matchers on it.
 *
 * Admission is lock-free: validate, take the next id from the single global
 * counter, construct the order in the arena and push it onto its queue.
 * Ids start at 1 and are never reused.
 */
class OrderBook {
private:
    struct TickerSlot {
        ConcurrentOrderQueue bids;
        ConcurrentOrderQueue asks;
        std::atomic_flag matching;    // Held by the matcher working this ticker

        TickerSlot() noexcept : matching() {}
    };

    EngineConfig config_;
    OrderPool order_pool_;
    std::unique_ptr<TickerSlot[]> tickers_;
    std::atomic<OrderId> next_order_id_;

    // Statistics
    std::atomic<uint64_t> orders_accepted_;
    std::atomic<uint64_t> quantity_accepted_;
    std::array<std::atomic<uint64_t>, ADMISSION_STATUS_COUNT> rejection_counts_{};

    AdmissionStatus validate(TickerId ticker, uint64_t quantity, double price) const noexcept;
    AddOrderResult reject(AdmissionStatus status, Side side, TickerId ticker,
                          uint64_t quantity, double price) noexcept;

public:
    /**
     * Throws std::invalid_argument if config.max_price is not finite or lies
     * outside [0, PRICE_MAX], and std::bad_alloc if the order arena cannot be
     * allocated.
     */
    explicit OrderBook(const EngineConfig& config = EngineConfig{});

    OrderBook(const OrderBook&) = delete;
    OrderBook& operator=(const OrderBook&) = delete;

    /**
     * Admit a new order. Rejections leave the book untouched apart from the
     * rejection counters, so callers may retry with corrected input.
     * `quantity` is unsigned: a negative count converted by the caller arrives
     * as a very large lot size and is admitted as such.
     */
    AddOrderResult add_order(Side side, TickerId ticker, uint64_t quantity, double price) noexcept;

    /**
     * Queue for (ticker, side). `ticker` must be below MAX_TICKERS.
     */
    ConcurrentOrderQueue& queue(TickerId ticker, Side side) noexcept;
    const ConcurrentOrderQueue& queue(TickerId ticker, Side side) const noexcept;

    /**
     * Per-ticker matcher exclusion. Spins (yielding) until acquired.
     */
    void lock_ticker(TickerId ticker) noexcept;
    void unlock_ticker(TickerId ticker) noexcept;

    uint64_t resting_quantity(TickerId ticker, Side side) const;
    std::size_t resting_orders(TickerId ticker, Side side) const;

    const EngineConfig& config() const noexcept { return config_; }

    // Statistics getters
    uint64_t orders_accepted() const noexcept;
    uint64_t quantity_accepted() const noexcept;
    uint64_t orders_rejected() const noexcept;
    uint64_t rejection_count(AdmissionStatus reason) const noexcept;
    uint64_t queue_cas_retries() const noexcept;
    uint64_t pool_available() const noexcept;
};

/**
 * RAII holder for OrderBook::lock_ticker.
 */
class TickerMatchGuard {
private:
    OrderBook& book_;
    TickerId ticker_;

public:
    TickerMatchGuard(OrderBook& book, TickerId ticker) noexcept
        : book_(book), ticker_(ticker) {
        book_.lock_ticker(ticker_);
    }

    ~TickerMatchGuard() { book_.unlock_ticker(ticker_); }

    TickerMatchGuard(const TickerMatchGuard&) = delete;
    TickerMatchGuard& operator=(const TickerMatchGuard&) = delete;
};

} // namespace TickerMatch
