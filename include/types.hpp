#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace TickerMatch {

// Configuration constants
constexpr uint32_t MAX_TICKERS = 1024;
constexpr uint64_t MAX_ORDERS = 1 << 20;     // Order arena capacity
constexpr double PRICE_MAX = 100000.0;        // Largest accepted max_price; bounds the counting sort buckets

using TickerId = uint32_t;
using OrderId = uint64_t;

// Enumerations
enum class Side : uint8_t {
    BUY,
    SELL
};

enum class AdmissionStatus : uint8_t {
    ACCEPTED,
    REJECTED_INVALID_TICKER,
    REJECTED_INVALID_QUANTITY,
    REJECTED_INVALID_PRICE,
    REJECTED_POOL_EXHAUSTED
};

constexpr std::size_t ADMISSION_STATUS_COUNT = 5;

/**
 * Runtime engine configuration. Defaults reproduce the compile-time constants.
 */
struct EngineConfig {
    uint32_t ticker_bound = MAX_TICKERS;      // Registry modulus; above MAX_TICKERS is a misconfiguration
    uint64_t order_capacity = MAX_ORDERS;
    double max_price = PRICE_MAX;
    uint32_t match_threads = 1;               // >1 matches tickers in parallel
    int numa_node = -1;                       // -1 = node of the constructing thread's CPU
    bool log_orders = false;

    EngineConfig() = default;
};

/**
 * Intrusive link for ConcurrentOrderQueue. The low bit of `next` marks the
 * owning node as logically removed.
 */
struct QueueHook {
    std::atomic<std::uintptr_t> next{0};
};

// Core data structures
struct Order {
    const OrderId order_id;
    const Side side;
    const TickerId ticker;
    const double price;
    const uint64_t original_quantity;

    std::atomic<uint64_t> quantity;   // Remaining, only ever decreases
    std::atomic<bool> matched;        // Set once quantity reaches zero

    QueueHook hook;

    Order(OrderId id, Side s, TickerId t, uint64_t qty, double p) noexcept;

    Order(const Order&) = delete;
    Order& operator=(const Order&) = delete;

    uint64_t remaining() const noexcept;
    bool is_matched() const noexcept;

    /**
     * Reduce the remaining quantity by `qty` (clamped to what is left).
     * Flags the order as matched when nothing remains.
     * Only the matcher holding the ticker's guard may call this.
     */
    void fill(uint64_t qty) noexcept;
};

struct Trade {
    TickerId ticker;
    OrderId buy_order_id;
    OrderId sell_order_id;
    uint64_t quantity;
    double price;
    std::chrono::high_resolution_clock::time_point timestamp;

    Trade(TickerId t, OrderId buy_id, OrderId sell_id, uint64_t q, double p) noexcept
        : ticker(t), buy_order_id(buy_id), sell_order_id(sell_id), quantity(q), price(p),
          timestamp(std::chrono::high_resolution_clock::now()) {}
};

struct AddOrderResult {
    AdmissionStatus status;
    OrderId order_id;    // 0 unless accepted

    bool accepted() const noexcept { return status == AdmissionStatus::ACCEPTED; }
};

const char* side_to_string(Side side) noexcept;
const char* admission_status_to_string(AdmissionStatus status) noexcept;

} // namespace TickerMatch
