#pragma once

#include "types.hpp"
#include "numa_allocator.hpp"
#include <atomic>

namespace TickerMatch {

/**
 * Arena for Orders to eliminate dynamic allocation on the admission path.
 *
 * Slots are handed out by a lock-free bump index and are never recycled while
 * the pool lives. Queue traversals may therefore keep following a node after
 * it has been unlinked, and queue CAS operations cannot suffer ABA.
 * All slots are released together when the pool is destroyed.
 */
class OrderPool {
private:
    NumaArena arena_;
    Order* slots_;
    uint64_t capacity_;
    std::atomic<uint64_t> next_slot_;

public:
    explicit OrderPool(uint64_t max_orders, int numa_node = -1);
    ~OrderPool();

    OrderPool(const OrderPool&) = delete;
    OrderPool& operator=(const OrderPool&) = delete;

    /**
     * Construct an Order in the next free slot. Returns nullptr if the pool
     * is exhausted. Safe to call from any number of threads.
     */
    Order* allocate(OrderId id, Side side, TickerId ticker, uint64_t quantity, double price) noexcept;

    uint64_t allocated_count() const noexcept;
    uint64_t available_count() const noexcept;
    uint64_t capacity() const noexcept;
    int numa_node() const noexcept;
};

} // namespace TickerMatch
