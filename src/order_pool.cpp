#include "order_pool.hpp"
#include <algorithm>
#include <new>

namespace TickerMatch {

OrderPool::OrderPool(uint64_t max_orders, int numa_node)
    : arena_(std::max<uint64_t>(max_orders, 1) * sizeof(Order), numa_node),
      slots_(static_cast<Order*>(arena_.data())),
      capacity_(max_orders),
      next_slot_(0) {}

OrderPool::~OrderPool() {
    const uint64_t used = allocated_count();
    for (uint64_t i = 0; i < used; ++i) {
        slots_[i].~Order();
    }
}

Order* OrderPool::allocate(OrderId id, Side side, TickerId ticker, uint64_t quantity, double price) noexcept {
    // Index may run past capacity under contention; those callers just fail
    const uint64_t slot = next_slot_.fetch_add(1, std::memory_order_relaxed);
    if (slot >= capacity_) return nullptr;

    return new (&slots_[slot]) Order(id, side, ticker, quantity, price);
}

uint64_t OrderPool::allocated_count() const noexcept {
    return std::min(next_slot_.load(std::memory_order_relaxed), capacity_);
}

uint64_t OrderPool::available_count() const noexcept {
    return capacity_ - allocated_count();
}

uint64_t OrderPool::capacity() const noexcept {
    return capacity_;
}

int OrderPool::numa_node() const noexcept {
    return arena_.node();
}

} // namespace TickerMatch
