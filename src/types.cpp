#include "types.hpp"

namespace TickerMatch {

Order::Order(OrderId id, Side s, TickerId t, uint64_t qty, double p) noexcept
    : order_id(id), side(s), ticker(t), price(p), original_quantity(qty),
      quantity(qty), matched(false) {}

uint64_t Order::remaining() const noexcept {
    return quantity.load(std::memory_order_acquire);
}

bool Order::is_matched() const noexcept {
    return matched.load(std::memory_order_acquire);
}

void Order::fill(uint64_t qty) noexcept {
    const uint64_t left = quantity.load(std::memory_order_relaxed);
    const uint64_t next = (qty >= left) ? 0 : left - qty;

    quantity.store(next, std::memory_order_release);
    if (next == 0) {
        matched.store(true, std::memory_order_release);
    }
}

const char* side_to_string(Side side) noexcept {
    return side == Side::BUY ? "BUY" : "SELL";
}

const char* admission_status_to_string(AdmissionStatus status) noexcept {
    switch (status) {
        case AdmissionStatus::ACCEPTED: return "ACCEPTED";
        case AdmissionStatus::REJECTED_INVALID_TICKER: return "INVALID_TICKER";
        case AdmissionStatus::REJECTED_INVALID_QUANTITY: return "INVALID_QUANTITY";
        case AdmissionStatus::REJECTED_INVALID_PRICE: return "INVALID_PRICE";
        case AdmissionStatus::REJECTED_POOL_EXHAUSTED: return "POOL_EXHAUSTED";
    }
    return "UNKNOWN";
}

} // namespace TickerMatch
