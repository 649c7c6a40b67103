#include "order_queue.hpp"

namespace TickerMatch {

namespace {

constexpr std::uintptr_t REMOVED_MARK = 1;

inline Order* to_order(std::uintptr_t link) noexcept {
    return reinterpret_cast<Order*>(link & ~REMOVED_MARK);
}

inline std::uintptr_t to_link(Order* order) noexcept {
    return reinterpret_cast<std::uintptr_t>(order);
}

inline bool is_removed(std::uintptr_t link) noexcept {
    return (link & REMOVED_MARK) != 0;
}

} // namespace

ConcurrentOrderQueue::ConcurrentOrderQueue() noexcept
    : cas_retries_(0) {}

void ConcurrentOrderQueue::push(Order* order) noexcept {
    std::uintptr_t old_head = head_.next.load(std::memory_order_relaxed);

    // Release publishes the order's fields to snapshot readers
    for (;;) {
        order->hook.next.store(old_head, std::memory_order_relaxed);
        if (head_.next.compare_exchange_weak(old_head, to_link(order),
                                             std::memory_order_release,
                                             std::memory_order_relaxed)) {
            return;
        }
        cas_retries_.fetch_add(1, std::memory_order_relaxed);
    }
}

std::vector<Order*> ConcurrentOrderQueue::snapshot() const {
    std::vector<Order*> orders;

    std::uintptr_t link = head_.next.load(std::memory_order_acquire);
    while (link != 0) {
        Order* order = to_order(link);
        const std::uintptr_t succ = order->hook.next.load(std::memory_order_acquire);

        if (!is_removed(succ) && !order->is_matched()) {
            orders.push_back(order);
        }
        link = succ & ~REMOVED_MARK;
    }

    return orders;
}

template <typename Predicate>
std::size_t ConcurrentOrderQueue::unlink_if(Predicate pred, bool first_only) noexcept {
    std::size_t removed = 0;
    bool restart = true;

    while (restart) {
        restart = false;

        QueueHook* prev = &head_;
        std::uintptr_t cur_link = prev->next.load(std::memory_order_acquire);

        while (cur_link != 0) {
            Order* cur = to_order(cur_link);
            std::uintptr_t succ = cur->hook.next.load(std::memory_order_acquire);

            if (is_removed(succ)) {
                // Help finish someone else's removal
                std::uintptr_t expected = cur_link;
                const std::uintptr_t clean_succ = succ & ~REMOVED_MARK;
                if (!prev->next.compare_exchange_strong(expected, clean_succ,
                                                        std::memory_order_acq_rel,
                                                        std::memory_order_acquire)) {
                    cas_retries_.fetch_add(1, std::memory_order_relaxed);
                    restart = true;
                    break;
                }
                cur_link = clean_succ;
                continue;
            }

            if (!pred(*cur)) {
                prev = &cur->hook;
                cur_link = succ;
                continue;
            }

            // Logical delete: once marked, cur->hook.next never changes again
            if (!cur->hook.next.compare_exchange_strong(succ, succ | REMOVED_MARK,
                                                        std::memory_order_acq_rel,
                                                        std::memory_order_acquire)) {
                cas_retries_.fetch_add(1, std::memory_order_relaxed);
                restart = true;
                break;
            }
            ++removed;

            std::uintptr_t expected = cur_link;
            const bool unlinked = prev->next.compare_exchange_strong(expected, succ,
                                                                     std::memory_order_acq_rel,
                                                                     std::memory_order_acquire);
            if (first_only) {
                // A later traversal finishes the unlink if this one lost the race
                return removed;
            }
            if (!unlinked) {
                cas_retries_.fetch_add(1, std::memory_order_relaxed);
                restart = true;
                break;
            }
            cur_link = succ;
        }
    }

    return removed;
}

bool ConcurrentOrderQueue::remove(OrderId order_id) noexcept {
    return unlink_if([order_id](const Order& order) { return order.order_id == order_id; },
                     true) > 0;
}

std::size_t ConcurrentOrderQueue::purge_filled() noexcept {
    return unlink_if([](const Order& order) { return order.is_matched(); }, false);
}

bool ConcurrentOrderQueue::empty() const noexcept {
    std::uintptr_t link = head_.next.load(std::memory_order_acquire);
    while (link != 0) {
        const Order* order = to_order(link);
        const std::uintptr_t succ = order->hook.next.load(std::memory_order_acquire);
        if (!is_removed(succ) && !order->is_matched()) return false;
        link = succ & ~REMOVED_MARK;
    }
    return true;
}

uint64_t ConcurrentOrderQueue::cas_retries() const noexcept {
    return cas_retries_.load(std::memory_order_relaxed);
}

} // namespace TickerMatch
