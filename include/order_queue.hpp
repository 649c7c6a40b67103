#pragma once

#include "types.hpp"
#include <atomic>
#include <vector>

namespace TickerMatch {

/**
 * Lock-free unordered collection of resting orders for one (ticker, side).
 *
 * Orders are intrusive nodes linked through Order::hook. Insertion prepends
 * with a CAS on the head. Removal is two-phase: the victim's own successor
 * link is first marked (logical delete), then the predecessor is swung past
 * it (physical unlink). Any traversal that meets a marked node helps unlink
 * it, and every failed CAS restarts the scan from the head. The restart has
 * no fairness bound, so removers can livelock under sustained contention;
 * the restarts are counted in cas_retries().
 *
 * Nodes are never freed while the queue is reachable (see OrderPool), so a
 * thread that is still walking an unlinked node stays on valid memory.
 */
class ConcurrentOrderQueue {
private:
    QueueHook head_;
    mutable std::atomic<uint64_t> cas_retries_;

    template <typename Predicate>
    std::size_t unlink_if(Predicate pred, bool first_only) noexcept;

public:
    ConcurrentOrderQueue() noexcept;

    ConcurrentOrderQueue(const ConcurrentOrderQueue&) = delete;
    ConcurrentOrderQueue& operator=(const ConcurrentOrderQueue&) = delete;

    /**
     * Prepend an order. Never blocks; retries only while the head moves.
     */
    void push(Order* order) noexcept;

    /**
     * Weakly consistent copy of the live orders. May miss orders pushed
     * during the walk. Never yields a removed node or a matched order.
     */
    std::vector<Order*> snapshot() const;

    /**
     * Unlink the order with `order_id`. Returns true for exactly one caller
     * when several race to remove the same order.
     */
    bool remove(OrderId order_id) noexcept;

    /**
     * Unlink every matched order in one sweep. Returns how many this call
     * removed.
     */
    std::size_t purge_filled() noexcept;

    bool empty() const noexcept;
    uint64_t cas_retries() const noexcept;
};

} // namespace TickerMatch
