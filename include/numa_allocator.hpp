#pragma once

#include <cstddef>

namespace TickerMatch {

/**
 * NUMA-aware backing storage for the order arena.
 *
 * Key concepts:
 * - One contiguous block placed on a single NUMA node
 * - Node chosen explicitly or from the constructing thread's CPU
 * - Falls back to regular allocation when the kernel reports no NUMA support
 */
class NumaArena {
private:
    void* memory_;
    std::size_t size_;
    int node_;
    bool numa_backed_;

public:
    /**
     * Allocate `bytes` on `preferred_node` (-1 = current CPU's node).
     * Throws std::bad_alloc if neither NUMA nor regular allocation succeeds.
     */
    explicit NumaArena(std::size_t bytes, int preferred_node = -1);
    ~NumaArena();

    NumaArena(const NumaArena&) = delete;
    NumaArena& operator=(const NumaArena&) = delete;

    void* data() const noexcept { return memory_; }
    std::size_t size() const noexcept { return size_; }
    int node() const noexcept { return node_; }
    bool is_numa_backed() const noexcept { return numa_backed_; }
};

/**
 * NUMA topology information
 */
bool is_numa_available() noexcept;
int numa_node_count() noexcept;
int current_numa_node() noexcept;

} // namespace TickerMatch
