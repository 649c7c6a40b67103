#include "numa_allocator.hpp"
#include <cstdlib>
#include <iostream>
#include <new>
#include <numa.h>
#include <sched.h>

namespace TickerMatch {

bool is_numa_available() noexcept {
    return numa_available() >= 0;
}

int numa_node_count() noexcept {
    return is_numa_available() ? numa_max_node() + 1 : 1;
}

int current_numa_node() noexcept {
    if (!is_numa_available()) return 0;

    const int cpu = sched_getcpu();
    if (cpu < 0) return 0;

    const int node = numa_node_of_cpu(cpu);
    return node >= 0 ? node : 0;
}

NumaArena::NumaArena(std::size_t bytes, int preferred_node)
    : memory_(nullptr), size_(bytes), node_(0), numa_backed_(false) {

    if (is_numa_available()) {
        node_ = (preferred_node >= 0 && preferred_node < numa_node_count())
            ? preferred_node : current_numa_node();
        memory_ = numa_alloc_onnode(size_, node_);
        numa_backed_ = (memory_ != nullptr);
    }

    if (!memory_) {
        memory_ = std::malloc(size_);  // Fallback to regular malloc
    }

    if (!memory_) {
        std::cerr << "WARNING: Failed to allocate " << size_ << " bytes for order arena\n";
        throw std::bad_alloc();
    }
}

NumaArena::~NumaArena() {
    if (!memory_) return;

    if (numa_backed_) {
        numa_free(memory_, size_);
    } else {
        std::free(memory_);
    }
}

} // namespace TickerMatch
