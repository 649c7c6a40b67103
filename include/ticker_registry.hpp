#pragma once

#include "types.hpp"
#include <string>

namespace TickerMatch {

/**
 * Maps a symbol to a bounded ticker id with a deterministic string hash.
 *
 * The mapping is not injective: distinct symbols may resolve to the same id
 * and then share one order book. Nothing corrects this.
 */
class TickerRegistry {
private:
    uint32_t bound_;

public:
    explicit TickerRegistry(uint32_t bound = MAX_TICKERS) noexcept;

    /**
     * 31-based polynomial hash over the symbol bytes in 32-bit unsigned
     * arithmetic, reduced modulo the bound. Result is in [0, bound).
     */
    TickerId resolve(const std::string& symbol) const noexcept;

    uint32_t bound() const noexcept { return bound_; }
};

} // namespace TickerMatch
