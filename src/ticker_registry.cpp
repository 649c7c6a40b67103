#include "ticker_registry.hpp"

namespace TickerMatch {

TickerRegistry::TickerRegistry(uint32_t bound) noexcept
    : bound_(bound == 0 ? 1 : bound) {}

TickerId TickerRegistry::resolve(const std::string& symbol) const noexcept {
    uint32_t hash = 0;
    for (const char c : symbol) {
        hash = hash * 31u + static_cast<unsigned char>(c);
    }
    return hash % bound_;
}

} // namespace TickerMatch
