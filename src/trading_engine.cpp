#include "trading_engine.hpp"

namespace TickerMatch {

TradingEngine::TradingEngine(TradeSink& sink, const EngineConfig& config)
    : registry_(config.ticker_bound), book_(config), matcher_(book_, sink) {}

AddOrderResult TradingEngine::add_order(Side side, const std::string& symbol,
                                        uint64_t quantity, double price) noexcept {
    return book_.add_order(side, registry_.resolve(symbol), quantity, price);
}

void TradingEngine::match_orders() {
    matcher_.match_orders();
}

TickerId TradingEngine::ticker_id(const std::string& symbol) const noexcept {
    return registry_.resolve(symbol);
}

} // namespace TickerMatch
