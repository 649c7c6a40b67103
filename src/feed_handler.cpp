#include "feed_handler.hpp"
#include <atomic>
#include <random>
#include <thread>

namespace TickerMatch {

FeedReport FeedHandler::run(TradingEngine& engine, const FeedConfig& config) {
    FeedReport report;
    if (config.symbols.empty()) return report;

    std::random_device rd;
    const uint64_t base_seed = (config.seed != 0) ? config.seed : rd();

    std::atomic<uint64_t> submitted{0};
    std::atomic<uint64_t> accepted{0};
    std::atomic<uint64_t> rejected{0};
    std::atomic<uint64_t> quantity{0};

    const auto start_time = std::chrono::high_resolution_clock::now();

    std::vector<std::thread> producers;
    producers.reserve(config.producers);

    for (uint32_t p = 0; p < config.producers; ++p) {
        producers.emplace_back([&, p]() {
            std::mt19937_64 gen(base_seed + p);

            std::uniform_int_distribution<int> side_dist(0, 1);
            std::uniform_int_distribution<std::size_t> symbol_dist(0, config.symbols.size() - 1);
            std::uniform_int_distribution<uint64_t> lots_dist(1, 100);
            std::uniform_real_distribution<double> price_dist(0.0, 950.0);
            std::uniform_int_distribution<int> pause_dist(1, 4);

            for (uint64_t i = 0; i < config.orders_per_producer; ++i) {
                const Side side = (side_dist(gen) == 0) ? Side::BUY : Side::SELL;
                const std::string& symbol = config.symbols[symbol_dist(gen)];
                const uint64_t qty = lots_dist(gen) * 10;
                const double price = 50.0 + price_dist(gen);

                const AddOrderResult result = engine.add_order(side, symbol, qty, price);
                ++submitted;
                if (result.accepted()) {
                    ++accepted;
                    quantity += qty;
                } else {
                    ++rejected;
                }

                if (config.match_every != 0 && i % config.match_every == 0) {
                    engine.match_orders();
                }

                if (config.pause_between_orders) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(pause_dist(gen)));
                }
            }
        });
    }

    for (auto& producer : producers) {
        producer.join();
    }

    // Final matching phase
    engine.match_orders();

    report.orders_submitted = submitted.load();
    report.orders_accepted = accepted.load();
    report.orders_rejected = rejected.load();
    report.quantity_accepted = quantity.load();
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start_time);
    return report;
}

} // namespace TickerMatch
