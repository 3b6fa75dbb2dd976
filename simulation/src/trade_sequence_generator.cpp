#include "trade_sequence_generator.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <random>

namespace simulation {

TradeSequenceGenerator::TradeSequenceGenerator(std::size_t num_trades, double win_probability)
    : num_trades_(num_trades), win_probability_(win_probability)
{
    if (num_trades_ == 0) {
        throw core::SimulationException("Trade sequence must contain at least one trade.");
    }
    // Negated form also rejects NaN
    if (!(win_probability_ >= 0.0 && win_probability_ <= 1.0)) {
        throw core::SimulationException(fmt::format("Win probability {} is outside [0, 1].", win_probability_));
    }
}

core::TradeSequence TradeSequenceGenerator::generate(core::RandomEngine& engine) const {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    core::TradeSequence outcomes;
    outcomes.reserve(num_trades_);
    for (std::size_t i = 0; i < num_trades_; ++i) {
        outcomes.push_back(uniform(engine) < win_probability_);
    }
    return outcomes;
}

} // namespace simulation
