#include "portfolio_simulator.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace simulation {

PortfolioSimulator::PortfolioSimulator(double initial_capital, double risk_reward_ratio)
    : initial_capital_(initial_capital), risk_reward_ratio_(risk_reward_ratio)
{
    if (!(initial_capital_ > 0.0)) {
        throw core::SimulationException(fmt::format("Initial capital must be positive (got {}).", initial_capital_));
    }
    if (!(risk_reward_ratio_ > 0.0)) {
        throw core::SimulationException(fmt::format("Risk/reward ratio must be positive (got {}).", risk_reward_ratio_));
    }
}

core::TrialResult PortfolioSimulator::simulate(double position_size,
                                               const core::TradeSequence& trade_outcomes,
                                               bool keep_equity_curve) const
{
    Portfolio portfolio(initial_capital_, position_size, risk_reward_ratio_, keep_equity_curve);
    for (core::TradeOutcome is_win : trade_outcomes) {
        portfolio.applyTrade(is_win);
    }

    core::TrialResult result;
    result.final_capital = portfolio.getCapital();
    result.max_drawdown = portfolio.getMaxDrawdown();
    if (keep_equity_curve) {
        result.equity_curve = portfolio.releaseEquityCurve();
    }
    return result;
}

core::EquityCurve PortfolioSimulator::equityCurve(double position_size,
                                                  const core::TradeSequence& trade_outcomes) const
{
    auto result = simulate(position_size, trade_outcomes, true);
    return std::move(*result.equity_curve);
}

} // namespace simulation
