#pragma once

#include "datatypes.hpp"
#include "portfolio.hpp"

namespace simulation {

    // --- PortfolioSimulator ---
    // Replays one trade sequence against one position size. Pure function of
    // its inputs: no randomness, no shared state.
    class PortfolioSimulator {
    public:
        PortfolioSimulator(double initial_capital, double risk_reward_ratio);

        // Final capital and max drawdown; the equity curve is attached only
        // when keep_equity_curve is set
        core::TrialResult simulate(double position_size,
                                   const core::TradeSequence& trade_outcomes,
                                   bool keep_equity_curve = false) const;

        // Convenience for callers that always want the curve (N+1 points)
        core::EquityCurve equityCurve(double position_size,
                                      const core::TradeSequence& trade_outcomes) const;

        double getInitialCapital() const { return initial_capital_; }
        double getRiskRewardRatio() const { return risk_reward_ratio_; }

    private:
        double initial_capital_;
        double risk_reward_ratio_;
    };

} // namespace simulation
