#pragma once

#include "datatypes.hpp" // Provides core::PortfolioState, core::EquityCurve, core::TrialResult

namespace simulation {

    // --- Portfolio Class Definition ---
    // Fixed-fractional account: every trade risks the same fraction of the
    // CURRENT capital. Capital is clamped at zero and ruin is absorbing.
    class Portfolio {
    public:
        Portfolio(double initial_capital,
                  double position_size,       // Fraction of capital risked, (0, 1]
                  double risk_reward_ratio,   // Gain per unit risked on a win
                  bool record_equity_curve = true);

        // --- Getters ---
        double getCapital() const { return state_.capital; }
        double getPeakCapital() const { return state_.peak_capital; }
        double getMaxDrawdown() const { return state_.max_drawdown; }
        const core::PortfolioState& getState() const { return state_; }
        const core::EquityCurve& getEquityCurve() const { return equity_curve_; }
        int getTradeCount() const { return trade_count_; }
        bool isRuined() const { return state_.capital <= 0.0; }

        // --- Modifiers ---
        // Applies one trade outcome and records the resulting capital
        void applyTrade(core::TradeOutcome is_win);

        // Moves the recorded curve out; the portfolio keeps its state
        core::EquityCurve releaseEquityCurve();

    private:
        double position_size_;
        double risk_reward_ratio_;
        bool record_equity_curve_;
        core::PortfolioState state_;
        core::EquityCurve equity_curve_;
        int trade_count_ = 0;
    };

} // namespace simulation
