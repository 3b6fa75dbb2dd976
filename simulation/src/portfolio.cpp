#include "portfolio.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm> // For std::max
#include <utility>

namespace simulation {

    Portfolio::Portfolio(double initial_capital, double position_size,
                         double risk_reward_ratio, bool record_equity_curve)
        : position_size_(position_size),
          risk_reward_ratio_(risk_reward_ratio),
          record_equity_curve_(record_equity_curve)
    {
        if (!(initial_capital > 0.0)) {
            throw core::SimulationException(fmt::format("Initial capital must be positive (got {}).", initial_capital));
        }
        if (!(position_size > 0.0 && position_size <= 1.0)) {
            throw core::SimulationException(fmt::format("Position size must be in (0, 1] (got {}).", position_size));
        }
        if (!(risk_reward_ratio > 0.0)) {
            throw core::SimulationException(fmt::format("Risk/reward ratio must be positive (got {}).", risk_reward_ratio));
        }

        state_.capital = initial_capital;
        state_.peak_capital = initial_capital;
        state_.max_drawdown = 0.0;
        if (record_equity_curve_) {
            equity_curve_.push_back(initial_capital);
        }
    }

    void Portfolio::applyTrade(core::TradeOutcome is_win) {
        ++trade_count_;

        // Ruined accounts sit out every remaining trade at zero
        if (isRuined()) {
            if (record_equity_curve_) {
                equity_curve_.push_back(0.0);
            }
            return;
        }

        double risk_amount = state_.capital * position_size_;
        if (is_win) {
            state_.capital += risk_amount * risk_reward_ratio_;
        } else {
            state_.capital -= risk_amount;
        }
        state_.capital = std::max(0.0, state_.capital);

        if (record_equity_curve_) {
            equity_curve_.push_back(state_.capital);
        }

        // --- Drawdown Tracking ---
        state_.peak_capital = std::max(state_.peak_capital, state_.capital);
        double drawdown = (state_.peak_capital > 0.0)
            ? (state_.peak_capital - state_.capital) / state_.peak_capital
            : 0.0;
        state_.max_drawdown = std::max(state_.max_drawdown, drawdown);
    }

    core::EquityCurve Portfolio::releaseEquityCurve() {
        return std::move(equity_curve_);
    }

} // namespace simulation
