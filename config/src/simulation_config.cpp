#include "simulation_config.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <set>

namespace config {

    std::vector<double> defaultPositionSizes() {
        std::vector<double> sizes;
        for (double pct : core::utils::percentRange(1.0, 40.0, 0.5)) {
            sizes.push_back(core::utils::percentToFraction(pct));
        }
        return sizes;
    }

    void SimulationConfig::validate() const {
        // Negated comparisons so NaN is rejected too
        if (!(win_probability > 0.0 && win_probability < 1.0)) {
            throw core::ConfigException("win_probability", fmt::format("must be in (0, 1), got {}", win_probability));
        }
        if (num_trades < 1) {
            throw core::ConfigException("num_trades", "must be at least 1");
        }
        if (num_trials < 1) {
            throw core::ConfigException("num_trials", "must be at least 1");
        }
        if (!(initial_capital > 0.0) || !std::isfinite(initial_capital)) {
            throw core::ConfigException("initial_capital", fmt::format("must be positive and finite, got {}", initial_capital));
        }
        if (!(risk_reward_ratio > 0.0) || !std::isfinite(risk_reward_ratio)) {
            throw core::ConfigException("risk_reward_ratio", fmt::format("must be positive and finite, got {}", risk_reward_ratio));
        }
        if (position_sizes.empty()) {
            throw core::ConfigException(kPositionSizesKey, "at least one candidate size is required");
        }
        std::set<double> seen;
        for (double size : position_sizes) {
            if (!(size > 0.0 && size <= 1.0)) {
                throw core::ConfigException(kPositionSizesKey,
                    fmt::format("{}% is outside (0%, 100%]", core::utils::fractionToPercent(size)));
            }
            if (!seen.insert(size).second) {
                throw core::ConfigException(kPositionSizesKey,
                    fmt::format("duplicate size {}", core::utils::formatSizeLabel(size)));
            }
        }
        if (!(log_return_floor > 0.0 && log_return_floor < 1.0)) {
            throw core::ConfigException("log_return_floor", fmt::format("must be in (0, 1), got {}", log_return_floor));
        }
        if (!(ruin_threshold_ratio >= 0.0 && ruin_threshold_ratio < 1.0)) {
            throw core::ConfigException("ruin_threshold_ratio", fmt::format("must be in [0, 1), got {}", ruin_threshold_ratio));
        }
        if (!(selection.safe_drawdown_pct > 0.0 && selection.safe_drawdown_pct <= 100.0)) {
            throw core::ConfigException("selection.safe_drawdown_pct",
                fmt::format("must be in (0, 100], got {}", selection.safe_drawdown_pct));
        }
        if (!(selection.very_safe_drawdown_pct > 0.0 && selection.very_safe_drawdown_pct <= 100.0)) {
            throw core::ConfigException("selection.very_safe_drawdown_pct",
                fmt::format("must be in (0, 100], got {}", selection.very_safe_drawdown_pct));
        }
    }

} // namespace config
