#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace core {

    // Random engine threaded explicitly through every call that consumes randomness
    using RandomEngine = std::mt19937_64;

    // true = win, false = loss
    using TradeOutcome = bool;

    // Ordered, immutable once generated. One instance per trial, shared by
    // const reference across every candidate position size.
    using TradeSequence = std::vector<TradeOutcome>;

    // Capital after each trade, starting with the initial capital (N+1 points)
    using EquityCurve = std::vector<double>;

    // Evolving state of one portfolio within a single (trial, size) replay
    struct PortfolioState {
        double capital = 0.0;
        double peak_capital = 0.0;
        double max_drawdown = 0.0;  // Fraction, 0..1
    };

    // Outcome of replaying one trade sequence at one position size
    struct TrialResult {
        double final_capital = 0.0;
        double max_drawdown = 0.0;               // Fraction, 0..1
        std::optional<EquityCurve> equity_curve; // Only kept when requested
    };

    // Aggregate statistics for one position size over all trials.
    // Percentages are on a 0-100 scale.
    struct SizeMetrics {
        double position_size = 0.0;   // Fraction of capital risked, 0..1
        std::size_t trial_count = 0;

        double mean_final = 0.0;
        double median_final = 0.0;
        double std_final = 0.0;       // Population standard deviation
        double min_final = 0.0;
        double max_final = 0.0;

        double geometric_mean_return_pct = 0.0;
        double mean_return_pct = 0.0;
        double median_return_pct = 0.0;

        double avg_max_drawdown_pct = 0.0;
        double worst_drawdown_pct = 0.0;

        double profitable_pct = 0.0;
        double bankrupt_pct = 0.0;

        double risk_adjusted_score = 0.0;
    };

    // Keyed by position size fraction; std::map keeps sizes ascending
    using TrialResultsBySize = std::map<double, std::vector<TrialResult>>;
    using MetricsBySize = std::map<double, SizeMetrics>;

    // Chosen size for one selection criterion. An empty size means no
    // candidate was eligible under the criterion's constraint.
    struct CriterionSelection {
        std::string criterion;
        std::string description;
        std::optional<double> position_size;
    };

} // namespace core
