#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace config {

    // Parameter named by position size errors; the JSON list key
    inline constexpr const char* kPositionSizesKey = "position_sizes_pct";

    struct SelectionConfig {
        double safe_drawdown_pct = 30.0;       // best_safe_growth cap
        double very_safe_drawdown_pct = 20.0;  // best_very_safe cap
    };

    // 1%, 1.5%, ..., 40% as fractions
    std::vector<double> defaultPositionSizes();

    // --- SimulationConfig ---
    // Everything one run needs. Passed explicitly into the engine; defaults
    // are the full position-size scan at a 57% win rate.
    struct SimulationConfig {
        double win_probability = 0.57;
        std::size_t num_trades = 500;
        std::size_t num_trials = 500;
        double initial_capital = 10000.0;
        double risk_reward_ratio = 1.0;
        std::vector<double> position_sizes = defaultPositionSizes(); // Fractions in (0, 1]
        std::optional<std::uint64_t> seed = 42;  // Empty = seed from std::random_device

        std::size_t workers = 0;                 // 0 = one per hardware thread
        bool keep_equity_curves = false;
        double log_return_floor = 1e-4;
        double ruin_threshold_ratio = 1e-6;
        SelectionConfig selection;

        // Throws core::ConfigException naming the first offending parameter
        void validate() const;
    };

} // namespace config
