#include "report_logger.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cmath>
#include <optional>
#include <string>

namespace reporting {

    namespace {

        const std::string kRule(70, '=');

        std::string sizeOrNone(const std::optional<double>& size) {
            return size ? core::utils::formatSizeLabel(*size) : std::string("none eligible");
        }

        // Whole-percent sizes keep the table short on fine-grained scans
        bool isWholePercent(double size) {
            double pct = core::utils::fractionToPercent(size);
            return pct == std::floor(pct);
        }

    } // end anonymous namespace

    void ReportLogger::logParameters(const engine::StudyResult& result) {
        auto logger = core::logging::getLogger();
        const auto& config = result.config;
        logger->info(kRule);
        logger->info("POSITION SIZE STUDY (PURE SIMULATION)");
        logger->info(kRule);
        logger->info("  - Win Probability:         {}%", config.win_probability * 100.0);
        logger->info("  - Risk/Reward Ratio:       1:{}", config.risk_reward_ratio);
        logger->info("  - Number of Trades:        {}", config.num_trades);
        logger->info("  - Monte Carlo Simulations: {}", config.num_trials);
        logger->info("  - Initial Capital:         ${:.2f}", config.initial_capital);
        logger->info("  - Position Sizes:          {} candidates, {} to {}",
                     config.position_sizes.size(),
                     core::utils::formatSizeLabel(result.metrics.begin()->first),
                     core::utils::formatSizeLabel(result.metrics.rbegin()->first));
        logger->info("  - Seed:                    {}", result.seed);
    }

    void ReportLogger::logSelection(const engine::StudyResult& result) {
        auto logger = core::logging::getLogger();
        logger->info(kRule);
        logger->info("SIMULATION RESULTS - OPTIMAL POSITION SIZES");
        logger->info(kRule);

        auto best = result.selection.sizeFor(analysis::criteria::kBestGeometric);
        logger->info("  OPTIMAL POSITION SIZE (Best Geometric Growth): {}", sizeOrNone(best));
        logger->info("  Other Criteria:");
        for (const auto& selection : result.selection.selections) {
            if (selection.criterion == analysis::criteria::kBestGeometric) continue;
            logger->info("  - {:<20} {:<45} {}", selection.criterion, selection.description,
                         sizeOrNone(selection.position_size));
        }

        if (best) {
            const auto& m = result.metricsFor(*best);
            logger->info("  Metrics for OPTIMAL {} position size:", core::utils::formatSizeLabel(*best));
            logger->info("    - Geometric Return:    {:.1f}%", m.geometric_mean_return_pct);
            logger->info("    - Median Return:       {:.1f}%", m.median_return_pct);
            logger->info("    - Avg Max Drawdown:    {:.1f}%", m.avg_max_drawdown_pct);
            logger->info("    - Profitable:          {:.1f}%", m.profitable_pct);
            logger->info("    - Bankrupt:            {:.1f}%", m.bankrupt_pct);
        }
    }

    void ReportLogger::logMetricsTable(const engine::StudyResult& result) {
        auto logger = core::logging::getLogger();
        auto best = result.selection.sizeFor(analysis::criteria::kBestGeometric);

        logger->info(kRule);
        logger->info("DETAILED METRICS BY POSITION SIZE");
        logger->info(kRule);
        logger->info("{:<7} {:>11} {:>11} {:>11} {:>10} {:>10} {:>10} {:>9}",
                     "Size", "Geo Ret %", "Median Ret%", "Mean Ret %", "AvgMaxDD%", "Profit %", "Bankrupt%", "RiskAdj");
        logger->info(std::string(86, '-'));
        for (const auto& [size, m] : result.metrics) {
            bool is_best = best && *best == size;
            if (!isWholePercent(size) && !is_best) continue;
            logger->info("{:<7} {:>11.1f} {:>11.1f} {:>11.1f} {:>10.1f} {:>10.1f} {:>10.1f} {:>9.3f}{}",
                         core::utils::formatSizeLabel(size), m.geometric_mean_return_pct, m.median_return_pct,
                         m.mean_return_pct, m.avg_max_drawdown_pct, m.profitable_pct, m.bankrupt_pct,
                         m.risk_adjusted_score, is_best ? "  <-- OPTIMAL" : "");
        }

        // Capital spread per size (debug detail)
        for (const auto& [size, m] : result.metrics) {
            logger->debug("{} Position Size: min ${:.2f}, max ${:.2f}, std ${:.2f}, worst DD {:.1f}%",
                          core::utils::formatSizeLabel(size), m.min_final, m.max_final, m.std_final,
                          m.worst_drawdown_pct);
        }
    }

    void ReportLogger::logStudy(const engine::StudyResult& result) {
        logParameters(result);
        logSelection(result);
        logMetricsTable(result);
        core::logging::getLogger()->info(kRule);
    }

} // namespace reporting
