#pragma once

#include "datatypes.hpp"
#include "selection_criteria.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace analysis {

    // Criterion names used in the selection output
    namespace criteria {
        inline constexpr const char* kBestGeometric = "best_geometric";
        inline constexpr const char* kBestMedian = "best_median";
        inline constexpr const char* kBestMean = "best_mean";
        inline constexpr const char* kBestRiskAdjusted = "best_risk_adjusted";
        inline constexpr const char* kBestSafeGrowth = "best_safe_growth";
        inline constexpr const char* kBestVerySafe = "best_very_safe";
    } // namespace criteria

    constexpr double kDefaultSafeDrawdownPct = 30.0;
    constexpr double kDefaultVerySafeDrawdownPct = 20.0;

    // Chosen size per criterion, in criterion order
    struct OptimalitySelection {
        std::vector<core::CriterionSelection> selections;

        // nullptr if no criterion has that name
        const core::CriterionSelection* find(const std::string& criterion) const;

        // Chosen size, empty when no size was eligible. Throws for unknown names.
        std::optional<double> sizeFor(const std::string& criterion) const;
    };

    // --- OptimalSelector ---
    // Applies each criterion over the per-size metrics. Ties on the maximal
    // score resolve to the smallest position size.
    class OptimalSelector {
    public:
        explicit OptimalSelector(std::vector<std::unique_ptr<ISelectionCriterion>> criteria);

        // The six standard criteria: geometric, median, mean, risk-adjusted,
        // and geometric restricted to the two drawdown caps
        static OptimalSelector withDefaultCriteria(double safe_drawdown_pct = kDefaultSafeDrawdownPct,
                                                   double very_safe_drawdown_pct = kDefaultVerySafeDrawdownPct);

        OptimalitySelection select(const core::MetricsBySize& metrics) const;

        // Best eligible size for a single criterion, empty if none qualifies
        static std::optional<double> selectBest(const ISelectionCriterion& criterion,
                                                const core::MetricsBySize& metrics);

        const std::vector<std::unique_ptr<ISelectionCriterion>>& getCriteria() const { return criteria_; }

    private:
        std::vector<std::unique_ptr<ISelectionCriterion>> criteria_;
    };

} // namespace analysis
