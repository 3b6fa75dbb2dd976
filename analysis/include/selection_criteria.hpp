#pragma once

#include "datatypes.hpp" // Provides core::SizeMetrics
#include <memory> // For std::unique_ptr
#include <string>

namespace analysis {

    // Which SizeMetrics field a criterion maximizes
    enum class MetricField {
        GeometricMeanReturn,
        MedianFinal,
        MeanFinal,
        RiskAdjustedScore
    };

    std::string metricFieldToString(MetricField field);

    // --- Selection Criterion Interface ---
    // Scores a position size's metrics; the selector picks the eligible size
    // with the highest score.
    class ISelectionCriterion {
    public:
        virtual ~ISelectionCriterion() = default;

        // Key in the selection output, e.g. "best_geometric"
        virtual std::string getName() const = 0;
        virtual std::string describe() const = 0;

        virtual bool isEligible(const core::SizeMetrics& metrics) const = 0;
        virtual double score(const core::SizeMetrics& metrics) const = 0;
    };

    // --- MetricCriterion ---
    // Unconstrained: every size is eligible, score is one metric field.
    class MetricCriterion : public ISelectionCriterion {
    public:
        MetricCriterion(std::string name, MetricField field);

        std::string getName() const override;
        std::string describe() const override;
        bool isEligible(const core::SizeMetrics& metrics) const override;
        double score(const core::SizeMetrics& metrics) const override;

    private:
        std::string name_;
        MetricField field_;
    };

    // --- DrawdownCappedCriterion ---
    // Restricts an inner criterion to sizes whose average max drawdown is
    // strictly below the cap (percent). Scoring is delegated unchanged.
    class DrawdownCappedCriterion : public ISelectionCriterion {
    public:
        DrawdownCappedCriterion(std::string name,
                                std::unique_ptr<ISelectionCriterion> inner,
                                double max_avg_drawdown_pct);

        std::string getName() const override;
        std::string describe() const override;
        bool isEligible(const core::SizeMetrics& metrics) const override;
        double score(const core::SizeMetrics& metrics) const override;

        double getMaxAvgDrawdownPct() const { return max_avg_drawdown_pct_; }

    private:
        std::string name_;
        std::unique_ptr<ISelectionCriterion> inner_;
        double max_avg_drawdown_pct_;
    };

} // namespace analysis
