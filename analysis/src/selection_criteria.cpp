#include "selection_criteria.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept> // For std::invalid_argument
#include <utility>

namespace analysis {

    std::string metricFieldToString(MetricField field) {
        switch (field) {
            case MetricField::GeometricMeanReturn: return "geometric mean return";
            case MetricField::MedianFinal:         return "median final capital";
            case MetricField::MeanFinal:           return "mean final capital";
            case MetricField::RiskAdjustedScore:   return "risk-adjusted score";
        }
        return "unknown metric";
    }

    // --- MetricCriterion ---

    MetricCriterion::MetricCriterion(std::string name, MetricField field)
        : name_(std::move(name)), field_(field)
    {
        if (name_.empty()) throw std::invalid_argument("Selection criterion name cannot be empty.");
    }

    std::string MetricCriterion::getName() const { return name_; }

    std::string MetricCriterion::describe() const {
        return "max " + metricFieldToString(field_);
    }

    bool MetricCriterion::isEligible(const core::SizeMetrics& /*metrics*/) const {
        return true;
    }

    double MetricCriterion::score(const core::SizeMetrics& metrics) const {
        switch (field_) {
            case MetricField::GeometricMeanReturn: return metrics.geometric_mean_return_pct;
            case MetricField::MedianFinal:         return metrics.median_final;
            case MetricField::MeanFinal:           return metrics.mean_final;
            case MetricField::RiskAdjustedScore:   return metrics.risk_adjusted_score;
        }
        throw std::invalid_argument("Unhandled metric field in MetricCriterion.");
    }

    // --- DrawdownCappedCriterion ---

    DrawdownCappedCriterion::DrawdownCappedCriterion(std::string name,
                                                     std::unique_ptr<ISelectionCriterion> inner,
                                                     double max_avg_drawdown_pct)
        : name_(std::move(name)), inner_(std::move(inner)), max_avg_drawdown_pct_(max_avg_drawdown_pct)
    {
        if (name_.empty()) throw std::invalid_argument("Selection criterion name cannot be empty.");
        if (!inner_) throw std::invalid_argument("DrawdownCappedCriterion requires an inner criterion.");
        if (!(max_avg_drawdown_pct_ > 0.0)) {
            throw std::invalid_argument("Drawdown cap must be positive.");
        }
    }

    std::string DrawdownCappedCriterion::getName() const { return name_; }

    std::string DrawdownCappedCriterion::describe() const {
        return fmt::format("{} with avg max drawdown < {}%", inner_->describe(), max_avg_drawdown_pct_);
    }

    bool DrawdownCappedCriterion::isEligible(const core::SizeMetrics& metrics) const {
        return metrics.avg_max_drawdown_pct < max_avg_drawdown_pct_ && inner_->isEligible(metrics);
    }

    double DrawdownCappedCriterion::score(const core::SizeMetrics& metrics) const {
        return inner_->score(metrics);
    }

} // namespace analysis
