#include "optimal_selector.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <set>
#include <utility>

namespace analysis {

    const core::CriterionSelection* OptimalitySelection::find(const std::string& criterion) const {
        for (const auto& selection : selections) {
            if (selection.criterion == criterion) return &selection;
        }
        return nullptr;
    }

    std::optional<double> OptimalitySelection::sizeFor(const std::string& criterion) const {
        const auto* selection = find(criterion);
        if (!selection) {
            throw std::out_of_range("Unknown selection criterion: " + criterion);
        }
        return selection->position_size;
    }

    OptimalSelector::OptimalSelector(std::vector<std::unique_ptr<ISelectionCriterion>> criteria)
        : criteria_(std::move(criteria))
    {
        if (criteria_.empty()) {
            throw std::invalid_argument("OptimalSelector must receive at least one criterion.");
        }
        std::set<std::string> names;
        for (const auto& criterion : criteria_) {
            if (!criterion) throw std::invalid_argument("OptimalSelector received a null criterion.");
            if (!names.insert(criterion->getName()).second) {
                throw std::invalid_argument("Duplicate selection criterion name: " + criterion->getName());
            }
        }
    }

    OptimalSelector OptimalSelector::withDefaultCriteria(double safe_drawdown_pct, double very_safe_drawdown_pct) {
        std::vector<std::unique_ptr<ISelectionCriterion>> list;
        list.push_back(std::make_unique<MetricCriterion>(criteria::kBestGeometric, MetricField::GeometricMeanReturn));
        list.push_back(std::make_unique<MetricCriterion>(criteria::kBestMedian, MetricField::MedianFinal));
        list.push_back(std::make_unique<MetricCriterion>(criteria::kBestMean, MetricField::MeanFinal));
        list.push_back(std::make_unique<MetricCriterion>(criteria::kBestRiskAdjusted, MetricField::RiskAdjustedScore));
        list.push_back(std::make_unique<DrawdownCappedCriterion>(
            criteria::kBestSafeGrowth,
            std::make_unique<MetricCriterion>(criteria::kBestGeometric, MetricField::GeometricMeanReturn),
            safe_drawdown_pct));
        list.push_back(std::make_unique<DrawdownCappedCriterion>(
            criteria::kBestVerySafe,
            std::make_unique<MetricCriterion>(criteria::kBestGeometric, MetricField::GeometricMeanReturn),
            very_safe_drawdown_pct));
        return OptimalSelector(std::move(list));
    }

    std::optional<double> OptimalSelector::selectBest(const ISelectionCriterion& criterion,
                                                      const core::MetricsBySize& metrics)
    {
        // metrics is ordered by ascending size and only a strictly greater
        // score replaces the current best, so ties keep the smaller size
        std::optional<double> best_size;
        double best_score = 0.0;
        for (const auto& [size, size_metrics] : metrics) {
            if (!criterion.isEligible(size_metrics)) continue;
            double score = criterion.score(size_metrics);
            if (!best_size || score > best_score) {
                best_size = size;
                best_score = score;
            }
        }
        return best_size;
    }

    OptimalitySelection OptimalSelector::select(const core::MetricsBySize& metrics) const {
        if (metrics.empty()) {
            throw core::SimulationException("Cannot select an optimal size from an empty metrics table.");
        }
        auto logger = core::logging::getLogger();

        OptimalitySelection result;
        result.selections.reserve(criteria_.size());
        for (const auto& criterion : criteria_) {
            core::CriterionSelection selection;
            selection.criterion = criterion->getName();
            selection.description = criterion->describe();
            selection.position_size = selectBest(*criterion, metrics);

            if (selection.position_size) {
                logger->debug("Criterion '{}' ({}) -> {}", selection.criterion, selection.description,
                              core::utils::formatSizeLabel(*selection.position_size));
            } else {
                logger->debug("Criterion '{}' ({}) -> none eligible", selection.criterion, selection.description);
            }
            result.selections.push_back(std::move(selection));
        }
        return result;
    }

} // namespace analysis
