// =============================================================================
// optimal_selector_test.cpp
// =============================================================================
// Unit tests for analysis::OptimalSelector and the selection criteria.
//
// Validates:
//   - Each default criterion picks the size maximizing its metric
//   - Drawdown-capped criteria only consider sizes strictly under the cap
//   - No eligible size -> "none eligible", not an exception
//   - Ties on the maximal score resolve to the smallest size
//   - Custom criteria lists and lookup of unknown criteria
// =============================================================================

#include "optimal_selector.hpp"
#include "selection_criteria.hpp"
#include "exceptions.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

using analysis::OptimalSelector;
namespace criteria = analysis::criteria;

namespace {

core::SizeMetrics makeMetrics(double size, double geo_pct, double median, double mean,
                              double risk_adjusted, double avg_dd_pct) {
  core::SizeMetrics m;
  m.position_size = size;
  m.geometric_mean_return_pct = geo_pct;
  m.median_final = median;
  m.mean_final = mean;
  m.risk_adjusted_score = risk_adjusted;
  m.avg_max_drawdown_pct = avg_dd_pct;
  return m;
}

// Shaped like a real scan: growth peaks mid-range, mean keeps rising with
// size, drawdown rises with size.
core::MetricsBySize syntheticTable() {
  core::MetricsBySize table;
  table[0.02] = makeMetrics(0.02, 40.0, 14000.0, 14500.0, 2.0, 12.0);
  table[0.05] = makeMetrics(0.05, 90.0, 18500.0, 21000.0, 1.6, 19.0);
  table[0.10] = makeMetrics(0.10, 140.0, 22000.0, 40000.0, 1.1, 29.0);
  table[0.15] = makeMetrics(0.15, 150.0, 21000.0, 90000.0, 0.7, 38.0);
  table[0.30] = makeMetrics(0.30, -60.0, 3000.0, 300000.0, 0.2, 70.0);
  return table;
}

}  // namespace

TEST(OptimalSelectorTest, DefaultCriteriaPickTheirMaxima) {
  auto selector = OptimalSelector::withDefaultCriteria();
  auto selection = selector.select(syntheticTable());

  ASSERT_EQ(selection.selections.size(), 6u);
  EXPECT_EQ(selection.sizeFor(criteria::kBestGeometric), 0.15);
  EXPECT_EQ(selection.sizeFor(criteria::kBestMedian), 0.10);
  EXPECT_EQ(selection.sizeFor(criteria::kBestMean), 0.30);
  EXPECT_EQ(selection.sizeFor(criteria::kBestRiskAdjusted), 0.02);
  // Under 30% drawdown: 2%, 5%, 10% -> best growth at 10%
  EXPECT_EQ(selection.sizeFor(criteria::kBestSafeGrowth), 0.10);
  // Under 20% drawdown: 2%, 5% -> 5%
  EXPECT_EQ(selection.sizeFor(criteria::kBestVerySafe), 0.05);
}

TEST(OptimalSelectorTest, SelectionsFollowCriterionOrder) {
  auto selection = OptimalSelector::withDefaultCriteria().select(syntheticTable());
  const char* expected[] = {criteria::kBestGeometric, criteria::kBestMedian, criteria::kBestMean,
                            criteria::kBestRiskAdjusted, criteria::kBestSafeGrowth, criteria::kBestVerySafe};
  for (std::size_t i = 0; i < selection.selections.size(); ++i) {
    EXPECT_EQ(selection.selections[i].criterion, expected[i]);
    EXPECT_FALSE(selection.selections[i].description.empty());
  }
}

// -----------------------------------------------------------------------------
// Nothing under 20% drawdown: best_very_safe reports "none eligible" and the
// other criteria are unaffected.
// -----------------------------------------------------------------------------
TEST(OptimalSelectorTest, NoEligibleSizeReportsNone) {
  core::MetricsBySize table;
  table[0.10] = makeMetrics(0.10, 50.0, 15000.0, 16000.0, 1.0, 25.0);
  table[0.20] = makeMetrics(0.20, 30.0, 12000.0, 20000.0, 0.5, 45.0);

  auto selection = OptimalSelector::withDefaultCriteria().select(table);
  EXPECT_FALSE(selection.sizeFor(criteria::kBestVerySafe).has_value());
  EXPECT_EQ(selection.sizeFor(criteria::kBestSafeGrowth), 0.10);
  EXPECT_EQ(selection.sizeFor(criteria::kBestGeometric), 0.10);

  const auto* very_safe = selection.find(criteria::kBestVerySafe);
  ASSERT_NE(very_safe, nullptr);
  EXPECT_FALSE(very_safe->position_size.has_value());
}

TEST(OptimalSelectorTest, DrawdownCapIsStrict) {
  core::MetricsBySize table;
  table[0.05] = makeMetrics(0.05, 10.0, 11000.0, 11000.0, 1.0, 19.0);
  table[0.08] = makeMetrics(0.08, 20.0, 12000.0, 12000.0, 1.0, 20.0);  // Exactly at the cap

  auto selection = OptimalSelector::withDefaultCriteria().select(table);
  EXPECT_EQ(selection.sizeFor(criteria::kBestVerySafe), 0.05);
}

// -----------------------------------------------------------------------------
// Two sizes share the identical maximal growth: the smaller one wins, for
// every criterion.
// -----------------------------------------------------------------------------
TEST(OptimalSelectorTest, TiesResolveToSmallestSize) {
  core::MetricsBySize table;
  table[0.12] = makeMetrics(0.12, 150.0, 20000.0, 30000.0, 1.0, 25.0);
  table[0.08] = makeMetrics(0.08, 150.0, 20000.0, 30000.0, 1.0, 25.0);
  table[0.20] = makeMetrics(0.20, 100.0, 15000.0, 25000.0, 0.5, 40.0);

  auto selection = OptimalSelector::withDefaultCriteria().select(table);
  EXPECT_EQ(selection.sizeFor(criteria::kBestGeometric), 0.08);
  EXPECT_EQ(selection.sizeFor(criteria::kBestMedian), 0.08);
  EXPECT_EQ(selection.sizeFor(criteria::kBestMean), 0.08);
  EXPECT_EQ(selection.sizeFor(criteria::kBestRiskAdjusted), 0.08);
  EXPECT_EQ(selection.sizeFor(criteria::kBestSafeGrowth), 0.08);
}

TEST(OptimalSelectorTest, CustomDrawdownCaps) {
  auto selection = OptimalSelector::withDefaultCriteria(40.0, 15.0).select(syntheticTable());
  EXPECT_EQ(selection.sizeFor(criteria::kBestSafeGrowth), 0.15);
  EXPECT_EQ(selection.sizeFor(criteria::kBestVerySafe), 0.02);
}

TEST(OptimalSelectorTest, CustomCriteriaList) {
  std::vector<std::unique_ptr<analysis::ISelectionCriterion>> list;
  list.push_back(std::make_unique<analysis::MetricCriterion>("max_growth",
                                                             analysis::MetricField::GeometricMeanReturn));
  OptimalSelector selector(std::move(list));
  auto selection = selector.select(syntheticTable());
  ASSERT_EQ(selection.selections.size(), 1u);
  EXPECT_EQ(selection.sizeFor("max_growth"), 0.15);
}

TEST(OptimalSelectorTest, RejectsBadInput) {
  auto selector = OptimalSelector::withDefaultCriteria();
  EXPECT_THROW(selector.select({}), core::SimulationException);

  auto selection = selector.select(syntheticTable());
  EXPECT_THROW(selection.sizeFor("best_everything"), std::out_of_range);
  EXPECT_EQ(selection.find("best_everything"), nullptr);

  std::vector<std::unique_ptr<analysis::ISelectionCriterion>> duplicates;
  duplicates.push_back(std::make_unique<analysis::MetricCriterion>("a", analysis::MetricField::MeanFinal));
  duplicates.push_back(std::make_unique<analysis::MetricCriterion>("a", analysis::MetricField::MedianFinal));
  EXPECT_THROW(OptimalSelector{std::move(duplicates)}, std::invalid_argument);

  EXPECT_THROW(analysis::DrawdownCappedCriterion("capped", nullptr, 20.0), std::invalid_argument);
}
