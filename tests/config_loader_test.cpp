// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for config::SimulationConfig and config::ConfigLoader.
//
// Validates:
//   - Defaults are valid: p=0.57, N=M=500, C0=10000, R=1, 1%..40% by 0.5%
//   - List and range forms of the position sizes
//   - Each invalid parameter raises ConfigException naming that parameter
//   - Wrong JSON types are reported, not silently coerced
//   - toJson() output reads back to the same configuration
//   - File loading errors surface as "config_file"
// =============================================================================

#include "config_loader.hpp"
#include "simulation_config.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using config::ConfigLoader;
using config::SimulationConfig;
using json = nlohmann::json;

namespace {

// Runs fn and returns the parameter named by the ConfigException it throws,
// or "<none>" if it doesn't throw.
template <typename Fn>
std::string offendingParameter(Fn&& fn) {
  try {
    fn();
  } catch (const core::ConfigException& e) {
    return e.parameter();
  }
  return "<none>";
}

std::string parameterFor(const json& document) {
  return offendingParameter([&] { ConfigLoader::fromJson(document); });
}

}  // namespace

TEST(SimulationConfigTest, DefaultsMatchTheReferenceScan) {
  SimulationConfig config;
  EXPECT_NO_THROW(config.validate());

  EXPECT_DOUBLE_EQ(config.win_probability, 0.57);
  EXPECT_EQ(config.num_trades, 500u);
  EXPECT_EQ(config.num_trials, 500u);
  EXPECT_DOUBLE_EQ(config.initial_capital, 10000.0);
  EXPECT_DOUBLE_EQ(config.risk_reward_ratio, 1.0);
  ASSERT_TRUE(config.seed.has_value());
  EXPECT_EQ(*config.seed, 42u);

  ASSERT_EQ(config.position_sizes.size(), 79u);
  EXPECT_DOUBLE_EQ(config.position_sizes.front(), 0.01);
  EXPECT_DOUBLE_EQ(config.position_sizes[1], 0.015);
  EXPECT_DOUBLE_EQ(config.position_sizes.back(), 0.40);
}

TEST(SimulationConfigTest, ValidateNamesTheOffendingParameter) {
  auto check = [](auto mutate) {
    SimulationConfig config;
    mutate(config);
    return offendingParameter([&] { config.validate(); });
  };

  EXPECT_EQ(check([](SimulationConfig& c) { c.win_probability = 0.0; }), "win_probability");
  EXPECT_EQ(check([](SimulationConfig& c) { c.win_probability = 1.0; }), "win_probability");
  EXPECT_EQ(check([](SimulationConfig& c) { c.num_trades = 0; }), "num_trades");
  EXPECT_EQ(check([](SimulationConfig& c) { c.num_trials = 0; }), "num_trials");
  EXPECT_EQ(check([](SimulationConfig& c) { c.initial_capital = -5.0; }), "initial_capital");
  EXPECT_EQ(check([](SimulationConfig& c) { c.risk_reward_ratio = 0.0; }), "risk_reward_ratio");
  EXPECT_EQ(check([](SimulationConfig& c) { c.position_sizes.clear(); }), "position_sizes_pct");
  EXPECT_EQ(check([](SimulationConfig& c) { c.position_sizes = {0.1, 1.2}; }), "position_sizes_pct");
  EXPECT_EQ(check([](SimulationConfig& c) { c.position_sizes = {0.1, 0.1}; }), "position_sizes_pct");
  EXPECT_EQ(check([](SimulationConfig& c) { c.log_return_floor = 0.0; }), "log_return_floor");
  EXPECT_EQ(check([](SimulationConfig& c) { c.ruin_threshold_ratio = 1.0; }), "ruin_threshold_ratio");
  EXPECT_EQ(check([](SimulationConfig& c) { c.selection.very_safe_drawdown_pct = 0.0; }),
            "selection.very_safe_drawdown_pct");
}

TEST(ConfigLoaderTest, ParsesFullDocument) {
  json document = {
      {"win_probability", 0.6},
      {"num_trades", 250},
      {"num_trials", 1000},
      {"initial_capital", 5000.0},
      {"risk_reward_ratio", 1.5},
      {"position_sizes_pct", {1, 2.5, 10}},
      {"seed", 7},
      {"workers", 4},
      {"keep_equity_curves", true},
      {"ruin_threshold_ratio", 0.0},
      {"selection", {{"safe_drawdown_pct", 25.0}, {"very_safe_drawdown_pct", 10.0}}}};

  auto config = ConfigLoader::fromJson(document);
  EXPECT_DOUBLE_EQ(config.win_probability, 0.6);
  EXPECT_EQ(config.num_trades, 250u);
  EXPECT_EQ(config.num_trials, 1000u);
  EXPECT_DOUBLE_EQ(config.initial_capital, 5000.0);
  EXPECT_DOUBLE_EQ(config.risk_reward_ratio, 1.5);
  ASSERT_EQ(config.position_sizes.size(), 3u);
  EXPECT_DOUBLE_EQ(config.position_sizes[0], 0.01);
  EXPECT_DOUBLE_EQ(config.position_sizes[1], 0.025);
  EXPECT_DOUBLE_EQ(config.position_sizes[2], 0.10);
  EXPECT_EQ(config.seed, 7u);
  EXPECT_EQ(config.workers, 4u);
  EXPECT_TRUE(config.keep_equity_curves);
  EXPECT_DOUBLE_EQ(config.ruin_threshold_ratio, 0.0);
  EXPECT_DOUBLE_EQ(config.selection.safe_drawdown_pct, 25.0);
  EXPECT_DOUBLE_EQ(config.selection.very_safe_drawdown_pct, 10.0);
}

TEST(ConfigLoaderTest, MissingKeysKeepDefaults) {
  auto config = ConfigLoader::fromJson(json{{"num_trials", 50}, {"unused_key", "ignored"}});
  EXPECT_EQ(config.num_trials, 50u);
  EXPECT_DOUBLE_EQ(config.win_probability, 0.57);
  EXPECT_EQ(config.position_sizes.size(), 79u);
}

TEST(ConfigLoaderTest, ParsesRangeForm) {
  auto config = ConfigLoader::fromJson(
      json{{"position_size_range_pct", {{"start", 5}, {"stop", 20}, {"step", 5}}}});
  ASSERT_EQ(config.position_sizes.size(), 4u);
  EXPECT_DOUBLE_EQ(config.position_sizes[0], 0.05);
  EXPECT_DOUBLE_EQ(config.position_sizes[3], 0.20);

  EXPECT_EQ(parameterFor(json{{"position_size_range_pct", {{"start", 5}, {"stop", 20}}}}),
            "position_size_range_pct.step");
  EXPECT_EQ(parameterFor(json{{"position_size_range_pct", {{"start", 5}, {"stop", 20}, {"step", 0}}}}),
            "position_size_range_pct");
}

TEST(ConfigLoaderTest, RejectsInvalidValues) {
  EXPECT_EQ(parameterFor(json{{"win_probability", 1.2}}), "win_probability");
  EXPECT_EQ(parameterFor(json{{"num_trades", -10}}), "num_trades");
  EXPECT_EQ(parameterFor(json{{"num_trials", 0}}), "num_trials");
  EXPECT_EQ(parameterFor(json{{"initial_capital", 0}}), "initial_capital");
  EXPECT_EQ(parameterFor(json{{"position_sizes_pct", {5, 150}}}), "position_sizes_pct");
  EXPECT_EQ(parameterFor(json{{"position_sizes_pct", json::array()}}), "position_sizes_pct");
  EXPECT_EQ(parameterFor(json{{"seed", -1}}), "seed");
}

// -----------------------------------------------------------------------------
// A range whose step is tiny relative to its span would expand to billions of
// candidates (or overflow the count). It must be rejected as a configuration
// error on the range key, never truncated or left to fail allocation.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, RejectsRangeWithTooManyValues) {
  for (double step : {1e-9, 1e-300}) {
    json document = {{"position_size_range_pct", {{"start", 1}, {"stop", 40}, {"step", step}}}};
    EXPECT_EQ(parameterFor(document), "position_size_range_pct") << "step " << step;
  }
  EXPECT_THROW(core::utils::percentRange(1.0, 40.0, 1e-300), std::invalid_argument);
  EXPECT_EQ(core::utils::percentRange(1.0, 10000.0, 1.0).size(), core::utils::kMaxRangeValues);
  EXPECT_THROW(core::utils::percentRange(1.0, 10001.0, 1.0), std::invalid_argument);
}

TEST(ConfigLoaderTest, RangeErrorsNameTheRangeKey) {
  // 50%..150% parses as a range but 150% fails validation
  json document = {{"position_size_range_pct", {{"start", 50}, {"stop", 150}, {"step", 50}}}};
  EXPECT_EQ(parameterFor(document), "position_size_range_pct");
}

TEST(ConfigLoaderTest, RejectsBothSizeForms) {
  json document = {{"position_sizes_pct", {1, 2}},
                   {"position_size_range_pct", {{"start", 1}, {"stop", 2}, {"step", 1}}}};
  EXPECT_EQ(parameterFor(document), "position_sizes_pct");
}

TEST(ConfigLoaderTest, RejectsWrongTypes) {
  EXPECT_EQ(parameterFor(json{{"win_probability", "high"}}), "win_probability");
  EXPECT_EQ(parameterFor(json{{"num_trades", 12.5}}), "num_trades");
  EXPECT_EQ(parameterFor(json{{"keep_equity_curves", 1}}), "keep_equity_curves");
  EXPECT_EQ(parameterFor(json{{"position_sizes_pct", {5, "ten"}}}), "position_sizes_pct");
  EXPECT_EQ(parameterFor(json{{"selection", 30}}), "selection");
  EXPECT_EQ(parameterFor(json::array({1, 2})), "<root>");
}

TEST(ConfigLoaderTest, NullSeedMeansUnseeded) {
  auto config = ConfigLoader::fromJson(json{{"seed", nullptr}});
  EXPECT_FALSE(config.seed.has_value());
}

TEST(ConfigLoaderTest, ToJsonReadsBack) {
  SimulationConfig original;
  original.win_probability = 0.55;
  original.num_trials = 123;
  original.risk_reward_ratio = 2.0;
  original.seed.reset();
  original.workers = 3;
  original.selection.safe_drawdown_pct = 35.0;

  auto document = ConfigLoader::toJson(original);
  EXPECT_TRUE(document["seed"].is_null());
  EXPECT_DOUBLE_EQ(document["position_sizes_pct"][1].get<double>(), 1.5);

  auto restored = ConfigLoader::fromJson(document);
  EXPECT_DOUBLE_EQ(restored.win_probability, original.win_probability);
  EXPECT_EQ(restored.num_trials, original.num_trials);
  EXPECT_DOUBLE_EQ(restored.risk_reward_ratio, original.risk_reward_ratio);
  EXPECT_FALSE(restored.seed.has_value());
  EXPECT_EQ(restored.workers, original.workers);
  EXPECT_EQ(restored.position_sizes, original.position_sizes);
  EXPECT_DOUBLE_EQ(restored.selection.safe_drawdown_pct, 35.0);
}

TEST(ConfigLoaderTest, LoadsFromFile) {
  auto path = std::filesystem::temp_directory_path() / "position_sizing_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"num_trials": 20, "num_trades": 30, "position_sizes_pct": [2, 4]})";
  }
  auto config = ConfigLoader::fromFile(path.string());
  EXPECT_EQ(config.num_trials, 20u);
  EXPECT_EQ(config.num_trades, 30u);
  EXPECT_EQ(config.position_sizes.size(), 2u);
  std::filesystem::remove(path);
}

TEST(ConfigLoaderTest, FileErrorsNameConfigFile) {
  EXPECT_EQ(offendingParameter([] { ConfigLoader::fromFile("/nonexistent/dir/config.json"); }),
            "config_file");

  auto path = std::filesystem::temp_directory_path() / "position_sizing_config_broken.json";
  {
    std::ofstream out(path);
    out << "{ \"num_trials\": ";
  }
  EXPECT_EQ(offendingParameter([&] { ConfigLoader::fromFile(path.string()); }), "config_file");
  std::filesystem::remove(path);
}
