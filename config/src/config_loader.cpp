#include "config_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <fstream>    // For std::ifstream
#include <set>
#include <stdexcept>

namespace config {

    namespace { // File-local helpers

        const std::set<std::string> kKnownKeys = {
            "win_probability", "num_trades", "num_trials", "initial_capital", "risk_reward_ratio",
            "position_sizes_pct", "position_size_range_pct", "seed", "workers",
            "keep_equity_curves", "log_return_floor", "ruin_threshold_ratio", "selection"
        };

    } // end anonymous namespace

    double ConfigLoader::readNumber(const json& document, const std::string& key) {
        const auto& value = document.at(key);
        if (!value.is_number()) {
            throw core::ConfigException(key, fmt::format("expected a number, got {}", value.dump()));
        }
        return value.get<double>();
    }

    std::size_t ConfigLoader::readCount(const json& document, const std::string& key) {
        const auto& value = document.at(key);
        if (!value.is_number_integer()) {
            throw core::ConfigException(key, fmt::format("expected an integer, got {}", value.dump()));
        }
        if (value.is_number_unsigned()) {
            return static_cast<std::size_t>(value.get<std::uint64_t>());
        }
        long long signed_value = value.get<long long>();
        if (signed_value < 0) {
            throw core::ConfigException(key, fmt::format("must not be negative, got {}", signed_value));
        }
        return static_cast<std::size_t>(signed_value);
    }

    std::vector<double> ConfigLoader::readPositionSizes(const json& document) {
        const bool has_list = document.contains("position_sizes_pct");
        const bool has_range = document.contains("position_size_range_pct");
        if (has_list && has_range) {
            throw core::ConfigException("position_sizes_pct",
                "give either 'position_sizes_pct' or 'position_size_range_pct', not both");
        }

        std::vector<double> percents;
        if (has_list) {
            const auto& list = document["position_sizes_pct"];
            if (!list.is_array() || list.empty()) {
                throw core::ConfigException("position_sizes_pct", "expected a non-empty array of percentages");
            }
            for (const auto& entry : list) {
                if (!entry.is_number()) {
                    throw core::ConfigException("position_sizes_pct", fmt::format("non-numeric entry {}", entry.dump()));
                }
                percents.push_back(entry.get<double>());
            }
        } else {
            const auto& range = document["position_size_range_pct"];
            if (!range.is_object()) {
                throw core::ConfigException("position_size_range_pct", "expected an object with 'start', 'stop', 'step'");
            }
            for (const char* field : {"start", "stop", "step"}) {
                if (!range.contains(field) || !range[field].is_number()) {
                    throw core::ConfigException(fmt::format("position_size_range_pct.{}", field), "expected a number");
                }
            }
            try {
                percents = core::utils::percentRange(range["start"].get<double>(),
                                                     range["stop"].get<double>(),
                                                     range["step"].get<double>());
            } catch (const std::invalid_argument& e) {
                throw core::ConfigException("position_size_range_pct", e.what());
            }
        }

        std::vector<double> fractions;
        fractions.reserve(percents.size());
        for (double pct : percents) {
            fractions.push_back(core::utils::percentToFraction(pct));
        }
        return fractions;
    }

    SimulationConfig ConfigLoader::fromJson(const json& document) {
        if (!document.is_object()) {
            throw core::ConfigException("<root>", "configuration must be a JSON object");
        }
        auto logger = core::logging::getLogger();
        for (const auto& item : document.items()) {
            if (kKnownKeys.count(item.key()) == 0) {
                logger->warn("Ignoring unknown configuration key '{}'", item.key());
            }
        }

        SimulationConfig config;
        try {
            if (document.contains("win_probability")) config.win_probability = readNumber(document, "win_probability");
            if (document.contains("num_trades")) config.num_trades = readCount(document, "num_trades");
            if (document.contains("num_trials")) config.num_trials = readCount(document, "num_trials");
            if (document.contains("initial_capital")) config.initial_capital = readNumber(document, "initial_capital");
            if (document.contains("risk_reward_ratio")) config.risk_reward_ratio = readNumber(document, "risk_reward_ratio");
            if (document.contains("position_sizes_pct") || document.contains("position_size_range_pct")) {
                config.position_sizes = readPositionSizes(document);
            }
            if (document.contains("seed")) {
                const auto& seed = document["seed"];
                if (seed.is_null()) {
                    config.seed.reset();
                } else {
                    config.seed = static_cast<std::uint64_t>(readCount(document, "seed"));
                }
            }
            if (document.contains("workers")) config.workers = readCount(document, "workers");
            if (document.contains("keep_equity_curves")) {
                if (!document["keep_equity_curves"].is_boolean()) {
                    throw core::ConfigException("keep_equity_curves", "expected true or false");
                }
                config.keep_equity_curves = document["keep_equity_curves"].get<bool>();
            }
            if (document.contains("log_return_floor")) config.log_return_floor = readNumber(document, "log_return_floor");
            if (document.contains("ruin_threshold_ratio")) config.ruin_threshold_ratio = readNumber(document, "ruin_threshold_ratio");
            if (document.contains("selection")) {
                const auto& selection = document["selection"];
                if (!selection.is_object()) {
                    throw core::ConfigException("selection", "expected an object");
                }
                if (selection.contains("safe_drawdown_pct")) {
                    if (!selection["safe_drawdown_pct"].is_number()) {
                        throw core::ConfigException("selection.safe_drawdown_pct", "expected a number");
                    }
                    config.selection.safe_drawdown_pct = selection["safe_drawdown_pct"].get<double>();
                }
                if (selection.contains("very_safe_drawdown_pct")) {
                    if (!selection["very_safe_drawdown_pct"].is_number()) {
                        throw core::ConfigException("selection.very_safe_drawdown_pct", "expected a number");
                    }
                    config.selection.very_safe_drawdown_pct = selection["very_safe_drawdown_pct"].get<double>();
                }
            }
        } catch (const json::exception& e) {
            // Type checks above should catch everything; keep the parameter context anyway
            logger->error("JSON error while reading configuration: {}", e.what());
            throw core::ConfigException("<document>", e.what());
        }

        try {
            config.validate();
        } catch (const core::ConfigException& e) {
            // Report size errors under the key the document actually used
            if (e.parameter() == kPositionSizesKey && document.contains("position_size_range_pct")) {
                throw core::ConfigException("position_size_range_pct", e.detail());
            }
            throw;
        }
        logger->debug("Configuration parsed: p={}, N={}, M={}, C0={}, R={}, {} sizes",
                      config.win_probability, config.num_trades, config.num_trials,
                      config.initial_capital, config.risk_reward_ratio, config.position_sizes.size());
        return config;
    }

    SimulationConfig ConfigLoader::fromFile(const std::string& path) {
        auto logger = core::logging::getLogger();
        logger->info("Loading simulation config from: {}", path);

        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigException("config_file", fmt::format("failed to open '{}'", path));
        }
        json document;
        try {
            document = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw core::ConfigException("config_file", fmt::format("failed to parse '{}': {}", path, e.what()));
        }
        return fromJson(document);
    }

    json ConfigLoader::toJson(const SimulationConfig& config) {
        json document;
        document["win_probability"] = config.win_probability;
        document["num_trades"] = config.num_trades;
        document["num_trials"] = config.num_trials;
        document["initial_capital"] = config.initial_capital;
        document["risk_reward_ratio"] = config.risk_reward_ratio;

        json sizes = json::array();
        for (double size : config.position_sizes) {
            sizes.push_back(core::utils::fractionToPercent(size));
        }
        document["position_sizes_pct"] = sizes;

        document["seed"] = config.seed ? json(*config.seed) : json(nullptr);
        document["workers"] = config.workers;
        document["keep_equity_curves"] = config.keep_equity_curves;
        document["log_return_floor"] = config.log_return_floor;
        document["ruin_threshold_ratio"] = config.ruin_threshold_ratio;
        document["selection"] = {
            {"safe_drawdown_pct", config.selection.safe_drawdown_pct},
            {"very_safe_drawdown_pct", config.selection.very_safe_drawdown_pct}
        };
        return document;
    }

} // namespace config
