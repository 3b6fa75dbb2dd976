#include "result_exporter.hpp"
#include "config_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <fstream>

namespace reporting {

    json ResultExporter::metricsToJson(const core::SizeMetrics& m) {
        return json{
            {"position_size_pct", core::utils::fractionToPercent(m.position_size)},
            {"trial_count", m.trial_count},
            {"mean_final", m.mean_final},
            {"median_final", m.median_final},
            {"std_final", m.std_final},
            {"min_final", m.min_final},
            {"max_final", m.max_final},
            {"geometric_mean_return_pct", m.geometric_mean_return_pct},
            {"mean_return_pct", m.mean_return_pct},
            {"median_return_pct", m.median_return_pct},
            {"avg_max_drawdown_pct", m.avg_max_drawdown_pct},
            {"worst_drawdown_pct", m.worst_drawdown_pct},
            {"profitable_pct", m.profitable_pct},
            {"bankrupt_pct", m.bankrupt_pct},
            {"risk_adjusted_score", m.risk_adjusted_score}
        };
    }

    json ResultExporter::toJson(const engine::StudyResult& result, bool include_curves, bool include_final_capitals) {
        json document;
        document["generated_at"] = core::utils::timestampToString(result.started_at);
        document["elapsed_seconds"] = result.elapsed_seconds;
        document["seed"] = result.seed;
        document["config"] = config::ConfigLoader::toJson(result.config);

        json metrics = json::array();
        for (const auto& [size, size_metrics] : result.metrics) {
            json entry = metricsToJson(size_metrics);
            if (include_final_capitals) {
                json finals = json::array();
                auto trials_it = result.trial_results.find(size);
                if (trials_it != result.trial_results.end()) {
                    for (const auto& trial : trials_it->second) {
                        finals.push_back(trial.final_capital);
                    }
                }
                entry["final_capitals"] = finals;
            }
            metrics.push_back(entry);
        }
        document["metrics"] = metrics;

        json selection = json::object();
        for (const auto& s : result.selection.selections) {
            selection[s.criterion] = {
                {"description", s.description},
                {"position_size_pct", s.position_size ? json(core::utils::fractionToPercent(*s.position_size))
                                                      : json(nullptr)}
            };
        }
        document["selection"] = selection;

        if (include_curves) {
            json curves = json::object();
            for (const auto& [size, curve] : result.representative_curves) {
                auto trial_it = result.representative_trials.find(size);
                curves[core::utils::formatSizeLabel(size)] = {
                    {"trial_index", trial_it != result.representative_trials.end() ? json(trial_it->second) : json(nullptr)},
                    {"equity", curve}
                };
            }
            document["representative_equity_curves"] = curves;
        }
        return document;
    }

    void ResultExporter::writeToFile(const engine::StudyResult& result, const std::string& path,
                                     bool include_curves, bool include_final_capitals) {
        auto logger = core::logging::getLogger();
        std::ofstream ofs(path);
        if (!ofs.is_open()) {
            throw core::ReportException(fmt::format("Failed to open result file for writing: {}", path));
        }
        ofs << toJson(result, include_curves, include_final_capitals).dump(2) << '\n';
        if (!ofs) {
            throw core::ReportException(fmt::format("Failed while writing result file: {}", path));
        }
        logger->info("Study result written to '{}'", path);
    }

} // namespace reporting
