#pragma once

#include "sizing_study.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace reporting {

    using json = nlohmann::json;

    // Serializes a StudyResult for external chart/report tooling. Position
    // sizes appear as percentages, keyed by their label ("1.5%").
    class ResultExporter {
    public:
        // include_final_capitals adds every trial's final capital (trial
        // order) to each metrics entry, for distribution plots
        static json toJson(const engine::StudyResult& result, bool include_curves = true,
                           bool include_final_capitals = false);

        // Throws core::ReportException if the file can't be written
        static void writeToFile(const engine::StudyResult& result, const std::string& path,
                                bool include_curves = true, bool include_final_capitals = false);

        static json metricsToJson(const core::SizeMetrics& metrics);
    };

} // namespace reporting
