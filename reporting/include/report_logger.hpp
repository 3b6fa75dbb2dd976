#pragma once

#include "sizing_study.hpp"

namespace reporting {

    // Writes the study summary through the platform logger: parameters,
    // headline optimum, other criteria, and the per-size metrics table.
    class ReportLogger {
    public:
        static void logStudy(const engine::StudyResult& result);

        static void logParameters(const engine::StudyResult& result);
        static void logSelection(const engine::StudyResult& result);
        static void logMetricsTable(const engine::StudyResult& result);
    };

} // namespace reporting
