#pragma once

#include "glossary.hpp"
#include "quality.hpp"
#include "unit.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

struct AnalysisStats {
    std::size_t units_total = 0;
    std::size_t workers_used = 0;
    std::chrono::milliseconds wall_time{0};
    double units_per_second = 0.0;
};

struct AnalysisResult {
    std::vector<UnitReport> reports;
    QualitySummary summary;
    GlossaryResult glossary;
    AnalysisStats stats;
};

// Runs the quality classifier and the glossary builder side by side over the
// same unit list. Each worker writes only to its own part of out_result.
bool run_analysis(
    const std::vector<TranslationUnit>& units,
    const QualityThresholds& thresholds,
    AnalysisResult& out_result,
    std::string& error
);
