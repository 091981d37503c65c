#pragma once

#include "unit.hpp"

#include <cstddef>
#include <string>
#include <vector>

struct QualityThresholds {
    double min_ratio = 0.3;
    double max_ratio = 2.5;
    double ascii_threshold = 0.7;
};

struct UnitReport {
    std::string id;
    std::size_t source_chars = 0;  // floored to 1
    std::size_t target_chars = 0;
    double ratio = 0.0;
    bool untranslated = false;
    bool ascii_heavy = false;
    bool ratio_flag = false;
    std::string source_preview;
    std::string target_preview;
};

struct QualitySummary {
    std::size_t units = 0;
    std::size_t untranslated = 0;
    std::size_t ascii_heavy = 0;
    std::size_t ratio_flags = 0;
    double avg_ratio = 0.0;
    double min_ratio = 0.0;
    double max_ratio = 0.0;
};

UnitReport classify_unit(const TranslationUnit& unit, const QualityThresholds& thresholds);

void analyze_units(
    const std::vector<TranslationUnit>& units,
    const QualityThresholds& thresholds,
    std::vector<UnitReport>& out_reports,
    QualitySummary& out_summary
);

double round3(double value);
