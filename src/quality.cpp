#include "quality.hpp"

#include "text_normalize.hpp"

#include <algorithm>
#include <cmath>

UnitReport classify_unit(const TranslationUnit& unit, const QualityThresholds& thresholds) {
    const std::string source_clean = strip_markup(unit.source_text);
    const std::string target_clean = strip_markup(unit.target_text);

    const std::string source_norm = normalize_text(source_clean);
    const std::string target_norm = normalize_text(target_clean);

    UnitReport report;
    report.id = unit.id;
    report.untranslated = !source_norm.empty() && source_norm == target_norm;
    report.ascii_heavy = ascii_ratio(target_clean) >= thresholds.ascii_threshold && has_ascii_letter(target_clean);

    report.source_chars = std::max<std::size_t>(char_len(source_clean), 1);
    report.target_chars = char_len(target_clean);
    report.ratio = static_cast<double>(report.target_chars) / static_cast<double>(report.source_chars);
    report.ratio_flag = report.ratio < thresholds.min_ratio || report.ratio > thresholds.max_ratio;

    report.source_preview = make_preview(source_clean);
    report.target_preview = make_preview(target_clean);
    return report;
}

void analyze_units(
    const std::vector<TranslationUnit>& units,
    const QualityThresholds& thresholds,
    std::vector<UnitReport>& out_reports,
    QualitySummary& out_summary
) {
    out_reports.clear();
    out_reports.reserve(units.size());
    out_summary = QualitySummary{};

    if (units.empty()) {
        return;
    }

    double ratio_sum = 0.0;
    double ratio_min = 0.0;
    double ratio_max = 0.0;

    for (const auto& unit : units) {
        UnitReport report = classify_unit(unit, thresholds);

        if (report.untranslated) {
            ++out_summary.untranslated;
        }
        if (report.ascii_heavy) {
            ++out_summary.ascii_heavy;
        }
        if (report.ratio_flag) {
            ++out_summary.ratio_flags;
        }

        if (out_reports.empty()) {
            ratio_min = report.ratio;
            ratio_max = report.ratio;
        } else {
            ratio_min = std::min(ratio_min, report.ratio);
            ratio_max = std::max(ratio_max, report.ratio);
        }
        ratio_sum += report.ratio;

        out_reports.push_back(std::move(report));
    }

    out_summary.units = out_reports.size();
    out_summary.avg_ratio = ratio_sum / static_cast<double>(out_reports.size());
    out_summary.min_ratio = ratio_min;
    out_summary.max_ratio = ratio_max;
}

double round3(double value) {
    return std::round(value * 1000.0) / 1000.0;
}
