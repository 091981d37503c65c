#include "config.hpp"
#include "glossary.hpp"
#include "input_files.hpp"
#include "pipeline.hpp"
#include "quality.hpp"
#include "report_writer.hpp"
#include "xliff_reader.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

int run_check(const AppConfig& config) {
    XliffDocument doc;
    std::string error;
    if (!read_xliff_file(config.input_path, doc, error)) {
        std::cerr << "[fatal] " << error << "\n";
        return kExitFailure;
    }

    std::vector<UnitReport> reports;
    QualitySummary summary;
    analyze_units(extract_units(doc), config.thresholds, reports, summary);

    if (config.emit_tsv) {
        write_quality_tsv(std::cout, reports);
    }

    if (!config.json_path.empty()) {
        if (!write_quality_json_file(config.json_path, reports, summary, error)) {
            std::cerr << "[error] " << error << "\n";
            return kExitFailure;
        }
    }

    if (!config.quiet) {
        write_quality_summary(std::cerr, summary);
    }
    return kExitOk;
}

int run_glossary(const AppConfig& config) {
    XliffDocument doc;
    std::string error;
    if (!read_xliff_file(config.input_path, doc, error)) {
        std::cerr << "[fatal] " << error << "\n";
        return kExitFailure;
    }

    GlossaryResult glossary;
    build_glossary(extract_units(doc), glossary);

    GlossaryPaths paths;
    if (!write_glossary_files(config.output_dir, glossary, paths, error)) {
        std::cerr << "[error] " << error << "\n";
        return kExitFailure;
    }

    if (!config.quiet) {
        std::cout << "Wrote: " << paths.pairs.string() << "\n";
        std::cout << "Wrote: " << paths.source_unmatched.string() << "\n";
        std::cout << "Wrote: " << paths.target_unmatched.string() << "\n";
    }
    return kExitOk;
}

int run_targets(const AppConfig& config) {
    XliffDocument doc;
    std::string error;
    if (!read_xliff_file(config.input_path, doc, error)) {
        std::cerr << "[fatal] " << error << "\n";
        return kExitFailure;
    }

    const auto targets = collect_target_texts(doc, config.skip_empty_targets);
    if (!write_target_texts(config.targets_output, targets, config.separator, error)) {
        std::cerr << "[error] " << error << "\n";
        return kExitFailure;
    }

    if (!config.quiet) {
        std::cout << "Wrote: " << config.targets_output.string() << " targets=" << targets.size() << "\n";
    }
    return kExitOk;
}

bool process_file(
    const AppConfig& config,
    const std::filesystem::path& xliff_file,
    const std::filesystem::path& report_dir,
    AnalysisResult& result,
    std::string& error
) {
    XliffDocument doc;
    if (!read_xliff_file(xliff_file, doc, error)) {
        return false;
    }

    const auto units = extract_units(doc);
    if (!run_analysis(units, config.thresholds, result, error)) {
        return false;
    }

    const auto name = xliff_file.filename().string();
    if (!write_quality_tsv_file(report_dir / (name + ".quality.tsv"), result.reports, error)) {
        return false;
    }
    if (!write_quality_json_file(report_dir / (name + ".quality.json"), result.reports, result.summary, error)) {
        return false;
    }

    GlossaryPaths paths;
    if (!write_glossary_files(report_dir, result.glossary, paths, error)) {
        return false;
    }

    if (!config.quiet) {
        std::cout
            << "[ok] " << xliff_file.filename().string()
            << " shape=" << shape_name(doc.shape)
            << " units=" << result.stats.units_total
            << " untranslated=" << result.summary.untranslated
            << " ascii_heavy=" << result.summary.ascii_heavy
            << " ratio_flags=" << result.summary.ratio_flags
            << " pairs=" << result.glossary.pairs.size()
            << " time_ms=" << result.stats.wall_time.count()
            << " units_per_sec=" << result.stats.units_per_second
            << "\n";
    }
    return true;
}

int run_all(const AppConfig& config) {
    std::vector<std::filesystem::path> input_files;
    std::string error;
    if (!collect_input_files(config.input_path, config.output_dir, input_files, error)) {
        std::cerr << "[fatal] " << error << "\n";
        return kExitFailure;
    }

    const bool input_is_dir = std::filesystem::is_directory(config.input_path);

    std::size_t total_units = 0;
    std::chrono::milliseconds total_time{0};
    std::size_t files_ok = 0;
    std::size_t files_failed = 0;

    for (const auto& xliff_file : input_files) {
        const auto report_dir = report_dir_for(config.input_path, input_is_dir, xliff_file, config.output_dir);

        AnalysisResult result;
        error.clear();
        if (!process_file(config, xliff_file, report_dir, result, error)) {
            std::cerr << "[error] " << xliff_file.string() << ": " << error << "\n";
            ++files_failed;
            continue;
        }

        total_units += result.stats.units_total;
        total_time += result.stats.wall_time;
        ++files_ok;
    }

    if (!config.quiet) {
        std::cout
            << "[summary] files=" << input_files.size()
            << " ok=" << files_ok
            << " failed=" << files_failed
            << " total_units=" << total_units
            << " total_time_ms=" << total_time.count()
            << "\n";
    }

    return files_failed == 0 ? kExitOk : kExitFailure;
}

}  // namespace

int main(int argc, char** argv) {
    AppConfig config;
    std::string error;

    if (!parse_args(argc, argv, config, error)) {
        if (error != "help") {
            std::cerr << "Argument error: " << error << "\n\n";
        }
        print_usage(argv[0]);
        return error == "help" ? kExitOk : kExitUsage;
    }

    ensure_utf8_output();

    try {
        switch (config.command) {
        case Command::Check:
            return run_check(config);
        case Command::Glossary:
            return run_glossary(config);
        case Command::Targets:
            return run_targets(config);
        case Command::All:
            return run_all(config);
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "[fatal] " << ex.what() << "\n";
        return kExitFailure;
    }

    return kExitOk;
}
