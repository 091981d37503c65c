#pragma once

#include "glossary.hpp"
#include "quality.hpp"

#include <filesystem>
#include <ostream>
#include <set>
#include <string>
#include <vector>

// Idempotent; call once from main before writing any report to the console.
void ensure_utf8_output();

std::string format_ratio(double ratio);
std::string join_ids(const std::set<std::string>& ids);
std::string json_escape(const std::string& s);

void write_quality_tsv(std::ostream& out, const std::vector<UnitReport>& reports);
void write_quality_summary(std::ostream& out, const QualitySummary& summary);
void write_quality_json(std::ostream& out, const std::vector<UnitReport>& reports, const QualitySummary& summary);

bool write_quality_tsv_file(
    const std::filesystem::path& out_path,
    const std::vector<UnitReport>& reports,
    std::string& error
);

bool write_quality_json_file(
    const std::filesystem::path& out_path,
    const std::vector<UnitReport>& reports,
    const QualitySummary& summary,
    std::string& error
);

struct GlossaryPaths {
    std::filesystem::path pairs;
    std::filesystem::path source_unmatched;
    std::filesystem::path target_unmatched;
};

GlossaryPaths glossary_paths_in(const std::filesystem::path& out_dir);

void write_pairs_tsv(std::ostream& out, const GlossaryResult& glossary);
void write_terms_tsv(std::ostream& out, const TermOccurrences& occurrences, const std::string& header);

bool write_glossary_files(
    const std::filesystem::path& out_dir,
    const GlossaryResult& glossary,
    GlossaryPaths& out_paths,
    std::string& error
);

bool write_target_texts(
    const std::filesystem::path& out_path,
    const std::vector<std::string>& targets,
    const std::string& separator,
    std::string& error
);
