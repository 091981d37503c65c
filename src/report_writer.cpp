#include "report_writer.hpp"

#include <cstdio>
#include <fstream>
#include <mutex>

#if defined(_WIN32)
#include <windows.h>
#endif

namespace {

std::once_flag g_utf8_output_once;

bool open_output(const std::filesystem::path& out_path, std::ofstream& out, std::string& error) {
    const auto parent = out_path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error = "Failed to create output directory: " + parent.string();
            return false;
        }
    }

    out.open(out_path, std::ios::binary);
    if (!out) {
        error = "Failed to open output: " + out_path.string();
        return false;
    }
    return true;
}

bool finish_output(const std::filesystem::path& out_path, std::ofstream& out, std::string& error) {
    out.flush();
    if (!out) {
        error = "Failed to write output: " + out_path.string();
        return false;
    }
    return true;
}

const char* flag_cell(bool value) {
    return value ? "1" : "0";
}

const char* json_bool(bool value) {
    return value ? "true" : "false";
}

}  // namespace

void ensure_utf8_output() {
    std::call_once(g_utf8_output_once, []() {
#if defined(_WIN32)
        SetConsoleOutputCP(CP_UTF8);
#endif
    });
}

std::string format_ratio(double ratio) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", round3(ratio));
    return buf;
}

std::string join_ids(const std::set<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) {
            out.push_back(',');
        }
        out += id;
    }
    return out;
}

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (unsigned char ch : s) {
        switch (ch) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (ch < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", ch);
                out += buf;
            } else {
                out.push_back(static_cast<char>(ch));
            }
        }
    }
    return out;
}

void write_quality_tsv(std::ostream& out, const std::vector<UnitReport>& reports) {
    out << "id\tsrc_chars\ttgt_chars\tratio\tuntranslated\tascii_heavy\tratio_flag\tsource_preview\ttarget_preview\n";
    for (const auto& r : reports) {
        out << r.id << '\t'
            << r.source_chars << '\t'
            << r.target_chars << '\t'
            << format_ratio(r.ratio) << '\t'
            << flag_cell(r.untranslated) << '\t'
            << flag_cell(r.ascii_heavy) << '\t'
            << flag_cell(r.ratio_flag) << '\t'
            << r.source_preview << '\t'
            << r.target_preview << '\n';
    }
}

void write_quality_summary(std::ostream& out, const QualitySummary& summary) {
    out << "\n# Summary\n"
        << "units: " << summary.units << '\n'
        << "untranslated: " << summary.untranslated << '\n'
        << "ascii_heavy: " << summary.ascii_heavy << '\n'
        << "ratio_flags: " << summary.ratio_flags << '\n'
        << "avg_ratio: " << format_ratio(summary.avg_ratio) << '\n'
        << "min_ratio: " << format_ratio(summary.min_ratio) << '\n'
        << "max_ratio: " << format_ratio(summary.max_ratio) << '\n';
}

void write_quality_json(std::ostream& out, const std::vector<UnitReport>& reports, const QualitySummary& summary) {
    out << "{\n"
        << "  \"summary\": {\n"
        << "    \"units\": " << summary.units << ",\n"
        << "    \"untranslated\": " << summary.untranslated << ",\n"
        << "    \"ascii_heavy\": " << summary.ascii_heavy << ",\n"
        << "    \"ratio_flags\": " << summary.ratio_flags << ",\n"
        << "    \"avg_ratio\": " << format_ratio(summary.avg_ratio) << ",\n"
        << "    \"min_ratio\": " << format_ratio(summary.min_ratio) << ",\n"
        << "    \"max_ratio\": " << format_ratio(summary.max_ratio) << "\n"
        << "  },\n";

    if (reports.empty()) {
        out << "  \"units\": []\n}\n";
        return;
    }

    out << "  \"units\": [\n";
    for (std::size_t i = 0; i < reports.size(); ++i) {
        const auto& r = reports[i];
        out << "    {\n"
            << "      \"id\": \"" << json_escape(r.id) << "\",\n"
            << "      \"source_chars\": " << r.source_chars << ",\n"
            << "      \"target_chars\": " << r.target_chars << ",\n"
            << "      \"ratio\": " << format_ratio(r.ratio) << ",\n"
            << "      \"untranslated\": " << json_bool(r.untranslated) << ",\n"
            << "      \"ascii_heavy\": " << json_bool(r.ascii_heavy) << ",\n"
            << "      \"ratio_flag\": " << json_bool(r.ratio_flag) << ",\n"
            << "      \"source_preview\": \"" << json_escape(r.source_preview) << "\",\n"
            << "      \"target_preview\": \"" << json_escape(r.target_preview) << "\"\n"
            << "    }" << (i + 1 < reports.size() ? "," : "") << '\n';
    }
    out << "  ]\n}\n";
}

bool write_quality_tsv_file(
    const std::filesystem::path& out_path,
    const std::vector<UnitReport>& reports,
    std::string& error
) {
    std::ofstream out;
    if (!open_output(out_path, out, error)) {
        return false;
    }
    write_quality_tsv(out, reports);
    return finish_output(out_path, out, error);
}

bool write_quality_json_file(
    const std::filesystem::path& out_path,
    const std::vector<UnitReport>& reports,
    const QualitySummary& summary,
    std::string& error
) {
    std::ofstream out;
    if (!open_output(out_path, out, error)) {
        return false;
    }
    write_quality_json(out, reports, summary);
    return finish_output(out_path, out, error);
}

GlossaryPaths glossary_paths_in(const std::filesystem::path& out_dir) {
    GlossaryPaths paths;
    paths.pairs = out_dir / "glossary_pairs.tsv";
    paths.source_unmatched = out_dir / "glossary_en_unmatched.tsv";
    paths.target_unmatched = out_dir / "glossary_ja_unmatched.tsv";
    return paths;
}

void write_pairs_tsv(std::ostream& out, const GlossaryResult& glossary) {
    out << "source_term\ttarget_term\tcount\texample_ids\n";
    for (const auto& pair : sorted_pairs(glossary)) {
        out << pair.source_term << '\t'
            << pair.target_term << '\t'
            << pair.count << '\t'
            << join_ids(pair.example_ids) << '\n';
    }
}

void write_terms_tsv(std::ostream& out, const TermOccurrences& occurrences, const std::string& header) {
    out << header << "\tcount\texample_ids\n";
    for (const auto& entry : sorted_terms(occurrences)) {
        out << entry.term << '\t'
            << entry.example_ids.size() << '\t'
            << join_ids(entry.example_ids) << '\n';
    }
}

bool write_glossary_files(
    const std::filesystem::path& out_dir,
    const GlossaryResult& glossary,
    GlossaryPaths& out_paths,
    std::string& error
) {
    out_paths = glossary_paths_in(out_dir);

    std::ofstream pairs_out;
    if (!open_output(out_paths.pairs, pairs_out, error)) {
        return false;
    }
    write_pairs_tsv(pairs_out, glossary);
    if (!finish_output(out_paths.pairs, pairs_out, error)) {
        return false;
    }

    std::ofstream source_out;
    if (!open_output(out_paths.source_unmatched, source_out, error)) {
        return false;
    }
    write_terms_tsv(source_out, glossary.source_unmatched, "en_term");
    if (!finish_output(out_paths.source_unmatched, source_out, error)) {
        return false;
    }

    std::ofstream target_out;
    if (!open_output(out_paths.target_unmatched, target_out, error)) {
        return false;
    }
    write_terms_tsv(target_out, glossary.target_unmatched, "ja_term");
    return finish_output(out_paths.target_unmatched, target_out, error);
}

bool write_target_texts(
    const std::filesystem::path& out_path,
    const std::vector<std::string>& targets,
    const std::string& separator,
    std::string& error
) {
    std::ofstream out;
    if (!open_output(out_path, out, error)) {
        return false;
    }

    for (std::size_t i = 0; i < targets.size(); ++i) {
        if (i > 0) {
            out << separator;
        }
        out << targets[i];
    }
    if (separator.empty() || separator.back() != '\n') {
        out << '\n';
    }

    return finish_output(out_path, out, error);
}
