#include "report_writer.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace {

std::filesystem::path scratch_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / ("xliff_qa_report_" + name);
    std::filesystem::remove_all(dir);
    return dir;
}

std::string slurp(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

UnitReport sample_report() {
    UnitReport r;
    r.id = "u1";
    r.source_chars = 18;
    r.target_chars = 5;
    r.ratio = 5.0 / 18.0;
    r.ratio_flag = true;
    r.source_preview = "Site-19 \"Containment\"";
    r.target_preview = "サイト19";
    return r;
}

}  // namespace

TEST(FormatRatio, ThreeDecimals) {
    EXPECT_EQ(format_ratio(5.0 / 18.0), "0.278");
    EXPECT_EQ(format_ratio(1.0), "1.000");
    EXPECT_EQ(format_ratio(0.0), "0.000");
}

TEST(JoinIds, CommaJoinedAscending) {
    EXPECT_EQ(join_ids({"b", "a", "c"}), "a,b,c");
    EXPECT_EQ(join_ids({}), "");
}

TEST(JsonEscape, EscapesQuotesAndControlCharacters) {
    EXPECT_EQ(json_escape("a\"b\\c\nd\x01"), "a\\\"b\\\\c\\nd\\u0001");
    EXPECT_EQ(json_escape("財団"), "財団");
}

TEST(QualityTsv, HeaderAndRow) {
    std::ostringstream out;
    write_quality_tsv(out, {sample_report()});
    EXPECT_EQ(out.str(),
        "id\tsrc_chars\ttgt_chars\tratio\tuntranslated\tascii_heavy\tratio_flag\tsource_preview\ttarget_preview\n"
        "u1\t18\t5\t0.278\t0\t0\t1\tSite-19 \"Containment\"\tサイト19\n");
}

TEST(QualitySummaryBlock, ListsEveryAggregate) {
    QualitySummary summary;
    summary.units = 2;
    summary.ratio_flags = 1;
    summary.avg_ratio = 0.75;
    summary.min_ratio = 0.5;
    summary.max_ratio = 1.0;

    std::ostringstream out;
    write_quality_summary(out, summary);
    const auto text = out.str();
    EXPECT_NE(text.find("# Summary"), std::string::npos);
    EXPECT_NE(text.find("units: 2\n"), std::string::npos);
    EXPECT_NE(text.find("ratio_flags: 1\n"), std::string::npos);
    EXPECT_NE(text.find("avg_ratio: 0.750\n"), std::string::npos);
    EXPECT_NE(text.find("max_ratio: 1.000\n"), std::string::npos);
}

TEST(QualityJson, ContainsSummaryAndUnits) {
    QualitySummary summary;
    summary.units = 1;
    summary.ratio_flags = 1;
    summary.avg_ratio = 5.0 / 18.0;

    std::ostringstream out;
    write_quality_json(out, {sample_report()}, summary);
    const auto text = out.str();
    EXPECT_NE(text.find("\"summary\": {"), std::string::npos);
    EXPECT_NE(text.find("\"avg_ratio\": 0.278"), std::string::npos);
    EXPECT_NE(text.find("\"id\": \"u1\""), std::string::npos);
    EXPECT_NE(text.find("\"ratio_flag\": true"), std::string::npos);
    EXPECT_NE(text.find("\"source_preview\": \"Site-19 \\\"Containment\\\"\""), std::string::npos);
    EXPECT_NE(text.find("\"target_preview\": \"サイト19\""), std::string::npos);
}

TEST(QualityJson, EmptyUnitList) {
    std::ostringstream out;
    write_quality_json(out, {}, QualitySummary{});
    EXPECT_NE(out.str().find("\"units\": []"), std::string::npos);
}

TEST(QualityJsonFile, CreatesParentDirectories) {
    const auto dir = scratch_dir("json");
    const auto path = dir / "nested" / "report.json";

    std::string error;
    ASSERT_TRUE(write_quality_json_file(path, {sample_report()}, QualitySummary{}, error)) << error;
    EXPECT_NE(slurp(path).find("\"units\": ["), std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST(GlossaryFiles, WritesThreeSortedTables) {
    GlossaryResult glossary;
    build_glossary({
        {"2", "Keter", "ケテル"},
        {"1", "Keter", "ケテル"},
        {"3", "Alpha and Bravo", "アルファ"},
        {"4", "Bravo Charlie", "何か"},
    }, glossary);

    const auto dir = scratch_dir("glossary");
    GlossaryPaths paths;
    std::string error;
    ASSERT_TRUE(write_glossary_files(dir, glossary, paths, error)) << error;

    EXPECT_EQ(paths.pairs.string(), (dir / "glossary_pairs.tsv").string());
    EXPECT_EQ(slurp(paths.pairs),
        "source_term\ttarget_term\tcount\texample_ids\n"
        "Keter\tケテル\t2\t1,2\n");
    EXPECT_EQ(slurp(paths.source_unmatched),
        "en_term\tcount\texample_ids\n"
        "Bravo\t2\t3,4\n"
        "Alpha\t1\t3\n"
        "Charlie\t1\t4\n");
    EXPECT_EQ(slurp(paths.target_unmatched),
        "ja_term\tcount\texample_ids\n"
        "アルファ\t1\t3\n");

    std::filesystem::remove_all(dir);
}

TEST(TargetTexts, JoinsWithSeparatorAndEndsWithNewline) {
    const auto dir = scratch_dir("targets");
    const auto path = dir / "tgt.txt";
    std::string error;

    ASSERT_TRUE(write_target_texts(path, {"一", "二"}, "\n", error)) << error;
    EXPECT_EQ(slurp(path), "一\n二");

    ASSERT_TRUE(write_target_texts(path, {"一", "二"}, " | ", error)) << error;
    EXPECT_EQ(slurp(path), "一 | 二\n");

    ASSERT_TRUE(write_target_texts(path, {"a", "b"}, std::string(1, '\0'), error)) << error;
    EXPECT_EQ(slurp(path), std::string("a\0b\n", 4));

    std::filesystem::remove_all(dir);
}

TEST(EnsureUtf8Output, CanBeCalledRepeatedly) {
    ensure_utf8_output();
    ensure_utf8_output();
    SUCCEED();
}
