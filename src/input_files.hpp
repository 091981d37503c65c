#pragma once

#include <filesystem>
#include <string>
#include <vector>

bool has_xliff_extension(const std::filesystem::path& path);

// Component-wise prefix test: "out2/a.xlf" is not within "out".
bool is_within_directory(const std::filesystem::path& dir, const std::filesystem::path& path);

// A single file is accepted as-is; a directory is searched recursively for XLIFF files,
// skipping anything under output_dir. Results are sorted.
bool collect_input_files(
    const std::filesystem::path& input,
    const std::filesystem::path& output_dir,
    std::vector<std::filesystem::path>& out_files,
    std::string& error
);

// Report directory for one input: <output_dir>/<path relative to the input root>. The extension
// is kept so that x.xlf and x.xml next to each other get separate directories.
std::filesystem::path report_dir_for(
    const std::filesystem::path& input_root,
    bool root_is_dir,
    const std::filesystem::path& xliff_file,
    const std::filesystem::path& output_dir
);
