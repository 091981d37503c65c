#include "input_files.hpp"

#include <algorithm>
#include <cctype>

bool has_xliff_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext == ".xlf" || ext == ".xliff" || ext == ".xml";
}

bool is_within_directory(const std::filesystem::path& dir, const std::filesystem::path& path) {
    auto base = dir.lexically_normal();
    if (base.filename().empty()) {
        base = base.parent_path();
    }
    const auto candidate = path.lexically_normal();

    auto base_it = base.begin();
    auto path_it = candidate.begin();
    for (; base_it != base.end(); ++base_it, ++path_it) {
        if (path_it == candidate.end() || *base_it != *path_it) {
            return false;
        }
    }
    return true;
}

bool collect_input_files(
    const std::filesystem::path& input,
    const std::filesystem::path& output_dir,
    std::vector<std::filesystem::path>& out_files,
    std::string& error
) {
    out_files.clear();

    std::error_code ec;
    if (!std::filesystem::exists(input, ec)) {
        error = "Input path does not exist: " + input.string();
        return false;
    }

    if (std::filesystem::is_regular_file(input, ec)) {
        out_files.push_back(input);
        return true;
    }

    if (!std::filesystem::is_directory(input, ec)) {
        error = "Input path is neither file nor directory: " + input.string();
        return false;
    }

    const auto output_abs = std::filesystem::weakly_canonical(output_dir, ec);
    const bool skip_output_subtree = !ec && !output_dir.empty();

    for (const auto& entry : std::filesystem::recursive_directory_iterator(input)) {
        if (!entry.is_regular_file() || !has_xliff_extension(entry.path())) {
            continue;
        }
        if (skip_output_subtree) {
            std::error_code entry_ec;
            const auto entry_abs = std::filesystem::weakly_canonical(entry.path(), entry_ec);
            if (!entry_ec && is_within_directory(output_abs, entry_abs)) {
                continue;
            }
        }
        out_files.push_back(entry.path());
    }
    std::sort(out_files.begin(), out_files.end());

    if (out_files.empty()) {
        error = "No XLIFF files found under: " + input.string();
        return false;
    }

    return true;
}

std::filesystem::path report_dir_for(
    const std::filesystem::path& input_root,
    bool root_is_dir,
    const std::filesystem::path& xliff_file,
    const std::filesystem::path& output_dir
) {
    const std::filesystem::path rel = root_is_dir
        ? std::filesystem::relative(xliff_file, input_root)
        : xliff_file.filename();
    return output_dir / rel;
}
