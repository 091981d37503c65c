#pragma once

#include "quality.hpp"

#include <filesystem>
#include <string>

enum class Command {
    Check,
    Glossary,
    Targets,
    All
};

struct AppConfig {
    Command command = Command::Check;
    std::filesystem::path input_path;
    std::filesystem::path output_dir;
    std::filesystem::path json_path;
    std::filesystem::path targets_output;
    QualityThresholds thresholds;
    std::string separator = "\n";
    bool skip_empty_targets = false;
    bool emit_tsv = true;
    bool quiet = false;
};

void print_usage(const char* program_name);
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);

// Turns the escapes "\n", "\t" and "\0" into the characters they name.
std::string decode_separator(const std::string& raw);
