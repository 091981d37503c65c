#include "config.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

namespace {

bool parse_double_arg(const std::string& key, const std::string& value, double& out, std::string& error) {
    if (!error.empty()) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed)) {
            error = "Invalid number for " + key + ": " + value;
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::logic_error&) {
        error = "Invalid number for " + key + ": " + value;
        return false;
    }
}

bool parse_command(const std::string& name, Command& out) {
    if (name == "check") {
        out = Command::Check;
    } else if (name == "glossary") {
        out = Command::Glossary;
    } else if (name == "targets") {
        out = Command::Targets;
    } else if (name == "all") {
        out = Command::All;
    } else {
        return false;
    }
    return true;
}

}  // namespace

void print_usage(const char* program_name) {
    std::cout
        << "Usage:\n"
        << "  " << program_name << " check <xliff> [--min-ratio <f>] [--max-ratio <f>] [--ascii-ratio <f>] [--json <path>] [--no-tsv]\n"
        << "  " << program_name << " glossary <xliff> [--out-dir <dir>]\n"
        << "  " << program_name << " targets <xliff> [--sep <s>] [--no-empty] [--output <path>]\n"
        << "  " << program_name << " all <xliff-file-or-dir> --out-dir <dir> [threshold options]\n\n"
        << "Options:\n"
        << "  --min-ratio <f>       Minimum acceptable target/source length ratio (default: 0.3)\n"
        << "  --max-ratio <f>       Maximum acceptable target/source length ratio (default: 2.5)\n"
        << "  --ascii-ratio <f>     ASCII proportion that marks a target ascii_heavy (default: 0.7)\n"
        << "  --json <path>         Also write the quality report as JSON\n"
        << "  --no-tsv              Do not print the quality table on stdout\n"
        << "  --out-dir <dir>       Output directory (glossary default: build/glossary)\n"
        << "  --sep <s>             Separator between targets (default: newline; \\n, \\t, \\0 accepted)\n"
        << "  --no-empty            Skip empty targets\n"
        << "  --output <path>       Targets output file (default: tgt.txt next to the input)\n"
        << "  --quiet               Suppress [ok] and summary lines\n"
        << "  -h, --help            Show this help\n";
}

std::string decode_separator(const std::string& raw) {
    if (raw == "\\0") {
        return std::string(1, '\0');
    }
    if (raw == "\\n") {
        return "\n";
    }
    if (raw == "\\t") {
        return "\t";
    }
    return raw;
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    if (argc <= 1) {
        error = "No arguments provided";
        return false;
    }

    const std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        error = "help";
        return false;
    }
    if (!parse_command(command, config.command)) {
        error = "Unknown command: " + command;
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "--min-ratio") {
            if (!parse_double_arg(arg, require_value(arg), config.thresholds.min_ratio, error)) {
                return false;
            }
        } else if (arg == "--max-ratio") {
            if (!parse_double_arg(arg, require_value(arg), config.thresholds.max_ratio, error)) {
                return false;
            }
        } else if (arg == "--ascii-ratio") {
            if (!parse_double_arg(arg, require_value(arg), config.thresholds.ascii_threshold, error)) {
                return false;
            }
        } else if (arg == "--json") {
            config.json_path = require_value(arg);
        } else if (arg == "--no-tsv") {
            config.emit_tsv = false;
        } else if (arg == "--out-dir") {
            config.output_dir = require_value(arg);
        } else if (arg == "--sep") {
            config.separator = decode_separator(require_value(arg));
        } else if (arg == "--no-empty") {
            config.skip_empty_targets = true;
        } else if (arg == "--output") {
            config.targets_output = require_value(arg);
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else if (!arg.empty() && arg.front() == '-') {
            error = "Unknown argument: " + arg;
            return false;
        } else if (config.input_path.empty()) {
            config.input_path = arg;
        } else {
            error = "Unexpected argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    if (config.input_path.empty()) {
        error = "An input path is required";
        return false;
    }

    if (config.thresholds.min_ratio < 0.0 || config.thresholds.max_ratio < 0.0) {
        error = "Ratio thresholds must not be negative";
        return false;
    }
    if (config.thresholds.min_ratio > config.thresholds.max_ratio) {
        error = "--min-ratio must not exceed --max-ratio";
        return false;
    }
    if (config.thresholds.ascii_threshold < 0.0 || config.thresholds.ascii_threshold > 1.0) {
        error = "--ascii-ratio must be between 0 and 1";
        return false;
    }

    if (config.command == Command::Glossary && config.output_dir.empty()) {
        config.output_dir = std::filesystem::path("build") / "glossary";
    }
    if (config.command == Command::All && config.output_dir.empty()) {
        error = "--out-dir is required for all";
        return false;
    }
    if (config.command == Command::Targets && config.targets_output.empty()) {
        config.targets_output = config.input_path.parent_path() / "tgt.txt";
    }

    return true;
}
