#include "config.hpp"

#include "version.hpp"

#include <iostream>

namespace elan_eaf {

void print_usage(const char* program_name) {
    std::cout
        << "elan-eaf " << kVersion << "\n\n"
        << "Usage:\n"
        << "  " << program_name << " --input <eaf-file-or-dir> --output <out-dir> [options]\n\n"
        << "Options:\n"
        << "  --emit-rttm             Write speaker turns as RTTM (*.rttm)\n"
        << "  --emit-text             Write one line per segment (*.txt)\n"
        << "  --emit-eaf              Write a re-serialized copy of each document (*.eaf)\n"
        << "  --exclude-tier <name>   Leave this tier out of RTTM and text output (repeatable)\n"
        << "  --audio <path>          Attach this audio file to re-serialized copies\n"
        << "  --no-progress           Disable progress bar output\n"
        << "  --no-resume             Always reprocess files even if outputs look current\n"
        << "  -h, --help              Show this help\n";
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    if (argc <= 1) {
        error = "No arguments provided";
        return false;
    }

    for (int i = 1; i < argc; ++i) {
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

        if (arg == "--input") {
            config.input_path = require_value(arg);
        } else if (arg == "--output") {
            config.output_dir = require_value(arg);
        } else if (arg == "--audio") {
            config.audio_path = require_value(arg);
        } else if (arg == "--exclude-tier") {
            const std::string tier = require_value(arg);
            if (!tier.empty()) {
                config.excluded_tiers.insert(tier);
            }
        } else if (arg == "--emit-rttm") {
            config.emit_rttm = true;
        } else if (arg == "--emit-text") {
            config.emit_text = true;
        } else if (arg == "--emit-eaf") {
            config.emit_eaf = true;
        } else if (arg == "--no-progress") {
            config.show_progress = false;
        } else if (arg == "--no-resume") {
            config.resume = false;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    if (config.input_path.empty()) {
        error = "--input is required";
        return false;
    }
    if (config.output_dir.empty()) {
        error = "--output is required";
        return false;
    }
    if (!config.emit_rttm && !config.emit_text && !config.emit_eaf) {
        error = "Nothing to do: pass at least one of --emit-rttm, --emit-text, --emit-eaf";
        return false;
    }

    return true;
}

}  // namespace elan_eaf
