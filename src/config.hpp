#pragma once

#include <filesystem>
#include <set>
#include <string>

namespace elan_eaf {

struct AppConfig {
    std::filesystem::path input_path;
    std::filesystem::path output_dir;
    std::filesystem::path audio_path;
    std::set<std::string> excluded_tiers;
    bool emit_rttm = false;
    bool emit_text = false;
    bool emit_eaf = false;
    bool show_progress = true;
    bool resume = true;
};

void print_usage(const char* program_name);
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);

}  // namespace elan_eaf
