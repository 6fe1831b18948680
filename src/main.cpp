#include "config.hpp"
#include "document.hpp"
#include "errors.hpp"
#include "writer_rttm.hpp"
#include "writer_text.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace elan_eaf;

namespace {

bool has_eaf_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext == ".eaf";
}

bool collect_input_files(
    const std::filesystem::path& input,
    const std::filesystem::path& output_dir,
    std::vector<std::filesystem::path>& out_files,
    std::string& error
) {
    out_files.clear();

    if (!std::filesystem::exists(input)) {
        error = "Input path does not exist: " + input.string();
        return false;
    }

    if (std::filesystem::is_regular_file(input)) {
        if (!has_eaf_extension(input)) {
            error = "Input file is not an .eaf file: " + input.string();
            return false;
        }
        out_files.push_back(input);
        return true;
    }

    if (!std::filesystem::is_directory(input)) {
        error = "Input path is neither file nor directory: " + input.string();
        return false;
    }

    std::error_code ec;
    const auto input_abs = std::filesystem::weakly_canonical(input, ec);
    const auto output_abs = std::filesystem::weakly_canonical(output_dir, ec);
    const bool skip_output_subtree = !ec && output_abs != input_abs &&
        output_abs.string().starts_with(input_abs.string());

    for (const auto& entry : std::filesystem::recursive_directory_iterator(input)) {
        if (entry.is_regular_file() && has_eaf_extension(entry.path())) {
            if (skip_output_subtree) {
                const auto entry_abs = std::filesystem::weakly_canonical(entry.path(), ec);
                if (!ec && entry_abs.string().starts_with(output_abs.string())) {
                    continue;
                }
            }
            out_files.push_back(entry.path());
        }
    }

    std::sort(out_files.begin(), out_files.end());

    if (out_files.empty()) {
        error = "No .eaf files found under: " + input.string();
        return false;
    }

    return true;
}

std::filesystem::path output_relative_for(
    const std::filesystem::path& input_root,
    bool root_is_dir,
    const std::filesystem::path& eaf_file
) {
    if (root_is_dir) {
        return std::filesystem::relative(eaf_file, input_root);
    }

    return eaf_file.filename();
}

std::string format_progress_bar(double ratio, std::size_t width) {
    ratio = std::clamp(ratio, 0.0, 1.0);
    const std::size_t filled = static_cast<std::size_t>(ratio * static_cast<double>(width));
    std::string bar(width, '-');
    for (std::size_t i = 0; i < filled && i < width; ++i) {
        bar[i] = '=';
    }
    if (filled < width) {
        bar[filled] = '>';
    }
    return bar;
}

void print_progress(std::size_t done_files, std::size_t total_files, const std::string& current_file, bool done) {
    if (total_files == 0) {
        return;
    }

    const double fraction = static_cast<double>(done_files) / static_cast<double>(total_files);
    const auto pct = static_cast<int>(std::clamp(fraction, 0.0, 1.0) * 100.0);

    std::ostringstream line;
    line
        << "\r["
        << format_progress_bar(fraction, 30)
        << "] "
        << std::setw(3) << pct << "% "
        << "files " << done_files << "/" << total_files
        << " " << current_file;

    std::cerr << line.str();
    if (done) {
        std::cerr << "\n";
    }
    std::cerr.flush();
}

bool outputs_are_current(
    const std::filesystem::path& input_eaf,
    const std::vector<std::filesystem::path>& outputs,
    bool resume_enabled,
    std::string& reason
) {
    if (!resume_enabled) {
        return false;
    }

    std::error_code ec;
    const auto in_time = std::filesystem::last_write_time(input_eaf, ec);
    if (ec) {
        reason = "cannot read input mtime";
        return false;
    }

    for (const auto& output : outputs) {
        if (!std::filesystem::exists(output, ec)) {
            return false;
        }
        const auto out_time = std::filesystem::last_write_time(output, ec);
        if (ec || out_time < in_time) {
            return false;
        }
    }

    reason = "outputs current";
    return true;
}

bool same_file(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::error_code ec;
    const auto lhs = std::filesystem::weakly_canonical(a, ec);
    if (ec) {
        return false;
    }
    const auto rhs = std::filesystem::weakly_canonical(b, ec);
    return !ec && lhs == rhs;
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
        return error == "help" ? 0 : 1;
    }

    std::vector<std::filesystem::path> input_files;
    if (!collect_input_files(config.input_path, config.output_dir, input_files, error)) {
        std::cerr << error << "\n";
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.output_dir, ec);
    if (ec) {
        std::cerr << "[fatal] cannot create output directory " << config.output_dir << ": " << ec.message() << "\n";
        return 1;
    }

    const bool input_is_dir = std::filesystem::is_directory(config.input_path);

    std::size_t total_segments = 0;
    std::size_t files_ok = 0;
    std::size_t files_failed = 0;

    if (config.show_progress) {
        print_progress(0, input_files.size(), "", false);
    }

    for (std::size_t file_idx = 0; file_idx < input_files.size(); ++file_idx) {
        const auto& eaf_file = input_files[file_idx];
        const bool last_file = file_idx + 1 == input_files.size();

        const auto rel_path = output_relative_for(config.input_path, input_is_dir, eaf_file);
        const auto out_parent = config.output_dir / rel_path.parent_path();
        const auto stem = rel_path.stem().string();

        const auto rttm_path = out_parent / (stem + ".rttm");
        const auto text_path = out_parent / (stem + ".txt");
        const auto eaf_path = out_parent / (stem + ".eaf");

        std::vector<std::filesystem::path> outputs;
        if (config.emit_rttm) {
            outputs.push_back(rttm_path);
        }
        if (config.emit_text) {
            outputs.push_back(text_path);
        }
        if (config.emit_eaf) {
            outputs.push_back(eaf_path);
        }

        if (config.show_progress) {
            print_progress(file_idx, input_files.size(), eaf_file.filename().string(), false);
        }

        std::string resume_reason;
        if (outputs_are_current(eaf_file, outputs, config.resume, resume_reason)) {
            ++files_ok;
            if (config.show_progress) {
                print_progress(file_idx + 1, input_files.size(), eaf_file.filename().string(), last_file);
            }
            std::cout << "[skip] " << eaf_file.filename().string() << " " << resume_reason << "\n";
            continue;
        }

        if (config.emit_eaf && same_file(eaf_file, eaf_path)) {
            std::cerr << "[error] refusing to overwrite input " << eaf_file << " with its re-serialized copy\n";
            ++files_failed;
            continue;
        }

        std::optional<Document> doc;
        try {
            doc.emplace(Document::from_file(eaf_file));
        } catch (const Error& ex) {
            std::cerr << "[skip] " << ex.what() << "\n";
            ++files_failed;
            continue;
        }

        std::filesystem::create_directories(out_parent, ec);
        if (ec) {
            std::cerr << "[error] cannot create " << out_parent << ": " << ec.message() << "\n";
            ++files_failed;
            continue;
        }

        if (config.emit_rttm && !write_rttm_output(rttm_path, *doc, config.excluded_tiers, error)) {
            std::cerr << "[error] RTTM write failed for " << eaf_file << ": " << error << "\n";
            ++files_failed;
            continue;
        }

        if (config.emit_text && !write_text_output(text_path, *doc, config.excluded_tiers, error)) {
            std::cerr << "[error] text write failed for " << eaf_file << ": " << error << "\n";
            ++files_failed;
            continue;
        }

        if (config.emit_eaf) {
            try {
                if (!config.audio_path.empty()) {
                    doc->add_audio(config.audio_path);
                }
                // Stale outputs from an earlier run are replaced.
                doc->save_as(eaf_path, /*overwrite_existing=*/true);
            } catch (const Error& ex) {
                std::cerr << "[error] EAF write failed for " << eaf_file << ": " << ex.what() << "\n";
                ++files_failed;
                continue;
            }
        }

        total_segments += doc->size();
        ++files_ok;

        if (config.show_progress) {
            print_progress(file_idx + 1, input_files.size(), eaf_file.filename().string(), last_file);
        }

        std::cout
            << "[ok] " << eaf_file.filename().string()
            << " tiers=" << doc->tiers().size()
            << " subtiers=" << doc->subtiers().size()
            << " segments=" << doc->size()
            << " audio=" << (doc->audio_path() ? doc->audio_path()->string() : "none")
            << "\n";
    }

    std::cout
        << "[summary] files=" << input_files.size()
        << " ok=" << files_ok
        << " failed=" << files_failed
        << " total_segments=" << total_segments
        << "\n";

    return files_failed == 0 ? 0 : 1;
}
