#include "writer_text.hpp"

#include <fstream>

namespace elan_eaf {

std::string default_text_line(const Segment& segment) {
    const auto first = segment.text.find_first_not_of(" \t\r\n");
    const auto last = segment.text.find_last_not_of(" \t\r\n");
    const std::string text = first == std::string::npos ? std::string() : segment.text.substr(first, last - first + 1);

    return segment.tier + " " + std::to_string(segment.start) + "-" + std::to_string(segment.end) + ": " + text;
}

bool write_text_output(
    const std::filesystem::path& out_path,
    const Document& doc,
    const std::set<std::string>& excluded_tiers,
    std::string& error,
    const SegmentFormatter& formatter
) {
    std::ofstream out(out_path);
    if (!out) {
        error = "Failed to open text output: " + out_path.string();
        return false;
    }

    const SegmentFormatter& format = formatter ? formatter : SegmentFormatter(default_text_line);
    for (const auto& seg : doc.segments()) {
        if (excluded_tiers.contains(seg.tier)) {
            continue;
        }
        out << format(seg) << "\n";
    }

    if (!out) {
        error = "Failed to write text output: " + out_path.string();
        return false;
    }

    return true;
}

}  // namespace elan_eaf
