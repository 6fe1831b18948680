#pragma once

#include "document.hpp"

#include <filesystem>
#include <functional>
#include <set>
#include <string>

namespace elan_eaf {

// Formats one output line; the newline is appended by the writer.
using SegmentFormatter = std::function<std::string(const Segment&)>;

// "TIER START-END: TEXT" with the text trimmed.
std::string default_text_line(const Segment& segment);

bool write_text_output(
    const std::filesystem::path& out_path,
    const Document& doc,
    const std::set<std::string>& excluded_tiers,
    std::string& error,
    const SegmentFormatter& formatter = {}
);

}  // namespace elan_eaf
