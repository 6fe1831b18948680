#include "writer_rttm.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>

namespace elan_eaf {

namespace {

std::string speaker_label(std::string tier) {
    const auto first = tier.find_first_not_of(" \t");
    const auto last = tier.find_last_not_of(" \t");
    tier = first == std::string::npos ? std::string() : tier.substr(first, last - first + 1);
    std::replace(tier.begin(), tier.end(), ' ', '_');
    return tier;
}

}  // namespace

bool write_rttm_output(
    const std::filesystem::path& out_path,
    const Document& doc,
    const std::set<std::string>& excluded_tiers,
    std::string& error
) {
    std::ofstream out(out_path);
    if (!out) {
        error = "Failed to open RTTM output: " + out_path.string();
        return false;
    }

    const std::string file_id = doc.file().stem().string();
    out << std::fixed << std::setprecision(6);

    for (const auto& seg : doc.segments()) {
        if (excluded_tiers.contains(seg.tier)) {
            continue;
        }

        out << "SPEAKER " << file_id << " 1 "
            << static_cast<double>(seg.start) / 1000.0 << " "
            << static_cast<double>(seg.duration) / 1000.0 << " "
            << "<NA> <NA> " << speaker_label(seg.tier) << " <NA> <NA>\n";
    }

    if (!out) {
        error = "Failed to write RTTM output: " + out_path.string();
        return false;
    }

    return true;
}

}  // namespace elan_eaf
