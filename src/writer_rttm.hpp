#pragma once

#include "document.hpp"

#include <filesystem>
#include <set>
#include <string>

namespace elan_eaf {

bool write_rttm_output(
    const std::filesystem::path& out_path,
    const Document& doc,
    const std::set<std::string>& excluded_tiers,
    std::string& error
);

}  // namespace elan_eaf
