#pragma once

#include "eaf_reader.hpp"
#include "segmentations.hpp"

#include <filesystem>
#include <string>

#include <pugixml.hpp>

namespace elan_eaf {

// Rebuilds `out_doc` from `source` with the model's tier types, tiers and segments.
// TIME_ORDER is synthesised from segment times; elements the model does not own are copied through.
void build_eaf_tree(
    const pugi::xml_document& source,
    const TierIndex& index,
    const Segmentations& segmentations,
    pugi::xml_document& out_doc
);

bool write_eaf_file(const std::filesystem::path& out_path, const pugi::xml_document& doc, std::string& error);
std::string eaf_to_string(const pugi::xml_document& doc);

}  // namespace elan_eaf
