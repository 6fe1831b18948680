#pragma once

#include "segmentations.hpp"
#include "tier.hpp"
#include "tier_type.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <pugixml.hpp>

namespace elan_eaf {

// Tier declarations recovered from an ANNOTATION_DOCUMENT, keyed by name.
struct TierIndex {
    std::map<std::string, std::shared_ptr<const TierType>> tier_types;
    std::map<std::string, Tier> tiers;
    std::map<std::string, Subtier> subtiers;
};

// Throws IoError when the file cannot be read and FormatError when it is not an EAF document.
void load_eaf_tree(const std::filesystem::path& path, pugi::xml_document& out_doc);
void load_eaf_string(const std::string& xml, pugi::xml_document& out_doc);

TierIndex extract_tiers(const pugi::xml_node& root);
std::vector<Segment> read_segment_rows(const pugi::xml_node& root);
// Ids of the symbolic REF_ANNOTATIONs, which are carried through save but not modelled.
std::vector<std::string> read_reference_annotation_ids(const pugi::xml_node& root);
std::optional<std::filesystem::path> read_audio_path(const pugi::xml_node& root);

}  // namespace elan_eaf
