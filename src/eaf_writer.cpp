#include "eaf_writer.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace elan_eaf {

namespace {

constexpr const char* kIndent = "  ";

bool is_model_owned(const pugi::xml_node& node) {
    static const char* const owned[] = {"HEADER", "TIME_ORDER", "TIER", "LINGUISTIC_TYPE"};
    return std::any_of(std::begin(owned), std::end(owned), [&](const char* name) {
        return std::strcmp(node.name(), name) == 0;
    });
}

std::size_t parent_depth(const TierIndex& index, const Subtier& subtier) {
    std::size_t depth = 1;
    std::string parent = subtier.parent_name();
    while (depth <= index.subtiers.size()) {
        const auto it = index.subtiers.find(parent);
        if (it == index.subtiers.end()) {
            break;
        }
        parent = it->second.parent_name();
        ++depth;
    }
    return depth;
}

// Subtiers ordered so that every parent is written before its children.
std::vector<const Subtier*> ordered_subtiers(const TierIndex& index) {
    std::vector<std::pair<std::size_t, const Subtier*>> by_depth;
    for (const auto& [name, subtier] : index.subtiers) {
        by_depth.emplace_back(parent_depth(index, subtier), &subtier);
    }
    std::stable_sort(by_depth.begin(), by_depth.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });

    std::vector<const Subtier*> out;
    out.reserve(by_depth.size());
    for (const auto& entry : by_depth) {
        out.push_back(entry.second);
    }
    return out;
}

bool has_tier(const TierIndex& index, const std::string& name) {
    return index.tiers.contains(name) || index.subtiers.contains(name);
}

void update_last_used_annotation_id(pugi::xml_node header, std::int64_t last_used) {
    pugi::xml_node property = header.find_child_by_attribute("PROPERTY", "NAME", "lastUsedAnnotationId");
    if (!property) {
        if (last_used == 0) {
            return;
        }
        property = header.append_child("PROPERTY");
        property.append_attribute("NAME") = "lastUsedAnnotationId";
    }
    property.text().set(std::to_string(last_used).c_str());
}

void append_annotations(
    pugi::xml_node tier_tag,
    std::vector<const Segment*> rows,
    const std::map<std::int64_t, std::string>& slot_ids
) {
    std::stable_sort(rows.begin(), rows.end(), [](const Segment* a, const Segment* b) {
        return a->start != b->start ? a->start < b->start : a->end < b->end;
    });

    for (const auto* row : rows) {
        auto annotation = tier_tag.append_child("ANNOTATION").append_child("ALIGNABLE_ANNOTATION");
        annotation.append_attribute("ANNOTATION_ID") = row->id.c_str();
        annotation.append_attribute("TIME_SLOT_REF1") = slot_ids.at(row->start).c_str();
        annotation.append_attribute("TIME_SLOT_REF2") = slot_ids.at(row->end).c_str();
        annotation.append_child("ANNOTATION_VALUE").text().set(row->text.c_str());
    }
}

// REF_ANNOTATIONs are not modelled; they are carried over from the source TIER while the
// annotation they refer to is still written. Parents are emitted before their subtiers.
void append_reference_annotations(
    pugi::xml_node tier_tag,
    const pugi::xml_node& source_root,
    const Subtier& subtier,
    std::set<std::string>& written_ids,
    std::int64_t& last_used
) {
    const auto source_tier = source_root.find_child_by_attribute("TIER", "TIER_ID", subtier.name().c_str());
    if (subtier.parent_name() != source_tier.attribute("PARENT_REF").value()) {
        return;
    }

    for (const auto& wrapper : source_tier.children("ANNOTATION")) {
        const auto annotation = wrapper.child("REF_ANNOTATION");
        if (!annotation || !written_ids.contains(annotation.attribute("ANNOTATION_REF").value())) {
            continue;
        }

        tier_tag.append_copy(wrapper);
        const std::string id = annotation.attribute("ANNOTATION_ID").value();
        written_ids.insert(id);
        if (const auto number = annotation_number(id)) {
            last_used = std::max(last_used, *number);
        }
    }
}

}  // namespace

void build_eaf_tree(
    const pugi::xml_document& source,
    const TierIndex& index,
    const Segmentations& segmentations,
    pugi::xml_document& out_doc
) {
    out_doc.reset();

    for (const auto& child : source.children()) {
        if (child.type() == pugi::node_declaration) {
            out_doc.append_copy(child);
        }
    }

    const auto source_root = source.document_element();
    auto root = out_doc.append_child(source_root.name());
    for (const auto& attr : source_root.attributes()) {
        root.append_copy(attr);
    }

    pugi::xml_node header = source_root.child("HEADER")
        ? root.append_copy(source_root.child("HEADER"))
        : root.append_child("HEADER");
    if (!header.attribute("TIME_UNITS")) {
        header.append_attribute("TIME_UNITS") = "milliseconds";
    }

    // Segments on tiers that were removed have nowhere to go.
    std::map<std::string, std::vector<const Segment*>> rows_by_tier;
    std::set<std::int64_t> times;
    std::set<std::string> written_ids;
    std::int64_t last_used = 0;
    for (const auto& row : segmentations.segments()) {
        if (!has_tier(index, row.tier)) {
            continue;
        }
        rows_by_tier[row.tier].push_back(&row);
        times.insert(row.start);
        times.insert(row.end);
        written_ids.insert(row.id);
        if (const auto number = annotation_number(row.id)) {
            last_used = std::max(last_used, *number);
        }
    }

    // Adjacent segments share one slot per distinct time value.
    auto time_order = root.append_child("TIME_ORDER");
    std::map<std::int64_t, std::string> slot_ids;
    for (const auto time : times) {
        const std::string id = "ts" + std::to_string(slot_ids.size() + 1);
        auto slot = time_order.append_child("TIME_SLOT");
        slot.append_attribute("TIME_SLOT_ID") = id.c_str();
        slot.append_attribute("TIME_VALUE") = std::to_string(time).c_str();
        slot_ids.emplace(time, id);
    }

    std::map<std::string, std::shared_ptr<const TierType>> tier_types = index.tier_types;
    auto emit_tier = [&](const Tier& tier) {
        auto tag = tier.to_tag(root);
        tier_types.emplace(tier.tier_type().name(), tier.shared_tier_type());
        append_annotations(tag, rows_by_tier[tier.name()], slot_ids);
        return tag;
    };

    for (const auto& [name, tier] : index.tiers) {
        emit_tier(tier);
    }
    for (const auto* subtier : ordered_subtiers(index)) {
        auto tag = emit_tier(*subtier);
        append_reference_annotations(tag, source_root, *subtier, written_ids, last_used);
    }

    update_last_used_annotation_id(header, last_used);

    for (const auto& [name, tier_type] : tier_types) {
        tier_type->to_tag(root);
    }

    for (const auto& child : source_root.children()) {
        if (child.type() == pugi::node_element && !is_model_owned(child)) {
            root.append_copy(child);
        }
    }
}

bool write_eaf_file(const std::filesystem::path& out_path, const pugi::xml_document& doc, std::string& error) {
    if (!doc.save_file(out_path.c_str(), kIndent, pugi::format_default, pugi::encoding_utf8)) {
        error = "Failed to write EAF XML: " + out_path.string();
        return false;
    }
    return true;
}

std::string eaf_to_string(const pugi::xml_document& doc) {
    std::ostringstream out;
    doc.save(out, kIndent, pugi::format_default, pugi::encoding_utf8);
    return out.str();
}

}  // namespace elan_eaf
