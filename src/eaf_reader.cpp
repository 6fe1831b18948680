#include "eaf_reader.hpp"

#include "errors.hpp"
#include "media_url.hpp"

#include <cstring>
#include <unordered_map>
#include <utility>

namespace elan_eaf {

namespace {

constexpr unsigned int kParseFlags = pugi::parse_default | pugi::parse_declaration;

void require_annotation_document(const pugi::xml_document& doc, const std::string& source) {
    const auto root = doc.document_element();
    if (!root) {
        throw FormatError("No root element in XML: " + source);
    }
    if (std::strcmp(root.name(), "ANNOTATION_DOCUMENT") != 0) {
        throw FormatError("Root element of " + source + " is " + root.name() + ", not ANNOTATION_DOCUMENT");
    }
}

std::string required_attribute(const pugi::xml_node& node, const char* name) {
    const auto attr = node.attribute(name);
    if (!attr) {
        throw FormatError(std::string(node.name()) + " tag is missing " + name);
    }
    return attr.value();
}

void read_tier_types(const pugi::xml_node& root, TierIndex& index) {
    for (const auto& tag : root.children("LINGUISTIC_TYPE")) {
        auto tier_type = std::make_shared<const TierType>(TierType::from_tag(tag));
        // First declaration wins, as in ELAN.
        index.tier_types.emplace(tier_type->name(), std::move(tier_type));
    }
}

std::shared_ptr<const TierType> resolve_tier_type(const pugi::xml_node& tier_tag, const TierIndex& index) {
    const std::string type_name = required_attribute(tier_tag, "LINGUISTIC_TYPE_REF");

    const auto it = index.tier_types.find(type_name);
    if (it == index.tier_types.end()) {
        throw FormatError(
            std::string("TIER ") + tier_tag.attribute("TIER_ID").value() +
            " has unknown linguistic type reference " + type_name
        );
    }
    return it->second;
}

const Tier* find_resolved(const TierIndex& index, const std::string& name) {
    if (const auto it = index.tiers.find(name); it != index.tiers.end()) {
        return &it->second;
    }
    if (const auto it = index.subtiers.find(name); it != index.subtiers.end()) {
        return &it->second;
    }
    return nullptr;
}

std::unordered_map<std::string, std::int64_t> read_time_slots(const pugi::xml_node& root) {
    std::unordered_map<std::string, std::int64_t> slots;
    for (const auto& slot : root.child("TIME_ORDER").children("TIME_SLOT")) {
        const std::string id = required_attribute(slot, "TIME_SLOT_ID");
        const auto value = slot.attribute("TIME_VALUE");
        if (!value) {
            // Unaligned slots only occur under symbolic tiers, which are not modelled.
            continue;
        }
        try {
            slots[id] = parse_milliseconds(value.value());
        } catch (const InvalidArgument& ex) {
            throw FormatError("TIME_SLOT " + id + ": " + ex.what());
        }
    }
    return slots;
}

std::int64_t dereference_slot(
    const std::unordered_map<std::string, std::int64_t>& slots,
    const pugi::xml_node& annotation,
    const char* ref_attribute
) {
    const std::string ref = required_attribute(annotation, ref_attribute);
    const auto it = slots.find(ref);
    if (it == slots.end()) {
        throw FormatError(
            std::string("Annotation ") + annotation.attribute("ANNOTATION_ID").value() +
            " refers to unknown or unaligned time slot " + ref
        );
    }
    return it->second;
}

}  // namespace

void load_eaf_tree(const std::filesystem::path& path, pugi::xml_document& out_doc) {
    const pugi::xml_parse_result parse = out_doc.load_file(path.c_str(), kParseFlags, pugi::encoding_auto);
    if (parse.status == pugi::status_file_not_found || parse.status == pugi::status_io_error) {
        throw IoError("Failed to read " + path.string() + ": " + parse.description());
    }
    if (!parse) {
        throw FormatError("Failed to parse XML " + path.string() + ": " + parse.description());
    }
    require_annotation_document(out_doc, path.string());
}

void load_eaf_string(const std::string& xml, pugi::xml_document& out_doc) {
    const pugi::xml_parse_result parse = out_doc.load_string(xml.c_str(), kParseFlags);
    if (!parse) {
        throw FormatError(std::string("Failed to parse XML string: ") + parse.description());
    }
    require_annotation_document(out_doc, "<string>");
}

TierIndex extract_tiers(const pugi::xml_node& root) {
    TierIndex index;
    std::vector<pugi::xml_node> pending;

    // Declared types are kept whether or not a tier refers to them.
    read_tier_types(root, index);

    // Pass 1: root tiers. Subtier tags wait until their parent object exists.
    for (const auto& tag : root.children("TIER")) {
        const std::string name = required_attribute(tag, "TIER_ID");
        auto tier_type = resolve_tier_type(tag, index);

        if (find_resolved(index, name) != nullptr) {
            throw FormatError("Duplicate TIER_ID " + name);
        }

        if (tag.attribute("PARENT_REF")) {
            pending.push_back(tag);
            continue;
        }
        index.tiers.emplace(name, Tier::from_tag(tag, std::move(tier_type)));
    }

    // Pass 2: subtiers, repeated while nested levels keep resolving.
    while (!pending.empty()) {
        std::vector<pugi::xml_node> unresolved;
        for (const auto& tag : pending) {
            const std::string name = tag.attribute("TIER_ID").value();
            const Tier* parent = find_resolved(index, tag.attribute("PARENT_REF").value());
            if (parent == nullptr) {
                unresolved.push_back(tag);
                continue;
            }
            if (find_resolved(index, name) != nullptr) {
                throw FormatError("Duplicate TIER_ID " + name);
            }
            auto subtier = Subtier::from_tag(tag, resolve_tier_type(tag, index), *parent);
            index.subtiers.emplace(name, std::move(subtier));
        }

        if (unresolved.size() == pending.size()) {
            const auto& tag = unresolved.front();
            throw FormatError(
                std::string("TIER ") + tag.attribute("TIER_ID").value() + " has unknown parent " +
                tag.attribute("PARENT_REF").value()
            );
        }
        pending = std::move(unresolved);
    }

    return index;
}

std::vector<Segment> read_segment_rows(const pugi::xml_node& root) {
    const auto slots = read_time_slots(root);
    std::vector<Segment> rows;

    for (const auto& tier : root.children("TIER")) {
        const std::string tier_name = required_attribute(tier, "TIER_ID");

        for (const auto& wrapper : tier.children("ANNOTATION")) {
            const auto annotation = wrapper.child("ALIGNABLE_ANNOTATION");
            if (!annotation) {
                continue;
            }

            Segment row;
            row.tier = tier_name;
            row.id = required_attribute(annotation, "ANNOTATION_ID");
            row.start = dereference_slot(slots, annotation, "TIME_SLOT_REF1");
            row.end = dereference_slot(slots, annotation, "TIME_SLOT_REF2");
            row.duration = row.end - row.start;
            row.text = annotation.child("ANNOTATION_VALUE").text().as_string();

            if (row.start < 0 || row.end <= row.start) {
                throw FormatError(
                    "Annotation " + row.id + " has an invalid interval " + std::to_string(row.start) + "-" +
                    std::to_string(row.end)
                );
            }
            rows.push_back(std::move(row));
        }
    }

    return rows;
}

std::vector<std::string> read_reference_annotation_ids(const pugi::xml_node& root) {
    std::vector<std::string> ids;
    for (const auto& tier : root.children("TIER")) {
        for (const auto& wrapper : tier.children("ANNOTATION")) {
            if (const auto annotation = wrapper.child("REF_ANNOTATION")) {
                ids.push_back(required_attribute(annotation, "ANNOTATION_ID"));
            }
        }
    }
    return ids;
}

std::optional<std::filesystem::path> read_audio_path(const pugi::xml_node& root) {
    for (const auto& descriptor : root.child("HEADER").children("MEDIA_DESCRIPTOR")) {
        const auto url = descriptor.attribute("MEDIA_URL");
        if (descriptor.attribute("MIME_TYPE") && url && url.value()[0] != '\0') {
            return file_url_to_path(url.value());
        }
    }
    return std::nullopt;
}

}  // namespace elan_eaf
