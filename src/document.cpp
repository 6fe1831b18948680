#include "document.hpp"

#include "eaf_writer.hpp"
#include "errors.hpp"
#include "media_url.hpp"
#include "version.hpp"

#include <algorithm>
#include <system_error>

namespace elan_eaf {

namespace {

constexpr const char* kMinimumEaf = R"(<?xml version="1.0" encoding="UTF-8"?>
<ANNOTATION_DOCUMENT AUTHOR="" DATE="" FORMAT="3.0" VERSION="3.0"
    xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance"
    xsi:noNamespaceSchemaLocation="http://www.mpi.nl/tools/elan/EAFv3.0.xsd">
    <HEADER MEDIA_FILE="" TIME_UNITS="milliseconds"/>
    <TIME_ORDER/>
    <TIER LINGUISTIC_TYPE_REF="default-lt" TIER_ID="default"/>
    <LINGUISTIC_TYPE GRAPHIC_REFERENCES="false" LINGUISTIC_TYPE_ID="default-lt" TIME_ALIGNABLE="true"/>
    <CONSTRAINT DESCRIPTION="Time subdivision of parent annotation's time interval, no time gaps allowed within this interval" STEREOTYPE="Time_Subdivision"/>
    <CONSTRAINT DESCRIPTION="Symbolic subdivision of a parent annotation. Annotations refering to the same parent are ordered" STEREOTYPE="Symbolic_Subdivision"/>
    <CONSTRAINT DESCRIPTION="1-1 association with a parent annotation" STEREOTYPE="Symbolic_Association"/>
    <CONSTRAINT DESCRIPTION="Time alignable annotations within the parent annotation's time interval, gaps are allowed" STEREOTYPE="Included_In"/>
</ANNOTATION_DOCUMENT>
)";

void require_path(const std::filesystem::path& file) {
    if (file.empty()) {
        throw InvalidArgument("No file given");
    }
}

}  // namespace

Document::Document(std::filesystem::path file, std::unique_ptr<pugi::xml_document> tree)
    : file_(std::move(file)), tree_(std::move(tree)) {}

Document Document::create(const std::filesystem::path& file) {
    require_path(file);

    auto tree = std::make_unique<pugi::xml_document>();
    load_eaf_string(kMinimumEaf, *tree);

    Document doc(file, std::move(tree));
    doc.index_ = extract_tiers(doc.tree_->document_element());
    doc.rebuild_names();
    return doc;
}

Document Document::create_eaf(
    const std::filesystem::path& file,
    const std::optional<std::filesystem::path>& audio,
    const std::vector<std::string>& tiers,
    bool remove_default
) {
    Document doc = create(file);
    if (remove_default) {
        doc.remove_tiers({kDefaultTierName});
    }
    doc.add_tiers(tiers);
    if (audio) {
        doc.add_audio(*audio);
    }
    doc.modified_ = false;
    return doc;
}

Document Document::from_file(const std::filesystem::path& file) {
    require_path(file);

    auto tree = std::make_unique<pugi::xml_document>();
    load_eaf_tree(file, *tree);

    Document doc(file, std::move(tree));
    const auto root = doc.tree_->document_element();
    doc.index_ = extract_tiers(root);
    doc.rebuild_names();

    try {
        doc.segmentations_ = Segmentations(read_segment_rows(root));
    } catch (const InvalidArgument& ex) {
        throw FormatError(file.string() + ": " + ex.what());
    }
    for (const auto& id : read_reference_annotation_ids(root)) {
        doc.segmentations_.reserve_id(id);
    }

    doc.audio_ = read_audio_path(root);
    doc.modified_ = false;
    return doc;
}

Document Document::from_table(
    const std::vector<Segment>& rows,
    const std::filesystem::path& file,
    const std::optional<std::filesystem::path>& audio
) {
    Document doc = create(file);
    if (audio) {
        doc.add_audio(*audio);
    }

    const bool keeps_default = std::any_of(rows.begin(), rows.end(), [](const Segment& row) {
        return row.tier == kDefaultTierName;
    });
    if (!keeps_default) {
        doc.remove_tiers({kDefaultTierName});
    }

    for (const auto& row : rows) {
        doc.add_segment(row.tier, row.start, row.end, row.text);
    }

    doc.modified_ = false;
    return doc;
}

const Tier* Document::find_tier(const std::string& name) const {
    if (const auto it = index_.tiers.find(name); it != index_.tiers.end()) {
        return &it->second;
    }
    if (const auto it = index_.subtiers.find(name); it != index_.subtiers.end()) {
        return &it->second;
    }
    return nullptr;
}

Tier* Document::find_mutable_tier(const std::string& name) {
    return const_cast<Tier*>(static_cast<const Document&>(*this).find_tier(name));
}

const Tier* Document::parent_of(const Subtier& subtier) const {
    return find_tier(subtier.parent_name());
}

std::optional<std::string> Document::get_segment(const std::string& id) const {
    if (const auto* row = segmentations_.find_segment(id)) {
        return row->text;
    }
    return std::nullopt;
}

std::optional<std::string> Document::get_segment(std::int64_t id) const {
    return get_segment(annotation_id(id));
}

std::shared_ptr<const TierType> Document::default_tier_type() {
    auto& slot = index_.tier_types[kDefaultTierTypeName];
    if (!slot) {
        slot = std::make_shared<const TierType>();
    }
    return slot;
}

void Document::rebuild_names() {
    names_.clear();
    for (const auto& [name, tier] : index_.tiers) {
        names_.insert(name);
    }
    for (const auto& [name, subtier] : index_.subtiers) {
        names_.insert(name);
    }
}

void Document::add_tier(const std::string& name) {
    if (name.empty() || names_.contains(name)) {
        return;
    }

    index_.tiers.emplace(name, Tier(name, {}, {}, default_tier_type()));
    names_.insert(name);
    modified_ = true;
}

void Document::add_tiers(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        add_tier(name);
    }
}

bool Document::erase_tier_with_descendants(const std::string& name) {
    if (index_.tiers.erase(name) + index_.subtiers.erase(name) == 0) {
        return false;
    }

    bool erased = true;
    while (erased) {
        erased = false;
        for (auto it = index_.subtiers.begin(); it != index_.subtiers.end();) {
            if (find_tier(it->second.parent_name()) == nullptr) {
                it = index_.subtiers.erase(it);
                erased = true;
            } else {
                ++it;
            }
        }
    }
    return true;
}

void Document::remove_tiers(const std::vector<std::string>& names) {
    bool removed = false;
    for (const auto& name : names) {
        removed = erase_tier_with_descendants(name) || removed;
    }

    if (removed) {
        rebuild_names();
        modified_ = true;
    }
}

void Document::set_participant(const std::string& tier, const std::string& participant) {
    auto* target = find_mutable_tier(tier);
    if (target == nullptr || target->participant() == participant) {
        return;
    }
    target->set_participant(participant);
    modified_ = true;
}

void Document::set_annotator(const std::string& tier, const std::string& annotator) {
    auto* target = find_mutable_tier(tier);
    if (target == nullptr || target->annotator() == annotator) {
        return;
    }
    target->set_annotator(annotator);
    modified_ = true;
}

std::string Document::add_segment(
    const std::string& tier,
    std::int64_t start,
    std::int64_t end,
    const std::string& text
) {
    if (tier.empty()) {
        throw InvalidArgument("No tier given");
    }
    // Checked before the tier is created so bad input leaves no trace.
    if (start < 0 || end <= start) {
        throw InvalidArgument(
            "Start must be 0 or greater and less than end, got " + std::to_string(start) + "-" + std::to_string(end)
        );
    }

    add_tier(tier);
    const std::string id = segmentations_.add_segment(tier, start, end, text);
    modified_ = true;
    return id;
}

std::string Document::add_segment(
    const std::string& tier,
    const std::string& start,
    const std::string& end,
    const std::string& text
) {
    return add_segment(tier, parse_milliseconds(start), parse_milliseconds(end), text);
}

bool Document::remove_segment(const std::string& id) {
    if (!segmentations_.remove_segment(id)) {
        return false;
    }
    modified_ = true;
    return true;
}

std::pair<std::string, std::string> Document::split_segment(const std::string& id, std::int64_t split_ms) {
    auto ids = segmentations_.split_segment(id, split_ms);
    modified_ = true;
    return ids;
}

std::pair<std::string, std::string> Document::split_segment_at_fraction(const std::string& id, double fraction) {
    auto ids = segmentations_.split_segment_at_fraction(id, fraction);
    modified_ = true;
    return ids;
}

void Document::add_audio(const std::filesystem::path& audio) {
    if (audio.empty()) {
        return;
    }

    const auto absolute = std::filesystem::absolute(audio).lexically_normal();
    const std::string url = path_to_file_url(absolute);
    audio_ = absolute;

    auto root = tree_->document_element();
    auto header = root.child("HEADER");
    if (!header) {
        header = root.prepend_child("HEADER");
        header.append_attribute("TIME_UNITS") = "milliseconds";
    }

    if (auto old = header.child("MEDIA_DESCRIPTOR")) {
        if (url == old.attribute("MEDIA_URL").value()) {
            return;
        }
        header.remove_child(old);
    }

    auto descriptor = header.prepend_child("MEDIA_DESCRIPTOR");
    descriptor.append_attribute("MEDIA_URL") = url.c_str();
    descriptor.append_attribute("MIME_TYPE") = kAudioMimeType;

    modified_ = true;
}

void Document::write_to(const std::filesystem::path& file, bool overwrite_existing) {
    std::error_code ec;
    if (!overwrite_existing && std::filesystem::exists(file, ec)) {
        throw AlreadyExists(file.string() + " already exists; pass overwrite_existing to replace it");
    }

    auto out = std::make_unique<pugi::xml_document>();
    build_eaf_tree(*tree_, index_, segmentations_, *out);

    std::string error;
    if (!write_eaf_file(file, *out, error)) {
        throw IoError(error);
    }

    tree_ = std::move(out);
    modified_ = false;
}

void Document::save(bool overwrite_existing) {
    write_to(file_, overwrite_existing);
}

void Document::save_as(const std::filesystem::path& file, bool overwrite_existing) {
    require_path(file);
    write_to(file, overwrite_existing);
    file_ = file;
}

std::string Document::to_string() const {
    pugi::xml_document out;
    build_eaf_tree(*tree_, index_, segmentations_, out);
    return eaf_to_string(out);
}

}  // namespace elan_eaf
