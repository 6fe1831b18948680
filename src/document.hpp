#pragma once

#include "eaf_reader.hpp"
#include "segmentations.hpp"
#include "tier.hpp"
#include "tier_type.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <pugixml.hpp>

namespace elan_eaf {

// One annotation file plus its audio reference. Owns every TierType, Tier and Subtier;
// subtiers refer to their parent by name and are resolved through parent_of().
class Document {
public:
    static Document create(const std::filesystem::path& file);
    static Document create_eaf(
        const std::filesystem::path& file,
        const std::optional<std::filesystem::path>& audio,
        const std::vector<std::string>& tiers,
        bool remove_default = false
    );
    static Document from_file(const std::filesystem::path& file);
    // Flat tiers only: every row's tier becomes a default-typed root tier.
    static Document from_table(
        const std::vector<Segment>& rows,
        const std::filesystem::path& file,
        const std::optional<std::filesystem::path>& audio = std::nullopt
    );

    Document(Document&&) = default;
    Document& operator=(Document&&) = default;

    const std::filesystem::path& file() const { return file_; }
    const std::optional<std::filesystem::path>& audio_path() const { return audio_; }
    bool modified() const { return modified_; }

    const std::set<std::string>& tier_names() const { return names_; }
    const std::map<std::string, Tier>& tiers() const { return index_.tiers; }
    const std::map<std::string, Subtier>& subtiers() const { return index_.subtiers; }
    const std::map<std::string, std::shared_ptr<const TierType>>& tier_types() const { return index_.tier_types; }
    const Tier* find_tier(const std::string& name) const;
    const Tier* parent_of(const Subtier& subtier) const;
    bool contains(const std::string& name) const { return names_.contains(name); }

    const Segmentations& segmentations() const { return segmentations_; }
    const std::vector<Segment>& segments() const { return segmentations_.segments(); }
    std::size_t size() const { return segmentations_.size(); }
    std::optional<std::string> get_segment(const std::string& id) const;
    std::optional<std::string> get_segment(std::int64_t id) const;

    void add_tier(const std::string& name);
    void add_tiers(const std::vector<std::string>& names);
    // Subtiers below a removed tier go with it; segments stay in the store.
    void remove_tiers(const std::vector<std::string>& names);
    void set_participant(const std::string& tier, const std::string& participant);
    void set_annotator(const std::string& tier, const std::string& annotator);

    std::string add_segment(const std::string& tier, std::int64_t start, std::int64_t end, const std::string& text);
    std::string add_segment(const std::string& tier, const std::string& start, const std::string& end, const std::string& text);
    bool remove_segment(const std::string& id);
    std::pair<std::string, std::string> split_segment(const std::string& id, std::int64_t split_ms);
    std::pair<std::string, std::string> split_segment_at_fraction(const std::string& id, double fraction);

    void add_audio(const std::filesystem::path& audio);

    // Both throw AlreadyExists if the target exists and overwrite_existing is false.
    // save_as retargets file() only once the write has succeeded.
    void save(bool overwrite_existing = false);
    void save_as(const std::filesystem::path& file, bool overwrite_existing = false);
    std::string to_string() const;

private:
    Document(std::filesystem::path file, std::unique_ptr<pugi::xml_document> tree);

    Tier* find_mutable_tier(const std::string& name);
    std::shared_ptr<const TierType> default_tier_type();
    bool erase_tier_with_descendants(const std::string& name);
    void write_to(const std::filesystem::path& file, bool overwrite_existing);
    void rebuild_names();

    std::filesystem::path file_;
    std::unique_ptr<pugi::xml_document> tree_;
    TierIndex index_;
    std::set<std::string> names_;
    Segmentations segmentations_;
    std::optional<std::filesystem::path> audio_;
    bool modified_ = false;
};

}  // namespace elan_eaf
