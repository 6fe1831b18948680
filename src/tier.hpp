#pragma once

#include "tier_type.hpp"

#include <memory>
#include <string>
#include <utility>

#include <pugixml.hpp>

namespace elan_eaf {

// A TIER without PARENT_REF. Tiers share their TierType with every other tier of that type.
class Tier {
public:
    Tier();
    Tier(std::string name, std::string participant, std::string annotator, std::shared_ptr<const TierType> tier_type);
    virtual ~Tier() = default;

    Tier(const Tier&) = default;
    Tier& operator=(const Tier&) = default;
    Tier(Tier&&) = default;
    Tier& operator=(Tier&&) = default;

    static Tier from_tag(const pugi::xml_node& tag, std::shared_ptr<const TierType> tier_type);

    const std::string& name() const { return name_; }
    const std::string& participant() const { return participant_; }
    const std::string& annotator() const { return annotator_; }
    const TierType& tier_type() const { return *tier_type_; }
    const std::shared_ptr<const TierType>& shared_tier_type() const { return tier_type_; }

    void set_participant(std::string participant) { participant_ = std::move(participant); }
    void set_annotator(std::string annotator) { annotator_ = std::move(annotator); }

    // Appends a TIER element to `parent`. Empty participant/annotator are omitted, not written empty.
    virtual pugi::xml_node to_tag(pugi::xml_node parent) const;

protected:
    static void read_metadata(const pugi::xml_node& tag, Tier& tier);

    std::string name_;
    std::string participant_;
    std::string annotator_;
    std::shared_ptr<const TierType> tier_type_;
};

// A TIER with PARENT_REF. The parent is held by name; the owning Document resolves it.
class Subtier final : public Tier {
public:
    Subtier(
        std::string name,
        std::string participant,
        std::string annotator,
        std::shared_ptr<const TierType> tier_type,
        const Tier& parent
    );

    // The parent cannot be rebuilt from the tag: its type lives in another element.
    static Subtier from_tag(const pugi::xml_node& tag, std::shared_ptr<const TierType> tier_type, const Tier& parent);

    const std::string& parent_name() const { return parent_name_; }

    pugi::xml_node to_tag(pugi::xml_node parent) const override;

private:
    std::string parent_name_;
};

}  // namespace elan_eaf
