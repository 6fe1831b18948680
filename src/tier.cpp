#include "tier.hpp"

#include "errors.hpp"
#include "version.hpp"

#include <cstring>
#include <utility>

namespace elan_eaf {

namespace {

void require_tier_tag(const pugi::xml_node& tag) {
    if (!tag || tag.type() != pugi::node_element || std::strcmp(tag.name(), "TIER") != 0) {
        throw FormatError(std::string("Expected a TIER tag, got: ") + tag.name());
    }
    const auto id = tag.attribute("TIER_ID");
    if (!id || id.value()[0] == '\0') {
        throw FormatError("TIER tag has no TIER_ID");
    }
}

}  // namespace

Tier::Tier() : name_(kDefaultTierName), tier_type_(std::make_shared<const TierType>()) {}

Tier::Tier(std::string name, std::string participant, std::string annotator, std::shared_ptr<const TierType> tier_type)
    : name_(std::move(name)),
      participant_(std::move(participant)),
      annotator_(std::move(annotator)),
      tier_type_(std::move(tier_type)) {
    if (name_.empty()) {
        throw InvalidArgument("Tier name must not be empty");
    }
    if (!tier_type_) {
        throw InvalidArgument("Tier " + name_ + " has no tier type");
    }
}

Tier Tier::from_tag(const pugi::xml_node& tag, std::shared_ptr<const TierType> tier_type) {
    require_tier_tag(tag);
    if (tag.attribute("PARENT_REF")) {
        throw WrongVariant(std::string("TIER ") + tag.attribute("TIER_ID").value() + " has a PARENT_REF; build it as a Subtier");
    }

    Tier tier(tag.attribute("TIER_ID").value(), {}, {}, std::move(tier_type));
    read_metadata(tag, tier);
    return tier;
}

void Tier::read_metadata(const pugi::xml_node& tag, Tier& tier) {
    if (const auto attr = tag.attribute("PARTICIPANT")) {
        tier.participant_ = attr.value();
    }
    if (const auto attr = tag.attribute("ANNOTATOR")) {
        tier.annotator_ = attr.value();
    }
}

pugi::xml_node Tier::to_tag(pugi::xml_node parent) const {
    auto element = parent.append_child("TIER");
    element.append_attribute("LINGUISTIC_TYPE_REF") = tier_type_->name().c_str();
    element.append_attribute("TIER_ID") = name_.c_str();

    if (!participant_.empty()) {
        element.append_attribute("PARTICIPANT") = participant_.c_str();
    }
    if (!annotator_.empty()) {
        element.append_attribute("ANNOTATOR") = annotator_.c_str();
    }

    return element;
}

Subtier::Subtier(
    std::string name,
    std::string participant,
    std::string annotator,
    std::shared_ptr<const TierType> tier_type,
    const Tier& parent
)
    : Tier(std::move(name), std::move(participant), std::move(annotator), std::move(tier_type)),
      parent_name_(parent.name()) {
    if (parent_name_ == name_) {
        throw InvalidArgument("Tier " + name_ + " cannot be its own parent");
    }
}

Subtier Subtier::from_tag(const pugi::xml_node& tag, std::shared_ptr<const TierType> tier_type, const Tier& parent) {
    require_tier_tag(tag);
    const auto parent_ref = tag.attribute("PARENT_REF");
    if (!parent_ref) {
        throw WrongVariant(std::string("TIER ") + tag.attribute("TIER_ID").value() + " has no PARENT_REF; build it as a Tier");
    }
    if (parent.name() != parent_ref.value()) {
        throw FormatError(
            std::string("TIER ") + tag.attribute("TIER_ID").value() + " refers to parent " + parent_ref.value() +
            " but was given " + parent.name()
        );
    }

    Subtier subtier(tag.attribute("TIER_ID").value(), {}, {}, std::move(tier_type), parent);
    read_metadata(tag, subtier);
    return subtier;
}

pugi::xml_node Subtier::to_tag(pugi::xml_node parent) const {
    auto element = Tier::to_tag(parent);
    element.append_attribute("PARENT_REF") = parent_name_.c_str();
    return element;
}

}  // namespace elan_eaf
