#include "tier_type.hpp"

#include "errors.hpp"
#include "version.hpp"

#include <cstring>
#include <utility>

namespace elan_eaf {

namespace {

struct StereotypeName {
    Stereotype stereotype;
    const char* name;
};

constexpr StereotypeName kStereotypeNames[] = {
    {Stereotype::None, "None"},
    {Stereotype::TimeSubdivision, "Time_Subdivision"},
    {Stereotype::SymbolicSubdivision, "Symbolic_Subdivision"},
    {Stereotype::SymbolicAssociation, "Symbolic_Association"},
    {Stereotype::IncludedIn, "Included_In"},
};

std::string validated_name(std::string name) {
    if (name.empty()) {
        throw InvalidArgument("Tier type name must not be empty");
    }
    return name;
}

}  // namespace

const char* to_string(Stereotype stereotype) {
    for (const auto& entry : kStereotypeNames) {
        if (entry.stereotype == stereotype) {
            return entry.name;
        }
    }
    throw InvalidArgument("Unknown stereotype value");
}

Stereotype stereotype_from_string(const std::string& value) {
    for (const auto& entry : kStereotypeNames) {
        if (value == entry.name) {
            return entry.stereotype;
        }
    }
    throw InvalidArgument("Unknown stereotype: " + value);
}

TierType::TierType() : name_(kDefaultTierTypeName) {}

TierType::TierType(std::string name, Stereotype stereotype)
    : name_(validated_name(std::move(name))), stereotype_(stereotype) {
    // Rejects values cast in from outside the enumerators.
    to_string(stereotype_);
}

TierType::TierType(std::string name, const std::string& stereotype)
    : TierType(std::move(name), stereotype_from_string(stereotype)) {}

TierType TierType::from_tag(const pugi::xml_node& tag) {
    if (!tag || tag.type() != pugi::node_element || std::strcmp(tag.name(), "LINGUISTIC_TYPE") != 0) {
        throw FormatError(std::string("Expected a LINGUISTIC_TYPE tag, got: ") + tag.name());
    }

    const auto id = tag.attribute("LINGUISTIC_TYPE_ID");
    if (!id || id.value()[0] == '\0') {
        throw FormatError("LINGUISTIC_TYPE tag has no LINGUISTIC_TYPE_ID");
    }

    const auto constraints = tag.attribute("CONSTRAINTS");
    if (!constraints) {
        return TierType(id.value(), Stereotype::None);
    }

    try {
        return TierType(id.value(), std::string(constraints.value()));
    } catch (const InvalidArgument& ex) {
        throw FormatError(std::string("LINGUISTIC_TYPE ") + id.value() + ": " + ex.what());
    }
}

bool TierType::time_alignable() const {
    return stereotype_ == Stereotype::None || stereotype_ == Stereotype::TimeSubdivision;
}

pugi::xml_node TierType::to_tag(pugi::xml_node parent) const {
    auto element = parent.append_child("LINGUISTIC_TYPE");
    element.append_attribute("GRAPHIC_REFERENCES") = "false";
    element.append_attribute("LINGUISTIC_TYPE_ID") = name_.c_str();
    element.append_attribute("TIME_ALIGNABLE") = time_alignable() ? "true" : "false";

    if (stereotype_ != Stereotype::None) {
        element.append_attribute("CONSTRAINTS") = to_string(stereotype_);
    }

    return element;
}

}  // namespace elan_eaf
