#pragma once

#include <string>

#include <pugixml.hpp>

namespace elan_eaf {

enum class Stereotype {
    None,
    TimeSubdivision,
    SymbolicSubdivision,
    SymbolicAssociation,
    IncludedIn
};

// Names as they appear in the CONSTRAINTS attribute ("None" for the unconstrained type).
const char* to_string(Stereotype stereotype);
Stereotype stereotype_from_string(const std::string& value);

// A LINGUISTIC_TYPE declaration. Immutable once built; edits replace the object.
class TierType {
public:
    TierType();
    TierType(std::string name, Stereotype stereotype);
    TierType(std::string name, const std::string& stereotype);

    static TierType from_tag(const pugi::xml_node& tag);

    const std::string& name() const { return name_; }
    Stereotype stereotype() const { return stereotype_; }
    bool time_alignable() const;

    // Appends a LINGUISTIC_TYPE element to `parent` and returns it.
    pugi::xml_node to_tag(pugi::xml_node parent) const;

    bool operator==(const TierType& other) const { return name_ == other.name_; }

private:
    std::string name_;
    Stereotype stereotype_ = Stereotype::None;
};

}  // namespace elan_eaf
