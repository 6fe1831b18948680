#include <catch2/catch.hpp>

#include "errors.hpp"
#include "tier_type.hpp"

#include <cstring>

using namespace elan_eaf;

namespace {

pugi::xml_node append_type_tag(pugi::xml_document& doc, const char* id, const char* constraints) {
    auto tag = doc.append_child("LINGUISTIC_TYPE");
    tag.append_attribute("LINGUISTIC_TYPE_ID") = id;
    if (constraints != nullptr) {
        tag.append_attribute("CONSTRAINTS") = constraints;
    }
    return tag;
}

}  // namespace

TEST_CASE("TierType defaults to the unconstrained default-lt type") {
    TierType tt;
    REQUIRE(tt.name() == "default-lt");
    REQUIRE(tt.stereotype() == Stereotype::None);
    REQUIRE(tt.time_alignable());
}

TEST_CASE("TierType accepts every stereotype name and rejects others") {
    for (const char* name : {"None", "Time_Subdivision", "Symbolic_Subdivision", "Symbolic_Association", "Included_In"}) {
        TierType tt("new-type", std::string(name));
        REQUIRE(std::strcmp(to_string(tt.stereotype()), name) == 0);
    }

    REQUIRE_THROWS_AS(TierType("new-type", std::string("NONE")), InvalidArgument);
    REQUIRE_THROWS_AS(TierType("new-type", std::string("Time Subdivision")), InvalidArgument);
    REQUIRE_THROWS_AS(TierType("new-type", static_cast<Stereotype>(42)), InvalidArgument);
    REQUIRE_THROWS_AS(TierType("", Stereotype::None), InvalidArgument);
}

TEST_CASE("TierType::from_tag reads id and optional constraint") {
    pugi::xml_document doc;

    const auto plain = TierType::from_tag(append_type_tag(doc, "default-lt", nullptr));
    REQUIRE(plain.name() == "default-lt");
    REQUIRE(plain.stereotype() == Stereotype::None);

    const auto words = TierType::from_tag(append_type_tag(doc, "words", "Symbolic_Association"));
    REQUIRE(words.stereotype() == Stereotype::SymbolicAssociation);
}

TEST_CASE("TierType::from_tag rejects tags of the wrong shape") {
    pugi::xml_document doc;
    auto bad = doc.append_child("bad");
    bad.append_attribute("bad_id") = "badbadbad";
    REQUIRE_THROWS_AS(TierType::from_tag(bad), FormatError);

    auto no_id = doc.append_child("LINGUISTIC_TYPE");
    REQUIRE_THROWS_AS(TierType::from_tag(no_id), FormatError);

    REQUIRE_THROWS_AS(TierType::from_tag(append_type_tag(doc, "odd", "Sideways")), FormatError);
}

TEST_CASE("TierType::to_tag derives TIME_ALIGNABLE and CONSTRAINTS from the stereotype") {
    struct Expected {
        Stereotype stereotype;
        const char* time_alignable;
        const char* constraints;
    };
    const Expected table[] = {
        {Stereotype::None, "true", nullptr},
        {Stereotype::TimeSubdivision, "true", "Time_Subdivision"},
        {Stereotype::SymbolicSubdivision, "false", "Symbolic_Subdivision"},
        {Stereotype::SymbolicAssociation, "false", "Symbolic_Association"},
        {Stereotype::IncludedIn, "false", "Included_In"},
    };

    for (const auto& row : table) {
        pugi::xml_document doc;
        const auto tag = TierType("tt", row.stereotype).to_tag(doc);

        REQUIRE(std::strcmp(tag.name(), "LINGUISTIC_TYPE") == 0);
        REQUIRE(std::string(tag.attribute("LINGUISTIC_TYPE_ID").value()) == "tt");
        REQUIRE(std::string(tag.attribute("GRAPHIC_REFERENCES").value()) == "false");
        REQUIRE(std::string(tag.attribute("TIME_ALIGNABLE").value()) == row.time_alignable);
        if (row.constraints == nullptr) {
            REQUIRE_FALSE(tag.attribute("CONSTRAINTS"));
        } else {
            REQUIRE(std::string(tag.attribute("CONSTRAINTS").value()) == row.constraints);
        }
    }
}

TEST_CASE("TierType equality is by name") {
    REQUIRE(TierType("a", Stereotype::None) == TierType("a", Stereotype::IncludedIn));
    REQUIRE_FALSE(TierType("a", Stereotype::None) == TierType("b", Stereotype::None));
}
