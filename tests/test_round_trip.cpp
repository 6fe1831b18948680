#include <catch2/catch.hpp>

#include "document.hpp"
#include "eaf_reader.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <map>

using namespace elan_eaf;

namespace {

std::vector<Segment> sorted_rows(const Document& doc) {
    auto rows = doc.segments();
    std::sort(rows.begin(), rows.end(), [](const Segment& a, const Segment& b) { return a.id < b.id; });
    return rows;
}

std::map<std::string, std::string> parent_links(const Document& doc) {
    std::map<std::string, std::string> links;
    for (const auto& [name, subtier] : doc.subtiers()) {
        links[name] = subtier.parent_name();
    }
    return links;
}

void require_same_model(const Document& a, const Document& b) {
    REQUIRE(a.tier_names() == b.tier_names());
    REQUIRE(parent_links(a) == parent_links(b));
    REQUIRE(sorted_rows(a) == sorted_rows(b));
    REQUIRE(a.audio_path() == b.audio_path());

    for (const auto& [name, tier] : a.tiers()) {
        const Tier* other = b.find_tier(name);
        REQUIRE(other != nullptr);
        REQUIRE(other->participant() == tier.participant());
        REQUIRE(other->annotator() == tier.annotator());
        REQUIRE(other->tier_type().name() == tier.tier_type().name());
        REQUIRE(other->tier_type().stereotype() == tier.tier_type().stereotype());
    }
}

}  // namespace

TEST_CASE("a parsed file survives save and re-parse") {
    auto original = Document::from_file(test::data_path("sample.eaf"));
    const auto out = test::scratch_dir("round_trip_sample") / "sample.eaf";

    original.save_as(out);
    REQUIRE_FALSE(original.modified());

    const auto reparsed = Document::from_file(out);
    require_same_model(original, reparsed);
}

TEST_CASE("an edited document survives save and re-parse") {
    auto doc = Document::create_eaf("unused.eaf", std::filesystem::path("/tmp/rec.wav"), {"A", "B"});
    doc.add_segment("A", 0, 1000, "first");
    doc.add_segment("A", 1000, 2000, "second");
    doc.add_segment("B", 500, 1500, "overlap & <markup>");
    doc.add_segment("C", 3000, 3500, "");
    doc.set_participant("B", "Ben");
    doc.split_segment("a2", 1500);

    const auto out = test::scratch_dir("round_trip_edited") / "edited.eaf";
    doc.save_as(out);

    const auto reparsed = Document::from_file(out);
    require_same_model(doc, reparsed);
    REQUIRE(reparsed.get_segment("a3") == std::optional<std::string>("overlap & <markup>"));
}

TEST_CASE("nested subtiers keep their parents through a round trip") {
    auto doc = Document::from_file(test::data_path("nested.eaf"));
    const auto out = test::scratch_dir("round_trip_nested") / "nested.eaf";
    doc.save_as(out);

    const auto reparsed = Document::from_file(out);
    require_same_model(doc, reparsed);
    REQUIRE(reparsed.subtiers().at("phones").tier_type().stereotype() == Stereotype::SymbolicSubdivision);
}

TEST_CASE("serialized time slots are shared and deterministic") {
    auto doc = Document::create("slots.eaf");
    doc.add_segment("default", 0, 100, "a");
    doc.add_segment("default", 100, 250, "b");
    doc.add_segment("other", 100, 250, "c");

    const std::string xml = doc.to_string();
    REQUIRE(xml == doc.to_string());

    pugi::xml_document tree;
    load_eaf_string(xml, tree);
    const auto root = tree.document_element();

    std::vector<std::pair<std::string, std::string>> slots;
    for (const auto& slot : root.child("TIME_ORDER").children("TIME_SLOT")) {
        slots.emplace_back(slot.attribute("TIME_SLOT_ID").value(), slot.attribute("TIME_VALUE").value());
    }
    const std::vector<std::pair<std::string, std::string>> expected = {
        {"ts1", "0"}, {"ts2", "100"}, {"ts3", "250"}
    };
    REQUIRE(slots == expected);

    REQUIRE(std::string(root.child("HEADER").find_child_by_attribute("PROPERTY", "NAME", "lastUsedAnnotationId")
        .text().as_string()) == "3");
    REQUIRE_FALSE(root.find_child_by_attribute("CONSTRAINT", "STEREOTYPE", "Included_In").empty());
    REQUIRE(xml.find("<?xml version=\"1.0\" encoding=\"UTF-8\"?>") == 0);
}

TEST_CASE("segments on removed tiers are not written") {
    auto doc = Document::create("orphans.eaf");
    doc.add_segment("gone", 0, 100, "orphan");
    doc.add_segment("default", 0, 100, "kept");
    doc.remove_tiers({"gone"});

    pugi::xml_document tree;
    load_eaf_string(doc.to_string(), tree);
    const auto rows = read_segment_rows(tree.document_element());
    REQUIRE(rows.size() == 1);
    REQUIRE(rows.front().text == "kept");
}

TEST_CASE("symbolic annotations and unused tier types survive a save") {
    const auto original = Document::from_file(test::data_path("symbolic.eaf"));
    REQUIRE(original.tier_types().contains("morphemes"));

    auto doc = Document::from_file(test::data_path("symbolic.eaf"));
    const auto out = test::scratch_dir("round_trip_symbolic") / "symbolic.eaf";
    doc.save_as(out);

    pugi::xml_document tree;
    load_eaf_tree(out, tree);
    const auto root = tree.document_element();

    REQUIRE(read_reference_annotation_ids(root) == std::vector<std::string>{"a3", "a4"});
    const auto greeting = root.find_child_by_attribute("TIER", "TIER_ID", "gloss")
        .child("ANNOTATION").child("REF_ANNOTATION");
    REQUIRE(std::string(greeting.attribute("ANNOTATION_REF").value()) == "a1");
    REQUIRE(std::string(greeting.child("ANNOTATION_VALUE").text().as_string()) == "greeting");
    REQUIRE_FALSE(root.find_child_by_attribute("LINGUISTIC_TYPE", "LINGUISTIC_TYPE_ID", "morphemes").empty());

    const auto reparsed = Document::from_file(out);
    require_same_model(original, reparsed);
    REQUIRE(reparsed.tier_types().size() == 3);
}

TEST_CASE("reference annotations are dropped with the annotation they refer to") {
    auto doc = Document::from_file(test::data_path("symbolic.eaf"));
    REQUIRE(doc.remove_segment("a1"));

    pugi::xml_document tree;
    load_eaf_string(doc.to_string(), tree);
    const auto root = tree.document_element();

    REQUIRE(read_reference_annotation_ids(root) == std::vector<std::string>{"a4"});
    REQUIRE(std::string(root.child("HEADER").find_child_by_attribute("PROPERTY", "NAME", "lastUsedAnnotationId")
        .text().as_string()) == "4");
}

TEST_CASE("new segments never reuse reference annotation ids") {
    auto doc = Document::from_file(test::data_path("symbolic.eaf"));
    REQUIRE(doc.add_segment("words", 900, 1200, "again") == "a5");
}
