#include <catch2/catch.hpp>

#include "errors.hpp"
#include "segmentations.hpp"
#include "test_helpers.hpp"

#include <set>

using namespace elan_eaf;

TEST_CASE("annotation ids round between numbers and the a<N> form") {
    REQUIRE(annotation_id(12) == "a12");
    REQUIRE(annotation_number("a12") == 12);
    REQUIRE_FALSE(annotation_number("a"));
    REQUIRE_FALSE(annotation_number("b3"));
    REQUIRE_FALSE(annotation_number("a3x"));
    REQUIRE_FALSE(annotation_number("a0"));
}

TEST_CASE("parse_milliseconds accepts integers in canonical form only") {
    REQUIRE(parse_milliseconds("1200") == 1200);
    REQUIRE(parse_milliseconds(" 35 ") == 35);
    REQUIRE(parse_milliseconds("1200.000") == 1200);
    REQUIRE_THROWS_AS(parse_milliseconds("1200.5"), InvalidArgument);
    REQUIRE_THROWS_AS(parse_milliseconds("twelve"), InvalidArgument);
    REQUIRE_THROWS_AS(parse_milliseconds(""), InvalidArgument);
}

TEST_CASE("add_segment allocates sequential ids with positive durations") {
    Segmentations store;
    std::set<std::string> ids;

    for (std::int64_t start : {0, 100, 250, 1000}) {
        const auto id = store.add_segment("A", start, start + 40, "x");
        REQUIRE(ids.insert(id).second);
        const auto row = store.get_segment(id);
        REQUIRE(row);
        REQUIRE(row->duration == 40);
    }

    REQUIRE(store.size() == 4);
    REQUIRE(store.segments().front().id == "a1");
    REQUIRE(store.segments().back().id == "a4");
    REQUIRE(store.next_id() == 5);
}

TEST_CASE("add_segment rejects empty and negative intervals") {
    Segmentations store;
    REQUIRE_THROWS_AS(store.add_segment("A", 5, 5, "x"), InvalidArgument);
    REQUIRE_THROWS_AS(store.add_segment("A", -1, 10, "x"), InvalidArgument);
    REQUIRE_THROWS_AS(store.add_segment("A", 10, 3, "x"), InvalidArgument);
    REQUIRE(store.empty());
    REQUIRE(store.next_id() == 1);
}

TEST_CASE("add_segment coerces string times") {
    Segmentations store;
    const auto id = store.add_segment("A", std::string("100"), std::string("250.0"), "x");
    REQUIRE(store.get_segment(id)->start == 100);
    REQUIRE(store.get_segment(id)->end == 250);
    REQUIRE_THROWS_AS(store.add_segment("A", std::string("soon"), std::string("250"), "x"), InvalidArgument);
}

TEST_CASE("constructing from recovered rows continues the id sequence") {
    std::vector<Segment> rows = {
        {"A", 0, 100, "one", "a3", 0},
        {"B", 50, 80, "two", "a17", 0},
        {"B", 90, 95, "three", "custom-id", 0},
    };
    Segmentations store(rows);

    REQUIRE(store.next_id() == 18);
    REQUIRE(store.get_segment("a3")->duration == 100);
    REQUIRE(store.add_segment("A", 200, 300, "") == "a18");
}

TEST_CASE("column data drops unknown columns and recomputes duration") {
    SegmentColumns columns = {
        {"TIER", {"A", "B"}},
        {"START", {"0", "150"}},
        {"END", {"100", "400"}},
        {"TEXT", {"hello", "world"}},
        {"ID", {"a1", "a2"}},
        {"DURATION", {"-100", "-250"}},
        {"SPEAKER_AGE", {"31"}},
    };
    Segmentations store(columns);

    REQUIRE(store.size() == 2);
    REQUIRE(store.get_segment("a1")->duration == 100);
    REQUIRE(store.get_segment("a2")->duration == 250);
    REQUIRE(store.next_id() == 3);
}

TEST_CASE("column data of the wrong shape is rejected") {
    const SegmentColumns missing_columns = {{"TIER", {"A"}}, {"START", {"0"}}};
    REQUIRE_THROWS_AS(Segmentations(missing_columns), InvalidArgument);

    const SegmentColumns ragged = {{"TIER", {"A", "B"}}, {"START", {"0"}}, {"END", {"10"}}, {"ID", {"a1"}}};
    REQUIRE_THROWS_AS(Segmentations(ragged), InvalidArgument);

    const SegmentColumns empty_interval = {{"TIER", {"A"}}, {"START", {"10"}}, {"END", {"10"}}, {"ID", {"a1"}}};
    REQUIRE_THROWS_AS(Segmentations(empty_interval), InvalidArgument);
}

TEST_CASE("get_segment returns an isolated copy or nothing") {
    Segmentations store;
    store.add_segment("A", 0, 100, "hello");

    auto copy = store.get_segment("a1");
    REQUIRE(copy);
    copy->text = "changed";
    REQUIRE(store.get_segment("a1")->text == "hello");

    REQUIRE(store.get_segment(1)->text == "hello");
    REQUIRE_FALSE(store.get_segment("a9"));
    REQUIRE(store.find_segment("a9") == nullptr);

    const auto tuple = store.get_segment_tuple("a1");
    REQUIRE(tuple);
    REQUIRE(*tuple == SegmentTuple{"A", 0, 100, "hello", "a1", 100});
}

TEST_CASE("remove_segment removes one row and detects duplicate ids") {
    Segmentations store;
    store.add_segment("A", 0, 100, "one");
    store.add_segment("A", 100, 200, "two");

    REQUIRE(store.remove_segment("a1"));
    REQUIRE_FALSE(store.remove_segment("a1"));
    REQUIRE(store.size() == 1);

    Segmentations corrupted(std::vector<Segment>{
        {"A", 0, 10, "x", "a1", 0},
        {"B", 0, 10, "y", "a1", 0},
    });
    REQUIRE_THROWS_AS(corrupted.remove_segment("a1"), Corruption);
    REQUIRE(corrupted.size() == 2);
}

TEST_CASE("split_segment replaces a segment with two abutting halves") {
    Segmentations store;
    store.add_segment("A", 100, 500, "text");

    const auto [left, right] = store.split_segment("a1", 300);
    REQUIRE_FALSE(store.get_segment("a1"));
    REQUIRE(store.size() == 2);

    const auto first = store.get_segment(left);
    const auto second = store.get_segment(right);
    REQUIRE(first->start == 100);
    REQUIRE(first->end == 300);
    REQUIRE(second->start == 300);
    REQUIRE(second->end == 500);
    REQUIRE(first->text == "text");
    REQUIRE(second->text == "text");
}

TEST_CASE("split_segment_at_fraction splits at a relative position") {
    Segmentations store;
    store.add_segment("A", 1000, 2000, "text");

    const auto [left, right] = store.split_segment_at_fraction("a1", 0.25);
    REQUIRE(store.get_segment(left)->end == 1250);
    REQUIRE(store.get_segment(right)->start == 1250);
}

TEST_CASE("split_segment rejects points outside the interval and unknown ids") {
    Segmentations store;
    store.add_segment("A", 100, 500, "text");

    REQUIRE_THROWS_AS(store.split_segment("a1", 50), InvalidArgument);
    REQUIRE_THROWS_AS(store.split_segment("a1", 600), InvalidArgument);
    REQUIRE_THROWS_AS(store.split_segment("a1", 100), InvalidArgument);
    REQUIRE_THROWS_AS(store.split_segment_at_fraction("a1", 1.5), InvalidArgument);
    REQUIRE_THROWS_AS(store.split_segment("a7", 200), NotFound);
    REQUIRE(store.size() == 1);
}

TEST_CASE("Segmentations::from_file resolves time slots") {
    const auto store = Segmentations::from_file(test::data_path("sample.eaf"));

    REQUIRE(store.size() == 4);
    REQUIRE(*store.get_segment_tuple("a1") == SegmentTuple{"default", 0, 1200, "Hello there", "a1", 1200});
    REQUIRE(*store.get_segment_tuple("a2") == SegmentTuple{"default", 1200, 2500, "general Kenobi", "a2", 1300});
    REQUIRE(*store.get_segment_tuple("a3") == SegmentTuple{"noise", 2500, 4000, "", "a3", 1500});
    REQUIRE(*store.get_segment_tuple("a4") == SegmentTuple{"child", 400, 900, "Hello", "a4", 500});
    REQUIRE(store.next_id() == 5);
}

TEST_CASE("Segmentations::from_file surfaces read and format errors") {
    REQUIRE_THROWS_AS(Segmentations::from_file(test::data_path("does_not_exist.eaf")), IoError);
    REQUIRE_THROWS_AS(Segmentations::from_file(test::data_path("missing_slot.eaf")), FormatError);
}
