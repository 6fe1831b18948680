#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace elan_eaf {

struct Segment {
    std::string tier;
    std::int64_t start = 0;
    std::int64_t end = 0;
    std::string text;
    std::string id;
    std::int64_t duration = 0;

    bool operator==(const Segment& other) const = default;
};

// (tier, start, end, text, id, duration)
using SegmentTuple = std::tuple<std::string, std::int64_t, std::int64_t, std::string, std::string, std::int64_t>;

SegmentTuple as_tuple(const Segment& segment);

// Column name -> raw cell values. Recognised columns: TIER, START, END, TEXT, ID, DURATION.
using SegmentColumns = std::map<std::string, std::vector<std::string>>;

// Canonical "a<N>" annotation id.
std::string annotation_id(std::int64_t number);
// Numeric suffix of an "a<N>" id, or nullopt for ids of any other shape.
std::optional<std::int64_t> annotation_number(const std::string& id);

// Parses a millisecond value written as an integer (optionally as "12.0"); throws InvalidArgument.
std::int64_t parse_milliseconds(const std::string& value);

// The annotation table. Owns the id allocation policy; never checks that tiers exist.
class Segmentations {
public:
    Segmentations() = default;
    explicit Segmentations(std::vector<Segment> rows);
    explicit Segmentations(const SegmentColumns& columns);

    static Segmentations from_file(const std::filesystem::path& path);

    const std::vector<Segment>& segments() const { return rows_; }
    std::size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }
    std::int64_t next_id() const { return next_id_; }
    // Keeps an id used outside the table from being allocated again.
    void reserve_id(const std::string& id);

    // Returned row aliases the store and is invalidated by the next mutation.
    const Segment* find_segment(const std::string& id) const;
    std::optional<Segment> get_segment(const std::string& id) const;
    std::optional<Segment> get_segment(std::int64_t id) const;
    std::optional<SegmentTuple> get_segment_tuple(const std::string& id) const;

    std::vector<Segment> segments_for_tier(const std::string& tier) const;

    std::string add_segment(const std::string& tier, std::int64_t start, std::int64_t end, const std::string& text);
    std::string add_segment(const std::string& tier, const std::string& start, const std::string& end, const std::string& text);

    // Returns true when a row was removed. Throws Corruption if the id is not unique.
    bool remove_segment(const std::string& id);

    // Replaces the segment with two abutting halves carrying the same text; returns their ids.
    std::pair<std::string, std::string> split_segment(const std::string& id, std::int64_t split_ms);
    std::pair<std::string, std::string> split_segment_at_fraction(const std::string& id, double fraction);

private:
    void validate_rows() const;
    void recompute_next_id();

    std::vector<Segment> rows_;
    std::int64_t next_id_ = 1;
};

}  // namespace elan_eaf
