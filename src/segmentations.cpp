#include "segmentations.hpp"

#include "eaf_reader.hpp"
#include "errors.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cmath>
#include <iterator>
#include <set>

namespace elan_eaf {

namespace {

const std::set<std::string> kColumns = {"TIER", "START", "END", "TEXT", "ID", "DURATION"};

std::string trim(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

const std::vector<std::string>& require_column(const SegmentColumns& columns, const std::string& name) {
    const auto it = columns.find(name);
    if (it == columns.end()) {
        throw InvalidArgument("Segment data is missing the " + name + " column");
    }
    return it->second;
}

void validate_interval(std::int64_t start, std::int64_t end) {
    if (start < 0) {
        throw InvalidArgument("Segment start must be 0 or greater, got " + std::to_string(start));
    }
    if (end <= start) {
        throw InvalidArgument(
            "Segment end must be greater than start, got " + std::to_string(start) + "-" + std::to_string(end)
        );
    }
}

}  // namespace

SegmentTuple as_tuple(const Segment& segment) {
    return {segment.tier, segment.start, segment.end, segment.text, segment.id, segment.duration};
}

std::string annotation_id(std::int64_t number) {
    return "a" + std::to_string(number);
}

std::optional<std::int64_t> annotation_number(const std::string& id) {
    if (id.size() < 2 || id.front() != 'a') {
        return std::nullopt;
    }
    std::int64_t number = 0;
    const char* first = id.data() + 1;
    const char* last = id.data() + id.size();
    const auto [ptr, ec] = std::from_chars(first, last, number);
    if (ec != std::errc() || ptr != last || number <= 0) {
        return std::nullopt;
    }
    return number;
}

std::int64_t parse_milliseconds(const std::string& value) {
    const std::string trimmed = trim(value);
    if (trimmed.empty()) {
        throw InvalidArgument("Empty millisecond value");
    }

    std::int64_t number = 0;
    const char* first = trimmed.data();
    const char* last = trimmed.data() + trimmed.size();
    const auto [ptr, ec] = std::from_chars(first, last, number);
    if (ec != std::errc()) {
        throw InvalidArgument("Invalid millisecond value: " + value);
    }

    // "1200.0" is accepted; "1200.5" is not.
    const char* rest = ptr;
    if (rest != last && *rest == '.') {
        ++rest;
        while (rest != last && *rest == '0') {
            ++rest;
        }
    }
    if (rest != last) {
        throw InvalidArgument("Invalid millisecond value: " + value);
    }

    return number;
}

Segmentations::Segmentations(std::vector<Segment> rows) : rows_(std::move(rows)) {
    for (auto& row : rows_) {
        row.duration = row.end - row.start;
    }
    validate_rows();
    recompute_next_id();
}

Segmentations::Segmentations(const SegmentColumns& columns) {
    const auto& tiers = require_column(columns, "TIER");
    for (const auto& [name, values] : columns) {
        // Unrecognised columns are dropped.
        if (kColumns.contains(name) && values.size() != tiers.size()) {
            throw InvalidArgument("Segment column " + name + " has a different length than TIER");
        }
    }

    const auto& starts = require_column(columns, "START");
    const auto& ends = require_column(columns, "END");
    const auto& ids = require_column(columns, "ID");
    const auto text_it = columns.find("TEXT");

    rows_.reserve(tiers.size());
    for (std::size_t i = 0; i < tiers.size(); ++i) {
        Segment row;
        row.tier = tiers[i];
        row.start = parse_milliseconds(starts[i]);
        row.end = parse_milliseconds(ends[i]);
        row.text = text_it != columns.end() ? text_it->second[i] : std::string();
        row.id = ids[i];
        row.duration = row.end - row.start;
        rows_.push_back(std::move(row));
    }

    validate_rows();
    recompute_next_id();
}

Segmentations Segmentations::from_file(const std::filesystem::path& path) {
    pugi::xml_document doc;
    load_eaf_tree(path, doc);
    return Segmentations(read_segment_rows(doc.document_element()));
}

void Segmentations::validate_rows() const {
    for (const auto& row : rows_) {
        if (row.tier.empty()) {
            throw InvalidArgument("Segment " + row.id + " has no tier");
        }
        if (row.id.empty()) {
            throw InvalidArgument("Segment on tier " + row.tier + " has no id");
        }
        validate_interval(row.start, row.end);
    }
}

void Segmentations::recompute_next_id() {
    std::int64_t highest = 0;
    for (const auto& row : rows_) {
        if (const auto number = annotation_number(row.id)) {
            highest = std::max(highest, *number);
        }
    }
    next_id_ = highest + 1;
}

void Segmentations::reserve_id(const std::string& id) {
    if (const auto number = annotation_number(id)) {
        next_id_ = std::max(next_id_, *number + 1);
    }
}

const Segment* Segmentations::find_segment(const std::string& id) const {
    const auto it = std::find_if(rows_.begin(), rows_.end(), [&](const Segment& row) { return row.id == id; });
    return it == rows_.end() ? nullptr : &*it;
}

std::optional<Segment> Segmentations::get_segment(const std::string& id) const {
    if (const auto* row = find_segment(id)) {
        return *row;
    }
    return std::nullopt;
}

std::optional<Segment> Segmentations::get_segment(std::int64_t id) const {
    return get_segment(annotation_id(id));
}

std::optional<SegmentTuple> Segmentations::get_segment_tuple(const std::string& id) const {
    if (const auto* row = find_segment(id)) {
        return as_tuple(*row);
    }
    return std::nullopt;
}

std::vector<Segment> Segmentations::segments_for_tier(const std::string& tier) const {
    std::vector<Segment> out;
    std::copy_if(rows_.begin(), rows_.end(), std::back_inserter(out), [&](const Segment& row) {
        return row.tier == tier;
    });
    return out;
}

std::string Segmentations::add_segment(
    const std::string& tier,
    std::int64_t start,
    std::int64_t end,
    const std::string& text
) {
    validate_interval(start, end);

    Segment row;
    row.tier = tier;
    row.start = start;
    row.end = end;
    row.text = text;
    row.id = annotation_id(next_id_);
    row.duration = end - start;

    rows_.push_back(row);
    ++next_id_;
    return row.id;
}

std::string Segmentations::add_segment(
    const std::string& tier,
    const std::string& start,
    const std::string& end,
    const std::string& text
) {
    return add_segment(tier, parse_milliseconds(start), parse_milliseconds(end), text);
}

bool Segmentations::remove_segment(const std::string& id) {
    const auto matches = std::count_if(rows_.begin(), rows_.end(), [&](const Segment& row) { return row.id == id; });
    if (matches > 1) {
        throw Corruption("Segment id " + id + " is shared by " + std::to_string(matches) + " rows");
    }
    if (matches == 0) {
        return false;
    }

    rows_.erase(std::find_if(rows_.begin(), rows_.end(), [&](const Segment& row) { return row.id == id; }));
    return true;
}

std::pair<std::string, std::string> Segmentations::split_segment(const std::string& id, std::int64_t split_ms) {
    const auto* found = find_segment(id);
    if (found == nullptr) {
        throw NotFound("No segment with id " + id);
    }
    const Segment original = *found;

    if (std::count_if(rows_.begin(), rows_.end(), [&](const Segment& row) { return row.id == id; }) > 1) {
        throw Corruption("Segment id " + id + " is shared by more than one row");
    }
    if (split_ms <= original.start || split_ms >= original.end) {
        throw InvalidArgument(
            "Split point " + std::to_string(split_ms) + " is outside segment " + id + " (" +
            std::to_string(original.start) + "-" + std::to_string(original.end) + ")"
        );
    }

    std::pair<std::string, std::string> ids;
    ids.first = add_segment(original.tier, original.start, split_ms, original.text);
    ids.second = add_segment(original.tier, split_ms, original.end, original.text);
    remove_segment(id);
    return ids;
}

std::pair<std::string, std::string> Segmentations::split_segment_at_fraction(const std::string& id, double fraction) {
    if (!(fraction >= 0.0 && fraction <= 1.0)) {
        throw InvalidArgument("Split fraction must be within [0, 1], got " + std::to_string(fraction));
    }

    const auto* found = find_segment(id);
    if (found == nullptr) {
        throw NotFound("No segment with id " + id);
    }

    const auto span = static_cast<double>(found->end - found->start);
    const auto split_ms = found->start + static_cast<std::int64_t>(std::llround(fraction * span));
    return split_segment(id, split_ms);
}

}  // namespace elan_eaf
