// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file pattern.h
/// @brief Address generalization and glob matching.
///
/// generalize() turns a concrete address into an ArrayPattern by replacing
/// every array segment with `[]`; identity keys found at structurally
/// equivalent locations share one pattern.
///
/// AddressPattern is a segment-wise glob used to ignore families of diffs:
///
/// | Pattern segment | Matches                                   |
/// |-----------------|-------------------------------------------|
/// | `name`          | the field `name`                          |
/// | `[3]`           | the literal index 3                       |
/// | `[id=b]`        | the literal key selector                  |
/// | `*`             | exactly one segment of any kind           |
/// | `[*]` / `[]`    | exactly one array segment (index or key)  |
///
/// Without a trailing wildcard the pattern and the address must have the
/// same number of segments. A `*` glued to the last segment (`config*`,
/// `items[id=b]*`) turns the pattern into a prefix: it matches that address
/// and every address nested under it.
///
/// @code
///   matches(IdentityAddress::parse("items[id=b].v"), "items.*.v");   // true
///   matches(IdentityAddress::parse("items[id=b]"),   "items.*.v");   // false
///
///   IgnoreList ignore;
///   ignore.add("timestamps", "meta.updated*");
///   auto kept = ignore.filter(result.diffs);
/// @endcode

#pragma once

#include <struct_diff/api.h>
#include <struct_diff/address.h>
#include <struct_diff/identity_key.h>
#include <struct_diff/value_diff.h>

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace struct_diff {

// ============================================================
// Generalization
// ============================================================

[[nodiscard]] STRUCT_DIFF_API ArrayPattern generalize(const IdentityAddress& address);
[[nodiscard]] STRUCT_DIFF_API ArrayPattern generalize(const PositionAddress& address);

/// Pattern naming the elements of the array described by `info`: "items[]"
[[nodiscard]] STRUCT_DIFF_API ArrayPattern element_pattern(const IdentityKeyInfo& info);

/// Identity keys grouped by element_pattern() text, each group in report order.
[[nodiscard]] STRUCT_DIFF_API std::map<std::string, std::vector<IdentityKeyInfo>>
group_identity_keys(const std::vector<IdentityKeyInfo>& infos);

// ============================================================
// AddressPattern
// ============================================================

class STRUCT_DIFF_API AddressPattern {
public:
    /// Throws AddressError on malformed pattern text.
    [[nodiscard]] static AddressPattern parse(std::string_view text);

    [[nodiscard]] const std::vector<PatternSegment>& segments() const noexcept { return segments_; }
    [[nodiscard]] bool open_ended() const noexcept { return open_ended_; }

    /// The text the pattern was parsed from
    [[nodiscard]] const std::string& text() const noexcept { return text_; }

    [[nodiscard]] bool matches(const PositionAddress& address) const;
    [[nodiscard]] bool matches(const IdentityAddress& address) const;

private:
    std::vector<PatternSegment> segments_;
    bool open_ended_ = false;
    std::string text_;

    template <typename Address>
    bool matches_segments(const Address& address) const;
};

[[nodiscard]] STRUCT_DIFF_API ParseResult<AddressPattern> validate_pattern(std::string_view text);

/// Match against pattern text. A malformed pattern matches nothing (and is logged).
[[nodiscard]] STRUCT_DIFF_API bool matches(const PositionAddress& address, std::string_view pattern);
[[nodiscard]] STRUCT_DIFF_API bool matches(const IdentityAddress& address, std::string_view pattern);

[[nodiscard]] inline bool matches(const PositionAddress& address, const AddressPattern& pattern)
{
    return pattern.matches(address);
}

[[nodiscard]] inline bool matches(const IdentityAddress& address, const AddressPattern& pattern)
{
    return pattern.matches(address);
}

// ============================================================
// IgnoreList - named patterns that suppress diffs
//
// A diff is ignored when its identity address or either of its
// position addresses matches any pattern.
// ============================================================

class STRUCT_DIFF_API IgnoreList {
public:
    struct Entry {
        std::string id;
        AddressPattern pattern;
    };

    /// Adds (or replaces) the pattern stored under `id`. Throws AddressError
    /// on malformed pattern text; the list is left unchanged in that case.
    void add(std::string id, std::string_view pattern);

    /// Adds a pattern under a generated id ("pattern_1", "pattern_2", ...) and returns the id.
    std::string add(std::string_view pattern);

    /// Replace the pattern of an existing entry. Returns false when `id` is unknown.
    bool update(const std::string& id, std::string_view pattern);

    /// Returns false when `id` is unknown.
    bool remove(const std::string& id);

    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    void clear() { entries_.clear(); }

    [[nodiscard]] bool is_ignored(const IdentityAddress& address) const;
    [[nodiscard]] bool is_ignored(const PositionAddress& address) const;
    [[nodiscard]] bool is_ignored(const DiffRecord& record) const;

    /// Diffs not ignored, in their original order
    [[nodiscard]] std::vector<DiffRecord> filter(const std::vector<DiffRecord>& diffs) const;

private:
    std::vector<Entry> entries_;
    std::size_t next_id_ = 1;

    std::vector<Entry>::iterator find_entry(const std::string& id);
};

} // namespace struct_diff
