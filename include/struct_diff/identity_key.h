// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file identity_key.h
/// @brief Identity-key detection for arrays of records.
///
/// For an array present at the same logical location in both documents, the
/// detector proposes a field (or the smallest combination of fields) whose
/// values identify each element on both sides. Matching elements by that key
/// instead of by position keeps the diff stable under reordering, insertion
/// and deletion.
///
/// Detection never fails: when no key qualifies the array is compared by
/// position.
///
/// @code
///   auto detection = detect_identity_key(&left_items, &right_items);
///   if (detection.keyed()) {
///       // detection.fields == {"id"}
///   }
/// @endcode

#pragma once

#include <struct_diff/api.h>
#include <struct_diff/address.h>
#include <struct_diff/value.h>

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace struct_diff {

// ============================================================
// DetectorOptions
// ============================================================

struct DetectorOptions {
    /// Arrays whose sides both hold fewer elements than this compare by position.
    std::size_t min_array_size = 2;

    /// Shared distinct key values over the smaller side's distinct count.
    /// Only checked when both sides are non-empty.
    double min_overlap_ratio = 0.5;

    /// Distinct key values over element count, per side. 1.0 demands
    /// uniqueness; lower values admit duplicates, which the diff engine then
    /// disambiguates with occurrence suffixes.
    double min_distinct_ratio = 1.0;

    /// Largest field combination tried (2 or 3).
    std::size_t max_composite_arity = 3;

    /// Only the first N candidate fields take part in composite keys.
    std::size_t max_composite_candidates = 6;

    /// Fields tried before all others, in this order.
    std::vector<std::string> preferred_fields;
};

// ============================================================
// KeyDetection - raw detector output for one array location
// ============================================================

struct KeyDetection {
    std::vector<std::string> fields;  ///< empty: compare by position
    bool is_composite = false;

    [[nodiscard]] bool keyed() const noexcept { return !fields.empty(); }
};

// ============================================================
// IdentityKeyInfo - one record per visited array location
// ============================================================

struct STRUCT_DIFF_API IdentityKeyInfo {
    /// Position of the array in the reference document: the left document
    /// when the array exists there, otherwise the right one.
    ScopedAddress array_address;

    /// Identity address of the array itself (how the resolver finds this entry)
    IdentityAddress identity_address;

    /// Key fields in match order; empty when the array compares by position.
    std::vector<std::string> key;
    bool is_composite = false;
    std::size_t size_left = 0;
    std::size_t size_right = 0;

    [[nodiscard]] bool has_key() const noexcept { return !key.empty(); }

    /// "id", "org+id", or "" when there is no key
    [[nodiscard]] std::string key_name() const;
};

// ============================================================
// IdentityKeyIndex - lookup of IdentityKeyInfo by array identity address
// ============================================================

class STRUCT_DIFF_API IdentityKeyIndex {
public:
    IdentityKeyIndex() = default;
    explicit IdentityKeyIndex(const std::vector<IdentityKeyInfo>& infos);

    /// Later entries for the same array replace earlier ones.
    void add(const IdentityKeyInfo& info);

    [[nodiscard]] const IdentityKeyInfo* find(const IdentityAddress& array_address) const;

    /// Key fields for the array, or nullptr when it compares by position or is unknown.
    [[nodiscard]] const std::vector<std::string>* key_for(const IdentityAddress& array_address) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    std::unordered_map<IdentityAddress, IdentityKeyInfo> entries_;
};

// ============================================================
// Detection
// ============================================================

/// Plain text of a key value: strings raw, integers in decimal, doubles in
/// shortest round-trip form, booleans as true/false. Null, objects and arrays
/// are not key material and yield nullopt.
[[nodiscard]] STRUCT_DIFF_API std::optional<std::string> key_text(const Value& val);

/// Key tuple of one element, or nullopt when the element is not an object or
/// lacks a key field or holds a non-key value in one.
[[nodiscard]] STRUCT_DIFF_API std::optional<std::vector<std::string>>
key_tuple(const Value& element, const std::vector<std::string>& fields);

/// Detect the identity key of an array location. Either side may be nullptr
/// (absent), which counts as an empty array. A present side that is not an
/// array, or any element that is not an object, yields a positional result.
[[nodiscard]] STRUCT_DIFF_API KeyDetection detect_identity_key(const Value* left,
                                                               const Value* right,
                                                               const DetectorOptions& options = {});

/// Run the detector over every array of a single document, treating the
/// counterpart as absent. Records use the same addressing as compare().
[[nodiscard]] STRUCT_DIFF_API std::vector<IdentityKeyInfo>
detect_identity_keys(const Value& document, const DetectorOptions& options = {});

} // namespace struct_diff
