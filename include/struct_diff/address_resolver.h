// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file address_resolver.h
/// @brief Conversion between identity and position addresses.
///
/// An IdentityAddress produced by compare() names a logical node of both
/// documents. Resolving it against one document yields the concrete
/// PositionAddress of that node there, using the identity keys the same
/// compare() run reported.
///
/// Resolution never throws on a document mismatch. A missing field, a
/// missing element, a stale key or a structural mismatch all yield nullopt.
///
/// @code
///   auto result = compare(left, right);
///   auto index  = result.key_index();
///   auto pos    = resolve_identity_to_position(
///                     IdentityAddress::parse("items[id=b].v"), right, index);
///   // *pos == PositionAddress::parse("items[0].v")
/// @endcode

#pragma once

#include <struct_diff/api.h>
#include <struct_diff/address.h>
#include <struct_diff/identity_key.h>
#include <struct_diff/value.h>

#include <optional>
#include <vector>

namespace struct_diff {

// ============================================================
// Identity -> position
// ============================================================

[[nodiscard]] STRUCT_DIFF_API std::optional<PositionAddress>
resolve_identity_to_position(const IdentityAddress& address,
                             const Value& document,
                             const IdentityKeyIndex& keys);

[[nodiscard]] STRUCT_DIFF_API std::optional<PositionAddress>
resolve_identity_to_position(const IdentityAddress& address,
                             const Value& document,
                             const std::vector<IdentityKeyInfo>& keys);

struct ResolvedPair {
    std::optional<PositionAddress> left;
    std::optional<PositionAddress> right;

    [[nodiscard]] bool both() const noexcept { return left.has_value() && right.has_value(); }
};

[[nodiscard]] STRUCT_DIFF_API ResolvedPair resolve_both_sides(const IdentityAddress& address,
                                                              const Value& left,
                                                              const Value& right,
                                                              const IdentityKeyIndex& keys);

[[nodiscard]] STRUCT_DIFF_API ResolvedPair resolve_both_sides(const IdentityAddress& address,
                                                              const Value& left,
                                                              const Value& right,
                                                              const std::vector<IdentityKeyInfo>& keys);

// ============================================================
// Position -> identity
// ============================================================

/// Inverse of resolve_identity_to_position for one document. Elements of
/// keyed arrays become key selectors; an occurrence suffix is added only
/// when the key tuple repeats within this document's array.
[[nodiscard]] STRUCT_DIFF_API std::optional<IdentityAddress>
position_to_identity(const PositionAddress& address,
                     const Value& document,
                     const IdentityKeyIndex& keys);

[[nodiscard]] STRUCT_DIFF_API std::optional<IdentityAddress>
position_to_identity(const PositionAddress& address,
                     const Value& document,
                     const std::vector<IdentityKeyInfo>& keys);

// ============================================================
// Value lookup
// ============================================================

/// Node at `address`, or nullptr when absent.
[[nodiscard]] STRUCT_DIFF_API const Value* value_at(const Value& document, const PositionAddress& address);

/// Node at a scoped address, looked up in the document its side names.
[[nodiscard]] STRUCT_DIFF_API const Value* value_at(const Value& left,
                                                    const Value& right,
                                                    const ScopedAddress& address);

} // namespace struct_diff
