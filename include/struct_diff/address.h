// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file address.h
/// @brief Validated address kinds naming nodes inside a document.
///
/// Three address kinds exist and none converts implicitly into another:
///
/// - PositionAddress: field names and literal array indices. Meaningful only
///   against one concrete document.
/// - IdentityAddress: field names, array indices and identity-key selectors
///   (`[id=b]`, `[org=x,id=1]`, `[id=b::1]`). Names the same logical element
///   in both compared documents.
/// - ScopedAddress: a PositionAddress tagged with the document (left/right)
///   it belongs to.
///
/// ArrayPattern (`items[].tags[]`) names a family of array locations.
///
/// Text grammar shared by all kinds:
/// @code
///   address  := "" | first ( "." field | bracket )*
///   first    := field | bracket
///   field    := 1*( char | "\" escaped ) | '""'     ; '""' is the empty name
///   bracket  := "[" digits "]"                       ; index
///             | "[" comp ("," comp)* ("::" digits)? "]"
///   comp     := key "=" value
/// @endcode
/// Field names escape `\ . [ ] " *`; bracket contents escape `\ [ ] = : ,`.
/// The root address is the empty string.
///
/// Usage:
/// @code
///   auto pos = PositionAddress::parse("items[2].tags[0]");
///   auto id  = IdentityAddress::parse("items[id=b].v");
///   auto r   = validate_identity_address(user_text);   // never throws
///   if (!r) std::cerr << r.error_message << " at " << r.error_offset;
/// @endcode

#pragma once

#include <struct_diff/api.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace struct_diff {

// ============================================================
// Errors
// ============================================================

enum class AddressErrorCode {
    Success = 0,
    EmptySegment,        // "a..b", leading or trailing '.'
    UnexpectedCharacter, // stray ']' or '"', junk after a bracket
    InvalidEscape,       // backslash before a character that needs no escape
    UnterminatedBracket,
    InvalidIndex,        // leading zeros or out of range
    InvalidSelector,     // missing '=' or empty key name inside [...]
    InvalidOccurrence,   // "::" not followed by digits only
    UnexpectedWildcard,  // '*', '[*]' or '[]' where the kind forbids it
    UnexpectedSegment,   // segment kind the address kind does not allow
    InvalidSide,         // scoped address without "left:" / "right:"
};

[[nodiscard]] STRUCT_DIFF_API std::string_view error_code_name(AddressErrorCode code) noexcept;

/// Thrown by the `parse` functions on malformed address text.
/// what() reads "<description> at offset <n>".
class STRUCT_DIFF_API AddressError : public std::invalid_argument {
public:
    AddressError(AddressErrorCode code, std::size_t offset, const std::string& description);

    [[nodiscard]] AddressErrorCode code() const noexcept { return code_; }
    /// Character offset in the parsed text where the error was detected
    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }

private:
    AddressErrorCode code_;
    std::size_t offset_;
    std::string description_;
};

/// Non-throwing parse outcome returned by the validate_* functions.
template <typename T>
struct ParseResult {
    std::optional<T> address;
    bool success = false;
    AddressErrorCode error_code = AddressErrorCode::Success;
    std::string error_message;
    std::size_t error_offset = 0;

    explicit operator bool() const noexcept { return success; }

    const T& get() const
    {
        if (!success) {
            throw AddressError(error_code, error_offset, error_message);
        }
        return *address;
    }
};

// ============================================================
// Segments
// ============================================================

/// One `field=value` pair of a key selector. `value` is the key text of the
/// element's field (see key_text() in identity_key.h).
struct KeyComponent {
    std::string field;
    std::string value;

    bool operator==(const KeyComponent&) const = default;
};

/// `[id=b]`, `[org=x,id=1]` or `[id=b::1]`.
///
/// `occurrence` is present only when the key value occurs more than once in
/// the array on either side; it is the 0-based ordinal among the elements
/// sharing that value.
struct STRUCT_DIFF_API KeySelector {
    std::vector<KeyComponent> components;
    std::optional<std::size_t> occurrence;

    [[nodiscard]] std::vector<std::string> fields() const;
    [[nodiscard]] bool is_composite() const noexcept { return components.size() > 1; }

    bool operator==(const KeySelector&) const = default;
};

/// `[]` or `[*]`: any element of an array
struct AnyElement {
    bool operator==(const AnyElement&) const = default;
};

/// `*`: exactly one segment of any kind (match patterns only)
struct AnySegment {
    bool operator==(const AnySegment&) const = default;
};

using PositionSegment     = std::variant<std::string, std::size_t>;
using IdentitySegment     = std::variant<std::string, std::size_t, KeySelector>;
using ArrayPatternSegment = std::variant<std::string, AnyElement>;
using PatternSegment      = std::variant<std::string, std::size_t, KeySelector, AnyElement, AnySegment>;

// ============================================================
// AddressBase - shared segment container
// ============================================================

template <typename Derived, typename Segment>
class AddressBase {
public:
    using segment_type   = Segment;
    using container_type = std::vector<Segment>;
    using const_iterator = typename container_type::const_iterator;

    AddressBase() = default;
    explicit AddressBase(container_type segments) : segments_(std::move(segments)) {}

    [[nodiscard]] const container_type& segments() const noexcept { return segments_; }
    [[nodiscard]] std::size_t size() const noexcept { return segments_.size(); }
    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
    [[nodiscard]] bool is_root() const noexcept { return segments_.empty(); }

    [[nodiscard]] const Segment& operator[](std::size_t i) const { return segments_[i]; }
    [[nodiscard]] const Segment& back() const { return segments_.back(); }

    const_iterator begin() const noexcept { return segments_.begin(); }
    const_iterator end() const noexcept { return segments_.end(); }

    void push_back(Segment segment) { segments_.push_back(std::move(segment)); }
    void pop_back() { segments_.pop_back(); }

    /// Address with the last segment dropped (the root is its own parent)
    [[nodiscard]] Derived parent() const
    {
        Derived result{static_cast<const Derived&>(*this)};
        if (!result.empty()) {
            result.pop_back();
        }
        return result;
    }

    [[nodiscard]] bool starts_with(const Derived& prefix) const
    {
        const auto& other = prefix.segments();
        if (other.size() > segments_.size()) {
            return false;
        }
        for (std::size_t i = 0; i < other.size(); ++i) {
            if (!(segments_[i] == other[i])) {
                return false;
            }
        }
        return true;
    }

    bool operator==(const AddressBase&) const = default;

protected:
    [[nodiscard]] Derived with_segment(Segment segment) const
    {
        Derived result{static_cast<const Derived&>(*this)};
        result.push_back(std::move(segment));
        return result;
    }

    container_type segments_;
};

// ============================================================
// PositionAddress
// ============================================================

class STRUCT_DIFF_API PositionAddress : public AddressBase<PositionAddress, PositionSegment> {
public:
    using AddressBase::AddressBase;

    /// Throws AddressError on malformed text or on key selectors / wildcards.
    [[nodiscard]] static PositionAddress parse(std::string_view text);

    [[nodiscard]] PositionAddress child(std::string field) const { return with_segment(std::move(field)); }
    [[nodiscard]] PositionAddress child(std::size_t index) const { return with_segment(index); }

    [[nodiscard]] std::string to_string() const;

    bool operator==(const PositionAddress&) const = default;
};

// ============================================================
// IdentityAddress
//
// Occurrence suffixes (`::n`) are assigned per comparison run. An
// IdentityAddress that carries one is only meaningful together with the
// documents and identity-key report of the run that produced it; do not
// persist it and apply it to another pair of documents.
// ============================================================

class STRUCT_DIFF_API IdentityAddress : public AddressBase<IdentityAddress, IdentitySegment> {
public:
    using AddressBase::AddressBase;

    /// Throws AddressError on malformed text or on wildcards.
    [[nodiscard]] static IdentityAddress parse(std::string_view text);

    /// Identity address that uses literal indices for every array segment
    [[nodiscard]] static IdentityAddress from_position(const PositionAddress& position);

    [[nodiscard]] IdentityAddress child(std::string field) const { return with_segment(std::move(field)); }
    [[nodiscard]] IdentityAddress child(std::size_t index) const { return with_segment(index); }
    [[nodiscard]] IdentityAddress child(KeySelector selector) const { return with_segment(std::move(selector)); }

    [[nodiscard]] bool has_selectors() const noexcept;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const IdentityAddress&) const = default;
};

// ============================================================
// ScopedAddress - "left:items[0]" / "right:items[2].v"
// ============================================================

enum class Side : std::uint8_t { Left, Right };

[[nodiscard]] constexpr std::string_view side_name(Side side) noexcept
{
    return side == Side::Left ? "left" : "right";
}

[[nodiscard]] constexpr Side other_side(Side side) noexcept
{
    return side == Side::Left ? Side::Right : Side::Left;
}

struct STRUCT_DIFF_API ScopedAddress {
    Side side = Side::Left;
    PositionAddress address;

    [[nodiscard]] static ScopedAddress parse(std::string_view text);
    [[nodiscard]] std::string to_string() const;

    bool operator==(const ScopedAddress&) const = default;
};

// ============================================================
// ArrayPattern - "items[].tags[]"
//
// Every array segment is the wildcard `[]`. Produced by generalize()
// to group structurally equivalent array locations.
// ============================================================

class STRUCT_DIFF_API ArrayPattern : public AddressBase<ArrayPattern, ArrayPatternSegment> {
public:
    using AddressBase::AddressBase;

    [[nodiscard]] static ArrayPattern parse(std::string_view text);

    [[nodiscard]] ArrayPattern child(std::string field) const { return with_segment(std::move(field)); }
    [[nodiscard]] ArrayPattern any_element() const { return with_segment(AnyElement{}); }

    /// Number of `[]` segments
    [[nodiscard]] std::size_t array_depth() const noexcept;

    /// True when the pattern names an array element family (ends with `[]`)
    [[nodiscard]] bool is_valid_target() const noexcept;

    /// Field holding the innermost array: "a[].b.tags[]" -> "tags"
    [[nodiscard]] std::optional<std::string> target_array_field() const;

    /// Pattern of the enclosing array: "a[].b.tags[]" -> "a[]".
    /// Empty when there is no enclosing array.
    [[nodiscard]] std::optional<ArrayPattern> parent_array() const;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const ArrayPattern&) const = default;
};

// ============================================================
// Validation (non-throwing)
// ============================================================

[[nodiscard]] STRUCT_DIFF_API ParseResult<PositionAddress> validate_position_address(std::string_view text);
[[nodiscard]] STRUCT_DIFF_API ParseResult<IdentityAddress> validate_identity_address(std::string_view text);
[[nodiscard]] STRUCT_DIFF_API ParseResult<ScopedAddress> validate_scoped_address(std::string_view text);
[[nodiscard]] STRUCT_DIFF_API ParseResult<ArrayPattern> validate_array_pattern(std::string_view text);

// ============================================================
// Segment text helpers
// ============================================================

/// Escape a field name for use in address text (`""` for the empty name)
[[nodiscard]] STRUCT_DIFF_API std::string escape_field(std::string_view name);

/// Escape a selector key or value for use inside brackets
[[nodiscard]] STRUCT_DIFF_API std::string escape_bracket_text(std::string_view text);

/// "[id=b]", "[org=x,id=1::2]"
[[nodiscard]] STRUCT_DIFF_API std::string selector_to_string(const KeySelector& selector);

namespace detail {

/// Raw scan of address text into the widest segment set. Each address kind
/// then rejects the segment kinds it does not allow.
struct ScannedAddress {
    std::vector<PatternSegment> segments;
    std::vector<std::size_t> offsets;  ///< text offset of each segment
    bool open_ended = false;           ///< trailing `prefix*`
};

/// Throws AddressError.
[[nodiscard]] STRUCT_DIFF_API ScannedAddress scan_address(std::string_view text);

/// Appends one segment to `out` in address text form. `first` suppresses the
/// leading '.' of a field segment.
STRUCT_DIFF_API void append_segment_text(std::string& out, const PatternSegment& segment, bool first);

} // namespace detail

} // namespace struct_diff

// ============================================================
// std::hash specializations (used as unordered_map keys)
// ============================================================

namespace std {

template <>
struct hash<struct_diff::PositionAddress> {
    STRUCT_DIFF_API std::size_t operator()(const struct_diff::PositionAddress& address) const noexcept;
};

template <>
struct hash<struct_diff::IdentityAddress> {
    STRUCT_DIFF_API std::size_t operator()(const struct_diff::IdentityAddress& address) const noexcept;
};

template <>
struct hash<struct_diff::ScopedAddress> {
    STRUCT_DIFF_API std::size_t operator()(const struct_diff::ScopedAddress& address) const noexcept;
};

} // namespace std
