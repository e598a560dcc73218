// value_diff.h - Identity-aware structural diff of two Values

#pragma once

#include <struct_diff/api.h>
#include <struct_diff/address.h>
#include <struct_diff/identity_key.h>
#include <struct_diff/value.h>

#include <iosfwd>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace struct_diff {

enum class DiffKind : std::uint8_t { Added, Removed, Changed };

[[nodiscard]] constexpr std::string_view diff_kind_name(DiffKind kind) noexcept
{
    switch (kind) {
        case DiffKind::Added:   return "ADDED";
        case DiffKind::Removed: return "REMOVED";
        case DiffKind::Changed: return "CHANGED";
    }
    return "UNKNOWN";
}

struct STRUCT_DIFF_API DiffRecord {
    DiffKind kind = DiffKind::Changed;
    IdentityAddress identity_address;          // Stable across both documents
    std::optional<PositionAddress> left_address;   // Absent for Added
    std::optional<PositionAddress> right_address;  // Absent for Removed
    std::optional<Value> old_value;            // Present for Removed and Changed
    std::optional<Value> new_value;            // Present for Added and Changed

    /// The value that was added, removed, or changed to:
    /// - Added: new_value
    /// - Removed: old_value
    /// - Changed: new_value (old_value holds the previous one)
    [[nodiscard]] const Value& value() const
    {
        return kind == DiffKind::Removed ? *old_value : *new_value;
    }

    /// Position address on the requested side, if the node exists there
    [[nodiscard]] const std::optional<PositionAddress>& address_on(Side side) const noexcept
    {
        return side == Side::Left ? left_address : right_address;
    }
};

struct CompareOptions {
    DetectorOptions detector;

    /// false: a node present on one side only yields one Added/Removed record
    /// carrying the whole subtree.
    /// true: the walk descends into that subtree and yields one record per
    /// scalar leaf or empty container.
    bool expand_one_sided = false;
};

struct STRUCT_DIFF_API CompareResult {
    std::vector<DiffRecord> diffs;
    std::vector<IdentityKeyInfo> identity_keys;

    [[nodiscard]] bool has_changes() const noexcept { return !diffs.empty(); }

    /// Index over identity_keys, ready for the resolver
    [[nodiscard]] IdentityKeyIndex key_index() const { return IdentityKeyIndex{identity_keys}; }
};

// ============================================================
// DiffSession - one comparison run
//
// Walks both documents in lock-step. Objects are compared per field
// (left declaration order, then right-only fields in right order),
// arrays through the identity-key detector. All state, including the
// per-array detector memo, lives in the session, so concurrent
// comparisons need separate sessions and nothing else.
//
// Emission order is a deterministic pre-order walk.
// ============================================================

class STRUCT_DIFF_API DiffSession {
public:
    explicit DiffSession(CompareOptions options = {});

    /// Compare two documents. The session can be reused; each call starts fresh.
    [[nodiscard]] CompareResult run(const Value& left, const Value& right);

    /// Detect identity keys of every array in one document (counterpart absent).
    [[nodiscard]] std::vector<IdentityKeyInfo> detect_all(const Value& document);

    [[nodiscard]] const CompareOptions& options() const noexcept { return options_; }

private:
    CompareOptions options_;
    bool collect_diffs_ = true;

    std::vector<DiffRecord> diffs_;
    std::vector<IdentityKeyInfo> keys_;
    std::unordered_map<ScopedAddress, std::size_t> memo_;  // array -> index into keys_

    // Current walk position; a side's path is only read while that side is present
    IdentityAddress identity_path_;
    PositionAddress left_path_;
    PositionAddress right_path_;

    void reset();
    void diff_node(const Value* left, const Value* right);
    void diff_object(const ValueObject* left, const ValueObject* right);
    void diff_array(const Value* left, const Value* right);
    void diff_keyed_array(const ValueArray* left, const ValueArray* right, const std::vector<std::string>& key);
    void diff_positional_array(const ValueArray* left, const ValueArray* right);
    void one_sided(const Value& present, bool is_left);

    /// Record (once per array location) and return the key fields for the array at the current position.
    std::vector<std::string> detect(const Value* left, const Value* right);

    [[nodiscard]] bool expand() const noexcept { return options_.expand_one_sided || !collect_diffs_; }

    void emit(DiffKind kind, const Value* left, const Value* right);
    void push_field(const std::string& name);
    void push_element(IdentitySegment segment, std::size_t left_index, std::size_t right_index);
    void pop();
};

/// Compare two documents.
[[nodiscard]] STRUCT_DIFF_API CompareResult compare(const Value& left,
                                                    const Value& right,
                                                    const CompareOptions& options = {});

/// Print diffs one per line:
///   CHANGED items[id=b].v  left=items[1].v right=items[0].v: 2 -> 3
STRUCT_DIFF_API void print_diffs(const std::vector<DiffRecord>& diffs, std::ostream& os);

/// Print identity keys one per line:
///   items[]  key=id  (left:items, 2/3)
STRUCT_DIFF_API void print_identity_keys(const std::vector<IdentityKeyInfo>& keys, std::ostream& os);

/// Diff list as a JSON array of {kind, identity, left, right, old, new}
[[nodiscard]] STRUCT_DIFF_API Value diffs_to_value(const std::vector<DiffRecord>& diffs);

} // namespace struct_diff
