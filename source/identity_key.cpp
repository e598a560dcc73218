// identity_key.cpp
// Identity-key detection for arrays of records

#include <struct_diff/identity_key.h>

#include <algorithm>
#include <set>
#include <unordered_set>

namespace struct_diff {

// ============================================================
// IdentityKeyInfo / IdentityKeyIndex
// ============================================================

std::string IdentityKeyInfo::key_name() const
{
    std::string name;
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (i > 0) name += '+';
        name += key[i];
    }
    return name;
}

IdentityKeyIndex::IdentityKeyIndex(const std::vector<IdentityKeyInfo>& infos)
{
    entries_.reserve(infos.size());
    for (const auto& info : infos) {
        add(info);
    }
}

void IdentityKeyIndex::add(const IdentityKeyInfo& info)
{
    entries_.insert_or_assign(info.identity_address, info);
}

const IdentityKeyInfo* IdentityKeyIndex::find(const IdentityAddress& array_address) const
{
    auto it = entries_.find(array_address);
    return it != entries_.end() ? &it->second : nullptr;
}

const std::vector<std::string>* IdentityKeyIndex::key_for(const IdentityAddress& array_address) const
{
    const auto* info = find(array_address);
    return (info && info->has_key()) ? &info->key : nullptr;
}

// ============================================================
// Key material
// ============================================================

std::optional<std::string> key_text(const Value& val)
{
    return std::visit([](const auto& arg) -> std::optional<std::string> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, bool>) {
            return std::string(arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_number(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else {
            // null, object, array
            return std::nullopt;
        }
    }, val.data);
}

std::optional<std::vector<std::string>> key_tuple(const Value& element, const std::vector<std::string>& fields)
{
    if (!element.is_object()) {
        return std::nullopt;
    }
    std::vector<std::string> tuple;
    tuple.reserve(fields.size());
    for (const auto& field : fields) {
        const Value* member = element.find(field);
        if (!member) {
            return std::nullopt;
        }
        auto text = key_text(*member);
        if (!text) {
            return std::nullopt;
        }
        tuple.push_back(std::move(*text));
    }
    return tuple;
}

namespace {

using KeyTuple = std::vector<std::string>;

void log_detection(std::string_view reason, std::size_t size_left, std::size_t size_right)
{
#if STRUCT_DIFF_TRACE_DETECTION
    detail::log_access_error("detect_identity_key",
                             std::string(reason) + " (sizes " + std::to_string(size_left) + "/" +
                                 std::to_string(size_right) + "), comparing by position");
#else
    (void)reason;
    (void)size_left;
    (void)size_right;
#endif
}

bool all_objects(const ValueArray* elements)
{
    if (!elements) {
        return true;
    }
    return std::all_of(elements->begin(), elements->end(), [](const ValueBox& box) {
        return box.get().is_object();
    });
}

/// Fields holding a key-capable value on at least one element, in
/// first-seen order (left side first), preferred fields moved to the front.
std::vector<std::string> collect_candidates(const ValueArray* left,
                                            const ValueArray* right,
                                            const DetectorOptions& options)
{
    std::vector<std::string> seen_order;
    std::unordered_set<std::string> seen;

    auto scan = [&](const ValueArray* elements) {
        if (!elements) return;
        for (const auto& box : *elements) {
            const auto* object = box.get().get_if<ValueObject>();
            for (const auto& field : *object) {
                if (key_text(field.value.get()) && seen.insert(field.name).second) {
                    seen_order.push_back(field.name);
                }
            }
        }
    };
    scan(left);
    scan(right);

    std::vector<std::string> candidates;
    candidates.reserve(seen_order.size());
    for (const auto& preferred : options.preferred_fields) {
        auto it = std::find(seen_order.begin(), seen_order.end(), preferred);
        if (it != seen_order.end()) {
            candidates.push_back(std::move(*it));
            seen_order.erase(it);
        }
    }
    candidates.insert(candidates.end(),
                      std::make_move_iterator(seen_order.begin()),
                      std::make_move_iterator(seen_order.end()));
    return candidates;
}

/// Distinct key tuples of one side; nullopt when an element lacks the key
/// or the side is not distinct enough.
std::optional<std::set<KeyTuple>> distinct_tuples(const ValueArray* elements,
                                                  const std::vector<std::string>& fields,
                                                  const DetectorOptions& options)
{
    std::set<KeyTuple> distinct;
    if (!elements || elements->empty()) {
        return distinct;
    }
    for (const auto& box : *elements) {
        auto tuple = key_tuple(box.get(), fields);
        if (!tuple) {
            return std::nullopt;
        }
        distinct.insert(std::move(*tuple));
    }
    const double ratio = static_cast<double>(distinct.size()) / static_cast<double>(elements->size());
    if (ratio < options.min_distinct_ratio) {
        return std::nullopt;
    }
    return distinct;
}

bool qualifies(const ValueArray* left,
               const ValueArray* right,
               const std::vector<std::string>& fields,
               const DetectorOptions& options)
{
    auto left_keys = distinct_tuples(left, fields, options);
    if (!left_keys) {
        return false;
    }
    auto right_keys = distinct_tuples(right, fields, options);
    if (!right_keys) {
        return false;
    }
    if (left_keys->empty() || right_keys->empty()) {
        return true;
    }

    std::size_t common = 0;
    for (const auto& tuple : *left_keys) {
        common += right_keys->count(tuple);
    }
    const auto smaller = std::min(left_keys->size(), right_keys->size());
    return static_cast<double>(common) / static_cast<double>(smaller) >= options.min_overlap_ratio;
}

} // anonymous namespace

KeyDetection detect_identity_key(const Value* left, const Value* right, const DetectorOptions& options)
{
    const ValueArray* left_elements = nullptr;
    const ValueArray* right_elements = nullptr;
    if (left) {
        left_elements = left->get_if<ValueArray>();
        if (!left_elements) return {};
    }
    if (right) {
        right_elements = right->get_if<ValueArray>();
        if (!right_elements) return {};
    }

    const std::size_t size_left = left_elements ? left_elements->size() : 0;
    const std::size_t size_right = right_elements ? right_elements->size() : 0;
    if (std::max(size_left, size_right) < options.min_array_size) {
        return {};
    }
    if (!all_objects(left_elements) || !all_objects(right_elements)) {
        log_detection("array holds non-object elements", size_left, size_right);
        return {};
    }

    const auto candidates = collect_candidates(left_elements, right_elements, options);

    for (const auto& candidate : candidates) {
        std::vector<std::string> fields{candidate};
        if (qualifies(left_elements, right_elements, fields, options)) {
            return KeyDetection{std::move(fields), false};
        }
    }

    // Smallest combination first: every pair, then every triple
    const std::size_t limit = std::min(candidates.size(), options.max_composite_candidates);
    if (options.max_composite_arity >= 2) {
        for (std::size_t i = 0; i < limit; ++i) {
            for (std::size_t j = i + 1; j < limit; ++j) {
                std::vector<std::string> fields{candidates[i], candidates[j]};
                if (qualifies(left_elements, right_elements, fields, options)) {
                    return KeyDetection{std::move(fields), true};
                }
            }
        }
    }
    if (options.max_composite_arity >= 3) {
        for (std::size_t i = 0; i < limit; ++i) {
            for (std::size_t j = i + 1; j < limit; ++j) {
                for (std::size_t k = j + 1; k < limit; ++k) {
                    std::vector<std::string> fields{candidates[i], candidates[j], candidates[k]};
                    if (qualifies(left_elements, right_elements, fields, options)) {
                        return KeyDetection{std::move(fields), true};
                    }
                }
            }
        }
    }

    log_detection("no qualifying identity key", size_left, size_right);
    return {};
}

} // namespace struct_diff
