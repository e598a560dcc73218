// value_diff.cpp - DiffSession and diff reporting

#include <struct_diff/value_diff.h>
#include <struct_diff/pattern.h>

#include <algorithm>
#include <map>
#include <ostream>

namespace struct_diff {

// ============================================================
// DiffSession Implementation
// ============================================================

DiffSession::DiffSession(CompareOptions options)
    : options_(std::move(options))
{}

void DiffSession::reset()
{
    diffs_.clear();
    keys_.clear();
    memo_.clear();
    identity_path_ = IdentityAddress{};
    left_path_ = PositionAddress{};
    right_path_ = PositionAddress{};
}

CompareResult DiffSession::run(const Value& left, const Value& right)
{
    reset();
    collect_diffs_ = true;

    // Pre-allocate to reduce reallocations during diff collection
    diffs_.reserve(32);
    diff_node(&left, &right);

    CompareResult result{std::move(diffs_), std::move(keys_)};
    reset();
    return result;
}

std::vector<IdentityKeyInfo> DiffSession::detect_all(const Value& document)
{
    reset();
    collect_diffs_ = false;
    diff_node(&document, nullptr);
    collect_diffs_ = true;

    auto keys = std::move(keys_);
    reset();
    return keys;
}

void DiffSession::diff_node(const Value* left, const Value* right)
{
    if (!left && !right) {
        return;
    }
    if (!right) {
        one_sided(*left, true);
        return;
    }
    if (!left) {
        one_sided(*right, false);
        return;
    }

    const ValueKind kind = left->kind();
    if (kind != right->kind()) [[unlikely]] {
        emit(DiffKind::Changed, left, right);
        return;
    }

    switch (kind) {
        case ValueKind::Object:
            diff_object(left->get_if<ValueObject>(), right->get_if<ValueObject>());
            break;
        case ValueKind::Array:
            diff_array(left, right);
            break;
        case ValueKind::Null:
        case ValueKind::Bool:
        case ValueKind::Number:
        case ValueKind::String:
            if (!(*left == *right)) {
                emit(DiffKind::Changed, left, right);
            }
            break;
    }
}

void DiffSession::one_sided(const Value& present, bool is_left)
{
    const bool descend = expand() && present.is_container() && present.size() > 0;
    if (!descend) {
        if (is_left) {
            emit(DiffKind::Removed, &present, nullptr);
        } else {
            emit(DiffKind::Added, nullptr, &present);
        }
        return;
    }

    if (const auto* object = present.get_if<ValueObject>()) {
        if (is_left) {
            diff_object(object, nullptr);
        } else {
            diff_object(nullptr, object);
        }
    } else if (is_left) {
        diff_array(&present, nullptr);
    } else {
        diff_array(nullptr, &present);
    }
}

void DiffSession::diff_object(const ValueObject* left, const ValueObject* right)
{
    if (left) {
        for (const auto& field : *left) {
            const ValueBox* other = right ? right->find(field.name) : nullptr;
            push_field(field.name);
            diff_node(&field.value.get(), other ? &other->get() : nullptr);
            pop();
        }
    }
    if (right) {
        for (const auto& field : *right) {
            if (left && left->contains(field.name)) {
                continue;
            }
            push_field(field.name);
            diff_node(nullptr, &field.value.get());
            pop();
        }
    }
}

void DiffSession::diff_array(const Value* left, const Value* right)
{
    const auto key = detect(left, right);
    const auto* left_elements = left ? left->get_if<ValueArray>() : nullptr;
    const auto* right_elements = right ? right->get_if<ValueArray>() : nullptr;

    if (key.empty()) {
        diff_positional_array(left_elements, right_elements);
    } else {
        diff_keyed_array(left_elements, right_elements, key);
    }
}

std::vector<std::string> DiffSession::detect(const Value* left, const Value* right)
{
    const bool on_left = left != nullptr;
    ScopedAddress scoped{on_left ? Side::Left : Side::Right, on_left ? left_path_ : right_path_};

    if (auto it = memo_.find(scoped); it != memo_.end()) {
        return keys_[it->second].key;
    }

    auto detection = detect_identity_key(left, right, options_.detector);

    IdentityKeyInfo info;
    info.array_address = scoped;
    info.identity_address = identity_path_;
    info.key = std::move(detection.fields);
    info.is_composite = detection.is_composite;
    info.size_left = left ? left->size() : 0;
    info.size_right = right ? right->size() : 0;

    memo_.emplace(std::move(scoped), keys_.size());
    keys_.push_back(std::move(info));
    return keys_.back().key;
}

namespace {

using KeyTuple = std::vector<std::string>;

struct KeyedElement {
    KeyTuple tuple;
    std::size_t occurrence;  // 0-based among elements of this side sharing the tuple
};

/// Key tuples of one side in element order; nullopt when an element has no tuple.
std::optional<std::vector<KeyedElement>> key_elements(const ValueArray* elements,
                                                      const std::vector<std::string>& key,
                                                      std::map<KeyTuple, std::size_t>& counts)
{
    std::vector<KeyedElement> result;
    if (!elements) {
        return result;
    }
    result.reserve(elements->size());
    for (const auto& box : *elements) {
        auto tuple = key_tuple(box.get(), key);
        if (!tuple) {
            return std::nullopt;
        }
        auto& count = counts[*tuple];
        result.push_back({std::move(*tuple), count++});
    }
    return result;
}

KeySelector make_selector(const std::vector<std::string>& key,
                          const KeyTuple& tuple,
                          std::optional<std::size_t> occurrence)
{
    KeySelector selector;
    selector.components.reserve(key.size());
    for (std::size_t i = 0; i < key.size(); ++i) {
        selector.components.push_back({key[i], tuple[i]});
    }
    selector.occurrence = occurrence;
    return selector;
}

} // anonymous namespace

void DiffSession::diff_keyed_array(const ValueArray* left,
                                   const ValueArray* right,
                                   const std::vector<std::string>& key)
{
    std::map<KeyTuple, std::size_t> left_counts;
    std::map<KeyTuple, std::size_t> right_counts;
    auto left_keys = key_elements(left, key, left_counts);
    auto right_keys = key_elements(right, key, right_counts);
    if (!left_keys || !right_keys) [[unlikely]] {
        diff_positional_array(left, right);
        return;
    }

    auto duplicated = [&](const KeyTuple& tuple) {
        auto l = left_counts.find(tuple);
        auto r = right_counts.find(tuple);
        return (l != left_counts.end() && l->second > 1) || (r != right_counts.end() && r->second > 1);
    };
    auto segment_for = [&](const KeyedElement& element) {
        return make_selector(key, element.tuple,
                             duplicated(element.tuple) ? std::optional<std::size_t>{element.occurrence}
                                                       : std::nullopt);
    };

    std::map<std::pair<KeyTuple, std::size_t>, std::size_t> right_position;
    for (std::size_t j = 0; j < right_keys->size(); ++j) {
        const auto& element = (*right_keys)[j];
        right_position.emplace(std::make_pair(element.tuple, element.occurrence), j);
    }
    std::vector<bool> right_matched(right_keys->size(), false);

    // Logical elements: left order first, then right-only elements in right order
    for (std::size_t i = 0; i < left_keys->size(); ++i) {
        const auto& element = (*left_keys)[i];
        auto it = right_position.find(std::make_pair(element.tuple, element.occurrence));
        const Value* counterpart = nullptr;
        std::size_t j = 0;
        if (it != right_position.end()) {
            j = it->second;
            right_matched[j] = true;
            counterpart = &(*right)[j].get();
        }
        push_element(segment_for(element), i, j);
        diff_node(&(*left)[i].get(), counterpart);
        pop();
    }

    for (std::size_t j = 0; j < right_keys->size(); ++j) {
        if (right_matched[j]) {
            continue;
        }
        push_element(segment_for((*right_keys)[j]), 0, j);
        diff_node(nullptr, &(*right)[j].get());
        pop();
    }
}

void DiffSession::diff_positional_array(const ValueArray* left, const ValueArray* right)
{
    const std::size_t left_size = left ? left->size() : 0;
    const std::size_t right_size = right ? right->size() : 0;
    const std::size_t count = std::max(left_size, right_size);

    for (std::size_t i = 0; i < count; ++i) {
        push_element(IdentitySegment{i}, i, i);
        diff_node(i < left_size ? &(*left)[i].get() : nullptr,
                  i < right_size ? &(*right)[i].get() : nullptr);
        pop();
    }
}

void DiffSession::emit(DiffKind kind, const Value* left, const Value* right)
{
    if (!collect_diffs_) {
        return;
    }
    DiffRecord record;
    record.kind = kind;
    record.identity_address = identity_path_;
    if (left) {
        record.left_address = left_path_;
        record.old_value = *left;
    }
    if (right) {
        record.right_address = right_path_;
        record.new_value = *right;
    }
    diffs_.push_back(std::move(record));
}

void DiffSession::push_field(const std::string& name)
{
    identity_path_.push_back(name);
    left_path_.push_back(name);
    right_path_.push_back(name);
}

void DiffSession::push_element(IdentitySegment segment, std::size_t left_index, std::size_t right_index)
{
    identity_path_.push_back(std::move(segment));
    left_path_.push_back(left_index);
    right_path_.push_back(right_index);
}

void DiffSession::pop()
{
    identity_path_.pop_back();
    left_path_.pop_back();
    right_path_.pop_back();
}

// ============================================================
// Free functions
// ============================================================

CompareResult compare(const Value& left, const Value& right, const CompareOptions& options)
{
    DiffSession session{options};
    return session.run(left, right);
}

std::vector<IdentityKeyInfo> detect_identity_keys(const Value& document, const DetectorOptions& options)
{
    CompareOptions compare_options;
    compare_options.detector = options;
    DiffSession session{std::move(compare_options)};
    return session.detect_all(document);
}

namespace {

std::string address_text(const std::optional<PositionAddress>& address)
{
    if (!address) return "-";
    return address->is_root() ? "<root>" : address->to_string();
}

} // anonymous namespace

void print_diffs(const std::vector<DiffRecord>& diffs, std::ostream& os)
{
    if (diffs.empty()) {
        os << "  (no changes)\n";
        return;
    }
    for (const auto& d : diffs) {
        const auto identity = d.identity_address.is_root() ? std::string("<root>") : d.identity_address.to_string();
        os << "  " << diff_kind_name(d.kind) << " " << identity
           << "  left=" << address_text(d.left_address)
           << " right=" << address_text(d.right_address);
        switch (d.kind) {
            case DiffKind::Changed:
                os << ": " << value_to_string(*d.old_value) << " -> " << value_to_string(*d.new_value);
                break;
            case DiffKind::Added:
            case DiffKind::Removed:
                os << ": " << value_to_string(d.value());
                break;
        }
        os << "\n";
    }
}

void print_identity_keys(const std::vector<IdentityKeyInfo>& keys, std::ostream& os)
{
    for (const auto& info : keys) {
        os << "  " << element_pattern(info).to_string()
           << "  key=" << (info.has_key() ? info.key_name() : std::string("<position>"));
        if (info.is_composite) {
            os << " (composite)";
        }
        os << "  (" << info.array_address.to_string() << ", "
           << info.size_left << "/" << info.size_right << ")\n";
    }
}

Value diffs_to_value(const std::vector<DiffRecord>& diffs)
{
    auto optional_address = [](const std::optional<PositionAddress>& address) {
        return address ? Value{address->to_string()} : Value{};
    };

    auto list = ValueArray{}.transient();
    for (const auto& d : diffs) {
        ValueObject entry;
        entry = entry.set("kind", ValueBox{Value{std::string(diff_kind_name(d.kind))}});
        entry = entry.set("identity", ValueBox{Value{d.identity_address.to_string()}});
        entry = entry.set("left", ValueBox{optional_address(d.left_address)});
        entry = entry.set("right", ValueBox{optional_address(d.right_address)});
        if (d.old_value) {
            entry = entry.set("old", ValueBox{*d.old_value});
        }
        if (d.new_value) {
            entry = entry.set("new", ValueBox{*d.new_value});
        }
        list.push_back(ValueBox{Value{std::move(entry)}});
    }
    return Value{list.persistent()};
}

} // namespace struct_diff
