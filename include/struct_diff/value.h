// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Immutable JSON-like document value.
///
/// A Value is one of:
/// - null (std::monostate)
/// - bool
/// - number, stored as int64_t or double (one kind: 1 == 1.0)
/// - string
/// - object: ordered field list with a name index
/// - array: ordered list of values
///
/// Containers are immer persistent structures, so copying a Value only bumps
/// reference counts and both documents of a comparison can share subtrees.
/// The Value type is templated on the immer memory policy.

#pragma once

#include <struct_diff/struct_diff_config.h>
#include <struct_diff/api.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location> // for std::source_location (C++20)
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace struct_diff {

namespace detail {

template <typename>
inline constexpr bool always_false = false;

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STRUCT_DIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STRUCT_DIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STRUCT_DIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

inline void log_pattern_error(
    std::string_view func,
    std::string_view pattern,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STRUCT_DIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] pattern '" << pattern << "' rejected: " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)pattern;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Object,
    Array,
};

[[nodiscard]] constexpr std::string_view kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Null:   return "null";
        case ValueKind::Bool:   return "bool";
        case ValueKind::Number: return "number";
        case ValueKind::String: return "string";
        case ValueKind::Object: return "object";
        case ValueKind::Array:  return "array";
    }
    return "unknown";
}

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueArray = immer::vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
struct BasicObjectField {
    std::string name;
    BasicValueBox<MemoryPolicy> value;
};

// ============================================================
// BasicValueObject - Ordered object
//
// Fields keep their declaration order (the diff walk and the
// identity-key detector both depend on it). A name index gives
// O(log n) lookup. Equality ignores field order.
// ============================================================

template <typename MemoryPolicy>
class BasicValueObject {
public:
    using value_box      = BasicValueBox<MemoryPolicy>;
    using field_type     = BasicObjectField<MemoryPolicy>;
    using fields_type    = immer::vector<field_type, MemoryPolicy>;
    using index_type     = immer::map<std::string,
                                      std::size_t,
                                      std::hash<std::string>,
                                      std::equal_to<std::string>,
                                      MemoryPolicy>;
    using const_iterator = typename fields_type::const_iterator;

    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }

    [[nodiscard]] const field_type& operator[](std::size_t position) const { return fields_[position]; }

    [[nodiscard]] const value_box* find(const std::string& name) const
    {
        if (auto* position = index_.find(name)) {
            return &fields_[*position].value;
        }
        return nullptr;
    }

    [[nodiscard]] bool contains(const std::string& name) const { return index_.count(name) > 0; }

    /// Returns a copy with `name` bound to `value`. Rebinding an existing name
    /// replaces its value in place, so the field keeps its first position.
    [[nodiscard]] BasicValueObject set(std::string name, value_box value) const
    {
        BasicValueObject result = *this;
        if (auto* position = index_.find(name)) {
            result.fields_ = fields_.set(*position, field_type{std::move(name), std::move(value)});
        } else {
            result.index_  = index_.set(name, fields_.size());
            result.fields_ = fields_.push_back(field_type{std::move(name), std::move(value)});
        }
        return result;
    }

    friend bool operator==(const BasicValueObject& a, const BasicValueObject& b)
    {
        if (a.size() != b.size()) {
            return false;
        }
        for (const auto& field : a.fields_) {
            auto* other = b.find(field.name);
            if (!other || !(field.value.get() == other->get())) {
                return false;
            }
        }
        return true;
    }

private:
    fields_type fields_;
    index_type index_;
};

template <typename MemoryPolicy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_object  = BasicValueObject<MemoryPolicy>;
    using value_array   = BasicValueArray<MemoryPolicy>;
    using object_field  = BasicObjectField<MemoryPolicy>;

    std::variant<bool,
                 std::int64_t,
                 double,
                 std::string,
                 value_object,
                 value_array,
                 std::monostate>
        data;

    BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    BasicValue(bool v) noexcept : data(std::in_place_type<bool>, v) {}
    BasicValue(int v) noexcept : data(std::in_place_type<std::int64_t>, v) {}
    BasicValue(std::int64_t v) noexcept : data(std::in_place_type<std::int64_t>, v) {}
    BasicValue(double v) noexcept : data(std::in_place_type<double>, v) {}
    BasicValue(const std::string& v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(std::string&& v) noexcept : data(std::in_place_type<std::string>, std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_object v) : data(std::in_place_type<value_object>, std::move(v)) {}
    BasicValue(value_array v) : data(std::in_place_type<value_array>, std::move(v)) {}

    // Factory functions for container types
    static BasicValue object(std::initializer_list<std::pair<std::string, BasicValue>> init)
    {
        value_object result;
        for (const auto& [name, val] : init) {
            result = result.set(name, value_box{val});
        }
        return BasicValue{std::move(result)};
    }

    static BasicValue array(std::initializer_list<BasicValue> init)
    {
        auto t = value_array{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueKind kind() const noexcept
    {
        return std::visit([](const auto& arg) -> ValueKind {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return ValueKind::Null;
            } else if constexpr (std::is_same_v<T, bool>) {
                return ValueKind::Bool;
            } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
                return ValueKind::Number;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return ValueKind::String;
            } else if constexpr (std::is_same_v<T, value_object>) {
                return ValueKind::Object;
            } else if constexpr (std::is_same_v<T, value_array>) {
                return ValueKind::Array;
            } else {
                static_assert(detail::always_false<T>, "unhandled value alternative");
            }
        }, data);
    }

    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<std::int64_t>() || is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<value_object>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<value_array>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_object() || is_array(); }

    /// Child lookup that distinguishes "absent" (nullptr) from "present and null".
    [[nodiscard]] const BasicValue* find(const std::string& key) const
    {
        if (auto* obj = get_if<value_object>()) {
            if (auto* box = obj->find(key)) {
                return &box->get();
            }
        }
        return nullptr;
    }

    [[nodiscard]] const BasicValue* find(std::size_t index) const
    {
        if (auto* arr = get_if<value_array>()) {
            if (index < arr->size()) {
                return &(*arr)[index].get();
            }
        }
        return nullptr;
    }

    [[nodiscard]] BasicValue at(const std::string& key) const
    {
        if (auto* found = find(key)) {
            return *found;
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const
    {
        if (auto* found = find(index)) {
            return *found;
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const
    {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::int64_t as_int64(std::int64_t default_val = 0) const
    {
        if (auto* p = get_if<std::int64_t>()) return *p;
        if (auto* p = get_if<double>()) return static_cast<std::int64_t>(*p);
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const
    {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<std::int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const
    {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept
    {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] std::size_t size() const
    {
        if (auto* obj = get_if<value_object>()) return obj->size();
        if (auto* arr = get_if<value_array>()) return arr->size();
        return 0;
    }
};

/// Structural equality: numbers compare numerically, objects ignore field order.
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    using V = BasicValue<MemoryPolicy>;
    if (a.kind() != b.kind()) {
        return false;
    }
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            if (auto* rhs = b.template get_if<std::int64_t>()) return lhs == *rhs;
            return static_cast<double>(lhs) == *b.template get_if<double>();
        } else if constexpr (std::is_same_v<T, double>) {
            if (auto* rhs = b.template get_if<double>()) return lhs == *rhs;
            return lhs == static_cast<double>(*b.template get_if<std::int64_t>());
        } else if constexpr (std::is_same_v<T, typename V::value_array>) {
            const auto& rhs = *b.template get_if<T>();
            if (lhs.size() != rhs.size()) return false;
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                if (!(lhs[i].get() == rhs[i].get())) return false;
            }
            return true;
        } else {
            // bool, string, object
            return lhs == *b.template get_if<T>();
        }
    }, a.data);
}

/// Pre-order fold over a value tree: `fn(accumulator, node)` returns the next accumulator.
template <typename MemoryPolicy, typename T, typename Fn>
T fold_value(const BasicValue<MemoryPolicy>& node, T init, Fn&& fn)
{
    using V = BasicValue<MemoryPolicy>;
    T acc = fn(std::move(init), node);
    if (auto* obj = node.template get_if<typename V::value_object>()) {
        for (const auto& field : *obj) {
            acc = fold_value(field.value.get(), std::move(acc), fn);
        }
    } else if (auto* arr = node.template get_if<typename V::value_array>()) {
        for (const auto& box : *arr) {
            acc = fold_value(box.get(), std::move(acc), fn);
        }
    }
    return acc;
}

// ============================================================
// Memory Policy Definitions
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

/// Thread-safe memory policy: atomic refcount + spinlock
using thread_safe_memory_policy = immer::default_memory_policy;

using UnsafeValue       = BasicValue<unsafe_memory_policy>;
using ThreadSafeValue   = BasicValue<thread_safe_memory_policy>;

// ============================================================
// Default Value Type Aliases
//
// Value is the thread-safe variant unless STRUCT_DIFF_SINGLE_THREADED
// is set, because comparisons commonly run on worker threads that
// share a parsed document.
// ============================================================

#if STRUCT_DIFF_SINGLE_THREADED
using value_memory_policy = unsafe_memory_policy;
#else
using value_memory_policy = thread_safe_memory_policy;
#endif

using Value       = BasicValue<value_memory_policy>;
using ValueBox    = BasicValueBox<value_memory_policy>;
using ValueObject = BasicValueObject<value_memory_policy>;
using ValueArray  = BasicValueArray<value_memory_policy>;
using ObjectField = BasicObjectField<value_memory_policy>;

// ============================================================
// Utility functions
// ============================================================

/// Compact single-line rendering for logs and diff listings.
/// Strings are quoted; containers are rendered as compact JSON.
[[nodiscard]] STRUCT_DIFF_API std::string value_to_string(const Value& val);

/// Shortest round-trip text for a double. Integral values print without a
/// fraction ("2", not "2.0"), so 2 and 2.0 render identically.
[[nodiscard]] STRUCT_DIFF_API std::string format_number(double value);

/// Number of scalar leaves plus empty containers below (and including) `val`.
[[nodiscard]] STRUCT_DIFF_API std::size_t count_leaves(const Value& val);

// ============================================================
// Extern Template Declarations
//
// The instantiations live in value.cpp.
// ============================================================

STRUCT_DIFF_EXTERN_TEMPLATE struct BasicValue<unsafe_memory_policy>;
STRUCT_DIFF_EXTERN_TEMPLATE struct BasicValue<thread_safe_memory_policy>;

} // namespace struct_diff
