// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text conversion for Value.
///
/// Usage:
/// @code
///   #include <struct_diff/serialization.h>
///
///   Value doc = parse_json(R"({"items": [{"id": "a"}]})");   // throws JsonParseError
///   std::string error;
///   Value maybe = from_json(text, &error);                    // null + error on failure
///   std::string pretty = to_json(doc, false);
/// @endcode
///
/// Parsing preserves object field order. A repeated field name keeps the
/// position of its first occurrence and the value of its last one.
/// Integers that fit in int64_t are stored as int64_t, everything else as
/// double.

#pragma once

#include <struct_diff/api.h>
#include <struct_diff/value.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace struct_diff {

/// Malformed JSON text. `offset()` is the byte position where parsing stopped.
class STRUCT_DIFF_API JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& message, std::size_t offset);

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

/// Parse JSON text; throws JsonParseError on malformed input.
[[nodiscard]] STRUCT_DIFF_API Value parse_json(std::string_view json_str);

/// Parse JSON text; returns null and fills `error_out` (when given) on failure.
[[nodiscard]] STRUCT_DIFF_API Value from_json(std::string_view json_str, std::string* error_out = nullptr);

/// Serialize to JSON. `compact` omits all whitespace.
[[nodiscard]] STRUCT_DIFF_API std::string to_json(const Value& val, bool compact = true);

/// Read and parse a JSON file. Throws std::runtime_error when the file cannot
/// be read and JsonParseError when its content is malformed.
[[nodiscard]] STRUCT_DIFF_API Value load_json_file(const std::string& file_path);

} // namespace struct_diff
