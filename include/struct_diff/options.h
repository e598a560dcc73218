// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file options.h
/// @brief Loading comparison settings from a JSON document.
///
/// Recognized layout (every key optional):
/// @code
///   {
///     "detector": {
///       "minArraySize": 2,
///       "minOverlapRatio": 0.5,
///       "minDistinctRatio": 1.0,
///       "maxCompositeArity": 3,
///       "maxCompositeCandidates": 6,
///       "preferredFields": ["id", "key"]
///     },
///     "expandOneSided": false,
///     "ignore": ["meta.updated*", "items.*.rev"]
///   }
/// @endcode
///
/// Unknown keys are logged and skipped. A known key holding a value of the
/// wrong type or outside its range throws std::invalid_argument.

#pragma once

#include <struct_diff/api.h>
#include <struct_diff/pattern.h>
#include <struct_diff/value.h>
#include <struct_diff/value_diff.h>

#include <string>
#include <vector>

namespace struct_diff {

struct DiffConfig {
    CompareOptions compare;
    std::vector<std::string> ignore;  ///< pattern texts, validated on load

    /// IgnoreList holding every `ignore` pattern under generated ids
    [[nodiscard]] IgnoreList ignore_list() const
    {
        IgnoreList list;
        for (const auto& pattern : ignore) {
            list.add(pattern);
        }
        return list;
    }
};

[[nodiscard]] STRUCT_DIFF_API DiffConfig options_from_value(const Value& config);

/// Read a JSON config file. Throws std::runtime_error on I/O failure,
/// JsonParseError on malformed JSON and std::invalid_argument on bad values.
[[nodiscard]] STRUCT_DIFF_API DiffConfig load_options(const std::string& file_path);

} // namespace struct_diff
