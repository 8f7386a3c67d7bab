// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text conversion for Value.
///
/// The diff itself never parses text; these functions let callers load
/// the two trees from JSON and show values in reports.
///
/// Usage:
/// @code
///   #include <deep_diff/serialization.h>
///
///   std::string err;
///   Value before = from_json(R"({"name": "Alice", "tags": [1, 2]})", &err);
///   if (!err.empty()) { ... }
///
///   std::string text = to_json(before, true);  // {"name":"Alice","tags":[1,2]}
/// @endcode
///
/// Numbers: integer literals that fit in int64_t become int64_t, all other
/// numbers (fraction, exponent, or out of int64_t range) become double.
///
/// Note: This header must be included separately from value.h if you need serialization.

#pragma once

#include "api.h"
#include "value.h"

#include <string>
#include <string_view>

namespace deep_diff {

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @return JSON string representation
///
/// Doubles are written in shortest round-trip form. NaN and infinities have
/// no JSON spelling and are written as null.
[[nodiscard]] DEEP_DIFF_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON string to Value
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure (cleared on success)
/// @return Parsed Value, or null Value on parse error
///
/// Duplicate object keys: the last occurrence wins.
/// Errors: trailing non-whitespace after the top-level value, numbers
/// outside the double range, and nesting deeper than 512 levels.
[[nodiscard]] DEEP_DIFF_API Value from_json(std::string_view json_str, std::string* error_out = nullptr);

} // namespace deep_diff
