// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Paths into Value trees and their string rendering.
///
/// A Path is a sequence of segments, each an object key or an array index.
/// Paths are rendered with a fixed convention that callers can match on:
///
/// | Path segments         | Rendered      |
/// |-----------------------|---------------|
/// | (root)                | ""            |
/// | "name"                | "name"        |
/// | 2                     | "[2]"         |
/// | "a", "b", 0, "c"      | "a.b[0].c"    |
/// | 0, "x"                | "[0].x"       |
///
/// - The first key has no leading separator
/// - Every later key is prefixed with '.'
/// - Indices are written as [i] directly after the previous segment
/// - Keys are written verbatim: a key containing '.' or '[' is not escaped,
///   so use the segments (not the string) when an exact address matters

#pragma once

#include <deep_diff/api.h>
#include <deep_diff/value.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace deep_diff {

using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

/// Append one segment to an already rendered path
/// @param out Rendered path so far (empty for the root)
/// @param elem Key or index to append
DEEP_DIFF_API void append_path_element(std::string& out, const PathElement& elem);

/// Render a path with the convention above
[[nodiscard]] DEEP_DIFF_API std::string path_to_string(const Path& path);

/// Look up the value at a path.
/// @return The value, or std::nullopt if any segment does not exist
///         (missing key, index out of range, or key/index on the wrong kind).
///         A present null is returned as a null Value, not as std::nullopt.
[[nodiscard]] DEEP_DIFF_API std::optional<Value> get_at_path(const Value& root, const Path& path);

} // namespace deep_diff
