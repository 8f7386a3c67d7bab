// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Recursive, path-addressed diff of two Value trees.
///
/// deep_diff(a, b) walks both trees in lock-step (depth-first, pre-order)
/// and returns one Difference per point of divergence:
///
/// - Kinds differ: one Difference at that path, children are not visited
/// - Leaves differ: one Difference at that path
/// - Array: compared index by index; extra elements on either side are
///   reported with the missing side absent
/// - Object: keys of `a` in a's iteration order, then keys only in `b` in
///   b's iteration order; a key missing on one side is reported with that
///   side absent
///
/// Absent (std::nullopt) is distinct from a present null.
///
/// @code
///   auto a = Value::map({{"name", "Alice"}, {"age", 30}});
///   auto b = Value::map({{"name", "Bob"}, {"age", 30}});
///   for (const auto& d : deep_diff(a, b)) {
///       std::cout << difference_to_string(d) << "\n";   // CHANGE name: "Alice" -> "Bob"
///   }
/// @endcode
///
/// Recursion depth equals the depth of the deeper input. Callers diffing
/// untrusted input should cap nesting before calling in.

#pragma once

#include <deep_diff/api.h>
#include <deep_diff/path.h>
#include <deep_diff/value.h>

#include <optional>
#include <string>
#include <vector>

namespace deep_diff {

// ============================================================
// Difference - records a single divergence
// ============================================================
struct Difference {
    enum class Type { Add, Remove, Change };

    std::string path;               // Rendered path, see path.h ("" for the root)
    Path segments;                  // Same path as segments
    std::optional<Value> before;    // Value in the first tree, nullopt if absent there
    std::optional<Value> after;     // Value in the second tree, nullopt if absent there

    Difference(const Path& p, std::optional<Value> before_v, std::optional<Value> after_v)
        : path(path_to_string(p)), segments(p),
          before(std::move(before_v)), after(std::move(after_v)) {}

    /// Add when absent before, Remove when absent after, Change otherwise
    [[nodiscard]] Type type() const noexcept {
        if (!before) return Type::Add;
        if (!after) return Type::Remove;
        return Type::Change;
    }

    /// Get the value that was added/removed/changed
    /// For Add and Change: the after value. For Remove: the before value.
    /// Null when both sides are absent.
    [[nodiscard]] const Value& value() const {
        const auto& side = (type() == Type::Remove) ? before : after;
        if (side) return *side;
        static const Value absent_value;
        return absent_value;
    }

    /// Same path, before and after swapped
    [[nodiscard]] Difference reversed() const {
        Difference d;
        d.path = path;
        d.segments = segments;
        d.before = after;
        d.after = before;
        return d;
    }

private:
    Difference() = default;
};

DEEP_DIFF_API bool operator==(const Difference& a, const Difference& b);

using DifferenceList = std::vector<Difference>;

// ============================================================
// DiffCollector
//
// Collects differences between two Value trees.
//
// Supports two modes:
// - Recursive mode (default): descends into matching containers down to
//   the leaves, as deep_diff() does
// - Shallow mode: a container whose content differs is reported as a
//   single Change at its own path (one entry per differing container)
//
// Subtrees that share the same immer node on both sides are skipped
// without being walked.
// ============================================================
class DEEP_DIFF_API DiffCollector {
private:
    DifferenceList diffs_;
    bool recursive_ = true;

    // Path is passed by reference and grown/shrunk with push_back/pop_back
    void diff_value(const Value& old_val, const Value& new_val, Path& current_path);
    void diff_map(const ValueMap& old_map, const ValueMap& new_map, Path& current_path);
    void diff_vector(const ValueVector& old_vec, const ValueVector& new_vec, Path& current_path);
    void add_change(const Path& current_path, const Value& old_val, const Value& new_val);

public:
    /// Compare two Values, replacing any previously collected result
    /// @param recursive true = report down to the leaves, false = stop at the first differing container
    void diff(const Value& old_val, const Value& new_val, bool recursive = true);

    [[nodiscard]] const DifferenceList& get_diffs() const;

    /// Move the collected differences out, leaving the collector empty
    [[nodiscard]] DifferenceList take_diffs();

    void clear();

    [[nodiscard]] bool has_changes() const;

    [[nodiscard]] bool is_recursive() const { return recursive_; }

    // Print diffs to stdout
    void print_diffs() const;
};

/// Compute every difference between two values (recursive mode).
/// Empty if and only if a == b.
[[nodiscard]] DEEP_DIFF_API DifferenceList deep_diff(const Value& a, const Value& b);

// ============================================================
// Quick change detection (early exit)
//
// For when only IF matters, not WHAT. Stops at the first divergence.
// has_any_difference(a, b) == !deep_diff(a, b).empty()
// ============================================================
[[nodiscard]] DEEP_DIFF_API bool has_any_difference(const Value& old_val, const Value& new_val);

namespace detail {
    [[nodiscard]] bool values_differ(const Value& old_val, const Value& new_val);
    [[nodiscard]] bool maps_differ(const ValueMap& old_map, const ValueMap& new_map);
    [[nodiscard]] bool vectors_differ(const ValueVector& old_vec, const ValueVector& new_vec);
}

// ============================================================
// Rendering
// ============================================================

/// One line per difference:
///   CHANGE a.b: 1 -> 2
///   ADD    tags[3]: "new"
///   REMOVE email: "bob@test.com"
/// The root path is shown as "<root>".
[[nodiscard]] DEEP_DIFF_API std::string difference_to_string(const Difference& d);

DEEP_DIFF_API std::ostream& operator<<(std::ostream& os, const Difference& d);

} // namespace deep_diff
