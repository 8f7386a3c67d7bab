// value_diff.cpp - DiffCollector, deep_diff and early-exit detection

#include <deep_diff/value_diff.h>

#include <algorithm>
#include <iostream>
#include <sstream>

namespace deep_diff {

namespace {

// Same immer node on both sides: equal without walking it
bool same_node(const ValueMap& a, const ValueMap& b)
{
    return a.impl().root == b.impl().root && a.impl().size == b.impl().size;
}

bool same_node(const ValueVector& a, const ValueVector& b)
{
    return a.impl().root == b.impl().root &&
           a.impl().tail == b.impl().tail &&
           a.impl().size == b.impl().size;
}

const char* type_label(Difference::Type type)
{
    switch (type) {
        case Difference::Type::Add:    return "ADD   ";
        case Difference::Type::Remove: return "REMOVE";
        case Difference::Type::Change: return "CHANGE";
    }
    return "?     ";
}

std::string side_to_string(const std::optional<Value>& side)
{
    return side ? value_to_string(*side) : "<absent>";
}

} // anonymous namespace

bool operator==(const Difference& a, const Difference& b)
{
    return a.path == b.path && a.segments == b.segments &&
           a.before == b.before && a.after == b.after;
}

// ============================================================
// DiffCollector Implementation
// ============================================================

void DiffCollector::diff(const Value& old_val, const Value& new_val, bool recursive)
{
    diffs_.clear();
    recursive_ = recursive;

    // Same object compared to itself
    if (&old_val.data == &new_val.data) {
        return;
    }

    Path root_path;
    root_path.reserve(16);
    diff_value(old_val, new_val, root_path);
}

const DifferenceList& DiffCollector::get_diffs() const
{
    return diffs_;
}

DifferenceList DiffCollector::take_diffs()
{
    DifferenceList out;
    out.swap(diffs_);
    return out;
}

void DiffCollector::clear()
{
    diffs_.clear();
}

bool DiffCollector::has_changes() const
{
    return !diffs_.empty();
}

void DiffCollector::print_diffs() const
{
    if (diffs_.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for (const auto& d : diffs_) {
        std::cout << "  " << difference_to_string(d) << "\n";
    }
}

void DiffCollector::add_change(const Path& current_path, const Value& old_val, const Value& new_val)
{
    diffs_.emplace_back(current_path, old_val, new_val);
}

void DiffCollector::diff_value(const Value& old_val, const Value& new_val, Path& current_path)
{
    // A kind mismatch covers everything below it
    if (old_val.kind() != new_val.kind()) [[unlikely]] {
        add_change(current_path, old_val, new_val);
        return;
    }

    std::visit([&](const auto& old_arg) {
        using T = std::decay_t<decltype(old_arg)>;

        if constexpr (std::is_same_v<T, ValueMap>) {
            const auto& new_map = std::get<ValueMap>(new_val.data);
            if (same_node(old_arg, new_map)) [[likely]] {
                return;
            }
            if (!recursive_) {
                if (detail::maps_differ(old_arg, new_map)) {
                    add_change(current_path, old_val, new_val);
                }
                return;
            }
            diff_map(old_arg, new_map, current_path);
        }
        else if constexpr (std::is_same_v<T, ValueVector>) {
            const auto& new_vec = std::get<ValueVector>(new_val.data);
            if (same_node(old_arg, new_vec)) [[likely]] {
                return;
            }
            if (!recursive_) {
                if (detail::vectors_differ(old_arg, new_vec)) {
                    add_change(current_path, old_val, new_val);
                }
                return;
            }
            diff_vector(old_arg, new_vec, current_path);
        }
        else if constexpr (std::is_same_v<T, std::monostate>) {
            // Both null, no change
        }
        else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            // Same kind but possibly int64 vs double
            if (!numbers_equal(old_val, new_val)) {
                add_change(current_path, old_val, new_val);
            }
        }
        else {
            // bool and string: kinds match, so the alternative matches too
            if (old_arg != std::get<T>(new_val.data)) {
                add_change(current_path, old_val, new_val);
            }
        }
    }, old_val.data);
}

void DiffCollector::diff_map(const ValueMap& old_map, const ValueMap& new_map, Path& current_path)
{
    // Keys of the old map in its own order: changed or removed
    for (const auto& [key, old_box] : old_map) {
        current_path.push_back(key);
        if (const auto* new_box = new_map.find(key)) {
            // Shared box: unchanged
            if (&old_box.get() != &new_box->get()) {
                diff_value(*old_box, **new_box, current_path);
            }
        } else {
            diffs_.emplace_back(current_path, *old_box, std::nullopt);
        }
        current_path.pop_back();
    }

    // Then keys only in the new map, in its own order
    for (const auto& [key, new_box] : new_map) {
        if (old_map.count(key) == 0) {
            current_path.push_back(key);
            diffs_.emplace_back(current_path, std::nullopt, *new_box);
            current_path.pop_back();
        }
    }
}

void DiffCollector::diff_vector(const ValueVector& old_vec, const ValueVector& new_vec, Path& current_path)
{
    const std::size_t old_size = old_vec.size();
    const std::size_t new_size = new_vec.size();
    const std::size_t common_size = std::min(old_size, new_size);

    for (std::size_t i = 0; i < common_size; ++i) {
        const auto& old_box = old_vec[i];
        const auto& new_box = new_vec[i];

        if (&old_box.get() == &new_box.get()) [[likely]] {
            continue;
        }

        current_path.push_back(i);
        diff_value(*old_box, *new_box, current_path);
        current_path.pop_back();
    }

    // Removed tail elements
    for (std::size_t i = common_size; i < old_size; ++i) {
        current_path.push_back(i);
        diffs_.emplace_back(current_path, *old_vec[i], std::nullopt);
        current_path.pop_back();
    }

    // Added tail elements
    for (std::size_t i = common_size; i < new_size; ++i) {
        current_path.push_back(i);
        diffs_.emplace_back(current_path, std::nullopt, *new_vec[i]);
        current_path.pop_back();
    }
}

DifferenceList deep_diff(const Value& a, const Value& b)
{
    DiffCollector collector;
    collector.diff(a, b);
    return collector.take_diffs();
}

// ============================================================
// Early-exit detection
// ============================================================

bool has_any_difference(const Value& old_val, const Value& new_val)
{
    // Fast path: same object
    if (&old_val.data == &new_val.data) {
        return false;
    }
    return detail::values_differ(old_val, new_val);
}

namespace detail {

bool values_differ(const Value& old_val, const Value& new_val)
{
    if (old_val.kind() != new_val.kind()) [[unlikely]] {
        return true;
    }

    return std::visit([&](const auto& old_arg) -> bool {
        using T = std::decay_t<decltype(old_arg)>;

        if constexpr (std::is_same_v<T, ValueMap>) {
            const auto& new_map = std::get<ValueMap>(new_val.data);
            if (same_node(old_arg, new_map)) [[likely]] {
                return false;
            }
            return maps_differ(old_arg, new_map);
        }
        else if constexpr (std::is_same_v<T, ValueVector>) {
            const auto& new_vec = std::get<ValueVector>(new_val.data);
            if (same_node(old_arg, new_vec)) [[likely]] {
                return false;
            }
            return vectors_differ(old_arg, new_vec);
        }
        else if constexpr (std::is_same_v<T, std::monostate>) {
            return false;  // Both null
        }
        else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            return !numbers_equal(old_val, new_val);
        }
        else {
            return old_arg != std::get<T>(new_val.data);
        }
    }, old_val.data);
}

bool maps_differ(const ValueMap& old_map, const ValueMap& new_map)
{
    // Same size and every old key present in new: the key sets are equal
    if (old_map.size() != new_map.size()) {
        return true;
    }

    for (const auto& [key, old_box] : old_map) {
        const auto* new_box = new_map.find(key);
        if (!new_box) {
            return true;
        }
        if (&old_box.get() == &new_box->get()) [[likely]] {
            continue;
        }
        if (values_differ(*old_box, **new_box)) {
            return true;
        }
    }
    return false;
}

bool vectors_differ(const ValueVector& old_vec, const ValueVector& new_vec)
{
    const std::size_t old_size = old_vec.size();
    const std::size_t new_size = new_vec.size();

    if (old_size != new_size) {
        return true;
    }

    for (std::size_t i = 0; i < old_size; ++i) {
        const auto& old_box = old_vec[i];
        const auto& new_box = new_vec[i];

        if (&old_box.get() == &new_box.get()) [[likely]] {
            continue;
        }

        if (values_differ(*old_box, *new_box)) {
            return true;
        }
    }

    return false;
}

} // namespace detail

// ============================================================
// Rendering
// ============================================================

std::string difference_to_string(const Difference& d)
{
    std::ostringstream oss;
    oss << type_label(d.type()) << " " << (d.path.empty() ? "<root>" : d.path) << ": ";
    switch (d.type()) {
        case Difference::Type::Change:
            oss << value_to_string(*d.before) << " -> " << value_to_string(*d.after);
            break;
        case Difference::Type::Add:
            oss << side_to_string(d.after);
            break;
        case Difference::Type::Remove:
            oss << side_to_string(d.before);
            break;
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Difference& d)
{
    return os << difference_to_string(d);
}

} // namespace deep_diff
