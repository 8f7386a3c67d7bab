// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Value type definition for JSON-like dynamic data.
///
/// The Value type can represent:
/// - Null (std::monostate)
/// - Boolean
/// - Number: int64_t for integers that fit, double for everything else
/// - String
/// - Array: immer::vector of boxed values
/// - Object: immer::map from string key to boxed value
///
/// Containers are immer persistent structures, so copying a Value is O(1)
/// and unchanged subtrees of two related trees share their nodes.
///
/// The Value type is templated on a memory policy, allowing users to
/// customize memory allocation strategies for the underlying immer containers.

#pragma once

#include "deep_diff_config.h"
#include "api.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cmath>
#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace deep_diff {

namespace detail {

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DEEP_DIFF_VERBOSE_LOG
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
#if DEEP_DIFF_VERBOSE_LOG
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

/// True when d holds exactly the integer i.
/// [-2^63, 2^63) is the int64_t range and both bounds are exact doubles.
[[nodiscard]] inline bool integer_equals_double(int64_t i, double d) noexcept
{
    if (!std::isfinite(d) || std::trunc(d) != d) {
        return false;
    }
    if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
        return false;
    }
    return static_cast<int64_t>(d) == i;
}

} // namespace detail

// ============================================================
// ValueKind - the six JSON kinds
//
// Several variant alternatives may share one kind (int64_t and double
// are both Number). The diff compares kinds, never variant indices.
// ============================================================
enum class ValueKind : uint8_t { Null, Boolean, Number, String, Array, Object };

/// "null", "boolean", "number", "string", "array" or "object"
[[nodiscard]] DEEP_DIFF_API const char* kind_name(ValueKind kind) noexcept;

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                  BasicValueBox<MemoryPolicy>,
                                  std::hash<std::string>,
                                  std::equal_to<std::string>,
                                  MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>,
                                        MemoryPolicy>;

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;

    using data_type = std::variant<int64_t,
                                   double,
                                   bool,
                                   std::string,
                                   value_map,
                                   value_vector,
                                   std::monostate>;

    data_type data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}

    template <std::integral T>
        requires (!std::same_as<T, bool>)
    constexpr BasicValue(T v) noexcept : data(integer_data(v)) {}

    template <std::floating_point T>
    constexpr BasicValue(T v) noexcept : data(static_cast<double>(v)) {}

    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_map v) : data(std::move(v)) {}
    BasicValue(value_vector v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }

    [[nodiscard]] ValueKind kind() const noexcept {
        switch (data.index()) {
            case 0:
            case 1: return ValueKind::Number;
            case 2: return ValueKind::Boolean;
            case 3: return ValueKind::String;
            case 4: return ValueKind::Object;
            case 5: return ValueKind::Array;
            default: return ValueKind::Null;
        }
    }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<int64_t>() || is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<value_map>(); }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at_or(const std::string& key, BasicValue default_val) const {
        if (!contains(key)) return default_val;
        return at(key);
    }

    [[nodiscard]] BasicValue at_or(std::size_t index, BasicValue default_val) const {
        if (!contains(index)) return default_val;
        return at(index);
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] value_map as_map(value_map default_val = {}) const {
        if (auto* p = get_if<value_map>()) return *p;
        return default_val;
    }

    [[nodiscard]] value_vector as_vector(value_vector default_val = {}) const {
        if (auto* p = get_if<value_vector>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    [[nodiscard]] bool contains(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) return index < v->size();
        return false;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-object type");
        return *this;
    }

    [[nodiscard]] BasicValue set(std::size_t index, BasicValue val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return v->set(index, value_box{std::move(val)});
        }
        detail::log_index_error("Value::set", index, "out of range or non-array type");
        return *this;
    }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key);
        return 0;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }

private:
    // Integers outside the int64_t range (large uint64_t) are kept as double
    template <std::integral T>
    static constexpr data_type integer_data(T v) noexcept {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
            if (v > static_cast<T>(std::numeric_limits<int64_t>::max())) {
                return data_type{std::in_place_type<double>, static_cast<double>(v)};
            }
        }
        return data_type{std::in_place_type<int64_t>, static_cast<int64_t>(v)};
    }
};

// ============================================================
// Memory Policy Definitions
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

using Value       = BasicValue<unsafe_memory_policy>;
using ValueBox    = BasicValueBox<unsafe_memory_policy>;
using ValueMap    = BasicValueMap<unsafe_memory_policy>;
using ValueVector = BasicValueVector<unsafe_memory_policy>;

// ============================================================
// Number equality
//
// The one numeric rule used by operator== and by the diff:
//   int64 / int64   : exact
//   double / double : by value, NaN equals NaN
//   int64 / double  : the double must hold exactly that integer
// So 1 == 1.0 and 1.5 == 1.50; "1.5" (a string) is never a number.
// ============================================================

template <typename MemoryPolicy>
[[nodiscard]] bool numbers_equal(const BasicValue<MemoryPolicy>& a,
                                 const BasicValue<MemoryPolicy>& b) noexcept
{
    const auto* ai = a.template get_if<int64_t>();
    const auto* bi = b.template get_if<int64_t>();
    if (ai && bi) return *ai == *bi;

    const auto* ad = a.template get_if<double>();
    const auto* bd = b.template get_if<double>();
    if (ad && bd) return *ad == *bd || (std::isnan(*ad) && std::isnan(*bd));

    if (ai && bd) return detail::integer_equals_double(*ai, *bd);
    if (ad && bi) return detail::integer_equals_double(*bi, *ad);
    return false;
}

/// Structural equality. Objects compare by key set regardless of insertion
/// order, arrays compare position by position.
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    if (a.is_number() && b.is_number()) {
        return numbers_equal(a, b);
    }
    if (a.data.index() != b.data.index()) {
        return false;
    }
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else {
            // immer containers compare element-wise through BasicValue::operator==
            return lhs == std::get<T>(b.data);
        }
    }, a.data);
}

// ============================================================
// Utility functions
// ============================================================

// Convert Value to a short human-readable string ("Alice", 42, {object:3})
[[nodiscard]] DEEP_DIFF_API std::string value_to_string(const Value& val);

// Print Value with indentation
DEEP_DIFF_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

extern template struct BasicValue<unsafe_memory_policy>;

} // namespace deep_diff
