// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for O(n) construction of Value containers.
///
/// - MapBuilder: build an object
/// - VectorBuilder: build an array
///
/// Usage:
/// @code
///   #include <deep_diff/builders.h>
///
///   Value config = MapBuilder()
///       .set("width", 1920)
///       .set("height", 1080)
///       .set("fullscreen", true)
///       .finish();
///
///   Value items = VectorBuilder()
///       .push_back("item1")
///       .push_back("item2")
///       .finish();
/// @endcode

#pragma once

#include "value.h"

namespace deep_diff {

/// Builder for constructing value_map efficiently - O(n) complexity
template <typename MemoryPolicy>
class BasicMapBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_map = BasicValueMap<MemoryPolicy>;
    using transient_type = typename value_map::transient_type;

    BasicMapBuilder() : transient_(value_map{}.transient()) {}
    explicit BasicMapBuilder(const value_map& existing) : transient_(existing.transient()) {}

    /// Start from an existing object; any other kind starts empty
    explicit BasicMapBuilder(const value_type& existing)
        : transient_(existing.template is<value_map>()
            ? existing.template get_if<value_map>()->transient()
            : value_map{}.transient()) {}

    BasicMapBuilder(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder& operator=(BasicMapBuilder&&) noexcept = default;

    // Transients must not be shared
    BasicMapBuilder(const BasicMapBuilder&) = delete;
    BasicMapBuilder& operator=(const BasicMapBuilder&) = delete;

    /// Set a key-value pair, replacing any previous value for the key
    template <typename T>
    BasicMapBuilder& set(const std::string& key, T&& val) {
        transient_.set(key, value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    BasicMapBuilder& set(const std::string& key, value_type val) {
        transient_.set(key, value_box{std::move(val)});
        return *this;
    }

    /// Remove a key if present
    BasicMapBuilder& erase(const std::string& key) {
        transient_.erase(key);
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Finish building and return the immutable Value
    /// Note: After calling finish(), the builder is in an undefined state
    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

    [[nodiscard]] value_map finish_map() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

/// Builder for constructing value_vector efficiently - O(n) complexity
template <typename MemoryPolicy>
class BasicVectorBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_vector = BasicValueVector<MemoryPolicy>;
    using transient_type = typename value_vector::transient_type;

    BasicVectorBuilder() : transient_(value_vector{}.transient()) {}

    explicit BasicVectorBuilder(const value_vector& existing)
        : transient_(existing.transient()) {}

    explicit BasicVectorBuilder(const value_type& existing)
        : transient_(existing.template is<value_vector>()
            ? existing.template get_if<value_vector>()->transient()
            : value_vector{}.transient()) {}

    BasicVectorBuilder(BasicVectorBuilder&&) noexcept = default;
    BasicVectorBuilder& operator=(BasicVectorBuilder&&) noexcept = default;

    BasicVectorBuilder(const BasicVectorBuilder&) = delete;
    BasicVectorBuilder& operator=(const BasicVectorBuilder&) = delete;

    template <typename T>
    BasicVectorBuilder& push_back(T&& val) {
        transient_.push_back(value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    BasicVectorBuilder& push_back(value_type val) {
        transient_.push_back(value_box{std::move(val)});
        return *this;
    }

    /// Replace the element at index; out-of-range indices are ignored
    template <typename T>
    BasicVectorBuilder& set(std::size_t index, T&& val) {
        if (index < transient_.size()) {
            transient_.set(index, value_box{value_type{std::forward<T>(val)}});
        } else {
            detail::log_index_error("VectorBuilder::set", index, "out of range");
        }
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

    [[nodiscard]] value_vector finish_vector() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

using MapBuilder    = BasicMapBuilder<unsafe_memory_policy>;
using VectorBuilder = BasicVectorBuilder<unsafe_memory_policy>;

extern template class BasicMapBuilder<unsafe_memory_policy>;
extern template class BasicVectorBuilder<unsafe_memory_policy>;

} // namespace deep_diff
