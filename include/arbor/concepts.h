// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for type constraints in arbor.
///
/// Trees are generic over the types of their namespaces, tags, leaves,
/// attribute names, attribute values and keys. These concepts state what
/// the diff engine needs from each of them, so that mismatched or
/// unsuitable type parameters are rejected at compile time.
///
/// @note Requires C++20 or later.

#pragma once

#include <concepts>
#include <cstddef>
#include <functional>

namespace arbor {

// ============================================================
// Component Type Concepts
// ============================================================

/// Concept for types the diff engine compares by value
template<typename T>
concept Comparable = std::equality_comparable<T> && std::copy_constructible<T>;

/// Concept for key types: compared by value and hashed into the
/// reconciler's key tables
template<typename T>
concept HashableKey = Comparable<T> && requires(const T& k) {
    { std::hash<T>{}(k) } -> std::convertible_to<std::size_t>;
};

/// Concept for types that look like immer memory policies
/// (This is a simplified check; immer doesn't expose a formal concept)
template<typename T>
concept MemoryPolicyLike = requires {
    typename T::heap;
    typename T::refcount;
};

// ============================================================
// Tree Traits Concept
// ============================================================

/// Concept for the traits bundle that parameterizes a tree.
///
/// A conforming traits type looks like:
/// @code
/// struct MyTraits {
///     using memory_policy        = arbor::unsafe_memory_policy;
///     using namespace_type       = std::string;
///     using tag_type             = std::string;
///     using leaf_type            = std::string;
///     using attribute_name_type  = std::string;
///     using attribute_value_type = std::string;
///     using key_type             = std::string;
/// };
/// @endcode
template<typename T>
concept NodeTraits = requires {
    typename T::memory_policy;
    typename T::namespace_type;
    typename T::tag_type;
    typename T::leaf_type;
    typename T::attribute_name_type;
    typename T::attribute_value_type;
    typename T::key_type;
} && MemoryPolicyLike<typename T::memory_policy>
  && Comparable<typename T::namespace_type>
  && Comparable<typename T::tag_type>
  && Comparable<typename T::leaf_type>
  && Comparable<typename T::attribute_name_type>
  && Comparable<typename T::attribute_value_type>
  && HashableKey<typename T::key_type>;

} // namespace arbor
