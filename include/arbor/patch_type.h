// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_type.h
/// @brief Kinds of patch produced by the diff engine.

#pragma once

#include <arbor/api.h>

#include <cstdint>
#include <string_view>

namespace arbor {

enum class PatchType : std::uint8_t {
    InsertBeforeNode,  ///< insert nodes as siblings before the node at path
    InsertAfterNode,   ///< insert nodes as siblings after the node at path
    AppendChildren,    ///< append nodes to the children of the node at path
    RemoveNode,        ///< remove the node at path
    ReplaceNode,       ///< replace the node at path with one node
    MoveBeforeNode,    ///< move the nodes at node_paths before the node at path
    MoveAfterNode,     ///< move the nodes at node_paths after the node at path
    AddAttributes,     ///< add or overwrite attributes (by name) of the element at path
    RemoveAttributes,  ///< remove attributes (by name) from the element at path
    ChangeLeaf,        ///< replace the leaf at path with another leaf
};

/// Stable display name, e.g. "InsertBeforeNode"
[[nodiscard]] ARBOR_API std::string_view patch_type_name(PatchType type) noexcept;

} // namespace arbor
