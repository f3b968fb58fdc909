// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <arbor/patch_type.h>

namespace arbor {

std::string_view patch_type_name(PatchType type) noexcept
{
    switch (type) {
    case PatchType::InsertBeforeNode: return "InsertBeforeNode";
    case PatchType::InsertAfterNode:  return "InsertAfterNode";
    case PatchType::AppendChildren:   return "AppendChildren";
    case PatchType::RemoveNode:       return "RemoveNode";
    case PatchType::ReplaceNode:      return "ReplaceNode";
    case PatchType::MoveBeforeNode:   return "MoveBeforeNode";
    case PatchType::MoveAfterNode:    return "MoveAfterNode";
    case PatchType::AddAttributes:    return "AddAttributes";
    case PatchType::RemoveAttributes: return "RemoveAttributes";
    case PatchType::ChangeLeaf:       return "ChangeLeaf";
    }
    return "Unknown";
}

} // namespace arbor
