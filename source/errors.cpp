// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <arbor/errors.h>

namespace arbor {

namespace {

std::string format_message(PatchType type, const TreePath& path, const std::string& reason)
{
    std::string msg{patch_type_name(type)};
    msg += " at ";
    msg += path.to_string();
    msg += ": ";
    msg += reason;
    return msg;
}

} // namespace

PatchError::PatchError(PatchType type, TreePath path, const std::string& reason)
    : std::runtime_error(format_message(type, path, reason))
    , type_(type)
    , path_(std::move(path))
    , reason_(reason)
{}

} // namespace arbor
