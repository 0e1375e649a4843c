// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares DeclMap, which resolves a local node id to its item and its module path.
 */

#ifndef METALITH_AST_DECLMAP_H
#define METALITH_AST_DECLMAP_H

#include <string>
#include <unordered_map>
#include <vector>

#include "metalith/AST/Node.h"

namespace Metalith::AST {
enum class PathElemKind : uint8_t { MOD, NAME };

struct PathElem {
    PathElemKind kind;
    std::string name;

    bool operator==(const PathElem& other) const
    {
        return kind == other.kind && name == other.name;
    }
};

using Path = std::vector<PathElem>;

/// `path` extended by one element.
Path ChainPath(const Path& path, PathElemKind kind, const std::string& name);

class DeclMap {
public:
    explicit DeclMap(const Unit& unit);

    /// Item with @p id, or null when @p id is not an item of this unit (fields, members, foreign items...).
    Ptr<const Item> FindItem(NodeId id) const;

    /// Full path of the item or foreign item @p id, the item's own element included.
    const Path* FindPath(NodeId id) const;

private:
    void Collect(const std::vector<OwnedPtr<Item>>& items, const Path& modPath);

    std::unordered_map<NodeId, Ptr<const Item>> items;
    std::unordered_map<NodeId, Path> paths;
};
} // namespace Metalith::AST

#endif
