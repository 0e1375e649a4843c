// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements DeclMap.
 */

#include "metalith/AST/DeclMap.h"

using namespace Metalith;
using namespace Metalith::AST;

Path AST::ChainPath(const Path& path, PathElemKind kind, const std::string& name)
{
    Path result = path;
    result.push_back({kind, name});
    return result;
}

DeclMap::DeclMap(const Unit& unit)
{
    paths.emplace(UNIT_ROOT_NODE, Path{});
    Collect(unit.items, {});
}

void DeclMap::Collect(const std::vector<OwnedPtr<Item>>& decls, const Path& modPath)
{
    for (auto& item : decls) {
        auto kind = item->kind == ItemKind::MOD ? PathElemKind::MOD : PathElemKind::NAME;
        auto path = ChainPath(modPath, kind, item->name);
        items.emplace(item->id, item.get());
        paths.emplace(item->id, path);
        if (item->kind == ItemKind::MOD) {
            Collect(static_cast<const ModDecl&>(*item).items, path);
        } else if (item->kind == ItemKind::FOREIGN_MOD) {
            // Foreign blocks are transparent in paths.
            for (auto& foreignItem : static_cast<const ForeignModDecl&>(*item).items) {
                paths.emplace(foreignItem.id, ChainPath(modPath, PathElemKind::NAME, foreignItem.name));
            }
        }
    }
}

Ptr<const Item> DeclMap::FindItem(NodeId id) const
{
    auto found = items.find(id);
    return found == items.end() ? nullptr : found->second;
}

const Path* DeclMap::FindPath(NodeId id) const
{
    auto found = paths.find(id);
    return found == paths.end() ? nullptr : &found->second;
}
