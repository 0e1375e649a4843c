// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the path records and the re-export lists of modules.
 */

#include "MetadataEncoderImpl.h"

#include "metalith/Utils/CheckUtils.h"

using namespace Metalith;
using namespace Metalith::AST;
using namespace Metalith::Metadata;

void MetadataEncoder::MetadataEncoderImpl::EncodePath(const Path& path)
{
    writer->StartTag(Tag::PATH);
    writer->WrTaggedU32(Tag::PATH_LEN, static_cast<uint32_t>(path.size()));
    for (auto& elem : path) {
        writer->WrTaggedStr(elem.kind == PathElemKind::MOD ? Tag::PATH_ELEM_MOD : Tag::PATH_ELEM_NAME, elem.name);
    }
    writer->EndTag();
}

const Path& MetadataEncoder::MetadataEncoderImpl::PathOf(NodeId id) const
{
    auto* path = declMap->FindPath(id);
    // Every item and foreign item of the unit is collected by the DeclMap.
    MLT_NULLPTR_CHECK(path);
    return *path;
}

void MetadataEncoder::MetadataEncoderImpl::EncodeReexports(NodeId moduleId, const Path& modPath)
{
    auto* exports = store.LookupExports(moduleId);
    if (!exports) {
        return;
    }
    for (auto& exp : *exports) {
        EncodeReexport(exp.target, exp.name);
        EncodeReexportedMethods(exp, modPath);
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodeReexportedMethods(const Sema::Export& exp, const Path& modPath)
{
    if (!exp.target.IsLocal()) {
        return;
    }
    auto item = declMap->FindItem(exp.target.node);
    if (!item) {
        return;
    }
    // An item reached under its own name from its own module is found by readers through the item itself.
    auto& itemPath = PathOf(item->id);
    Path parentPath(itemPath.begin(), itemPath.end() - (itemPath.empty() ? 0 : 1));
    if (parentPath == modPath && item->name == exp.name) {
        return;
    }
    if (!EncodeReexportedInherentMethods(exp)) {
        (void)EncodeReexportedTraitMethods(exp);
    }
}

bool MetadataEncoder::MetadataEncoderImpl::EncodeReexportedInherentMethods(const Sema::Export& exp)
{
    auto* impls = store.LookupInherentImpls(exp.target);
    if (!impls) {
        return false;
    }
    for (auto& impl : *impls) {
        auto* itemIds = store.LookupImplItemIds(impl);
        if (!itemIds) {
            continue;
        }
        for (auto& itemId : *itemIds) {
            if (itemId.kind != Sema::AssocKind::METHOD) {
                continue;
            }
            auto* method = store.LookupAssocItem(itemId.id);
            if (method) {
                EncodeReexport(itemId.id, exp.name + "::" + method->name);
            }
        }
    }
    return true;
}

bool MetadataEncoder::MetadataEncoderImpl::EncodeReexportedTraitMethods(const Sema::Export& exp)
{
    auto* itemIds = store.LookupTraitItemIds(exp.target);
    if (!itemIds) {
        return false;
    }
    for (auto& itemId : *itemIds) {
        if (itemId.kind != Sema::AssocKind::METHOD) {
            continue;
        }
        auto* method = store.LookupAssocItem(itemId.id);
        if (method) {
            EncodeReexport(itemId.id, exp.name + "::" + method->name);
        }
    }
    return true;
}

void MetadataEncoder::MetadataEncoderImpl::EncodeReexport(DeclId target, const std::string& name)
{
    writer->StartTag(Tag::ITEMS_DATA_ITEM_REEXPORT);
    writer->WrTaggedU64(Tag::ITEMS_DATA_ITEM_REEXPORT_DEF_ID, target.Pack());
    writer->WrTaggedStr(Tag::ITEMS_DATA_ITEM_REEXPORT_NAME, name);
    writer->EndTag();
}
