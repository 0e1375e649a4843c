// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the unit-level sections written before the declaration records.
 */

#include "MetadataEncoderImpl.h"

#include <algorithm>

using namespace Metalith;
using namespace Metalith::AST;
using namespace Metalith::Metadata;

namespace {
const std::string UNIT_ID_ATTR = "unit_id";

/// Narrowest width, in bytes, that holds every distance between consecutive line starts.
uint8_t LineDiffWidth(const std::vector<uint32_t>& lines)
{
    uint32_t maxDiff = 0;
    for (size_t i = 1; i < lines.size(); ++i) {
        maxDiff = std::max(maxDiff, lines[i] - lines[i - 1]);
    }
    if (maxDiff <= 0xff) {
        return 1;
    }
    return maxDiff <= 0xffff ? 2 : 4;
}
} // namespace

void MetadataEncoder::MetadataEncoderImpl::EncodeUnitName()
{
    writer->WrTaggedStr(Tag::UNIT_NAME, unitInfo.name);
    writer->WrTaggedStr(Tag::UNIT_TRIPLE, unitInfo.triple);
    writer->WrTaggedStr(Tag::UNIT_HASH, unitInfo.hash);
}

void MetadataEncoder::MetadataEncoderImpl::EncodeDylibDependencyFormats()
{
    std::string formats;
    if (unitInfo.dylibFormats) {
        auto& prefs = *unitInfo.dylibFormats;
        for (size_t i = 0; i < prefs.size(); ++i) {
            if (!prefs[i]) {
                continue;
            }
            if (!formats.empty()) {
                formats += ",";
            }
            formats += std::to_string(i + 1) + ":" + (*prefs[i] == LinkagePreference::DYNAMIC ? "d" : "s");
        }
    }
    writer->WrTaggedStr(Tag::DYLIB_DEPENDENCY_FORMATS, formats);
}

void MetadataEncoder::MetadataEncoderImpl::EncodeUnitAttributes(const Unit& unit)
{
    // The unit_id attribute always names the unit being encoded, whatever the source said.
    std::vector<Attribute> attrs;
    for (auto& attr : unit.attrs) {
        if (!attr.CheckName(UNIT_ID_ATTR)) {
            attrs.push_back(attr);
        }
    }
    attrs.push_back(MakeAttribute(MetaItem::NameValue(UNIT_ID_ATTR, unitInfo.name)));
    EncodeAttributes(attrs);
}

void MetadataEncoder::MetadataEncoderImpl::EncodeUnitDeps()
{
    auto deps = unitInfo.deps;
    std::sort(deps.begin(), deps.end(),
        [](const UnitDependency& a, const UnitDependency& b) { return a.unitNumber < b.unitNumber; });
    uint32_t expected = 1;
    for (auto& dep : deps) {
        if (dep.unitNumber != expected) {
            diag.Fatal(DiagKind::METADATA_DEPENDENCY_GAP, expected, dep.unitNumber);
        }
        ++expected;
    }

    writer->StartTag(Tag::UNIT_DEPS);
    for (auto& dep : deps) {
        writer->StartTag(Tag::UNIT_DEP);
        writer->WrTaggedStr(Tag::UNIT_DEP_UNIT_NAME, dep.name);
        writer->WrTaggedStr(Tag::UNIT_DEP_HASH, dep.hash);
        writer->EndTag();
    }
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeLangItems()
{
    auto& table = store.GetLangItems();
    writer->StartTag(Tag::LANG_ITEMS);
    for (size_t i = 0; i < Sema::LANG_ITEM_COUNT; ++i) {
        auto& id = table.items[i];
        if (!id || !id->IsLocal()) {
            continue;
        }
        writer->StartTag(Tag::LANG_ITEMS_ITEM);
        writer->WrTaggedU32(Tag::LANG_ITEMS_ITEM_ID, static_cast<uint32_t>(i));
        writer->WrTaggedU32(Tag::LANG_ITEMS_ITEM_NODE_ID, id->node);
        writer->EndTag();
    }
    for (auto item : table.missing) {
        writer->WrTaggedU32(Tag::LANG_ITEMS_MISSING, static_cast<uint32_t>(item));
    }
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeNativeLibraries()
{
    writer->StartTag(Tag::NATIVE_LIBRARIES);
    for (auto& lib : unitInfo.nativeLibs) {
        // Static libraries are bundled into the unit's own archive.
        if (lib.kind == NativeLibKind::STATIC) {
            continue;
        }
        writer->StartTag(Tag::NATIVE_LIBRARIES_LIB);
        writer->WrTaggedU32(Tag::NATIVE_LIBRARIES_KIND, static_cast<uint32_t>(lib.kind));
        writer->WrTaggedStr(Tag::NATIVE_LIBRARIES_NAME, lib.name);
        writer->EndTag();
    }
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodePluginRegistrarFn()
{
    if (unitInfo.pluginRegistrar) {
        writer->WrTaggedU32(Tag::PLUGIN_REGISTRAR_FN, *unitInfo.pluginRegistrar);
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodeCodemap()
{
    writer->StartTag(Tag::CODEMAP);
    for (auto& source : sm.GetSources()) {
        if (source.isImported || source.lineOffsets.empty()) {
            continue;
        }
        writer->StartTag(Tag::CODEMAP_FILEMAP);
        writer->WrTaggedStr(Tag::FILEMAP_NAME, source.path);
        writer->WrTaggedU32(Tag::FILEMAP_START_POS, source.startPos);
        writer->WrTaggedU32(Tag::FILEMAP_END_POS, source.EndPos());

        // count, diff width, first line start, then the distance to each following line start.
        auto& lines = source.lineOffsets;
        auto width = LineDiffWidth(lines);
        writer->StartTag(Tag::FILEMAP_LINES);
        writer->WrU32BE(static_cast<uint32_t>(lines.size()));
        writer->WrU8(width);
        writer->WrU32BE(lines[0]);
        for (size_t i = 1; i < lines.size(); ++i) {
            uint32_t diff = lines[i] - lines[i - 1];
            for (int shift = (width - 1) * 8; shift >= 0; shift -= 8) {
                writer->WrU8(static_cast<uint8_t>(diff >> static_cast<unsigned>(shift)));
            }
        }
        writer->EndTag();

        writer->StartTag(Tag::FILEMAP_MULTIBYTE_CHARS);
        writer->WrU32BE(static_cast<uint32_t>(source.multiByteChars.size()));
        for (auto& mbc : source.multiByteChars) {
            writer->WrU32BE(mbc.pos);
            writer->WrU8(mbc.bytes);
        }
        writer->EndTag();
        writer->EndTag();
    }
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeMacroDefs(const Unit& unit)
{
    writer->StartTag(Tag::MACRO_DEFS);
    for (auto& def : unit.exportedMacros) {
        writer->StartTag(Tag::MACRO_DEF);
        EncodeName(def.name);
        EncodeAttributes(def.attrs);
        writer->WrTaggedStr(Tag::MACRO_DEF_BODY, def.body);
        writer->EndTag();
    }
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeImpls(const Unit& unit)
{
    writer->StartTag(Tag::IMPLS);
    EncodeEagerImplsIn(unit.items);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeEagerImplsIn(const std::vector<OwnedPtr<Item>>& items)
{
    auto dropTrait = store.GetLangItems().Get(Sema::LangItem::DROP_TRAIT);
    for (auto& item : items) {
        if (item->kind == ItemKind::MOD) {
            EncodeEagerImplsIn(static_cast<const ModDecl&>(*item).items);
            continue;
        }
        if (item->kind != ItemKind::IMPL) {
            continue;
        }
        // Impls of a foreign trait, and destructors, must be loaded before any item is looked up.
        auto* traitRef = store.LookupImplTraitRef(LocalDeclId(item->id));
        if (!traitRef || (traitRef->def.IsLocal() && !(dropTrait && *dropTrait == traitRef->def))) {
            continue;
        }
        writer->StartTag(Tag::IMPLS_IMPL);
        EncodeDefId(LocalDeclId(item->id));
        writer->WrTaggedU64(Tag::IMPLS_IMPL_TRAIT_DEF_ID, traitRef->def.Pack());
        writer->EndTag();
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodeMiscInfo(const Unit& unit)
{
    writer->StartTag(Tag::MISC_INFO);
    writer->StartTag(Tag::MISC_INFO_UNIT_ITEMS);
    for (auto& item : unit.items) {
        if (item->kind == ItemKind::USE || item->kind == ItemKind::EXTERN_UNIT) {
            continue;
        }
        writer->WrTaggedU64(Tag::MOD_CHILD, LocalDeclId(item->id).Pack());
        if (auto aux = AuxiliaryNodeId(*item)) {
            writer->WrTaggedU64(Tag::MOD_CHILD, LocalDeclId(*aux).Pack());
        }
    }
    EncodeReexports(UNIT_ROOT_NODE, {});
    writer->EndTag();
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeReachableExternFns()
{
    writer->StartTag(Tag::REACHABLE_EXTERN_FNS);
    for (auto id : store.GetReachable()) {
        auto item = declMap->FindItem(id);
        if (!item || item->kind != ItemKind::FN) {
            continue;
        }
        auto& fn = static_cast<const FnDecl&>(*item);
        if (fn.sig.abi != Abi::RUST && fn.typeParams.empty()) {
            writer->WrTaggedU32(Tag::REACHABLE_EXTERN_FN_ID, id);
        }
    }
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeStructFieldAttrs(const Unit& unit)
{
    writer->StartTag(Tag::STRUCT_FIELDS);
    EncodeStructFieldAttrsIn(unit.items);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeStructFieldAttrsIn(const std::vector<OwnedPtr<Item>>& items)
{
    auto encodeFields = [this](const std::vector<FieldDecl>& fields) {
        for (auto& field : fields) {
            writer->StartTag(Tag::STRUCT_FIELD);
            writer->WrTaggedU32(Tag::STRUCT_FIELD_ID, field.id);
            EncodeAttributes(field.attrs);
            writer->EndTag();
        }
    };
    for (auto& item : items) {
        switch (item->kind) {
            case ItemKind::MOD:
                EncodeStructFieldAttrsIn(static_cast<const ModDecl&>(*item).items);
                break;
            case ItemKind::STRUCT:
                encodeFields(static_cast<const StructDecl&>(*item).fields);
                break;
            case ItemKind::ENUM:
                for (auto& variant : static_cast<const EnumDecl&>(*item).variants) {
                    if (variant.kind == VariantKind::STRUCT) {
                        encodeFields(variant.fields);
                    }
                }
                break;
            default:
                break;
        }
    }
}
