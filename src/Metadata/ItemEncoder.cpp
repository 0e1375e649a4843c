// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the declaration records. Records are written post-order: the children of a module, the
 * items of a foreign block and the fields of a struct come before the record that owns them. Every record is
 * entered into the item index at its start position.
 */

#include "MetadataEncoderImpl.h"

#include "metalith/Metadata/InliningRules.h"

using namespace Metalith;
using namespace Metalith::AST;
using namespace Metalith::Metadata;

namespace {
char AssocItemSort(Sema::AssocKind kind)
{
    switch (kind) {
        case Sema::AssocKind::CONST:
            return Sort::CONST;
        case Sema::AssocKind::METHOD:
            return Sort::REQUIRED;
        case Sema::AssocKind::TYPE:
            return Sort::TYPE;
    }
    return Sort::REQUIRED;
}

void AddToIndex(RecordWriter& w, ItemIndex& index, NodeId id)
{
    index.push_back({static_cast<int64_t>(id), w.MarkStablePosition()});
}
} // namespace

ItemIndex MetadataEncoder::MetadataEncoderImpl::EncodeItems(const Unit& unit)
{
    ItemIndex index;
    writer->StartTag(Tag::ITEMS_DATA);
    AddToIndex(*writer, index, UNIT_ROOT_NODE);
    EncodeModRecord(UNIT_ROOT_NODE, unit.items, {}, "", Visibility::PUBLIC);
    EncodeItemsIn(unit.items, index);
    writer->EndTag();
    return index;
}

void MetadataEncoder::MetadataEncoderImpl::EncodeItemsIn(const std::vector<OwnedPtr<Item>>& items, ItemIndex& index)
{
    for (auto& item : items) {
        EncodeItem(*item, index);
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodeItem(const Item& item, ItemIndex& index)
{
    switch (item.kind) {
        case ItemKind::EXTERN_UNIT:
        case ItemKind::USE:
            // Imports reach metadata through the re-exports of their module.
            break;
        case ItemKind::STATIC:
            AddToIndex(*writer, index, item.id);
            EncodeStatic(static_cast<const StaticDecl&>(item));
            break;
        case ItemKind::CONST:
            AddToIndex(*writer, index, item.id);
            EncodeConst(static_cast<const ConstDecl&>(item));
            break;
        case ItemKind::FN:
            AddToIndex(*writer, index, item.id);
            EncodeFn(static_cast<const FnDecl&>(item));
            break;
        case ItemKind::MOD: {
            auto& mod = static_cast<const ModDecl&>(item);
            EncodeItemsIn(mod.items, index);
            AddToIndex(*writer, index, item.id);
            EncodeModRecord(item.id, mod.items, item.attrs, item.name, item.vis);
            break;
        }
        case ItemKind::FOREIGN_MOD:
            EncodeForeignMod(static_cast<const ForeignModDecl&>(item), index);
            break;
        case ItemKind::TYPE_ALIAS:
            AddToIndex(*writer, index, item.id);
            EncodeTypeAlias(static_cast<const TypeAliasDecl&>(item));
            break;
        case ItemKind::ENUM:
            EncodeEnum(static_cast<const EnumDecl&>(item), index);
            break;
        case ItemKind::STRUCT:
            EncodeStruct(static_cast<const StructDecl&>(item), index);
            break;
        case ItemKind::DEFAULT_IMPL:
            AddToIndex(*writer, index, item.id);
            EncodeDefaultImpl(static_cast<const DefaultImplDecl&>(item));
            break;
        case ItemKind::IMPL:
            EncodeImpl(static_cast<const ImplDecl&>(item), index);
            break;
        case ItemKind::TRAIT:
            EncodeTrait(static_cast<const TraitDecl&>(item), index);
            break;
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodeModRecord(NodeId id, const std::vector<OwnedPtr<Item>>& children,
    const std::vector<Attribute>& attrs, const std::string& name, Visibility vis)
{
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(LocalDeclId(id));
    EncodeFamily(Family::MOD);
    EncodeName(name);
    for (auto& child : children) {
        if (child->kind == ItemKind::USE || child->kind == ItemKind::EXTERN_UNIT) {
            continue;
        }
        writer->WrTaggedU64(Tag::MOD_CHILD, LocalDeclId(child->id).Pack());
        if (auto aux = AuxiliaryNodeId(*child)) {
            writer->WrTaggedU64(Tag::MOD_CHILD, LocalDeclId(*aux).Pack());
        }
        if (child->kind == ItemKind::IMPL) {
            writer->WrTaggedU64(Tag::MOD_IMPL, LocalDeclId(child->id).Pack());
        }
    }
    auto& path = PathOf(id);
    EncodePath(path);
    EncodeVisibility(vis);
    EncodeStability(LocalDeclId(id));
    if (vis == Visibility::PUBLIC) {
        EncodeReexports(id, path);
    }
    EncodeAttributes(attrs);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeStatic(const StaticDecl& decl)
{
    auto id = LocalDeclId(decl.id);
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(id);
    EncodeFamily(decl.mutability == Mutability::MUTABLE ? Family::MUTABLE_STATIC : Family::IMMUTABLE_STATIC);
    EncodeBoundsAndType(id);
    EncodeSymbol(decl.id);
    EncodeName(decl.name);
    EncodePath(PathOf(decl.id));
    EncodeVisibility(decl.vis);
    EncodeStability(id);
    EncodeAttributes(decl.attrs);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeConst(const ConstDecl& decl)
{
    auto id = LocalDeclId(decl.id);
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(id);
    EncodeFamily(Family::CONST);
    EncodeBoundsAndType(id);
    EncodeName(decl.name);
    EncodePath(PathOf(decl.id));
    EncodeAttributes(decl.attrs);
    EncodeInlinedItem({InlinedItemKind::ITEM, decl.id, std::nullopt});
    EncodeVisibility(decl.vis);
    EncodeStability(id);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeFn(const FnDecl& decl)
{
    auto id = LocalDeclId(decl.id);
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(id);
    EncodeFamily(Family::FN);
    EncodeBoundsAndType(id);
    EncodeName(decl.name);
    EncodePath(PathOf(decl.id));
    EncodeAttributes(decl.attrs);
    bool generic = !decl.typeParams.empty();
    if (NeedsInlinedBody(generic, false, RequestsInline(decl.attrs), decl.sig.constness == Constness::CONST)) {
        EncodeInlinedItem({InlinedItemKind::ITEM, decl.id, std::nullopt});
    }
    if (AttachesLinkageSymbol(generic)) {
        EncodeSymbol(decl.id);
    }
    EncodeConstness(decl.sig.constness);
    EncodeVisibility(decl.vis);
    EncodeStability(id);
    EncodeMethodArgumentNames(decl.sig);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeForeignMod(const ForeignModDecl& decl, ItemIndex& index)
{
    for (auto& item : decl.items) {
        AddToIndex(*writer, index, item.id);
        EncodeForeignItem(item, decl.abi);
    }

    auto id = LocalDeclId(decl.id);
    AddToIndex(*writer, index, decl.id);
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(id);
    EncodeFamily(Family::FOREIGN_MOD);
    EncodeName(decl.name);
    EncodePath(PathOf(decl.id));
    for (auto& item : decl.items) {
        writer->WrTaggedU64(Tag::MOD_CHILD, LocalDeclId(item.id).Pack());
    }
    EncodeVisibility(decl.vis);
    EncodeStability(id);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeForeignItem(const ForeignItem& item, Abi abi)
{
    auto id = LocalDeclId(item.id);
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(id);
    EncodeVisibility(item.vis);
    switch (item.kind) {
        case ForeignItemKind::FN:
            EncodeFamily(Family::FN);
            EncodeBoundsAndType(id);
            EncodeName(item.name);
            if (abi == Abi::RUST_INTRINSIC) {
                EncodeInlinedItem({InlinedItemKind::FOREIGN_ITEM, item.id, std::nullopt});
            }
            EncodeAttributes(item.attrs);
            EncodeStability(id);
            EncodeSymbol(item.id);
            EncodeMethodArgumentNames(item.sig);
            break;
        case ForeignItemKind::STATIC:
            EncodeFamily(item.mutability == Mutability::MUTABLE ? Family::MUTABLE_STATIC : Family::IMMUTABLE_STATIC);
            EncodeBoundsAndType(id);
            EncodeAttributes(item.attrs);
            EncodeStability(id);
            EncodeSymbol(item.id);
            EncodeName(item.name);
            break;
    }
    EncodePath(PathOf(item.id));
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeTypeAlias(const TypeAliasDecl& decl)
{
    auto id = LocalDeclId(decl.id);
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(id);
    EncodeFamily(Family::TYPE);
    EncodeBoundsAndType(id);
    EncodeName(decl.name);
    EncodePath(PathOf(decl.id));
    EncodeVisibility(decl.vis);
    EncodeStability(id);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeEnum(const EnumDecl& decl, ItemIndex& index)
{
    auto id = LocalDeclId(decl.id);
    AddToIndex(*writer, index, decl.id);
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(id);
    EncodeFamily(Family::ENUM);
    EncodeVariances(id);
    EncodeBoundsAndType(id);
    EncodeName(decl.name);
    EncodeAttributes(decl.attrs);
    EncodeReprAttrs(decl.attrs);
    for (auto& variant : decl.variants) {
        auto packed = LocalDeclId(variant.id).Pack();
        writer->WrTaggedU64(Tag::ITEMS_DATA_ITEM_VARIANT, packed);
        writer->WrTaggedU64(Tag::MOD_CHILD, packed);
    }
    EncodeInlinedItem({InlinedItemKind::ITEM, decl.id, std::nullopt});
    EncodePath(PathOf(decl.id));
    EncodeInherentImpls(id);
    EncodeVisibility(decl.vis);
    EncodeStability(id);
    writer->EndTag();

    EncodeVariants(decl, index);
}

void MetadataEncoder::MetadataEncoderImpl::EncodeVariants(const EnumDecl& decl, ItemIndex& index)
{
    auto enumId = LocalDeclId(decl.id);
    auto* infos = store.LookupEnumVariants(enumId);
    auto& enumPath = PathOf(decl.id);
    // Discriminants are only written when they differ from the previous one plus one.
    uint64_t expected = 0;
    for (size_t i = 0; i < decl.variants.size(); ++i) {
        auto& variant = decl.variants[i];
        auto id = LocalDeclId(variant.id);

        const std::vector<Sema::FieldInfo>* fields = nullptr;
        ItemIndex fieldIndex;
        if (variant.kind == VariantKind::STRUCT) {
            fields = &RequireStructFields(id);
            fieldIndex = EncodeFieldRecords(*fields, index);
        }

        AddToIndex(*writer, index, variant.id);
        writer->StartTag(Tag::ITEMS_DATA_ITEM);
        EncodeDefId(id);
        EncodeFamily(variant.kind == VariantKind::TUPLE ? Family::TUPLE_VARIANT : Family::STRUCT_VARIANT);
        EncodeName(variant.name);
        EncodeParentItem(enumId);
        EncodeVisibility(variant.vis);
        EncodeAttributes(variant.attrs);
        EncodeReprAttrs(variant.attrs);
        EncodeStability(id);
        if (fields) {
            EncodeStructFields(*fields, id);
            EncodeI64Index(*writer, fieldIndex);
        }
        uint64_t discriminant = infos && i < infos->size() ? (*infos)[i].discriminant : expected;
        if (discriminant != expected) {
            writer->WrTaggedU64(Tag::ITEMS_DATA_ITEM_DISR_VAL, discriminant);
            expected = discriminant;
        }
        EncodeBoundsAndType(id);
        EncodePath(ChainPath(enumPath, PathElemKind::NAME, variant.name));
        writer->EndTag();
        ++expected;
    }
}

ItemIndex MetadataEncoder::MetadataEncoderImpl::EncodeFieldRecords(
    const std::vector<Sema::FieldInfo>& fields, ItemIndex& index)
{
    ItemIndex ownIndex;
    for (auto& field : fields) {
        IndexEntry<int64_t> entry{static_cast<int64_t>(field.id.node), writer->MarkStablePosition()};
        ownIndex.push_back(entry);
        index.push_back(entry);
        writer->StartTag(Tag::ITEMS_DATA_ITEM);
        EncodeFamily(field.vis == Visibility::PUBLIC ? Family::PUBLIC_FIELD : Family::INHERITED_FIELD);
        EncodeName(field.name);
        EncodeBoundsAndType(field.id);
        EncodeDefId(field.id);
        EncodeStability(field.id);
        writer->EndTag();
    }
    return ownIndex;
}

void MetadataEncoder::MetadataEncoderImpl::EncodeStruct(const StructDecl& decl, ItemIndex& index)
{
    auto id = LocalDeclId(decl.id);
    auto& fields = RequireStructFields(id);
    auto fieldIndex = EncodeFieldRecords(fields, index);

    AddToIndex(*writer, index, decl.id);
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(id);
    EncodeFamily(Family::STRUCT);
    EncodeBoundsAndType(id);
    EncodeVariances(id);
    EncodeName(decl.name);
    EncodeAttributes(decl.attrs);
    EncodePath(PathOf(decl.id));
    EncodeStability(id);
    EncodeVisibility(decl.vis);
    EncodeReprAttrs(decl.attrs);
    EncodeStructFields(fields, id);
    EncodeInlinedItem({InlinedItemKind::ITEM, decl.id, std::nullopt});
    EncodeInherentImpls(id);
    EncodeI64Index(*writer, fieldIndex);
    writer->EndTag();

    if (decl.ctorId) {
        EncodeStructCtor(decl, *decl.ctorId, index);
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodeStructCtor(const StructDecl& decl, NodeId ctorId, ItemIndex& index)
{
    auto id = LocalDeclId(ctorId);
    AddToIndex(*writer, index, ctorId);
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(id);
    EncodeFamily(Family::STRUCT_CTOR);
    EncodeBoundsAndType(id);
    EncodeName(decl.name);
    EncodePath(PathOf(decl.id));
    EncodeParentItem(LocalDeclId(decl.id));
    // Unit-like constructors are plain values and have no symbol.
    if (auto* symbol = store.LookupSymbol(ctorId)) {
        writer->WrTaggedStr(Tag::ITEMS_DATA_ITEM_SYMBOL, *symbol);
    }
    EncodeStability(id);
    writer->WrTaggedBytes(Tag::ITEMS_DATA_ITEM_IS_TUPLE_STRUCT_CTOR, nullptr, 0);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeDefaultImpl(const DefaultImplDecl& decl)
{
    auto id = LocalDeclId(decl.id);
    auto* traitRef = store.LookupImplTraitRef(id);
    if (!traitRef) {
        diag.Fatal(DiagKind::METADATA_MISSING_IMPL_TRAIT_REF, id.ToString());
    }
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(id);
    EncodeFamily(Family::DEFAULT_IMPL);
    EncodeName(decl.name);
    EncodeUnsafety(decl.unsafety);
    EncodeTraitRef(*traitRef, Tag::ITEM_TRAIT_REF);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeImpl(const ImplDecl& decl, ItemIndex& index)
{
    auto id = LocalDeclId(decl.id);
    auto* itemIds = store.LookupImplItemIds(id);
    if (!itemIds) {
        diag.Fatal(DiagKind::METADATA_MISSING_IMPL_ITEMS, id.ToString());
    }

    AddToIndex(*writer, index, decl.id);
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(id);
    EncodeFamily(Family::IMPL);
    EncodeBoundsAndType(id);
    EncodeName(decl.name);
    EncodeAttributes(decl.attrs);
    EncodeUnsafety(decl.unsafety);
    EncodePolarity(decl.polarity);
    if (auto kind = store.LookupCoerceUnsizedKind(id)) {
        writer->WrTaggedU32(Tag::IMPL_COERCE_UNSIZED_KIND, *kind);
    }
    if (!decl.selfTypeBasename.empty()) {
        writer->WrTaggedStr(Tag::ITEM_IMPL_TYPE_BASENAME, decl.selfTypeBasename);
    }
    for (auto& itemId : *itemIds) {
        writer->StartTag(Tag::ITEM_IMPL_ITEM);
        EncodeDefId(itemId.id);
        EncodeItemSort(AssocItemSort(itemId.kind));
        writer->EndTag();
    }
    if (auto* traitRef = store.LookupImplTraitRef(id)) {
        EncodeTraitRef(*traitRef, Tag::ITEM_TRAIT_REF);
    }
    auto& implPath = PathOf(decl.id);
    EncodePath(implPath);
    EncodeStability(id);
    writer->EndTag();

    // Members are matched to the impl body by position. Items the checker synthesized have no source member.
    for (size_t i = 0; i < itemIds->size(); ++i) {
        auto& itemId = (*itemIds)[i];
        if (!itemId.id.IsLocal()) {
            diag.Fatal(DiagKind::METADATA_FOREIGN_IMPL_ITEM, itemId.id.ToString());
        }
        const ImplMember* member = i < decl.members.size() ? &decl.members[i] : nullptr;
        auto& item = RequireAssocItem(itemId.id);
        AddToIndex(*writer, index, itemId.id.node);
        switch (item.kind) {
            case Sema::AssocKind::CONST:
                EncodeImplConst(item, implPath, decl.id, member);
                break;
            case Sema::AssocKind::METHOD:
                EncodeImplMethod(item, implPath, decl.id, member);
                break;
            case Sema::AssocKind::TYPE:
                EncodeImplType(item, implPath, decl.id, member);
                break;
        }
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodeImplConst(
    const Sema::AssocItem& item, const Path& implPath, NodeId implId, const ImplMember* member)
{
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(item.id);
    EncodeName(item.name);
    EncodeVisibility(item.vis);
    EncodeFamily(Family::CONST);
    EncodeProvidedSource(item.providedSource);
    EncodeParentItem(LocalDeclId(implId));
    EncodeItemSort(Sort::CONST);
    EncodeBoundsAndType(item.id);
    EncodeStability(item.id);
    EncodePath(ChainPath(implPath, PathElemKind::NAME, item.name));
    if (member) {
        EncodeAttributes(member->attrs);
        EncodeInlinedItem({InlinedItemKind::IMPL_ITEM, member->id, LocalDeclId(implId)});
    }
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeImplMethod(
    const Sema::AssocItem& item, const Path& implPath, NodeId implId, const ImplMember* member)
{
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeMethodTyFields(item);
    EncodeParentItem(LocalDeclId(implId));
    EncodeItemSort(Sort::REQUIRED);
    EncodeStability(item.id);
    EncodeBoundsAndType(item.id);
    EncodePath(ChainPath(implPath, PathElemKind::NAME, item.name));
    if (member) {
        EncodeAttributes(member->attrs);
        // Parameters of the impl count too: a method of a generic impl is generic.
        bool generic = !RequireTypeScheme(item.id).generics.types.IsEmpty();
        bool isConst = member->sig.constness == Constness::CONST;
        if (NeedsInlinedBody(generic, false, RequestsInline(member->attrs), isConst)) {
            EncodeInlinedItem({InlinedItemKind::IMPL_ITEM, member->id, LocalDeclId(implId)});
        }
        EncodeConstness(member->sig.constness);
        if (AttachesLinkageSymbol(generic)) {
            EncodeSymbol(item.id.node);
        }
        EncodeMethodArgumentNames(member->sig);
    }
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeImplType(
    const Sema::AssocItem& item, const Path& implPath, NodeId implId, const ImplMember* member)
{
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(item.id);
    EncodeName(item.name);
    EncodeVisibility(item.vis);
    EncodeFamily(Family::TYPE);
    EncodeParentItem(LocalDeclId(implId));
    EncodeItemSort(Sort::TYPE);
    EncodeStability(item.id);
    EncodePath(ChainPath(implPath, PathElemKind::NAME, item.name));
    if (member) {
        EncodeAttributes(member->attrs);
    } else {
        auto* predicates = store.LookupPredicates(item.id);
        EncodePredicates(predicates ? *predicates : Sema::GenericPredicates{}, Tag::ITEM_GENERICS);
    }
    if (item.ty) {
        EncodeType(item.ty);
    }
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeTrait(const TraitDecl& decl, ItemIndex& index)
{
    auto id = LocalDeclId(decl.id);
    auto* def = store.LookupTraitDef(id);
    if (!def) {
        diag.Fatal(DiagKind::METADATA_MISSING_TRAIT_DEF, id.ToString());
    }
    static const std::vector<Sema::AssocItemId> NO_ITEMS;
    auto* found = store.LookupTraitItemIds(id);
    auto& itemIds = found ? *found : NO_ITEMS;
    auto* predicates = store.LookupPredicates(id);
    auto* superPredicates = store.LookupSuperPredicates(id);

    AddToIndex(*writer, index, decl.id);
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeDefId(id);
    EncodeFamily(Family::TRAIT);
    EncodeVariances(id);
    EncodeUnsafety(def->unsafety);
    writer->WrTaggedU8(Tag::PAREN_SUGAR, def->parenSugar ? 1 : 0);
    writer->WrTaggedU8(Tag::DEFAULTED_TRAIT, store.TraitHasDefaultImpl(id) ? 1 : 0);
    writer->StartTag(Tag::ASSOCIATED_TYPE_NAMES);
    for (auto& name : def->associatedTypeNames) {
        writer->WrTaggedStr(Tag::ASSOCIATED_TYPE_NAME, name);
    }
    writer->EndTag();
    EncodeGenerics(def->generics, predicates ? *predicates : Sema::GenericPredicates{}, Tag::ITEM_GENERICS);
    EncodePredicates(superPredicates ? *superPredicates : Sema::GenericPredicates{}, Tag::ITEM_SUPER_PREDICATES);
    EncodeTraitRef(def->traitRef, Tag::ITEM_TRAIT_REF);
    EncodeName(decl.name);
    EncodeAttributes(decl.attrs);
    EncodeVisibility(decl.vis);
    EncodeStability(id);
    for (auto& itemId : itemIds) {
        writer->StartTag(Tag::ITEM_TRAIT_ITEM);
        EncodeDefId(itemId.id);
        EncodeItemSort(AssocItemSort(itemId.kind));
        writer->EndTag();
        writer->WrTaggedU64(Tag::MOD_CHILD, itemId.id.Pack());
    }
    auto& traitPath = PathOf(decl.id);
    EncodePath(traitPath);
    EncodeExtensionImpls(*def);
    EncodeInherentImpls(id);
    writer->EndTag();

    for (size_t i = 0; i < itemIds.size(); ++i) {
        auto& itemId = itemIds[i].id;
        if (!itemId.IsLocal()) {
            diag.Fatal(DiagKind::METADATA_FOREIGN_TRAIT_ITEM, itemId.ToString());
        }
        if (i >= decl.members.size()) {
            diag.Fatal(DiagKind::METADATA_MISSING_TRAIT_MEMBER, id.ToString());
        }
        auto& item = RequireAssocItem(itemId);
        AddToIndex(*writer, index, itemId.node);
        EncodeTraitItem(decl, item, decl.members[i], traitPath);
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodeTraitItem(
    const TraitDecl& decl, const Sema::AssocItem& item, const TraitMember& member, const Path& traitPath)
{
    auto traitId = LocalDeclId(decl.id);
    auto itemPath = ChainPath(traitPath, PathElemKind::NAME, item.name);
    writer->StartTag(Tag::ITEMS_DATA_ITEM);
    EncodeParentItem(traitId);
    EncodeStability(item.id);
    switch (item.kind) {
        case Sema::AssocKind::CONST:
            EncodeName(item.name);
            EncodeDefId(item.id);
            EncodeVisibility(item.vis);
            EncodeProvidedSource(item.providedSource);
            EncodePath(itemPath);
            EncodeItemSort(member.hasDefault ? Sort::CONST : Sort::CONST_WITHOUT_DEFAULT);
            EncodeFamily(Family::CONST);
            EncodeBoundsAndType(item.id);
            break;
        case Sema::AssocKind::METHOD:
            EncodeMethodTyFields(item);
            EncodePath(itemPath);
            EncodeBoundsAndType(item.id);
            break;
        case Sema::AssocKind::TYPE:
            EncodeName(item.name);
            EncodeDefId(item.id);
            EncodePath(itemPath);
            EncodeItemSort(Sort::TYPE);
            EncodeFamily(Family::TYPE);
            if (item.ty) {
                EncodeType(item.ty);
            }
            break;
    }
    EncodeParentSort(Sort::TRAIT_PARENT);
    EncodeAttributes(member.attrs);

    // Required methods and consts without a default have no body to export.
    bool exportsBody = false;
    if (member.hasDefault && item.kind != Sema::AssocKind::TYPE) {
        bool isMethod = item.kind == Sema::AssocKind::METHOD;
        bool generic = isMethod && !RequireTypeScheme(item.id).generics.types.IsEmpty();
        bool isConst = !isMethod || member.sig.constness == Constness::CONST;
        exportsBody = NeedsInlinedBody(generic, member.hasDefault, RequestsInline(member.attrs), isConst);
    }
    if (item.kind == Sema::AssocKind::CONST && exportsBody) {
        EncodeInlinedItem({InlinedItemKind::TRAIT_ITEM, member.id, traitId});
    }
    if (item.kind == Sema::AssocKind::METHOD) {
        if (member.hasDefault) {
            EncodeItemSort(Sort::PROVIDED);
            if (exportsBody) {
                EncodeInlinedItem({InlinedItemKind::TRAIT_ITEM, member.id, traitId});
            }
        } else {
            EncodeItemSort(Sort::REQUIRED);
        }
        EncodeMethodArgumentNames(member.sig);
    }
    writer->EndTag();
}
