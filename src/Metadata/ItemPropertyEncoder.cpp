// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the fields shared by declaration records.
 */

#include "MetadataEncoderImpl.h"

using namespace Metalith;
using namespace Metalith::AST;
using namespace Metalith::Metadata;

namespace {
char VarianceCode(Sema::Variance variance)
{
    switch (variance) {
        case Sema::Variance::COVARIANT:
            return '+';
        case Sema::Variance::CONTRAVARIANT:
            return '-';
        case Sema::Variance::INVARIANT:
            return 'o';
        case Sema::Variance::BIVARIANT:
            return '*';
    }
    return 'o';
}

/// Each space's variances followed by '|'.
void AppendVariances(std::string& out, const Sema::PerParamSpace<Sema::Variance>& variances)
{
    for (auto space : Sema::ALL_PARAM_SPACES) {
        for (auto variance : variances.Get(space)) {
            out += VarianceCode(variance);
        }
        out += '|';
    }
}
} // namespace

void MetadataEncoder::MetadataEncoderImpl::EncodeDefId(DeclId id)
{
    writer->WrTaggedU64(Tag::DEF_ID, id.Pack());
}

void MetadataEncoder::MetadataEncoderImpl::EncodeFamily(Family family)
{
    writer->WrTaggedU8(Tag::ITEMS_DATA_ITEM_FAMILY, static_cast<uint8_t>(family));
}

void MetadataEncoder::MetadataEncoderImpl::EncodeName(const std::string& name)
{
    writer->WrTaggedStr(Tag::PATHS_DATA_NAME, name);
}

void MetadataEncoder::MetadataEncoderImpl::EncodeVisibility(Visibility vis)
{
    writer->WrTaggedU8(
        Tag::ITEMS_DATA_ITEM_VISIBILITY, vis == Visibility::PUBLIC ? VISIBILITY_PUBLIC : VISIBILITY_INHERITED);
}

void MetadataEncoder::MetadataEncoderImpl::EncodeParentItem(DeclId id)
{
    writer->WrTaggedU64(Tag::ITEMS_DATA_PARENT_ITEM, id.Pack());
}

void MetadataEncoder::MetadataEncoderImpl::EncodeItemSort(char sort)
{
    writer->WrTaggedU8(Tag::ITEM_SORT, static_cast<uint8_t>(sort));
}

void MetadataEncoder::MetadataEncoderImpl::EncodeParentSort(char sort)
{
    writer->WrTaggedU8(Tag::ITEM_TRAIT_PARENT_SORT, static_cast<uint8_t>(sort));
}

void MetadataEncoder::MetadataEncoderImpl::EncodeProvidedSource(const std::optional<DeclId>& source)
{
    if (source) {
        writer->WrTaggedU64(Tag::ITEM_METHOD_PROVIDED_SOURCE, source->Pack());
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodeSymbol(NodeId id)
{
    auto* symbol = store.LookupSymbol(id);
    if (!symbol) {
        diag.Fatal(DiagKind::METADATA_MISSING_SYMBOL, id);
    }
    writer->WrTaggedStr(Tag::ITEMS_DATA_ITEM_SYMBOL, *symbol);
}

void MetadataEncoder::MetadataEncoderImpl::EncodeConstness(Constness constness)
{
    writer->StartTag(Tag::ITEMS_DATA_ITEM_CONSTNESS);
    writer->WrU8(constness == Constness::CONST ? 'c' : 'n');
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeUnsafety(Unsafety unsafety)
{
    writer->WrTaggedU8(Tag::UNSAFETY, unsafety == Unsafety::UNSAFE ? 1 : 0);
}

void MetadataEncoder::MetadataEncoderImpl::EncodePolarity(ImplPolarity polarity)
{
    writer->WrTaggedU8(Tag::POLARITY, polarity == ImplPolarity::NEGATIVE ? 1 : 0);
}

void MetadataEncoder::MetadataEncoderImpl::EncodeExplicitSelf(const Sema::ExplicitSelf& explicitSelf)
{
    uint8_t bytes[2] = {0, 0};
    size_t len = 1;
    switch (explicitSelf.kind) {
        case Sema::ExplicitSelfKind::STATIC:
            bytes[0] = 's';
            break;
        case Sema::ExplicitSelfKind::BY_VALUE:
            bytes[0] = 'v';
            break;
        case Sema::ExplicitSelfKind::BY_BOX:
            bytes[0] = '~';
            break;
        case Sema::ExplicitSelfKind::BY_REFERENCE:
            bytes[0] = '&';
            bytes[1] = explicitSelf.mutability == Mutability::MUTABLE ? 'm' : 'i';
            len = 2;
            break;
    }
    writer->WrTaggedBytes(Tag::ITEM_TRAIT_METHOD_EXPLICIT_SELF, bytes, len);
}

void MetadataEncoder::MetadataEncoderImpl::EncodeMethodArgumentNames(const FnSignature& sig)
{
    writer->StartTag(Tag::METHOD_ARGUMENT_NAMES);
    for (auto& param : sig.params) {
        writer->WrTaggedStr(Tag::METHOD_ARGUMENT_NAME, param.name);
    }
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeStability(DeclId id)
{
    auto* stability = store.LookupStability(id);
    if (!stability) {
        return;
    }
    writer->StartTag(Tag::ITEMS_DATA_ITEM_STABILITY);
    writer->WrTaggedU8(Tag::STABILITY_LEVEL, static_cast<uint8_t>(stability->level));
    writer->WrTaggedStr(Tag::STABILITY_FEATURE, stability->feature);
    writer->WrTaggedStr(Tag::STABILITY_SINCE, stability->since);
    if (stability->deprecatedSince) {
        writer->WrTaggedStr(Tag::STABILITY_DEPRECATED_SINCE, *stability->deprecatedSince);
    }
    if (stability->reason) {
        writer->WrTaggedStr(Tag::STABILITY_REASON, *stability->reason);
    }
    if (stability->issue) {
        writer->WrTaggedU32(Tag::STABILITY_ISSUE, *stability->issue);
    }
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeReprAttrs(const std::vector<Attribute>& attrs)
{
    writer->StartTag(Tag::ITEMS_DATA_ITEM_REPR);
    for (auto& repr : FindReprAttrs(diag, attrs)) {
        writer->WrTaggedStr(Tag::REPR_ATTR, repr.ToString());
    }
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeVariances(DeclId id)
{
    std::string text;
    if (auto* variances = store.LookupVariances(id)) {
        AppendVariances(text, variances->types);
        AppendVariances(text, variances->regions);
    } else {
        // Nothing recorded: every space is empty.
        AppendVariances(text, {});
        AppendVariances(text, {});
    }
    writer->WrTaggedStr(Tag::ITEM_VARIANCES, text);
}

void MetadataEncoder::MetadataEncoderImpl::EncodeAttributes(const std::vector<Attribute>& attrs)
{
    writer->StartTag(Tag::ATTRIBUTES);
    for (auto& attr : attrs) {
        writer->StartTag(Tag::ATTRIBUTE);
        writer->WrTaggedU8(Tag::ATTRIBUTE_IS_SUGARED_DOC, attr.isSugaredDoc ? 1 : 0);
        EncodeMetaItem(attr.value);
        writer->EndTag();
    }
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeMetaItem(const MetaItem& item)
{
    switch (item.kind) {
        case MetaItemKind::WORD:
            writer->StartTag(Tag::META_ITEM_WORD);
            writer->WrTaggedStr(Tag::META_ITEM_NAME, item.name);
            writer->EndTag();
            break;
        case MetaItemKind::NAME_VALUE:
            // Only string values survive; readers have no way to rebuild other literals.
            if (item.valueKind != LitKind::STRING) {
                break;
            }
            writer->StartTag(Tag::META_ITEM_NAME_VALUE);
            writer->WrTaggedStr(Tag::META_ITEM_NAME, item.name);
            writer->WrTaggedStr(Tag::META_ITEM_VALUE, item.value);
            writer->EndTag();
            break;
        case MetaItemKind::LIST:
            writer->StartTag(Tag::META_ITEM_LIST);
            writer->WrTaggedStr(Tag::META_ITEM_NAME, item.name);
            for (auto& inner : item.items) {
                EncodeMetaItem(inner);
            }
            writer->EndTag();
            break;
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodeType(Ptr<const Sema::Ty> ty)
{
    writer->StartTag(Tag::ITEMS_DATA_ITEM_TYPE);
    TypeEncoder(*writer, typeAbbrevs).EncTy(ty);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeRegion(const Sema::Region& region)
{
    writer->StartTag(Tag::ITEMS_DATA_REGION);
    TypeEncoder(*writer, typeAbbrevs).EncRegion(region);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeTraitRef(const Sema::TraitRef& traitRef, uint32_t tag)
{
    writer->StartTag(tag);
    TypeEncoder(*writer, typeAbbrevs).EncTraitRef(traitRef);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeGenerics(
    const Sema::Generics& generics, const Sema::GenericPredicates& predicates, uint32_t tag)
{
    writer->StartTag(tag);
    for (auto space : Sema::ALL_PARAM_SPACES) {
        for (auto& param : generics.types.Get(space)) {
            writer->StartTag(Tag::TYPE_PARAM_DEF);
            TypeEncoder(*writer, typeAbbrevs).EncTypeParamDef(param);
            writer->EndTag();
        }
    }
    for (auto space : Sema::ALL_PARAM_SPACES) {
        for (auto& param : generics.regions.Get(space)) {
            writer->StartTag(Tag::REGION_PARAM_DEF);
            writer->StartTag(Tag::REGION_PARAM_DEF_IDENT);
            EncodeName(param.name);
            writer->EndTag();
            writer->WrTaggedU64(Tag::REGION_PARAM_DEF_DEF_ID, param.def.Pack());
            writer->WrTaggedU64(Tag::REGION_PARAM_DEF_SPACE, static_cast<uint64_t>(param.space));
            writer->WrTaggedU64(Tag::REGION_PARAM_DEF_INDEX, param.index);
            for (auto& bound : param.bounds) {
                EncodeRegion(bound);
            }
            writer->EndTag();
        }
    }
    EncodePredicatesInCurrentRecord(predicates);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodePredicatesInCurrentRecord(const Sema::GenericPredicates& predicates)
{
    for (auto space : Sema::ALL_PARAM_SPACES) {
        for (auto& predicate : predicates.predicates.Get(space)) {
            writer->StartTag(Tag::PREDICATE);
            writer->WrTaggedU8(Tag::PREDICATE_SPACE, static_cast<uint8_t>(space));
            writer->StartTag(Tag::PREDICATE_DATA);
            TypeEncoder(*writer, typeAbbrevs).EncPredicate(predicate);
            writer->EndTag();
            writer->EndTag();
        }
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodePredicates(const Sema::GenericPredicates& predicates, uint32_t tag)
{
    writer->StartTag(tag);
    EncodePredicatesInCurrentRecord(predicates);
    writer->EndTag();
}

void MetadataEncoder::MetadataEncoderImpl::EncodeBoundsAndType(DeclId id)
{
    auto& scheme = RequireTypeScheme(id);
    auto* predicates = store.LookupPredicates(id);
    EncodeGenerics(scheme.generics, predicates ? *predicates : Sema::GenericPredicates{}, Tag::ITEM_GENERICS);
    EncodeType(scheme.ty);
}

void MetadataEncoder::MetadataEncoderImpl::EncodeMethodTyFields(const Sema::AssocItem& method)
{
    EncodeDefId(method.id);
    EncodeName(method.name);
    EncodeGenerics(method.generics, method.predicates, Tag::METHOD_TY_GENERICS);
    writer->StartTag(Tag::ITEM_METHOD_FTY);
    TypeEncoder(*writer, typeAbbrevs).EncBareFnTy(method.fty);
    writer->EndTag();
    EncodeVisibility(method.vis);
    EncodeExplicitSelf(method.explicitSelf);
    EncodeFamily(method.explicitSelf.kind == Sema::ExplicitSelfKind::STATIC ? Family::STATIC_METHOD : Family::METHOD);
    EncodeProvidedSource(method.providedSource);
}

void MetadataEncoder::MetadataEncoderImpl::EncodeStructFields(
    const std::vector<Sema::FieldInfo>& fields, DeclId origin)
{
    for (auto& field : fields) {
        if (field.name.empty()) {
            writer->StartTag(Tag::ITEM_UNNAMED_FIELD);
        } else {
            writer->StartTag(Tag::ITEM_FIELD);
            EncodeName(field.name);
        }
        EncodeFamily(field.vis == Visibility::PUBLIC ? Family::PUBLIC_FIELD : Family::INHERITED_FIELD);
        EncodeDefId(field.id);
        writer->WrTaggedU64(Tag::ITEM_FIELD_ORIGIN, origin.Pack());
        writer->EndTag();
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodeInherentImpls(DeclId id)
{
    auto* impls = store.LookupInherentImpls(id);
    if (!impls) {
        return;
    }
    for (auto& impl : *impls) {
        writer->StartTag(Tag::ITEMS_DATA_ITEM_INHERENT_IMPL);
        EncodeDefId(impl);
        writer->EndTag();
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodeExtensionImpls(const Sema::TraitDef& def)
{
    for (auto& impl : def.impls) {
        writer->StartTag(Tag::ITEMS_DATA_ITEM_EXTENSION_IMPL);
        EncodeDefId(impl);
        writer->EndTag();
    }
}

void MetadataEncoder::MetadataEncoderImpl::EncodeInlinedItem(const InlinedItemRef& item)
{
    inlinedItemWriter(*writer, item);
}

const Sema::TypeScheme& MetadataEncoder::MetadataEncoderImpl::RequireTypeScheme(DeclId id) const
{
    auto* scheme = store.LookupTypeScheme(id);
    if (!scheme) {
        diag.Fatal(DiagKind::METADATA_MISSING_TYPE_SCHEME, id.ToString());
    }
    return *scheme;
}

const Sema::AssocItem& MetadataEncoder::MetadataEncoderImpl::RequireAssocItem(DeclId id) const
{
    auto* item = store.LookupAssocItem(id);
    if (!item) {
        diag.Fatal(DiagKind::METADATA_MISSING_ASSOC_ITEM, id.ToString());
    }
    return *item;
}

const std::vector<Sema::FieldInfo>& MetadataEncoder::MetadataEncoderImpl::RequireStructFields(DeclId id) const
{
    auto* fields = store.LookupStructFields(id);
    if (!fields) {
        diag.Fatal(DiagKind::METADATA_MISSING_STRUCT_FIELDS, id.ToString());
    }
    return *fields;
}

std::optional<NodeId> MetadataEncoder::MetadataEncoderImpl::AuxiliaryNodeId(const Item& item)
{
    // A tuple-like struct also binds its constructor in the value namespace.
    if (item.kind != ItemKind::STRUCT) {
        return std::nullopt;
    }
    auto& decl = static_cast<const StructDecl&>(item);
    if (decl.ctorId && !decl.fields.empty() && decl.fields[0].name.empty()) {
        return decl.ctorId;
    }
    return std::nullopt;
}
