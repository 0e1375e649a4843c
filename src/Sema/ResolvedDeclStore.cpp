// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the ResolvedDeclStore and the language item table.
 */

#include "metalith/Sema/ResolvedDeclStore.h"

#include <utility>

using namespace Metalith;
using namespace Metalith::Sema;

namespace {
const char* const LANG_ITEM_NAMES[] = {
#define LANG_ITEM(KIND, NAME) NAME,
#include "metalith/Sema/LangItems.def"
#undef LANG_ITEM
};

template <typename Map, typename Key> auto Find(const Map& map, const Key& key) -> const typename Map::mapped_type*
{
    auto found = map.find(key);
    return found == map.end() ? nullptr : &found->second;
}
} // namespace

const char* Sema::LangItemName(LangItem item)
{
    return LANG_ITEM_NAMES[static_cast<size_t>(item)];
}

const TypeScheme* ResolvedDeclStore::LookupTypeScheme(DeclId id) const
{
    return Find(typeSchemes, id);
}

const GenericPredicates* ResolvedDeclStore::LookupPredicates(DeclId id) const
{
    return Find(predicates, id);
}

const GenericPredicates* ResolvedDeclStore::LookupSuperPredicates(DeclId id) const
{
    return Find(superPredicates, id);
}

const std::vector<FieldInfo>* ResolvedDeclStore::LookupStructFields(DeclId id) const
{
    return Find(structFields, id);
}

const std::vector<VariantInfo>* ResolvedDeclStore::LookupEnumVariants(DeclId id) const
{
    return Find(enumVariants, id);
}

const TraitDef* ResolvedDeclStore::LookupTraitDef(DeclId id) const
{
    return Find(traitDefs, id);
}

const std::vector<AssocItemId>* ResolvedDeclStore::LookupTraitItemIds(DeclId id) const
{
    return Find(traitItemIds, id);
}

const std::vector<AssocItemId>* ResolvedDeclStore::LookupImplItemIds(DeclId id) const
{
    return Find(implItemIds, id);
}

const AssocItem* ResolvedDeclStore::LookupAssocItem(DeclId id) const
{
    return Find(assocItems, id);
}

const TraitRef* ResolvedDeclStore::LookupImplTraitRef(DeclId id) const
{
    return Find(implTraitRefs, id);
}

const std::vector<DeclId>* ResolvedDeclStore::LookupInherentImpls(DeclId id) const
{
    return Find(inherentImpls, id);
}

const Stability* ResolvedDeclStore::LookupStability(DeclId id) const
{
    return Find(stabilities, id);
}

const ItemVariances* ResolvedDeclStore::LookupVariances(DeclId id) const
{
    return Find(variances, id);
}

const std::string* ResolvedDeclStore::LookupSymbol(NodeId id) const
{
    return Find(symbols, id);
}

const std::vector<Export>* ResolvedDeclStore::LookupExports(NodeId moduleId) const
{
    return Find(exports, moduleId);
}

std::optional<uint32_t> ResolvedDeclStore::LookupCoerceUnsizedKind(DeclId id) const
{
    if (auto kind = Find(coerceUnsizedKinds, id)) {
        return *kind;
    }
    return std::nullopt;
}

void ResolvedDeclStore::SetTypeScheme(DeclId id, TypeScheme scheme)
{
    typeSchemes.insert_or_assign(id, std::move(scheme));
}

void ResolvedDeclStore::SetPredicates(DeclId id, GenericPredicates preds)
{
    predicates.insert_or_assign(id, std::move(preds));
}

void ResolvedDeclStore::SetSuperPredicates(DeclId id, GenericPredicates preds)
{
    superPredicates.insert_or_assign(id, std::move(preds));
}

void ResolvedDeclStore::SetStructFields(DeclId id, std::vector<FieldInfo> fields)
{
    structFields.insert_or_assign(id, std::move(fields));
}

void ResolvedDeclStore::SetEnumVariants(DeclId id, std::vector<VariantInfo> variants)
{
    enumVariants.insert_or_assign(id, std::move(variants));
}

void ResolvedDeclStore::SetTraitDef(DeclId id, TraitDef def)
{
    traitDefs.insert_or_assign(id, std::move(def));
}

void ResolvedDeclStore::SetTraitItemIds(DeclId id, std::vector<AssocItemId> ids)
{
    traitItemIds.insert_or_assign(id, std::move(ids));
}

void ResolvedDeclStore::SetImplItemIds(DeclId id, std::vector<AssocItemId> ids)
{
    implItemIds.insert_or_assign(id, std::move(ids));
}

void ResolvedDeclStore::SetAssocItem(AssocItem item)
{
    auto id = item.id;
    assocItems.insert_or_assign(id, std::move(item));
}

void ResolvedDeclStore::SetImplTraitRef(DeclId id, TraitRef traitRef)
{
    implTraitRefs.insert_or_assign(id, std::move(traitRef));
}

void ResolvedDeclStore::AddInherentImpl(DeclId self, DeclId impl)
{
    inherentImpls[self].push_back(impl);
}

void ResolvedDeclStore::SetStability(DeclId id, Stability stability)
{
    stabilities.insert_or_assign(id, std::move(stability));
}

void ResolvedDeclStore::SetVariances(DeclId id, ItemVariances itemVariances)
{
    variances.insert_or_assign(id, std::move(itemVariances));
}

void ResolvedDeclStore::SetSymbol(NodeId id, std::string symbol)
{
    symbols.insert_or_assign(id, std::move(symbol));
}

void ResolvedDeclStore::AddExport(NodeId moduleId, Export exp)
{
    exports[moduleId].push_back(std::move(exp));
}

void ResolvedDeclStore::SetCoerceUnsizedKind(DeclId id, uint32_t kind)
{
    coerceUnsizedKinds.insert_or_assign(id, kind);
}

void ResolvedDeclStore::AddDefaultImplTrait(DeclId id)
{
    defaultImplTraits.insert(id);
}

void ResolvedDeclStore::SetLangItem(LangItem item, DeclId id)
{
    langItems.items[static_cast<size_t>(item)] = id;
}

void ResolvedDeclStore::AddMissingLangItem(LangItem item)
{
    langItems.missing.push_back(item);
}

void ResolvedDeclStore::AddReachable(NodeId id)
{
    reachable.insert(id);
}
