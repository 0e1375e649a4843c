// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the ResolvedDeclStore, the read-only result of type checking that the metadata encoder
 * consults: type schemes, predicates, fields, variants, trait and impl members, stability, variances, symbols,
 * inherent impls, exports and language items. Every entry is computed before encoding starts.
 */

#ifndef METALITH_SEMA_RESOLVEDDECLSTORE_H
#define METALITH_SEMA_RESOLVEDDECLSTORE_H

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "metalith/Sema/LangItems.h"
#include "metalith/Sema/Types.h"

namespace Metalith::Sema {
using AST::NodeId;

struct FieldInfo {
    std::string name; ///< Empty for positional fields.
    DeclId id;
    AST::Visibility vis{AST::Visibility::INHERITED};
    DeclId origin; ///< Struct or variant that declares the field.
};

struct VariantInfo {
    DeclId id;
    std::string name;
    uint64_t discriminant{0};
};

enum class ExplicitSelfKind : uint8_t { STATIC, BY_VALUE, BY_REFERENCE, BY_BOX };

struct ExplicitSelf {
    ExplicitSelfKind kind{ExplicitSelfKind::STATIC};
    AST::Mutability mutability{AST::Mutability::IMMUTABLE}; ///< BY_REFERENCE only.
};

enum class AssocKind : uint8_t { CONST, METHOD, TYPE };

struct AssocItemId {
    AssocKind kind;
    DeclId id;
};

/// An associated const, method or type, as declared in a trait or an impl.
struct AssocItem {
    AssocKind kind{AssocKind::METHOD};
    std::string name;
    DeclId id;
    AST::Visibility vis{AST::Visibility::INHERITED};
    DeclId container;
    /// For methods, the trait method providing the body. For consts, the trait const providing the default.
    std::optional<DeclId> providedSource;
    // Methods.
    Generics generics;
    GenericPredicates predicates;
    BareFnSig fty;
    ExplicitSelf explicitSelf;
    // Consts and types. Null for an associated type without a resolved type.
    Ptr<Ty> ty;
};

struct TraitDef {
    AST::Unsafety unsafety{AST::Unsafety::NORMAL};
    bool parenSugar{false};
    Generics generics;
    TraitRef traitRef; ///< The trait applied to its own parameters.
    std::vector<std::string> associatedTypeNames;
    std::vector<DeclId> impls; ///< Every known impl of this trait, local or not.
};

enum class StabilityLevel : uint8_t { UNSTABLE, STABLE };

struct Stability {
    StabilityLevel level{StabilityLevel::UNSTABLE};
    std::string feature;
    std::string since;
    std::optional<std::string> deprecatedSince;
    std::optional<std::string> reason;
    std::optional<uint32_t> issue;
};

enum class Variance : uint8_t { COVARIANT, INVARIANT, CONTRAVARIANT, BIVARIANT };

struct ItemVariances {
    PerParamSpace<Variance> types;
    PerParamSpace<Variance> regions;
};

struct Export {
    std::string name;
    DeclId target;
};

struct LangItemTable {
    std::array<std::optional<DeclId>, LANG_ITEM_COUNT> items;
    std::vector<LangItem> missing;

    std::optional<DeclId> Get(LangItem item) const
    {
        return items[static_cast<size_t>(item)];
    }
};

class ResolvedDeclStore {
public:
    ///@{
    /// Lookups return null when nothing was recorded; the encoder decides whether that is fatal.
    const TypeScheme* LookupTypeScheme(DeclId id) const;
    const GenericPredicates* LookupPredicates(DeclId id) const;
    const GenericPredicates* LookupSuperPredicates(DeclId id) const;
    const std::vector<FieldInfo>* LookupStructFields(DeclId id) const;
    const std::vector<VariantInfo>* LookupEnumVariants(DeclId id) const;
    const TraitDef* LookupTraitDef(DeclId id) const;
    const std::vector<AssocItemId>* LookupTraitItemIds(DeclId id) const;
    const std::vector<AssocItemId>* LookupImplItemIds(DeclId id) const;
    const AssocItem* LookupAssocItem(DeclId id) const;
    const TraitRef* LookupImplTraitRef(DeclId id) const;
    const std::vector<DeclId>* LookupInherentImpls(DeclId id) const;
    const Stability* LookupStability(DeclId id) const;
    const ItemVariances* LookupVariances(DeclId id) const;
    const std::string* LookupSymbol(NodeId id) const;
    const std::vector<Export>* LookupExports(NodeId moduleId) const;
    std::optional<uint32_t> LookupCoerceUnsizedKind(DeclId id) const;
    ///@}

    bool TraitHasDefaultImpl(DeclId id) const
    {
        return defaultImplTraits.count(id) != 0;
    }

    const LangItemTable& GetLangItems() const
    {
        return langItems;
    }

    const std::set<NodeId>& GetReachable() const
    {
        return reachable;
    }

    ///@{
    /// Population, used by the checker that produces the store.
    void SetTypeScheme(DeclId id, TypeScheme scheme);
    void SetPredicates(DeclId id, GenericPredicates predicates);
    void SetSuperPredicates(DeclId id, GenericPredicates predicates);
    void SetStructFields(DeclId id, std::vector<FieldInfo> fields);
    void SetEnumVariants(DeclId id, std::vector<VariantInfo> variants);
    void SetTraitDef(DeclId id, TraitDef def);
    void SetTraitItemIds(DeclId id, std::vector<AssocItemId> ids);
    void SetImplItemIds(DeclId id, std::vector<AssocItemId> ids);
    void SetAssocItem(AssocItem item);
    void SetImplTraitRef(DeclId id, TraitRef traitRef);
    void AddInherentImpl(DeclId self, DeclId impl);
    void SetStability(DeclId id, Stability stability);
    void SetVariances(DeclId id, ItemVariances variances);
    void SetSymbol(NodeId id, std::string symbol);
    void AddExport(NodeId moduleId, Export exp);
    void SetCoerceUnsizedKind(DeclId id, uint32_t kind);
    void AddDefaultImplTrait(DeclId id);
    void SetLangItem(LangItem item, DeclId id);
    void AddMissingLangItem(LangItem item);
    void AddReachable(NodeId id);
    ///@}

private:
    std::unordered_map<DeclId, TypeScheme> typeSchemes;
    std::unordered_map<DeclId, GenericPredicates> predicates;
    std::unordered_map<DeclId, GenericPredicates> superPredicates;
    std::unordered_map<DeclId, std::vector<FieldInfo>> structFields;
    std::unordered_map<DeclId, std::vector<VariantInfo>> enumVariants;
    std::unordered_map<DeclId, TraitDef> traitDefs;
    std::unordered_map<DeclId, std::vector<AssocItemId>> traitItemIds;
    std::unordered_map<DeclId, std::vector<AssocItemId>> implItemIds;
    std::unordered_map<DeclId, AssocItem> assocItems;
    std::unordered_map<DeclId, TraitRef> implTraitRefs;
    std::unordered_map<DeclId, std::vector<DeclId>> inherentImpls;
    std::unordered_map<DeclId, Stability> stabilities;
    std::unordered_map<DeclId, ItemVariances> variances;
    std::unordered_map<NodeId, std::string> symbols;
    std::unordered_map<NodeId, std::vector<Export>> exports;
    std::unordered_map<DeclId, uint32_t> coerceUnsizedKinds;
    std::set<DeclId> defaultImplTraits;
    LangItemTable langItems;
    std::set<NodeId> reachable;
};
} // namespace Metalith::Sema

#endif
