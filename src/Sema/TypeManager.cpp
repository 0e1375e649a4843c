// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the TypeManager and the predicate constructors.
 */

#include "metalith/Sema/TypeManager.h"

#include "metalith/Utils/CheckUtils.h"

using namespace Metalith;
using namespace Metalith::Sema;

namespace {
std::string TyKey(Ptr<const Ty> ty)
{
    return ty ? std::to_string(ty->id) : std::string("!");
}

std::string TyListKey(const std::vector<Ptr<Ty>>& tys)
{
    std::string key;
    for (auto& ty : tys) {
        key += TyKey(ty) + ",";
    }
    return key;
}
} // namespace

std::string Region::Key() const
{
    std::string key = std::to_string(static_cast<int>(kind));
    switch (kind) {
        case RegionKind::EARLY_BOUND:
            key += "/" + std::to_string(static_cast<int>(space)) + "/" + std::to_string(index) + "/" + name;
            break;
        case RegionKind::LATE_BOUND:
            key += "/" + std::to_string(depth) + "/" + std::to_string(index);
            break;
        default:
            break;
    }
    return key;
}

Predicate Predicate::Trait(TraitRef traitRef)
{
    Predicate p;
    p.kind = PredicateKind::TRAIT;
    p.traitRef = std::move(traitRef);
    return p;
}

Predicate Predicate::Equate(Ptr<Ty> a, Ptr<Ty> b)
{
    Predicate p;
    p.kind = PredicateKind::EQUATE;
    p.tyA = a;
    p.tyB = b;
    return p;
}

Predicate Predicate::RegionOutlives(Region a, Region b)
{
    Predicate p;
    p.kind = PredicateKind::REGION_OUTLIVES;
    p.regionA = std::move(a);
    p.regionB = std::move(b);
    return p;
}

Predicate Predicate::TypeOutlives(Ptr<Ty> a, Region b)
{
    Predicate p;
    p.kind = PredicateKind::TYPE_OUTLIVES;
    p.tyA = a;
    p.regionB = std::move(b);
    return p;
}

Predicate Predicate::Projection(ProjectionPredicate projection)
{
    Predicate p;
    p.kind = PredicateKind::PROJECTION;
    p.projection = std::move(projection);
    return p;
}

TypeManager::TypeManager()
{
    boolTy = Intern("b", MakeOwned<PrimitiveTy>(TypeKind::TYPE_BOOL));
    charTy = Intern("c", MakeOwned<PrimitiveTy>(TypeKind::TYPE_CHAR));
    strTy = Intern("v", MakeOwned<PrimitiveTy>(TypeKind::TYPE_STR));
    errorTy = Intern("e", MakeOwned<PrimitiveTy>(TypeKind::TYPE_ERROR));
    inferTy = Intern("?", MakeOwned<PrimitiveTy>(TypeKind::TYPE_INFER));
}

Ptr<Ty> TypeManager::Intern(const std::string& key, OwnedPtr<Ty> fresh)
{
    if (auto found = tyPool.find(key); found != tyPool.end()) {
        return found->second;
    }
    fresh->id = static_cast<uint32_t>(allTys.size() + 1);
    Ptr<Ty> ty = fresh.get();
    allTys.emplace_back(std::move(fresh));
    tyPool.emplace(key, ty);
    return ty;
}

std::string TypeManager::Key(const TraitRef& traitRef)
{
    MLT_NULLPTR_CHECK(traitRef.substs.get());
    return traitRef.def.ToString() + "<" + std::to_string(traitRef.substs->id) + ">";
}

Ptr<Ty> TypeManager::GetIntTy(IntKind kind)
{
    auto numeric = static_cast<uint8_t>(kind);
    return Intern("i" + std::to_string(numeric), MakeOwned<PrimitiveTy>(TypeKind::TYPE_INT, numeric));
}

Ptr<Ty> TypeManager::GetUintTy(UintKind kind)
{
    auto numeric = static_cast<uint8_t>(kind);
    return Intern("u" + std::to_string(numeric), MakeOwned<PrimitiveTy>(TypeKind::TYPE_UINT, numeric));
}

Ptr<Ty> TypeManager::GetFloatTy(FloatKind kind)
{
    auto numeric = static_cast<uint8_t>(kind);
    return Intern("f" + std::to_string(numeric), MakeOwned<PrimitiveTy>(TypeKind::TYPE_FLOAT, numeric));
}

Ptr<const Substs> TypeManager::GetSubsts(const PerParamSpace<Ptr<Ty>>& types)
{
    Substs fresh;
    fresh.erasedRegions = true;
    fresh.types = types;
    std::string key = "e";
    for (auto space : ALL_PARAM_SPACES) {
        key += "[" + TyListKey(types.Get(space)) + "]";
    }
    if (auto found = substsPool.find(key); found != substsPool.end()) {
        return found->second;
    }
    fresh.id = static_cast<uint32_t>(allSubsts.size() + 1);
    allSubsts.emplace_back(MakeOwned<Substs>(std::move(fresh)));
    Ptr<const Substs> interned = allSubsts.back().get();
    substsPool.emplace(key, interned);
    return interned;
}

Ptr<const Substs> TypeManager::GetSubsts(const PerParamSpace<Ptr<Ty>>& types, const PerParamSpace<Region>& regions)
{
    Substs fresh;
    fresh.erasedRegions = false;
    fresh.types = types;
    fresh.regions = regions;
    std::string key = "n";
    for (auto space : ALL_PARAM_SPACES) {
        key += "[";
        for (auto& region : regions.Get(space)) {
            key += region.Key() + ",";
        }
        key += "]";
    }
    for (auto space : ALL_PARAM_SPACES) {
        key += "[" + TyListKey(types.Get(space)) + "]";
    }
    if (auto found = substsPool.find(key); found != substsPool.end()) {
        return found->second;
    }
    fresh.id = static_cast<uint32_t>(allSubsts.size() + 1);
    allSubsts.emplace_back(MakeOwned<Substs>(std::move(fresh)));
    Ptr<const Substs> interned = allSubsts.back().get();
    substsPool.emplace(key, interned);
    return interned;
}

Ptr<const Substs> TypeManager::GetEmptySubsts()
{
    return GetSubsts(PerParamSpace<Ptr<Ty>>{});
}

Ptr<Ty> TypeManager::GetEnumTy(DeclId def, Ptr<const Substs> substs)
{
    return Intern("t" + Key({def, substs}), MakeOwned<AdtTy>(TypeKind::TYPE_ENUM, def, substs));
}

Ptr<Ty> TypeManager::GetStructTy(DeclId def, Ptr<const Substs> substs)
{
    return Intern("a" + Key({def, substs}), MakeOwned<AdtTy>(TypeKind::TYPE_STRUCT, def, substs));
}

Ptr<Ty> TypeManager::GetClosureTy(DeclId def, Ptr<const Substs> substs)
{
    return Intern("k" + Key({def, substs}), MakeOwned<AdtTy>(TypeKind::TYPE_CLOSURE, def, substs));
}

Ptr<Ty> TypeManager::GetBoxTy(Ptr<Ty> pointee)
{
    return Intern("~" + TyKey(pointee),
        MakeOwned<PointerTy>(TypeKind::TYPE_BOX, pointee, AST::Mutability::IMMUTABLE, Region::Static()));
}

Ptr<Ty> TypeManager::GetRawPtrTy(Ptr<Ty> pointee, AST::Mutability mutability)
{
    auto key = "*" + std::to_string(static_cast<int>(mutability)) + TyKey(pointee);
    return Intern(key, MakeOwned<PointerTy>(TypeKind::TYPE_RAW_PTR, pointee, mutability, Region::Static()));
}

Ptr<Ty> TypeManager::GetRefTy(const Region& region, Ptr<Ty> pointee, AST::Mutability mutability)
{
    auto key = "&" + region.Key() + "|" + std::to_string(static_cast<int>(mutability)) + TyKey(pointee);
    return Intern(key, MakeOwned<PointerTy>(TypeKind::TYPE_REF, pointee, mutability, region));
}

Ptr<Ty> TypeManager::GetArrayTy(Ptr<Ty> elem, uint64_t size)
{
    return Intern("V" + TyKey(elem) + "/" + std::to_string(size),
        MakeOwned<ArrayTy>(TypeKind::TYPE_ARRAY, elem, size));
}

Ptr<Ty> TypeManager::GetSliceTy(Ptr<Ty> elem)
{
    return Intern("V" + TyKey(elem) + "/", MakeOwned<ArrayTy>(TypeKind::TYPE_SLICE, elem, 0));
}

Ptr<Ty> TypeManager::GetTupleTy(const std::vector<Ptr<Ty>>& elems)
{
    return Intern("T[" + TyListKey(elems) + "]", MakeOwned<TupleTy>(elems));
}

Ptr<Ty> TypeManager::GetFnTy(std::optional<DeclId> def, const BareFnSig& sig)
{
    std::string key = def ? "F" + def->ToString() : std::string("G");
    key += "|" + std::to_string(static_cast<int>(sig.unsafety)) + std::to_string(static_cast<int>(sig.abi));
    key += "[" + TyListKey(sig.inputs) + "]" + (sig.variadic ? "V" : "N") + TyKey(sig.output);
    return Intern(key, MakeOwned<FnTy>(def, sig));
}

Ptr<Ty> TypeManager::GetTraitObjectTy(const TraitRef& principal, const ExistentialBounds& bounds)
{
    std::string key = "x[" + Key(principal) + "|" + bounds.regionBound.Key() + "|";
    for (auto bound : bounds.builtinBounds) {
        key += std::to_string(static_cast<int>(bound));
    }
    for (auto& projection : bounds.projectionBounds) {
        key += "P" + Key(projection.traitRef) + projection.itemName + "=" + TyKey(projection.ty);
    }
    return Intern(key + "]", MakeOwned<TraitObjectTy>(principal, bounds));
}

Ptr<Ty> TypeManager::GetParamTy(ParamSpace space, uint32_t index, const std::string& name)
{
    auto key = "p[" + std::to_string(static_cast<int>(space)) + "|" + std::to_string(index) + "|" + name + "]";
    return Intern(key, MakeOwned<ParamTy>(space, index, name));
}

Ptr<Ty> TypeManager::GetProjectionTy(const TraitRef& traitRef, const std::string& itemName)
{
    return Intern("P[" + Key(traitRef) + itemName + "]", MakeOwned<ProjectionTy>(traitRef, itemName));
}
