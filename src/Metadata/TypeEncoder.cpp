// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the type grammar writer.
 */

#include "metalith/Metadata/TypeEncoder.h"

#include <sstream>

using namespace Metalith;
using namespace Metalith::Sema;
using namespace Metalith::Metadata;

namespace {
/// Number of hex digits needed for @p n. Zero needs none.
uint64_t EstimateHexSize(uint64_t n)
{
    uint64_t len = 0;
    while (n != 0) {
        ++len;
        n >>= 4u;
    }
    return len;
}

std::string SpaceText(ParamSpace space)
{
    return std::to_string(static_cast<unsigned>(space));
}

const char* IntCode(IntKind kind)
{
    switch (kind) {
        case IntKind::ISIZE:
            return "is";
        case IntKind::I8:
            return "MB";
        case IntKind::I16:
            return "MW";
        case IntKind::I32:
            return "ML";
        case IntKind::I64:
            return "MD";
    }
    return "";
}

const char* UintCode(UintKind kind)
{
    switch (kind) {
        case UintKind::USIZE:
            return "us";
        case UintKind::U8:
            return "Mb";
        case UintKind::U16:
            return "Mw";
        case UintKind::U32:
            return "Ml";
        case UintKind::U64:
            return "Md";
    }
    return "";
}

char BuiltinBoundCode(BuiltinBound bound)
{
    switch (bound) {
        case BuiltinBound::SEND:
            return 'S';
        case BuiltinBound::SIZED:
            return 'Z';
        case BuiltinBound::COPY:
            return 'P';
        case BuiltinBound::SYNC:
            return 'T';
    }
    return '?';
}
} // namespace

std::string TypeEncoder::MakeAbbreviation(uint64_t start, uint64_t end)
{
    uint64_t len = end - start;
    // '#', ':' and '#' plus both hex numbers.
    uint64_t abbrevLen = 3 + EstimateHexSize(start) + EstimateHexSize(len);
    if (abbrevLen >= len) {
        return "";
    }
    std::ostringstream oss;
    oss << '#' << std::hex << start << ':' << len << '#';
    return oss.str();
}

template <typename T, typename Fn> void TypeEncoder::EncPerParamSpace(const PerParamSpace<T>& values, Fn op)
{
    for (auto space : ALL_PARAM_SPACES) {
        w.WrU8('[');
        for (auto& value : values.Get(space)) {
            op(value);
        }
        w.WrU8(']');
    }
}

void TypeEncoder::EncTy(Ptr<const Ty> ty)
{
    if (auto found = cache.types.find(ty.get()); found != cache.types.end()) {
        w.WrStr(found->second);
        return;
    }
    auto start = w.MarkStablePosition();
    EncTyUncached(*ty);
    auto end = w.MarkStablePosition();
    if (auto abbrev = MakeAbbreviation(start, end); !abbrev.empty()) {
        cache.types[ty.get()] = abbrev;
    }
}

void TypeEncoder::EncTyUncached(const Ty& ty)
{
    switch (ty.kind) {
        case TypeKind::TYPE_BOOL:
            w.WrU8('b');
            break;
        case TypeKind::TYPE_CHAR:
            w.WrU8('c');
            break;
        case TypeKind::TYPE_INT:
            w.WrStr(IntCode(static_cast<IntKind>(static_cast<const PrimitiveTy&>(ty).numericKind)));
            break;
        case TypeKind::TYPE_UINT:
            w.WrStr(UintCode(static_cast<UintKind>(static_cast<const PrimitiveTy&>(ty).numericKind)));
            break;
        case TypeKind::TYPE_FLOAT: {
            auto kind = static_cast<FloatKind>(static_cast<const PrimitiveTy&>(ty).numericKind);
            w.WrStr(kind == FloatKind::F32 ? "Mf" : "MF");
            break;
        }
        case TypeKind::TYPE_STR:
            w.WrU8('v');
            break;
        case TypeKind::TYPE_ENUM:
        case TypeKind::TYPE_STRUCT:
        case TypeKind::TYPE_CLOSURE: {
            auto& adt = static_cast<const AdtTy&>(ty);
            char code = ty.kind == TypeKind::TYPE_ENUM ? 't' : (ty.kind == TypeKind::TYPE_STRUCT ? 'a' : 'k');
            w.WrU8(static_cast<uint8_t>(code));
            w.WrU8('[');
            w.WrStr(adt.def.ToString() + "|");
            EncSubsts(*adt.substs);
            w.WrU8(']');
            break;
        }
        case TypeKind::TYPE_TRAIT: {
            auto& object = static_cast<const TraitObjectTy&>(ty);
            w.WrStr("x[");
            EncTraitRef(object.principal);
            EncExistentialBounds(object.bounds);
            w.WrU8(']');
            break;
        }
        case TypeKind::TYPE_TUPLE:
            w.WrStr("T[");
            for (auto& elem : static_cast<const TupleTy&>(ty).elems) {
                EncTy(elem);
            }
            w.WrU8(']');
            break;
        case TypeKind::TYPE_BOX:
            w.WrU8('~');
            EncTy(static_cast<const PointerTy&>(ty).pointee);
            break;
        case TypeKind::TYPE_RAW_PTR: {
            auto& ptr = static_cast<const PointerTy&>(ty);
            w.WrU8('*');
            EncMt(ptr.pointee, ptr.mutability);
            break;
        }
        case TypeKind::TYPE_REF: {
            auto& ref = static_cast<const PointerTy&>(ty);
            w.WrU8('&');
            EncRegion(ref.region);
            EncMt(ref.pointee, ref.mutability);
            break;
        }
        case TypeKind::TYPE_ARRAY: {
            auto& array = static_cast<const ArrayTy&>(ty);
            w.WrU8('V');
            EncTy(array.elem);
            w.WrStr("/" + std::to_string(array.size) + "|");
            break;
        }
        case TypeKind::TYPE_SLICE:
            w.WrU8('V');
            EncTy(static_cast<const ArrayTy&>(ty).elem);
            w.WrStr("/|");
            break;
        case TypeKind::TYPE_BARE_FN: {
            auto& fn = static_cast<const FnTy&>(ty);
            if (fn.def) {
                w.WrStr("F" + fn.def->ToString() + "|");
            } else {
                w.WrU8('G');
            }
            EncBareFnTy(fn.sig);
            break;
        }
        case TypeKind::TYPE_PARAM: {
            auto& param = static_cast<const ParamTy&>(ty);
            w.WrStr("p[" + SpaceText(param.space) + "|" + std::to_string(param.index) + "|" + param.name + "]");
            break;
        }
        case TypeKind::TYPE_PROJECTION: {
            auto& projection = static_cast<const ProjectionTy&>(ty);
            w.WrStr("P[");
            EncTraitRef(projection.traitRef);
            w.WrStr(projection.itemName + "]");
            break;
        }
        case TypeKind::TYPE_ERROR:
            w.WrU8('e');
            break;
        case TypeKind::TYPE_INFER:
            diag.Fatal(DiagKind::METADATA_INFERENCE_TYPE);
    }
}

void TypeEncoder::EncMt(Ptr<const Ty> pointee, AST::Mutability mutability)
{
    if (mutability == AST::Mutability::MUTABLE) {
        w.WrU8('m');
    }
    EncTy(pointee);
}

void TypeEncoder::EncRegion(const Region& region)
{
    switch (region.kind) {
        case RegionKind::EARLY_BOUND:
            w.WrStr("B[" + SpaceText(region.space) + "|" + std::to_string(region.index) + "|" + region.name + "]");
            break;
        case RegionKind::LATE_BOUND:
            w.WrStr("b[" + std::to_string(region.depth) + "|a" + std::to_string(region.index) + "|]");
            break;
        case RegionKind::STATIC:
            w.WrU8('t');
            break;
        case RegionKind::EMPTY:
            w.WrU8('e');
            break;
        case RegionKind::INFER:
            diag.Fatal(DiagKind::METADATA_INFERENCE_REGION);
    }
}

void TypeEncoder::EncSubsts(const Substs& substs)
{
    if (substs.erasedRegions) {
        w.WrU8('e');
    } else {
        w.WrU8('n');
        EncPerParamSpace(substs.regions, [this](const Region& region) { EncRegion(region); });
    }
    EncPerParamSpace(substs.types, [this](const Ptr<Ty>& ty) { EncTy(ty); });
}

void TypeEncoder::EncTraitRef(const TraitRef& traitRef)
{
    auto key = std::make_pair(traitRef.def.Pack(), traitRef.substs.get());
    if (auto found = cache.traitRefs.find(key); found != cache.traitRefs.end()) {
        w.WrStr(found->second);
        return;
    }
    auto start = w.MarkStablePosition();
    EncTraitRefUncached(traitRef);
    auto end = w.MarkStablePosition();
    if (auto abbrev = MakeAbbreviation(start, end); !abbrev.empty()) {
        cache.traitRefs.emplace(key, abbrev);
    }
}

void TypeEncoder::EncTraitRefUncached(const TraitRef& traitRef)
{
    w.WrStr(traitRef.def.ToString() + "|");
    EncSubsts(*traitRef.substs);
}

void TypeEncoder::EncBareFnTy(const BareFnSig& sig)
{
    w.WrU8(sig.unsafety == AST::Unsafety::UNSAFE ? 'u' : 'n');
    w.WrStr("[" + AST::AbiName(sig.abi) + "]");
    w.WrU8('[');
    for (auto& input : sig.inputs) {
        EncTy(input);
    }
    w.WrU8(']');
    w.WrU8(sig.variadic ? 'V' : 'N');
    if (sig.output) {
        EncTy(sig.output);
    } else {
        w.WrU8('z');
    }
}

void TypeEncoder::EncBuiltinBounds(const std::vector<BuiltinBound>& bounds)
{
    for (auto bound : bounds) {
        w.WrU8(static_cast<uint8_t>(BuiltinBoundCode(bound)));
    }
    w.WrU8('.');
}

void TypeEncoder::EncExistentialBounds(const ExistentialBounds& bounds)
{
    EncBuiltinBounds(bounds.builtinBounds);
    EncRegion(bounds.regionBound);
    for (auto& projection : bounds.projectionBounds) {
        w.WrU8('P');
        EncProjectionPredicate(projection);
    }
    w.WrU8('.');
}

void TypeEncoder::EncProjectionPredicate(const ProjectionPredicate& projection)
{
    EncTraitRef(projection.traitRef);
    w.WrStr(projection.itemName + "|");
    EncTy(projection.ty);
}

void TypeEncoder::EncPredicate(const Predicate& predicate)
{
    switch (predicate.kind) {
        case PredicateKind::TRAIT:
            w.WrU8('t');
            EncTraitRef(predicate.traitRef);
            break;
        case PredicateKind::EQUATE:
            w.WrU8('e');
            EncTy(predicate.tyA);
            EncTy(predicate.tyB);
            break;
        case PredicateKind::REGION_OUTLIVES:
            w.WrU8('r');
            EncRegion(predicate.regionA);
            EncRegion(predicate.regionB);
            break;
        case PredicateKind::TYPE_OUTLIVES:
            w.WrU8('o');
            EncTy(predicate.tyA);
            EncRegion(predicate.regionB);
            break;
        case PredicateKind::PROJECTION:
            w.WrU8('p');
            EncProjectionPredicate(predicate.projection);
            break;
    }
}

void TypeEncoder::EncTypeParamDef(const TypeParamDef& def)
{
    w.WrStr(def.name + ":" + def.def.ToString() + "|" + SpaceText(def.space) + "|" + std::to_string(def.index) +
        "|" + def.defaultDef.ToString() + "|");
    if (def.defaultTy) {
        w.WrU8('s');
        EncTy(def.defaultTy);
    } else {
        w.WrU8('n');
    }
    switch (def.objectLifetimeDefault) {
        case ObjectLifetimeDefaultKind::AMBIGUOUS:
            w.WrU8('a');
            break;
        case ObjectLifetimeDefaultKind::BASE_DEFAULT:
            w.WrU8('b');
            break;
        case ObjectLifetimeDefaultKind::SPECIFIC:
            w.WrU8('s');
            EncRegion(def.objectLifetimeRegion);
            break;
    }
}

std::string Metadata::EncodedTy(DiagnosticEngine& diag, Ptr<const Ty> ty)
{
    RecordWriter w(diag);
    AbbreviationCache cache;
    TypeEncoder(w, cache).EncTy(ty);
    auto& buffer = w.GetBuffer();
    return std::string(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(w.Position()));
}
