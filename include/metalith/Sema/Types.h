// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the semantic type model: interned types, regions, substitutions, trait references,
 * predicates and generics. Types are created and uniqued by the TypeManager, so two types are equal exactly when
 * their pointers are.
 */

#ifndef METALITH_SEMA_TYPES_H
#define METALITH_SEMA_TYPES_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "metalith/AST/DeclId.h"
#include "metalith/AST/Node.h"
#include "metalith/Utils/SafePointer.h"

namespace Metalith::Sema {
using AST::DeclId;

enum class ParamSpace : uint8_t { TYPE_SPACE, SELF_SPACE, FN_SPACE };
constexpr size_t PARAM_SPACE_COUNT = 3;
constexpr std::array<ParamSpace, PARAM_SPACE_COUNT> ALL_PARAM_SPACES = {
    ParamSpace::TYPE_SPACE, ParamSpace::SELF_SPACE, ParamSpace::FN_SPACE};

/// One list of values per parameter space.
template <typename T> struct PerParamSpace {
    std::array<std::vector<T>, PARAM_SPACE_COUNT> spaces;

    const std::vector<T>& Get(ParamSpace space) const
    {
        return spaces[static_cast<size_t>(space)];
    }

    void Push(ParamSpace space, T value)
    {
        spaces[static_cast<size_t>(space)].push_back(std::move(value));
    }

    bool IsEmpty() const
    {
        for (auto& space : spaces) {
            if (!space.empty()) {
                return false;
            }
        }
        return true;
    }
};

enum class RegionKind : uint8_t { STATIC, EMPTY, EARLY_BOUND, LATE_BOUND, INFER };

struct Region {
    RegionKind kind{RegionKind::STATIC};
    ParamSpace space{ParamSpace::TYPE_SPACE}; ///< EARLY_BOUND only.
    uint32_t index{0};                        ///< Parameter index, or anonymous index for LATE_BOUND.
    uint32_t depth{0};                        ///< LATE_BOUND only.
    std::string name;                         ///< EARLY_BOUND only.

    static Region Static()
    {
        return {};
    }

    static Region EarlyBound(ParamSpace space, uint32_t index, std::string name)
    {
        return {RegionKind::EARLY_BOUND, space, index, 0, std::move(name)};
    }

    static Region LateBound(uint32_t depth, uint32_t index)
    {
        return {RegionKind::LATE_BOUND, ParamSpace::TYPE_SPACE, index, depth, ""};
    }

    std::string Key() const;
};

struct Ty;

/// Generic arguments. Interned by the TypeManager.
struct Substs {
    bool erasedRegions{true};
    PerParamSpace<Region> regions;
    PerParamSpace<Ptr<Ty>> types;
    uint32_t id{0};
};

struct TraitRef {
    DeclId def;
    Ptr<const Substs> substs;
};

struct BareFnSig {
    AST::Unsafety unsafety{AST::Unsafety::NORMAL};
    AST::Abi abi{AST::Abi::RUST};
    std::vector<Ptr<Ty>> inputs;
    Ptr<Ty> output; ///< Null for a diverging function.
    bool variadic{false};
};

enum class BuiltinBound : uint8_t { SEND, SIZED, COPY, SYNC };

struct ProjectionPredicate {
    TraitRef traitRef;
    std::string itemName;
    Ptr<Ty> ty;
};

struct ExistentialBounds {
    Region regionBound;
    std::vector<BuiltinBound> builtinBounds;
    std::vector<ProjectionPredicate> projectionBounds;
};

enum class TypeKind : uint8_t {
    TYPE_BOOL,
    TYPE_CHAR,
    TYPE_INT,
    TYPE_UINT,
    TYPE_FLOAT,
    TYPE_STR,
    TYPE_ENUM,
    TYPE_STRUCT,
    TYPE_CLOSURE,
    TYPE_BOX,
    TYPE_RAW_PTR,
    TYPE_REF,
    TYPE_ARRAY,
    TYPE_SLICE,
    TYPE_BARE_FN,
    TYPE_TRAIT,
    TYPE_TUPLE,
    TYPE_PARAM,
    TYPE_PROJECTION,
    TYPE_INFER,
    TYPE_ERROR,
};

enum class IntKind : uint8_t { ISIZE, I8, I16, I32, I64 };
enum class UintKind : uint8_t { USIZE, U8, U16, U32, U64 };
enum class FloatKind : uint8_t { F32, F64 };

struct Ty {
    const TypeKind kind;
    uint32_t id{0}; ///< Interning sequence number, unique per TypeManager.

    virtual ~Ty() = default;

protected:
    explicit Ty(TypeKind kind) : kind(kind)
    {
    }
};

/// bool, char, str, the numeric types, inference variables and the error type.
struct PrimitiveTy : Ty {
    explicit PrimitiveTy(TypeKind kind, uint8_t numericKind = 0) : Ty(kind), numericKind(numericKind)
    {
    }
    uint8_t numericKind; ///< IntKind, UintKind or FloatKind value for numeric types.
};

/// Enums, structs and closures: a definition applied to arguments.
struct AdtTy : Ty {
    AdtTy(TypeKind kind, DeclId def, Ptr<const Substs> substs) : Ty(kind), def(def), substs(substs)
    {
    }
    DeclId def;
    Ptr<const Substs> substs;
};

/// Box, raw pointer and reference.
struct PointerTy : Ty {
    PointerTy(TypeKind kind, Ptr<Ty> pointee, AST::Mutability mutability, Region region)
        : Ty(kind), pointee(pointee), mutability(mutability), region(std::move(region))
    {
    }
    Ptr<Ty> pointee;
    AST::Mutability mutability;
    Region region; ///< TYPE_REF only.
};

/// Fixed-size arrays and slices.
struct ArrayTy : Ty {
    ArrayTy(TypeKind kind, Ptr<Ty> elem, uint64_t size) : Ty(kind), elem(elem), size(size)
    {
    }
    Ptr<Ty> elem;
    uint64_t size; ///< TYPE_ARRAY only.
};

struct TupleTy : Ty {
    explicit TupleTy(std::vector<Ptr<Ty>> elems) : Ty(TypeKind::TYPE_TUPLE), elems(std::move(elems))
    {
    }
    std::vector<Ptr<Ty>> elems;
};

struct FnTy : Ty {
    FnTy(std::optional<DeclId> def, BareFnSig sig) : Ty(TypeKind::TYPE_BARE_FN), def(def), sig(std::move(sig))
    {
    }
    std::optional<DeclId> def; ///< Set for the type of a named function item.
    BareFnSig sig;
};

struct TraitObjectTy : Ty {
    TraitObjectTy(TraitRef principal, ExistentialBounds bounds)
        : Ty(TypeKind::TYPE_TRAIT), principal(std::move(principal)), bounds(std::move(bounds))
    {
    }
    TraitRef principal;
    ExistentialBounds bounds;
};

struct ParamTy : Ty {
    ParamTy(ParamSpace space, uint32_t index, std::string name)
        : Ty(TypeKind::TYPE_PARAM), space(space), index(index), name(std::move(name))
    {
    }
    ParamSpace space;
    uint32_t index;
    std::string name;
};

struct ProjectionTy : Ty {
    ProjectionTy(TraitRef traitRef, std::string itemName)
        : Ty(TypeKind::TYPE_PROJECTION), traitRef(std::move(traitRef)), itemName(std::move(itemName))
    {
    }
    TraitRef traitRef;
    std::string itemName;
};

enum class PredicateKind : uint8_t { TRAIT, EQUATE, REGION_OUTLIVES, TYPE_OUTLIVES, PROJECTION };

struct Predicate {
    PredicateKind kind{PredicateKind::TRAIT};
    TraitRef traitRef;             ///< TRAIT.
    Ptr<Ty> tyA;                   ///< EQUATE, TYPE_OUTLIVES.
    Ptr<Ty> tyB;                   ///< EQUATE.
    Region regionA;                ///< REGION_OUTLIVES.
    Region regionB;                ///< REGION_OUTLIVES, TYPE_OUTLIVES.
    ProjectionPredicate projection; ///< PROJECTION.

    static Predicate Trait(TraitRef traitRef);
    static Predicate Equate(Ptr<Ty> a, Ptr<Ty> b);
    static Predicate RegionOutlives(Region a, Region b);
    static Predicate TypeOutlives(Ptr<Ty> a, Region b);
    static Predicate Projection(ProjectionPredicate projection);
};

struct GenericPredicates {
    PerParamSpace<Predicate> predicates;
};

enum class ObjectLifetimeDefaultKind : uint8_t { AMBIGUOUS, BASE_DEFAULT, SPECIFIC };

struct TypeParamDef {
    std::string name;
    DeclId def;
    ParamSpace space{ParamSpace::TYPE_SPACE};
    uint32_t index{0};
    DeclId defaultDef;
    Ptr<Ty> defaultTy; ///< Null when the parameter has no default.
    ObjectLifetimeDefaultKind objectLifetimeDefault{ObjectLifetimeDefaultKind::BASE_DEFAULT};
    Region objectLifetimeRegion; ///< SPECIFIC only.
};

struct RegionParamDef {
    std::string name;
    DeclId def;
    ParamSpace space{ParamSpace::TYPE_SPACE};
    uint32_t index{0};
    std::vector<Region> bounds;
};

struct Generics {
    PerParamSpace<TypeParamDef> types;
    PerParamSpace<RegionParamDef> regions;
};

struct TypeScheme {
    Generics generics;
    Ptr<Ty> ty;
};
} // namespace Metalith::Sema

#endif
