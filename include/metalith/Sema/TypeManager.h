// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the TypeManager, which creates and uniques semantic types and substitutions.
 */

#ifndef METALITH_SEMA_TYPEMANAGER_H
#define METALITH_SEMA_TYPEMANAGER_H

#include <string>
#include <unordered_map>
#include <vector>

#include "metalith/Sema/Types.h"

namespace Metalith::Sema {
class TypeManager {
public:
    TypeManager();

    ///@{
    /// Primitive types are created once per manager.
    Ptr<Ty> GetBoolTy() const
    {
        return boolTy;
    }
    Ptr<Ty> GetCharTy() const
    {
        return charTy;
    }
    Ptr<Ty> GetStrTy() const
    {
        return strTy;
    }
    Ptr<Ty> GetErrorTy() const
    {
        return errorTy;
    }
    Ptr<Ty> GetInferTy() const
    {
        return inferTy;
    }
    Ptr<Ty> GetIntTy(IntKind kind);
    Ptr<Ty> GetUintTy(UintKind kind);
    Ptr<Ty> GetFloatTy(FloatKind kind);
    ///@}

    Ptr<const Substs> GetSubsts(const PerParamSpace<Ptr<Ty>>& types);
    Ptr<const Substs> GetSubsts(const PerParamSpace<Ptr<Ty>>& types, const PerParamSpace<Region>& regions);
    Ptr<const Substs> GetEmptySubsts();

    Ptr<Ty> GetEnumTy(DeclId def, Ptr<const Substs> substs);
    Ptr<Ty> GetStructTy(DeclId def, Ptr<const Substs> substs);
    Ptr<Ty> GetClosureTy(DeclId def, Ptr<const Substs> substs);
    Ptr<Ty> GetBoxTy(Ptr<Ty> pointee);
    Ptr<Ty> GetRawPtrTy(Ptr<Ty> pointee, AST::Mutability mutability);
    Ptr<Ty> GetRefTy(const Region& region, Ptr<Ty> pointee, AST::Mutability mutability);
    Ptr<Ty> GetArrayTy(Ptr<Ty> elem, uint64_t size);
    Ptr<Ty> GetSliceTy(Ptr<Ty> elem);
    Ptr<Ty> GetTupleTy(const std::vector<Ptr<Ty>>& elems);
    Ptr<Ty> GetFnTy(std::optional<DeclId> def, const BareFnSig& sig);
    Ptr<Ty> GetTraitObjectTy(const TraitRef& principal, const ExistentialBounds& bounds);
    Ptr<Ty> GetParamTy(ParamSpace space, uint32_t index, const std::string& name);
    Ptr<Ty> GetProjectionTy(const TraitRef& traitRef, const std::string& itemName);

    size_t GetTypeCount() const
    {
        return allTys.size();
    }

private:
    /// Return the type already interned under @p key, or take ownership of @p fresh.
    Ptr<Ty> Intern(const std::string& key, OwnedPtr<Ty> fresh);
    static std::string Key(const TraitRef& traitRef);

    std::vector<OwnedPtr<Ty>> allTys;
    std::unordered_map<std::string, Ptr<Ty>> tyPool;
    std::vector<OwnedPtr<Substs>> allSubsts;
    std::unordered_map<std::string, Ptr<const Substs>> substsPool;
    Ptr<Ty> boolTy;
    Ptr<Ty> charTy;
    Ptr<Ty> strTy;
    Ptr<Ty> errorTy;
    Ptr<Ty> inferTy;
};
} // namespace Metalith::Sema

#endif
