// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the TypeEncoder, which writes semantic types, regions, substitutions, trait references and
 * predicates as a compact ASCII grammar into the payload of the currently open record.
 */

#ifndef METALITH_METADATA_TYPEENCODER_H
#define METALITH_METADATA_TYPEENCODER_H

#include <cstdint>
#include <map>
#include <string>
#include <utility>

#include "llvm/ADT/DenseMap.h"

#include "metalith/Metadata/RecordWriter.h"
#include "metalith/Sema/Types.h"

namespace Metalith::Metadata {
/**
 * Back-references to types and trait references already written to the stream. An entry `#pos:len#` (both in
 * hex) points at the bytes of the first encoding. Entries are only added when the back-reference is shorter than
 * the encoding it replaces. The cache lives as long as the stream it refers to.
 */
struct AbbreviationCache {
    llvm::DenseMap<const Sema::Ty*, std::string> types;
    std::map<std::pair<uint64_t, const Sema::Substs*>, std::string> traitRefs;

    void Clear()
    {
        types.clear();
        traitRefs.clear();
    }
};

class TypeEncoder {
public:
    TypeEncoder(RecordWriter& w, AbbreviationCache& cache) : w(w), diag(w.GetDiag()), cache(cache)
    {
    }

    void EncTy(Ptr<const Sema::Ty> ty);
    void EncTraitRef(const Sema::TraitRef& traitRef);
    void EncPredicate(const Sema::Predicate& predicate);
    void EncTypeParamDef(const Sema::TypeParamDef& def);
    void EncRegion(const Sema::Region& region);
    void EncSubsts(const Sema::Substs& substs);
    void EncBareFnTy(const Sema::BareFnSig& sig);
    void EncExistentialBounds(const Sema::ExistentialBounds& bounds);

private:
    void EncTyUncached(const Sema::Ty& ty);
    void EncTraitRefUncached(const Sema::TraitRef& traitRef);
    void EncMt(Ptr<const Sema::Ty> pointee, AST::Mutability mutability);
    void EncBuiltinBounds(const std::vector<Sema::BuiltinBound>& bounds);
    void EncProjectionPredicate(const Sema::ProjectionPredicate& projection);
    template <typename T, typename Fn> void EncPerParamSpace(const Sema::PerParamSpace<T>& values, Fn op);
    /// Abbreviation for the bytes [start, end), or an empty string when it would not save space.
    static std::string MakeAbbreviation(uint64_t start, uint64_t end);

    RecordWriter& w;
    DiagnosticEngine& diag;
    AbbreviationCache& cache;
};

/// Render @p ty on its own, with a fresh stream and cache. Used for diagnostics and tests.
std::string EncodedTy(DiagnosticEngine& diag, Ptr<const Sema::Ty> ty);
} // namespace Metalith::Metadata

#endif
