// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the MetadataEncoder implementation. Its member functions are spread over:
 *   MetadataEncoder.cpp        section order, statistics and framing
 *   UnitHeaderEncoder.cpp      unit-level sections
 *   ItemEncoder.cpp            one record per declaration
 *   ItemPropertyEncoder.cpp    the fields shared by declaration records
 *   PathEncoder.cpp            paths and re-exports
 */

#ifndef METALITH_METADATA_METADATAENCODERIMPL_H
#define METALITH_METADATA_METADATAENCODERIMPL_H

#include <vector>

#include "metalith/AST/DeclMap.h"
#include "metalith/Metadata/IndexBuilder.h"
#include "metalith/Metadata/MetadataEncoder.h"
#include "metalith/Metadata/Tags.h"
#include "metalith/Metadata/TypeEncoder.h"

namespace Metalith::Metadata {
using ItemIndex = std::vector<IndexEntry<int64_t>>;

class MetadataEncoder::MetadataEncoderImpl {
public:
    MetadataEncoderImpl(DiagnosticEngine& diag, const Sema::ResolvedDeclStore& store, const UnitInfo& unitInfo,
        const SourceManager& sm, const MetadataOptions& opts);
    ~MetadataEncoderImpl()
    {
    }

    std::vector<uint8_t> Encode(const AST::Unit& unit);

    InlinedItemWriter inlinedItemWriter;
    EncodeStats stats;

private:
    // Unit header sections, in stream order.
    void EncodeUnitName();
    void EncodeDylibDependencyFormats();
    void EncodeUnitAttributes(const AST::Unit& unit);
    void EncodeUnitDeps();
    void EncodeLangItems();
    void EncodeNativeLibraries();
    void EncodePluginRegistrarFn();
    void EncodeCodemap();
    void EncodeMacroDefs(const AST::Unit& unit);
    void EncodeImpls(const AST::Unit& unit);
    void EncodeEagerImplsIn(const std::vector<OwnedPtr<AST::Item>>& items);
    void EncodeMiscInfo(const AST::Unit& unit);
    void EncodeReachableExternFns();
    void EncodeStructFieldAttrs(const AST::Unit& unit);
    void EncodeStructFieldAttrsIn(const std::vector<OwnedPtr<AST::Item>>& items);
    void PrintStats() const;

    // Declaration records.
    ItemIndex EncodeItems(const AST::Unit& unit);
    void EncodeItemsIn(const std::vector<OwnedPtr<AST::Item>>& items, ItemIndex& index);
    void EncodeItem(const AST::Item& item, ItemIndex& index);
    void EncodeModRecord(AST::NodeId id, const std::vector<OwnedPtr<AST::Item>>& children,
        const std::vector<AST::Attribute>& attrs, const std::string& name, AST::Visibility vis);
    void EncodeStatic(const AST::StaticDecl& decl);
    void EncodeConst(const AST::ConstDecl& decl);
    void EncodeFn(const AST::FnDecl& decl);
    void EncodeForeignMod(const AST::ForeignModDecl& decl, ItemIndex& index);
    void EncodeForeignItem(const AST::ForeignItem& item, AST::Abi abi);
    void EncodeTypeAlias(const AST::TypeAliasDecl& decl);
    void EncodeEnum(const AST::EnumDecl& decl, ItemIndex& index);
    void EncodeVariants(const AST::EnumDecl& decl, ItemIndex& index);
    void EncodeStruct(const AST::StructDecl& decl, ItemIndex& index);
    void EncodeStructCtor(const AST::StructDecl& decl, AST::NodeId ctorId, ItemIndex& index);
    /// Field records of a struct or struct-like variant. Returns the owner's own field index.
    ItemIndex EncodeFieldRecords(const std::vector<Sema::FieldInfo>& fields, ItemIndex& index);
    void EncodeDefaultImpl(const AST::DefaultImplDecl& decl);
    void EncodeImpl(const AST::ImplDecl& decl, ItemIndex& index);
    void EncodeImplConst(const Sema::AssocItem& item, const AST::Path& implPath, AST::NodeId implId,
        const AST::ImplMember* member);
    void EncodeImplMethod(const Sema::AssocItem& item, const AST::Path& implPath, AST::NodeId implId,
        const AST::ImplMember* member);
    void EncodeImplType(const Sema::AssocItem& item, const AST::Path& implPath, AST::NodeId implId,
        const AST::ImplMember* member);
    void EncodeTrait(const AST::TraitDecl& decl, ItemIndex& index);
    void EncodeTraitItem(const AST::TraitDecl& decl, const Sema::AssocItem& item, const AST::TraitMember& member,
        const AST::Path& traitPath);

    // Fields shared by declaration records.
    void EncodeDefId(AST::DeclId id);
    void EncodeFamily(Family family);
    void EncodeName(const std::string& name);
    void EncodeVisibility(AST::Visibility vis);
    void EncodeParentItem(AST::DeclId id);
    void EncodeItemSort(char sort);
    void EncodeParentSort(char sort);
    void EncodeProvidedSource(const std::optional<AST::DeclId>& source);
    void EncodeSymbol(AST::NodeId id);
    void EncodeConstness(AST::Constness constness);
    void EncodeUnsafety(AST::Unsafety unsafety);
    void EncodePolarity(AST::ImplPolarity polarity);
    void EncodeExplicitSelf(const Sema::ExplicitSelf& explicitSelf);
    void EncodeMethodArgumentNames(const AST::FnSignature& sig);
    void EncodeStability(AST::DeclId id);
    void EncodeReprAttrs(const std::vector<AST::Attribute>& attrs);
    void EncodeVariances(AST::DeclId id);
    void EncodeAttributes(const std::vector<AST::Attribute>& attrs);
    void EncodeMetaItem(const AST::MetaItem& item);
    void EncodeType(Ptr<const Sema::Ty> ty);
    void EncodeRegion(const Sema::Region& region);
    void EncodeTraitRef(const Sema::TraitRef& traitRef, uint32_t tag);
    void EncodeGenerics(const Sema::Generics& generics, const Sema::GenericPredicates& predicates, uint32_t tag);
    void EncodePredicatesInCurrentRecord(const Sema::GenericPredicates& predicates);
    void EncodePredicates(const Sema::GenericPredicates& predicates, uint32_t tag);
    /// Generics and type of a declaration, from its type scheme and predicates.
    void EncodeBoundsAndType(AST::DeclId id);
    void EncodeMethodTyFields(const Sema::AssocItem& method);
    void EncodeStructFields(const std::vector<Sema::FieldInfo>& fields, AST::DeclId origin);
    void EncodeInherentImpls(AST::DeclId id);
    void EncodeExtensionImpls(const Sema::TraitDef& def);
    void EncodeInlinedItem(const InlinedItemRef& item);

    // Paths and re-exports.
    void EncodePath(const AST::Path& path);
    const AST::Path& PathOf(AST::NodeId id) const;
    void EncodeReexports(AST::NodeId moduleId, const AST::Path& modPath);
    void EncodeReexportedMethods(const Sema::Export& exp, const AST::Path& modPath);
    bool EncodeReexportedInherentMethods(const Sema::Export& exp);
    bool EncodeReexportedTraitMethods(const Sema::Export& exp);
    void EncodeReexport(AST::DeclId target, const std::string& name);

    // Lookups that must succeed.
    const Sema::TypeScheme& RequireTypeScheme(AST::DeclId id) const;
    const Sema::AssocItem& RequireAssocItem(AST::DeclId id) const;
    const std::vector<Sema::FieldInfo>& RequireStructFields(AST::DeclId id) const;

    /// Children listed after a module child: the constructor of a tuple-like struct.
    static std::optional<AST::NodeId> AuxiliaryNodeId(const AST::Item& item);

    DiagnosticEngine& diag;
    const Sema::ResolvedDeclStore& store;
    const UnitInfo& unitInfo;
    const SourceManager& sm;
    MetadataOptions opts;

    // State of the current encode.
    OwnedPtr<RecordWriter> writer;
    AbbreviationCache typeAbbrevs;
    OwnedPtr<AST::DeclMap> declMap;
};
} // namespace Metalith::Metadata

#endif
