// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the MetadataEncoder, which serializes the public interface of a checked unit into a framed
 * metadata blob that downstream units load instead of re-reading the sources.
 */

#ifndef METALITH_METADATA_METADATAENCODER_H
#define METALITH_METADATA_METADATAENCODER_H

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "metalith/AST/Node.h"
#include "metalith/Basic/DiagnosticEngine.h"
#include "metalith/Basic/SourceManager.h"
#include "metalith/Metadata/RecordWriter.h"
#include "metalith/Sema/ResolvedDeclStore.h"

namespace Metalith::Metadata {
struct MetadataOptions {
    /// Print the byte count of every section after encoding (`meta-stats`).
    bool printStats{false};
    /// Allow small records to be compacted. When false every record keeps a 4-byte size field.
    bool relaxRecords{true};
};

struct UnitDependency {
    uint32_t unitNumber;
    std::string name;
    std::string hash;
};

/// Wire values of NATIVE_LIBRARIES_KIND.
enum class NativeLibKind : uint32_t { STATIC = 0, FRAMEWORK = 1, UNKNOWN = 2 };

struct NativeLibrary {
    std::string name;
    NativeLibKind kind{NativeLibKind::UNKNOWN};
};

enum class LinkagePreference : uint8_t { DYNAMIC, STATIC };

/// Facts about the unit that do not come from its declarations.
struct UnitInfo {
    std::string name;
    std::string triple;
    std::string hash;
    std::vector<UnitDependency> deps;
    std::vector<NativeLibrary> nativeLibs;
    /// Set when the unit is a dynamic library: the linkage chosen for each dependency, by unit number - 1.
    std::optional<std::vector<std::optional<LinkagePreference>>> dylibFormats;
    std::optional<AST::NodeId> pluginRegistrar;
};

enum class InlinedItemKind : uint8_t { ITEM, TRAIT_ITEM, IMPL_ITEM, FOREIGN_ITEM };

/// A declaration whose body is exported for cross-unit inlining.
struct InlinedItemRef {
    InlinedItemKind kind;
    AST::NodeId node;
    std::optional<AST::DeclId> parent; ///< Trait or impl owning a TRAIT_ITEM or IMPL_ITEM.
};

/**
 * Writes the body of an inlined item into the current record. The default writer emits a reference record
 * `AST { AST_ITEM_KIND, AST_ITEM_NODE_ID [, AST_ITEM_PARENT] }`; a code generator can install one that writes the
 * full body.
 */
using InlinedItemWriter = std::function<void(RecordWriter& w, const InlinedItemRef& item)>;

/// Byte counts per section of the last encode.
struct EncodeStats {
    uint64_t attrBytes{0};
    uint64_t depBytes{0};
    uint64_t langItemBytes{0};
    uint64_t nativeLibBytes{0};
    uint64_t pluginRegistrarBytes{0};
    uint64_t codemapBytes{0};
    uint64_t macroDefBytes{0};
    uint64_t implBytes{0};
    uint64_t miscBytes{0};
    uint64_t itemBytes{0};
    uint64_t indexBytes{0};
    uint64_t zeroBytes{0};
    uint64_t totalBytes{0};
};

class MetadataEncoder {
public:
    MetadataEncoder(DiagnosticEngine& diag, const Sema::ResolvedDeclStore& store, const UnitInfo& unitInfo,
        const SourceManager& sm, const MetadataOptions& opts = {});
    ~MetadataEncoder();

    /**
     * Encode @p unit and return the framed blob. Internal invariant violations are reported through the
     * DiagnosticEngine and abort the encode with InternalCompilerError; no partial blob is returned.
     */
    std::vector<uint8_t> Encode(const AST::Unit& unit) const;

    void SetInlinedItemWriter(InlinedItemWriter writer);

    const EncodeStats& GetStats() const;

private:
    class MetadataEncoderImpl;
    std::unique_ptr<MetadataEncoderImpl> pImpl;
};
} // namespace Metalith::Metadata

#endif
