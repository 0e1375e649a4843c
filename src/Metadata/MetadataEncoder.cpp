// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the MetadataEncoder entry point: section order, statistics and framing.
 */

#include "MetadataEncoderImpl.h"

#include <algorithm>

#include "metalith/Basic/Print.h"
#include "metalith/Metadata/BlobFramer.h"
#include "metalith/Utils/CheckUtils.h"

using namespace Metalith;
using namespace Metalith::Metadata;

namespace {
void WriteInlinedItemReference(RecordWriter& w, const InlinedItemRef& item)
{
    w.StartTag(Tag::AST);
    w.WrTaggedU8(Tag::AST_ITEM_KIND, static_cast<uint8_t>(item.kind));
    w.WrTaggedU32(Tag::AST_ITEM_NODE_ID, item.node);
    if (item.parent) {
        w.WrTaggedU64(Tag::AST_ITEM_PARENT, item.parent->Pack());
    }
    w.EndTag();
}
} // namespace

MetadataEncoder::MetadataEncoder(DiagnosticEngine& diag, const Sema::ResolvedDeclStore& store,
    const UnitInfo& unitInfo, const SourceManager& sm, const MetadataOptions& opts)
    : pImpl{std::make_unique<MetadataEncoderImpl>(diag, store, unitInfo, sm, opts)}
{
}

MetadataEncoder::~MetadataEncoder()
{
}

std::vector<uint8_t> MetadataEncoder::Encode(const AST::Unit& unit) const
{
    return pImpl->Encode(unit);
}

void MetadataEncoder::SetInlinedItemWriter(InlinedItemWriter writer)
{
    pImpl->inlinedItemWriter = writer ? std::move(writer) : WriteInlinedItemReference;
}

const EncodeStats& MetadataEncoder::GetStats() const
{
    return pImpl->stats;
}

MetadataEncoder::MetadataEncoderImpl::MetadataEncoderImpl(DiagnosticEngine& diag,
    const Sema::ResolvedDeclStore& store, const UnitInfo& unitInfo, const SourceManager& sm,
    const MetadataOptions& opts)
    : inlinedItemWriter(WriteInlinedItemReference), diag(diag), store(store), unitInfo(unitInfo), sm(sm), opts(opts)
{
}

std::vector<uint8_t> MetadataEncoder::MetadataEncoderImpl::Encode(const AST::Unit& unit)
{
    writer = MakeOwned<RecordWriter>(diag, opts.relaxRecords);
    typeAbbrevs.Clear();
    declMap = MakeOwned<AST::DeclMap>(unit);
    stats = EncodeStats{};

    auto& w = *writer;
    uint64_t start = 0;
    auto measure = [&w, &start](uint64_t& counter) {
        counter = w.Position() - start;
        start = w.Position();
    };

    EncodeUnitName();
    EncodeDylibDependencyFormats();

    start = w.Position();
    EncodeUnitAttributes(unit);
    measure(stats.attrBytes);
    EncodeUnitDeps();
    measure(stats.depBytes);
    EncodeLangItems();
    measure(stats.langItemBytes);
    EncodeNativeLibraries();
    measure(stats.nativeLibBytes);
    EncodePluginRegistrarFn();
    measure(stats.pluginRegistrarBytes);
    EncodeCodemap();
    measure(stats.codemapBytes);
    EncodeMacroDefs(unit);
    measure(stats.macroDefBytes);
    EncodeImpls(unit);
    measure(stats.implBytes);
    EncodeMiscInfo(unit);
    EncodeReachableExternFns();
    measure(stats.miscBytes);

    w.StartTag(Tag::ITEMS);
    start = w.Position();
    auto index = EncodeItems(unit);
    measure(stats.itemBytes);
    EncodeI64Index(w, index);
    measure(stats.indexBytes);
    w.EndTag();

    EncodeStructFieldAttrs(unit);

    MLT_ASSERT(w.OpenRecordCount() == 0);
    stats.totalBytes = w.Position();
    auto& buffer = w.GetBuffer();
    stats.zeroBytes = static_cast<uint64_t>(
        std::count(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(stats.totalBytes), 0));
    if (opts.printStats) {
        PrintStats();
    }
    return FrameMetadata(w);
}

void MetadataEncoder::MetadataEncoderImpl::PrintStats() const
{
    const int labelWidth = 24;
    Println("metadata stats:");
    PrintLabeled("attribute bytes", stats.attrBytes, labelWidth);
    PrintLabeled("dep bytes", stats.depBytes, labelWidth);
    PrintLabeled("lang item bytes", stats.langItemBytes, labelWidth);
    PrintLabeled("native bytes", stats.nativeLibBytes, labelWidth);
    PrintLabeled("plugin registrar bytes", stats.pluginRegistrarBytes, labelWidth);
    PrintLabeled("codemap bytes", stats.codemapBytes, labelWidth);
    PrintLabeled("macro def bytes", stats.macroDefBytes, labelWidth);
    PrintLabeled("impl bytes", stats.implBytes, labelWidth);
    PrintLabeled("misc bytes", stats.miscBytes, labelWidth);
    PrintLabeled("item bytes", stats.itemBytes, labelWidth);
    PrintLabeled("index bytes", stats.indexBytes, labelWidth);
    PrintLabeled("zero bytes", stats.zeroBytes, labelWidth);
    PrintLabeled("total bytes", stats.totalBytes, labelWidth);
}
