// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the index key writer and the two-hop index lookup.
 */

#include "metalith/Metadata/IndexBuilder.h"

#include "llvm/Support/Endian.h"

using namespace Metalith;
using namespace Metalith::Metadata;

void Metadata::WriteI64Key(RecordWriter& w, const int64_t& key)
{
    if (key < 0 || key >= INDEX_KEY_LIMIT) {
        w.GetDiag().Fatal(DiagKind::METADATA_KEY_OVERFLOW, key);
    }
    w.WrU32BE(static_cast<uint32_t>(key));
}

std::optional<Doc> Metadata::LookupIndex(
    const Doc& owner, uint64_t hash, const std::function<bool(const uint8_t* key, size_t len)>& eq)
{
    auto index = owner.Get(Tag::INDEX);
    if (!index) {
        return std::nullopt;
    }
    auto table = index->Get(Tag::INDEX_TABLE);
    if (!table || table->Size() != INDEX_BUCKET_COUNT * sizeof(uint32_t)) {
        return std::nullopt;
    }
    size_t slot = table->start + static_cast<size_t>(hash % INDEX_BUCKET_COUNT) * sizeof(uint32_t);
    size_t bucketPos = llvm::support::endian::read32be(owner.data + slot);
    auto bucket = DocAt(owner.data, owner.dataLen, bucketPos);
    if (!bucket || bucket->tag != Tag::INDEX_BUCKETS_BUCKET) {
        return std::nullopt;
    }
    bucket->doc.dataLen = owner.dataLen;
    for (auto& elt : bucket->doc.TaggedDocs(Tag::INDEX_BUCKETS_BUCKET_ELT)) {
        if (elt.Size() < sizeof(uint32_t)) {
            continue;
        }
        if (!eq(elt.data + elt.start + sizeof(uint32_t), elt.Size() - sizeof(uint32_t))) {
            continue;
        }
        size_t recordPos = llvm::support::endian::read32be(elt.data + elt.start);
        auto record = DocAt(owner.data, owner.dataLen, recordPos);
        if (!record) {
            return std::nullopt;
        }
        return record->doc;
    }
    return std::nullopt;
}

std::optional<Doc> Metadata::LookupItem(const Doc& owner, int64_t key)
{
    auto hash = Utils::SipHash::GetHashValue(key);
    return LookupIndex(owner, hash, [key](const uint8_t* bytes, size_t len) {
        return len == sizeof(uint32_t) && llvm::support::endian::read32be(bytes) == static_cast<uint64_t>(key);
    });
}
