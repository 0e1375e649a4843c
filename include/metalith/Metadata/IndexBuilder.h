// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the bucketed record index and its lookup.
 *
 * Layout:
 *   INDEX
 *     INDEX_BUCKETS
 *       INDEX_BUCKETS_BUCKET x 256      bucket i holds the keys with SipHash(key) % 256 == i
 *         INDEX_BUCKETS_BUCKET_ELT*     u32 BE record offset, then the key bytes
 *     INDEX_TABLE                       256 x u32 BE offset of each bucket record
 */

#ifndef METALITH_METADATA_INDEXBUILDER_H
#define METALITH_METADATA_INDEXBUILDER_H

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "metalith/Metadata/RecordReader.h"
#include "metalith/Metadata/RecordWriter.h"
#include "metalith/Metadata/Tags.h"
#include "metalith/Utils/SipHash.h"

namespace Metalith::Metadata {
constexpr size_t INDEX_BUCKET_COUNT = 256;
/// Offsets are stored in 32 bits; this value and above cannot be represented.
constexpr uint64_t INDEX_OFFSET_LIMIT = 0xffffffffULL;
constexpr int64_t INDEX_KEY_LIMIT = 0x7fffffff;

template <typename T> struct IndexEntry {
    T key;
    uint64_t pos;
};

/// Item and field keys: node ids written as u32 BE.
void WriteI64Key(RecordWriter& w, const int64_t& key);

/**
 * Write the index of @p entries into the current record of @p w. @p writeKey encodes one key; it must
 * produce the bytes that the reader's equality function compares against.
 */
template <typename T>
void EncodeIndex(RecordWriter& w, const std::vector<IndexEntry<T>>& entries,
    const std::function<void(RecordWriter&, const T&)>& writeKey)
{
    std::array<std::vector<const IndexEntry<T>*>, INDEX_BUCKET_COUNT> buckets;
    for (auto& entry : entries) {
        auto hash = Utils::SipHash::GetHashValue(entry.key);
        buckets[hash % INDEX_BUCKET_COUNT].push_back(&entry);
    }

    w.StartTag(Tag::INDEX);
    std::array<uint64_t, INDEX_BUCKET_COUNT> bucketLocs{};
    w.StartTag(Tag::INDEX_BUCKETS);
    for (size_t i = 0; i < INDEX_BUCKET_COUNT; ++i) {
        bucketLocs[i] = w.MarkStablePosition();
        w.StartTag(Tag::INDEX_BUCKETS_BUCKET);
        for (auto entry : buckets[i]) {
            w.StartTag(Tag::INDEX_BUCKETS_BUCKET_ELT);
            if (entry->pos >= INDEX_OFFSET_LIMIT) {
                w.GetDiag().Fatal(DiagKind::METADATA_OFFSET_OVERFLOW, entry->pos);
            }
            w.WrU32BE(static_cast<uint32_t>(entry->pos));
            writeKey(w, entry->key);
            w.EndTag();
        }
        w.EndTag();
    }
    w.EndTag();

    w.StartTag(Tag::INDEX_TABLE);
    for (auto loc : bucketLocs) {
        if (loc >= INDEX_OFFSET_LIMIT) {
            w.GetDiag().Fatal(DiagKind::METADATA_OFFSET_OVERFLOW, loc);
        }
        w.WrU32BE(static_cast<uint32_t>(loc));
    }
    w.EndTag();
    w.EndTag();
}

inline void EncodeI64Index(RecordWriter& w, const std::vector<IndexEntry<int64_t>>& entries)
{
    EncodeIndex<int64_t>(w, entries, WriteI64Key);
}

/**
 * Find a record through the index embedded in @p owner. @p hash selects the bucket and @p eq compares the stored
 * key bytes. Returns the record at the stored offset.
 */
std::optional<Doc> LookupIndex(
    const Doc& owner, uint64_t hash, const std::function<bool(const uint8_t* key, size_t len)>& eq);

/// LookupIndex for keys written by WriteI64Key.
std::optional<Doc> LookupItem(const Doc& owner, int64_t key);
} // namespace Metalith::Metadata

#endif
