// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares Doc, a bounds-checked read-only view of one record of a finished metadata body. It is the
 * consumer side of the record format: loaders use it to random-access records found through an index.
 */

#ifndef METALITH_METADATA_RECORDREADER_H
#define METALITH_METADATA_RECORDREADER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Metalith::Metadata {
struct TaggedDoc;

/// Payload of one record, as [start, end) inside the metadata body @c data.
struct Doc {
    const uint8_t* data{nullptr};
    size_t dataLen{0};
    size_t start{0};
    size_t end{0};

    /// A view of a whole body, for reading its top-level records.
    static Doc Whole(const uint8_t* data, size_t len)
    {
        return {data, len, 0, len};
    }

    size_t Size() const
    {
        return end - start;
    }

    /// First child record with @p tag.
    std::optional<Doc> Get(uint32_t tag) const;
    /// All child records with @p tag, in order.
    std::vector<Doc> TaggedDocs(uint32_t tag) const;
    /// All child records. Stops at the first malformed child and reports it through the return value.
    bool ForEach(const std::function<bool(uint32_t tag, const Doc& doc)>& fn) const;

    ///@{
    /// Scalar payloads. Return std::nullopt when the payload has the wrong size.
    std::optional<uint8_t> AsU8() const;
    std::optional<uint32_t> AsU32() const;
    std::optional<uint64_t> AsU64() const;
    ///@}
    std::string AsStr() const;
    std::vector<uint8_t> AsBytes() const;
};

struct TaggedDoc {
    uint32_t tag;
    Doc doc;
    size_t next; ///< Position right after the record.
};

/// Decode the record that starts at @p pos of @p data. Returns std::nullopt for a truncated or malformed header.
std::optional<TaggedDoc> DocAt(const uint8_t* data, size_t len, size_t pos);
} // namespace Metalith::Metadata

#endif
