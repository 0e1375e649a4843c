// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the RecordWriter, the in-memory writer of nested (tag, size, payload) records.
 */

#ifndef METALITH_METADATA_RECORDWRITER_H
#define METALITH_METADATA_RECORDWRITER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

#include "metalith/Basic/DiagnosticEngine.h"

namespace Metalith::Metadata {
/**
 * Writes nested records. Each record is a tag, a size and a payload made of raw bytes or further records.
 *
 * A record's size is unknown when it opens, so StartTag reserves four bytes and EndTag backpatches them. Small
 * records are then compacted: the size is rewritten in its shortest form and the payload moved back, which leaves
 * stale bytes past the logical end. Offsets handed out by MarkStablePosition are never invalidated, because no
 * record opened before the most recent stable position is compacted.
 */
class RecordWriter {
public:
    explicit RecordWriter(DiagnosticEngine& diag, bool relaxRecords = true) : diag(diag), relaxRecords(relaxRecords)
    {
    }

    void StartTag(uint32_t tag);
    void EndTag();

    ///@{
    /// One complete record holding a single scalar. Integers are big-endian.
    void WrTaggedBytes(uint32_t tag, const uint8_t* data, size_t len);
    void WrTaggedU8(uint32_t tag, uint8_t value);
    void WrTaggedU32(uint32_t tag, uint32_t value);
    void WrTaggedU64(uint32_t tag, uint64_t value);
    void WrTaggedStr(uint32_t tag, llvm::StringRef value);
    ///@}

    ///@{
    /// Raw payload bytes inside the currently open record.
    void WrBytes(const uint8_t* data, size_t len);
    void WrStr(llvm::StringRef value);
    void WrU8(uint8_t value);
    void WrU32BE(uint32_t value);
    ///@}

    /// Current logical position, and a promise that no byte before it moves from now on.
    uint64_t MarkStablePosition();

    uint64_t Position() const
    {
        return pos;
    }

    size_t OpenRecordCount() const
    {
        return sizePositions.size();
    }

    /// Backing buffer. Bytes at or past Position() are stale.
    const std::vector<uint8_t>& GetBuffer() const
    {
        return buffer;
    }

    std::vector<uint8_t> TakeBuffer()
    {
        return std::move(buffer);
    }

    DiagnosticEngine& GetDiag() const
    {
        return diag;
    }

private:
    void WriteTag(uint32_t tag);
    void WriteVuint(uint64_t n);
    void WriteSizedVuint(uint64_t n, size_t width);

    DiagnosticEngine& diag;
    bool relaxRecords;
    std::vector<uint8_t> buffer;
    uint64_t pos{0};
    uint64_t relaxLimit{0};
    llvm::SmallVector<uint64_t, 16> sizePositions;
};
} // namespace Metalith::Metadata

#endif
