// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the RecordWriter.
 */

#include "metalith/Metadata/RecordWriter.h"

#include <cstring>

#include "llvm/Support/Endian.h"

#include "metalith/Metadata/Tags.h"

using namespace Metalith;
using namespace Metalith::Metadata;

namespace {
/// Records with a payload up to this size are compacted on close.
constexpr uint64_t RELAX_MAX_SIZE = 0x100;
constexpr size_t SIZE_SLOT_WIDTH = 4;

constexpr uint64_t VUINT_LIMIT_1 = 0x7f;
constexpr uint64_t VUINT_LIMIT_2 = 0x4000;
constexpr uint64_t VUINT_LIMIT_3 = 0x200000;
constexpr uint64_t VUINT_LIMIT_4 = 0x10000000;
} // namespace

void RecordWriter::WrBytes(const uint8_t* data, size_t len)
{
    if (len == 0) {
        return;
    }
    if (pos + len > buffer.size()) {
        buffer.resize(pos + len);
    }
    std::memcpy(buffer.data() + pos, data, len);
    pos += len;
}

void RecordWriter::WrStr(llvm::StringRef value)
{
    WrBytes(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

void RecordWriter::WrU8(uint8_t value)
{
    WrBytes(&value, 1);
}

void RecordWriter::WrU32BE(uint32_t value)
{
    uint8_t bytes[sizeof(uint32_t)];
    llvm::support::endian::write32be(bytes, value);
    WrBytes(bytes, sizeof(bytes));
}

void RecordWriter::WriteTag(uint32_t tag)
{
    if (tag < SHORT_TAG_LIMIT) {
        WrU8(static_cast<uint8_t>(tag));
    } else if (tag >= 0x100 && tag < NUM_TAGS) {
        uint8_t bytes[] = {static_cast<uint8_t>(0xf0 | (tag >> 8u)), static_cast<uint8_t>(tag & 0xffu)};
        WrBytes(bytes, sizeof(bytes));
    } else {
        diag.Fatal(DiagKind::METADATA_INVALID_TAG, tag);
    }
}

void RecordWriter::WriteSizedVuint(uint64_t n, size_t width)
{
    switch (width) {
        case 1:
            WrU8(static_cast<uint8_t>(0x80 | n));
            break;
        case 2: {
            uint8_t bytes[] = {static_cast<uint8_t>(0x40 | (n >> 8u)), static_cast<uint8_t>(n)};
            WrBytes(bytes, sizeof(bytes));
            break;
        }
        case 3: {
            uint8_t bytes[] = {static_cast<uint8_t>(0x20 | (n >> 16u)), static_cast<uint8_t>(n >> 8u),
                static_cast<uint8_t>(n)};
            WrBytes(bytes, sizeof(bytes));
            break;
        }
        case 4: {
            uint8_t bytes[] = {static_cast<uint8_t>(0x10 | (n >> 24u)), static_cast<uint8_t>(n >> 16u),
                static_cast<uint8_t>(n >> 8u), static_cast<uint8_t>(n)};
            WrBytes(bytes, sizeof(bytes));
            break;
        }
        default:
            diag.Fatal(DiagKind::METADATA_RECORD_TOO_LARGE, n);
    }
}

void RecordWriter::WriteVuint(uint64_t n)
{
    if (n < VUINT_LIMIT_1) {
        WriteSizedVuint(n, 1);
    } else if (n < VUINT_LIMIT_2) {
        WriteSizedVuint(n, 2);
    } else if (n < VUINT_LIMIT_3) {
        WriteSizedVuint(n, 3);
    } else if (n < VUINT_LIMIT_4) {
        WriteSizedVuint(n, 4);
    } else {
        diag.Fatal(DiagKind::METADATA_RECORD_TOO_LARGE, n);
    }
}

void RecordWriter::StartTag(uint32_t tag)
{
    WriteTag(tag);
    sizePositions.push_back(pos);
    const uint8_t placeholder[SIZE_SLOT_WIDTH] = {0, 0, 0, 0};
    WrBytes(placeholder, SIZE_SLOT_WIDTH);
}

void RecordWriter::EndTag()
{
    if (sizePositions.empty()) {
        diag.Fatal(DiagKind::METADATA_UNBALANCED_RECORD);
    }
    uint64_t sizePos = sizePositions.pop_back_val();
    uint64_t end = pos;
    uint64_t size = end - sizePos - SIZE_SLOT_WIDTH;
    if (size >= VUINT_LIMIT_4) {
        diag.Fatal(DiagKind::METADATA_RECORD_TOO_LARGE, size);
    }
    pos = sizePos;
    if (relaxRecords && size <= RELAX_MAX_SIZE && sizePos >= relaxLimit) {
        uint8_t payload[RELAX_MAX_SIZE];
        std::memcpy(payload, buffer.data() + sizePos + SIZE_SLOT_WIDTH, size);
        WriteVuint(size);
        WrBytes(payload, size);
    } else {
        WriteSizedVuint(size, SIZE_SLOT_WIDTH);
        pos = end;
    }
}

void RecordWriter::WrTaggedBytes(uint32_t tag, const uint8_t* data, size_t len)
{
    StartTag(tag);
    WrBytes(data, len);
    EndTag();
}

void RecordWriter::WrTaggedU8(uint32_t tag, uint8_t value)
{
    WrTaggedBytes(tag, &value, 1);
}

void RecordWriter::WrTaggedU32(uint32_t tag, uint32_t value)
{
    uint8_t bytes[sizeof(uint32_t)];
    llvm::support::endian::write32be(bytes, value);
    WrTaggedBytes(tag, bytes, sizeof(bytes));
}

void RecordWriter::WrTaggedU64(uint32_t tag, uint64_t value)
{
    uint8_t bytes[sizeof(uint64_t)];
    llvm::support::endian::write64be(bytes, value);
    WrTaggedBytes(tag, bytes, sizeof(bytes));
}

void RecordWriter::WrTaggedStr(uint32_t tag, llvm::StringRef value)
{
    WrTaggedBytes(tag, reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

uint64_t RecordWriter::MarkStablePosition()
{
    relaxLimit = pos;
    return pos;
}
