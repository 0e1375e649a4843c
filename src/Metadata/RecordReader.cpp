// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the record reader.
 */

#include "metalith/Metadata/RecordReader.h"

#include "llvm/Support/Endian.h"

#include "metalith/Metadata/Tags.h"

using namespace Metalith::Metadata;

namespace {
struct Decoded {
    uint64_t value;
    size_t next;
};

std::optional<Decoded> ReadTag(const uint8_t* data, size_t len, size_t pos)
{
    if (pos >= len) {
        return std::nullopt;
    }
    uint8_t first = data[pos];
    if (first < SHORT_TAG_LIMIT) {
        return Decoded{first, pos + 1};
    }
    if (pos + 1 >= len) {
        return std::nullopt;
    }
    return Decoded{(static_cast<uint64_t>(first & 0x0fu) << 8u) | data[pos + 1], pos + 2};
}

std::optional<Decoded> ReadVuint(const uint8_t* data, size_t len, size_t pos)
{
    if (pos >= len) {
        return std::nullopt;
    }
    uint8_t first = data[pos];
    size_t width;
    uint64_t value;
    if ((first & 0x80u) != 0) {
        width = 1;
        value = first & 0x7fu;
    } else if ((first & 0x40u) != 0) {
        width = 2;
        value = first & 0x3fu;
    } else if ((first & 0x20u) != 0) {
        width = 3;
        value = first & 0x1fu;
    } else if ((first & 0x10u) != 0) {
        width = 4;
        value = first & 0x0fu;
    } else {
        return std::nullopt;
    }
    if (pos + width > len) {
        return std::nullopt;
    }
    for (size_t i = 1; i < width; ++i) {
        value = (value << 8u) | data[pos + i];
    }
    return Decoded{value, pos + width};
}
} // namespace

std::optional<TaggedDoc> Metalith::Metadata::DocAt(const uint8_t* data, size_t len, size_t pos)
{
    auto tag = ReadTag(data, len, pos);
    if (!tag) {
        return std::nullopt;
    }
    auto size = ReadVuint(data, len, tag->next);
    if (!size || size->value > len - size->next) {
        return std::nullopt;
    }
    size_t start = size->next;
    size_t end = start + static_cast<size_t>(size->value);
    return TaggedDoc{static_cast<uint32_t>(tag->value), Doc{data, len, start, end}, end};
}

bool Doc::ForEach(const std::function<bool(uint32_t tag, const Doc& doc)>& fn) const
{
    size_t pos = start;
    while (pos < end) {
        auto child = DocAt(data, end, pos);
        if (!child) {
            return false;
        }
        child->doc.dataLen = dataLen;
        if (!fn(child->tag, child->doc)) {
            return true;
        }
        pos = child->next;
    }
    return true;
}

std::optional<Doc> Doc::Get(uint32_t tag) const
{
    std::optional<Doc> result;
    (void)ForEach([&result, tag](uint32_t childTag, const Doc& child) {
        if (childTag == tag) {
            result = child;
            return false;
        }
        return true;
    });
    return result;
}

std::vector<Doc> Doc::TaggedDocs(uint32_t tag) const
{
    std::vector<Doc> result;
    (void)ForEach([&result, tag](uint32_t childTag, const Doc& child) {
        if (childTag == tag) {
            result.push_back(child);
        }
        return true;
    });
    return result;
}

std::optional<uint8_t> Doc::AsU8() const
{
    if (Size() != sizeof(uint8_t)) {
        return std::nullopt;
    }
    return data[start];
}

std::optional<uint32_t> Doc::AsU32() const
{
    if (Size() != sizeof(uint32_t)) {
        return std::nullopt;
    }
    return llvm::support::endian::read32be(data + start);
}

std::optional<uint64_t> Doc::AsU64() const
{
    if (Size() != sizeof(uint64_t)) {
        return std::nullopt;
    }
    return llvm::support::endian::read64be(data + start);
}

std::string Doc::AsStr() const
{
    return std::string(reinterpret_cast<const char*>(data + start), Size());
}

std::vector<uint8_t> Doc::AsBytes() const
{
    return std::vector<uint8_t>(data + start, data + end);
}
