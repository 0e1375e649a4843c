// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the SourceManager related classes.
 */

#include "metalith/Basic/SourceManager.h"

#include <algorithm>
#include <cstddef>
#include <utility>

#include "metalith/Utils/CheckUtils.h"

using namespace Metalith;

namespace {
size_t GetLineTerminatorLength(const char* ptr, const char* end)
{
    if (ptr >= end) {
        return 0;
    }
    if (*ptr == '\n') {
        return 1;
    }
    if (*ptr == '\r') {
        return (ptr + 1 < end && *(ptr + 1) == '\n') ? 2 : 1;
    }
    return 0;
}

uint8_t GetUtf8SequenceLength(unsigned char lead)
{
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 1;
}
} // namespace

Source::Source(unsigned int fileID, std::string path, std::string buffer, uint32_t startPos, bool isImported)
    : fileID(fileID), path(std::move(path)), buffer(std::move(buffer)), startPos(startPos), isImported(isImported)
{
    if (this->buffer.empty()) {
        return;
    }

    // build lineOffsets
    lineOffsets.emplace_back(startPos);
    auto pStart = this->buffer.data();
    auto pEnd = pStart + this->buffer.length();
    for (auto ptr = pStart; ptr < pEnd;) {
        if (auto len = GetLineTerminatorLength(ptr, pEnd); len != 0) {
            ptr += len;
            if (ptr < pEnd) {
                lineOffsets.emplace_back(startPos + static_cast<uint32_t>(ptr - pStart));
            }
            continue;
        }
        auto seqLen = GetUtf8SequenceLength(static_cast<unsigned char>(*ptr));
        if (seqLen > 1) {
            multiByteChars.push_back({startPos + static_cast<uint32_t>(ptr - pStart), seqLen});
        }
        ptr += std::min<std::ptrdiff_t>(seqLen, pEnd - ptr);
    }
}

unsigned int SourceManager::AddSource(const std::string& path, const std::string& buffer, bool isImported)
{
    auto fileID = static_cast<unsigned int>(sources.size());
    sources.emplace_back(fileID, path, buffer, nextStartPos, isImported);
    filePathToFileIDMap.emplace(path, fileID);
    nextStartPos = sources.back().EndPos() + 1;
    MLT_ASSERT(nextStartPos > sources.back().startPos);
    return fileID;
}
