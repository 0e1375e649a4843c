// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the SourceManager, which owns the source files of a unit and lays them out in one
 * global position space. The metadata encoder exports its line tables so downstream units can translate spans.
 */

#ifndef METALITH_BASIC_SOURCEMANAGER_H
#define METALITH_BASIC_SOURCEMANAGER_H

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Metalith {
/// A character whose UTF-8 encoding is longer than one byte.
struct MultiByteChar {
    uint32_t pos;  ///< Global position of the first byte.
    uint8_t bytes; ///< Encoded length, 2 to 4.
};

struct Source {
    unsigned int fileID;
    std::string path;
    std::string buffer;
    uint32_t startPos; ///< Global position of the first byte of this file.
    bool isImported;   ///< Sources replayed from another unit's metadata.
    /// Global positions of each line start. Empty for an empty file.
    std::vector<uint32_t> lineOffsets;
    std::vector<MultiByteChar> multiByteChars;

    Source(unsigned int fileID, std::string path, std::string buffer, uint32_t startPos, bool isImported);

    uint32_t EndPos() const
    {
        return startPos + static_cast<uint32_t>(buffer.size());
    }
};

class SourceManager {
public:
    /**
     * Add a source file and return its file ID. Positions continue after the previous file, with one byte of
     * padding so that the end of one file never equals the start of the next.
     */
    unsigned int AddSource(const std::string& path, const std::string& buffer, bool isImported = false);

    const Source& GetSource(unsigned int fileID) const
    {
        return sources.at(fileID);
    }

    const std::vector<Source>& GetSources() const
    {
        return sources;
    }

    size_t GetNumberOfFiles() const
    {
        return sources.size();
    }

    int GetFileID(const std::string& path) const
    {
        auto found = filePathToFileIDMap.find(path);
        return found == filePathToFileIDMap.end() ? -1 : static_cast<int>(found->second);
    }

private:
    std::vector<Source> sources;
    std::unordered_map<std::string, unsigned int> filePathToFileIDMap;
    uint32_t nextStartPos{0};
};
} // namespace Metalith

#endif
