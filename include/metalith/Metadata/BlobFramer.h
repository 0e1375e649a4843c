// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the framing of a finished metadata body: an 8-byte version tag, a big-endian u32 body
 * length and the body itself. Containers may pad the blob; readers ignore anything past the body.
 */

#ifndef METALITH_METADATA_BLOBFRAMER_H
#define METALITH_METADATA_BLOBFRAMER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "metalith/Metadata/RecordWriter.h"

namespace Metalith::Metadata {
constexpr std::array<uint8_t, 8> METADATA_ENCODING_VERSION = {'m', 'l', 't', 'h', 0, 0, 0, 2};
constexpr size_t METADATA_HEADER_SIZE = METADATA_ENCODING_VERSION.size() + sizeof(uint32_t);

/// Frame the first Position() bytes of @p w. Bytes past the logical end are left out.
std::vector<uint8_t> FrameMetadata(const RecordWriter& w);

struct MetadataBody {
    const uint8_t* data;
    size_t len;
};

/// Find the body inside a blob. Fails on a version mismatch or when the blob is shorter than its length field says.
std::optional<MetadataBody> LocateMetadataBody(const uint8_t* blob, size_t len);
} // namespace Metalith::Metadata

#endif
