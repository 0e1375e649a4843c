// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "metalith/Metadata/BlobFramer.h"

#include <algorithm>

#include "llvm/Support/Endian.h"

#include "metalith/Metadata/IndexBuilder.h"

using namespace Metalith;
using namespace Metalith::Metadata;

std::vector<uint8_t> Metadata::FrameMetadata(const RecordWriter& w)
{
    auto len = w.Position();
    if (len >= INDEX_OFFSET_LIMIT) {
        w.GetDiag().Fatal(DiagKind::METADATA_RECORD_TOO_LARGE, len);
    }
    std::vector<uint8_t> blob(METADATA_ENCODING_VERSION.begin(), METADATA_ENCODING_VERSION.end());
    blob.resize(METADATA_HEADER_SIZE + static_cast<size_t>(len));
    llvm::support::endian::write32be(blob.data() + METADATA_ENCODING_VERSION.size(), static_cast<uint32_t>(len));
    auto& buffer = w.GetBuffer();
    (void)std::copy(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(len),
        blob.begin() + static_cast<std::ptrdiff_t>(METADATA_HEADER_SIZE));
    return blob;
}

std::optional<MetadataBody> Metadata::LocateMetadataBody(const uint8_t* blob, size_t len)
{
    if (len < METADATA_HEADER_SIZE ||
        !std::equal(METADATA_ENCODING_VERSION.begin(), METADATA_ENCODING_VERSION.end(), blob)) {
        return std::nullopt;
    }
    size_t bodyLen = llvm::support::endian::read32be(blob + METADATA_ENCODING_VERSION.size());
    if (bodyLen > len - METADATA_HEADER_SIZE) {
        return std::nullopt;
    }
    return MetadataBody{blob + METADATA_HEADER_SIZE, bodyLen};
}
