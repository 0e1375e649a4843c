// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "metalith/Metadata/Tags.h"

const char* Metalith::Metadata::TagName(uint32_t tag)
{
    switch (tag) {
#define METADATA_TAG(KIND, VALUE)                                                                                      \
    case Tag::KIND:                                                                                                    \
        return #KIND;
#include "metalith/Metadata/Tags.def"
#undef METADATA_TAG
        default:
            return "<unknown>";
    }
}
