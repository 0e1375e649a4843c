// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares some condition check helper macros.
 */

#ifndef METALITH_UTILS_CHECKUTILS_H
#define METALITH_UTILS_CHECKUTILS_H

#include <cassert>
#include <cstdio>
#include <cstdlib>

#ifdef NDEBUG
#define MLT_ASSERT(f) static_cast<void>(f)
#define MLT_ASSERT_WITH_MSG(f, msg) (static_cast<void>(f), static_cast<void>(msg))
#else
#define MLT_ASSERT(f) assert(f)
#define MLT_ASSERT_WITH_MSG(f, msg)                                                                                    \
    {                                                                                                                  \
        if (!(f)) {                                                                                                    \
            fprintf(stderr, "MLT_ASSERT failed at %s:%d: %s\n", __FILE__, __LINE__, msg);                             \
            assert(f);                                                                                                 \
        }                                                                                                              \
    }
#endif

#define MLT_NULLPTR_CHECK(p) MLT_ASSERT((p) != nullptr)

#endif
