// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the fixed table of language items.
 */

#ifndef METALITH_SEMA_LANGITEMS_H
#define METALITH_SEMA_LANGITEMS_H

#include <cstddef>
#include <cstdint>

namespace Metalith::Sema {
enum class LangItem : uint32_t {
#define LANG_ITEM(KIND, NAME) KIND,
#include "metalith/Sema/LangItems.def"
#undef LANG_ITEM
};

constexpr size_t LANG_ITEM_COUNT = 0
#define LANG_ITEM(KIND, NAME) +1
#include "metalith/Sema/LangItems.def"
#undef LANG_ITEM
    ;

/// Source-level name of a language item, e.g. "drop".
const char* LangItemName(LangItem item);
} // namespace Metalith::Sema

#endif
