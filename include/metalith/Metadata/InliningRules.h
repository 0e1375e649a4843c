// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the rules deciding which bodies are exported for cross-unit inlining and which members get a
 * linkage symbol.
 */

#ifndef METALITH_METADATA_INLININGRULES_H
#define METALITH_METADATA_INLININGRULES_H

namespace Metalith::Metadata {
/**
 * A body is exported when a downstream unit has to instantiate or evaluate it: generic code, default trait
 * bodies, bodies marked `#[inline]`, and const functions.
 */
inline bool NeedsInlinedBody(bool generic, bool traitDefault, bool inlineRequested, bool isConst)
{
    return generic || traitDefault || inlineRequested || isConst;
}

/// Generic members have no single instantiation to link against.
inline bool AttachesLinkageSymbol(bool generic)
{
    return !generic;
}
} // namespace Metalith::Metadata

#endif
