// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares DeclId, the identity of a declaration across compilation units.
 */

#ifndef METALITH_AST_DECLID_H
#define METALITH_AST_DECLID_H

#include <cstdint>
#include <functional>
#include <string>

namespace Metalith::AST {
/// Sequence number of a node inside its own unit.
using NodeId = uint32_t;

/// Unit number of the unit being compiled. Dependencies are numbered from 1.
constexpr uint32_t LOCAL_UNIT = 0;
/// Node id of the unit's root module.
constexpr NodeId UNIT_ROOT_NODE = 0;

struct DeclId {
    uint32_t unit{LOCAL_UNIT};
    NodeId node{0};

    bool IsLocal() const
    {
        return unit == LOCAL_UNIT;
    }

    /// Packed form used on the wire: unit in the high word, node in the low word.
    uint64_t Pack() const
    {
        return (static_cast<uint64_t>(unit) << 32u) | node;
    }

    static DeclId Unpack(uint64_t packed)
    {
        return {static_cast<uint32_t>(packed >> 32u), static_cast<NodeId>(packed & 0xffffffffu)};
    }

    /// Textual form used inside type strings: "unit:node".
    std::string ToString() const
    {
        return std::to_string(unit) + ":" + std::to_string(node);
    }

    bool operator==(const DeclId& other) const
    {
        return unit == other.unit && node == other.node;
    }

    bool operator!=(const DeclId& other) const
    {
        return !(*this == other);
    }

    bool operator<(const DeclId& other) const
    {
        return Pack() < other.Pack();
    }
};

inline DeclId LocalDeclId(NodeId node)
{
    return {LOCAL_UNIT, node};
}
} // namespace Metalith::AST

template <> struct std::hash<Metalith::AST::DeclId> {
    std::size_t operator()(const Metalith::AST::DeclId& id) const noexcept
    {
        return std::hash<uint64_t>()(id.Pack());
    }
};

#endif
