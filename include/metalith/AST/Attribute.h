// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares source attributes and the queries the encoder runs over them.
 */

#ifndef METALITH_AST_ATTRIBUTE_H
#define METALITH_AST_ATTRIBUTE_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace Metalith {
class DiagnosticEngine;
}

namespace Metalith::AST {
enum class MetaItemKind : uint8_t { WORD, LIST, NAME_VALUE };
enum class LitKind : uint8_t { STRING, INTEGER, BOOL };

/// `name`, `name(items...)` or `name = value`.
struct MetaItem {
    MetaItemKind kind{MetaItemKind::WORD};
    std::string name;
    LitKind valueKind{LitKind::STRING};
    std::string value;
    std::vector<MetaItem> items;

    static MetaItem Word(std::string name);
    static MetaItem NameValue(std::string name, std::string value, LitKind valueKind = LitKind::STRING);
    static MetaItem List(std::string name, std::vector<MetaItem> items);
};

struct Attribute {
    MetaItem value;
    bool isSugaredDoc{false};

    bool CheckName(const std::string& name) const
    {
        return value.name == name;
    }
};

inline Attribute MakeAttribute(MetaItem value, bool isSugaredDoc = false)
{
    return Attribute{std::move(value), isSugaredDoc};
}

enum class ReprKind : uint8_t { C, PACKED, SIMD, INT };

struct ReprAttr {
    ReprKind kind;
    std::string intName; ///< Set for ReprKind::INT, e.g. "u8".

    /// Wire form: "C", "packed", "simd" or the integer type name.
    std::string ToString() const;
};

/// True for `#[inline]` and `#[inline(always)]`, false for `#[inline(never)]`.
bool RequestsInline(const std::vector<Attribute>& attrs);

/**
 * Collect the representation hints of `#[repr(...)]` attributes in source order. Unknown hints are reported as
 * warnings and skipped.
 */
std::vector<ReprAttr> FindReprAttrs(DiagnosticEngine& diag, const std::vector<Attribute>& attrs);
} // namespace Metalith::AST

#endif
