// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements attribute queries.
 */

#include "metalith/AST/Attribute.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "metalith/Basic/DiagnosticEngine.h"

using namespace Metalith;
using namespace Metalith::AST;

namespace {
const std::unordered_set<std::string> INT_REPR_NAMES = {
    "i8", "u8", "i16", "u16", "i32", "u32", "i64", "u64", "isize", "usize"};
} // namespace

MetaItem MetaItem::Word(std::string name)
{
    MetaItem item;
    item.kind = MetaItemKind::WORD;
    item.name = std::move(name);
    return item;
}

MetaItem MetaItem::NameValue(std::string name, std::string value, LitKind valueKind)
{
    MetaItem item;
    item.kind = MetaItemKind::NAME_VALUE;
    item.name = std::move(name);
    item.value = std::move(value);
    item.valueKind = valueKind;
    return item;
}

MetaItem MetaItem::List(std::string name, std::vector<MetaItem> items)
{
    MetaItem item;
    item.kind = MetaItemKind::LIST;
    item.name = std::move(name);
    item.items = std::move(items);
    return item;
}

std::string ReprAttr::ToString() const
{
    switch (kind) {
        case ReprKind::C:
            return "C";
        case ReprKind::PACKED:
            return "packed";
        case ReprKind::SIMD:
            return "simd";
        case ReprKind::INT:
            return intName;
    }
    return "";
}

bool AST::RequestsInline(const std::vector<Attribute>& attrs)
{
    return std::any_of(attrs.begin(), attrs.end(), [](auto& attr) {
        if (!attr.CheckName("inline")) {
            return false;
        }
        auto& value = attr.value;
        if (value.kind == MetaItemKind::WORD) {
            return true;
        }
        // Only `inline(always)` asks for a body; `inline(never)` and malformed lists do not.
        return value.kind == MetaItemKind::LIST && value.items.size() == 1 &&
            value.items[0].kind == MetaItemKind::WORD && value.items[0].name == "always";
    });
}

std::vector<ReprAttr> AST::FindReprAttrs(DiagnosticEngine& diag, const std::vector<Attribute>& attrs)
{
    std::vector<ReprAttr> result;
    for (auto& attr : attrs) {
        if (!attr.CheckName("repr") || attr.value.kind != MetaItemKind::LIST) {
            continue;
        }
        for (auto& hint : attr.value.items) {
            if (hint.kind != MetaItemKind::WORD) {
                diag.Warn(DiagKind::METADATA_UNKNOWN_REPR, hint.name);
                continue;
            }
            if (hint.name == "C") {
                result.push_back({ReprKind::C, ""});
            } else if (hint.name == "packed") {
                result.push_back({ReprKind::PACKED, ""});
            } else if (hint.name == "simd") {
                result.push_back({ReprKind::SIMD, ""});
            } else if (INT_REPR_NAMES.count(hint.name) != 0) {
                result.push_back({ReprKind::INT, hint.name});
            } else {
                diag.Warn(DiagKind::METADATA_UNKNOWN_REPR, hint.name);
            }
        }
    }
    return result;
}
