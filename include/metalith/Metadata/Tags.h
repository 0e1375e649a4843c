// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the record tags and the single-byte codes shared by the metadata encoder and its readers.
 */

#ifndef METALITH_METADATA_TAGS_H
#define METALITH_METADATA_TAGS_H

#include <cstdint>

namespace Metalith::Metadata {
namespace Tag {
enum : uint32_t {
#define METADATA_TAG(KIND, VALUE) KIND = VALUE,
#include "metalith/Metadata/Tags.def"
#undef METADATA_TAG
};
} // namespace Tag

/// Upper bound (exclusive) of the two-byte tag range.
constexpr uint32_t NUM_TAGS = 0x1000;
/// Tags from here up to 0xff are reserved for the two-byte prefix.
constexpr uint32_t SHORT_TAG_LIMIT = 0xf0;

const char* TagName(uint32_t tag);

/// Declaration families, written as one byte.
enum class Family : uint8_t {
    IMMUTABLE_STATIC = 'c',
    MUTABLE_STATIC = 'b',
    CONST = 'C',
    FN = 'f',
    STATIC_METHOD = 'F',
    METHOD = 'h',
    MOD = 'm',
    FOREIGN_MOD = 'n',
    TYPE = 'y',
    ENUM = 't',
    STRUCT = 'S',
    DEFAULT_IMPL = 'd',
    IMPL = 'i',
    TRAIT = 'I',
    TUPLE_VARIANT = 'v',
    STRUCT_VARIANT = 'V',
    PUBLIC_FIELD = 'g',
    INHERITED_FIELD = 'N',
    STRUCT_CTOR = 'o',
};

/// Member sorts inside trait and impl records.
namespace Sort {
constexpr char CONST = 'C';
constexpr char CONST_WITHOUT_DEFAULT = 'c';
constexpr char REQUIRED = 'r';
constexpr char PROVIDED = 'p';
constexpr char TYPE = 't';
/// ITEM_TRAIT_PARENT_SORT of an item declared in a trait.
constexpr char TRAIT_PARENT = 't';
} // namespace Sort

constexpr uint8_t VISIBILITY_PUBLIC = 'y';
constexpr uint8_t VISIBILITY_INHERITED = 'i';
} // namespace Metalith::Metadata

#endif
