// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the declaration tree handed to the metadata encoder. It only keeps what the encoder reads:
 * identities, names, visibility, attributes and the shape of each declaration kind. Computed types live in the
 * ResolvedDeclStore.
 */

#ifndef METALITH_AST_NODE_H
#define METALITH_AST_NODE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "metalith/AST/Attribute.h"
#include "metalith/AST/DeclId.h"
#include "metalith/Utils/SafePointer.h"

namespace Metalith::AST {
enum class Visibility : uint8_t { PUBLIC, INHERITED };
enum class Mutability : uint8_t { IMMUTABLE, MUTABLE };
enum class Constness : uint8_t { NOT_CONST, CONST };
enum class Unsafety : uint8_t { NORMAL, UNSAFE };
enum class ImplPolarity : uint8_t { POSITIVE, NEGATIVE };
enum class Abi : uint8_t { RUST, RUST_INTRINSIC, RUST_CALL, C, SYSTEM, STDCALL };

std::string AbiName(Abi abi);

struct Param {
    std::string name; ///< Empty when the parameter pattern is not a plain identifier.
};

struct FnSignature {
    std::vector<Param> params;
    Constness constness{Constness::NOT_CONST};
    Unsafety unsafety{Unsafety::NORMAL};
    Abi abi{Abi::RUST};
};

enum class ItemKind : uint8_t {
    EXTERN_UNIT,
    USE,
    STATIC,
    CONST,
    FN,
    MOD,
    FOREIGN_MOD,
    TYPE_ALIAS,
    ENUM,
    STRUCT,
    DEFAULT_IMPL,
    IMPL,
    TRAIT,
};

struct Item {
    const ItemKind kind;
    NodeId id{0};
    std::string name;
    Visibility vis{Visibility::INHERITED};
    std::vector<Attribute> attrs;

    virtual ~Item() = default;

protected:
    explicit Item(ItemKind kind) : kind(kind)
    {
    }
};

/// `extern unit` and `use` items. Their effect reaches metadata through the export map only.
struct ImportDecl : Item {
    explicit ImportDecl(ItemKind kind) : Item(kind)
    {
    }
};

struct StaticDecl : Item {
    StaticDecl() : Item(ItemKind::STATIC)
    {
    }
    Mutability mutability{Mutability::IMMUTABLE};
};

struct ConstDecl : Item {
    ConstDecl() : Item(ItemKind::CONST)
    {
    }
};

struct FnDecl : Item {
    FnDecl() : Item(ItemKind::FN)
    {
    }
    FnSignature sig;
    std::vector<std::string> typeParams;
};

struct ModDecl : Item {
    ModDecl() : Item(ItemKind::MOD)
    {
    }
    std::vector<OwnedPtr<Item>> items;
};

enum class ForeignItemKind : uint8_t { FN, STATIC };

struct ForeignItem {
    ForeignItemKind kind{ForeignItemKind::FN};
    NodeId id{0};
    std::string name;
    Visibility vis{Visibility::INHERITED};
    std::vector<Attribute> attrs;
    FnSignature sig;
    Mutability mutability{Mutability::IMMUTABLE};
};

struct ForeignModDecl : Item {
    ForeignModDecl() : Item(ItemKind::FOREIGN_MOD)
    {
    }
    Abi abi{Abi::C};
    std::vector<ForeignItem> items;
};

struct TypeAliasDecl : Item {
    TypeAliasDecl() : Item(ItemKind::TYPE_ALIAS)
    {
    }
};

struct FieldDecl {
    NodeId id{0};
    std::string name; ///< Empty for positional fields.
    Visibility vis{Visibility::INHERITED};
    std::vector<Attribute> attrs;
};

enum class VariantKind : uint8_t { TUPLE, STRUCT };

struct VariantDecl {
    NodeId id{0};
    std::string name;
    Visibility vis{Visibility::PUBLIC};
    std::vector<Attribute> attrs;
    VariantKind kind{VariantKind::TUPLE};
    std::vector<FieldDecl> fields;
};

struct EnumDecl : Item {
    EnumDecl() : Item(ItemKind::ENUM)
    {
    }
    std::vector<VariantDecl> variants;
};

struct StructDecl : Item {
    StructDecl() : Item(ItemKind::STRUCT)
    {
    }
    std::vector<FieldDecl> fields;
    std::optional<NodeId> ctorId; ///< Set for tuple-like and unit-like structs.
};

struct DefaultImplDecl : Item {
    DefaultImplDecl() : Item(ItemKind::DEFAULT_IMPL)
    {
    }
    Unsafety unsafety{Unsafety::NORMAL};
};

enum class MemberKind : uint8_t { CONST, METHOD, TYPE };

struct ImplMember {
    MemberKind kind{MemberKind::METHOD};
    NodeId id{0};
    std::string name;
    Visibility vis{Visibility::INHERITED};
    std::vector<Attribute> attrs;
    FnSignature sig;
};

struct ImplDecl : Item {
    ImplDecl() : Item(ItemKind::IMPL)
    {
    }
    Unsafety unsafety{Unsafety::NORMAL};
    ImplPolarity polarity{ImplPolarity::POSITIVE};
    /// Name of the self type when it is written as a single-segment path, empty otherwise.
    std::string selfTypeBasename;
    /// Members written in the impl body, in source order.
    std::vector<ImplMember> members;
};

struct TraitMember {
    MemberKind kind{MemberKind::METHOD};
    NodeId id{0};
    std::string name;
    std::vector<Attribute> attrs;
    FnSignature sig;
    bool hasDefault{false}; ///< Default body for methods, default value for consts.
};

struct TraitDecl : Item {
    TraitDecl() : Item(ItemKind::TRAIT)
    {
    }
    Unsafety unsafety{Unsafety::NORMAL};
    std::vector<TraitMember> members;
};

struct MacroDef {
    std::string name;
    std::vector<Attribute> attrs;
    std::string body; ///< Token text of the definition body.
};

/// Root of the declaration tree of one compilation unit.
struct Unit {
    std::string name;
    std::vector<Attribute> attrs;
    std::vector<OwnedPtr<Item>> items;
    std::vector<MacroDef> exportedMacros;
};
} // namespace Metalith::AST

#endif
