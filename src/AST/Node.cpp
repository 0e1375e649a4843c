// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "metalith/AST/Node.h"

using namespace Metalith::AST;

std::string Metalith::AST::AbiName(Abi abi)
{
    switch (abi) {
        case Abi::RUST:
            return "Rust";
        case Abi::RUST_INTRINSIC:
            return "rust-intrinsic";
        case Abi::RUST_CALL:
            return "rust-call";
        case Abi::C:
            return "C";
        case Abi::SYSTEM:
            return "system";
        case Abi::STDCALL:
            return "stdcall";
    }
    return "Rust";
}
