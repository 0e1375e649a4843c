// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements SipHash-2-4.
 */

#include "metalith/Utils/SipHash.h"

using namespace Metalith::Utils;

namespace {
constexpr int C_ROUNDS = 2;
constexpr int D_ROUNDS = 4;

inline uint64_t Rotl(uint64_t x, unsigned b)
{
    return (x << b) | (x >> (64u - b));
}

inline void SipRound(uint64_t& v0, uint64_t& v1, uint64_t& v2, uint64_t& v3)
{
    v0 += v1;
    v1 = Rotl(v1, 13);
    v1 ^= v0;
    v0 = Rotl(v0, 32);
    v2 += v3;
    v3 = Rotl(v3, 16);
    v3 ^= v2;
    v0 += v3;
    v3 = Rotl(v3, 21);
    v3 ^= v0;
    v2 += v1;
    v1 = Rotl(v1, 17);
    v1 ^= v2;
    v2 = Rotl(v2, 32);
}
} // namespace

SipHash::SipHash(uint64_t k0, uint64_t k1)
    : v0(k0 ^ 0x736f6d6570736575ULL),
      v1(k1 ^ 0x646f72616e646f6dULL),
      v2(k0 ^ 0x6c7967656e657261ULL),
      v3(k1 ^ 0x7465646279746573ULL)
{
}

void SipHash::Compress(uint64_t m)
{
    v3 ^= m;
    for (int i = 0; i < C_ROUNDS; ++i) {
        SipRound(v0, v1, v2, v3);
    }
    v0 ^= m;
}

void SipHash::Write(const uint8_t* data, size_t len)
{
    length += len;
    for (size_t i = 0; i < len; ++i) {
        tail |= static_cast<uint64_t>(data[i]) << (8u * ntail);
        if (++ntail == sizeof(uint64_t)) {
            Compress(tail);
            tail = 0;
            ntail = 0;
        }
    }
}

uint64_t SipHash::Finish() const
{
    SipHash state = *this;
    uint64_t b = (static_cast<uint64_t>(length & 0xff) << 56u) | state.tail;
    state.Compress(b);
    state.v2 ^= 0xff;
    for (int i = 0; i < D_ROUNDS; ++i) {
        SipRound(state.v0, state.v1, state.v2, state.v3);
    }
    return state.v0 ^ state.v1 ^ state.v2 ^ state.v3;
}
