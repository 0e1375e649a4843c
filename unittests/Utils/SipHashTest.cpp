// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "metalith/Utils/SipHash.h"

#include "gtest/gtest.h"

#include <vector>

using namespace Metalith::Utils;

namespace {
// Key 00 01 02 ... 0f of the SipHash reference vectors.
const uint64_t REF_K0 = 0x0706050403020100ULL;
const uint64_t REF_K1 = 0x0f0e0d0c0b0a0908ULL;

uint64_t HashOfPrefix(size_t len)
{
    std::vector<uint8_t> message(len);
    for (size_t i = 0; i < len; ++i) {
        message[i] = static_cast<uint8_t>(i);
    }
    SipHash hasher(REF_K0, REF_K1);
    hasher.Write(message.data(), message.size());
    return hasher.Finish();
}
} // namespace

TEST(SipHashTest, ReferenceVectors)
{
    EXPECT_EQ(HashOfPrefix(0), 0x726fdb47dd0e0e31ULL);
    EXPECT_EQ(HashOfPrefix(8), 0x93f5f5799a932462ULL);
    EXPECT_EQ(HashOfPrefix(15), 0xa129ca6149be45e5ULL);
}

TEST(SipHashTest, SplitWritesMatchOneShot)
{
    std::vector<uint8_t> message(23);
    for (size_t i = 0; i < message.size(); ++i) {
        message[i] = static_cast<uint8_t>(i * 7 + 3);
    }
    SipHash oneShot(REF_K0, REF_K1);
    oneShot.Write(message.data(), message.size());

    SipHash split(REF_K0, REF_K1);
    split.Write(message.data(), 3);
    split.Write(message.data() + 3, 0);
    split.Write(message.data() + 3, 10);
    split.Write(message.data() + 13, 10);
    EXPECT_EQ(split.Finish(), oneShot.Finish());
}

TEST(SipHashTest, IntegerKeysHashTheirLittleEndianBytes)
{
    int64_t key = 0x0102030405060708LL;
    uint8_t bytes[] = {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
    SipHash hasher;
    hasher.Write(bytes, sizeof(bytes));
    EXPECT_EQ(SipHash::GetHashValue(key), hasher.Finish());
    EXPECT_NE(SipHash::GetHashValue(int64_t{1}), SipHash::GetHashValue(int64_t{2}));
}
