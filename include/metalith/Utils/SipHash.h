// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares SipHash-2-4, the fixed-seed hash that places index keys into buckets.
 */

#ifndef METALITH_UTILS_SIPHASH_H
#define METALITH_UTILS_SIPHASH_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

namespace Metalith::Utils {
class SipHash {
public:
    explicit SipHash(uint64_t k0 = 0, uint64_t k1 = 0);

    /** Feed @p len bytes. May be called repeatedly; the result only depends on the concatenated input. */
    void Write(const uint8_t* data, size_t len);
    uint64_t Finish() const;

    /** Hash an integer through its little-endian bytes, with the zero key. */
    template <typename T> static std::enable_if_t<std::is_integral_v<T>, uint64_t> GetHashValue(T value)
    {
        uint8_t bytes[sizeof(T)];
        auto raw = static_cast<std::make_unsigned_t<T>>(value);
        for (size_t i = 0; i < sizeof(T); ++i) {
            bytes[i] = static_cast<uint8_t>(raw >> (i * 8u));
        }
        SipHash hasher;
        hasher.Write(bytes, sizeof(T));
        return hasher.Finish();
    }

    static uint64_t GetHashValue(const std::string& value)
    {
        SipHash hasher;
        hasher.Write(reinterpret_cast<const uint8_t*>(value.data()), value.size());
        return hasher.Finish();
    }

private:
    void Compress(uint64_t m);

    uint64_t v0;
    uint64_t v1;
    uint64_t v2;
    uint64_t v3;
    uint64_t tail{0}; ///< Pending bytes of an incomplete word, little-endian.
    size_t ntail{0};
    size_t length{0};
};
} // namespace Metalith::Utils

#endif
