// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the owning and non-owning pointer wrappers used by the declaration tree and the type
 * context. Dereferencing a null wrapper throws NullPointerException instead of crashing.
 */

#ifndef METALITH_UTILS_SAFEPOINTER_H
#define METALITH_UTILS_SAFEPOINTER_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace Metalith {
class NullPointerException : public std::exception {
public:
    const char* what() const noexcept override
    {
        return "null pointer dereferenced through a safe pointer";
    }
};

template <typename T> class Ptr;

/** Unique ownership of a heap node. */
template <typename T> class OwnedPtr {
public:
    OwnedPtr() = default;
    OwnedPtr(std::nullptr_t)
    {
    }
    explicit OwnedPtr(T* raw) : origin(raw)
    {
    }
    template <typename U, typename = std::enable_if_t<std::is_base_of_v<T, U>>>
    OwnedPtr(OwnedPtr<U>&& src) noexcept : origin(src.release())
    {
    }
    OwnedPtr(OwnedPtr<T>&& src) noexcept : origin(src.release())
    {
    }
    OwnedPtr(const OwnedPtr<T>&) = delete;
    OwnedPtr<T>& operator=(const OwnedPtr<T>&) = delete;

    OwnedPtr<T>& operator=(OwnedPtr<T>&& src) noexcept
    {
        if (this != &src) {
            reset(src.release());
        }
        return *this;
    }

    ~OwnedPtr()
    {
        delete origin;
    }

    Ptr<T> get() const
    {
        return Ptr<T>(origin);
    }

    void reset(T* raw = nullptr)
    {
        auto old = origin;
        origin = raw;
        delete old;
    }

    T* release()
    {
        auto old = origin;
        origin = nullptr;
        return old;
    }

    T* operator->() const
    {
        if (origin == nullptr) {
            throw NullPointerException();
        }
        return origin;
    }

    T& operator*() const
    {
        return *operator->();
    }

    explicit operator bool() const
    {
        return origin != nullptr;
    }

    bool operator==(std::nullptr_t) const
    {
        return origin == nullptr;
    }

    bool operator!=(std::nullptr_t) const
    {
        return origin != nullptr;
    }

private:
    T* origin = nullptr;
};

/** Non-owning reference into a tree or pool that outlives the holder. */
template <typename T> class Ptr {
public:
    Ptr() = default;
    Ptr(std::nullptr_t)
    {
    }
    Ptr(T* raw) : ptr(raw)
    {
    }
    template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>> Ptr(U* src) : ptr(src)
    {
    }
    template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
    Ptr(const Ptr<U>& src) : ptr(src.get())
    {
    }
    template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
    Ptr(const OwnedPtr<U>& src) : ptr(src.get().get())
    {
    }

    T* operator->() const
    {
        if (ptr == nullptr) {
            throw NullPointerException();
        }
        return ptr;
    }

    T& operator*() const
    {
        return *operator->();
    }

    T* get() const
    {
        return ptr;
    }

    template <typename U> Ptr<U> StaticCast() const
    {
        return Ptr<U>(static_cast<U*>(ptr));
    }

    explicit operator bool() const
    {
        return ptr != nullptr;
    }

    template <typename U> bool operator==(const Ptr<U>& other) const
    {
        return ptr == other.get();
    }

    template <typename U> bool operator!=(const Ptr<U>& other) const
    {
        return ptr != other.get();
    }

    bool operator==(std::nullptr_t) const
    {
        return ptr == nullptr;
    }

    bool operator!=(std::nullptr_t) const
    {
        return ptr != nullptr;
    }

    template <typename U> bool operator<(const Ptr<U>& other) const
    {
        return ptr < other.get();
    }

private:
    T* ptr = nullptr;
};

template <class T, class... Args> std::enable_if_t<!std::is_array<T>::value, OwnedPtr<T>> MakeOwned(Args&&... args)
{
    return OwnedPtr<T>(new T(std::forward<Args>(args)...));
}
} // namespace Metalith

template <typename T> struct std::hash<Metalith::Ptr<T>> {
    std::size_t operator()(const Metalith::Ptr<T>& p) const noexcept
    {
        return static_cast<std::size_t>(reinterpret_cast<uintptr_t>(p.get()));
    }
};

#endif
