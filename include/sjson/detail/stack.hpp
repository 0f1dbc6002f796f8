/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_DETAIL_STACK_HPP
#define SJSON_DETAIL_STACK_HPP

#pragma once
#include <sjson/config.hpp>

#include <cstddef>
#include <cstring>
#include <memory>
#include <new>
#include <type_traits>

namespace sjson::detail {

    // Work stack whose first N entries need no allocation. Growth uses nothrow new, so push
    // reports out of memory as false.
    template <class T, std::size_t N>
        requires std::is_trivially_copyable_v<T> && std::is_default_constructible_v<T>
    class InlineStack {
    public:
        InlineStack() = default;
        InlineStack(const InlineStack&) = delete;
        InlineStack& operator=(const InlineStack&) = delete;

        [[nodiscard]] SJSON_FORCEINLINE bool push(const T& v) noexcept {
            if (size_ == cap_ && !grow(size_ + 1))
                return false;
            data_[size_++] = v;
            return true;
        }

        SJSON_FORCEINLINE void pop() noexcept {
            --size_;
        }

        [[nodiscard]] SJSON_FORCEINLINE T& top() noexcept {
            return data_[size_ - 1];
        }

        [[nodiscard]] SJSON_FORCEINLINE T& operator[](const std::size_t i) noexcept {
            return data_[i];
        }

        [[nodiscard]] SJSON_FORCEINLINE bool empty() const noexcept {
            return size_ == 0;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return size_;
        }

        [[nodiscard]] T* data() noexcept {
            return data_;
        }

        [[nodiscard]] const T* data() const noexcept {
            return data_;
        }

        // Drops entries above n.
        void truncate(const std::size_t n) noexcept {
            if (n < size_)
                size_ = n;
        }

        void clear() noexcept {
            size_ = 0;
        }

    private:
        bool grow(const std::size_t need) noexcept {
            std::size_t cap = cap_ * 2;
            while (cap < need)
                cap *= 2;
            std::unique_ptr<T[]> next(new (std::nothrow) T[cap]);
            if (!next)
                return false;
            std::memcpy(static_cast<void*>(next.get()), data_, size_ * sizeof(T));
            heap_ = std::move(next);
            data_ = heap_.get();
            cap_ = cap;
            return true;
        }

        T inline_[N] {};
        std::unique_ptr<T[]> heap_ {};
        T* data_ {inline_};
        std::size_t size_ {};
        std::size_t cap_ {N};
    };

} // namespace sjson::detail

#endif // SJSON_DETAIL_STACK_HPP
