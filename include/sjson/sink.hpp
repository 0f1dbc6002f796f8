/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_SINK_HPP
#define SJSON_SINK_HPP

#pragma once
#include <sjson/config.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

namespace sjson {

    // Output is produced as reserve(n) -> write up to n bytes -> commit(written). reserve returns
    // nullptr when the sink cannot take n more bytes.
    template <class S>
    concept OutputSink = requires(S& s, std::size_t n) {
        { s.reserve(n) } -> std::same_as<char*>;
        { s.commit(n) } -> std::same_as<void>;
    };

    struct FixedBufferSink {
        char* buf {};
        std::size_t cap {};
        std::size_t pos {};

        [[nodiscard]] SJSON_FORCEINLINE char* reserve(const std::size_t n) noexcept {
            if (n > cap - pos)
                return nullptr;
            return buf + pos;
        }

        SJSON_FORCEINLINE void commit(const std::size_t n) noexcept {
            pos += n;
        }

        [[nodiscard]] SJSON_FORCEINLINE std::string_view finish() const noexcept {
            return {buf, pos};
        }
    };

    struct StringSink {
        std::string out;
        std::size_t len {};

        [[nodiscard]] SJSON_FORCEINLINE char* reserve(const std::size_t n) {
            if (out.size() - len < n)
                out.resize(std::max(len + n, out.size() * 2));
            return out.data() + len;
        }

        SJSON_FORCEINLINE void commit(const std::size_t n) noexcept {
            len += n;
        }

        [[nodiscard]] SJSON_FORCEINLINE std::string finish() {
            out.resize(len);
            len = 0;
            return std::move(out);
        }
    };

    template <OutputSink S>
    [[nodiscard]] SJSON_FORCEINLINE bool put_bytes(S& sink, const char* p, const std::size_t n) {
        char* dst = sink.reserve(n);
        if (!dst)
            return false;
        std::memcpy(dst, p, n);
        sink.commit(n);
        return true;
    }

    template <OutputSink S>
    [[nodiscard]] SJSON_FORCEINLINE bool put_str(S& sink, const std::string_view s) {
        return put_bytes(sink, s.data(), s.size());
    }

    template <OutputSink S>
    [[nodiscard]] SJSON_FORCEINLINE bool put_char(S& sink, const char c) {
        char* dst = sink.reserve(1);
        if (!dst)
            return false;
        *dst = c;
        sink.commit(1);
        return true;
    }

} // namespace sjson

#endif // SJSON_SINK_HPP
