/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_DETAIL_UTF8_HPP
#define SJSON_DETAIL_UTF8_HPP

#pragma once
#include <sjson/config.hpp>

#include <cstddef>
#include <cstdint>

namespace sjson::detail {

    struct CharMask256 {
        std::uint64_t w[4] {};

        static consteval CharMask256 make_ws() {
            CharMask256 m {};
            auto set = [&](const unsigned c) {
                m.w[c >> 6] |= 1ull << (c & 63);
            };
            set(' ');
            set('\n');
            set('\r');
            set('\t');
            return m;
        }

        static consteval CharMask256 make_digit() {
            CharMask256 m {};
            for (unsigned c = '0'; c <= '9'; ++c)
                m.w[c >> 6] |= 1ull << (c & 63);
            return m;
        }

        [[nodiscard]] static constexpr bool test(const CharMask256& m, const unsigned char c) noexcept {
            return m.w[c >> 6] >> (c & 63) & 1ull;
        }
    };

    inline constexpr CharMask256 kWsMask = CharMask256::make_ws();
    inline constexpr CharMask256 kDigitMask = CharMask256::make_digit();

    inline constexpr char kHexDigits[] = "0123456789ABCDEF";

    [[nodiscard]] SJSON_FORCEINLINE constexpr bool is_ws_u8(const unsigned char c) noexcept {
        return CharMask256::test(kWsMask, c);
    }

    [[nodiscard]] SJSON_FORCEINLINE constexpr bool is_digit(const char c) noexcept {
        return CharMask256::test(kDigitMask, static_cast<unsigned char>(c));
    }

    [[nodiscard]] SJSON_FORCEINLINE bool hex4_to_u16(const char* p, std::uint16_t& out) noexcept {
        out = 0;
        for (auto i = 0; i < 4; ++i) {
            const auto x = static_cast<std::uint8_t>(p[i]);

            const auto d = static_cast<std::uint8_t>(x - '0');
            const auto l = static_cast<std::uint8_t>((x | 0x20u) - 'a');

            const std::uint16_t v = d <= 9 ? d : l <= 5 ? static_cast<std::uint16_t>(l + 10) : 0xFFFFu;

            if (v == 0xFFFFu)
                return false;

            out = static_cast<std::uint16_t>(out << 4 | v);
        }
        return true;
    }

    // Returns the number of bytes written, 0 for a surrogate or out of range code point.
    [[nodiscard]] SJSON_FORCEINLINE std::size_t utf8_encode(char* out, const std::uint32_t cp) noexcept {
        if (cp > 0x10FFFFu)
            return 0;
        if (cp >= 0xD800u && cp <= 0xDFFFu)
            return 0;

        if (cp <= 0x7F) {
            out[0] = static_cast<char>(cp);
            return 1;
        }
        if (cp <= 0x7FF) {
            out[0] = static_cast<char>(0xC0 | cp >> 6);
            out[1] = static_cast<char>(0x80 | (cp & 0x3F));
            return 2;
        }
        if (cp <= 0xFFFF) {
            out[0] = static_cast<char>(0xE0 | cp >> 12);
            out[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out[2] = static_cast<char>(0x80 | (cp & 0x3F));
            return 3;
        }
        out[0] = static_cast<char>(0xF0 | cp >> 18);
        out[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }

    [[nodiscard]] SJSON_FORCEINLINE bool is_cont(const unsigned char c) noexcept {
        return (c & 0xC0u) == 0x80u;
    }

#if defined(SJSON_HAS_SSE2)

    [[nodiscard]] SJSON_FORCEINLINE const char* skip_ascii_sse2(const char* p, const char* e) noexcept {
        const __m128i zero = _mm_setzero_si128();

        while (p + 16 <= e) {
            const __m128i x = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p));
            const __m128i high = _mm_cmpgt_epi8(zero, x);

            if (const auto mask = static_cast<unsigned>(_mm_movemask_epi8(high))) {
    #if defined(_MSC_VER)
                unsigned long idx;
                _BitScanForward(&idx, mask);
                return p + idx;
    #else
                return p + __builtin_ctz(mask);
    #endif
            }

            p += 16;
        }

        return p;
    }

#endif

    [[nodiscard]] SJSON_FORCEINLINE const char* skip_ascii(const char* p, const char* e) noexcept {
#if defined(SJSON_HAS_SSE2)
        p = skip_ascii_sse2(p, e);
#endif

        while (p < e) {
            if (static_cast<unsigned char>(*p) & 0x80u)
                break;
            ++p;
        }

        return p;
    }

    // Returns the first byte of the first malformed sequence in [p, e), or e when the range is valid UTF-8.
    [[nodiscard]] inline const char* validate_utf8(const char* p, const char* e) noexcept {
        while (p < e) {
            p = skip_ascii(p, e);
            if (p >= e)
                return e;

            const char* const lead = p;
            const auto c = static_cast<unsigned char>(*p++);

            // 2-byte
            if ((c >> 5) == 0x6) {
                if (p >= e)
                    return lead;

                const auto c1 = static_cast<unsigned char>(*p++);
                if (!is_cont(c1))
                    return lead;

                if (((c & 0x1Fu) << 6 | (c1 & 0x3Fu)) < 0x80u)
                    return lead;

                continue;
            }

            // 3-byte
            if ((c >> 4) == 0xE) {
                if (e - p < 2)
                    return lead;

                const auto c1 = static_cast<unsigned char>(*p++);
                const auto c2 = static_cast<unsigned char>(*p++);

                if (!is_cont(c1) || !is_cont(c2))
                    return lead;

                const std::uint32_t cp = (c & 0x0Fu) << 12 | (c1 & 0x3Fu) << 6 | (c2 & 0x3Fu);

                if (cp < 0x800u)
                    return lead;

                if (cp >= 0xD800u && cp <= 0xDFFFu)
                    return lead;

                continue;
            }

            // 4-byte
            if ((c >> 3) == 0x1E) {
                if (e - p < 3)
                    return lead;

                const auto c1 = static_cast<unsigned char>(*p++);
                const auto c2 = static_cast<unsigned char>(*p++);
                const auto c3 = static_cast<unsigned char>(*p++);

                if (!is_cont(c1) || !is_cont(c2) || !is_cont(c3))
                    return lead;

                const std::uint32_t cp = (c & 0x07u) << 18 | (c1 & 0x3Fu) << 12 | (c2 & 0x3Fu) << 6 | (c3 & 0x3Fu);

                if (cp < 0x10000u || cp > 0x10FFFFu)
                    return lead;

                continue;
            }

            return lead;
        }

        return e;
    }

} // namespace sjson::detail

#endif // SJSON_DETAIL_UTF8_HPP
