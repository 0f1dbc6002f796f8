/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_STRING_HPP
#define SJSON_STRING_HPP

#pragma once
#include <sjson/config.hpp>
#include <sjson/detail/scan.hpp>
#include <sjson/detail/utf8.hpp>
#include <sjson/error.hpp>
#include <sjson/sink.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace sjson {

    // Escape status of a raw string span. Possible is used when the span was taken without
    // looking inside the string.
    enum class HasEscape : std::uint8_t {
        None,
        Possible,
        Yes
    };

} // namespace sjson

namespace sjson::detail {

    // Decoded byte for the character after a backslash, 0 when the escape is invalid. \u is
    // handled separately.
    consteval std::array<char, 256> make_escape_table() {
        std::array<char, 256> t {};
        t['"'] = '"';
        t['\\'] = '\\';
        t['/'] = '/';
        t['b'] = '\b';
        t['f'] = '\f';
        t['n'] = '\n';
        t['r'] = '\r';
        t['t'] = '\t';
        return t;
    }

    inline constexpr std::array<char, 256> kEscapeTab = make_escape_table();

    struct QuoteEntry {
        std::uint8_t len {};
        char bytes[7] {};
    };

    consteval std::array<QuoteEntry, 256> make_quote_table() {
        std::array<QuoteEntry, 256> t {};
        for (unsigned c = 0; c < 0x20; ++c) {
            t[c].len = 6;
            t[c].bytes[0] = '\\';
            t[c].bytes[1] = 'u';
            t[c].bytes[2] = '0';
            t[c].bytes[3] = '0';
            t[c].bytes[4] = kHexDigits[(c >> 4) & 0xF];
            t[c].bytes[5] = kHexDigits[c & 0xF];
        }

        auto short_form = [&](const unsigned char c, const char name) {
            t[c] = {};
            t[c].len = 2;
            t[c].bytes[0] = '\\';
            t[c].bytes[1] = name;
        };
        short_form('\b', 'b');
        short_form('\t', 't');
        short_form('\n', 'n');
        short_form('\f', 'f');
        short_form('\r', 'r');
        short_form('"', '"');
        short_form('\\', '\\');
        return t;
    }

    inline constexpr std::array<QuoteEntry, 256> kQuoteTab = make_quote_table();

    // First quote, backslash or control byte in [p, e), or e.
    [[nodiscard]] SJSON_FORCEINLINE const char* find_string_special(const ScanKernel& k, const char* p, const char* e) noexcept {
        Block64 b;
        while (static_cast<std::size_t>(e - p) >= kWindow) {
            k.classify(p, b);
            if (const std::uint64_t m = b.string_special())
                return p + first_bit(m);
            p += kWindow;
        }

        while (p < e) {
            const auto c = static_cast<unsigned char>(*p);
            if (c == '"' || c == '\\' || c < 0x20u)
                return p;
            ++p;
        }
        return e;
    }

    // p points just past the backslash and is left past the escape. Writes up to 4 bytes.
    [[nodiscard]] inline ErrorCode decode_escape(const char*& p, const char* end, char* out, std::size_t& n) noexcept {
        if (p >= end)
            return ErrorCode::EofWhileParsing;

        if (*p != 'u') {
            const char v = kEscapeTab[static_cast<unsigned char>(*p)];
            if (!v)
                return ErrorCode::InvalidEscape;
            out[0] = v;
            n = 1;
            ++p;
            return ErrorCode::None;
        }

        ++p;
        if (end - p < 4) {
            p = end;
            return ErrorCode::EofWhileParsing;
        }

        std::uint16_t hi = 0;
        if (!hex4_to_u16(p, hi))
            return ErrorCode::InvalidUnicodeCodePoint;
        p += 4;

        std::uint32_t cp = hi;
        if (hi >= 0xD800u && hi <= 0xDBFFu) {
            if (end - p < 6 || p[0] != '\\' || p[1] != 'u')
                return ErrorCode::InvalidSurrogate;

            std::uint16_t lo = 0;
            if (!hex4_to_u16(p + 2, lo))
                return ErrorCode::InvalidUnicodeCodePoint;
            if (lo < 0xDC00u || lo > 0xDFFFu)
                return ErrorCode::InvalidSurrogate;

            p += 6;
            cp = 0x10000u + ((static_cast<std::uint32_t>(hi) - 0xD800u) << 10) + (static_cast<std::uint32_t>(lo) - 0xDC00u);
        } else if (hi >= 0xDC00u && hi <= 0xDFFFu) {
            return ErrorCode::InvalidSurrogate;
        }

        n = utf8_encode(out, cp);
        return n ? ErrorCode::None : ErrorCode::InvalidUnicodeCodePoint;
    }

    // Validating skip. p starts after the opening quote and ends after the closing one, or at
    // the offending byte.
    [[nodiscard]] inline ErrorCode skip_string(const ScanKernel& k, const char*& p, const char* end, bool& escaped, const bool strict_utf8) noexcept {
        const char* const start = p;
        for (;;) {
            const char* q = find_string_special(k, p, end);
            if (q == end) {
                p = end;
                return ErrorCode::EofWhileParsing;
            }

            const auto c = static_cast<unsigned char>(*q);
            if (c == '"') {
                if (strict_utf8) {
                    if (const char* bad = validate_utf8(start, q); bad != q) {
                        p = bad;
                        return ErrorCode::InvalidUtf8;
                    }
                }
                p = q + 1;
                return ErrorCode::None;
            }

            if (c == '\\') {
                escaped = true;
                p = q + 1;
                char tmp[4];
                std::size_t n = 0;
                if (const auto code = decode_escape(p, end, tmp, n); code != ErrorCode::None)
                    return code;
                continue;
            }

            p = q;
            return ErrorCode::ControlCharacterInString;
        }
    }

    // Quote-parity skip; only escape carry is tracked.
    [[nodiscard]] inline ErrorCode skip_string_unchecked(const ScanKernel& k, const char*& p, const char* end, bool& escaped) noexcept {
        std::uint64_t prev_escaped = 0;
        Block64 b;

        while (static_cast<std::size_t>(end - p) >= kWindow) {
            k.classify(p, b);
            std::uint64_t quote = b.quote;
            if (((quote - 1) & b.backslash) != 0 || prev_escaped) {
                escaped = true;
                quote &= ~escaped_mask64(b.backslash, prev_escaped);
            }
            if (quote) {
                p += first_bit(quote) + 1;
                return ErrorCode::None;
            }
            p += kWindow;
        }

        if (prev_escaped)
            ++p;

        while (p < end) {
            const char c = *p;
            if (c == '\\') {
                escaped = true;
                if (end - p < 2)
                    break;
                p += 2;
                continue;
            }
            ++p;
            if (c == '"')
                return ErrorCode::None;
        }

        p = end;
        return ErrorCode::EofWhileParsing;
    }

    // Borrowed view when the string has no escape, otherwise the unescaped bytes in scratch.
    // p starts after the opening quote.
    [[nodiscard]] inline ErrorCode parse_string_raw(const ScanKernel& k, const char*& p, const char* end, std::string& scratch, std::string_view& out, bool& copied,
                                                    const bool strict_utf8) {
        const char* const start = p;
        const char* q = find_string_special(k, p, end);
        copied = false;

        if (q == end) {
            p = end;
            return ErrorCode::EofWhileParsing;
        }

        if (*q == '"') {
            if (strict_utf8) {
                if (const char* bad = validate_utf8(start, q); bad != q) {
                    p = bad;
                    return ErrorCode::InvalidUtf8;
                }
            }
            out = std::string_view {start, static_cast<std::size_t>(q - start)};
            p = q + 1;
            return ErrorCode::None;
        }

        if (*q != '\\') {
            p = q;
            return ErrorCode::ControlCharacterInString;
        }

        scratch.assign(start, q);
        p = q;
        for (;;) {
            ++p;
            char tmp[4];
            std::size_t n = 0;
            if (const auto code = decode_escape(p, end, tmp, n); code != ErrorCode::None)
                return code;
            scratch.append(tmp, n);

            q = find_string_special(k, p, end);
            scratch.append(p, q);
            if (q == end) {
                p = end;
                return ErrorCode::EofWhileParsing;
            }
            if (*q == '"')
                break;
            if (*q != '\\') {
                p = q;
                return ErrorCode::ControlCharacterInString;
            }
            p = q;
        }

        if (strict_utf8) {
            if (const char* bad = validate_utf8(start, q); bad != q) {
                p = bad;
                return ErrorCode::InvalidUtf8;
            }
        }

        p = q + 1;
        out = scratch;
        copied = true;
        return ErrorCode::None;
    }

    // Unescapes the string body starting at p (after the opening quote) in place. The decoded
    // text occupies [original p, original p + len) and p is left after the closing quote.
    [[nodiscard]] inline ErrorCode unescape_inplace(const ScanKernel& k, char*& p, const char* end, std::size_t& len) noexcept {
        char* const start = p;
        char* dst = p;

        for (;;) {
            const char* q = find_string_special(k, p, end);
            const auto run = static_cast<std::size_t>(q - p);
            if (dst != p)
                std::memmove(dst, p, run);
            dst += run;
            p += run;

            if (p == end)
                return ErrorCode::EofWhileParsing;

            const auto c = static_cast<unsigned char>(*p);
            if (c == '"') {
                ++p;
                len = static_cast<std::size_t>(dst - start);
                return ErrorCode::None;
            }
            if (c != '\\')
                return ErrorCode::ControlCharacterInString;

            const char* src = p + 1;
            char tmp[4];
            std::size_t n = 0;
            const auto code = decode_escape(src, end, tmp, n);
            p += src - p;
            if (code != ErrorCode::None)
                return code;

            std::memcpy(dst, tmp, n);
            dst += n;
        }
    }

} // namespace sjson::detail

namespace sjson {

    // Writes text as a quoted JSON string literal.
    template <OutputSink S>
    [[nodiscard]] bool escape_string(S& sink, const std::string_view text) {
        const auto& k = detail::active_kernel();
        const char* p = text.data();
        const char* const e = p + text.size();

        if (!put_char(sink, '"'))
            return false;

        while (p < e) {
            const char* q = detail::find_string_special(k, p, e);
            if (q > p && !put_bytes(sink, p, static_cast<std::size_t>(q - p)))
                return false;
            if (q == e)
                break;

            const auto& entry = detail::kQuoteTab[static_cast<unsigned char>(*q)];
            if (!put_bytes(sink, entry.bytes, entry.len))
                return false;
            p = q + 1;
        }

        return put_char(sink, '"');
    }

    [[nodiscard]] inline std::string escape(const std::string_view text) {
        StringSink sink;
        if (!escape_string(sink, text))
            return {};
        return sink.finish();
    }

    // Decodes a complete quoted string literal.
    [[nodiscard]] inline ErrorCode unescape(const std::string_view literal, std::string& out) {
        if (literal.empty() || literal.front() != '"')
            return ErrorCode::InvalidJsonValue;

        const char* p = literal.data() + 1;
        const char* const end = literal.data() + literal.size();
        std::string_view view;
        bool copied = false;
        std::string scratch;

        if (const auto code = detail::parse_string_raw(detail::active_kernel(), p, end, scratch, view, copied, true); code != ErrorCode::None)
            return code;
        if (p != end)
            return ErrorCode::TrailingCharacters;

        if (copied)
            out = std::move(scratch);
        else
            out.assign(view);
        return ErrorCode::None;
    }

} // namespace sjson

#endif // SJSON_STRING_HPP
