/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_NUMBER_HPP
#define SJSON_NUMBER_HPP

#pragma once
#include <sjson/config.hpp>
#include <sjson/detail/bigint.hpp>
#include <sjson/detail/pow5_table.hpp>
#include <sjson/detail/utf8.hpp>
#include <sjson/error.hpp>

#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

#if defined(_MSC_VER)
    #include <intrin.h>
#endif

namespace sjson {

    enum class NumberKind : std::uint8_t {
        Unsigned,
        Signed,
        Float
    };

    // Signed always holds a negative value, Float always a finite one.
    struct Number {
        NumberKind kind {NumberKind::Unsigned};

        union {
            std::uint64_t u {};
            std::int64_t i;
            double d;
        };

        [[nodiscard]] static constexpr Number from_u64(const std::uint64_t v) noexcept {
            Number n;
            n.kind = NumberKind::Unsigned;
            n.u = v;
            return n;
        }

        [[nodiscard]] static constexpr Number from_i64(const std::int64_t v) noexcept {
            if (v >= 0)
                return from_u64(static_cast<std::uint64_t>(v));
            Number n;
            n.kind = NumberKind::Signed;
            n.i = v;
            return n;
        }

        [[nodiscard]] static constexpr Number from_f64(const double v) noexcept {
            Number n;
            n.kind = NumberKind::Float;
            n.d = v;
            return n;
        }

        [[nodiscard]] constexpr bool is_u64() const noexcept {
            return kind == NumberKind::Unsigned;
        }

        [[nodiscard]] constexpr bool is_i64() const noexcept {
            return kind == NumberKind::Signed || (kind == NumberKind::Unsigned && u <= static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)()));
        }

        [[nodiscard]] constexpr bool is_f64() const noexcept {
            return kind == NumberKind::Float;
        }

        [[nodiscard]] constexpr std::optional<std::uint64_t> as_u64() const noexcept {
            if (kind == NumberKind::Unsigned)
                return u;
            return std::nullopt;
        }

        [[nodiscard]] constexpr std::optional<std::int64_t> as_i64() const noexcept {
            if (kind == NumberKind::Signed)
                return i;
            if (is_i64())
                return static_cast<std::int64_t>(u);
            return std::nullopt;
        }

        [[nodiscard]] constexpr std::optional<double> as_f64() const noexcept {
            switch (kind) {
            case NumberKind::Unsigned:
                return static_cast<double>(u);
            case NumberKind::Signed:
                return static_cast<double>(i);
            case NumberKind::Float:
                return d;
            }
            return std::nullopt;
        }

        [[nodiscard]] constexpr bool operator==(const Number& o) const noexcept {
            if (kind != o.kind)
                return false;
            switch (kind) {
            case NumberKind::Unsigned:
                return u == o.u;
            case NumberKind::Signed:
                return i == o.i;
            case NumberKind::Float:
                return d == o.d;
            }
            return false;
        }
    };

} // namespace sjson

namespace sjson::detail {

    inline constexpr double kPow10Double[23] = {1e0,  1e1,  1e2,  1e3,  1e4,  1e5,  1e6,  1e7,  1e8,  1e9,  1e10, 1e11,
                                                1e12, 1e13, 1e14, 1e15, 1e16, 1e17, 1e18, 1e19, 1e20, 1e21, 1e22};

    inline constexpr int kFloatLongestDigits = 17;
    inline constexpr std::uint64_t kF64SigMask = 0x000FFFFFFFFFFFFFull;
    inline constexpr std::int32_t kInfinitePower = 0x7FF;

    struct U128 {
        std::uint64_t lo;
        std::uint64_t hi;
    };

    [[nodiscard]] SJSON_FORCEINLINE U128 full_mul(const std::uint64_t a, const std::uint64_t b) noexcept {
#if defined(__SIZEOF_INT128__)
        const unsigned __int128 r = static_cast<unsigned __int128>(a) * b;
        return {static_cast<std::uint64_t>(r), static_cast<std::uint64_t>(r >> 64)};
#elif defined(_MSC_VER) && defined(_M_X64)
        std::uint64_t hi;
        const std::uint64_t lo = _umul128(a, b, &hi);
        return {lo, hi};
#else
        const std::uint64_t a_lo = a & 0xFFFFFFFFu;
        const std::uint64_t a_hi = a >> 32;
        const std::uint64_t b_lo = b & 0xFFFFFFFFu;
        const std::uint64_t b_hi = b >> 32;

        const std::uint64_t ll = a_lo * b_lo;
        const std::uint64_t lh = a_lo * b_hi;
        const std::uint64_t hl = a_hi * b_lo;
        const std::uint64_t hh = a_hi * b_hi;

        const std::uint64_t mid = (ll >> 32) + (lh & 0xFFFFFFFFu) + (hl & 0xFFFFFFFFu);
        return {(mid << 32) | (ll & 0xFFFFFFFFu), hh + (lh >> 32) + (hl >> 32) + (mid >> 32)};
#endif
    }

    // Mantissa without the hidden bit and biased exponent; e < 0 means undecided.
    struct BiasedFp {
        std::uint64_t f {};
        std::int32_t e {};

        [[nodiscard]] constexpr bool operator==(const BiasedFp&) const noexcept = default;
    };

    [[nodiscard]] SJSON_FORCEINLINE ErrorCode parse_exponent(const char*& p, const char* end, std::int32_t& out) noexcept {
        bool neg = false;
        if (p < end && (*p == '+' || *p == '-')) {
            neg = *p == '-';
            ++p;
        }

        if (p >= end || !is_digit(*p))
            return ErrorCode::InvalidNumber;

        std::int32_t e = 0;
        while (p < end && is_digit(*p) && e < 1000) {
            e = e * 10 + (*p - '0');
            ++p;
        }
        while (p < end && is_digit(*p))
            ++p;

        out = neg ? -e : e;
        return ErrorCode::None;
    }

    // Consumes the fraction digits starting at p (the first one is known to be a digit). At most
    // need digits enter sig, the rest only raise trunc.
    [[nodiscard]] SJSON_FORCEINLINE ErrorCode parse_fraction(const char*& p, const char* end, std::uint64_t& sig, std::int32_t& exp, bool& trunc, int need,
                                                              const char* dot) noexcept {
        while (need > 0 && p < end && is_digit(*p)) {
            sig = sig * 10 + static_cast<std::uint64_t>(*p - '0');
            ++p;
            --need;
        }

        exp -= static_cast<std::int32_t>(p - dot);
        while (p < end && is_digit(*p)) {
            trunc = true;
            ++p;
        }

        if (p < end && (*p == 'e' || *p == 'E')) {
            ++p;
            std::int32_t e = 0;
            if (const auto code = parse_exponent(p, end, e); code != ErrorCode::None)
                return code;
            exp += e;
        }
        return ErrorCode::None;
    }

    [[nodiscard]] SJSON_FORCEINLINE bool parse_float_fast(const std::int32_t exp10, const std::uint64_t sig, double& out) noexcept {
        double d = static_cast<double>(sig);
        if (exp10 > 0) {
            if (exp10 > 22) {
                d *= kPow10Double[exp10 - 22];
                if (d < -1e15 || d > 1e15)
                    return false;
                out = d * kPow10Double[22];
                return true;
            }
            out = d * kPow10Double[exp10];
            return true;
        }
        out = d / kPow10Double[-exp10];
        return true;
    }

    // 128-bit fixed point product against 5^exp10, accepted only outside the rounding
    // uncertainty window.
    [[nodiscard]] SJSON_FORCEINLINE bool parse_float_fixed(const std::int32_t exp10, const std::uint64_t man, std::uint64_t& raw) noexcept {
        const auto idx = static_cast<std::size_t>(exp10 - kSmallestPower5) * 2;
        const std::uint64_t sig2 = kPow5Table[idx];
        const std::uint64_t sig2_ext = kPow5Table[idx + 1];

        auto lz = static_cast<std::int32_t>(std::countl_zero(man));
        const std::uint64_t sig1 = man << lz;
        std::int32_t exp2 = ((217706 * exp10 - 4128768) >> 16) - lz;

        auto [lo, hi] = full_mul(sig1, sig2);

        bool exact = false;
        constexpr std::uint64_t kWindowMask = (1ull << (64 - 54 - 1)) - 1;
        if (const std::uint64_t bits = hi & kWindowMask; bits - 1 < kWindowMask - 1) {
            exact = true;
        } else {
            const std::uint64_t hi2 = full_mul(sig1, sig2_ext).hi;
            const std::uint64_t add = lo + hi2;
            if (add + 1 > 1u) {
                hi += (add < lo || add < hi2) ? 1u : 0u;
                exact = true;
            }
        }

        if (!exact)
            return false;

        lz = hi < (1ull << 63) ? 1 : 0;
        hi <<= lz;
        exp2 -= lz;
        exp2 += 64;

        if (hi & (1ull << (64 - 54)))
            hi += 1ull << (64 - 54);

        if (hi < (1ull << (64 - 54))) {
            hi = 1ull << 63;
            exp2 += 1;
        }

        hi >>= 64 - 53;
        exp2 += 64 - 53 + 52;
        exp2 += 1023;
        raw = (static_cast<std::uint64_t>(exp2) << 52) | (hi & kF64SigMask);
        return true;
    }

    [[nodiscard]] SJSON_FORCEINLINE U128 compute_product_approx(const std::int64_t q, const std::uint64_t w) noexcept {
        constexpr std::uint64_t kMask = ~0ull >> 55;
        const auto idx = static_cast<std::size_t>(q - kSmallestPower5) * 2;

        auto [first_lo, first_hi] = full_mul(w, kPow5Table[idx]);
        if ((first_hi & kMask) == kMask) {
            const std::uint64_t second_hi = full_mul(w, kPow5Table[idx + 1]).hi;
            first_lo += second_hi;
            if (second_hi > first_lo)
                ++first_hi;
        }
        return {first_lo, first_hi};
    }

    // Eisel-Lemire: w * 10^q rounded to nearest even, or e == -1 when the product is too close
    // to a halfway point to decide.
    [[nodiscard]] inline BiasedFp compute_float(const std::int64_t q, std::uint64_t w) noexcept {
        if (w == 0 || q < kSmallestPower5)
            return {0, 0};
        if (q > kLargestPower5)
            return {0, kInfinitePower};

        const auto lz = static_cast<std::int32_t>(std::countl_zero(w));
        w <<= lz;

        const auto [lo, hi] = compute_product_approx(q, w);
        if (lo == ~0ull && (q < -27 || q > 55))
            return {0, -1};

        const auto upperbit = static_cast<std::int32_t>(hi >> 63);
        std::uint64_t mantissa = hi >> (upperbit + 64 - 52 - 3);
        std::int32_t power2 = ((static_cast<std::int32_t>(q) * (152170 + 65536)) >> 16) + 63 + upperbit - lz + 1023;

        if (power2 <= 0) {
            if (-power2 + 1 >= 64)
                return {0, 0};
            mantissa >>= -power2 + 1;
            mantissa += mantissa & 1u;
            mantissa >>= 1;
            return {mantissa, mantissa >= (1ull << 52) ? 1 : 0};
        }

        if (lo <= 1 && q >= -4 && q <= 23 && (mantissa & 3u) == 1 && (mantissa << (upperbit + 64 - 52 - 3)) == hi)
            mantissa &= ~1ull;

        mantissa += mantissa & 1u;
        mantissa >>= 1;
        if (mantissa >= (2ull << 52)) {
            mantissa = 1ull << 52;
            ++power2;
        }

        mantissa &= ~(1ull << 52);
        if (power2 >= kInfinitePower)
            return {0, kInfinitePower};

        return {mantissa, power2};
    }

    [[nodiscard]] inline ErrorCode parse_float(const std::uint64_t sig, const std::int32_t exp, const bool neg, const bool trunc, const char* digits,
                                               const char* num_end, Number& out) noexcept {
        double d = 0;

        if (sig >> 52 == 0 && exp >= -22 && exp <= 22 + 15 && parse_float_fast(exp, sig, d)) {
            out = Number::from_f64(neg ? -d : d);
            return ErrorCode::None;
        }

        if (std::uint64_t raw = 0; !trunc && exp > -308 + 1 && exp < 308 - 20 && parse_float_fixed(exp, sig, raw)) {
            d = std::bit_cast<double>(raw);
            out = Number::from_f64(neg ? -d : d);
            return ErrorCode::None;
        }

        BiasedFp fp = compute_float(exp, sig);
        if (trunc && fp.e >= 0 && fp != compute_float(exp, sig + 1))
            fp.e = -1;

        std::uint64_t bits;
        if (fp.e < 0)
            bits = parse_decimal_exact(digits, num_end);
        else
            bits = fp.f | static_cast<std::uint64_t>(fp.e) << 52;

        d = std::bit_cast<double>(bits);
        if (neg)
            d = -d;

        if (std::isinf(d))
            return ErrorCode::FloatMustBeFinite;

        out = Number::from_f64(d);
        return ErrorCode::None;
    }

    // Parses the number starting at p ('-' or a digit). out_end is left after the last byte of
    // the number, or at the offending byte on error.
    [[nodiscard]] inline ErrorCode parse_number(const char* p, const char* end, const char*& out_end, Number& out) noexcept {
        bool neg = false;
        if (p < end && *p == '-') {
            neg = true;
            ++p;
        }

        const char* const digits = p;
        std::uint64_t sig = 0;
        std::int32_t exp = 0;
        bool trunc = false;

        auto finish = [&](const ErrorCode code) {
            out_end = p;
            return code;
        };

        if (p < end && *p == '0') {
            ++p;

            if (p < end && is_digit(*p))
                return finish(ErrorCode::InvalidNumber);

            if (p >= end || (*p != '.' && *p != 'e' && *p != 'E')) {
                out = neg ? Number::from_f64(0.0) : Number::from_u64(0);
                return finish(ErrorCode::None);
            }

            if (*p == '.') {
                ++p;
                const char* const dot = p;
                if (p >= end || !is_digit(*p))
                    return finish(ErrorCode::InvalidNumber);

                while (p < end && *p == '0')
                    ++p;

                // 0.000e123
                if (p < end && (*p == 'e' || *p == 'E')) {
                    ++p;
                    if (p < end && (*p == '-' || *p == '+'))
                        ++p;
                    if (p >= end || !is_digit(*p))
                        return finish(ErrorCode::InvalidNumber);
                    while (p < end && is_digit(*p))
                        ++p;
                    out = Number::from_f64(0.0);
                    return finish(ErrorCode::None);
                }

                if (p >= end || !is_digit(*p)) {
                    out = Number::from_f64(0.0);
                    return finish(ErrorCode::None);
                }

                sig = static_cast<std::uint64_t>(*p - '0');
                ++p;

                if (p < end && is_digit(*p)) {
                    if (const auto code = parse_fraction(p, end, sig, exp, trunc, kFloatLongestDigits - 1, dot); code != ErrorCode::None)
                        return finish(code);
                } else {
                    exp -= static_cast<std::int32_t>(p - dot);
                    if (p < end && (*p == 'e' || *p == 'E')) {
                        ++p;
                        std::int32_t e = 0;
                        if (const auto code = parse_exponent(p, end, e); code != ErrorCode::None)
                            return finish(code);
                        exp += e;
                    }
                }
            } else {
                ++p;
                if (p < end && (*p == '-' || *p == '+'))
                    ++p;
                if (p >= end || !is_digit(*p))
                    return finish(ErrorCode::InvalidNumber);
                while (p < end && is_digit(*p))
                    ++p;
                out = Number::from_f64(0.0);
                return finish(ErrorCode::None);
            }
        } else {
            const char* const digit_start = p;
            while (p < end && is_digit(*p)) {
                sig = sig * 10 + static_cast<std::uint64_t>(*p - '0');
                ++p;
            }

            auto cnt = static_cast<int>(p - digit_start);
            if (cnt == 0)
                return finish(ErrorCode::InvalidNumber);

            // Beyond 19 digits the accumulator wrapped: keep an exact 19 digit prefix.
            if (cnt > 19) {
                p = digit_start;
                sig = 0;
                cnt = 0;
                while (p < end && is_digit(*p) && cnt < 19) {
                    sig = sig * 10 + static_cast<std::uint64_t>(*p - '0');
                    ++cnt;
                    ++p;
                }
                while (p < end && is_digit(*p)) {
                    if (exp < 1000)
                        ++exp;
                    trunc = true;
                    ++p;
                }
            }

            if (p < end && (*p == 'e' || *p == 'E')) {
                ++p;
                std::int32_t e = 0;
                if (const auto code = parse_exponent(p, end, e); code != ErrorCode::None)
                    return finish(code);
                exp += e;
            } else if (p < end && *p == '.') {
                ++p;
                if (p >= end || !is_digit(*p))
                    return finish(ErrorCode::InvalidNumber);
                const char* const dot = p;
                if (const auto code = parse_fraction(p, end, sig, exp, trunc, kFloatLongestDigits - cnt, dot); code != ErrorCode::None)
                    return finish(code);
            } else {
                if (exp == 0) {
                    if (neg) {
                        if (sig > (1ull << 63))
                            out = Number::from_f64(-static_cast<double>(sig));
                        else
                            out = Number::from_i64(static_cast<std::int64_t>(0ull - sig));
                    } else {
                        out = Number::from_u64(sig);
                    }
                    return finish(ErrorCode::None);
                }

                if (exp == 1) {
                    // twenty digits may still fit in u64
                    const auto last = static_cast<std::uint64_t>(p[-1] - '0');
                    if (sig <= ((std::numeric_limits<std::uint64_t>::max)() - last) / 10) {
                        sig = sig * 10 + last;
                        out = neg ? Number::from_f64(-static_cast<double>(sig)) : Number::from_u64(sig);
                        return finish(ErrorCode::None);
                    }
                }
                trunc = true;
            }
        }

        const auto code = parse_float(sig, exp, neg, trunc, digits, p, out);
        if (code != ErrorCode::None)
            out_end = digits - (neg ? 1 : 0);
        else
            out_end = p;
        return code;
    }

    // Grammar-only walk over a number starting at p; nothing is converted.
    [[nodiscard]] inline ErrorCode skip_number(const char*& p, const char* end) noexcept {
        if (p < end && *p == '-')
            ++p;

        if (p >= end || !is_digit(*p))
            return ErrorCode::InvalidNumber;

        if (*p == '0') {
            ++p;
            if (p < end && is_digit(*p))
                return ErrorCode::InvalidNumber;
        } else {
            while (p < end && is_digit(*p))
                ++p;
        }

        if (p < end && *p == '.') {
            ++p;
            if (p >= end || !is_digit(*p))
                return ErrorCode::InvalidNumber;
            while (p < end && is_digit(*p))
                ++p;
        }

        if (p < end && (*p == 'e' || *p == 'E')) {
            ++p;
            if (p < end && (*p == '+' || *p == '-'))
                ++p;
            if (p >= end || !is_digit(*p))
                return ErrorCode::InvalidNumber;
            while (p < end && is_digit(*p))
                ++p;
        }

        return ErrorCode::None;
    }

} // namespace sjson::detail

namespace sjson {

    // Parses a complete number text, nothing may follow it.
    [[nodiscard]] inline ErrorCode parse_number(const std::string_view text, Number& out) noexcept {
        const char* end = text.data() + text.size();
        const char* stop = nullptr;
        if (const auto code = detail::parse_number(text.data(), end, stop, out); code != ErrorCode::None)
            return code;
        return stop == end ? ErrorCode::None : ErrorCode::InvalidNumber;
    }

} // namespace sjson

#endif // SJSON_NUMBER_HPP
