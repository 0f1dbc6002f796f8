/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_DETAIL_BIGINT_HPP
#define SJSON_DETAIL_BIGINT_HPP

#pragma once
#include <sjson/config.hpp>
#include <sjson/detail/utf8.hpp>

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace sjson::detail {

    // Fixed capacity unsigned integer, 32-bit limbs, least significant first. Sized for
    // 800 decimal digits scaled by 2^1076 or 10^1130, which bounds every operand of the
    // exact decimal conversion below.
    class BigUint {
    public:
        static constexpr std::size_t kMaxLimbs = 160;

        BigUint() = default;

        explicit BigUint(const std::uint64_t v) noexcept {
            limbs_[0] = static_cast<std::uint32_t>(v);
            limbs_[1] = static_cast<std::uint32_t>(v >> 32);
            len_ = 2;
            trim();
        }

        [[nodiscard]] bool is_zero() const noexcept {
            return len_ == 0;
        }

        [[nodiscard]] int bit_length() const noexcept {
            if (len_ == 0)
                return 0;
            return static_cast<int>(len_ * 32) - std::countl_zero(limbs_[len_ - 1]);
        }

        void mul_small(const std::uint32_t m) noexcept {
            std::uint64_t carry = 0;
            for (std::size_t i = 0; i < len_; ++i) {
                const std::uint64_t v = static_cast<std::uint64_t>(limbs_[i]) * m + carry;
                limbs_[i] = static_cast<std::uint32_t>(v);
                carry = v >> 32;
            }
            if (carry && len_ < kMaxLimbs)
                limbs_[len_++] = static_cast<std::uint32_t>(carry);
        }

        void add_small(const std::uint32_t a) noexcept {
            std::uint64_t carry = a;
            for (std::size_t i = 0; i < len_ && carry; ++i) {
                const std::uint64_t v = static_cast<std::uint64_t>(limbs_[i]) + carry;
                limbs_[i] = static_cast<std::uint32_t>(v);
                carry = v >> 32;
            }
            if (carry && len_ < kMaxLimbs)
                limbs_[len_++] = static_cast<std::uint32_t>(carry);
        }

        void mul_pow10(unsigned e) noexcept {
            constexpr std::uint32_t kPow10[10] = {1, 10, 100, 1000, 10000, 100000, 1000000, 10000000, 100000000, 1000000000};
            while (e >= 9) {
                mul_small(kPow10[9]);
                e -= 9;
            }
            if (e)
                mul_small(kPow10[e]);
        }

        void shl(const unsigned n) noexcept {
            if (len_ == 0 || n == 0)
                return;

            const std::size_t words = n / 32;
            const unsigned bits = n % 32;
            const std::size_t new_len = std::min(kMaxLimbs, len_ + words + 1);

            const auto len = static_cast<std::ptrdiff_t>(len_);
            for (std::size_t i = new_len; i-- > 0;) {
                const auto src = static_cast<std::ptrdiff_t>(i) - static_cast<std::ptrdiff_t>(words);
                const std::uint32_t hi = src >= 0 && src < len ? limbs_[src] : 0u;
                const std::uint32_t lo = src >= 1 && src - 1 < len ? limbs_[src - 1] : 0u;
                limbs_[i] = bits ? (hi << bits | lo >> (32 - bits)) : hi;
            }
            len_ = new_len;
            trim();
        }

        void shr1() noexcept {
            for (std::size_t i = 0; i < len_; ++i) {
                limbs_[i] >>= 1;
                if (i + 1 < len_)
                    limbs_[i] |= limbs_[i + 1] << 31;
            }
            trim();
        }

        // Requires *this >= rhs.
        void sub(const BigUint& rhs) noexcept {
            std::int64_t borrow = 0;
            for (std::size_t i = 0; i < len_; ++i) {
                std::int64_t v = static_cast<std::int64_t>(limbs_[i]) - borrow - (i < rhs.len_ ? static_cast<std::int64_t>(rhs.limbs_[i]) : 0);
                borrow = v < 0 ? 1 : 0;
                if (v < 0)
                    v += static_cast<std::int64_t>(1) << 32;
                limbs_[i] = static_cast<std::uint32_t>(v);
            }
            trim();
        }

        [[nodiscard]] int compare(const BigUint& rhs) const noexcept {
            if (len_ != rhs.len_)
                return len_ < rhs.len_ ? -1 : 1;
            for (std::size_t i = len_; i-- > 0;) {
                if (limbs_[i] != rhs.limbs_[i])
                    return limbs_[i] < rhs.limbs_[i] ? -1 : 1;
            }
            return 0;
        }

    private:
        void trim() noexcept {
            while (len_ > 0 && limbs_[len_ - 1] == 0)
                --len_;
        }

        std::uint32_t limbs_[kMaxLimbs] {};
        std::size_t len_ {};
    };

    inline constexpr std::size_t kMaxExactDigits = 800;

    // Exact decimal to binary64 conversion of the number text [p, e), sign excluded. The grammar
    // has already been checked. Digits past kMaxExactDigits only contribute a sticky bit, which
    // is enough to break every rounding tie. Returns the IEEE bit pattern, exponent field 0x7FF
    // for overflow.
    [[nodiscard]] inline std::uint64_t parse_decimal_exact(const char* p, const char* e) noexcept {
        constexpr std::uint64_t kInfBits = 0x7FF0000000000000ull;

        std::uint8_t digits[kMaxExactDigits];
        std::size_t nd = 0;
        bool sticky = false;
        bool seen_nonzero = false;
        std::int64_t dp = 0;

        auto push = [&](const unsigned d) {
            if (nd < kMaxExactDigits)
                digits[nd++] = static_cast<std::uint8_t>(d);
            else if (d != 0)
                sticky = true;
        };

        while (p < e && is_digit(*p)) {
            const auto d = static_cast<unsigned>(*p - '0');
            if (d != 0 || seen_nonzero) {
                seen_nonzero = true;
                push(d);
                ++dp;
            }
            ++p;
        }

        if (p < e && *p == '.') {
            ++p;
            while (p < e && is_digit(*p)) {
                const auto d = static_cast<unsigned>(*p - '0');
                if (d == 0 && !seen_nonzero) {
                    --dp;
                } else {
                    seen_nonzero = true;
                    push(d);
                }
                ++p;
            }
        }

        if (p < e && (*p == 'e' || *p == 'E')) {
            ++p;
            bool neg = false;
            if (p < e && (*p == '+' || *p == '-')) {
                neg = *p == '-';
                ++p;
            }
            std::int64_t exp = 0;
            while (p < e && is_digit(*p)) {
                if (exp < 100000)
                    exp = exp * 10 + (*p - '0');
                ++p;
            }
            dp += neg ? -exp : exp;
        }

        while (nd > 0 && digits[nd - 1] == 0)
            --nd;

        if (nd == 0 && !sticky)
            return 0;
        if (dp > 310)
            return kInfBits;
        if (dp < -330)
            return 0;

        BigUint num;
        {
            std::uint32_t chunk = 0;
            unsigned chunk_len = 0;
            for (std::size_t i = 0; i < nd; ++i) {
                chunk = chunk * 10 + digits[i];
                if (++chunk_len == 9) {
                    num.mul_pow10(9);
                    num.add_small(chunk);
                    chunk = 0;
                    chunk_len = 0;
                }
            }
            if (chunk_len) {
                num.mul_pow10(chunk_len);
                num.add_small(chunk);
            }
        }

        // value = num * 10^e10
        const std::int64_t e10 = dp - static_cast<std::int64_t>(nd);
        BigUint den(1);
        if (e10 >= 0)
            num.mul_pow10(static_cast<unsigned>(e10));
        else
            den.mul_pow10(static_cast<unsigned>(-e10));

        // k = floor(log2(num / den))
        int k = num.bit_length() - den.bit_length();
        {
            BigUint n = num;
            BigUint d = den;
            if (k >= 0)
                d.shl(static_cast<unsigned>(k));
            else
                n.shl(static_cast<unsigned>(-k));
            if (n.compare(d) < 0)
                --k;
        }

        if (k > 1023)
            return kInfBits;

        int lsb = std::max(k - 52, -1074);

        // q = floor(num / den * 2^(1 - lsb)), one bit below the last mantissa bit.
        const int shift = 1 - lsb;
        if (shift >= 0)
            num.shl(static_cast<unsigned>(shift));
        else
            den.shl(static_cast<unsigned>(-shift));

        std::uint64_t q = 0;
        {
            int steps = num.bit_length() - den.bit_length();
            if (steps < 0)
                steps = 0;
            den.shl(static_cast<unsigned>(steps));
            for (int i = steps; i >= 0; --i) {
                q <<= 1;
                if (num.compare(den) >= 0) {
                    num.sub(den);
                    q |= 1;
                }
                den.shr1();
            }
        }

        const bool round_bit = (q & 1u) != 0;
        std::uint64_t m = q >> 1;
        const bool rest = sticky || !num.is_zero();

        if (round_bit && (rest || (m & 1u)))
            ++m;

        if (m == (1ull << 53)) {
            m = 1ull << 52;
            ++lsb;
        }

        // Normal numbers have m in [2^52, 2^53); subnormals have lsb == -1074 and m < 2^52.
        const std::uint64_t bits = (static_cast<std::uint64_t>(lsb + 1074) << 52) + m;
        if (bits >= kInfBits)
            return kInfBits;
        return bits;
    }

} // namespace sjson::detail

#endif // SJSON_DETAIL_BIGINT_HPP
