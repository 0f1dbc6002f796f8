/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_DETAIL_SCAN_HPP
#define SJSON_DETAIL_SCAN_HPP

#pragma once
#include <sjson/config.hpp>

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>

namespace sjson::detail {

    inline constexpr std::size_t kWindow = 64;

    // One bit per byte of a 64-byte window, bit i for byte i.
    struct Block64 {
        std::uint64_t quote {};
        std::uint64_t backslash {};
        std::uint64_t control {};
        std::uint64_t space {};
        std::uint64_t comma {};
        std::uint64_t lbrace {};
        std::uint64_t rbrace {};
        std::uint64_t lbracket {};
        std::uint64_t rbracket {};

        [[nodiscard]] constexpr std::uint64_t string_special() const noexcept {
            return quote | backslash | control;
        }

        [[nodiscard]] constexpr bool operator==(const Block64&) const noexcept = default;
    };

    using ClassifyFn = void (*)(const char* p64, Block64& out) noexcept;

    struct ScanKernel {
        const char* name {};
        ClassifyFn classify {};
    };

    inline void classify_scalar(const char* p, Block64& b) noexcept {
        b = {};
        for (unsigned i = 0; i < kWindow; ++i) {
            const auto c = static_cast<unsigned char>(p[i]);
            const std::uint64_t bit = 1ull << i;

            if (c < 0x20u)
                b.control |= bit;

            switch (c) {
            case '"':
                b.quote |= bit;
                break;
            case '\\':
                b.backslash |= bit;
                break;
            case ' ':
            case '\t':
            case '\n':
            case '\r':
                b.space |= bit;
                break;
            case ',':
                b.comma |= bit;
                break;
            case '{':
                b.lbrace |= bit;
                break;
            case '}':
                b.rbrace |= bit;
                break;
            case '[':
                b.lbracket |= bit;
                break;
            case ']':
                b.rbracket |= bit;
                break;
            default:
                break;
            }
        }
    }

#if defined(SJSON_HAS_SSE2)

    [[nodiscard]] SJSON_FORCEINLINE std::uint64_t eq_mask16(const __m128i x, const char c) noexcept {
        return static_cast<std::uint16_t>(_mm_movemask_epi8(_mm_cmpeq_epi8(x, _mm_set1_epi8(c))));
    }

    inline void classify_sse2(const char* p, Block64& b) noexcept {
        b = {};
        const __m128i high3 = _mm_set1_epi8(static_cast<char>(0xE0));
        const __m128i zero = _mm_setzero_si128();

        for (unsigned i = 0; i < 4; ++i) {
            const __m128i x = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p + i * 16));
            const unsigned shift = i * 16;

            b.quote |= eq_mask16(x, '"') << shift;
            b.backslash |= eq_mask16(x, '\\') << shift;
            b.comma |= eq_mask16(x, ',') << shift;
            b.lbrace |= eq_mask16(x, '{') << shift;
            b.rbrace |= eq_mask16(x, '}') << shift;
            b.lbracket |= eq_mask16(x, '[') << shift;
            b.rbracket |= eq_mask16(x, ']') << shift;
            b.space |= (eq_mask16(x, ' ') | eq_mask16(x, '\t') | eq_mask16(x, '\n') | eq_mask16(x, '\r')) << shift;

            const __m128i ctrl = _mm_cmpeq_epi8(_mm_and_si128(x, high3), zero);
            b.control |= static_cast<std::uint64_t>(static_cast<std::uint16_t>(_mm_movemask_epi8(ctrl))) << shift;
        }
    }

#endif

#if defined(SJSON_HAS_AVX2)

    __attribute__((target("avx2"))) inline std::uint64_t eq_mask32(const __m256i x, const char c) noexcept {
        return static_cast<std::uint32_t>(_mm256_movemask_epi8(_mm256_cmpeq_epi8(x, _mm256_set1_epi8(c))));
    }

    __attribute__((target("avx2"))) inline void classify_avx2(const char* p, Block64& b) noexcept {
        b = {};
        const __m256i high3 = _mm256_set1_epi8(static_cast<char>(0xE0));
        const __m256i zero = _mm256_setzero_si256();

        for (unsigned i = 0; i < 2; ++i) {
            const __m256i x = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(p + i * 32));
            const unsigned shift = i * 32;

            b.quote |= eq_mask32(x, '"') << shift;
            b.backslash |= eq_mask32(x, '\\') << shift;
            b.comma |= eq_mask32(x, ',') << shift;
            b.lbrace |= eq_mask32(x, '{') << shift;
            b.rbrace |= eq_mask32(x, '}') << shift;
            b.lbracket |= eq_mask32(x, '[') << shift;
            b.rbracket |= eq_mask32(x, ']') << shift;
            b.space |= (eq_mask32(x, ' ') | eq_mask32(x, '\t') | eq_mask32(x, '\n') | eq_mask32(x, '\r')) << shift;

            const __m256i ctrl = _mm256_cmpeq_epi8(_mm256_and_si256(x, high3), zero);
            b.control |= static_cast<std::uint64_t>(static_cast<std::uint32_t>(_mm256_movemask_epi8(ctrl))) << shift;
        }
    }

    [[nodiscard]] inline bool cpu_has_avx2() noexcept {
        __builtin_cpu_init();
        return __builtin_cpu_supports("avx2");
    }

#endif

    inline constexpr ScanKernel kScalarKernel {"scalar", &classify_scalar};

    struct KernelSet {
        ScanKernel items[3] {};
        std::size_t count {};
    };

    // Kernels usable on the running CPU, best last. Detected once.
    [[nodiscard]] inline const KernelSet& kernel_set() noexcept {
        static const KernelSet set = [] {
            KernelSet s {};
            s.items[s.count++] = kScalarKernel;
#if defined(SJSON_HAS_SSE2)
            s.items[s.count++] = ScanKernel {"sse2", &classify_sse2};
#endif
#if defined(SJSON_HAS_AVX2)
            if (cpu_has_avx2())
                s.items[s.count++] = ScanKernel {"avx2", &classify_avx2};
#endif
            return s;
        }();
        return set;
    }

    [[nodiscard]] inline std::span<const ScanKernel> kernels() noexcept {
        const auto& s = kernel_set();
        return {s.items, s.count};
    }

    [[nodiscard]] inline const ScanKernel& active_kernel() noexcept {
        const auto& s = kernel_set();
        return s.items[s.count - 1];
    }

    [[nodiscard]] inline const ScanKernel& scalar_kernel() noexcept {
        return kScalarKernel;
    }

    [[nodiscard]] SJSON_FORCEINLINE std::uint64_t prefix_xor64(std::uint64_t mask) noexcept {
        mask ^= mask << 1;
        mask ^= mask << 2;
        mask ^= mask << 4;
        mask ^= mask << 8;
        mask ^= mask << 16;
        mask ^= mask << 32;
        return mask;
    }

    // Marks every byte preceded by an odd run of backslashes. prev_escaped carries a run that
    // ends on the last byte of the previous window (0 or 1) and is updated for the next one.
    [[nodiscard]] SJSON_FORCEINLINE std::uint64_t escaped_mask64(std::uint64_t backslash, std::uint64_t& prev_escaped) noexcept {
        constexpr std::uint64_t kEvenBits = 0x5555555555555555ull;

        backslash &= ~prev_escaped;
        const std::uint64_t follows_escape = backslash << 1 | prev_escaped;
        const std::uint64_t odd_sequence_starts = backslash & ~kEvenBits & ~follows_escape;

        const std::uint64_t sequences_starting_on_even_bits = odd_sequence_starts + backslash;
        prev_escaped = sequences_starting_on_even_bits < backslash ? 1u : 0u;

        const std::uint64_t invert_mask = sequences_starting_on_even_bits << 1;
        return (kEvenBits ^ invert_mask) & follows_escape;
    }

    // In-string bytes of a window: the opening quote is inside, the closing quote is not.
    [[nodiscard]] SJSON_FORCEINLINE std::uint64_t string_bits(const Block64& b, std::uint64_t& prev_in_string, std::uint64_t& prev_escaped) noexcept {
        const std::uint64_t escaped = b.backslash ? escaped_mask64(b.backslash, prev_escaped) : std::exchange(prev_escaped, 0);
        const std::uint64_t quote = b.quote & ~escaped;
        const std::uint64_t in = prefix_xor64(quote) ^ prev_in_string;
        prev_in_string = static_cast<std::uint64_t>(static_cast<std::int64_t>(in) >> 63);
        return in;
    }

    [[nodiscard]] SJSON_FORCEINLINE constexpr std::uint64_t valid_mask(const std::size_t avail) noexcept {
        return avail >= kWindow ? ~0ull : (1ull << avail) - 1u;
    }

    // Classifies the window at p. Short windows are copied into a space-padded buffer first, the
    // returned mask selects the bytes that belong to the input.
    SJSON_FORCEINLINE std::uint64_t classify_window(const ScanKernel& k, const char* p, const char* end, Block64& b) noexcept {
        const auto avail = static_cast<std::size_t>(end - p);
        if (avail >= kWindow) {
            k.classify(p, b);
            return ~0ull;
        }

        char tail[kWindow];
        std::memset(tail, ' ', kWindow);
        std::memcpy(tail, p, avail);
        k.classify(tail, b);
        return valid_mask(avail);
    }

    [[nodiscard]] SJSON_FORCEINLINE unsigned first_bit(const std::uint64_t m) noexcept {
        return static_cast<unsigned>(std::countr_zero(m));
    }

} // namespace sjson::detail

#endif // SJSON_DETAIL_SCAN_HPP
