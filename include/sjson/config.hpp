/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_CONFIG_HPP
#define SJSON_CONFIG_HPP

#pragma once
#include <cstddef>
#include <cstdint>

#ifdef _MSC_VER
    #define SJSON_FORCEINLINE __forceinline
#else
    #define SJSON_FORCEINLINE __attribute__((always_inline)) inline
#endif

#if !defined(SJSON_DISABLE_SIMD) && (defined(__x86_64__) || defined(_M_X64))
    #define SJSON_HAS_SSE2 1
    #include <emmintrin.h>
    #if defined(__GNUC__) || defined(__clang__)
        #define SJSON_HAS_AVX2 1
        #include <immintrin.h>
    #endif
#endif

#ifndef SJSON_DEFAULT_MAX_DEPTH
    #define SJSON_DEFAULT_MAX_DEPTH 512
#endif

namespace sjson {

    constexpr auto kDefaultBlockSize = 64ull * 1024ull;
    constexpr std::uint32_t kDefaultMaxDepth = SJSON_DEFAULT_MAX_DEPTH;
    constexpr std::size_t kUnboundedDepth = SIZE_MAX;

} // namespace sjson

#endif // SJSON_CONFIG_HPP
