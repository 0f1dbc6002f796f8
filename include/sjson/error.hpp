/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_ERROR_HPP
#define SJSON_ERROR_HPP

#pragma once
#include <sjson/config.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace sjson {

    enum class ErrorCode : std::uint8_t {
        None,
        EofWhileParsing,
        ExpectedColon,
        ExpectedArrayCommaOrEnd,
        ExpectedObjectCommaOrEnd,
        ExpectedObjectKeyOrEnd,
        ExpectedArrayStart,
        ExpectedObjectStart,
        TrailingComma,
        TrailingCharacters,
        InvalidLiteral,
        InvalidJsonValue,
        InvalidNumber,
        NumberOutOfRange,
        FloatMustBeFinite,
        InvalidEscape,
        InvalidUnicodeCodePoint,
        InvalidSurrogate,
        ControlCharacterInString,
        InvalidUtf8,
        DepthExceeded,
        GetInEmptyObject,
        GetUnknownKeyInObject,
        GetInEmptyArray,
        GetIndexOutOfArray,
        TypeMismatch,
        UnexpectedVisitType,
        AllocFailed,
        WriterOverflow,
        EncodeDepthExceeded,
        ToCharsFailed,
    };

    enum class ErrorCategory : std::uint8_t {
        None,
        Syntax,
        Eof,
        Encoding,
        Range,
        Depth,
        NotFound,
        TypeUnmatched,
        Resource
    };

    enum class ErrorFormat : std::uint8_t {
        Pretty,
        Compact
    };

    [[nodiscard]] constexpr const char* error_code_name(const ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::EofWhileParsing:
            return "EofWhileParsing";
        case ErrorCode::ExpectedColon:
            return "ExpectedColon";
        case ErrorCode::ExpectedArrayCommaOrEnd:
            return "ExpectedArrayCommaOrEnd";
        case ErrorCode::ExpectedObjectCommaOrEnd:
            return "ExpectedObjectCommaOrEnd";
        case ErrorCode::ExpectedObjectKeyOrEnd:
            return "ExpectedObjectKeyOrEnd";
        case ErrorCode::ExpectedArrayStart:
            return "ExpectedArrayStart";
        case ErrorCode::ExpectedObjectStart:
            return "ExpectedObjectStart";
        case ErrorCode::TrailingComma:
            return "TrailingComma";
        case ErrorCode::TrailingCharacters:
            return "TrailingCharacters";
        case ErrorCode::InvalidLiteral:
            return "InvalidLiteral";
        case ErrorCode::InvalidJsonValue:
            return "InvalidJsonValue";
        case ErrorCode::InvalidNumber:
            return "InvalidNumber";
        case ErrorCode::NumberOutOfRange:
            return "NumberOutOfRange";
        case ErrorCode::FloatMustBeFinite:
            return "FloatMustBeFinite";
        case ErrorCode::InvalidEscape:
            return "InvalidEscape";
        case ErrorCode::InvalidUnicodeCodePoint:
            return "InvalidUnicodeCodePoint";
        case ErrorCode::InvalidSurrogate:
            return "InvalidSurrogate";
        case ErrorCode::ControlCharacterInString:
            return "ControlCharacterInString";
        case ErrorCode::InvalidUtf8:
            return "InvalidUtf8";
        case ErrorCode::DepthExceeded:
            return "DepthExceeded";
        case ErrorCode::GetInEmptyObject:
            return "GetInEmptyObject";
        case ErrorCode::GetUnknownKeyInObject:
            return "GetUnknownKeyInObject";
        case ErrorCode::GetInEmptyArray:
            return "GetInEmptyArray";
        case ErrorCode::GetIndexOutOfArray:
            return "GetIndexOutOfArray";
        case ErrorCode::TypeMismatch:
            return "TypeMismatch";
        case ErrorCode::UnexpectedVisitType:
            return "UnexpectedVisitType";
        case ErrorCode::AllocFailed:
            return "AllocFailed";
        case ErrorCode::WriterOverflow:
            return "WriterOverflow";
        case ErrorCode::EncodeDepthExceeded:
            return "EncodeDepthExceeded";
        case ErrorCode::ToCharsFailed:
            return "ToCharsFailed";
        }
        return "Unknown";
    }

    [[nodiscard]] constexpr ErrorCategory error_category(const ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::None:
            return ErrorCategory::None;
        case ErrorCode::EofWhileParsing:
            return ErrorCategory::Eof;
        case ErrorCode::InvalidEscape:
        case ErrorCode::InvalidUnicodeCodePoint:
        case ErrorCode::InvalidSurrogate:
        case ErrorCode::InvalidUtf8:
            return ErrorCategory::Encoding;
        case ErrorCode::NumberOutOfRange:
        case ErrorCode::FloatMustBeFinite:
            return ErrorCategory::Range;
        case ErrorCode::DepthExceeded:
        case ErrorCode::EncodeDepthExceeded:
            return ErrorCategory::Depth;
        case ErrorCode::GetInEmptyObject:
        case ErrorCode::GetUnknownKeyInObject:
        case ErrorCode::GetInEmptyArray:
        case ErrorCode::GetIndexOutOfArray:
            return ErrorCategory::NotFound;
        case ErrorCode::TypeMismatch:
        case ErrorCode::UnexpectedVisitType:
            return ErrorCategory::TypeUnmatched;
        case ErrorCode::AllocFailed:
        case ErrorCode::WriterOverflow:
        case ErrorCode::ToCharsFailed:
            return ErrorCategory::Resource;
        default:
            return ErrorCategory::Syntax;
        }
    }

    struct ErrorLocation {
        std::size_t offset {};
        std::size_t line {1};
        std::size_t column {1};
    };

    struct ParseError {
        ErrorCode code {ErrorCode::None};
        const char* at {};
        std::string_view input {};

        SJSON_FORCEINLINE void set(const ErrorCode c, const char* at_str = nullptr) noexcept {
            if (code == ErrorCode::None) {
                code = c;
                at = at_str;
            }
        }

        SJSON_FORCEINLINE void reset() noexcept {
            code = ErrorCode::None;
            at = nullptr;
            input = {};
        }

        [[nodiscard]] ErrorLocation location() const noexcept;

        [[nodiscard]] std::size_t offset() const noexcept {
            return location().offset;
        }

        [[nodiscard]] std::size_t line() const noexcept {
            return location().line;
        }

        [[nodiscard]] std::size_t column() const noexcept {
            return location().column;
        }

        [[nodiscard]] constexpr ErrorCategory category() const noexcept {
            return error_category(code);
        }

        template <ErrorFormat Fmt>
        [[nodiscard]] std::string format() const;

        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] SJSON_FORCEINLINE constexpr bool ok() const noexcept {
            return code == ErrorCode::None;
        }

        [[nodiscard]] SJSON_FORCEINLINE constexpr explicit operator bool() const noexcept {
            return ok();
        }
    };

    // Line and column are only ever computed here, by walking the input up to the error.
    [[nodiscard]] inline ErrorLocation locate_error(const std::string_view input, const ParseError& e) noexcept {
        ErrorLocation loc {};
        if (e.code == ErrorCode::None || !e.at || input.data() == nullptr)
            return loc;

        const auto* base = input.data();
        const auto* end = base + input.size();
        if (e.at < base)
            return loc;

        const auto* p = std::min(e.at, end);
        loc.offset = static_cast<std::size_t>(p - base);

        std::size_t line = 1;
        std::size_t col = 1;
        for (const char* it = base; it < p; ++it) {
            if (*it == '\n') {
                ++line;
                col = 1;
            } else {
                ++col;
            }
        }
        loc.line = line;
        loc.column = col;
        return loc;
    }

    inline ErrorLocation ParseError::location() const noexcept {
        return locate_error(input, *this);
    }

    [[nodiscard]] inline std::string format_error_compact(const std::string_view input, const ParseError& e) {
        if (e.code == ErrorCode::None)
            return {};

        const auto [offset, line, column] = locate_error(input, e);

        std::string out;
        out.reserve(96);

        out.append("sjson: ");
        out.append(error_code_name(e.code));
        out.append(" at ");
        out.append(std::to_string(line));
        out.push_back(':');
        out.append(std::to_string(column));
        out.append(" (offset ");
        out.append(std::to_string(offset));
        out.push_back(')');

        if (offset < input.size()) {
            out.append(" unexpected '");
            out.push_back(input[offset]);
            out.push_back('\'');
        }

        return out;
    }

    [[nodiscard]] inline std::string format_error(const std::string_view input, const ParseError& e) {
        if (e.code == ErrorCode::None)
            return {};

        constexpr std::size_t kMaxWidth = 100;
        constexpr std::size_t kHalfWin = 40;

        const auto [offset, line, column] = locate_error(input, e);

        std::size_t start = offset;
        while (start > 0 && input[start - 1] != '\n')
            --start;

        std::size_t end = offset;
        while (end < input.size() && input[end] != '\n')
            ++end;

        std::string_view full = input.substr(start, end - start);

        std::size_t caret = column ? column - 1 : 0;
        std::size_t trim_left = 0;

        if (full.size() > kMaxWidth) {
            std::size_t win = caret > kHalfWin ? caret - kHalfWin : 0;
            if (win + kMaxWidth > full.size())
                win = full.size() - kMaxWidth;

            trim_left = win;
            full = full.substr(win, kMaxWidth);
            caret -= trim_left;
        }

        std::string out;
        out.reserve(full.size() + 128);

        out.append("sjson: ");
        out.append(error_code_name(e.code));
        out.push_back('\n');

        out.append(" --> ");
        out.append(std::to_string(line));
        out.push_back(':');
        out.append(std::to_string(column));
        out.append(" (offset ");
        out.append(std::to_string(offset));
        out.append(")\n\n");

        const std::string prefix = " " + std::to_string(line) + " | ";
        std::string rendered = prefix;

        if (trim_left)
            rendered += "...";

        rendered.append(full);

        if (trim_left + full.size() < end - start)
            rendered += "...";

        out.append(rendered);
        out.push_back('\n');

        std::string caret_line(rendered.size() + 1, ' ');
        const std::size_t caret_pos = prefix.size() + (trim_left ? 3 : 0) + caret;
        caret_line.resize(std::max(caret_line.size(), caret_pos + 1), ' ');
        caret_line[caret_pos] = '^';
        while (!caret_line.empty() && caret_line.back() == ' ')
            caret_line.pop_back();

        out.append(caret_line);

        if (offset < input.size()) {
            out.append(" unexpected '");
            out.push_back(input[offset]);
            out.push_back('\'');
        } else {
            out.append(" end of input");
        }

        out.push_back('\n');
        return out;
    }

    template <ErrorFormat Fmt>
    std::string ParseError::format() const {
        if (input.data() == nullptr)
            return {};

        if constexpr (Fmt == ErrorFormat::Compact)
            return format_error_compact(input, *this);
        else
            return format_error(input, *this);
    }

    inline std::string ParseError::to_string() const {
        return error_code_name(code);
    }

} // namespace sjson

#endif // SJSON_ERROR_HPP
