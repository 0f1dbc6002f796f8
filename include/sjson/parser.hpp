/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_PARSER_HPP
#define SJSON_PARSER_HPP

#pragma once
#include <sjson/config.hpp>
#include <sjson/detail/scan.hpp>
#include <sjson/detail/stack.hpp>
#include <sjson/detail/utf8.hpp>
#include <sjson/error.hpp>
#include <sjson/number.hpp>
#include <sjson/pointer.hpp>
#include <sjson/string.hpp>

#include <algorithm>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sjson {

    // Raw text of one value, exactly as it appears in the input.
    struct RawSpan {
        std::string_view raw {};
        HasEscape escape {HasEscape::None};
    };

    // Event sink of the drivers. Returning false stops the parse with UnexpectedVisitType.
    // on_string/on_key receive a view that is only valid during the call; the borrowed variants
    // receive a view into the input buffer.
    template <class V>
    concept JsonVisitor = requires(V& v, std::string_view s, std::size_t n) {
        { v.on_null() } -> std::convertible_to<bool>;
        { v.on_bool(true) } -> std::convertible_to<bool>;
        { v.on_u64(std::uint64_t {}) } -> std::convertible_to<bool>;
        { v.on_i64(std::int64_t {}) } -> std::convertible_to<bool>;
        { v.on_f64(0.0) } -> std::convertible_to<bool>;
        { v.on_string(s) } -> std::convertible_to<bool>;
        { v.on_borrowed_string(s) } -> std::convertible_to<bool>;
        { v.on_key(s) } -> std::convertible_to<bool>;
        { v.on_borrowed_key(s) } -> std::convertible_to<bool>;
        { v.on_array_begin(n) } -> std::convertible_to<bool>;
        { v.on_array_end(n) } -> std::convertible_to<bool>;
        { v.on_object_begin(n) } -> std::convertible_to<bool>;
        { v.on_object_end(n) } -> std::convertible_to<bool>;
    };

} // namespace sjson

namespace sjson::detail {

    struct IgnoreVisitor {
        bool on_null() noexcept {
            return true;
        }
        bool on_bool(bool) noexcept {
            return true;
        }
        bool on_u64(std::uint64_t) noexcept {
            return true;
        }
        bool on_i64(std::int64_t) noexcept {
            return true;
        }
        bool on_f64(double) noexcept {
            return true;
        }
        bool on_string(std::string_view) noexcept {
            return true;
        }
        bool on_borrowed_string(std::string_view) noexcept {
            return true;
        }
        bool on_key(std::string_view) noexcept {
            return true;
        }
        bool on_borrowed_key(std::string_view) noexcept {
            return true;
        }
        bool on_array_begin(std::size_t) noexcept {
            return true;
        }
        bool on_array_end(std::size_t) noexcept {
            return true;
        }
        bool on_object_begin(std::size_t) noexcept {
            return true;
        }
        bool on_object_end(std::size_t) noexcept {
            return true;
        }
    };

    // Open container of the iterative driver.
    struct ParseFrame {
        bool object {};
        std::size_t count {};
    };

    using FrameStack = InlineStack<ParseFrame, 64>;

    [[nodiscard]] SJSON_FORCEINLINE int byte_at(const char* p) noexcept {
        return static_cast<unsigned char>(*p);
    }

} // namespace sjson::detail

namespace sjson {

    // Tokenizer over [begin, end). One Parser drives one pass; position and the first error are
    // kept between calls so the lazy layer can step through a document.
    class Parser {
    public:
        Parser(const char* begin, const char* end, const bool strict_utf8 = true) noexcept
            : begin_(begin), end_(end), pos_(begin), strict_utf8_(strict_utf8) {
            err_.input = std::string_view {begin, static_cast<std::size_t>(end - begin)};
        }

        explicit Parser(const std::string_view json, const bool strict_utf8 = true) noexcept: Parser(json.data(), json.data() + json.size(), strict_utf8) { }

        // Writable input, required by parse_document_inplace.
        Parser(char* begin, char* end, const bool strict_utf8 = true) noexcept: Parser(static_cast<const char*>(begin), static_cast<const char*>(end), strict_utf8) {
            mutable_begin_ = begin;
        }

        Parser(const Parser&) = delete;
        Parser& operator=(const Parser&) = delete;

        [[nodiscard]] const ParseError& error() const noexcept {
            return err_;
        }

        [[nodiscard]] bool ok() const noexcept {
            return err_.ok();
        }

        [[nodiscard]] const char* pos() const noexcept {
            return pos_;
        }

        [[nodiscard]] std::size_t offset() const noexcept {
            return static_cast<std::size_t>(pos_ - begin_);
        }

        void set_max_depth(const std::uint32_t depth) noexcept {
            max_depth_ = depth;
        }

        void set_kernel(const detail::ScanKernel& k) noexcept {
            kernel_ = &k;
            nospace_start_ = kNoWindow;
        }

        // Recursive mode: nesting is limited by max_depth, exceeding it is DepthExceeded.
        template <JsonVisitor V>
        [[nodiscard]] bool parse_value(V& vis) {
            return parse_value_at(vis, 0);
        }

        // Iterative mode with an explicit stack; depth is bounded by memory only.
        template <JsonVisitor V>
        [[nodiscard]] bool parse_document(V& vis) {
            return parse_document_impl<false>(vis);
        }

        // Iterative mode over a writable buffer. Strings are unescaped in place and reported
        // through the borrowed events. Falls back to parse_document for read-only input.
        template <JsonVisitor V>
        [[nodiscard]] bool parse_document_inplace(V& vis) {
            if (!mutable_begin_)
                return parse_document_impl<false>(vis);
            return parse_document_impl<true>(vis);
        }

        // Fails with TrailingCharacters unless only whitespace remains.
        [[nodiscard]] bool parse_trailing() noexcept {
            const int c = skip_space();
            return c < 0 || fail(ErrorCode::TrailingCharacters, pos_ - 1);
        }

        // Skips one value and validates it on the way.
        [[nodiscard]] bool skip_one(RawSpan& out) {
            const int c = skip_space();
            if (c < 0)
                return fail(ErrorCode::EofWhileParsing, end_);

            const char* const start = pos_ - 1;
            HasEscape esc = HasEscape::None;
            if (!skip_value_checked(c, esc, 0))
                return false;
            out = RawSpan {std::string_view {start, static_cast<std::size_t>(pos_ - start)}, esc};
            return true;
        }

        // Skips one value by delimiter counting. Literals are still matched; numbers and string
        // contents are not looked at. Same span as skip_one on valid input.
        [[nodiscard]] bool skip_one_unchecked(RawSpan& out) noexcept {
            const int c = skip_space();
            if (c < 0)
                return fail(ErrorCode::EofWhileParsing, end_);

            const char* const start = pos_ - 1;
            HasEscape esc = HasEscape::None;
            switch (c) {
            case '"': {
                bool escaped = false;
                if (const auto code = detail::skip_string_unchecked(*kernel_, pos_, end_, escaped); code != ErrorCode::None)
                    return fail(code, pos_);
                esc = escaped ? HasEscape::Yes : HasEscape::None;
                break;
            }
            case '{':
            case '[':
                if (!skip_container(c == '{'))
                    return false;
                break;
            case 't':
                if (!parse_literal("true"))
                    return false;
                break;
            case 'f':
                if (!parse_literal("false"))
                    return false;
                break;
            case 'n':
                if (!parse_literal("null"))
                    return false;
                break;
            default:
                while (pos_ < end_) {
                    const auto b = static_cast<unsigned char>(*pos_);
                    if (b == ',' || b == ']' || b == '}' || detail::is_ws_u8(b))
                        break;
                    ++pos_;
                }
                break;
            }

            out = RawSpan {std::string_view {start, static_cast<std::size_t>(pos_ - start)}, esc};
            return true;
        }

        // Follows path from the current position and returns the span it ends on. Siblings of
        // the path are skipped structurally, nothing after the target is read.
        [[nodiscard]] bool get_from(const std::span<const PathItem> path, RawSpan& out) {
            return get_from_impl<true>(path, out);
        }

        [[nodiscard]] bool get_from_unchecked(const std::span<const PathItem> path, RawSpan& out) {
            return get_from_impl<false>(path, out);
        }

        // Resolves every path of tree in one pass. out[i] is the span of the i-th added path.
        // A path missing from the document fails the whole call.
        [[nodiscard]] bool get_many(const PointerTree& tree, const bool checked, std::vector<RawSpan>& out) {
            out.assign(tree.size(), RawSpan {});
            resolved_.assign(tree.node_count(), 0);
            pending_ = tree.size();
            if (pending_ == 0)
                return true;
            return checked ? walk_tree<true>(tree, tree.root(), out) : walk_tree<false>(tree, tree.root(), out);
        }

        // Lazy array stepping. The first call consumes '['. done is set at ']'.
        [[nodiscard]] bool next_array_elem(const bool first, const bool checked, RawSpan& out, bool& done) {
            done = false;
            if (first) {
                const int c = skip_space();
                if (c != '[')
                    return fail_token(ErrorCode::ExpectedArrayStart, c);
                if (peek_space() == ']') {
                    ++pos_;
                    done = true;
                    return true;
                }
            } else {
                const int c = skip_space();
                if (c == ']') {
                    done = true;
                    return true;
                }
                if (c != ',')
                    return fail_token(ErrorCode::ExpectedArrayCommaOrEnd, c);
                if (peek_space() == ']')
                    return fail(ErrorCode::TrailingComma, pos_);
            }
            return checked ? skip_one(out) : skip_one_unchecked(out);
        }

        // Lazy object stepping. key is valid until the next call.
        [[nodiscard]] bool next_object_entry(const bool first, const bool checked, std::string_view& key, RawSpan& out, bool& done) {
            done = false;
            int c = skip_space();
            if (first) {
                if (c != '{')
                    return fail_token(ErrorCode::ExpectedObjectStart, c);
                c = skip_space();
                if (c == '}') {
                    done = true;
                    return true;
                }
            } else {
                if (c == '}') {
                    done = true;
                    return true;
                }
                if (c != ',')
                    return fail_token(ErrorCode::ExpectedObjectCommaOrEnd, c);
                c = skip_space();
                if (c == '}')
                    return fail(ErrorCode::TrailingComma, pos_ - 1);
            }

            if (c != '"')
                return fail_token(ErrorCode::ExpectedObjectKeyOrEnd, c);
            if (!parse_key(key, checked))
                return false;
            if (!parse_colon())
                return false;
            return checked ? skip_one(out) : skip_one_unchecked(out);
        }

    private:
        static constexpr std::ptrdiff_t kNoWindow = -128;

        [[nodiscard]] SJSON_FORCEINLINE bool fail(const ErrorCode code, const char* at) noexcept {
            err_.set(code, at);
            return false;
        }

        // c is the byte skip_space returned.
        [[nodiscard]] SJSON_FORCEINLINE bool fail_token(const ErrorCode code, const int c) noexcept {
            if (c < 0)
                return fail(ErrorCode::EofWhileParsing, end_);
            return fail(code, pos_ - 1);
        }

        // Returns the next non-space byte and moves past it, -1 at end of input.
        [[nodiscard]] SJSON_FORCEINLINE int skip_space() noexcept {
            if (pos_ < end_ && !detail::is_ws_u8(static_cast<unsigned char>(*pos_)))
                return detail::byte_at(pos_++);
            if (end_ - pos_ >= 2 && !detail::is_ws_u8(static_cast<unsigned char>(pos_[1]))) {
                pos_ += 2;
                return detail::byte_at(pos_ - 1);
            }
            return skip_space_slow();
        }

        [[nodiscard]] SJSON_FORCEINLINE int peek_space() noexcept {
            const int c = skip_space();
            if (c >= 0)
                --pos_;
            return c;
        }

        int skip_space_slow() noexcept {
            const std::ptrdiff_t off = (pos_ - begin_) - nospace_start_;
            if (off >= 0 && off < static_cast<std::ptrdiff_t>(detail::kWindow)) {
                const std::uint64_t bits = nospace_bits_ & (~0ull << off);
                if (bits) {
                    pos_ = begin_ + nospace_start_ + detail::first_bit(bits);
                    return detail::byte_at(pos_++);
                }
                pos_ = begin_ + nospace_start_ + detail::kWindow;
            }

            detail::Block64 b;
            while (static_cast<std::size_t>(end_ - pos_) >= detail::kWindow) {
                kernel_->classify(pos_, b);
                if (const std::uint64_t nospace = ~b.space) {
                    nospace_start_ = pos_ - begin_;
                    nospace_bits_ = nospace;
                    pos_ += detail::first_bit(nospace);
                    return detail::byte_at(pos_++);
                }
                pos_ += detail::kWindow;
            }

            while (pos_ < end_) {
                const int c = detail::byte_at(pos_++);
                if (!detail::is_ws_u8(static_cast<unsigned char>(c)))
                    return c;
            }
            return -1;
        }

        [[nodiscard]] SJSON_FORCEINLINE bool parse_colon() noexcept {
            if (pos_ < end_ && *pos_ == ':') {
                ++pos_;
                return true;
            }
            const int c = skip_space();
            return c == ':' || fail_token(ErrorCode::ExpectedColon, c);
        }

        // pos_ is one past the first byte of the literal.
        [[nodiscard]] bool parse_literal(const std::string_view lit) noexcept {
            const char* const start = pos_ - 1;
            const auto avail = static_cast<std::size_t>(end_ - start);
            if (std::memcmp(start, lit.data(), std::min(avail, lit.size())) != 0)
                return fail(ErrorCode::InvalidLiteral, start);
            if (avail < lit.size())
                return fail(ErrorCode::EofWhileParsing, end_);
            pos_ = start + lit.size();
            return true;
        }

        // pos_ is after the opening quote of a key.
        [[nodiscard]] bool parse_key(std::string_view& key, const bool checked) {
            bool copied = false;
            if (const auto code = detail::parse_string_raw(*kernel_, pos_, end_, scratch_, key, copied, checked && strict_utf8_); code != ErrorCode::None)
                return fail(code, pos_);
            return true;
        }

        template <JsonVisitor V>
        [[nodiscard]] bool visit_number(V& vis) {
            const char* const start = pos_ - 1;
            const char* stop = nullptr;
            Number n;
            if (const auto code = detail::parse_number(start, end_, stop, n); code != ErrorCode::None)
                return fail(code, stop);
            pos_ = stop;

            bool accepted = false;
            switch (n.kind) {
            case NumberKind::Unsigned:
                accepted = vis.on_u64(n.u);
                break;
            case NumberKind::Signed:
                accepted = vis.on_i64(n.i);
                break;
            case NumberKind::Float:
                accepted = vis.on_f64(n.d);
                break;
            }
            return accepted || fail(ErrorCode::UnexpectedVisitType, start);
        }

        // pos_ is after the opening quote.
        template <bool InPlace, JsonVisitor V>
        [[nodiscard]] bool visit_string(V& vis, const bool key) {
            const char* const start = pos_ - 1;

            if constexpr (InPlace) {
                char* p = mutable_begin_ + (pos_ - begin_);
                char* const text = p;
                std::size_t len = 0;
                const auto code = detail::unescape_inplace(*kernel_, p, end_, len);
                pos_ = begin_ + (p - mutable_begin_);
                if (code != ErrorCode::None)
                    return fail(code, pos_);
                if (strict_utf8_) {
                    if (const char* bad = detail::validate_utf8(text, text + len); bad != text + len)
                        return fail(ErrorCode::InvalidUtf8, bad);
                }

                const std::string_view s {text, len};
                const bool accepted = key ? vis.on_borrowed_key(s) : vis.on_borrowed_string(s);
                return accepted || fail(ErrorCode::UnexpectedVisitType, start);
            } else {
                std::string_view s;
                bool copied = false;
                if (const auto code = detail::parse_string_raw(*kernel_, pos_, end_, scratch_, s, copied, strict_utf8_); code != ErrorCode::None)
                    return fail(code, pos_);

                bool accepted = false;
                if (copied)
                    accepted = key ? vis.on_key(s) : vis.on_string(s);
                else
                    accepted = key ? vis.on_borrowed_key(s) : vis.on_borrowed_string(s);
                return accepted || fail(ErrorCode::UnexpectedVisitType, start);
            }
        }

        // Scalars and the opening byte of containers. c was returned by skip_space.
        template <bool InPlace, JsonVisitor V>
        [[nodiscard]] bool visit_scalar(V& vis, const int c) {
            switch (c) {
            case '"':
                return visit_string<InPlace>(vis, false);
            case 't':
                return parse_literal("true") && (vis.on_bool(true) || fail(ErrorCode::UnexpectedVisitType, pos_ - 4));
            case 'f':
                return parse_literal("false") && (vis.on_bool(false) || fail(ErrorCode::UnexpectedVisitType, pos_ - 5));
            case 'n':
                return parse_literal("null") && (vis.on_null() || fail(ErrorCode::UnexpectedVisitType, pos_ - 4));
            case '-':
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
                return visit_number(vis);
            default:
                return fail_token(ErrorCode::InvalidJsonValue, c);
            }
        }

        template <JsonVisitor V>
        [[nodiscard]] bool parse_value_at(V& vis, const std::uint32_t depth) {
            const int c = skip_space();
            if (c == '{')
                return parse_object(vis, depth + 1);
            if (c == '[')
                return parse_array(vis, depth + 1);
            return visit_scalar<false>(vis, c);
        }

        template <JsonVisitor V>
        [[nodiscard]] bool parse_object(V& vis, const std::uint32_t depth) {
            if (depth > max_depth_)
                return fail(ErrorCode::DepthExceeded, pos_ - 1);
            if (!vis.on_object_begin(0))
                return fail(ErrorCode::UnexpectedVisitType, pos_ - 1);

            std::size_t count = 0;
            int c = skip_space();
            if (c == '}')
                return vis.on_object_end(0) || fail(ErrorCode::UnexpectedVisitType, pos_ - 1);

            for (;;) {
                if (c != '"')
                    return fail_token(ErrorCode::ExpectedObjectKeyOrEnd, c);
                if (!visit_string<false>(vis, true))
                    return false;
                if (!parse_colon())
                    return false;
                if (!parse_value_at(vis, depth))
                    return false;
                ++count;

                c = skip_space();
                if (c == ',') {
                    c = skip_space();
                    if (c == '}')
                        return fail(ErrorCode::TrailingComma, pos_ - 1);
                    continue;
                }
                if (c == '}')
                    return vis.on_object_end(count) || fail(ErrorCode::UnexpectedVisitType, pos_ - 1);
                return fail_token(ErrorCode::ExpectedObjectCommaOrEnd, c);
            }
        }

        template <JsonVisitor V>
        [[nodiscard]] bool parse_array(V& vis, const std::uint32_t depth) {
            if (depth > max_depth_)
                return fail(ErrorCode::DepthExceeded, pos_ - 1);
            if (!vis.on_array_begin(0))
                return fail(ErrorCode::UnexpectedVisitType, pos_ - 1);

            if (peek_space() == ']') {
                ++pos_;
                return vis.on_array_end(0) || fail(ErrorCode::UnexpectedVisitType, pos_ - 1);
            }

            std::size_t count = 0;
            for (;;) {
                if (!parse_value_at(vis, depth))
                    return false;
                ++count;

                const int c = skip_space();
                if (c == ',') {
                    if (peek_space() == ']') {
                        ++pos_;
                        return fail(ErrorCode::TrailingComma, pos_ - 1);
                    }
                    continue;
                }
                if (c == ']')
                    return vis.on_array_end(count) || fail(ErrorCode::UnexpectedVisitType, pos_ - 1);
                return fail_token(ErrorCode::ExpectedArrayCommaOrEnd, c);
            }
        }

        enum class State : std::uint8_t {
            ArrayValue,
            ObjectKey,
            ScopeEnd
        };

        // Starts the value whose first byte is c. Containers push a frame and move to their
        // first slot; scalars finish the value.
        template <bool InPlace, JsonVisitor V>
        [[nodiscard]] bool dispatch(V& vis, detail::FrameStack& stack, const int c, State& state, bool& after_comma) {
            if (c == '[' || c == '{') {
                const bool object = c == '{';
                if (!stack.push(detail::ParseFrame {object, 0}))
                    return fail(ErrorCode::AllocFailed, pos_ - 1);
                if (!(object ? vis.on_object_begin(0) : vis.on_array_begin(0)))
                    return fail(ErrorCode::UnexpectedVisitType, pos_ - 1);
                state = object ? State::ObjectKey : State::ArrayValue;
                after_comma = false;
                return true;
            }
            state = State::ScopeEnd;
            return visit_scalar<InPlace>(vis, c);
        }

        template <JsonVisitor V>
        [[nodiscard]] bool close_scope(V& vis, detail::FrameStack& stack) {
            const auto frame = stack.top();
            stack.pop();
            const bool accepted = frame.object ? vis.on_object_end(frame.count) : vis.on_array_end(frame.count);
            return accepted || fail(ErrorCode::UnexpectedVisitType, pos_ - 1);
        }

        template <bool InPlace, JsonVisitor V>
        [[nodiscard]] bool parse_document_impl(V& vis) {
            detail::FrameStack stack;
            State state = State::ScopeEnd;
            bool after_comma = false;

            if (!dispatch<InPlace>(vis, stack, skip_space(), state, after_comma))
                return false;

            for (;;) {
                switch (state) {
                case State::ArrayValue: {
                    const int c = skip_space();
                    if (c == ']') {
                        if (after_comma)
                            return fail(ErrorCode::TrailingComma, pos_ - 1);
                        if (!close_scope(vis, stack))
                            return false;
                        state = State::ScopeEnd;
                        break;
                    }
                    ++stack.top().count;
                    if (!dispatch<InPlace>(vis, stack, c, state, after_comma))
                        return false;
                    break;
                }

                case State::ObjectKey: {
                    const int c = skip_space();
                    if (c == '}') {
                        if (after_comma)
                            return fail(ErrorCode::TrailingComma, pos_ - 1);
                        if (!close_scope(vis, stack))
                            return false;
                        state = State::ScopeEnd;
                        break;
                    }
                    if (c != '"')
                        return fail_token(ErrorCode::ExpectedObjectKeyOrEnd, c);
                    if (!visit_string<InPlace>(vis, true))
                        return false;
                    if (!parse_colon())
                        return false;
                    ++stack.top().count;
                    if (!dispatch<InPlace>(vis, stack, skip_space(), state, after_comma))
                        return false;
                    break;
                }

                case State::ScopeEnd: {
                    if (stack.empty())
                        return true;
                    const int c = skip_space();
                    const bool object = stack.top().object;
                    if (c == ',') {
                        state = object ? State::ObjectKey : State::ArrayValue;
                        after_comma = true;
                        break;
                    }
                    if (c == (object ? '}' : ']')) {
                        if (!close_scope(vis, stack))
                            return false;
                        break;
                    }
                    return fail_token(object ? ErrorCode::ExpectedObjectCommaOrEnd : ErrorCode::ExpectedArrayCommaOrEnd, c);
                }
                }
            }
        }

        // c was returned by skip_space.
        [[nodiscard]] bool skip_value_checked(const int c, HasEscape& esc, const std::uint32_t depth) {
            switch (c) {
            case '"': {
                bool escaped = false;
                if (const auto code = detail::skip_string(*kernel_, pos_, end_, escaped, strict_utf8_); code != ErrorCode::None)
                    return fail(code, pos_);
                esc = escaped ? HasEscape::Yes : HasEscape::None;
                return true;
            }
            case '{':
                return skip_object_checked(depth + 1);
            case '[':
                return skip_array_checked(depth + 1);
            case 't':
                return parse_literal("true");
            case 'f':
                return parse_literal("false");
            case 'n':
                return parse_literal("null");
            case '-':
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9': {
                const char* p = pos_ - 1;
                if (const auto code = detail::skip_number(p, end_); code != ErrorCode::None)
                    return fail(code, p);
                pos_ = p;
                return true;
            }
            default:
                return fail_token(ErrorCode::InvalidJsonValue, c);
            }
        }

        [[nodiscard]] bool skip_object_checked(const std::uint32_t depth) {
            if (depth > max_depth_)
                return fail(ErrorCode::DepthExceeded, pos_ - 1);

            int c = skip_space();
            if (c == '}')
                return true;

            for (;;) {
                if (c != '"')
                    return fail_token(ErrorCode::ExpectedObjectKeyOrEnd, c);
                bool escaped = false;
                if (const auto code = detail::skip_string(*kernel_, pos_, end_, escaped, strict_utf8_); code != ErrorCode::None)
                    return fail(code, pos_);
                if (!parse_colon())
                    return false;
                HasEscape esc = HasEscape::None;
                if (!skip_value_checked(skip_space(), esc, depth))
                    return false;

                c = skip_space();
                if (c == ',') {
                    c = skip_space();
                    if (c == '}')
                        return fail(ErrorCode::TrailingComma, pos_ - 1);
                    continue;
                }
                if (c == '}')
                    return true;
                return fail_token(ErrorCode::ExpectedObjectCommaOrEnd, c);
            }
        }

        [[nodiscard]] bool skip_array_checked(const std::uint32_t depth) {
            if (depth > max_depth_)
                return fail(ErrorCode::DepthExceeded, pos_ - 1);

            int c = skip_space();
            if (c == ']')
                return true;

            for (;;) {
                HasEscape esc = HasEscape::None;
                if (!skip_value_checked(c, esc, depth))
                    return false;

                c = skip_space();
                if (c == ',') {
                    c = skip_space();
                    if (c == ']')
                        return fail(ErrorCode::TrailingComma, pos_ - 1);
                    continue;
                }
                if (c == ']')
                    return true;
                return fail_token(ErrorCode::ExpectedArrayCommaOrEnd, c);
            }
        }

        // pos_ is after the opening bracket. Counts brackets of one kind outside strings, one
        // window at a time.
        [[nodiscard]] bool skip_container(const bool object) noexcept {
            std::uint64_t prev_in_string = 0;
            std::uint64_t prev_escaped = 0;
            std::size_t depth = 1;
            detail::Block64 b;

            while (pos_ < end_) {
                const std::uint64_t valid = detail::classify_window(*kernel_, pos_, end_, b);
                const std::uint64_t outside = ~detail::string_bits(b, prev_in_string, prev_escaped) & valid;
                std::uint64_t opens = (object ? b.lbrace : b.lbracket) & outside;
                std::uint64_t closes = (object ? b.rbrace : b.rbracket) & outside;

                while (closes) {
                    const std::uint64_t bit = closes & (0 - closes);
                    const std::uint64_t below = bit - 1;
                    depth += static_cast<std::size_t>(std::popcount(opens & below));
                    opens &= ~below;
                    if (--depth == 0) {
                        pos_ += detail::first_bit(bit) + 1;
                        return true;
                    }
                    closes &= closes - 1;
                }

                depth += static_cast<std::size_t>(std::popcount(opens));
                pos_ += std::min<std::size_t>(detail::kWindow, static_cast<std::size_t>(end_ - pos_));
            }
            return fail(ErrorCode::EofWhileParsing, end_);
        }

        template <bool Checked>
        [[nodiscard]] bool skip(RawSpan& out) {
            if constexpr (Checked)
                return skip_one(out);
            else
                return skip_one_unchecked(out);
        }

        template <bool Checked>
        [[nodiscard]] bool get_from_impl(const std::span<const PathItem> path, RawSpan& out) {
            for (const auto& item : path) {
                if (item.is_key() ? !find_key<Checked>(item.key()) : !find_index<Checked>(item.index()))
                    return false;
            }
            return skip<Checked>(out);
        }

        // Leaves pos_ at the value of the first member named key.
        template <bool Checked>
        [[nodiscard]] bool find_key(const std::string_view key) {
            int c = skip_space();
            if (c != '{')
                return fail_token(ErrorCode::TypeMismatch, c);

            c = skip_space();
            if (c == '}')
                return fail(ErrorCode::GetInEmptyObject, pos_ - 1);

            for (;;) {
                if (c != '"')
                    return fail_token(ErrorCode::ExpectedObjectKeyOrEnd, c);
                std::string_view k;
                if (!parse_key(k, Checked))
                    return false;
                if (!parse_colon())
                    return false;
                if (k == key)
                    return true;

                RawSpan skipped;
                if (!skip<Checked>(skipped))
                    return false;

                c = skip_space();
                if (c == ',') {
                    c = skip_space();
                    if (c == '}')
                        return fail(ErrorCode::TrailingComma, pos_ - 1);
                    continue;
                }
                if (c == '}')
                    return fail(ErrorCode::GetUnknownKeyInObject, pos_ - 1);
                return fail_token(ErrorCode::ExpectedObjectCommaOrEnd, c);
            }
        }

        // Leaves pos_ at element index.
        template <bool Checked>
        [[nodiscard]] bool find_index(const std::size_t index) {
            int c = skip_space();
            if (c != '[')
                return fail_token(ErrorCode::TypeMismatch, c);

            if (peek_space() == ']') {
                ++pos_;
                return fail(ErrorCode::GetInEmptyArray, pos_ - 1);
            }

            for (std::size_t i = 0; i < index; ++i) {
                RawSpan skipped;
                if (!skip<Checked>(skipped))
                    return false;
                c = skip_space();
                if (c == ']')
                    return fail(ErrorCode::GetIndexOutOfArray, pos_ - 1);
                if (c != ',')
                    return fail_token(ErrorCode::ExpectedArrayCommaOrEnd, c);
                if constexpr (Checked) {
                    if (peek_space() == ']')
                        return fail(ErrorCode::TrailingComma, pos_);
                }
            }
            return true;
        }

        template <bool Checked>
        [[nodiscard]] bool walk_tree(const PointerTree& tree, const PointerTree::Node& node, std::vector<RawSpan>& out) {
            RawSpan span;
            if (node.is_leaf()) {
                if (!skip<Checked>(span))
                    return false;
            } else {
                const int c = peek_space();
                const char* const start = pos_;
                bool walked = false;
                if (c == '{' && node.indices.empty())
                    walked = walk_object<Checked>(tree, node, out);
                else if (c == '[' && node.keys.empty())
                    walked = walk_array<Checked>(tree, node, out);
                else if (c < 0)
                    return fail(ErrorCode::EofWhileParsing, end_);
                else
                    return fail(ErrorCode::TypeMismatch, pos_);

                if (!walked)
                    return false;
                if (pending_ == 0)
                    return true;
                span = RawSpan {std::string_view {start, static_cast<std::size_t>(pos_ - start)}, HasEscape::None};
            }

            for (const std::size_t slot : node.slots)
                out[slot] = span;
            pending_ -= node.slots.size();
            return true;
        }

        // Duplicate keys: the first occurrence resolves the child, later ones are skipped.
        template <bool Checked>
        [[nodiscard]] bool walk_object(const PointerTree& tree, const PointerTree::Node& node, std::vector<RawSpan>& out) {
            ++pos_;
            std::size_t remain = node.keys.size();

            int c = skip_space();
            if (c == '}')
                return fail(ErrorCode::GetInEmptyObject, pos_ - 1);

            for (;;) {
                if (c != '"')
                    return fail_token(ErrorCode::ExpectedObjectKeyOrEnd, c);
                std::string_view k;
                if (!parse_key(k, Checked))
                    return false;
                if (!parse_colon())
                    return false;

                const PointerTree::Node* child = tree.find_key(node, k);
                if (child && !resolved_[child->id]) {
                    resolved_[child->id] = 1;
                    --remain;
                    if (!walk_tree<Checked>(tree, *child, out))
                        return false;
                    if (pending_ == 0)
                        return true;
                } else {
                    RawSpan skipped;
                    if (!skip<Checked>(skipped))
                        return false;
                }

                c = skip_space();
                if (c == ',') {
                    c = skip_space();
                    if (c == '}')
                        return fail(ErrorCode::TrailingComma, pos_ - 1);
                    continue;
                }
                if (c == '}')
                    break;
                return fail_token(ErrorCode::ExpectedObjectCommaOrEnd, c);
            }

            return remain == 0 || fail(ErrorCode::GetUnknownKeyInObject, pos_ - 1);
        }

        template <bool Checked>
        [[nodiscard]] bool walk_array(const PointerTree& tree, const PointerTree::Node& node, std::vector<RawSpan>& out) {
            ++pos_;
            std::size_t remain = node.indices.size();

            if (peek_space() == ']') {
                ++pos_;
                return fail(ErrorCode::GetInEmptyArray, pos_ - 1);
            }

            for (std::size_t i = 0;; ++i) {
                if (const PointerTree::Node* child = tree.find_index(node, i)) {
                    --remain;
                    if (!walk_tree<Checked>(tree, *child, out))
                        return false;
                    if (pending_ == 0)
                        return true;
                } else {
                    RawSpan skipped;
                    if (!skip<Checked>(skipped))
                        return false;
                }

                const int c = skip_space();
                if (c == ']')
                    break;
                if (c != ',')
                    return fail_token(ErrorCode::ExpectedArrayCommaOrEnd, c);
                if constexpr (Checked) {
                    if (peek_space() == ']')
                        return fail(ErrorCode::TrailingComma, pos_);
                }
            }

            return remain == 0 || fail(ErrorCode::GetIndexOutOfArray, pos_ - 1);
        }

        const char* begin_ {};
        const char* end_ {};
        const char* pos_ {};
        char* mutable_begin_ {};
        const detail::ScanKernel* kernel_ {&detail::active_kernel()};
        ParseError err_ {};
        std::string scratch_ {};
        bool strict_utf8_ {true};
        std::uint32_t max_depth_ {kDefaultMaxDepth};

        // Non-space bitmap of the last fully scanned window and its offset.
        std::uint64_t nospace_bits_ {};
        std::ptrdiff_t nospace_start_ {kNoWindow};

        std::vector<std::uint8_t> resolved_ {};
        std::size_t pending_ {};
    };

    // Recursive mode over json, followed by the trailing-character check.
    template <JsonVisitor V>
    [[nodiscard]] ParseError sax_parse(const std::string_view json, V& vis, const std::uint32_t max_depth = kDefaultMaxDepth) {
        Parser p {json};
        p.set_max_depth(max_depth);
        if (p.parse_value(vis))
            (void)p.parse_trailing();
        return p.error();
    }

    [[nodiscard]] inline ParseError validate(const std::string_view json) {
        Parser p {json};
        detail::IgnoreVisitor vis;
        if (p.parse_document(vis))
            (void)p.parse_trailing();
        return p.error();
    }

    // Structure only: delimiters are balanced and a single value spans the input.
    [[nodiscard]] inline ParseError validate_unchecked(const std::string_view json) {
        Parser p {json, false};
        RawSpan span;
        if (p.skip_one_unchecked(span))
            (void)p.parse_trailing();
        return p.error();
    }

} // namespace sjson

#endif // SJSON_PARSER_HPP
