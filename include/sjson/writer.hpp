/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_WRITER_HPP
#define SJSON_WRITER_HPP

#pragma once
#include <sjson/config.hpp>
#include <sjson/detail/stack.hpp>
#include <sjson/error.hpp>
#include <sjson/sink.hpp>
#include <sjson/string.hpp>
#include <sjson/value.hpp>

#include <charconv>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace sjson {

    // Scalar output shared by the formatters.
    struct BasicFormatter {
        template <OutputSink S>
        [[nodiscard]] bool write_null(S& sink) {
            return put_str(sink, "null");
        }

        template <OutputSink S>
        [[nodiscard]] bool write_bool(S& sink, const bool b) {
            return put_str(sink, b ? "true" : "false");
        }

        template <OutputSink S>
        [[nodiscard]] bool write_u64(S& sink, const std::uint64_t v) {
            char* dst = sink.reserve(20);
            if (!dst)
                return false;
            const auto [p, ec] = std::to_chars(dst, dst + 20, v);
            if (ec != std::errc {})
                return false;
            sink.commit(static_cast<std::size_t>(p - dst));
            return true;
        }

        template <OutputSink S>
        [[nodiscard]] bool write_i64(S& sink, const std::int64_t v) {
            char* dst = sink.reserve(20);
            if (!dst)
                return false;
            const auto [p, ec] = std::to_chars(dst, dst + 20, v);
            if (ec != std::errc {})
                return false;
            sink.commit(static_cast<std::size_t>(p - dst));
            return true;
        }

        // Shortest round-trip form. ".0" is appended when the text would read back as an
        // integer. d must be finite.
        template <OutputSink S>
        [[nodiscard]] bool write_f64(S& sink, const double d) {
            char* dst = sink.reserve(32);
            if (!dst)
                return false;
            const auto [p, ec] = std::to_chars(dst, dst + 30, d);
            if (ec != std::errc {})
                return false;

            auto n = static_cast<std::size_t>(p - dst);
            if (std::memchr(dst, '.', n) == nullptr && std::memchr(dst, 'e', n) == nullptr) {
                dst[n++] = '.';
                dst[n++] = '0';
            }
            sink.commit(n);
            return true;
        }

        template <OutputSink S>
        [[nodiscard]] bool write_string(S& sink, const std::string_view s) {
            return escape_string(sink, s);
        }
    };

    template <class F, class S>
    concept Formatter = OutputSink<S> && requires(F& f, S& s, bool b, std::string_view str) {
        { f.begin_array(s) } -> std::same_as<bool>;
        { f.end_array(s, b) } -> std::same_as<bool>;
        { f.begin_array_value(s, b) } -> std::same_as<bool>;
        { f.end_array_value(s) } -> std::same_as<bool>;
        { f.begin_object(s) } -> std::same_as<bool>;
        { f.end_object(s, b) } -> std::same_as<bool>;
        { f.begin_object_key(s, b) } -> std::same_as<bool>;
        { f.end_object_key(s) } -> std::same_as<bool>;
        { f.begin_object_value(s) } -> std::same_as<bool>;
        { f.end_object_value(s) } -> std::same_as<bool>;
        { f.write_null(s) } -> std::same_as<bool>;
        { f.write_string(s, str) } -> std::same_as<bool>;
    };

    struct CompactFormatter : BasicFormatter {
        template <OutputSink S>
        [[nodiscard]] bool begin_array(S& sink) {
            return put_char(sink, '[');
        }

        template <OutputSink S>
        [[nodiscard]] bool end_array(S& sink, bool) {
            return put_char(sink, ']');
        }

        template <OutputSink S>
        [[nodiscard]] bool begin_array_value(S& sink, const bool first) {
            return first || put_char(sink, ',');
        }

        template <OutputSink S>
        [[nodiscard]] bool end_array_value(S&) {
            return true;
        }

        template <OutputSink S>
        [[nodiscard]] bool begin_object(S& sink) {
            return put_char(sink, '{');
        }

        template <OutputSink S>
        [[nodiscard]] bool end_object(S& sink, bool) {
            return put_char(sink, '}');
        }

        template <OutputSink S>
        [[nodiscard]] bool begin_object_key(S& sink, const bool first) {
            return first || put_char(sink, ',');
        }

        template <OutputSink S>
        [[nodiscard]] bool end_object_key(S&) {
            return true;
        }

        template <OutputSink S>
        [[nodiscard]] bool begin_object_value(S& sink) {
            return put_char(sink, ':');
        }

        template <OutputSink S>
        [[nodiscard]] bool end_object_value(S&) {
            return true;
        }
    };

    // One entry per line, nested levels indented by indent spaces. Empty containers stay
    // on one line.
    class PrettyFormatter : public BasicFormatter {
    public:
        explicit PrettyFormatter(const std::size_t indent = 2) noexcept: indent_(indent) { }

        template <OutputSink S>
        [[nodiscard]] bool begin_array(S& sink) {
            ++level_;
            return put_char(sink, '[');
        }

        template <OutputSink S>
        [[nodiscard]] bool end_array(S& sink, const bool empty) {
            --level_;
            if (!empty && !newline(sink))
                return false;
            return put_char(sink, ']');
        }

        template <OutputSink S>
        [[nodiscard]] bool begin_array_value(S& sink, const bool first) {
            if (!first && !put_char(sink, ','))
                return false;
            return newline(sink);
        }

        template <OutputSink S>
        [[nodiscard]] bool end_array_value(S&) {
            return true;
        }

        template <OutputSink S>
        [[nodiscard]] bool begin_object(S& sink) {
            ++level_;
            return put_char(sink, '{');
        }

        template <OutputSink S>
        [[nodiscard]] bool end_object(S& sink, const bool empty) {
            --level_;
            if (!empty && !newline(sink))
                return false;
            return put_char(sink, '}');
        }

        template <OutputSink S>
        [[nodiscard]] bool begin_object_key(S& sink, const bool first) {
            if (!first && !put_char(sink, ','))
                return false;
            return newline(sink);
        }

        template <OutputSink S>
        [[nodiscard]] bool end_object_key(S&) {
            return true;
        }

        template <OutputSink S>
        [[nodiscard]] bool begin_object_value(S& sink) {
            return put_str(sink, ": ");
        }

        template <OutputSink S>
        [[nodiscard]] bool end_object_value(S&) {
            return true;
        }

    private:
        template <OutputSink S>
        [[nodiscard]] bool newline(S& sink) {
            const std::size_t n = 1 + level_ * indent_;
            char* dst = sink.reserve(n);
            if (!dst)
                return false;
            dst[0] = '\n';
            std::memset(dst + 1, ' ', n - 1);
            sink.commit(n);
            return true;
        }

        std::size_t indent_ {};
        std::size_t level_ {};
    };

    // Serializes a tree with an explicit frame stack, so depth is unbounded unless max_depth
    // says otherwise. Errors: WriterOverflow when the sink is full, ToCharsFailed for
    // non-finite floats, EncodeDepthExceeded past max_depth.
    template <OutputSink Sink, class Fmt = CompactFormatter>
        requires Formatter<Fmt, Sink>
    class Writer {
    public:
        explicit Writer(Sink sink, Fmt fmt = Fmt {}, const std::size_t max_depth = kUnboundedDepth)
            : sink_(std::move(sink)), fmt_(std::move(fmt)), max_depth_(max_depth) { }

        Writer(const Writer&) = delete;
        Writer& operator=(const Writer&) = delete;

        [[nodiscard]] bool write(const ValueRef& v) {
            if (!v.valid())
                return write_scalar(Value {});
            if (!v.raw()->is_container())
                return write_scalar(*v.raw());
            return write_tree(*v.raw());
        }

        [[nodiscard]] auto finish() {
            return sink_.finish();
        }

        [[nodiscard]] const ParseError& error() const noexcept {
            return err_;
        }

        [[nodiscard]] Sink& sink() noexcept {
            return sink_;
        }

    private:
        struct Frame {
            const Value* next {};
            std::size_t remaining {};
            bool object {};
            bool first {};
        };

        [[nodiscard]] bool fail(const ErrorCode code) noexcept {
            err_.set(code);
            return false;
        }

        [[nodiscard]] bool write_scalar(const Value& v) {
            bool ok = true;
            switch (v.kind()) {
            case detail::Kind::Null:
                ok = fmt_.write_null(sink_);
                break;
            case detail::Kind::Bool:
                ok = fmt_.write_bool(sink_, v.boolean());
                break;
            case detail::Kind::Unsigned:
                ok = fmt_.write_u64(sink_, v.number().u);
                break;
            case detail::Kind::Signed:
                ok = fmt_.write_i64(sink_, v.number().i);
                break;
            case detail::Kind::Float: {
                const double d = v.number().d;
                if (!std::isfinite(d))
                    return fail(ErrorCode::ToCharsFailed);
                ok = fmt_.write_f64(sink_, d);
                break;
            }
            case detail::Kind::String:
                ok = fmt_.write_string(sink_, v.str());
                break;
            case detail::Kind::Array:
            case detail::Kind::Object:
                break;
            }
            return ok || fail(ErrorCode::WriterOverflow);
        }

        [[nodiscard]] bool open(const Value& v) {
            if (stack_.size() + 1 > max_depth_)
                return fail(ErrorCode::EncodeDepthExceeded);

            const bool object = v.kind() == detail::Kind::Object;
            if (!(object ? fmt_.begin_object(sink_) : fmt_.begin_array(sink_)))
                return fail(ErrorCode::WriterOverflow);

            return stack_.push(Frame {v.kids(), v.length(), object, true}) || fail(ErrorCode::AllocFailed);
        }

        [[nodiscard]] bool write_tree(const Value& root) {
            if (!open(root))
                return false;

            while (!stack_.empty()) {
                Frame& f = stack_.top();

                if (f.remaining == 0) {
                    const bool object = f.object;
                    const bool empty = f.first;
                    stack_.pop();
                    if (!(object ? fmt_.end_object(sink_, empty) : fmt_.end_array(sink_, empty)))
                        return fail(ErrorCode::WriterOverflow);
                    if (!stack_.empty() && !close_entry(stack_.top()))
                        return false;
                    continue;
                }

                const bool first = f.first;
                f.first = false;
                --f.remaining;

                const Value* child = f.next;
                if (f.object) {
                    if (!fmt_.begin_object_key(sink_, first) || !fmt_.write_string(sink_, child->str()) || !fmt_.end_object_key(sink_)
                        || !fmt_.begin_object_value(sink_))
                        return fail(ErrorCode::WriterOverflow);
                    ++child;
                } else if (!fmt_.begin_array_value(sink_, first)) {
                    return fail(ErrorCode::WriterOverflow);
                }
                f.next = child + 1;

                if (child->is_container()) {
                    if (!open(*child))
                        return false;
                    continue;
                }

                if (!write_scalar(*child) || !close_entry(f))
                    return false;
            }
            return true;
        }

        [[nodiscard]] bool close_entry(const Frame& f) {
            const bool ok = f.object ? fmt_.end_object_value(sink_) : fmt_.end_array_value(sink_);
            return ok || fail(ErrorCode::WriterOverflow);
        }

        Sink sink_;
        Fmt fmt_;
        std::size_t max_depth_ {};
        ParseError err_ {};
        detail::InlineStack<Frame, 64> stack_ {};
    };

    // Empty string on failure; err, when given, receives the reason.
    [[nodiscard]] inline std::string encode(const ValueRef& v, const bool pretty = false, ParseError* err = nullptr) {
        std::string out;
        ParseError e;
        if (pretty) {
            Writer<StringSink, PrettyFormatter> w {StringSink {}};
            if (w.write(v))
                out = w.finish();
            e = w.error();
        } else {
            Writer<StringSink, CompactFormatter> w {StringSink {}};
            if (w.write(v))
                out = w.finish();
            e = w.error();
        }
        if (err)
            *err = e;
        return out;
    }

    [[nodiscard]] inline std::string encode(const Document& doc, const bool pretty = false, ParseError* err = nullptr) {
        return encode(doc.root(), pretty, err);
    }

} // namespace sjson

#endif // SJSON_WRITER_HPP
