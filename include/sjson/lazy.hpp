/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_LAZY_HPP
#define SJSON_LAZY_HPP

#pragma once
#include <sjson/config.hpp>
#include <sjson/error.hpp>
#include <sjson/number.hpp>
#include <sjson/parser.hpp>
#include <sjson/pointer.hpp>
#include <sjson/string.hpp>
#include <sjson/value.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sjson {

    template <class Storage>
    class BasicLazyValue;

    // Borrows the input it was taken from.
    using LazyValue = BasicLazyValue<std::string_view>;

    // Owns a copy of its text.
    using OwnedLazyValue = BasicLazyValue<std::string>;

    // Unparsed value text. Typed accessors parse on demand; the unescaped form of a string is
    // computed at most once and shared by all readers.
    template <class Storage>
    class BasicLazyValue {
    public:
        BasicLazyValue() = default;

        BasicLazyValue(Storage raw, const HasEscape escape): raw_(std::move(raw)), escape_(escape) { }

        BasicLazyValue(const BasicLazyValue& o): raw_(o.raw_), escape_(o.escape_) { }

        BasicLazyValue(BasicLazyValue&& o) noexcept: raw_(std::move(o.raw_)), escape_(o.escape_), cache_(o.cache_.exchange(nullptr)) { }

        BasicLazyValue& operator=(const BasicLazyValue& o) {
            if (this != &o) {
                raw_ = o.raw_;
                escape_ = o.escape_;
                delete cache_.exchange(nullptr);
            }
            return *this;
        }

        BasicLazyValue& operator=(BasicLazyValue&& o) noexcept {
            if (this != &o) {
                raw_ = std::move(o.raw_);
                escape_ = o.escape_;
                delete cache_.exchange(o.cache_.exchange(nullptr));
            }
            return *this;
        }

        ~BasicLazyValue() {
            delete cache_.load(std::memory_order_acquire);
        }

        [[nodiscard]] std::string_view raw() const noexcept {
            return std::string_view {raw_};
        }

        [[nodiscard]] HasEscape escape() const noexcept {
            return escape_;
        }

        // Decided by the first byte; the rest is only looked at by the accessors.
        [[nodiscard]] Type type() const noexcept {
            const std::string_view r = raw();
            if (r.empty())
                return Type::Null;
            switch (r.front()) {
            case '"':
                return Type::String;
            case '{':
                return Type::Object;
            case '[':
                return Type::Array;
            case 't':
            case 'f':
                return Type::Bool;
            case 'n':
                return Type::Null;
            default:
                return Type::Number;
            }
        }

        [[nodiscard]] bool is_null() const noexcept {
            return raw() == "null";
        }
        [[nodiscard]] bool is_bool() const noexcept {
            return type() == Type::Bool;
        }
        [[nodiscard]] bool is_number() const noexcept {
            return !raw().empty() && type() == Type::Number;
        }
        [[nodiscard]] bool is_string() const noexcept {
            return type() == Type::String;
        }
        [[nodiscard]] bool is_array() const noexcept {
            return type() == Type::Array;
        }
        [[nodiscard]] bool is_object() const noexcept {
            return type() == Type::Object;
        }

        [[nodiscard]] std::optional<bool> as_bool() const noexcept {
            if (raw() == "true")
                return true;
            if (raw() == "false")
                return false;
            return std::nullopt;
        }

        [[nodiscard]] std::optional<Number> as_number() const noexcept {
            if (!is_number())
                return std::nullopt;
            Number n;
            if (parse_number(raw(), n) != ErrorCode::None)
                return std::nullopt;
            return n;
        }

        [[nodiscard]] std::optional<std::uint64_t> as_u64() const noexcept {
            const auto n = as_number();
            return n ? n->as_u64() : std::nullopt;
        }

        [[nodiscard]] std::optional<std::int64_t> as_i64() const noexcept {
            const auto n = as_number();
            return n ? n->as_i64() : std::nullopt;
        }

        [[nodiscard]] std::optional<double> as_f64() const noexcept {
            const auto n = as_number();
            return n ? n->as_f64() : std::nullopt;
        }

        // Unescaped string contents. Without escapes this is a view into raw(); otherwise it
        // views the cached decoded copy, which lives as long as this value.
        [[nodiscard]] std::optional<std::string_view> as_str() const {
            if (!is_string())
                return std::nullopt;

            const std::string_view r = raw();
            if (escape_ == HasEscape::None) {
                if (r.size() < 2 || r.back() != '"')
                    return std::nullopt;
                return r.substr(1, r.size() - 2);
            }

            if (const std::string* cached = cache_.load(std::memory_order_acquire))
                return std::string_view {*cached};

            auto fresh = std::make_unique<std::string>();
            if (unescape(r, *fresh) != ErrorCode::None)
                return std::nullopt;

            std::string* expected = nullptr;
            if (cache_.compare_exchange_strong(expected, fresh.get(), std::memory_order_acq_rel, std::memory_order_acquire))
                return std::string_view {*fresh.release()};
            return std::string_view {*expected};
        }

        // Member of an object value, read from raw() without building a tree.
        [[nodiscard]] std::optional<LazyValue> get(const std::string_view key, ParseError* err = nullptr) const {
            const PathItem item {key};
            return pointer(std::span<const PathItem> {&item, 1}, err);
        }

        [[nodiscard]] std::optional<LazyValue> get(const std::size_t index, ParseError* err = nullptr) const {
            const PathItem item {index};
            return pointer(std::span<const PathItem> {&item, 1}, err);
        }

        [[nodiscard]] std::optional<LazyValue> pointer(std::span<const PathItem> path, ParseError* err = nullptr) const;

        [[nodiscard]] std::optional<LazyValue> pointer(const std::initializer_list<PathItem> path, ParseError* err = nullptr) const {
            return pointer(std::span<const PathItem> {path.begin(), path.size()}, err);
        }

        // Builds a Document from raw().
        [[nodiscard]] Document parse() const {
            return Document::parse(raw());
        }

        [[nodiscard]] OwnedLazyValue to_owned() const {
            return OwnedLazyValue {std::string {raw()}, escape_};
        }

    private:
        Storage raw_ {};
        HasEscape escape_ {HasEscape::None};
        mutable std::atomic<std::string*> cache_ {nullptr};
    };

    // Steps through the members of an object without materializing it. After an error or the
    // closing brace next() keeps returning nullopt.
    class ObjectIter {
    public:
        ObjectIter(const std::string_view json, const bool checked) noexcept: parser_(json, checked), checked_(checked) { }

        [[nodiscard]] std::optional<std::pair<std::string, LazyValue>> next() {
            if (done_)
                return std::nullopt;

            std::string_view key;
            RawSpan span;
            bool end = false;
            if (!parser_.next_object_entry(first_, checked_, key, span, end) || end) {
                done_ = true;
                return std::nullopt;
            }
            first_ = false;
            return std::pair<std::string, LazyValue> {std::string {key}, LazyValue {span.raw, span.escape}};
        }

        [[nodiscard]] bool ok() const noexcept {
            return parser_.ok();
        }

        [[nodiscard]] const ParseError& error() const noexcept {
            return parser_.error();
        }

    private:
        Parser parser_;
        bool checked_ {};
        bool first_ {true};
        bool done_ {};
    };

    class ArrayIter {
    public:
        ArrayIter(const std::string_view json, const bool checked) noexcept: parser_(json, checked), checked_(checked) { }

        [[nodiscard]] std::optional<LazyValue> next() {
            if (done_)
                return std::nullopt;

            RawSpan span;
            bool end = false;
            if (!parser_.next_array_elem(first_, checked_, span, end) || end) {
                done_ = true;
                return std::nullopt;
            }
            first_ = false;
            return LazyValue {span.raw, span.escape};
        }

        [[nodiscard]] bool ok() const noexcept {
            return parser_.ok();
        }

        [[nodiscard]] const ParseError& error() const noexcept {
            return parser_.error();
        }

    private:
        Parser parser_;
        bool checked_ {};
        bool first_ {true};
        bool done_ {};
    };

} // namespace sjson

namespace sjson::detail {

    template <bool Checked>
    [[nodiscard]] std::optional<LazyValue> lazy_get(const std::string_view json, const std::span<const PathItem> path, ParseError* err) {
        Parser p {json, Checked};
        RawSpan span;
        const bool ok = Checked ? p.get_from(path, span) : p.get_from_unchecked(path, span);
        if (err)
            *err = p.error();
        if (!ok)
            return std::nullopt;
        return LazyValue {span.raw, span.escape};
    }

    template <bool Checked>
    [[nodiscard]] std::optional<std::vector<LazyValue>> lazy_get_many(const std::string_view json, const PointerTree& tree, ParseError* err) {
        Parser p {json, Checked};
        std::vector<RawSpan> spans;
        const bool ok = p.get_many(tree, Checked, spans);
        if (err)
            *err = p.error();
        if (!ok)
            return std::nullopt;

        std::vector<LazyValue> out;
        out.reserve(spans.size());
        for (const auto& s : spans)
            out.emplace_back(s.raw, s.escape);
        return out;
    }

} // namespace sjson::detail

namespace sjson {

    template <class Storage>
    std::optional<LazyValue> BasicLazyValue<Storage>::pointer(const std::span<const PathItem> path, ParseError* err) const {
        return detail::lazy_get<true>(raw(), path, err);
    }

    // Value at path. Only the bytes up to the end of the target are read, so input after it
    // is not validated.
    [[nodiscard]] inline std::optional<LazyValue> get(const std::string_view json, const std::span<const PathItem> path, ParseError* err = nullptr) {
        return detail::lazy_get<true>(json, path, err);
    }

    [[nodiscard]] inline std::optional<LazyValue> get(const std::string_view json, const std::initializer_list<PathItem> path, ParseError* err = nullptr) {
        return get(json, std::span<const PathItem> {path.begin(), path.size()}, err);
    }

    // As get, skipping siblings by delimiter counting. Invalid input may yield a wrong value
    // instead of an error.
    [[nodiscard]] inline std::optional<LazyValue> get_unchecked(const std::string_view json, const std::span<const PathItem> path, ParseError* err = nullptr) {
        return detail::lazy_get<false>(json, path, err);
    }

    [[nodiscard]] inline std::optional<LazyValue> get_unchecked(const std::string_view json, const std::initializer_list<PathItem> path, ParseError* err = nullptr) {
        return get_unchecked(json, std::span<const PathItem> {path.begin(), path.size()}, err);
    }

    [[nodiscard]] inline std::optional<OwnedLazyValue> get_owned(const std::string_view json, const std::span<const PathItem> path, ParseError* err = nullptr) {
        auto v = get(json, path, err);
        if (!v)
            return std::nullopt;
        return v->to_owned();
    }

    [[nodiscard]] inline std::optional<OwnedLazyValue> get_owned(const std::string_view json, const std::initializer_list<PathItem> path, ParseError* err = nullptr) {
        return get_owned(json, std::span<const PathItem> {path.begin(), path.size()}, err);
    }

    // One pass for every path of tree; result i belongs to the i-th path added.
    [[nodiscard]] inline std::optional<std::vector<LazyValue>> get_many(const std::string_view json, const PointerTree& tree, ParseError* err = nullptr) {
        return detail::lazy_get_many<true>(json, tree, err);
    }

    [[nodiscard]] inline std::optional<std::vector<LazyValue>> get_many_unchecked(const std::string_view json, const PointerTree& tree, ParseError* err = nullptr) {
        return detail::lazy_get_many<false>(json, tree, err);
    }

    [[nodiscard]] inline ObjectIter to_object_iter(const std::string_view json) noexcept {
        return ObjectIter {json, true};
    }

    [[nodiscard]] inline ObjectIter to_object_iter_unchecked(const std::string_view json) noexcept {
        return ObjectIter {json, false};
    }

    [[nodiscard]] inline ArrayIter to_array_iter(const std::string_view json) noexcept {
        return ArrayIter {json, true};
    }

    [[nodiscard]] inline ArrayIter to_array_iter_unchecked(const std::string_view json) noexcept {
        return ArrayIter {json, false};
    }

} // namespace sjson

#endif // SJSON_LAZY_HPP
