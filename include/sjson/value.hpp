/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_VALUE_HPP
#define SJSON_VALUE_HPP

#pragma once
#include <sjson/arena.hpp>
#include <sjson/config.hpp>
#include <sjson/detail/stack.hpp>
#include <sjson/detail/utf8.hpp>
#include <sjson/error.hpp>
#include <sjson/number.hpp>
#include <sjson/parser.hpp>
#include <sjson/pointer.hpp>

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <new>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace sjson {

    enum class Type : std::uint8_t {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    enum class StringStorage : std::uint8_t {
        Arena,
        Borrowed,
        Static
    };

} // namespace sjson

namespace sjson::detail {

    enum class Kind : std::uint8_t {
        Null,
        Bool,
        Unsigned,
        Signed,
        Float,
        String,
        Array,
        Object
    };

    // Precedes every children block. cap counts entries (elements of an array, members of an
    // object); epoch is the share epoch the block was made private under, 0 for none.
    struct ChildrenHeader {
        std::size_t cap {};
        std::uint64_t epoch {};
    };

    static_assert(sizeof(ChildrenHeader) == 16);

} // namespace sjson::detail

namespace sjson {

    // 16-byte tagged node. The meta word holds the kind in bits 0-3, flags in bits 4-7 and the
    // length (string bytes, array elements or object members) above. Object children are
    // stored as key, value pairs.
    class Value {
    public:
        static constexpr std::size_t kMaxLength = (std::size_t {1} << 56) - 1;

        Value() noexcept = default;

        [[nodiscard]] static Value make_bool(const bool b) noexcept {
            Value v;
            v.meta_ = pack(detail::Kind::Bool, 0, 0);
            v.b_ = b;
            return v;
        }

        [[nodiscard]] static Value make_number(const Number& n) noexcept {
            Value v;
            switch (n.kind) {
            case NumberKind::Unsigned:
                v.meta_ = pack(detail::Kind::Unsigned, 0, 0);
                v.u_ = n.u;
                break;
            case NumberKind::Signed:
                v.meta_ = pack(detail::Kind::Signed, 0, 0);
                v.i_ = n.i;
                break;
            case NumberKind::Float:
                v.meta_ = pack(detail::Kind::Float, 0, 0);
                v.d_ = n.d;
                break;
            }
            return v;
        }

        [[nodiscard]] static Value make_string(const char* p, const std::size_t n, const StringStorage storage) noexcept {
            Value v;
            v.meta_ = pack(detail::Kind::String, static_cast<std::uint8_t>(storage), n);
            v.str_ = p;
            return v;
        }

        [[nodiscard]] static Value make_array(Value* kids, const std::size_t len) noexcept {
            Value v;
            v.meta_ = pack(detail::Kind::Array, 0, len);
            v.kids_ = kids;
            return v;
        }

        [[nodiscard]] static Value make_object(Value* kids, const std::size_t len) noexcept {
            Value v;
            v.meta_ = pack(detail::Kind::Object, 0, len);
            v.kids_ = kids;
            return v;
        }

        [[nodiscard]] SJSON_FORCEINLINE detail::Kind kind() const noexcept {
            return static_cast<detail::Kind>(meta_ & 0xFu);
        }

        [[nodiscard]] Type type() const noexcept {
            switch (kind()) {
            case detail::Kind::Null:
                return Type::Null;
            case detail::Kind::Bool:
                return Type::Bool;
            case detail::Kind::Unsigned:
            case detail::Kind::Signed:
            case detail::Kind::Float:
                return Type::Number;
            case detail::Kind::String:
                return Type::String;
            case detail::Kind::Array:
                return Type::Array;
            case detail::Kind::Object:
                return Type::Object;
            }
            return Type::Null;
        }

        [[nodiscard]] SJSON_FORCEINLINE bool is_container() const noexcept {
            return kind() == detail::Kind::Array || kind() == detail::Kind::Object;
        }

        [[nodiscard]] SJSON_FORCEINLINE std::size_t length() const noexcept {
            return static_cast<std::size_t>(meta_ >> 8);
        }

        [[nodiscard]] StringStorage storage() const noexcept {
            return static_cast<StringStorage>((meta_ >> 4) & 0xFu);
        }

        [[nodiscard]] bool boolean() const noexcept {
            return b_;
        }

        [[nodiscard]] Number number() const noexcept {
            switch (kind()) {
            case detail::Kind::Signed:
                return Number::from_i64(i_);
            case detail::Kind::Float:
                return Number::from_f64(d_);
            default:
                return Number::from_u64(u_);
            }
        }

        [[nodiscard]] std::string_view str() const noexcept {
            return {str_, length()};
        }

        [[nodiscard]] SJSON_FORCEINLINE Value* kids() const noexcept {
            return kids_;
        }

        // Values per entry: 1 for arrays, 2 for objects.
        [[nodiscard]] SJSON_FORCEINLINE std::size_t width() const noexcept {
            return kind() == detail::Kind::Object ? 2 : 1;
        }

        SJSON_FORCEINLINE void set_length(const std::size_t n) noexcept {
            meta_ = (meta_ & 0xFFu) | (static_cast<std::uint64_t>(n) << 8);
        }

        SJSON_FORCEINLINE void set_kids(Value* kids) noexcept {
            kids_ = kids;
        }

    private:
        [[nodiscard]] static constexpr std::uint64_t pack(const detail::Kind k, const std::uint8_t flags, const std::size_t len) noexcept {
            return static_cast<std::uint64_t>(k) | static_cast<std::uint64_t>(flags & 0xFu) << 4 | static_cast<std::uint64_t>(len) << 8;
        }

        std::uint64_t meta_ {};

        union {
            bool b_;
            std::uint64_t u_ {};
            std::int64_t i_;
            double d_;
            const char* str_;
            Value* kids_;
        };
    };

    static_assert(sizeof(Value) == 16);
    static_assert(std::is_trivially_copyable_v<Value>);

} // namespace sjson

namespace sjson::detail {

    [[nodiscard]] SJSON_FORCEINLINE ChildrenHeader* header_of(Value* kids) noexcept {
        return reinterpret_cast<ChildrenHeader*>(kids) - 1;
    }

    [[nodiscard]] SJSON_FORCEINLINE std::size_t capacity_of(const Value& v) noexcept {
        return v.kids() ? header_of(v.kids())->cap : 0;
    }

    // Children block for cap entries of width values each. nullptr when out of memory.
    [[nodiscard]] inline Value* alloc_children(SharedArena& arena, const std::size_t cap, const std::size_t width, const std::uint64_t epoch) {
        if (cap > (Value::kMaxLength / width))
            return nullptr;
        const std::size_t bytes = sizeof(ChildrenHeader) + cap * width * sizeof(Value);
        void* mem = arena.alloc(bytes, alignof(ChildrenHeader));
        if (!mem)
            return nullptr;
        auto* h = std::construct_at(static_cast<ChildrenHeader*>(mem), ChildrenHeader {cap, epoch});
        return reinterpret_cast<Value*>(h + 1);
    }

    // Whether the children block of v is referenced from v alone.
    [[nodiscard]] inline bool owns_children(const SharedArena& arena, const Value& v) noexcept {
        if (!v.kids() || arena.exclusive())
            return true;
        const std::uint64_t epoch = header_of(v.kids())->epoch;
        return epoch != 0 && epoch == arena.epoch();
    }

    // Gives v a children block of at least cap entries that nothing else references.
    [[nodiscard]] inline bool make_children_private(SharedArena& arena, Value& v, std::size_t cap) {
        if (owns_children(arena, v) && capacity_of(v) >= cap && (cap == 0 || v.kids()))
            return true;

        cap = std::max(cap, capacity_of(v));
        if (cap == 0)
            return true;

        const std::size_t w = v.width();
        Value* kids = alloc_children(arena, cap, w, arena.epoch());
        if (!kids)
            return false;
        if (v.length())
            std::memcpy(static_cast<void*>(kids), v.kids(), v.length() * w * sizeof(Value));
        v.set_kids(kids);
        return true;
    }

    // Rewrites v so that every arena string and children block it reaches lives in arena.
    // Borrowed and static strings are kept as they are.
    [[nodiscard]] inline bool deep_copy(SharedArena& arena, Value& v) {
        InlineStack<Value*, 32> work;
        if (!work.push(&v))
            return false;

        while (!work.empty()) {
            Value* cur = work.top();
            work.pop();

            if (cur->kind() == Kind::String) {
                if (cur->storage() != StringStorage::Arena)
                    continue;
                const std::string_view s = cur->str();
                const char* p = arena.copy_string(s);
                if (!p)
                    return false;
                *cur = Value::make_string(p, s.size(), StringStorage::Arena);
                continue;
            }

            if (!cur->is_container() || cur->length() == 0) {
                if (cur->is_container())
                    cur->set_kids(nullptr);
                continue;
            }

            const std::size_t n = cur->length() * cur->width();
            Value* kids = alloc_children(arena, cur->length(), cur->width(), arena.epoch());
            if (!kids)
                return false;
            std::memcpy(static_cast<void*>(kids), cur->kids(), n * sizeof(Value));
            cur->set_kids(kids);

            for (std::size_t i = 0; i < n; ++i) {
                const Kind k = kids[i].kind();
                if ((k == Kind::String || k == Kind::Array || k == Kind::Object) && !work.push(&kids[i]))
                    return false;
            }
        }
        return true;
    }

} // namespace sjson::detail

namespace sjson {

    class ValueRef;

    [[nodiscard]] inline bool operator==(const ValueRef& a, const ValueRef& b) noexcept;

    // Read-only view of a node and the arena it lives in. Views stay valid while the owning
    // Document lives and the node is not mutated.
    class ValueRef {
    public:
        class ArrayItems;
        class ObjectMembers;

        ValueRef() = default;
        ValueRef(const Value* v, SharedArena* arena) noexcept: v_(v), arena_(arena) { }

        [[nodiscard]] bool valid() const noexcept {
            return v_ != nullptr;
        }

        [[nodiscard]] explicit operator bool() const noexcept {
            return valid();
        }

        [[nodiscard]] const Value* raw() const noexcept {
            return v_;
        }

        [[nodiscard]] SharedArena* arena() const noexcept {
            return arena_;
        }

        [[nodiscard]] Type type() const noexcept {
            return v_ ? v_->type() : Type::Null;
        }

        [[nodiscard]] bool is_null() const noexcept {
            return v_ && v_->kind() == detail::Kind::Null;
        }
        [[nodiscard]] bool is_bool() const noexcept {
            return v_ && v_->kind() == detail::Kind::Bool;
        }
        [[nodiscard]] bool is_number() const noexcept {
            return v_ && v_->type() == Type::Number;
        }
        [[nodiscard]] bool is_u64() const noexcept {
            return v_ && v_->kind() == detail::Kind::Unsigned;
        }
        [[nodiscard]] bool is_i64() const noexcept {
            return v_ && v_->kind() == detail::Kind::Signed;
        }
        [[nodiscard]] bool is_f64() const noexcept {
            return v_ && v_->kind() == detail::Kind::Float;
        }
        [[nodiscard]] bool is_string() const noexcept {
            return v_ && v_->kind() == detail::Kind::String;
        }
        [[nodiscard]] bool is_array() const noexcept {
            return v_ && v_->kind() == detail::Kind::Array;
        }
        [[nodiscard]] bool is_object() const noexcept {
            return v_ && v_->kind() == detail::Kind::Object;
        }

        [[nodiscard]] std::optional<bool> as_bool() const noexcept {
            if (!is_bool())
                return std::nullopt;
            return v_->boolean();
        }

        [[nodiscard]] std::optional<Number> as_number() const noexcept {
            if (!is_number())
                return std::nullopt;
            return v_->number();
        }

        [[nodiscard]] std::optional<std::uint64_t> as_u64() const noexcept {
            if (!is_number())
                return std::nullopt;
            return v_->number().as_u64();
        }

        [[nodiscard]] std::optional<std::int64_t> as_i64() const noexcept {
            if (!is_number())
                return std::nullopt;
            return v_->number().as_i64();
        }

        [[nodiscard]] std::optional<double> as_f64() const noexcept {
            if (!is_number())
                return std::nullopt;
            return v_->number().as_f64();
        }

        [[nodiscard]] std::optional<std::string_view> as_string() const noexcept {
            if (!is_string())
                return std::nullopt;
            return v_->str();
        }

        // Elements of an array, members of an object, 0 otherwise.
        [[nodiscard]] std::size_t size() const noexcept {
            return v_ && v_->is_container() ? v_->length() : 0;
        }

        [[nodiscard]] bool empty() const noexcept {
            return size() == 0;
        }

        // Array element; an invalid view when out of range or not an array.
        [[nodiscard]] ValueRef at(const std::size_t i) const noexcept {
            if (!is_array() || i >= v_->length())
                return {};
            return ValueRef {v_->kids() + i, arena_};
        }

        [[nodiscard]] ValueRef operator[](const std::size_t i) const noexcept {
            assert(is_array() && i < v_->length());
            return at(i);
        }

        // Value of the first member named key.
        [[nodiscard]] ValueRef get(const std::string_view key) const noexcept {
            if (!is_object())
                return {};
            const Value* kids = v_->kids();
            for (std::size_t i = 0, n = v_->length(); i < n; ++i) {
                if (kids[2 * i].str() == key)
                    return ValueRef {kids + 2 * i + 1, arena_};
            }
            return {};
        }

        [[nodiscard]] ValueRef operator[](const std::string_view key) const noexcept {
            return get(key);
        }

        [[nodiscard]] bool contains(const std::string_view key) const noexcept {
            return get(key).valid();
        }

        [[nodiscard]] ValueRef pointer(const std::span<const PathItem> path) const noexcept {
            ValueRef cur = *this;
            for (const auto& item : path) {
                cur = item.is_key() ? cur.get(item.key()) : cur.at(item.index());
                if (!cur)
                    return {};
            }
            return cur;
        }

        [[nodiscard]] ValueRef pointer(const std::initializer_list<PathItem> path) const noexcept {
            return pointer(std::span<const PathItem> {path.begin(), path.size()});
        }

        [[nodiscard]] ArrayItems items() const noexcept;
        [[nodiscard]] ObjectMembers members() const noexcept;

    private:
        const Value* v_ {};
        SharedArena* arena_ {};
    };

    class ValueRef::ArrayItems {
    public:
        struct iterator {
            const Value* p {};
            SharedArena* arena {};

            [[nodiscard]] ValueRef operator*() const noexcept {
                return ValueRef {p, arena};
            }

            iterator& operator++() noexcept {
                ++p;
                return *this;
            }

            [[nodiscard]] bool operator==(const iterator& o) const noexcept {
                return p == o.p;
            }
        };

        ArrayItems() = default;
        ArrayItems(const Value* b, const std::size_t n, SharedArena* arena) noexcept: b_(b), n_(n), arena_(arena) { }

        [[nodiscard]] iterator begin() const noexcept {
            return {b_, arena_};
        }

        [[nodiscard]] iterator end() const noexcept {
            return {b_ + n_, arena_};
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return n_;
        }

    private:
        const Value* b_ {};
        std::size_t n_ {};
        SharedArena* arena_ {};
    };

    class ValueRef::ObjectMembers {
    public:
        struct iterator {
            const Value* p {};
            SharedArena* arena {};

            [[nodiscard]] std::pair<std::string_view, ValueRef> operator*() const noexcept {
                return {p[0].str(), ValueRef {p + 1, arena}};
            }

            iterator& operator++() noexcept {
                p += 2;
                return *this;
            }

            [[nodiscard]] bool operator==(const iterator& o) const noexcept {
                return p == o.p;
            }
        };

        ObjectMembers() = default;
        ObjectMembers(const Value* b, const std::size_t n, SharedArena* arena) noexcept: b_(b), n_(n), arena_(arena) { }

        [[nodiscard]] iterator begin() const noexcept {
            return {b_, arena_};
        }

        [[nodiscard]] iterator end() const noexcept {
            return {b_ + 2 * n_, arena_};
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return n_;
        }

    private:
        const Value* b_ {};
        std::size_t n_ {};
        SharedArena* arena_ {};
    };

    inline ValueRef::ArrayItems ValueRef::items() const noexcept {
        if (!is_array())
            return {};
        return {v_->kids(), v_->length(), arena_};
    }

    inline ValueRef::ObjectMembers ValueRef::members() const noexcept {
        if (!is_object())
            return {};
        return {v_->kids(), v_->length(), arena_};
    }

    // Structural equality. Objects match member by member through key lookup, the n-th
    // occurrence of a duplicate key on one side against the n-th on the other. Walks an
    // explicit stack, so nesting depth is bounded by memory only; reports false if that stack
    // cannot grow.
    inline bool operator==(const ValueRef& a, const ValueRef& b) noexcept {
        if (!a.valid() || !b.valid())
            return a.valid() == b.valid();

        struct Pair {
            const Value* x {};
            const Value* y {};
        };

        detail::InlineStack<Pair, 32> work;
        if (!work.push(Pair {a.raw(), b.raw()}))
            return false;

        while (!work.empty()) {
            const Pair top = work.top();
            work.pop();

            const Value& x = *top.x;
            const Value& y = *top.y;
            if (x.kind() != y.kind())
                return false;

            switch (x.kind()) {
            case detail::Kind::Null:
                break;
            case detail::Kind::Bool:
                if (x.boolean() != y.boolean())
                    return false;
                break;
            case detail::Kind::Unsigned:
            case detail::Kind::Signed:
            case detail::Kind::Float:
                if (!(x.number() == y.number()))
                    return false;
                break;
            case detail::Kind::String:
                if (x.str() != y.str())
                    return false;
                break;
            case detail::Kind::Array:
                if (x.length() != y.length())
                    return false;
                for (std::size_t i = 0; i < x.length(); ++i) {
                    if (!work.push(Pair {x.kids() + i, y.kids() + i}))
                        return false;
                }
                break;
            case detail::Kind::Object: {
                if (x.length() != y.length())
                    return false;
                const Value* xk = x.kids();
                const Value* yk = y.kids();
                const std::size_t n = x.length();
                for (std::size_t i = 0; i < n; ++i) {
                    const std::string_view key = xk[2 * i].str();
                    std::size_t occurrence = 0;
                    for (std::size_t j = 0; j < i; ++j) {
                        if (xk[2 * j].str() == key)
                            ++occurrence;
                    }

                    const Value* match = nullptr;
                    for (std::size_t j = 0; j < n; ++j) {
                        if (yk[2 * j].str() == key && occurrence-- == 0) {
                            match = yk + 2 * j + 1;
                            break;
                        }
                    }
                    if (!match || !work.push(Pair {xk + 2 * i + 1, match}))
                        return false;
                }
                break;
            }
            }
        }
        return true;
    }

    class Document;

    // Mutable handle to one slot of a Document tree. Children blocks are copied before they
    // are written when they may be reachable from elsewhere. A NodeRef is invalidated by any
    // operation that shares the arena (copying the Document, inserting a same-arena subtree).
    class NodeRef {
    public:
        NodeRef() = default;
        NodeRef(Value* slot, SharedArena* arena) noexcept: slot_(slot), arena_(arena) { }

        [[nodiscard]] bool ok() const noexcept {
            return slot_ && arena_;
        }

        [[nodiscard]] explicit operator bool() const noexcept {
            return ok();
        }

        [[nodiscard]] Value* raw() const noexcept {
            return slot_;
        }

        [[nodiscard]] ValueRef view() const noexcept {
            return ValueRef {slot_, arena_};
        }

        operator ValueRef() const noexcept { // NOLINT(google-explicit-constructor)
            return view();
        }

        [[nodiscard]] Type type() const noexcept {
            return view().type();
        }

        [[nodiscard]] bool is_null() const noexcept {
            return view().is_null();
        }
        [[nodiscard]] bool is_array() const noexcept {
            return view().is_array();
        }
        [[nodiscard]] bool is_object() const noexcept {
            return view().is_object();
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return view().size();
        }

        void set_null() const noexcept {
            if (slot_)
                *slot_ = Value {};
        }

        void set_bool(const bool b) const noexcept {
            if (slot_)
                *slot_ = Value::make_bool(b);
        }

        void set_number(const Number& n) const noexcept {
            if (slot_)
                *slot_ = Value::make_number(n);
        }

        // Copies s into the arena.
        [[nodiscard]] bool set_string(const std::string_view s) const {
            if (!ok() || s.size() > Value::kMaxLength)
                return false;
            const char* p = arena_->copy_string(s);
            if (!p)
                return false;
            *slot_ = Value::make_string(p, s.size(), StringStorage::Arena);
            return true;
        }

        // Zero-copy: s must outlive the document.
        void set_borrowed_string(const std::string_view s) const noexcept {
            if (slot_)
                *slot_ = Value::make_string(s.data(), s.size(), StringStorage::Borrowed);
        }

        void set_static_string(const std::string_view s) const noexcept {
            if (slot_)
                *slot_ = Value::make_string(s.data(), s.size(), StringStorage::Static);
        }

        [[nodiscard]] bool set_array(const std::size_t cap = 0) const {
            return set_container(detail::Kind::Array, cap);
        }

        [[nodiscard]] bool set_object(const std::size_t cap = 0) const {
            return set_container(detail::Kind::Object, cap);
        }

        // Assigns null, bool, integers, floats, Number, strings (copied), a ValueRef or a
        // Document. See push_back for how trees are brought in.
        template <class T>
        [[nodiscard]] bool set(T&& v) const;

        // Appends to an array; a null slot becomes an empty array first. Same-arena trees are
        // shared, foreign ones deep-copied, and a Document moved in keeps its arena alive
        // inside this one. Returns the new element, invalid on failure.
        template <class T>
        NodeRef push_back(T&& v) const;

        // Appends a member to an object even when key is already present.
        template <class T>
        NodeRef insert(std::string_view key, T&& v) const;

        NodeRef push_value(const ValueRef& v) const {
            return push_back(v);
        }

        NodeRef insert_value(const std::string_view key, const ValueRef& v) const {
            return insert(key, v);
        }

        // Removes the element (array) or member (object) at index.
        bool erase(std::size_t index) const;

        // Removes the first member named key.
        bool erase(std::string_view key) const;

        [[nodiscard]] bool reserve(std::size_t n) const;

        void clear() const noexcept {
            if (ok() && slot_->is_container())
                slot_->set_length(0);
        }

        // Array element, invalid when out of range.
        [[nodiscard]] NodeRef at(std::size_t i) const;

        // Value of the first member named key, invalid when absent.
        [[nodiscard]] NodeRef get(std::string_view key) const;

        // Creates the member as null when absent; a null slot becomes an object first.
        NodeRef operator[](std::string_view key) const;

        // Pads the array with nulls up to i; a null slot becomes an array first.
        NodeRef operator[](std::size_t i) const;

    private:
        [[nodiscard]] bool set_container(const detail::Kind k, const std::size_t cap) const {
            if (!ok())
                return false;
            Value* kids = nullptr;
            if (cap) {
                kids = detail::alloc_children(*arena_, cap, k == detail::Kind::Object ? 2 : 1, arena_->epoch());
                if (!kids)
                    return false;
            }
            *slot_ = k == detail::Kind::Object ? Value::make_object(kids, 0) : Value::make_array(kids, 0);
            return true;
        }

        // Room for one more entry, growing the block geometrically. Returns the entry slot.
        [[nodiscard]] Value* append_entry() const {
            Value& v = *slot_;
            const std::size_t len = v.length();
            const std::size_t cap = detail::capacity_of(v);
            const std::size_t want = len < cap ? cap : std::max<std::size_t>(4, cap * 2);
            if (!detail::make_children_private(*arena_, v, want))
                return nullptr;
            v.set_length(len + 1);
            return v.kids() + len * v.width();
        }

        [[nodiscard]] bool prepare(const detail::Kind k) const {
            if (!ok())
                return false;
            if (slot_->kind() == detail::Kind::Null && !set_container(k, 0))
                return false;
            return slot_->kind() == k;
        }

        Value* slot_ {};
        SharedArena* arena_ {};
    };

    // Visitor building a tree. Entries gather in one flat buffer; each container end moves
    // its entries into a single arena block sized to fit.
    class DocumentBuilder {
    public:
        // strings_in_arena: borrowed strings already live in the arena (in-place parse of an
        // arena copy) and are referenced instead of copied.
        DocumentBuilder(SharedArena& arena, const bool strings_in_arena) noexcept: arena_(arena), strings_in_arena_(strings_in_arena) { }

        bool on_null() {
            return push(Value {});
        }
        bool on_bool(const bool b) {
            return push(Value::make_bool(b));
        }
        bool on_u64(const std::uint64_t v) {
            return push(Value::make_number(Number::from_u64(v)));
        }
        bool on_i64(const std::int64_t v) {
            return push(Value::make_number(Number::from_i64(v)));
        }
        bool on_f64(const double v) {
            return push(Value::make_number(Number::from_f64(v)));
        }
        bool on_string(const std::string_view s) {
            return push_copy(s);
        }
        bool on_borrowed_string(const std::string_view s) {
            if (!strings_in_arena_)
                return push_copy(s);
            return push(Value::make_string(s.data(), s.size(), StringStorage::Arena));
        }
        bool on_key(const std::string_view s) {
            return on_string(s);
        }
        bool on_borrowed_key(const std::string_view s) {
            return on_borrowed_string(s);
        }
        bool on_array_begin(std::size_t) noexcept {
            return true;
        }
        bool on_array_end(const std::size_t count) {
            return close(detail::Kind::Array, count);
        }
        bool on_object_begin(std::size_t) noexcept {
            return true;
        }
        bool on_object_end(const std::size_t count) {
            return close(detail::Kind::Object, count);
        }

        [[nodiscard]] bool alloc_failed() const noexcept {
            return failed_;
        }

        [[nodiscard]] Value root() const noexcept {
            return stack_.empty() ? Value {} : stack_.data()[0];
        }

    private:
        bool push(const Value& v) noexcept {
            if (!stack_.push(v)) {
                failed_ = true;
                return false;
            }
            return true;
        }

        bool push_copy(const std::string_view s) {
            const char* p = arena_.copy_string(s);
            if (!p) {
                failed_ = true;
                return false;
            }
            return push(Value::make_string(p, s.size(), StringStorage::Arena));
        }

        bool close(const detail::Kind k, const std::size_t count) {
            const std::size_t w = k == detail::Kind::Object ? 2 : 1;
            const std::size_t n = count * w;
            Value* kids = nullptr;
            if (count) {
                kids = detail::alloc_children(arena_, count, w, 0);
                if (!kids) {
                    failed_ = true;
                    return false;
                }
                std::memcpy(static_cast<void*>(kids), stack_.data() + (stack_.size() - n), n * sizeof(Value));
            }
            stack_.truncate(stack_.size() - n);
            return push(k == detail::Kind::Object ? Value::make_object(kids, count) : Value::make_array(kids, count));
        }

        SharedArena& arena_;
        bool strings_in_arena_ {};
        bool failed_ {};
        detail::InlineStack<Value, 64> stack_ {};
    };

    // A tree and the arena it lives in. Copies share the arena; mutation through root_mut()
    // copies whatever the other copies can still see.
    class Document {
    public:
        Document(): arena_(SharedArena::create()) {
            if (!arena_)
                err_.set(ErrorCode::AllocFailed);
        }

        template <AllocatorLike Alloc>
        explicit Document(Alloc& alloc): arena_(SharedArena::create(alloc)) {
            if (!arena_)
                err_.set(ErrorCode::AllocFailed);
        }

        Document(const Document&) = default;
        Document& operator=(const Document&) = default;

        Document(Document&& other) noexcept: arena_(std::move(other.arena_)), root_(std::exchange(other.root_, Value {})), err_(other.err_) { }

        Document& operator=(Document&& other) noexcept {
            if (this != &other) {
                arena_ = std::move(other.arena_);
                root_ = std::exchange(other.root_, Value {});
                err_ = other.err_;
            }
            return *this;
        }

        // Validates UTF-8 over the whole input, then builds the tree from an arena copy of the
        // input with strings unescaped in place.
        [[nodiscard]] static Document parse(const std::string_view json) {
            Document doc;
            doc.parse_into(json, true);
            return doc;
        }

        template <AllocatorLike Alloc>
        [[nodiscard]] static Document parse(const std::string_view json, Alloc& alloc) {
            Document doc {alloc};
            doc.parse_into(json, true);
            return doc;
        }

        // Same as parse without the UTF-8 pass; invalid UTF-8 ends up in the strings as is.
        [[nodiscard]] static Document parse_unchecked(const std::string_view json) {
            Document doc;
            doc.parse_into(json, false);
            return doc;
        }

        // A document sharing v's arena with v as its root.
        [[nodiscard]] static Document share(const ValueRef& v) {
            Document doc {ArenaRef::share(v.arena())};
            if (v.valid()) {
                doc.root_ = *v.raw();
                if (v.arena() && v.raw()->is_container())
                    v.arena()->mark_shared();
            }
            return doc;
        }

        [[nodiscard]] bool ok() const noexcept {
            return err_.ok();
        }

        [[nodiscard]] const ParseError& error() const noexcept {
            return err_;
        }

        [[nodiscard]] ValueRef root() const noexcept {
            return ValueRef {&root_, arena_.get()};
        }

        [[nodiscard]] NodeRef root_mut() noexcept {
            return NodeRef {&root_, arena_.get()};
        }

        [[nodiscard]] SharedArena* arena() const noexcept {
            return arena_.get();
        }

        // Moves the tree out, leaving the document without an arena.
        [[nodiscard]] std::pair<ArenaRef, Value> take() noexcept {
            return {std::move(arena_), std::exchange(root_, Value {})};
        }

    private:
        explicit Document(ArenaRef arena) noexcept: arena_(std::move(arena)) { }

        void parse_into(const std::string_view json, const bool check_utf8) {
            if (!arena_)
                return;

            if (check_utf8) {
                const char* const end = json.data() + json.size();
                if (const char* bad = detail::validate_utf8(json.data(), end); bad != end) {
                    err_.input = json;
                    err_.set(ErrorCode::InvalidUtf8, bad);
                    return;
                }
            }

            char* copy = arena_->copy_string(json);
            if (!copy) {
                err_.input = json;
                err_.set(ErrorCode::AllocFailed, json.data());
                return;
            }

            Parser p {copy, copy + json.size(), false};
            DocumentBuilder b {*arena_, true};
            if (p.parse_document_inplace(b) && p.parse_trailing()) {
                root_ = b.root();
                return;
            }

            // Report against the caller's buffer rather than the arena copy.
            const ParseError& e = p.error();
            err_.input = json;
            err_.code = b.alloc_failed() ? ErrorCode::AllocFailed : e.code;
            err_.at = e.at ? json.data() + (e.at - copy) : nullptr;
        }

        ArenaRef arena_ {};
        Value root_ {};
        ParseError err_ {};
    };

} // namespace sjson

namespace sjson::detail {

    template <class T>
    inline constexpr bool kIsDocumentRvalue = std::is_same_v<std::remove_cvref_t<T>, Document> && !std::is_lvalue_reference_v<T>;

    // Brings the tree of src into arena: shared when it already lives there, deep-copied
    // otherwise.
    [[nodiscard]] inline bool import_tree(SharedArena& arena, const ValueRef& src, Value& out) {
        if (!src.valid())
            return false;
        out = *src.raw();
        if (src.arena() == &arena) {
            if (out.is_container() && out.kids())
                arena.mark_shared();
            return true;
        }
        return deep_copy(arena, out);
    }

    template <class T>
    [[nodiscard]] bool make_value(SharedArena& arena, T&& v, Value& out) { // NOLINT(cppcoreguidelines-missing-std-forward)
        using U = std::remove_cvref_t<T>;

        if constexpr (std::is_same_v<U, std::nullptr_t>) {
            out = Value {};
            return true;
        } else if constexpr (std::is_same_v<U, bool>) {
            out = Value::make_bool(v);
            return true;
        } else if constexpr (std::is_integral_v<U>) {
            if constexpr (std::is_signed_v<U>)
                out = Value::make_number(Number::from_i64(static_cast<std::int64_t>(v)));
            else
                out = Value::make_number(Number::from_u64(static_cast<std::uint64_t>(v)));
            return true;
        } else if constexpr (std::is_floating_point_v<U>) {
            out = Value::make_number(Number::from_f64(static_cast<double>(v)));
            return true;
        } else if constexpr (std::is_same_v<U, Number>) {
            out = Value::make_number(v);
            return true;
        } else if constexpr (std::is_convertible_v<const U&, std::string_view> && !std::is_same_v<U, ValueRef> && !std::is_same_v<U, NodeRef>) {
            const std::string_view s {v};
            if (s.size() > Value::kMaxLength)
                return false;
            const char* p = arena.copy_string(s);
            if (!p)
                return false;
            out = Value::make_string(p, s.size(), StringStorage::Arena);
            return true;
        } else if constexpr (std::is_same_v<U, ValueRef> || std::is_same_v<U, NodeRef>) {
            return import_tree(arena, ValueRef {v}, out);
        } else if constexpr (kIsDocumentRvalue<T>) {
            if (!v.arena())
                return false;
            if (v.arena() == &arena || !arena.retain_foreign(v.arena()))
                return import_tree(arena, v.root(), out);
            // Grafted: the foreign arena is retained, the tree is taken as is.
            out = v.take().second;
            return true;
        } else if constexpr (std::is_same_v<U, Document>) {
            return import_tree(arena, v.root(), out);
        } else {
            static_assert(!sizeof(U), "Unsupported value type for NodeRef");
            return false;
        }
    }

} // namespace sjson::detail

namespace sjson {

    template <class T>
    bool NodeRef::set(T&& v) const {
        if (!ok())
            return false;
        Value val;
        if (!detail::make_value(*arena_, std::forward<T>(v), val))
            return false;
        *slot_ = val;
        return true;
    }

    template <class T>
    NodeRef NodeRef::push_back(T&& v) const {
        if (!prepare(detail::Kind::Array))
            return {};
        Value val;
        if (!detail::make_value(*arena_, std::forward<T>(v), val))
            return {};
        Value* entry = append_entry();
        if (!entry)
            return {};
        *entry = val;
        return NodeRef {entry, arena_};
    }

    template <class T>
    NodeRef NodeRef::insert(const std::string_view key, T&& v) const {
        if (!prepare(detail::Kind::Object) || key.size() > Value::kMaxLength)
            return {};
        const char* k = arena_->copy_string(key);
        if (!k)
            return {};
        Value val;
        if (!detail::make_value(*arena_, std::forward<T>(v), val))
            return {};
        Value* entry = append_entry();
        if (!entry)
            return {};
        entry[0] = Value::make_string(k, key.size(), StringStorage::Arena);
        entry[1] = val;
        return NodeRef {entry + 1, arena_};
    }

    inline bool NodeRef::erase(const std::size_t index) const {
        if (!ok() || !slot_->is_container() || index >= slot_->length())
            return false;
        if (!detail::make_children_private(*arena_, *slot_, 0))
            return false;

        const std::size_t w = slot_->width();
        const std::size_t len = slot_->length();
        Value* kids = slot_->kids();
        std::memmove(static_cast<void*>(kids + index * w), kids + (index + 1) * w, (len - index - 1) * w * sizeof(Value));
        slot_->set_length(len - 1);
        return true;
    }

    inline bool NodeRef::erase(const std::string_view key) const {
        if (!ok() || slot_->kind() != detail::Kind::Object)
            return false;
        const Value* kids = slot_->kids();
        for (std::size_t i = 0, n = slot_->length(); i < n; ++i) {
            if (kids[2 * i].str() == key)
                return erase(i);
        }
        return false;
    }

    inline bool NodeRef::reserve(const std::size_t n) const {
        if (!ok() || !slot_->is_container())
            return false;
        return detail::make_children_private(*arena_, *slot_, n);
    }

    inline NodeRef NodeRef::at(const std::size_t i) const {
        if (!ok() || slot_->kind() != detail::Kind::Array || i >= slot_->length())
            return {};
        if (!detail::make_children_private(*arena_, *slot_, 0))
            return {};
        return NodeRef {slot_->kids() + i, arena_};
    }

    inline NodeRef NodeRef::get(const std::string_view key) const {
        if (!ok() || slot_->kind() != detail::Kind::Object)
            return {};
        const Value* kids = slot_->kids();
        for (std::size_t i = 0, n = slot_->length(); i < n; ++i) {
            if (kids[2 * i].str() != key)
                continue;
            if (!detail::make_children_private(*arena_, *slot_, 0))
                return {};
            return NodeRef {slot_->kids() + 2 * i + 1, arena_};
        }
        return {};
    }

    inline NodeRef NodeRef::operator[](const std::string_view key) const {
        if (!prepare(detail::Kind::Object))
            return {};
        if (NodeRef found = get(key))
            return found;
        return insert(key, nullptr);
    }

    inline NodeRef NodeRef::operator[](const std::size_t i) const {
        if (!prepare(detail::Kind::Array))
            return {};
        while (slot_->length() <= i) {
            if (!push_back(nullptr))
                return {};
        }
        return at(i);
    }

} // namespace sjson

#endif // SJSON_VALUE_HPP
