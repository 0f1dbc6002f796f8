/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_ARENA_HPP
#define SJSON_ARENA_HPP

#pragma once
#include <sjson/config.hpp>
#include <sjson/detail/stack.hpp>

#include <algorithm>
#include <atomic>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <new>
#include <string_view>
#include <utility>

namespace sjson {

    // Source of arena blocks. kBlockSize is the payload size of a regular block; larger requests
    // get a block of their own. allocate returns nullptr when out of memory.
    template <class T>
    concept AllocatorLike = requires(T a, std::size_t sz, std::size_t align) {
        { T::kBlockSize } -> std::convertible_to<std::uint64_t>;
        { a.allocate(sz, align) } -> std::same_as<void*>;
        { a.deallocate(static_cast<void*>(nullptr), sz, align) } -> std::same_as<void>;
    };

    // Global aligned new. The default block source of every SharedArena.
    template <std::uint64_t BlockSize = kDefaultBlockSize>
    struct NewAllocator {
        static constexpr auto kBlockSize = BlockSize;

        // ReSharper disable once CppMemberFunctionMayBeStatic
        void* allocate(const std::size_t sz, const std::size_t al) noexcept {
            if (al == 0 || !std::has_single_bit(al))
                return nullptr;
            return ::operator new(sz, std::align_val_t {al}, std::nothrow);
        }

        // ReSharper disable once CppMemberFunctionMayBeStatic
        void deallocate(void* p, std::size_t, const std::size_t al) noexcept {
            ::operator delete(p, std::align_val_t {al});
        }
    };

    // Blocks from a caller-owned memory resource, e.g. a pool shared by many documents.
    // Exhaustion surfaces the way the resource reports it.
    template <std::uint64_t BlockSize = kDefaultBlockSize>
    struct PmrAllocator {
        static constexpr auto kBlockSize = BlockSize;

        std::pmr::memory_resource* resource {};

        PmrAllocator() = default;

        explicit PmrAllocator(std::pmr::memory_resource* r): resource(r) { }

        [[nodiscard]] void* allocate(const std::size_t sz, const std::size_t al) const {
            return resource ? resource->allocate(sz, al) : nullptr;
        }

        void deallocate(void* p, const std::size_t sz, const std::size_t al) const noexcept {
            if (resource)
                resource->deallocate(p, sz, al);
        }
    };

} // namespace sjson

namespace sjson::detail {

    // Type-erased reference to an AllocatorLike. The allocator must outlive every arena using it.
    struct BlockSource {
        void* self {};
        void* (*allocate)(void*, std::size_t, std::size_t) {};
        void (*deallocate)(void*, void*, std::size_t, std::size_t) {};
        std::size_t block_size {};

        template <AllocatorLike Alloc>
        [[nodiscard]] static BlockSource of(Alloc& a) noexcept {
            return BlockSource {
                &a,
                [](void* s, const std::size_t sz, const std::size_t al) -> void* { return static_cast<Alloc*>(s)->allocate(sz, al); },
                [](void* s, void* p, const std::size_t sz, const std::size_t al) { static_cast<Alloc*>(s)->deallocate(p, sz, al); },
                static_cast<std::size_t>(Alloc::kBlockSize),
            };
        }
    };

} // namespace sjson::detail

namespace sjson {

    // Bump allocator over a chain of blocks. Nothing is freed before reset() or destruction, so
    // strings and children blocks of a document stay put for the document's lifetime.
    class Arena {
    public:
        template <AllocatorLike Alloc>
        explicit Arena(Alloc& alloc) noexcept: src_(detail::BlockSource::of(alloc)) { }

        ~Arena() {
            reset();
        }

        Arena(const Arena&) = delete;
        Arena& operator=(const Arena&) = delete;

        // nullptr when al is not a power of two or the block source is exhausted.
        [[nodiscard]] void* alloc(const std::size_t sz, const std::size_t al = alignof(std::max_align_t)) {
            if (al == 0 || !std::has_single_bit(al) || sz > std::numeric_limits<std::size_t>::max() - al)
                return nullptr;

            if (char* p = bump(sz, al))
                return p;
            if (!grow(sz + al))
                return nullptr;
            return bump(sz, al);
        }

        // Gives every block back to the allocator.
        void reset() noexcept {
            while (head_) {
                Block* prev = head_->prev;
                src_.deallocate(src_.self, head_, sizeof(Block) + head_->cap, kBlockAlign);
                head_ = prev;
            }
            cursor_ = nullptr;
            limit_ = nullptr;
            blocks_ = 0;
            used_ = 0;
        }

        [[nodiscard]] std::size_t block_count() const noexcept {
            return blocks_;
        }

        // Bytes handed out, alignment padding included.
        [[nodiscard]] std::size_t bytes_used() const noexcept {
            return used_;
        }

    private:
        struct Block {
            Block* prev;
            std::size_t cap;
        };

        static constexpr std::size_t kBlockAlign = alignof(std::max_align_t) > alignof(Block) ? alignof(std::max_align_t) : alignof(Block);

        [[nodiscard]] SJSON_FORCEINLINE char* bump(const std::size_t sz, const std::size_t al) noexcept {
            if (!cursor_)
                return nullptr;
            const auto at = reinterpret_cast<std::uintptr_t>(cursor_);
            const std::size_t pad = (al - (at & (al - 1))) & (al - 1);
            if (pad > static_cast<std::size_t>(limit_ - cursor_) || sz > static_cast<std::size_t>(limit_ - cursor_) - pad)
                return nullptr;
            char* p = cursor_ + pad;
            cursor_ = p + sz;
            used_ += pad + sz;
            return p;
        }

        // Starts a fresh block with room for at least need bytes. The rest of the current block
        // is abandoned.
        [[nodiscard]] bool grow(const std::size_t need) {
            const std::size_t cap = std::max(src_.block_size, need);
            if (cap > std::numeric_limits<std::size_t>::max() - sizeof(Block))
                return false;

            void* mem = src_.allocate(src_.self, sizeof(Block) + cap, kBlockAlign);
            if (!mem)
                return false;

            head_ = std::construct_at(static_cast<Block*>(mem), Block {head_, cap});
            cursor_ = reinterpret_cast<char*>(head_ + 1);
            limit_ = cursor_ + cap;
            ++blocks_;
            return true;
        }

        detail::BlockSource src_;
        Block* head_ {};
        char* cursor_ {};
        char* limit_ {};
        std::size_t blocks_ {};
        std::size_t used_ {};
    };

} // namespace sjson

namespace sjson::detail {

    // Stamps handed out to children blocks. 0 is never handed out.
    [[nodiscard]] inline std::uint64_t next_share_epoch() noexcept {
        static std::atomic<std::uint64_t> counter {0};
        return counter.fetch_add(1, std::memory_order_relaxed) + 1;
    }

} // namespace sjson::detail

namespace sjson {

    // Arena with an atomic reference count. Allocation is serialized by a mutex so one arena can
    // back several documents. Grafted foreign arenas are retained until this one goes away and
    // mark it combined.
    //
    // The share epoch changes whenever memory of this arena may become reachable from one more
    // place (a new reference, a pointer shared inside the arena, a graft). A children block
    // stamped with the current epoch is known to be referenced from a single slot.
    class SharedArena {
    public:
        SharedArena(const SharedArena&) = delete;
        SharedArena& operator=(const SharedArena&) = delete;

        ~SharedArena() {
            for (std::size_t i = 0; i < retained_.size(); ++i)
                retained_[i]->release();
        }

        // Returns nullptr when out of memory. The caller holds the first reference.
        [[nodiscard]] static SharedArena* create() noexcept {
            return new (std::nothrow) SharedArena();
        }

        template <AllocatorLike Alloc>
        [[nodiscard]] static SharedArena* create(Alloc& alloc) noexcept {
            return new (std::nothrow) SharedArena(alloc);
        }

        [[nodiscard]] void* alloc(const std::size_t sz, const std::size_t al = alignof(std::max_align_t)) {
            const std::lock_guard lock {mutex_};
            return arena_.alloc(sz, al);
        }

        // Copy of s owned by the arena, NUL terminated. nullptr when out of memory.
        [[nodiscard]] char* copy_string(const std::string_view s) {
            auto* p = static_cast<char*>(alloc(s.size() + 1, 1));
            if (!p)
                return nullptr;
            if (!s.empty())
                std::memcpy(p, s.data(), s.size());
            p[s.size()] = '\0';
            return p;
        }

        void retain() noexcept {
            refs_.fetch_add(1, std::memory_order_relaxed);
            bump_epoch();
        }

        void release() noexcept {
            if (refs_.fetch_sub(1, std::memory_order_acq_rel) == 1)
                delete this;
        }

        [[nodiscard]] std::size_t use_count() const noexcept {
            return refs_.load(std::memory_order_acquire);
        }

        [[nodiscard]] bool combined() const noexcept {
            return combined_.load(std::memory_order_acquire);
        }

        // Every block is reachable from exactly one slot.
        [[nodiscard]] bool exclusive() const noexcept {
            return use_count() == 1 && !combined();
        }

        [[nodiscard]] std::uint64_t epoch() const noexcept {
            return epoch_.load(std::memory_order_acquire);
        }

        void bump_epoch() noexcept {
            epoch_.store(detail::next_share_epoch(), std::memory_order_release);
        }

        // A pointer into this arena was copied to a second slot.
        void mark_shared() noexcept {
            combined_.store(true, std::memory_order_release);
            bump_epoch();
        }

        // Keeps other alive for the lifetime of this arena. Fails when other already retains
        // this one, or when out of memory.
        [[nodiscard]] bool retain_foreign(SharedArena* other) {
            if (other == this || other->retains(this))
                return false;

            {
                const std::lock_guard lock {mutex_};
                if (!retained_.push(other))
                    return false;
            }

            other->retain();
            mark_shared();
            return true;
        }

        // Whether other is reachable through retained arenas. Answers true when the walk runs
        // out of memory, which makes callers fall back to copying.
        [[nodiscard]] bool retains(const SharedArena* other) {
            detail::InlineStack<SharedArena*, 16> work;
            if (!work.push(this))
                return true;

            while (!work.empty()) {
                SharedArena* a = work.top();
                work.pop();

                const std::lock_guard lock {a->mutex_};
                for (std::size_t i = 0; i < a->retained_.size(); ++i) {
                    SharedArena* r = a->retained_[i];
                    if (r == other)
                        return true;
                    if (!work.push(r))
                        return true;
                }
            }
            return false;
        }

        [[nodiscard]] std::size_t retained_count() {
            const std::lock_guard lock {mutex_};
            return retained_.size();
        }

        [[nodiscard]] std::size_t bytes_used() {
            const std::lock_guard lock {mutex_};
            return arena_.bytes_used();
        }

    private:
        SharedArena(): arena_(own_alloc_) { }

        template <AllocatorLike Alloc>
        explicit SharedArena(Alloc& alloc): arena_(alloc) { }

        NewAllocator<> own_alloc_ {};
        Arena arena_;
        std::atomic<std::size_t> refs_ {1};
        std::atomic<bool> combined_ {false};
        std::atomic<std::uint64_t> epoch_ {0};
        std::mutex mutex_ {};
        detail::InlineStack<SharedArena*, 4> retained_ {};
    };

    // Counted handle to a SharedArena.
    class ArenaRef {
    public:
        ArenaRef() = default;

        // Takes over one reference.
        explicit ArenaRef(SharedArena* a) noexcept: a_(a) { }

        ~ArenaRef() {
            if (a_)
                a_->release();
        }

        ArenaRef(const ArenaRef& other) noexcept: a_(other.a_) {
            if (a_)
                a_->retain();
        }

        ArenaRef& operator=(const ArenaRef& other) noexcept {
            if (this != &other) {
                if (other.a_)
                    other.a_->retain();
                if (a_)
                    a_->release();
                a_ = other.a_;
            }
            return *this;
        }

        ArenaRef(ArenaRef&& other) noexcept: a_(std::exchange(other.a_, nullptr)) { }

        ArenaRef& operator=(ArenaRef&& other) noexcept {
            if (this != &other) {
                if (a_)
                    a_->release();
                a_ = std::exchange(other.a_, nullptr);
            }
            return *this;
        }

        // New reference to a.
        [[nodiscard]] static ArenaRef share(SharedArena* a) noexcept {
            if (a)
                a->retain();
            return ArenaRef {a};
        }

        [[nodiscard]] SharedArena* get() const noexcept {
            return a_;
        }

        [[nodiscard]] SharedArena* operator->() const noexcept {
            return a_;
        }

        [[nodiscard]] SharedArena& operator*() const noexcept {
            return *a_;
        }

        [[nodiscard]] explicit operator bool() const noexcept {
            return a_ != nullptr;
        }

        // Gives up the reference without releasing it.
        [[nodiscard]] SharedArena* detach() noexcept {
            return std::exchange(a_, nullptr);
        }

    private:
        SharedArena* a_ {};
    };

} // namespace sjson

#endif // SJSON_ARENA_HPP
