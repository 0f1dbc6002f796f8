/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_POINTER_HPP
#define SJSON_POINTER_HPP

#pragma once
#include <sjson/config.hpp>

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sjson {

    // One step of a path: an object key or an array index.
    class PathItem {
    public:
        PathItem(std::string key): key_(std::move(key)), is_key_(true) { }
        PathItem(const std::string_view key): key_(key), is_key_(true) { }
        PathItem(const char* key): key_(key), is_key_(true) { }

        template <std::integral I>
        PathItem(const I index): index_(static_cast<std::size_t>(index)) { }

        [[nodiscard]] bool is_key() const noexcept {
            return is_key_;
        }

        [[nodiscard]] bool is_index() const noexcept {
            return !is_key_;
        }

        [[nodiscard]] std::string_view key() const noexcept {
            return key_;
        }

        [[nodiscard]] std::size_t index() const noexcept {
            return index_;
        }

        [[nodiscard]] bool operator==(const PathItem&) const = default;

    private:
        std::string key_ {};
        std::size_t index_ {};
        bool is_key_ {};
    };

    using JsonPointer = std::vector<PathItem>;

    // Trie of paths for one-pass extraction. Every path added gets the next output slot; equal
    // paths share a node and record one slot each.
    class PointerTree {
    public:
        struct Node {
            std::size_t id {};
            std::vector<std::size_t> slots {};
            std::vector<std::pair<std::string, std::size_t>> keys {};
            std::vector<std::pair<std::size_t, std::size_t>> indices {};

            [[nodiscard]] bool is_leaf() const noexcept {
                return keys.empty() && indices.empty();
            }
        };

        PointerTree() {
            nodes_.emplace_back();
        }

        void add_path(const std::span<const PathItem> path) {
            std::size_t cur = 0;
            for (const auto& item : path) {
                const std::size_t next = item.is_key() ? child_key(cur, item.key()) : child_index(cur, item.index());
                cur = next;
            }
            nodes_[cur].slots.push_back(size_++);
        }

        void add_path(const std::initializer_list<PathItem> path) {
            add_path(std::span<const PathItem> {path.begin(), path.size()});
        }

        // Number of paths added, which is the number of output slots.
        [[nodiscard]] std::size_t size() const noexcept {
            return size_;
        }

        [[nodiscard]] std::size_t node_count() const noexcept {
            return nodes_.size();
        }

        [[nodiscard]] const Node& root() const noexcept {
            return nodes_.front();
        }

        [[nodiscard]] const Node& node(const std::size_t id) const noexcept {
            return nodes_[id];
        }

        [[nodiscard]] const Node* find_key(const Node& n, const std::string_view key) const noexcept {
            for (const auto& [k, id] : n.keys) {
                if (k == key)
                    return &nodes_[id];
            }
            return nullptr;
        }

        [[nodiscard]] const Node* find_index(const Node& n, const std::size_t index) const noexcept {
            for (const auto& [i, id] : n.indices) {
                if (i == index)
                    return &nodes_[id];
            }
            return nullptr;
        }

    private:
        std::size_t child_key(const std::size_t parent, const std::string_view key) {
            for (const auto& [k, id] : nodes_[parent].keys) {
                if (k == key)
                    return id;
            }
            const std::size_t id = new_node();
            nodes_[parent].keys.emplace_back(std::string(key), id);
            return id;
        }

        std::size_t child_index(const std::size_t parent, const std::size_t index) {
            for (const auto& [i, id] : nodes_[parent].indices) {
                if (i == index)
                    return id;
            }
            const std::size_t id = new_node();
            nodes_[parent].indices.emplace_back(index, id);
            return id;
        }

        std::size_t new_node() {
            const std::size_t id = nodes_.size();
            nodes_.emplace_back();
            nodes_.back().id = id;
            return id;
        }

        std::vector<Node> nodes_ {};
        std::size_t size_ {};
    };

} // namespace sjson

#endif // SJSON_POINTER_HPP
