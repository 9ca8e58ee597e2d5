/*
 * SuffixTrie - Domain Suffix Matching Library
 * Copyright (C) 2026 ShadowStrike Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
/*
 * ============================================================================
 * SuffixTrie DomainTrie - Domain Suffix Trie
 * ============================================================================
 *
 * Label-keyed suffix trie. Domains are stored in reverse label order
 * (api.google.com -> com -> google -> api) so that a lookup walking the
 * query from its rightmost label inward stops on the most specific
 * registered suffix.
 *
 * NOT thread-safe. Use SyncDomainSuffixTrie for shared access.
 *
 * ============================================================================
 */

#pragma once

#include "DomainTrieFormat.hpp"
#include "IDomainSuffixTrie.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace SuffixTrie {
    namespace DomainTrie {

        template <typename T>
        class DomainSuffixTrie;

        // ============================================================================
        // DOMAIN SUFFIX TRIE NODE
        // ============================================================================

        /**
         * @brief One label of a registered suffix.
         *
         * Nodes are created only by DomainSuffixTrie::Insert and live as long as
         * the trie that owns them. Label, parent and depth never change after
         * construction; only the value may.
         */
        template <typename T>
        class DomainSuffixTrieNode {
        public:
            using ChildMap = std::unordered_map<std::string, std::unique_ptr<DomainSuffixTrieNode>>;
            using ChildView = std::unordered_map<std::string, const DomainSuffixTrieNode*>;

            /// @brief Restricts node construction to the trie and its nodes
            class ConstructionKey {
                friend class DomainSuffixTrie<T>;
                friend class DomainSuffixTrieNode<T>;
                ConstructionKey() = default;
            };

            DomainSuffixTrieNode(ConstructionKey, std::string label, DomainSuffixTrieNode* parent)
                : m_label(std::move(label))
                , m_parent(parent)
                , m_depth(parent ? parent->m_depth + 1 : 0) {
            }

            // Non-copyable, non-movable (children hold raw parent pointers)
            DomainSuffixTrieNode(const DomainSuffixTrieNode&) = delete;
            DomainSuffixTrieNode& operator=(const DomainSuffixTrieNode&) = delete;
            DomainSuffixTrieNode(DomainSuffixTrieNode&&) = delete;
            DomainSuffixTrieNode& operator=(DomainSuffixTrieNode&&) = delete;

            /// @brief Label of this node, e.g. "api" for api.google.com ("" for the root)
            [[nodiscard]] const std::string& GetLabel() const noexcept { return m_label; }

            /// @brief Suffix this node represents, e.g. "api.google.com" ("" for the root)
            [[nodiscard]] std::string GetPath() const;

            [[nodiscard]] const DomainSuffixTrieNode* GetParent() const noexcept { return m_parent; }
            [[nodiscard]] bool IsRoot() const noexcept { return m_parent == nullptr; }
            [[nodiscard]] size_t GetDepth() const noexcept { return m_depth; }

            /// @return Child for label, nullptr if absent
            [[nodiscard]] const DomainSuffixTrieNode* GetChild(std::string_view label) const;
            [[nodiscard]] DomainSuffixTrieNode* GetChild(std::string_view label);

            /// @brief Copy of the label -> child mapping; editing it does not touch the tree
            [[nodiscard]] ChildView GetChildren() const;
            [[nodiscard]] size_t GetChildCount() const noexcept { return m_children.size(); }

            [[nodiscard]] const std::optional<T>& GetValue() const noexcept { return m_value; }
            [[nodiscard]] bool HasValue() const noexcept { return m_value.has_value(); }

            /// @return The previous value (absent if none was set)
            std::optional<T> SetValue(T value);

            [[nodiscard]] NodeSnapshot<T> Snapshot() const;

        private:
            friend class DomainSuffixTrie<T>;

            /// @brief Child for label, created if missing
            /// @return {child, created}
            std::pair<DomainSuffixTrieNode*, bool> GetOrAddChild(std::string_view label);

            const std::string m_label;
            DomainSuffixTrieNode* const m_parent;  ///< Non-owning; null for the root
            const size_t m_depth;
            ChildMap m_children;
            std::optional<T> m_value;
        };

        // ============================================================================
        // DOMAIN SUFFIX TRIE
        // ============================================================================

        /**
         * @brief Longest-suffix matcher for domain names.
         *
         * Usage:
         * @code
         *   DomainSuffixTrie<std::string> trie;
         *   (void)trie.Insert("google.com", "A");
         *   (void)trie.Insert("map.google.com", "B");
         *   trie.MatchValue("x.map.google.com");   // "B"
         *   trie.Match("x.google.com")->GetPath(); // "google.com"
         * @endcode
         *
         * Matching is structural: the walk stops at the first label without a
         * child, whether or not the node reached so far carries a value. With only
         * "api.google.com" registered, "foo.google.com" matches the "google" node
         * and its value is absent.
         *
         * No domain validation is done: labels are the raw '.'-separated segments,
         * empty segments included. Teardown and traversal use explicit work
         * lists, so suffix length is bounded by memory, not by stack depth.
         */
        template <typename T>
        class DomainSuffixTrie final : public IDomainSuffixTrie<T> {
        public:
            using Node = DomainSuffixTrieNode<T>;
            using ChildView = typename Node::ChildView;

            DomainSuffixTrie();
            ~DomainSuffixTrie() override;

            DomainSuffixTrie(const DomainSuffixTrie&) = delete;
            DomainSuffixTrie& operator=(const DomainSuffixTrie&) = delete;

            /// @brief Take over other's tree; other is left as a fresh empty trie
            DomainSuffixTrie(DomainSuffixTrie&& other);
            DomainSuffixTrie& operator=(DomainSuffixTrie&& other);

            /**
             * @brief Register suffix with value.
             *
             * Labels are walked right to left from the root; missing nodes are
             * created. The final node's value is overwritten unconditionally.
             *
             * @return EmptySuffix for "", checked before any mutation
             */
            [[nodiscard]] TrieStatus Insert(std::string_view suffix, T value) override;

            /**
             * @brief Longest structural match for domain.
             * @return Deepest node reached; the root if nothing matched. Never null.
             */
            [[nodiscard]] Node* Match(std::string_view domain);
            [[nodiscard]] const Node* Match(std::string_view domain) const;

            [[nodiscard]] NodeSnapshot<T> Lookup(std::string_view domain) const override;
            [[nodiscard]] std::optional<T> MatchValue(std::string_view domain) const override;

            // Root accessors
            [[nodiscard]] std::optional<T> GetValue() const override { return m_root->GetValue(); }
            std::optional<T> SetValue(T value) override { return m_root->SetValue(std::move(value)); }
            [[nodiscard]] std::string GetLabel() const override { return m_root->GetLabel(); }
            [[nodiscard]] std::string GetPath() const override { return m_root->GetPath(); }
            [[nodiscard]] const Node* GetChild(std::string_view label) const { return m_root->GetChild(label); }
            [[nodiscard]] Node* GetChild(std::string_view label) { return m_root->GetChild(label); }
            [[nodiscard]] ChildView GetChildren() const { return m_root->GetChildren(); }

            [[nodiscard]] Node& GetRoot() noexcept { return *m_root; }
            [[nodiscard]] const Node& GetRoot() const noexcept { return *m_root; }

            [[nodiscard]] size_t GetNodeCount() const noexcept override { return m_nodeCount; }
            [[nodiscard]] size_t GetEntryCount() const override;
            [[nodiscard]] uint32_t GetHeight() const override;

            /**
             * @brief Visit every node carrying a value.
             * @param callback void(const std::string& path, const T& value)
             */
            template <typename Callback>
            void ForEach(Callback&& callback) const {
                VisitNodes([&callback](const Node* node) {
                    if (node->HasValue()) {
                        const std::string path = node->GetPath();
                        callback(path, *node->GetValue());
                    }
                });
            }

        private:
            [[nodiscard]] static std::unique_ptr<Node> MakeRoot();

            /// @brief Free a subtree without recursing once per level
            static void DestroyTree(std::unique_ptr<Node> root);

            /// @brief Longest structural walk from node; shared by both Match overloads
            template <typename NodePtr>
            [[nodiscard]] static NodePtr MatchFrom(NodePtr node, std::string_view domain);

            /// @brief Depth-first visit of every node, root included
            template <typename Visitor>
            void VisitNodes(Visitor&& visitor) const {
                std::vector<const Node*> pending{ m_root.get() };
                while (!pending.empty()) {
                    const Node* node = pending.back();
                    pending.pop_back();
                    visitor(node);
                    for (const auto& [label, child] : node->m_children) {
                        pending.push_back(child.get());
                    }
                }
            }

            std::unique_ptr<Node> m_root;
            size_t m_nodeCount{ 1 };
        };

        // ============================================================================
        // NODE IMPLEMENTATION
        // ============================================================================

        template <typename T>
        std::string DomainSuffixTrieNode<T>::GetPath() const {
            std::vector<std::string> labels;
            labels.reserve(m_depth);
            for (const DomainSuffixTrieNode* node = this; node != nullptr && !node->IsRoot(); node = node->m_parent) {
                labels.push_back(node->m_label);
            }
            return Utils::StringUtils::Join(labels, std::string_view(&LABEL_SEPARATOR, 1));
        }

        template <typename T>
        const DomainSuffixTrieNode<T>* DomainSuffixTrieNode<T>::GetChild(std::string_view label) const {
            auto it = m_children.find(std::string(label));
            return it != m_children.end() ? it->second.get() : nullptr;
        }

        template <typename T>
        DomainSuffixTrieNode<T>* DomainSuffixTrieNode<T>::GetChild(std::string_view label) {
            auto it = m_children.find(std::string(label));
            return it != m_children.end() ? it->second.get() : nullptr;
        }

        template <typename T>
        typename DomainSuffixTrieNode<T>::ChildView DomainSuffixTrieNode<T>::GetChildren() const {
            ChildView view;
            view.reserve(m_children.size());
            for (const auto& [label, child] : m_children) {
                view.emplace(label, child.get());
            }
            return view;
        }

        template <typename T>
        std::optional<T> DomainSuffixTrieNode<T>::SetValue(T value) {
            std::optional<T> previous = std::move(m_value);
            m_value = std::move(value);
            return previous;
        }

        template <typename T>
        NodeSnapshot<T> DomainSuffixTrieNode<T>::Snapshot() const {
            NodeSnapshot<T> snap;
            snap.label = m_label;
            snap.path = GetPath();
            snap.value = m_value;
            snap.depth = m_depth;
            snap.childCount = m_children.size();
            return snap;
        }

        template <typename T>
        std::pair<DomainSuffixTrieNode<T>*, bool> DomainSuffixTrieNode<T>::GetOrAddChild(std::string_view label) {
            std::string key(label);
            auto it = m_children.find(key);
            if (it != m_children.end()) {
                return { it->second.get(), false };
            }

            auto child = std::make_unique<DomainSuffixTrieNode>(ConstructionKey{}, key, this);
            DomainSuffixTrieNode* childPtr = child.get();
            m_children.emplace(std::move(key), std::move(child));
            return { childPtr, true };
        }

        // ============================================================================
        // TRIE IMPLEMENTATION
        // ============================================================================

        template <typename T>
        DomainSuffixTrie<T>::DomainSuffixTrie()
            : m_root(MakeRoot()) {
        }

        template <typename T>
        DomainSuffixTrie<T>::~DomainSuffixTrie() {
            DestroyTree(std::move(m_root));
        }

        template <typename T>
        DomainSuffixTrie<T>::DomainSuffixTrie(DomainSuffixTrie&& other)
            : m_root(std::exchange(other.m_root, MakeRoot()))
            , m_nodeCount(std::exchange(other.m_nodeCount, size_t{ 1 })) {
        }

        template <typename T>
        DomainSuffixTrie<T>& DomainSuffixTrie<T>::operator=(DomainSuffixTrie&& other) {
            if (this != &other) {
                auto fresh = MakeRoot();
                DestroyTree(std::exchange(m_root, std::exchange(other.m_root, std::move(fresh))));
                m_nodeCount = std::exchange(other.m_nodeCount, size_t{ 1 });
            }
            return *this;
        }

        template <typename T>
        std::unique_ptr<typename DomainSuffixTrie<T>::Node> DomainSuffixTrie<T>::MakeRoot() {
            return std::make_unique<Node>(typename Node::ConstructionKey{}, std::string(), nullptr);
        }

        template <typename T>
        void DomainSuffixTrie<T>::DestroyTree(std::unique_ptr<Node> root) {
            // Detach children before each node is freed so no destructor recurses
            std::vector<std::unique_ptr<Node>> pending;
            if (root) {
                pending.push_back(std::move(root));
            }
            while (!pending.empty()) {
                std::unique_ptr<Node> node = std::move(pending.back());
                pending.pop_back();
                for (auto& [label, child] : node->m_children) {
                    pending.push_back(std::move(child));
                }
                node->m_children.clear();
            }
        }

        template <typename T>
        TrieStatus DomainSuffixTrie<T>::Insert(std::string_view suffix, T value) {
            if (suffix.empty()) {
                ST_LOG_WARN(LOG_CATEGORY, "Insert rejected: domain suffix is empty");
                return TrieStatus::WithMessage(TrieError::EmptySuffix, "cannot register an empty suffix");
            }

            const auto labels = Utils::StringUtils::SplitView(suffix, LABEL_SEPARATOR);

            // Reverse label order: com -> google -> api
            Node* node = m_root.get();
            size_t created = 0;
            for (auto it = labels.rbegin(); it != labels.rend(); ++it) {
                auto [child, isNew] = node->GetOrAddChild(*it);
                if (isNew) {
                    ++created;
                }
                node = child;
            }
            m_nodeCount += created;

            const bool overwrite = node->HasValue();
            node->SetValue(std::move(value));

            if (overwrite) {
                ST_LOG_DEBUG(LOG_CATEGORY, "Replaced value of suffix '%.*s'",
                    static_cast<int>(suffix.size()), suffix.data());
            }
            ST_LOG_TRACE(LOG_CATEGORY, "Inserted '%.*s' (%zu labels, %zu new nodes)",
                static_cast<int>(suffix.size()), suffix.data(), labels.size(), created);

            return TrieStatus::Success();
        }

        template <typename T>
        template <typename NodePtr>
        NodePtr DomainSuffixTrie<T>::MatchFrom(NodePtr node, std::string_view domain) {
            if (domain.empty()) {
                return node;
            }

            const auto labels = Utils::StringUtils::SplitView(domain, LABEL_SEPARATOR);
            for (auto it = labels.rbegin(); it != labels.rend(); ++it) {
                NodePtr child = node->GetChild(*it);
                if (child == nullptr) {
                    break;
                }
                node = child;
            }
            return node;
        }

        template <typename T>
        typename DomainSuffixTrie<T>::Node* DomainSuffixTrie<T>::Match(std::string_view domain) {
            return MatchFrom<Node*>(m_root.get(), domain);
        }

        template <typename T>
        const typename DomainSuffixTrie<T>::Node* DomainSuffixTrie<T>::Match(std::string_view domain) const {
            return MatchFrom<const Node*>(m_root.get(), domain);
        }

        template <typename T>
        NodeSnapshot<T> DomainSuffixTrie<T>::Lookup(std::string_view domain) const {
            return Match(domain)->Snapshot();
        }

        template <typename T>
        std::optional<T> DomainSuffixTrie<T>::MatchValue(std::string_view domain) const {
            return Match(domain)->GetValue();
        }

        template <typename T>
        size_t DomainSuffixTrie<T>::GetEntryCount() const {
            size_t count = 0;
            VisitNodes([&count](const Node* node) {
                if (node->HasValue()) {
                    ++count;
                }
            });
            return count;
        }

        template <typename T>
        uint32_t DomainSuffixTrie<T>::GetHeight() const {
            size_t maxDepth = 0;
            VisitNodes([&maxDepth](const Node* node) {
                maxDepth = std::max(maxDepth, node->GetDepth());
            });
            return static_cast<uint32_t>(maxDepth);
        }

    } // namespace DomainTrie
} // namespace SuffixTrie
