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
 * SuffixTrie DomainTrie - Synchronized Domain Suffix Trie
 * ============================================================================
 *
 * DomainSuffixTrie behind one reader-writer lock covering the whole tree.
 * Readers run in parallel; Insert/SetValue exclude every other operation.
 * Results leave the lock as values, never as node pointers.
 *
 * ============================================================================
 */

#pragma once

#include "DomainSuffixTrie.hpp"

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace SuffixTrie {
    namespace DomainTrie {

        template <typename T>
        class SyncDomainSuffixTrie final : public IDomainSuffixTrie<T> {
        public:
            using SnapshotMap = std::unordered_map<std::string, NodeSnapshot<T>>;

            SyncDomainSuffixTrie() = default;
            ~SyncDomainSuffixTrie() override = default;

            // Non-copyable, non-movable
            SyncDomainSuffixTrie(const SyncDomainSuffixTrie&) = delete;
            SyncDomainSuffixTrie& operator=(const SyncDomainSuffixTrie&) = delete;
            SyncDomainSuffixTrie(SyncDomainSuffixTrie&&) = delete;
            SyncDomainSuffixTrie& operator=(SyncDomainSuffixTrie&&) = delete;

            /**
             * @brief Register suffix with value.
             *
             * Thread-safe: acquires exclusive write lock
             */
            [[nodiscard]] TrieStatus Insert(std::string_view suffix, T value) override {
                std::unique_lock<std::shared_mutex> lock(m_mutex);
                return m_trie.Insert(suffix, std::move(value));
            }

            /**
             * @brief Longest structural match for domain.
             *
             * Thread-safe: acquires shared read lock (allows concurrent reads)
             */
            [[nodiscard]] NodeSnapshot<T> Match(std::string_view domain) const {
                std::shared_lock<std::shared_mutex> lock(m_mutex);
                return m_trie.Lookup(domain);
            }

            [[nodiscard]] NodeSnapshot<T> Lookup(std::string_view domain) const override {
                return Match(domain);
            }

            [[nodiscard]] std::optional<T> MatchValue(std::string_view domain) const override {
                std::shared_lock<std::shared_mutex> lock(m_mutex);
                return m_trie.MatchValue(domain);
            }

            [[nodiscard]] std::optional<T> GetValue() const override {
                std::shared_lock<std::shared_mutex> lock(m_mutex);
                return m_trie.GetValue();
            }

            /// @brief Thread-safe: acquires exclusive write lock
            std::optional<T> SetValue(T value) override {
                std::unique_lock<std::shared_mutex> lock(m_mutex);
                return m_trie.SetValue(std::move(value));
            }

            /// @return Snapshot of the root's child for label, nullopt if absent
            [[nodiscard]] std::optional<NodeSnapshot<T>> GetChild(std::string_view label) const {
                std::shared_lock<std::shared_mutex> lock(m_mutex);
                const auto* child = m_trie.GetChild(label);
                if (child == nullptr) {
                    return std::nullopt;
                }
                return child->Snapshot();
            }

            /// @brief Snapshots of the root's children keyed by label
            [[nodiscard]] SnapshotMap GetChildren() const {
                std::shared_lock<std::shared_mutex> lock(m_mutex);
                SnapshotMap result;
                const auto children = m_trie.GetChildren();
                result.reserve(children.size());
                for (const auto& [label, child] : children) {
                    result.emplace(label, child->Snapshot());
                }
                return result;
            }

            [[nodiscard]] std::string GetLabel() const override {
                std::shared_lock<std::shared_mutex> lock(m_mutex);
                return m_trie.GetLabel();
            }

            [[nodiscard]] std::string GetPath() const override {
                std::shared_lock<std::shared_mutex> lock(m_mutex);
                return m_trie.GetPath();
            }

            [[nodiscard]] size_t GetNodeCount() const override {
                std::shared_lock<std::shared_mutex> lock(m_mutex);
                return m_trie.GetNodeCount();
            }

            [[nodiscard]] size_t GetEntryCount() const override {
                std::shared_lock<std::shared_mutex> lock(m_mutex);
                return m_trie.GetEntryCount();
            }

            [[nodiscard]] uint32_t GetHeight() const override {
                std::shared_lock<std::shared_mutex> lock(m_mutex);
                return m_trie.GetHeight();
            }

            /**
             * @brief Visit every node carrying a value under the read lock.
             * @param callback void(const std::string& path, const T& value)
             * @warning The callback must not call Insert/SetValue on this trie (self-deadlock).
             */
            template <typename Callback>
            void ForEach(Callback&& callback) const {
                std::shared_lock<std::shared_mutex> lock(m_mutex);
                m_trie.ForEach(std::forward<Callback>(callback));
            }

        private:
            DomainSuffixTrie<T> m_trie;
            mutable std::shared_mutex m_mutex;  // Single mutex for reader-writer locking
        };

    } // namespace DomainTrie
} // namespace SuffixTrie
