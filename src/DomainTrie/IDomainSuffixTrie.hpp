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
#pragma once

#include "DomainTrieFormat.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace SuffixTrie {
    namespace DomainTrie {

        /**
         * @brief Operations shared by DomainSuffixTrie and SyncDomainSuffixTrie.
         *
         * Lets callers hold either the single-threaded or the synchronized
         * container behind one type. Every result is returned by value.
         *
         * Root-level accessors (GetValue/SetValue/GetLabel/GetPath) act on the
         * root node, whose label and path are both empty.
         */
        template <typename T>
        class IDomainSuffixTrie {
        public:
            virtual ~IDomainSuffixTrie() = default;

            /// @brief Register a suffix, overwriting the value of an existing one
            /// @return EmptySuffix if suffix is empty (tree untouched), Success otherwise
            [[nodiscard]] virtual TrieStatus Insert(std::string_view suffix, T value) = 0;

            /// @brief Longest structural match for domain, copied out of the tree
            [[nodiscard]] virtual NodeSnapshot<T> Lookup(std::string_view domain) const = 0;

            /// @brief Value of the longest structural match (absent on root or intermediate nodes)
            [[nodiscard]] virtual std::optional<T> MatchValue(std::string_view domain) const = 0;

            [[nodiscard]] virtual std::optional<T> GetValue() const = 0;

            /// @return The previous root value
            virtual std::optional<T> SetValue(T value) = 0;

            [[nodiscard]] virtual std::string GetLabel() const = 0;
            [[nodiscard]] virtual std::string GetPath() const = 0;

            /// @brief Number of nodes, root included
            [[nodiscard]] virtual size_t GetNodeCount() const = 0;

            /// @brief Number of nodes carrying a value
            [[nodiscard]] virtual size_t GetEntryCount() const = 0;

            /// @brief Length of the longest label chain below the root
            [[nodiscard]] virtual uint32_t GetHeight() const = 0;
        };

    } // namespace DomainTrie
} // namespace SuffixTrie
