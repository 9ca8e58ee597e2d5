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
#include "DomainTrieFormat.hpp"

namespace SuffixTrie {
    namespace DomainTrie {

        std::string TrieStatus::GetFullMessage() const {
            std::string result = TrieErrorToString(code);
            if (!message.empty()) {
                result += ": " + message;
            }
            if (!context.empty()) {
                result += " [" + context + "]";
            }
            return result;
        }

    } // namespace DomainTrie
} // namespace SuffixTrie
