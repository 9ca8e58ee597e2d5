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
 * SuffixTrie DomainTrie - Shared Types
 * ============================================================================
 *
 * Error codes, status object and node snapshot type shared by the
 * single-threaded trie, the synchronized wrapper and the settings loader.
 *
 * ============================================================================
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace SuffixTrie {
    namespace DomainTrie {

        // ============================================================================
        // CONSTANTS
        // ============================================================================

        /// @brief Separator between domain labels
        inline constexpr char LABEL_SEPARATOR = '.';

        /// @brief Logger category used by the trie containers
        inline constexpr const char* LOG_CATEGORY = "DomainTrie";

        // ============================================================================
        // ERROR HANDLING
        // ============================================================================

        /// @brief Error codes for trie and settings operations
        enum class TrieError : uint32_t {
            Success = 0,

            // Trie errors (1-99)
            EmptySuffix = 1,

            // Settings errors (100-199)
            InvalidSettings = 100,
            SettingsFileError = 101,

            /// @brief Unknown error
            Unknown = 0xFFFFFFFF
        };

        /// @brief Get error message string
        [[nodiscard]] constexpr const char* TrieErrorToString(TrieError error) noexcept {
            switch (error) {
            case TrieError::Success: return "Success";
            case TrieError::EmptySuffix: return "Domain suffix is empty";
            case TrieError::InvalidSettings: return "Invalid settings";
            case TrieError::SettingsFileError: return "Settings file could not be read";
            default: return "Unknown error";
            }
        }

        /// @brief Result of a fallible operation
        struct TrieStatus {
            TrieError code{ TrieError::Success };
            std::string message;
            std::string context;  ///< Offending input (suffix, settings key, file path)

            [[nodiscard]] bool IsSuccess() const noexcept {
                return code == TrieError::Success;
            }

            /// @brief True on success, for if-checks
            [[nodiscard]] explicit operator bool() const noexcept {
                return IsSuccess();
            }

            [[nodiscard]] static TrieStatus Success() noexcept {
                return TrieStatus{};
            }

            [[nodiscard]] static TrieStatus WithMessage(TrieError code, std::string msg) {
                TrieStatus st;
                st.code = code;
                st.message = std::move(msg);
                return st;
            }

            [[nodiscard]] static TrieStatus WithContext(TrieError code, std::string msg, std::string ctx) {
                TrieStatus st;
                st.code = code;
                st.message = std::move(msg);
                st.context = std::move(ctx);
                return st;
            }

            void Clear() noexcept {
                code = TrieError::Success;
                message.clear();
                context.clear();
            }

            /// @brief "<code text>: <message> [<context>]"
            [[nodiscard]] std::string GetFullMessage() const;
        };

        // ============================================================================
        // NODE SNAPSHOT
        // ============================================================================

        /**
         * @brief Value copy of a node's observable state.
         *
         * Returned by lookups that must stay valid after the lock protecting the
         * tree has been released.
         */
        template <typename T>
        struct NodeSnapshot {
            std::string label;          ///< Label of the node ("" for the root)
            std::string path;           ///< Suffix the node represents ("" for the root)
            std::optional<T> value;     ///< Attached value, absent if never set
            size_t depth{ 0 };          ///< Number of labels below the root (0 = root)
            size_t childCount{ 0 };

            [[nodiscard]] bool IsRoot() const noexcept { return depth == 0; }
            [[nodiscard]] bool HasValue() const noexcept { return value.has_value(); }
        };

    } // namespace DomainTrie
} // namespace SuffixTrie
