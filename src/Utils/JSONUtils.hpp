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
/**
 * @file JSONUtils.hpp
 * @brief JSON parsing and typed lookup helpers for SuffixTrie settings.
 *
 * Provides:
 * - Safe parsing with size limits
 * - File loading (UTF-8 BOM stripped)
 * - JSON Pointer and dot/bracket path navigation
 * - Typed getters
 *
 * Implementation uses the nlohmann/json library.
 *
 * @note All functions are noexcept and return success/failure status.
 */

#include <cstddef>
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace SuffixTrie {
	namespace Utils {
		namespace JSON {

			/// @brief Type alias for nlohmann::json
			using Json = nlohmann::json;

			/// Default file size limit for LoadFromFile (4MB)
			inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 4ULL * 1024 * 1024;

			// ============================================================================
			// Error Handling
			// ============================================================================

			/**
			 * @brief Error information structure for JSON operations.
			 *
			 * Captures file path, byte offset, and approximate line/column for
			 * parse errors.
			 */
			struct Error {
				std::string message;              ///< Human-readable error description
				std::filesystem::path path;       ///< File path (if applicable)
				size_t byteOffset = 0;            ///< Byte offset in JSON text (0 = unknown)
				size_t line = 0;                  ///< Approximate line number (1-based, 0 = unknown)
				size_t column = 0;                ///< Approximate column number (1-based, 0 = unknown)

				[[nodiscard]] bool hasError() const noexcept {
					return !message.empty();
				}

				void clear() noexcept {
					message.clear();
					path.clear();
					byteOffset = 0;
					line = 0;
					column = 0;
				}
			};

			/**
			 * @brief Options for JSON parsing operations.
			 */
			struct ParseOptions {
				bool allowComments = true;         ///< Allow // and /* */ comments
			};

			// ============================================================================
			// Parsing
			// ============================================================================

			/**
			 * @brief Parse JSON text into a Json object.
			 *
			 * @param jsonText Input JSON text
			 * @param out Output Json object (unchanged on failure)
			 * @param err Optional error output
			 * @param opt Parse options
			 * @return true on success, false on parse error
			 */
			[[nodiscard]] bool Parse(std::string_view jsonText, Json& out, Error* err = nullptr,
			                         const ParseOptions& opt = {}) noexcept;

			/**
			 * @brief Load JSON from file.
			 *
			 * @param path File path to load
			 * @param out Output Json object
			 * @param err Optional error output
			 * @param opt Parse options
			 * @param maxBytes Maximum file size in bytes
			 * @return true on success, false on error
			 */
			[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Json& out,
			                                Error* err = nullptr, const ParseOptions& opt = {},
			                                size_t maxBytes = DEFAULT_MAX_FILE_SIZE) noexcept;

			// ============================================================================
			// JSON Pointer / Path Helpers
			// ============================================================================

			/**
			 * @brief Convert path-like string to JSON Pointer.
			 *
			 * Accepts either JSON Pointer ("/a/b/0") or dot/bracket notation ("a.b[0].c").
			 */
			[[nodiscard]] std::string ToJsonPointer(std::string_view pathLike) noexcept;

			// ============================================================================
			// Typed Getters
			// ============================================================================

			/**
			 * @brief Get typed value from Json using path.
			 *
			 * @return true if path exists and conversion succeeded; out is unchanged otherwise
			 */
			template <typename T>
			[[nodiscard]] bool Get(const Json& j, std::string_view pathLike, T& out) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);

					if (jp == "/") {
						out = j.template get<T>();
						return true;
					}

					const Json::json_pointer ptr(jp);
					if (!j.contains(ptr)) {
						return false;
					}
					out = j.at(ptr).template get<T>();
					return true;
				}
				catch (const std::exception&) {
					return false;
				}
			}

		} // namespace JSON
	} // namespace Utils
} // namespace SuffixTrie
