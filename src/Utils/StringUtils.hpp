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

#include <string>
#include <string_view>
#include <vector>

namespace SuffixTrie {

	namespace Utils {

		namespace StringUtils {

			//Comparing (ASCII only, locale independent)

			bool IEquals(std::string_view s1, std::string_view s2);

			//Splitting & joining

			// Splits by the delimiter and returns views into str; str must outlive the result.
			// Empty segments are kept ("a..b" -> "a", "", "b"). An empty input yields an empty vector.
			std::vector<std::string_view> SplitView(std::string_view str, char delimiter);

			std::string Join(const std::vector<std::string>& elements, std::string_view delimiter);

		}//namespace StringUtils

	}//namespace Utils

}//namespace SuffixTrie
