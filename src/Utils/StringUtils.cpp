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
#include "StringUtils.hpp"

#include <algorithm>

namespace SuffixTrie {
	namespace Utils {
		namespace StringUtils {

            bool IEquals(std::string_view s1, std::string_view s2) {
                if (s1.size() != s2.size()) {
                    return false;
                }
                for (size_t i = 0; i < s1.size(); ++i) {
                    unsigned char a = static_cast<unsigned char>(s1[i]);
                    unsigned char b = static_cast<unsigned char>(s2[i]);
                    if (a >= 'A' && a <= 'Z') a = static_cast<unsigned char>(a + ('a' - 'A'));
                    if (b >= 'A' && b <= 'Z') b = static_cast<unsigned char>(b + ('a' - 'A'));
                    if (a != b) {
                        return false;
                    }
                }
                return true;
            }

            std::vector<std::string_view> SplitView(std::string_view str, char delimiter) {
                std::vector<std::string_view> result;
                if (str.empty()) {
                    return result;
                }
                result.reserve(static_cast<size_t>(std::count(str.begin(), str.end(), delimiter)) + 1);
                size_t last = 0;
                size_t next = 0;
                while ((next = str.find(delimiter, last)) != std::string_view::npos) {
                    result.push_back(str.substr(last, next - last));
                    last = next + 1;
                }
                result.push_back(str.substr(last));
                return result;
            }

            std::string Join(const std::vector<std::string>& elements, std::string_view delimiter) {
                std::string result;
                if (elements.empty()) {
                    return result;
                }
                size_t total_size = (elements.size() - 1) * delimiter.size();
                for (const auto& s : elements) {
                    total_size += s.size();
                }
                result.reserve(total_size);
                result += elements[0];
                for (size_t i = 1; i < elements.size(); ++i) {
                    result += delimiter;
                    result += elements[i];
                }
                return result;
            }

		}//namespace StringUtils
	}//namespace Utils
}//namespace SuffixTrie
