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
#include "JSONUtils.hpp"

#include <fstream>

namespace SuffixTrie {
	namespace Utils {
		namespace JSON {

            namespace {

                void fillLineCol(std::string_view text, size_t byteOffset, size_t& line, size_t& col) {
                    line = 1; col = 1;
                    if (byteOffset > text.size()) byteOffset = text.size();
                    for (size_t i = 0; i < byteOffset; ++i) {
                        if (text[i] == '\n') { ++line; col = 1; }
                        else { ++col; }
                    }
                }

                void setParseErr(Error* err, std::string msg, const std::filesystem::path& p, std::string_view text, size_t byteOff) {
                    if (!err) return;
                    err->message = std::move(msg);
                    err->path = p;
                    err->byteOffset = byteOff;
                    fillLineCol(text, byteOff, err->line, err->column);
                }

                void setIoErr(Error* err, const std::string& what, const std::filesystem::path& p, const std::string& sysMsg = {}) {
                    if (!err) return;
                    err->message = what;
                    if (!sysMsg.empty()) {
                        err->message += ": ";
                        err->message += sysMsg;
                    }
                    err->path = p;
                    err->byteOffset = 0;
                    err->line = 0;
                    err->column = 0;
                }

                void stripUtf8BOM(std::string& s) {
                    if (s.size() >= 3 &&
                        static_cast<unsigned char>(s[0]) == 0xEF &&
                        static_cast<unsigned char>(s[1]) == 0xBB &&
                        static_cast<unsigned char>(s[2]) == 0xBF) {
                        s.erase(0, 3);
                    }
                }

                void appendPointerToken(std::string& pointer, std::string_view token) {
                    pointer.push_back('/');
                    for (char c : token) {
                        if (c == '~') pointer += "~0";
                        else if (c == '/') pointer += "~1";
                        else pointer.push_back(c);
                    }
                }

                bool parseText(std::string_view text, Json& out, Error* err,
                               const ParseOptions& opt, const std::filesystem::path& origin) noexcept {
                    try {
                        Json parsed = Json::parse(text.begin(), text.end(), /*cb*/nullptr,
                                                  /*allow_exceptions*/true, /*ignore_comments*/opt.allowComments);
                        out = std::move(parsed);
                        return true;
                    }
                    catch (const Json::parse_error& e) {
                        // e.byte is 1-based
                        const size_t byteOff = e.byte > 0 ? static_cast<size_t>(e.byte - 1) : 0;
                        setParseErr(err, e.what(), origin, text, byteOff);
                        return false;
                    }
                    catch (const std::exception& e) {
                        setParseErr(err, e.what(), origin, text, 0);
                        return false;
                    }
                }

            } // namespace

            std::string ToJsonPointer(std::string_view pathLike) noexcept {
                if (pathLike.empty()) {
                    return "/";
                }
                if (pathLike.front() == '/') {
                    return std::string(pathLike);
                }

                // "a.b[0].c" -> "/a/b/0/c"
                std::string pointer;
                pointer.reserve(pathLike.size() + 8);

                std::string cur;
                bool inBracket = false;
                for (char c : pathLike) {
                    if (inBracket) {
                        if (c == ']') {
                            appendPointerToken(pointer, cur);
                            cur.clear();
                            inBracket = false;
                        }
                        else {
                            cur.push_back(c);
                        }
                    }
                    else if (c == '.') {
                        if (!cur.empty()) {
                            appendPointerToken(pointer, cur);
                            cur.clear();
                        }
                    }
                    else if (c == '[') {
                        if (!cur.empty()) {
                            appendPointerToken(pointer, cur);
                            cur.clear();
                        }
                        inBracket = true;
                    }
                    else {
                        cur.push_back(c);
                    }
                }
                if (!cur.empty()) {
                    appendPointerToken(pointer, cur);
                }
                return pointer.empty() ? std::string("/") : pointer;
            }

            bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
                return parseText(jsonText, out, err, opt, {});
            }

            bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err, const ParseOptions& opt, size_t maxBytes) noexcept {
                try {
                    std::error_code ec;
                    const auto sz = std::filesystem::file_size(path, ec);
                    if (ec) {
                        setIoErr(err, "Failed to get file size", path, ec.message());
                        return false;
                    }
                    if (sz > static_cast<uintmax_t>(maxBytes)) {
                        setIoErr(err, "File too large", path);
                        return false;
                    }

                    std::ifstream ifs(path, std::ios::in | std::ios::binary);
                    if (!ifs) {
                        setIoErr(err, "Failed to open file", path);
                        return false;
                    }

                    std::string buf(static_cast<size_t>(sz), '\0');
                    if (sz > 0) {
                        ifs.read(buf.data(), static_cast<std::streamsize>(sz));
                        if (!ifs) {
                            setIoErr(err, "Failed to read file", path);
                            return false;
                        }
                    }
                    stripUtf8BOM(buf);

                    return parseText(buf, out, err, opt, path);
                }
                catch (const std::exception& e) {
                    setIoErr(err, e.what(), path);
                    return false;
                }
            }

		} // namespace JSON
	} // namespace Utils
} // namespace SuffixTrie
