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
#include "TrieSettings.hpp"

#include "../Utils/StringUtils.hpp"

#include <cstdint>
#include <exception>
#include <string>
#include <utility>

namespace SuffixTrie {
    namespace Config {

        using DomainTrie::TrieError;
        using DomainTrie::TrieStatus;
        using Utils::JSON::Json;

        namespace {

            void setErr(TrieStatus* err, TrieError code, std::string msg, std::string ctx) {
                if (!err) return;
                *err = TrieStatus::WithContext(code, std::move(msg), std::move(ctx));
            }

            /// Reads one optional key of a settings section; reports type errors
            class SectionReader {
            public:
                SectionReader(const Json& section, std::string prefix, TrieStatus* err)
                    : m_section(section), m_prefix(std::move(prefix)), m_err(err) {}

                [[nodiscard]] bool Ok() const noexcept { return m_ok; }

                void Bool(const char* key, bool& out) {
                    if (!Present(key)) return;
                    if (!Utils::JSON::Get(m_section, key, out)) {
                        Fail(key, "expected a boolean");
                    }
                }

                void String(const char* key, std::string& out) {
                    if (!Present(key)) return;
                    if (!m_section.at(key).is_string() || !Utils::JSON::Get(m_section, key, out)) {
                        Fail(key, "expected a string");
                    }
                }

                template <typename U>
                void Unsigned(const char* key, U& out) {
                    if (!Present(key)) return;
                    const Json& v = m_section.at(key);
                    if (!v.is_number_unsigned()) {
                        Fail(key, "expected a non-negative integer");
                        return;
                    }
                    out = static_cast<U>(v.get<uint64_t>());
                }

                void Level(const char* key, Utils::LogLevel& out) {
                    std::string name;
                    if (!Present(key)) return;
                    String(key, name);
                    if (!m_ok) return;
                    const auto level = ParseLogLevel(name);
                    if (!level) {
                        Fail(key, "unknown log level '" + name + "'");
                        return;
                    }
                    out = *level;
                }

                void Policy(const char* key, Utils::LoggerConfig::BackPressurePolicy& out) {
                    std::string name;
                    if (!Present(key)) return;
                    String(key, name);
                    if (!m_ok) return;
                    const auto policy = ParseBackPressurePolicy(name);
                    if (!policy) {
                        Fail(key, "unknown back-pressure policy '" + name + "'");
                        return;
                    }
                    out = *policy;
                }

            private:
                [[nodiscard]] bool Present(const char* key) const {
                    return m_ok && m_section.contains(key);
                }

                void Fail(const char* key, std::string msg) {
                    if (!m_ok) return;
                    m_ok = false;
                    setErr(m_err, TrieError::InvalidSettings, std::move(msg), m_prefix + "." + key);
                }

                const Json& m_section;
                std::string m_prefix;
                TrieStatus* m_err;
                bool m_ok = true;
            };

        } // namespace

        std::optional<Utils::LogLevel> ParseLogLevel(std::string_view name) noexcept {
            using Utils::StringUtils::IEquals;
            if (IEquals(name, "trace")) return Utils::LogLevel::Trace;
            if (IEquals(name, "debug")) return Utils::LogLevel::Debug;
            if (IEquals(name, "info")) return Utils::LogLevel::Info;
            if (IEquals(name, "warn") || IEquals(name, "warning")) return Utils::LogLevel::Warn;
            if (IEquals(name, "error")) return Utils::LogLevel::Error;
            if (IEquals(name, "fatal")) return Utils::LogLevel::Fatal;
            return std::nullopt;
        }

        std::optional<Utils::LoggerConfig::BackPressurePolicy> ParseBackPressurePolicy(std::string_view name) noexcept {
            using Utils::StringUtils::IEquals;
            using Policy = Utils::LoggerConfig::BackPressurePolicy;
            if (IEquals(name, "block")) return Policy::Block;
            if (IEquals(name, "dropOldest")) return Policy::DropOldest;
            if (IEquals(name, "dropNewest")) return Policy::DropNewest;
            return std::nullopt;
        }

        bool LoadSettingsFromJson(const Json& root, TrieSettings& settings, TrieStatus* err) noexcept {
            try {
                if (!root.is_object()) {
                    setErr(err, TrieError::InvalidSettings, "settings document must be a JSON object", "/");
                    return false;
                }

                TrieSettings next = settings;

                if (root.contains("logging")) {
                    const Json& logging = root.at("logging");
                    if (!logging.is_object()) {
                        setErr(err, TrieError::InvalidSettings, "expected an object", "logging");
                        return false;
                    }

                    Utils::LoggerConfig& cfg = next.logging;
                    SectionReader reader(logging, "logging", err);
                    reader.Level("level", cfg.minimalLevel);
                    reader.Level("flushLevel", cfg.flushLevel);
                    reader.Bool("async", cfg.async);
                    reader.Bool("toConsole", cfg.toConsole);
                    reader.Bool("toFile", cfg.toFile);
                    reader.Bool("jsonLines", cfg.jsonLines);
                    reader.Bool("useUtcTime", cfg.useUtcTime);
                    reader.Bool("includeSourceLocation", cfg.includeSrcLocation);
                    reader.Bool("includeProcThreadId", cfg.includeProcThreadId);
                    reader.String("directory", cfg.logDirectory);
                    reader.String("baseFileName", cfg.baseFileName);
                    reader.Unsigned("maxFileSizeBytes", cfg.maxFileSizeBytes);
                    reader.Unsigned("maxFileCount", cfg.maxFileCount);
                    reader.Unsigned("maxQueueSize", cfg.maxQueueSize);
                    reader.Policy("backPressure", cfg.bpPolicy);
                    if (!reader.Ok()) {
                        return false;
                    }

                    if (cfg.maxQueueSize == 0) {
                        setErr(err, TrieError::InvalidSettings, "must be greater than zero", "logging.maxQueueSize");
                        return false;
                    }
                }

                settings = std::move(next);
                return true;
            }
            catch (const std::exception& e) {
                setErr(err, TrieError::InvalidSettings, e.what(), {});
                return false;
            }
        }

        bool LoadSettingsFromFile(const std::filesystem::path& path, TrieSettings& settings, TrieStatus* err) noexcept {
            Json root;
            Utils::JSON::Error jsonErr;
            if (!Utils::JSON::LoadFromFile(path, root, &jsonErr)) {
                std::string msg = jsonErr.message;
                if (jsonErr.line != 0) {
                    msg += " (line " + std::to_string(jsonErr.line) + ", column " + std::to_string(jsonErr.column) + ")";
                }
                setErr(err, TrieError::SettingsFileError, std::move(msg), path.string());
                return false;
            }
            return LoadSettingsFromJson(root, settings, err);
        }

    } // namespace Config
} // namespace SuffixTrie
