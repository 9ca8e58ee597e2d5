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
 * @file TrieSettings.hpp
 * @brief Runtime settings for applications embedding SuffixTrie.
 *
 * Settings are read from a JSON document of the form:
 * @code
 *   {
 *     "logging": {
 *       "level": "debug",
 *       "async": true,
 *       "toConsole": true,
 *       "toFile": true,
 *       "directory": "logs",
 *       "baseFileName": "SuffixTrie",
 *       "jsonLines": false,
 *       "maxFileSizeBytes": 10485760,
 *       "maxFileCount": 10,
 *       "maxQueueSize": 1000,
 *       "backPressure": "dropOldest"
 *     }
 *   }
 * @endcode
 * Missing keys keep their defaults, unknown keys are ignored.
 */

#include "../DomainTrie/DomainTrieFormat.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace SuffixTrie {
    namespace Config {

        struct TrieSettings {
            Utils::LoggerConfig logging{};
        };

        /// @brief Parse "trace".."fatal" (case-insensitive)
        [[nodiscard]] std::optional<Utils::LogLevel> ParseLogLevel(std::string_view name) noexcept;

        /// @brief Parse "block", "dropOldest", "dropNewest" (case-insensitive)
        [[nodiscard]] std::optional<Utils::LoggerConfig::BackPressurePolicy> ParseBackPressurePolicy(std::string_view name) noexcept;

        /**
         * @brief Apply a parsed JSON document on top of settings.
         *
         * On failure settings is left unchanged.
         *
         * @param err Optional error output (InvalidSettings, context = offending key)
         * @return true on success
         */
        [[nodiscard]] bool LoadSettingsFromJson(const Utils::JSON::Json& root,
                                                TrieSettings& settings,
                                                DomainTrie::TrieStatus* err = nullptr) noexcept;

        /**
         * @brief Read and apply a JSON settings file.
         *
         * @param err Optional error output (SettingsFileError or InvalidSettings)
         * @return true on success
         */
        [[nodiscard]] bool LoadSettingsFromFile(const std::filesystem::path& path,
                                                TrieSettings& settings,
                                                DomainTrie::TrieStatus* err = nullptr) noexcept;

    } // namespace Config
} // namespace SuffixTrie
