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
#include <gtest/gtest.h>
#include "../../../src/Config/TrieSettings.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace SuffixTrie;
using namespace SuffixTrie::Config;
using Utils::JSON::Json;
using Utils::LogLevel;
using Policy = Utils::LoggerConfig::BackPressurePolicy;
namespace fs = std::filesystem;

// ============================================================================
// TEST FIXTURE
// ============================================================================
class TrieSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = fs::temp_directory_path() /
            ("suffixtrie_cfg_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir, ec);
    }

    fs::path tempDir;
    TrieSettings settings;
    DomainTrie::TrieStatus status;
};

// ============================================================================
// NAME PARSING
// ============================================================================
TEST_F(TrieSettingsTest, ParseLogLevel_CaseInsensitive) {
    EXPECT_EQ(ParseLogLevel("TRACE"), LogLevel::Trace);
    EXPECT_EQ(ParseLogLevel("Debug"), LogLevel::Debug);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(ParseLogLevel("fatal"), LogLevel::Fatal);
    EXPECT_FALSE(ParseLogLevel("verbose").has_value());
    EXPECT_FALSE(ParseLogLevel("").has_value());
}

TEST_F(TrieSettingsTest, ParseBackPressurePolicy_Names) {
    EXPECT_EQ(ParseBackPressurePolicy("block"), Policy::Block);
    EXPECT_EQ(ParseBackPressurePolicy("DROPOLDEST"), Policy::DropOldest);
    EXPECT_EQ(ParseBackPressurePolicy("dropNewest"), Policy::DropNewest);
    EXPECT_FALSE(ParseBackPressurePolicy("drop").has_value());
}

// ============================================================================
// JSON DOCUMENTS
// ============================================================================
TEST_F(TrieSettingsTest, LoadFromJson_EmptyObject_KeepsDefaults) {
    ASSERT_TRUE(LoadSettingsFromJson(Json::object(), settings, &status));

    const Utils::LoggerConfig defaults{};
    EXPECT_EQ(settings.logging.minimalLevel, defaults.minimalLevel);
    EXPECT_EQ(settings.logging.async, defaults.async);
    EXPECT_EQ(settings.logging.baseFileName, "SuffixTrie");
}

TEST_F(TrieSettingsTest, LoadFromJson_AllKeysApplied) {
    const Json doc = Json::parse(R"({
        "logging": {
            "level": "debug",
            "flushLevel": "warn",
            "async": false,
            "toConsole": false,
            "toFile": true,
            "jsonLines": true,
            "useUtcTime": false,
            "includeSourceLocation": false,
            "includeProcThreadId": false,
            "directory": "/var/log/suffixtrie",
            "baseFileName": "matcher",
            "maxFileSizeBytes": 4096,
            "maxFileCount": 3,
            "maxQueueSize": 64,
            "backPressure": "block"
        },
        "unrelated": { "ignored": true }
    })");

    ASSERT_TRUE(LoadSettingsFromJson(doc, settings, &status)) << status.GetFullMessage();

    const auto& log = settings.logging;
    EXPECT_EQ(log.minimalLevel, LogLevel::Debug);
    EXPECT_EQ(log.flushLevel, LogLevel::Warn);
    EXPECT_FALSE(log.async);
    EXPECT_FALSE(log.toConsole);
    EXPECT_TRUE(log.toFile);
    EXPECT_TRUE(log.jsonLines);
    EXPECT_FALSE(log.useUtcTime);
    EXPECT_FALSE(log.includeSrcLocation);
    EXPECT_FALSE(log.includeProcThreadId);
    EXPECT_EQ(log.logDirectory, "/var/log/suffixtrie");
    EXPECT_EQ(log.baseFileName, "matcher");
    EXPECT_EQ(log.maxFileSizeBytes, 4096u);
    EXPECT_EQ(log.maxFileCount, 3u);
    EXPECT_EQ(log.maxQueueSize, 64u);
    EXPECT_EQ(log.bpPolicy, Policy::Block);
}

TEST_F(TrieSettingsTest, LoadFromJson_WrongType_LeavesSettingsUnchanged) {
    const Json doc = Json::parse(R"({"logging":{"level":"error","async":"yes"}})");

    EXPECT_FALSE(LoadSettingsFromJson(doc, settings, &status));
    EXPECT_EQ(status.code, DomainTrie::TrieError::InvalidSettings);
    EXPECT_EQ(status.context, "logging.async");
    EXPECT_EQ(settings.logging.minimalLevel, LogLevel::Info);
}

TEST_F(TrieSettingsTest, LoadFromJson_UnknownLevel_Fails) {
    const Json doc = Json::parse(R"({"logging":{"flushLevel":"loud"}})");

    EXPECT_FALSE(LoadSettingsFromJson(doc, settings, &status));
    EXPECT_EQ(status.context, "logging.flushLevel");
    EXPECT_NE(status.message.find("loud"), std::string::npos);
}

TEST_F(TrieSettingsTest, LoadFromJson_NegativeOrZeroSizes_Fail) {
    EXPECT_FALSE(LoadSettingsFromJson(Json::parse(R"({"logging":{"maxFileCount":-1}})"), settings, &status));
    EXPECT_EQ(status.context, "logging.maxFileCount");

    EXPECT_FALSE(LoadSettingsFromJson(Json::parse(R"({"logging":{"maxQueueSize":0}})"), settings, &status));
    EXPECT_EQ(status.context, "logging.maxQueueSize");
}

TEST_F(TrieSettingsTest, LoadFromJson_NonObjectSections_Fail) {
    EXPECT_FALSE(LoadSettingsFromJson(Json::array(), settings, &status));
    EXPECT_EQ(status.code, DomainTrie::TrieError::InvalidSettings);

    EXPECT_FALSE(LoadSettingsFromJson(Json::parse(R"({"logging":true})"), settings, &status));
    EXPECT_EQ(status.context, "logging");
}

// ============================================================================
// FILES
// ============================================================================
TEST_F(TrieSettingsTest, LoadFromFile_ValidFile) {
    const fs::path p = tempDir / "settings.json";
    {
        std::ofstream ofs(p);
        ofs << "{\n  // comments allowed\n  \"logging\": { \"backPressure\": \"dropNewest\" }\n}\n";
    }

    ASSERT_TRUE(LoadSettingsFromFile(p, settings, &status)) << status.GetFullMessage();
    EXPECT_EQ(settings.logging.bpPolicy, Policy::DropNewest);
}

TEST_F(TrieSettingsTest, LoadFromFile_Missing_ReportsFileError) {
    const fs::path p = tempDir / "absent.json";

    EXPECT_FALSE(LoadSettingsFromFile(p, settings, &status));
    EXPECT_EQ(status.code, DomainTrie::TrieError::SettingsFileError);
    EXPECT_EQ(status.context, p.string());
}

TEST_F(TrieSettingsTest, LoadFromFile_Malformed_ReportsFileErrorWithLine) {
    const fs::path p = tempDir / "broken.json";
    {
        std::ofstream ofs(p);
        ofs << "{\n\"logging\": {\n";
    }

    EXPECT_FALSE(LoadSettingsFromFile(p, settings, &status));
    EXPECT_EQ(status.code, DomainTrie::TrieError::SettingsFileError);
    EXPECT_NE(status.message.find("(line "), std::string::npos);
}
