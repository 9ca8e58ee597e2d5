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
#include "../../../src/Utils/JSONUtils.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace SuffixTrie::Utils;
namespace fs = std::filesystem;

// ============================================================================
// TEST FIXTURE
// ============================================================================
class JSONUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = fs::temp_directory_path() /
            ("suffixtrie_json_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir, ec);
    }

    fs::path WriteFile(const std::string& name, const std::string& content) {
        const fs::path p = tempDir / name;
        std::ofstream ofs(p, std::ios::binary);
        ofs << content;
        return p;
    }

    fs::path tempDir;
};

// ============================================================================
// PARSE
// ============================================================================
TEST_F(JSONUtilsTest, Parse_ValidDocument) {
    JSON::Json j;
    JSON::Error err;
    ASSERT_TRUE(JSON::Parse(R"({"logging":{"level":"debug","maxFileCount":3}})", j, &err));
    EXPECT_FALSE(err.hasError());
    EXPECT_EQ(j["logging"]["level"], "debug");
}

TEST_F(JSONUtilsTest, Parse_Comments_AllowedByDefault) {
    JSON::Json j;
    EXPECT_TRUE(JSON::Parse("{ // note\n \"a\": 1 }", j));

    JSON::ParseOptions strict;
    strict.allowComments = false;
    JSON::Json k;
    EXPECT_FALSE(JSON::Parse("{ // note\n \"a\": 1 }", k, nullptr, strict));
}

TEST_F(JSONUtilsTest, Parse_Malformed_ReportsLineAndColumn) {
    JSON::Json j = JSON::Json::object();
    j["keep"] = true;
    JSON::Error err;

    EXPECT_FALSE(JSON::Parse("{\n  \"a\": ,\n}", j, &err));
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.line, 2u);
    EXPECT_GT(err.column, 1u);
    EXPECT_TRUE(j["keep"].get<bool>());
}

// ============================================================================
// FILES
// ============================================================================
TEST_F(JSONUtilsTest, LoadFromFile_StripsBom) {
    const auto p = WriteFile("bom.json", "\xEF\xBB\xBF{\"x\": 5}");
    JSON::Json j;
    JSON::Error err;

    ASSERT_TRUE(JSON::LoadFromFile(p, j, &err)) << err.message;
    EXPECT_EQ(j["x"], 5);
}

TEST_F(JSONUtilsTest, LoadFromFile_MissingFile_Fails) {
    JSON::Json j;
    JSON::Error err;

    EXPECT_FALSE(JSON::LoadFromFile(tempDir / "nope.json", j, &err));
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.path, tempDir / "nope.json");
}

TEST_F(JSONUtilsTest, LoadFromFile_TooLarge_Fails) {
    const auto p = WriteFile("big.json", "[1,2,3,4,5,6,7,8,9]");
    JSON::Json j;
    JSON::Error err;

    EXPECT_FALSE(JSON::LoadFromFile(p, j, &err, {}, 4));
    EXPECT_NE(err.message.find("too large"), std::string::npos);
}

// ============================================================================
// PATHS / TYPED GETTERS
// ============================================================================
TEST_F(JSONUtilsTest, ToJsonPointer_Conversions) {
    EXPECT_EQ(JSON::ToJsonPointer(""), "/");
    EXPECT_EQ(JSON::ToJsonPointer("/a/b"), "/a/b");
    EXPECT_EQ(JSON::ToJsonPointer("a.b[0].c"), "/a/b/0/c");
    EXPECT_EQ(JSON::ToJsonPointer("x/y"), "/x~1y");
}

TEST_F(JSONUtilsTest, Get_TypedLookup) {
    const JSON::Json j = JSON::Json::parse(R"({"logging":{"async":false,"dirs":["a","b"]}})");

    bool async = true;
    EXPECT_TRUE(JSON::Get(j, "logging.async", async));
    EXPECT_FALSE(async);

    std::string dir;
    EXPECT_TRUE(JSON::Get(j, "logging.dirs[1]", dir));
    EXPECT_EQ(dir, "b");

    int wrongType = 7;
    EXPECT_FALSE(JSON::Get(j, "logging.dirs", wrongType));
    EXPECT_EQ(wrongType, 7);

    std::string missing = "info";
    EXPECT_FALSE(JSON::Get(j, "logging.level", missing));
    EXPECT_EQ(missing, "info");
}
