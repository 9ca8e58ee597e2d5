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
#include "../../../src/DomainTrie/DomainTrieFormat.hpp"

#include <string>

using namespace SuffixTrie::DomainTrie;

TEST(DomainTrieFormatTest, TrieStatus_DefaultIsSuccess) {
    TrieStatus st;
    EXPECT_TRUE(st.IsSuccess());
    EXPECT_TRUE(static_cast<bool>(st));
    EXPECT_TRUE(TrieStatus::Success().IsSuccess());
}

TEST(DomainTrieFormatTest, TrieStatus_WithContext_FullMessage) {
    const auto st = TrieStatus::WithContext(TrieError::InvalidSettings, "expected a boolean", "logging.async");

    EXPECT_FALSE(st);
    EXPECT_EQ(st.code, TrieError::InvalidSettings);
    EXPECT_EQ(st.GetFullMessage(), "Invalid settings: expected a boolean [logging.async]");
}

TEST(DomainTrieFormatTest, TrieStatus_CodeOnly_FullMessageIsCodeText) {
    TrieStatus st;
    st.code = TrieError::EmptySuffix;
    EXPECT_EQ(st.GetFullMessage(), "Domain suffix is empty");

    st.Clear();
    EXPECT_TRUE(st.IsSuccess());
    EXPECT_TRUE(st.message.empty());
    EXPECT_TRUE(st.context.empty());
}

TEST(DomainTrieFormatTest, TrieErrorToString_KnownAndUnknown) {
    static_assert(TrieErrorToString(TrieError::Success)[0] == 'S');
    EXPECT_STREQ(TrieErrorToString(TrieError::SettingsFileError), "Settings file could not be read");
    EXPECT_STREQ(TrieErrorToString(TrieError::Unknown), "Unknown error");
    EXPECT_STREQ(TrieErrorToString(static_cast<TrieError>(42)), "Unknown error");
}

TEST(DomainTrieFormatTest, NodeSnapshot_Defaults) {
    NodeSnapshot<int> snap;
    EXPECT_TRUE(snap.IsRoot());
    EXPECT_FALSE(snap.HasValue());

    snap.value = 0;
    EXPECT_TRUE(snap.HasValue());
}
