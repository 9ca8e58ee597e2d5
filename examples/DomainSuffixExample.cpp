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
 * Usage: DomainSuffixExample [settings.json]
 *
 * Builds a small trie of site suffixes and classifies a few hostnames.
 */

#include "Config/TrieSettings.hpp"
#include "DomainTrie/DomainSuffixTrie.hpp"
#include "Utils/Logger.hpp"

#include <cstdio>
#include <optional>
#include <string>

using namespace SuffixTrie;

namespace {

	const char* OrNone(const std::optional<std::string>& value) {
		return value ? value->c_str() : "<none>";
	}

	int Run() {
		ST_LOG_SCOPE("Example");

		DomainTrie::DomainSuffixTrie<std::string> trie;

		const char* suffixes[][2] = {
			{ "google.com", "google main site" },
			{ "map.google.com", "google maps" },
			{ "baidu.com", "baidu main site" },
			{ "jd.com", "jd" },
		};
		for (const auto& entry : suffixes) {
			const auto status = trie.Insert(entry[0], entry[1]);
			if (!status) {
				ST_LOG_ERROR("Example", "%s", status.GetFullMessage().c_str());
				return 1;
			}
		}

		std::printf("%s\n", OrNone(trie.MatchValue("test.google.com")));      // google main site
		std::printf("%s\n", OrNone(trie.MatchValue("test.map.google.com")));  // google maps
		std::printf("%s\n", trie.Match("test.baidu.com")->GetPath().c_str()); // baidu.com
		std::printf("%s\n", trie.Match("test.jd.com")->GetLabel().c_str());   // jd
		std::printf("%s\n", OrNone(trie.MatchValue("example.org")));          // <none>

		ST_LOG_INFO("Example", "%zu suffixes in %zu nodes, height %u",
			trie.GetEntryCount(), trie.GetNodeCount(), trie.GetHeight());
		return 0;
	}

}  // namespace

int main(int argc, char* argv[]) {
	Config::TrieSettings settings;
	if (argc > 1) {
		DomainTrie::TrieStatus status;
		if (!Config::LoadSettingsFromFile(argv[1], settings, &status)) {
			std::fprintf(stderr, "%s\n", status.GetFullMessage().c_str());
			return 1;
		}
	}
	Utils::Logger::Instance().Initialize(settings.logging);

	const int rc = Run();

	Utils::Logger::Instance().ShutDown();
	return rc;
}
