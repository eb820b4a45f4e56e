/*
 * Release lookup and version comparison tests
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <cstring>
#include <string>

#include <gtest/gtest.h>

#include "result.hpp"
#include "test_helpers.hpp"
#include "version.hpp"

using test_helpers::TempDirTest;

TEST(VersionCompare, SameTagIsNotStale) {
    EXPECT_FALSE(version_is_stale("1.2.3", "1.2.3"));
    EXPECT_FALSE(version_is_stale("v1.2.3", "v1.2.3"));
}

TEST(VersionCompare, LeadingVIsIgnored) {
    EXPECT_FALSE(version_is_stale("v1.2.3", "1.2.3"));
    EXPECT_FALSE(version_is_stale("1.2.3", "v1.2.3"));
}

TEST(VersionCompare, DifferentTagIsStale) {
    EXPECT_TRUE(version_is_stale("v1.0.0", "v1.1.0"));
    EXPECT_TRUE(version_is_stale("1.0.0", "v2.0.0"));
}

TEST(VersionCompare, OlderPublishedTagStillCountsAsStale) {
    /* plain inequality, no ordering */
    EXPECT_TRUE(version_is_stale("v2.0.0", "v1.9.9"));
}

TEST(VersionCompare, DevBuildsAreAlwaysStale) {
    EXPECT_TRUE(version_is_stale(DEV_VERSION, "v1.0.0"));
    EXPECT_TRUE(version_is_stale("vdev", "v1.0.0"));
    EXPECT_TRUE(version_is_stale(DEV_VERSION, "dev"));
}

TEST(VersionCompare, MissingCurrentVersionIsStale) {
    EXPECT_TRUE(version_is_stale(nullptr, "v1.0.0"));
    EXPECT_TRUE(version_is_stale("", "v1.0.0"));
    /* nothing left once the prefix is gone */
    EXPECT_TRUE(version_is_stale("v", "v"));
    EXPECT_TRUE(version_is_stale("v", "v1.0.0"));
}

TEST(VersionCompare, MissingLatestIsNotStale) { EXPECT_FALSE(version_is_stale("v1.0.0", nullptr)); }

TEST(ReleaseInfo, ParsesRegistryResponse) {
    const char *json = R"({"tag_name": "v1.4.0", "name": "Release 1.4.0",
                           "html_url": "https://example.invalid/releases/v1.4.0", "draft": false})";
    release_info release;
    ASSERT_EQ(parse_release_info(json, strlen(json), release), RESULT_OK);
    EXPECT_EQ(release.tag, "v1.4.0");
    EXPECT_EQ(release.name, "Release 1.4.0");
    EXPECT_EQ(release.html_url, "https://example.invalid/releases/v1.4.0");
}

TEST(ReleaseInfo, OptionalFieldsMayBeAbsent) {
    const char *json = R"({"tag_name": "v0.9.1"})";
    release_info release;
    ASSERT_EQ(parse_release_info(json, strlen(json), release), RESULT_OK);
    EXPECT_EQ(release.tag, "v0.9.1");
    EXPECT_TRUE(release.name.empty());
    EXPECT_TRUE(release.html_url.empty());
}

TEST(ReleaseInfo, RejectsMalformedPayloads) {
    const char *payloads[] = {
        "",
        "not json at all",
        R"({"tag_name": )",
        R"(["v1.0.0"])",
        R"({"name": "no tag"})",
        R"({"tag_name": ""})",
        R"({"tag_name": 12})",
        R"({"tag_name": null})",
    };

    for (const char *payload : payloads) {
        release_info release;
        RESULT result = parse_release_info(payload, strlen(payload), release);
        EXPECT_TRUE(FAILED(result)) << payload;
        EXPECT_TRUE(RESULT_IS(result, CAT_JSON, E_PARSE_ERROR)) << payload;
    }
}

class FetchLatestRelease : public TempDirTest {};

TEST_F(FetchLatestRelease, ReadsDescriptorFromUrl) {
    const std::string descriptor = path("latest.json");
    ASSERT_TRUE(test_helpers::write_file(descriptor, R"({"tag_name": "v3.1.4", "name": "pi"})"));

    release_info release;
    ASSERT_EQ(fetch_latest_release(test_helpers::file_url(descriptor).c_str(), release), RESULT_OK);
    EXPECT_EQ(release.tag, "v3.1.4");
    EXPECT_EQ(release.name, "pi");
}

TEST_F(FetchLatestRelease, MalformedDescriptorIsAParseError) {
    const std::string descriptor = path("latest.json");
    ASSERT_TRUE(test_helpers::write_file(descriptor, "<html>rate limited</html>"));

    release_info release;
    RESULT result = fetch_latest_release(test_helpers::file_url(descriptor).c_str(), release);
    EXPECT_TRUE(RESULT_IS(result, CAT_JSON, E_PARSE_ERROR));
    EXPECT_TRUE(release.tag.empty());
}

TEST_F(FetchLatestRelease, UnreachableRegistryIsANetworkError) {
    release_info release;
    RESULT result = fetch_latest_release(test_helpers::file_url(path("missing.json")).c_str(), release);
    EXPECT_TRUE(FAILED(result));
    EXPECT_EQ(RESULT_CATEGORY(result), CAT_NETWORK);
}

TEST(FetchLatestReleaseHttp, ErrorStatusIsNotParsed) {
    /* a well-formed body doesn't make a rate-limited response usable */
    test_helpers::HttpStub server(403, R"({"tag_name": "v9.9.9"})");
    ASSERT_TRUE(server.ready());

    release_info release;
    RESULT result = fetch_latest_release(server.url("/releases/latest").c_str(), release);
    EXPECT_TRUE(RESULT_IS(result, CAT_NETWORK, E_HTTP_STATUS));
    EXPECT_TRUE(release.tag.empty());
}
