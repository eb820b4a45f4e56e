/*
 * Runtime configuration tests
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <cstdlib>
#include <string>

#include <gtest/gtest.h>

#include "branchdconfig.hpp"
#include "result.hpp"
#include "test_helpers.hpp"

class ConfigTest : public test_helpers::TempDirTest {
  protected:
    void TearDown() override {
        unsetenv("BRANCHD_INSTALL_DIR");
        unsetenv("BRANCHD_RELEASES_URL");
        unsetenv("BRANCHD_DOWNLOAD_URL");
        TempDirTest::TearDown();
    }
};

TEST_F(ConfigTest, InstallDirOverrideIsCreated) {
    const std::string prog_dir = path("data/branchd");
    ASSERT_EQ(setenv("BRANCHD_INSTALL_DIR", prog_dir.c_str(), 1), 0);

    ASSERT_EQ(config::setup_prog_dir(), RESULT_OK);
    EXPECT_STREQ(config::branchd_dir, prog_dir.c_str());
    EXPECT_TRUE(test_helpers::file_exists(prog_dir));
}

TEST_F(ConfigTest, XdgDataHomeIsUsedWithoutOverride) {
    unsetenv("BRANCHD_INSTALL_DIR");
    const char *previous = getenv("XDG_DATA_HOME");
    const std::string saved = previous ? previous : "";
    ASSERT_EQ(setenv("XDG_DATA_HOME", dir.c_str(), 1), 0);

    RESULT result = config::setup_prog_dir();

    if (previous)
        setenv("XDG_DATA_HOME", saved.c_str(), 1);
    else
        unsetenv("XDG_DATA_HOME");

    ASSERT_EQ(result, RESULT_OK);
    EXPECT_EQ(std::string(config::branchd_dir), path("branchd"));
}

TEST_F(ConfigTest, EndpointOverrides) {
    ASSERT_EQ(setenv("BRANCHD_RELEASES_URL", "http://127.0.0.1:8080/latest", 1), 0);
    ASSERT_EQ(setenv("BRANCHD_DOWNLOAD_URL", "http://127.0.0.1:8080/download//", 1), 0);

    ASSERT_EQ(config::setup_endpoints(), RESULT_OK);
    EXPECT_STREQ(config::releases_url, "http://127.0.0.1:8080/latest");
    EXPECT_STREQ(config::download_base_url, "http://127.0.0.1:8080/download");
}

TEST(ConfigTimeouts, BinaryTransfersGetTheLongestBudget) {
    EXPECT_EQ(config::METADATA_TIMEOUT, 10);
    EXPECT_EQ(config::CHECKSUM_TIMEOUT, 30);
    EXPECT_EQ(config::BINARY_TIMEOUT, 300);
}
