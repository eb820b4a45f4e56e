/*
 * Runtime configuration
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cstdlib>
#include <pwd.h>
#include <string>
#include <unistd.h>

#include "branchdconfig.hpp"
#include "macros.hpp"
#include "util.hpp"

#include "fmt/core.h"
#include "fmt/printf.h"

namespace config {

static std::string s_branchd_dir;
static std::string s_releases_url;
static std::string s_download_base_url;
const char *branchd_dir = nullptr;
const char *releases_url = DEFAULT_RELEASES_URL;
const char *download_base_url = DEFAULT_DOWNLOAD_URL;

RESULT setup_prog_dir(void) {
    struct passwd *pw;
    std::string result = {};
    const char *temp_path = getenv("BRANCHD_INSTALL_DIR");

    if (temp_path) {
        autofree char *expanded = expand_path(temp_path);
        if (expanded)
            result = expanded;
    } else if ((temp_path = getenv("XDG_DATA_HOME"))) {
        result = fmt::format("{}/{}", temp_path, PROG_NAME);
    } else if ((temp_path = getenv("HOME")) || ((pw = getpwuid(getuid())) && (temp_path = pw->pw_dir))) {
        result = fmt::format("{}/.local/share/{}", temp_path, PROG_NAME);
    }

    if (result.empty())
        return RESULT_FAIL;

    RESULT ensure_result = ensure_dir(result.c_str());
    if (FAILED(ensure_result)) {
        fmt::fprintf(stderr, "Error: Failed to create or access program directory: %s\n",
                     result_to_string(ensure_result));
        fmt::fprintf(stderr, "Attempted directory: %s\n", result);
        return ensure_result;
    }

    s_branchd_dir = std::move(result);
    branchd_dir = s_branchd_dir.c_str();

    return RESULT_OK;
}

RESULT setup_endpoints(void) {
    const char *env_url = getenv("BRANCHD_RELEASES_URL");
    if (env_url && env_url[0]) {
        s_releases_url = env_url;
        releases_url = s_releases_url.c_str();
    }

    env_url = getenv("BRANCHD_DOWNLOAD_URL");
    if (env_url && env_url[0]) {
        s_download_base_url = env_url;
        /* Artifact URLs are joined onto this */
        while (s_download_base_url.size() > 1 && s_download_base_url.back() == '/')
            s_download_base_url.pop_back();
        download_base_url = s_download_base_url.c_str();
    }

    return RESULT_OK;
}
}; // namespace config
