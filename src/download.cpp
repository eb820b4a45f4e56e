/*
 * Platform artifact resolution and download
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cstring>

#include "branchdconfig.hpp"
#include "download.hpp"
#include "log.hpp"

struct platform_artifact {
    const char *os;
    const char *arch;
    const char *name;
};

static constexpr platform_artifact artifact_matrix[] = {
    {"linux", "amd64", PROG_NAME "-linux-amd64"},
    {"linux", "arm64", PROG_NAME "-linux-arm64"},
    {"darwin", "amd64", PROG_NAME "-darwin-amd64"},
    {"darwin", "arm64", PROG_NAME "-darwin-arm64"},
    {"windows", "amd64", PROG_NAME "-windows-amd64.exe"},
};

const char *build_target_os(void) {
#if defined(__linux__)
    return "linux";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(_WIN32)
    return "windows";
#else
    return "unknown";
#endif
}

const char *build_target_arch(void) {
#if defined(__x86_64__) || defined(_M_X64)
    return "amd64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#else
    return "unknown";
#endif
}

RESULT resolve_platform_artifact(const char *os, const char *arch, const char **name) {
    if (!name)
        return MAKE_RESULT(SEV_ERROR, CAT_UPDATE, E_INVALID_ARG);

    *name = nullptr;
    if (os && arch) {
        for (size_t i = 0; i < ARRAY_SIZE(artifact_matrix); i++) {
            if (STRING_EQUALS(artifact_matrix[i].os, os) && STRING_EQUALS(artifact_matrix[i].arch, arch)) {
                *name = artifact_matrix[i].name;
                return RESULT_OK;
            }
        }
    }

    LOG_ERROR("Unsupported platform: %s/%s (no release artifact is published for it)", os ? os : "(null)",
              arch ? arch : "(null)");
    return MAKE_RESULT(SEV_ERROR, CAT_UPDATE, E_NOT_SUPPORTED);
}

char *build_artifact_url(const char *base_url, const char *tag, const char *artifact_name) {
    char *url = nullptr;
    join_paths(url, base_url, tag, artifact_name);
    return url;
}

RESULT download_artifact(const char *url, downloaded_artifact *artifact) {
    if (!url || !artifact)
        return MAKE_RESULT(SEV_ERROR, CAT_UPDATE, E_INVALID_ARG);

    /* Never inside the install directory, a partial file must not shadow the live binary */
    autofree_del char *temp_binary = nullptr;
    RESULT result = make_temp_file(PROG_NAME "-update-XXXXXX", &temp_binary);
    LOG_AND_RETURN_IF_FAILED(Level::Error, result, "Failed to create a file for the download");

    LOG_INFO("Downloading update from %s", url);
    result = download_file(url, temp_binary, nullptr, config::BINARY_TIMEOUT);
    if (FAILED(result)) {
        LOG_RESULT(Level::Error, result, "Failed to download update");
        LOG_ERROR("Download URL: %s", url);
        return MAKE_RESULT(SEV_ERROR, CAT_UPDATE, E_DOWNLOAD_FAILED);
    }

    char *url_copy = strdup(url);
    if (!url_copy)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    LOG_DEBUG("Downloaded %s to %s", url, temp_binary);

    /* Hand the file over to the artifact */
    cleanup_artifact(artifact);
    artifact->url = url_copy;
    artifact->local_path = temp_binary;
    temp_binary = nullptr;

    return RESULT_OK;
}
