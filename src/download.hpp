/*
 * Platform artifact resolution and download
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstdlib>
#include <unistd.h>

#include "macros.hpp"
#include "result.hpp"
#include "util.hpp"

/* A downloaded release binary, not yet installed */
struct downloaded_artifact {
    char *local_path;                           /* temporary file, removed by cleanup_artifact */
    char *url;                                  /* where it came from */
    const char *platform;                       /* artifact name, e.g. "branchd-linux-amd64" */
    char expected_sha256[SHA256_HEX_LEN + 1]; /* filled in from the manifest */
};

/* Removes the temporary file (unless ownership was taken by clearing local_path) and frees the strings */
static forceinline void cleanup_artifact(void *p) {
    downloaded_artifact *artifact = (downloaded_artifact *)p;
    if (!artifact)
        return;
    if (artifact->local_path)
        unlink(artifact->local_path);
    free(artifact->local_path);
    free(artifact->url);
    artifact->local_path = nullptr;
    artifact->url = nullptr;
}

#define autodel_artifact [[gnu::cleanup(cleanup_artifact)]]

/* OS and architecture this binary was built for, in release naming ("linux", "amd64", ...)
 * Returns "unknown" for targets outside the release matrix */
const char *build_target_os(void);
const char *build_target_arch(void);

/* Look up the release artifact name for an (os, arch) pair
 * Returns RESULT_OK and sets `*name` for linux/amd64, linux/arm64, darwin/amd64, darwin/arm64 and windows/amd64
 * Returns CAT_UPDATE/E_NOT_SUPPORTED for anything else */
RESULT resolve_platform_artifact(const char *os, const char *arch, const char **name);

/* Build "<base>/<tag>/<artifact>"
 * Returns a newly allocated string that must be freed by the caller */
char *build_artifact_url(const char *base_url, const char *tag, const char *artifact_name);

/* Download `url` into a fresh file in the system temporary directory
 * On success `artifact->local_path` and `artifact->url` are set; release them with cleanup_artifact
 * Returns RESULT_OK on success, CAT_UPDATE/E_DOWNLOAD_FAILED on transport failure or non-2xx status */
RESULT download_artifact(const char *url, downloaded_artifact *artifact);
