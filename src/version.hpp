/*
 * Release lookup and version comparison
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstddef>
#include <string>

#include "result.hpp"

/* Version string of builds that weren't stamped by the release pipeline */
#define DEV_VERSION "dev"

/* Latest published release, as described by the registry */
struct release_info {
    std::string tag;      /* e.g. "v1.2.3" */
    std::string name;     /* display name, may be empty */
    std::string html_url; /* release page, may be empty */
};

/* Parse a registry response of the form {"tag_name": ..., "name": ..., "html_url": ...}
 * Returns RESULT_OK on success, CAT_JSON/E_PARSE_ERROR if the payload is malformed */
RESULT parse_release_info(const char *json, size_t length, release_info &release);

/* Fetch the latest release descriptor from `url`
 * Returns RESULT_OK on success
 *         CAT_NETWORK/E_NETWORK_ERROR or E_TIMEOUT if the registry is unreachable
 *         CAT_NETWORK/E_HTTP_STATUS or CAT_JSON/E_PARSE_ERROR on a bad response */
RESULT fetch_latest_release(const char *url, release_info &release);

/* Should `current` be replaced by `latest`?
 * A leading 'v' is ignored on both sides, then the strings are compared for plain inequality.
 * There is no ordering: a different older tag also counts as stale.
 * A missing/empty current version or DEV_VERSION is always stale. */
bool version_is_stale(const char *current, const char *latest);
