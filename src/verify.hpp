/*
 * Artifact integrity verification
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include "result.hpp"
#include "util.hpp"

/* Suffix of the checksum manifest published next to every artifact */
#define MANIFEST_SUFFIX ".sha256"

/* Take the digest from manifest text in "hex  filename" (sha256sum) layout, or a bare digest
 * Only the first whitespace-delimited token is used; it must be 64 hex digits
 * Returns RESULT_OK on success, CAT_UPDATE/E_PARSE_ERROR otherwise */
RESULT parse_checksum_manifest(const char *text, char expected_hex[SHA256_HEX_LEN + 1]);

/* Download "<artifact_url>.sha256" and parse it
 * Returns RESULT_OK on success, a CAT_NETWORK error if it couldn't be fetched,
 * CAT_UPDATE/E_PARSE_ERROR if it's malformed */
RESULT fetch_checksum_manifest(const char *artifact_url, char expected_hex[SHA256_HEX_LEN + 1]);

/* Hash the whole file at `path` and compare it to `expected_hex`, ignoring case
 * Returns RESULT_OK on a match, CAT_UPDATE/E_CHECKSUM_MISMATCH on a mismatch,
 * or the error from reading the file */
RESULT verify_checksum(const char *path, const char *expected_hex);
