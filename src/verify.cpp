/*
 * Artifact integrity verification
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cctype>
#include <cstring>
#include <string>

#include "branchdconfig.hpp"
#include "log.hpp"
#include "macros.hpp"
#include "verify.hpp"

RESULT parse_checksum_manifest(const char *text, char expected_hex[SHA256_HEX_LEN + 1]) {
    if (!text || !expected_hex)
        return MAKE_RESULT(SEV_ERROR, CAT_UPDATE, E_INVALID_ARG);

    expected_hex[0] = '\0';

    while (*text && isspace((unsigned char)*text))
        text++;

    size_t token_len = 0;
    while (text[token_len] && !isspace((unsigned char)text[token_len]))
        token_len++;

    if (token_len != SHA256_HEX_LEN) {
        LOG_ERROR("Checksum manifest does not start with a SHA-256 digest (got %zu characters)", token_len);
        return MAKE_RESULT(SEV_ERROR, CAT_UPDATE, E_PARSE_ERROR);
    }

    for (size_t i = 0; i < token_len; i++) {
        if (!isxdigit((unsigned char)text[i])) {
            LOG_ERROR("Checksum manifest digest contains a non-hex character: '%c'", text[i]);
            return MAKE_RESULT(SEV_ERROR, CAT_UPDATE, E_PARSE_ERROR);
        }
    }

    memcpy(expected_hex, text, SHA256_HEX_LEN);
    expected_hex[SHA256_HEX_LEN] = '\0';
    return RESULT_OK;
}

RESULT fetch_checksum_manifest(const char *artifact_url, char expected_hex[SHA256_HEX_LEN + 1]) {
    autofree char *manifest_url = nullptr;
    append_sep(manifest_url, "", artifact_url, MANIFEST_SUFFIX);
    if (!manifest_url)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    std::string manifest;
    RESULT result = download_to_string(manifest_url, manifest, nullptr, config::CHECKSUM_TIMEOUT);
    if (FAILED(result)) {
        LOG_RESULT(Level::Error, result, "Failed to download checksum manifest");
        LOG_ERROR("Manifest URL: %s", manifest_url);
        return result;
    }

    result = parse_checksum_manifest(manifest.c_str(), expected_hex);
    if (FAILED(result)) {
        LOG_ERROR("Unusable checksum manifest at %s", manifest_url);
        return result;
    }

    LOG_DEBUG("Expected SHA-256 from %s: %s", manifest_url, expected_hex);
    return RESULT_OK;
}

RESULT verify_checksum(const char *path, const char *expected_hex) {
    if (!path || !expected_hex)
        return MAKE_RESULT(SEV_ERROR, CAT_UPDATE, E_INVALID_ARG);

    char actual_hex[SHA256_HEX_LEN + 1] = {};
    RESULT result = calculate_sha256(path, actual_hex);
    if (FAILED(result)) {
        LOG_RESULT(Level::Error, result, "Could not calculate hash");
        LOG_ERROR("File: %s", path);
        return result;
    }

    if (!LCSTRING_EQUALS(expected_hex, actual_hex)) {
        LOG_ERROR("Checksum mismatch for %s, expected: %s got: %s", path, expected_hex, actual_hex);
        return MAKE_RESULT(SEV_ERROR, CAT_UPDATE, E_CHECKSUM_MISMATCH);
    }

    LOG_DEBUG("Checksum verified for %s: %s", path, actual_hex);
    return RESULT_OK;
}
