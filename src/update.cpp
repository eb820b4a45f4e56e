/*
 * Self-update functionality
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "branchdconfig.hpp"
#include "download.hpp"
#include "install.hpp"
#include "log.hpp"
#include "macros.hpp"
#include "update.hpp"
#include "util.hpp"
#include "verify.hpp"
#include "version.hpp"

update_params default_update_params(void) {
    update_params params = {};
    params.current_version = VERSION;
    params.releases_url = config::releases_url;
    params.download_base_url = config::download_base_url;
    params.target_path = nullptr;
    params.os = nullptr;
    params.arch = nullptr;
    params.strategy = select_install_strategy();
    params.fs_ops = nullptr;
    return params;
}

RESULT check_for_updates(const update_params *params, update_outcome *outcome) {
    if (!params || !params->releases_url)
        return MAKE_RESULT(SEV_ERROR, CAT_UPDATE, E_INVALID_ARG);

    release_info release;

    LOG_INFO("Checking for updates...");
    RESULT result = fetch_latest_release(params->releases_url, release);
    LOG_AND_RETURN_IF_FAILED(Level::Error, result, "Failed to check for updates");

    if (outcome)
        outcome->latest_tag = release.tag;

    if (!version_is_stale(params->current_version, release.tag.c_str())) {
        LOG_INFO("You are already running the latest version (%s).", params->current_version);
        return MAKE_RESULT(SEV_INFO, CAT_UPDATE, E_UP_TO_DATE);
    }

    LOG_INFO("New version %s -> %s. Run: " PROG_NAME " update", params->current_version, release.tag.c_str());
    if (!release.html_url.empty())
        LOG_INFO("Release notes: %s", release.html_url.c_str());

    return MAKE_RESULT(SEV_INFO, CAT_UPDATE, E_UPDATE_AVAILABLE);
}

RESULT perform_update(const update_params *params, update_outcome *outcome) {
    if (!params || !params->releases_url || !params->download_base_url)
        return MAKE_RESULT(SEV_ERROR, CAT_UPDATE, E_INVALID_ARG);

    update_outcome local_outcome;
    if (!outcome)
        outcome = &local_outcome;

    release_info release;
    RESULT result;

    /* Check version */
    LOG_INFO("Checking for updates...");
    result = fetch_latest_release(params->releases_url, release);
    LOG_AND_RETURN_IF_FAILED(Level::Error, result, "Failed to check for updates");
    outcome->latest_tag = release.tag;

    if (!version_is_stale(params->current_version, release.tag.c_str())) {
        LOG_INFO("Already up to date (version %s)", params->current_version);
        return MAKE_RESULT(SEV_INFO, CAT_UPDATE, E_UP_TO_DATE);
    }

    LOG_INFO("Updating from %s to %s...", params->current_version, release.tag.c_str());

    /* Resolve platform artifact */
    const char *os = params->os ? params->os : build_target_os();
    const char *arch = params->arch ? params->arch : build_target_arch();
    const char *artifact_name = nullptr;
    result = resolve_platform_artifact(os, arch, &artifact_name);
    RETURN_IF_FAILED(result);

    autofree char *download_url = build_artifact_url(params->download_base_url, release.tag.c_str(), artifact_name);
    if (!download_url)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    /* Download; the temporary file is removed on every return from here on */
    autodel_artifact downloaded_artifact artifact = {};
    artifact.platform = artifact_name;
    result = download_artifact(download_url, &artifact);
    RETURN_IF_FAILED(result);
    outcome->download_path = artifact.local_path;

    /* Verify before anything on disk is replaced */
    LOG_INFO("Verifying checksum...");
    result = fetch_checksum_manifest(artifact.url, artifact.expected_sha256);
    LOG_AND_RETURN_IF_FAILED(Level::Error, result, "Checksum verification failed");

    result = verify_checksum(artifact.local_path, artifact.expected_sha256);
    if (FAILED(result)) {
        LOG_RESULT(Level::Error, result, "Checksum verification failed, the download was discarded");
        LOG_ERROR("Download URL: %s", artifact.url);
        return result;
    }

    /* Get current executable path */
    autofree char *self_path = nullptr;
    const char *target_path = params->target_path;
    if (!target_path) {
        self_path = get_self_path();
        if (!self_path) {
            result = result_from_errno();
            LOG_ERROR("Failed to get executable path: %s", strerror(errno));
            return FAILED(result) ? result : MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_NOT_FOUND);
        }
        target_path = self_path;
    }

    /* Install */
    autofree_txn install_transaction txn = {};
    result = install_transaction_init(&txn, artifact.local_path, target_path, params->strategy, params->fs_ops);
    LOG_AND_RETURN_IF_FAILED(Level::Error, result, "Failed to prepare the install");

    LOG_INFO("Installing new version...");
    result = install_binary(&txn);

    outcome->phase = txn.phase;
    outcome->backup_retained = txn.backup_retained;
    outcome->backup_path = txn.backup_path ? txn.backup_path : "";

    /* A rename moved the download into place, there's nothing left to remove */
    if (txn.source_consumed && !txn.staged_copy) {
        free(artifact.local_path);
        artifact.local_path = nullptr;
    }

    LOG_AND_RETURN_IF_FAILED(Level::Error, result, "Failed to install update");

    LOG_INFO("Successfully updated to version %s!", release.tag.c_str());
    return MAKE_RESULT(SEV_INFO, CAT_RUNTIME, E_UPDATE_PERFORMED);
}

/* Handle all update operations based on command line verbs */
RESULT handle_updates(int check_only, int do_update) {
    const update_params params = default_update_params();
    RESULT result = RESULT_OK;

    if (do_update) {
        result = perform_update(&params, nullptr);
    } else if (check_only) {
        result = check_for_updates(&params, nullptr);
        /* A failed check never stands in the way */
        if (FAILED(result)) {
            LOG_RESULT(Level::Warning, result, "Update check unsuccessful");
            result = RESULT_OK;
        }
    }

    return result;
}
