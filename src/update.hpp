/*
 * Self-update functionality
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <string>

#include "install.hpp"
#include "result.hpp"

/* Everything one update run depends on, fixed before it starts */
struct update_params {
    const char *current_version;   /* version of the running binary, e.g. "v1.0.0" or "dev" */
    const char *releases_url;      /* registry endpoint for the latest release */
    const char *download_base_url; /* artifacts live at <base>/<tag>/<artifact> */
    const char *target_path;       /* binary to replace, nullptr = the running executable */
    const char *os;                /* release platform, nullptr = the build target */
    const char *arch;
    install_strategy strategy;
    const install_fs_ops *fs_ops; /* nullptr = default_install_fs_ops */
};

/* What an update run found and did */
struct update_outcome {
    std::string latest_tag;
    std::string download_path; /* temporary file the artifact was downloaded to, gone once the run returns */
    install_phase phase = install_phase::Idle;
    bool backup_retained = false;
    std::string backup_path;
};

/* Parameters for this binary: VERSION, the configured endpoints, and the platform's install strategy */
update_params default_update_params(void);

/* Check if a new version is available and print information about it
 * Returns E_UPDATE_AVAILABLE or E_UP_TO_DATE (both informational) on success
 * Returns error RESULT on failure */
RESULT check_for_updates(const update_params *params, update_outcome *outcome);

/* Check for, download, verify and install the latest version
 * Every stage runs only if the previous one succeeded; nothing is retried
 * Returns E_UP_TO_DATE or E_UPDATE_PERFORMED (both informational) on success
 * Returns error RESULT on failure, see install_binary() for install errors */
RESULT perform_update(const update_params *params, update_outcome *outcome);

/* Handle update operations based on command line verbs
 * check_only: 1 = just check for updates, 0 = don't check
 * do_update: 1 = check and apply updates, 0 = don't update
 * Returns RESULT_OK or an informational RESULT on success, error RESULT on failure */
RESULT handle_updates(int check_only, int do_update);
