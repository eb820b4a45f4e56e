/*
 * Runtime configuration
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include "result.hpp"

namespace config {
    /* Resolve and create the program directory (logs), in order of preference:
     * $BRANCHD_INSTALL_DIR, $XDG_DATA_HOME/branchd, $HOME/.local/share/branchd */
    RESULT setup_prog_dir(void);

    /* Resolve release endpoints, honouring $BRANCHD_RELEASES_URL and $BRANCHD_DOWNLOAD_URL */
    RESULT setup_endpoints(void);

    /* The global program path, set at startup in main() */
    extern const char *branchd_dir;
    /* Registry endpoint returning the latest release descriptor */
    extern const char *releases_url;
    /* Base URL that artifacts live under, as <base>/<tag>/<artifact> */
    extern const char *download_base_url;

    /* Transfer timeouts, in seconds */
    constexpr long METADATA_TIMEOUT = 10;
    constexpr long CHECKSUM_TIMEOUT = 30;
    constexpr long BINARY_TIMEOUT = 300;
};
