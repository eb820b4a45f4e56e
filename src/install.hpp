/*
 * Replacement of the installed executable
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstdint>
#include <sys/types.h>

#include "result.hpp"

/* Suffixes of the previous binary while an install is in progress */
#define BACKUP_SUFFIX_COPY ".backup"
#define BACKUP_SUFFIX_RENAME ".old"

/* How a running executable can be replaced on this platform */
enum class install_strategy : uint8_t {
    CopyReplace = 0,  /* the live file may be replaced while it runs (Linux, macOS) */
    RenameReplace = 1 /* a loaded executable can only be renamed away (Windows) */
};

/* Install state machine:
 *   Idle -> Staged -> BackedUp -> Installed -> Committed
 * with RolledBack (previous binary restored) or Failed (manual recovery needed) on error */
enum class install_phase : uint8_t {
    Idle = 0,
    Staged = 1,
    BackedUp = 2,
    Installed = 3,
    Committed = 4,
    RolledBack = 5,
    Failed = 6
};

/* Filesystem primitives the installer goes through */
struct install_fs_ops {
    /* Replace `destination` with a copy of `source` carrying permission bits `mode` */
    RESULT (*copy_file)(const char *source, const char *destination, mode_t mode);
    /* rename(2) */
    RESULT (*rename_file)(const char *source, const char *destination);
    /* unlink(2), a missing file is not an error */
    RESULT (*remove_file)(const char *path);
    /* Sets `*same` if both paths live on one filesystem, i.e. rename(2) can move between them */
    RESULT (*same_filesystem)(const char *path1, const char *path2, bool *same);
};

extern const install_fs_ops default_install_fs_ops;

struct install_transaction {
    char *source_path; /* verified new binary */
    char *target_path; /* live executable, symlinks resolved */
    char *backup_path; /* previous binary while installing */
    char *staged_copy; /* copy of the source next to the target (RenameReplace across filesystems) */
    mode_t target_mode;
    install_strategy strategy;
    install_phase phase;
    bool source_consumed; /* the source file was moved into place */
    bool backup_retained; /* the backup is still on disk after Committed */
    const install_fs_ops *ops;
};

/* Releases the strings and removes a leftover staged copy */
void cleanup_install_transaction(void *p);

#define autofree_txn [[gnu::cleanup(cleanup_install_transaction)]]

/* Pick the replacement strategy for the platform this binary was built for */
install_strategy select_install_strategy(void);

const char *install_phase_name(install_phase phase);
const char *install_strategy_name(install_strategy strategy);

/* Prepare a transaction replacing `target_path` with `source_path`
 * `target_path` is resolved here, once, so later steps can't drift to another file
 * `ops` may be nullptr to use default_install_fs_ops
 * Returns RESULT_OK on success, error RESULT if either file is missing */
RESULT install_transaction_init(install_transaction *txn, const char *source_path, const char *target_path,
                                install_strategy strategy, const install_fs_ops *ops);

/* Run the transaction from Idle to Committed
 * Returns RESULT_OK once committed
 *         the underlying error if nothing was changed (phase stays Staged or Idle)
 *         CAT_INSTALL/E_ROLLED_BACK if the install failed and the previous binary was restored
 *         CAT_INSTALL/E_RECOVERY_REQUIRED if restoring failed as well (phase Failed);
 *         the backup and target paths are logged together with recovery instructions */
RESULT install_binary(install_transaction *txn);
