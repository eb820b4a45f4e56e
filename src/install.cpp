/*
 * Replacement of the installed executable
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

#include "install.hpp"
#include "log.hpp"
#include "macros.hpp"
#include "util.hpp"

/* errno may be 0 after a short stdio write */
static RESULT io_error(void) {
    RESULT result = result_from_errno();
    return FAILED(result) ? result : MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_IO_ERROR);
}

/* Copy through a sibling temporary file, so `destination` is swapped in by a single rename
 * and is never seen half-written */
static RESULT copy_file_atomic(const char *source, const char *destination, mode_t mode) {
    autofree char *temp_dest = nullptr;
    append_sep(temp_dest, "", destination, ".tmp");
    if (!temp_dest)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    /* Open both files in their own scope */
    {
        autoclose FILE *src = fopen(source, "rb");
        if (!src)
            return io_error();

        autoclose FILE *dst = fopen(temp_dest, "wb");
        if (!dst)
            return io_error();

        /* Copy the file contents in chunks */
        char buffer[BUFFER_SIZE];
        size_t bytes_read;
        while ((bytes_read = fread(buffer, 1, BUFFER_SIZE, src)) > 0) {
            if (fwrite(buffer, 1, bytes_read, dst) != bytes_read) {
                RESULT result = io_error();
                LOG_RESULT(Level::Error, result, "Failed to write to destination file");
                unlink(temp_dest);
                return result;
            }
        }

        if (ferror(src)) {
            RESULT result = io_error();
            LOG_RESULT(Level::Error, result, "Failed to read from source file");
            unlink(temp_dest);
            return result;
        }

        /* Ensure all data is on disk before it replaces anything */
        if (fflush(dst) != 0 || fsync(fileno(dst)) != 0 || fchmod(fileno(dst), mode & 07777) != 0) {
            RESULT result = io_error();
            LOG_RESULT(Level::Error, result, "Failed to finish writing destination file");
            unlink(temp_dest);
            return result;
        }
    }
    /* Files are now closed */

    if (rename(temp_dest, destination) != 0) {
        RESULT result = io_error();
        LOG_RESULT(Level::Error, result, "Failed to rename temporary file");
        unlink(temp_dest);
        return result;
    }

    return RESULT_OK;
}

static RESULT rename_file(const char *source, const char *destination) {
    if (rename(source, destination) != 0)
        return io_error();
    return RESULT_OK;
}

static RESULT remove_file(const char *path) {
    if (unlink(path) != 0 && errno != ENOENT)
        return io_error();
    return RESULT_OK;
}

static RESULT same_filesystem(const char *path1, const char *path2, bool *same) {
    struct stat stat1, stat2;
    if (stat(path1, &stat1) != 0 || stat(path2, &stat2) != 0)
        return io_error();
    *same = stat1.st_dev == stat2.st_dev;
    return RESULT_OK;
}

const install_fs_ops default_install_fs_ops = {copy_file_atomic, rename_file, remove_file, same_filesystem};

void cleanup_install_transaction(void *p) {
    install_transaction *txn = (install_transaction *)p;
    if (!txn)
        return;

    if (txn->staged_copy && !txn->source_consumed)
        unlink(txn->staged_copy);

    free(txn->source_path);
    free(txn->target_path);
    free(txn->backup_path);
    free(txn->staged_copy);
    txn->source_path = nullptr;
    txn->target_path = nullptr;
    txn->backup_path = nullptr;
    txn->staged_copy = nullptr;
}

install_strategy select_install_strategy(void) {
#ifdef _WIN32
    return install_strategy::RenameReplace;
#else
    return install_strategy::CopyReplace;
#endif
}

const char *install_phase_name(install_phase phase) {
    switch (phase) {
    case install_phase::Idle:
        return "idle";
    case install_phase::Staged:
        return "staged";
    case install_phase::BackedUp:
        return "backed up";
    case install_phase::Installed:
        return "installed";
    case install_phase::Committed:
        return "committed";
    case install_phase::RolledBack:
        return "rolled back";
    case install_phase::Failed:
        return "failed";
    }
    return "unknown";
}

const char *install_strategy_name(install_strategy strategy) {
    return strategy == install_strategy::RenameReplace ? "rename" : "copy";
}

static void set_phase(install_transaction *txn, install_phase phase) {
    LOG_DEBUG("Install transaction: %s -> %s", install_phase_name(txn->phase), install_phase_name(phase));
    txn->phase = phase;
}

RESULT install_transaction_init(install_transaction *txn, const char *source_path, const char *target_path,
                                install_strategy strategy, const install_fs_ops *ops) {
    if (!txn || !source_path || !target_path)
        return MAKE_RESULT(SEV_ERROR, CAT_INSTALL, E_INVALID_ARG);

    *txn = {};
    txn->strategy = strategy;
    txn->phase = install_phase::Idle;
    txn->ops = ops ? ops : &default_install_fs_ops;

    /* Resolved once: every later step works on this exact file */
    txn->target_path = realpath(target_path, nullptr);
    if (!txn->target_path) {
        RESULT result = io_error();
        LOG_ERROR("Cannot resolve install target %s: %s", target_path, strerror(errno));
        return result;
    }

    struct stat st;
    if (stat(txn->target_path, &st) != 0) {
        RESULT result = io_error();
        LOG_ERROR("Cannot stat install target %s: %s", txn->target_path, strerror(errno));
        return result;
    }
    if (!S_ISREG(st.st_mode)) {
        LOG_ERROR("Install target %s is not a regular file", txn->target_path);
        return MAKE_RESULT(SEV_ERROR, CAT_INSTALL, E_INVALID_ARG);
    }
    txn->target_mode = st.st_mode & 07777;

    if (access(source_path, R_OK) != 0) {
        RESULT result = io_error();
        LOG_ERROR("Cannot read new binary %s: %s", source_path, strerror(errno));
        return result;
    }

    txn->source_path = strdup(source_path);
    append_sep(txn->backup_path, "", txn->target_path,
               strategy == install_strategy::RenameReplace ? BACKUP_SUFFIX_RENAME : BACKUP_SUFFIX_COPY);
    if (!txn->source_path || !txn->backup_path)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    return RESULT_OK;
}

/* Idle -> Staged: the new binary is executable and can be moved into place with one call */
static RESULT stage(install_transaction *txn) {
    RESULT result = make_executable(txn->source_path);
    if (FAILED(result)) {
        LOG_RESULT(Level::Error, result, "Failed to set executable permissions");
        LOG_ERROR("File: %s", txn->source_path);
        return result;
    }

    if (txn->strategy == install_strategy::RenameReplace) {
        bool same = true;
        result = txn->ops->same_filesystem(txn->source_path, txn->target_path, &same);
        if (FAILED(result)) {
            LOG_RESULT(Level::Error, result, "Failed to inspect install paths");
            return result;
        }

        /* rename() can't cross filesystems, so bring the new binary next to the target first */
        if (!same) {
            struct stat src_stat;
            if (stat(txn->source_path, &src_stat) != 0)
                return io_error();

            LOG_DEBUG("Files on different filesystems, staging a copy next to %s", txn->target_path);
            append_sep(txn->staged_copy, "", txn->target_path, ".new");
            if (!txn->staged_copy)
                return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

            result = txn->ops->copy_file(txn->source_path, txn->staged_copy, src_stat.st_mode);
            if (FAILED(result)) {
                LOG_RESULT(Level::Error, result, "Failed to stage new binary");
                LOG_ERROR("Staging path: %s", txn->staged_copy);
                return result;
            }

            free(txn->source_path);
            txn->source_path = strdup(txn->staged_copy);
            if (!txn->source_path)
                return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);
        }
    }

    set_phase(txn, install_phase::Staged);
    return RESULT_OK;
}

/* Staged -> BackedUp: the previous binary is preserved before the target is touched */
static RESULT back_up(install_transaction *txn) {
    RESULT result = txn->ops->remove_file(txn->backup_path);
    if (FAILED(result)) {
        LOG_RESULT(Level::Error, result, "Failed to remove stale backup");
        LOG_ERROR("Backup path: %s", txn->backup_path);
        return result;
    }

    if (txn->strategy == install_strategy::CopyReplace)
        result = txn->ops->copy_file(txn->target_path, txn->backup_path, txn->target_mode);
    else
        result = txn->ops->rename_file(txn->target_path, txn->backup_path);

    if (FAILED(result)) {
        /* too dangerous to try continuing */
        LOG_RESULT(Level::Error, result, "Failed to create backup");
        LOG_ERROR("Could not back up %s to %s, nothing was changed", txn->target_path, txn->backup_path);
        return result;
    }

    LOG_DEBUG("Backup created at %s", txn->backup_path);
    set_phase(txn, install_phase::BackedUp);
    return RESULT_OK;
}

static void report_manual_recovery(const install_transaction *txn) {
    LOG_SYSTEM("The update failed and the previous version could not be restored automatically.");
    LOG_SYSTEM("Previous version (backup): %s", txn->backup_path);
    LOG_SYSTEM("Install target: %s", txn->target_path);
    LOG_SYSTEM("To recover, run: %s '%s' '%s'",
               txn->strategy == install_strategy::CopyReplace ? "cp -p" : "mv", txn->backup_path, txn->target_path);
}

/* A failed atomic copy never reached its final rename, so the target may still be intact */
static bool target_matches_backup(const install_transaction *txn) {
    char target_hex[SHA256_HEX_LEN + 1] = {};
    char backup_hex[SHA256_HEX_LEN + 1] = {};
    if (FAILED(calculate_sha256(txn->target_path, target_hex)) ||
        FAILED(calculate_sha256(txn->backup_path, backup_hex)))
        return false;
    return STRING_EQUALS(target_hex, backup_hex);
}

/* Put the backup back after a failed install */
static RESULT roll_back(install_transaction *txn, RESULT cause) {
    LOG_RESULT(Level::Error, cause, "Failed to install new binary");
    LOG_INFO("Restoring previous version from %s", txn->backup_path);

    RESULT result;
    if (txn->strategy == install_strategy::CopyReplace)
        result = txn->ops->copy_file(txn->backup_path, txn->target_path, txn->target_mode);
    else
        result = txn->ops->rename_file(txn->backup_path, txn->target_path);

    if (FAILED(result) && txn->strategy == install_strategy::CopyReplace && target_matches_backup(txn)) {
        LOG_RESULT(Level::Warning, result, "Failed to restore from backup");
        LOG_WARNING("%s was left untouched by the failed install", txn->target_path);
        result = RESULT_OK;
    }

    if (FAILED(result)) {
        LOG_RESULT(Level::Error, result, "Failed to restore from backup");
        txn->backup_retained = true;
        set_phase(txn, install_phase::Failed);
        report_manual_recovery(txn);
        return MAKE_RESULT(SEV_ERROR, CAT_INSTALL, E_RECOVERY_REQUIRED);
    }

    /* The copy is redundant once the target holds the same bytes again */
    if (txn->strategy == install_strategy::CopyReplace) {
        if (FAILED(txn->ops->remove_file(txn->backup_path))) {
            LOG_WARNING("Could not remove backup %s, you can delete it manually", txn->backup_path);
            txn->backup_retained = true;
        }
    }

    set_phase(txn, install_phase::RolledBack);
    LOG_ERROR("The previous version was restored at %s", txn->target_path);
    return MAKE_RESULT(SEV_ERROR, CAT_INSTALL, E_ROLLED_BACK);
}

/* BackedUp -> Installed: a single copy-and-rename or rename */
static RESULT replace(install_transaction *txn) {
    RESULT result;
    if (txn->strategy == install_strategy::CopyReplace) {
        result = txn->ops->copy_file(txn->source_path, txn->target_path, txn->target_mode);
    } else {
        result = txn->ops->rename_file(txn->source_path, txn->target_path);
        if (SUCCEEDED(result))
            txn->source_consumed = true;
    }

    if (FAILED(result))
        return roll_back(txn, result);

    set_phase(txn, install_phase::Installed);
    return RESULT_OK;
}

/* Installed -> Committed */
static void commit(install_transaction *txn) {
    if (txn->strategy == install_strategy::CopyReplace) {
        RESULT result = txn->ops->remove_file(txn->backup_path);
        if (FAILED(result)) {
            LOG_RESULT(Level::Warning, result, "Failed to remove backup");
            LOG_WARNING("The previous version is still at %s, you can delete it manually", txn->backup_path);
            txn->backup_retained = true;
        }
    } else {
        /* Deleting an image that was just swapped out isn't safe while it may still be loaded */
        txn->backup_retained = true;
        LOG_INFO("Note: the previous version was saved as %s, you can delete it manually", txn->backup_path);
    }

    set_phase(txn, install_phase::Committed);
}

RESULT install_binary(install_transaction *txn) {
    if (!txn || !txn->source_path || !txn->target_path || !txn->backup_path || txn->phase != install_phase::Idle)
        return MAKE_RESULT(SEV_ERROR, CAT_INSTALL, E_INVALID_ARG);

    LOG_DEBUG("Installing %s over %s (%s strategy)", txn->source_path, txn->target_path,
              install_strategy_name(txn->strategy));

    RESULT result = stage(txn);
    RETURN_IF_FAILED(result);

    result = back_up(txn);
    RETURN_IF_FAILED(result);

    result = replace(txn);
    RETURN_IF_FAILED(result);

    commit(txn);
    return RESULT_OK;
}
