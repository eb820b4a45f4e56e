/*
 * Executable replacement tests
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <string>
#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "install.hpp"
#include "result.hpp"
#include "test_helpers.hpp"

using test_helpers::file_exists;
using test_helpers::read_file;
using test_helpers::write_file;

/* Injected failures: calls whose destination is `fail_destination` fail until `failures` runs out */
static std::string fail_destination;
static int failures = 0;
/* A failing copy leaves garbage behind in its destination, like a write cut short */
static bool torn_writes = true;
/* Pretend the source and target are on different filesystems */
static bool cross_device = false;

static bool should_fail(const char *destination) {
    if (failures <= 0 || fail_destination != destination)
        return false;
    failures--;
    return true;
}

static RESULT failing_copy(const char *source, const char *destination, mode_t mode) {
    if (should_fail(destination)) {
        if (torn_writes)
            write_file(destination, "torn", 0600);
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_IO_ERROR);
    }
    return default_install_fs_ops.copy_file(source, destination, mode);
}

static RESULT failing_rename(const char *source, const char *destination) {
    if (should_fail(destination))
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_ACCESS_DENIED);
    return default_install_fs_ops.rename_file(source, destination);
}

static RESULT reported_filesystem(const char *path1, const char *path2, bool *same) {
    RESULT result = default_install_fs_ops.same_filesystem(path1, path2, same);
    if (SUCCEEDED(result) && cross_device)
        *same = false;
    return result;
}

static const install_fs_ops failing_ops = {failing_copy, failing_rename, default_install_fs_ops.remove_file,
                                           reported_filesystem};

class InstallTest : public test_helpers::TempDirTest {
  protected:
    std::string target;
    std::string source;

    void SetUp() override {
        TempDirTest::SetUp();
        if (HasFatalFailure())
            return;
        fail_destination.clear();
        failures = 0;
        torn_writes = true;
        cross_device = false;

        target = path("branchd");
        source = path("branchd-update");
        ASSERT_TRUE(write_file(target, "old binary", 0750));
        ASSERT_TRUE(write_file(source, "new binary", 0600));
    }

    void fail_next(const std::string &destination, int count) {
        fail_destination = destination;
        failures = count;
    }
};

TEST_F(InstallTest, InitResolvesTargetAndRecordsMode) {
    const std::string link = path("branchd-link");
    ASSERT_EQ(symlink(target.c_str(), link.c_str()), 0);

    autofree_txn install_transaction txn = {};
    ASSERT_EQ(install_transaction_init(&txn, source.c_str(), link.c_str(), install_strategy::CopyReplace, nullptr),
              RESULT_OK);
    EXPECT_STREQ(txn.target_path, target.c_str());
    EXPECT_EQ(txn.backup_path, target + BACKUP_SUFFIX_COPY);
    EXPECT_EQ(txn.target_mode, (mode_t)0750);
    EXPECT_EQ(txn.phase, install_phase::Idle);
    EXPECT_EQ(txn.ops, &default_install_fs_ops);
}

TEST_F(InstallTest, InitRejectsUnusableFiles) {
    {
        autofree_txn install_transaction txn = {};
        EXPECT_TRUE(FAILED(install_transaction_init(&txn, source.c_str(), path("absent").c_str(),
                                                    install_strategy::CopyReplace, nullptr)));
    }
    {
        autofree_txn install_transaction txn = {};
        RESULT result =
            install_transaction_init(&txn, source.c_str(), dir.c_str(), install_strategy::CopyReplace, nullptr);
        EXPECT_TRUE(RESULT_IS(result, CAT_INSTALL, E_INVALID_ARG));
    }
    {
        autofree_txn install_transaction txn = {};
        EXPECT_TRUE(FAILED(install_transaction_init(&txn, path("absent").c_str(), target.c_str(),
                                                    install_strategy::CopyReplace, nullptr)));
    }
}

TEST_F(InstallTest, CopyReplaceCommitsAndRemovesBackup) {
    autofree_txn install_transaction txn = {};
    ASSERT_EQ(install_transaction_init(&txn, source.c_str(), target.c_str(), install_strategy::CopyReplace, nullptr),
              RESULT_OK);
    ASSERT_EQ(install_binary(&txn), RESULT_OK);

    EXPECT_EQ(txn.phase, install_phase::Committed);
    EXPECT_EQ(read_file(target), "new binary");
    EXPECT_EQ(test_helpers::file_mode(target), (mode_t)0750);
    EXPECT_FALSE(txn.backup_retained);
    EXPECT_FALSE(file_exists(target + BACKUP_SUFFIX_COPY));
    EXPECT_FALSE(file_exists(target + ".tmp"));
    /* the download is still the caller's to remove */
    EXPECT_TRUE(file_exists(source));
}

TEST_F(InstallTest, CopyReplaceOverwritesStaleBackup) {
    ASSERT_TRUE(write_file(target + BACKUP_SUFFIX_COPY, "leftover from an interrupted run"));

    autofree_txn install_transaction txn = {};
    ASSERT_EQ(install_transaction_init(&txn, source.c_str(), target.c_str(), install_strategy::CopyReplace, nullptr),
              RESULT_OK);
    ASSERT_EQ(install_binary(&txn), RESULT_OK);
    EXPECT_EQ(read_file(target), "new binary");
    EXPECT_FALSE(file_exists(target + BACKUP_SUFFIX_COPY));
}

TEST_F(InstallTest, RenameReplaceCommitsAndRetainsBackup) {
    autofree_txn install_transaction txn = {};
    ASSERT_EQ(install_transaction_init(&txn, source.c_str(), target.c_str(), install_strategy::RenameReplace, nullptr),
              RESULT_OK);
    ASSERT_EQ(install_binary(&txn), RESULT_OK);

    EXPECT_EQ(txn.phase, install_phase::Committed);
    EXPECT_EQ(read_file(target), "new binary");
    EXPECT_TRUE(txn.source_consumed);
    EXPECT_FALSE(file_exists(source));
    EXPECT_TRUE(txn.backup_retained);
    EXPECT_EQ(read_file(target + BACKUP_SUFFIX_RENAME), "old binary");
}

TEST_F(InstallTest, NewBinaryIsExecutable) {
    autofree_txn install_transaction txn = {};
    ASSERT_EQ(install_transaction_init(&txn, source.c_str(), target.c_str(), install_strategy::RenameReplace, nullptr),
              RESULT_OK);
    ASSERT_EQ(install_binary(&txn), RESULT_OK);
    EXPECT_TRUE(is_exec_file(target.c_str()));
}

TEST_F(InstallTest, CopyReplaceRollsBackFailedInstall) {
    /* the failed install clobbers the target, only the restore brings it back */
    fail_next(target, 1);

    autofree_txn install_transaction txn = {};
    ASSERT_EQ(
        install_transaction_init(&txn, source.c_str(), target.c_str(), install_strategy::CopyReplace, &failing_ops),
        RESULT_OK);
    RESULT result = install_binary(&txn);

    EXPECT_TRUE(RESULT_IS(result, CAT_INSTALL, E_ROLLED_BACK));
    EXPECT_EQ(txn.phase, install_phase::RolledBack);
    EXPECT_EQ(read_file(target), "old binary");
    EXPECT_EQ(test_helpers::file_mode(target), (mode_t)0750);
    EXPECT_FALSE(file_exists(target + BACKUP_SUFFIX_COPY));
}

TEST_F(InstallTest, RenameReplaceRollsBackFailedInstall) {
    fail_next(target, 1);

    autofree_txn install_transaction txn = {};
    ASSERT_EQ(
        install_transaction_init(&txn, source.c_str(), target.c_str(), install_strategy::RenameReplace, &failing_ops),
        RESULT_OK);
    RESULT result = install_binary(&txn);

    EXPECT_TRUE(RESULT_IS(result, CAT_INSTALL, E_ROLLED_BACK));
    EXPECT_EQ(txn.phase, install_phase::RolledBack);
    EXPECT_EQ(read_file(target), "old binary");
    EXPECT_FALSE(file_exists(target + BACKUP_SUFFIX_RENAME));
    EXPECT_FALSE(txn.source_consumed);
}

TEST_F(InstallTest, FailedRestoreRequiresManualRecovery) {
    /* both the install and the restore of the previous binary fail */
    fail_next(target, 2);

    autofree_txn install_transaction txn = {};
    ASSERT_EQ(
        install_transaction_init(&txn, source.c_str(), target.c_str(), install_strategy::RenameReplace, &failing_ops),
        RESULT_OK);
    RESULT result = install_binary(&txn);

    EXPECT_TRUE(RESULT_IS(result, CAT_INSTALL, E_RECOVERY_REQUIRED));
    EXPECT_EQ(txn.phase, install_phase::Failed);
    EXPECT_TRUE(txn.backup_retained);
    EXPECT_EQ(txn.backup_path, target + BACKUP_SUFFIX_RENAME);
    EXPECT_EQ(read_file(txn.backup_path), "old binary");
    EXPECT_FALSE(file_exists(target));
}

TEST_F(InstallTest, CopyReplaceFailedRestoreRequiresManualRecovery) {
    fail_next(target, 2);

    autofree_txn install_transaction txn = {};
    ASSERT_EQ(
        install_transaction_init(&txn, source.c_str(), target.c_str(), install_strategy::CopyReplace, &failing_ops),
        RESULT_OK);
    RESULT result = install_binary(&txn);

    EXPECT_TRUE(RESULT_IS(result, CAT_INSTALL, E_RECOVERY_REQUIRED));
    EXPECT_EQ(txn.phase, install_phase::Failed);
    EXPECT_TRUE(txn.backup_retained);
    EXPECT_STREQ(txn.target_path, target.c_str());
    EXPECT_EQ(txn.backup_path, target + BACKUP_SUFFIX_COPY);
    EXPECT_EQ(read_file(txn.backup_path), "old binary");
    EXPECT_EQ(read_file(target), "torn");
}

TEST_F(InstallTest, CopyReplaceUntouchedTargetNeedsNoRecovery) {
    /* neither failed copy got as far as replacing the target */
    torn_writes = false;
    fail_next(target, 2);

    autofree_txn install_transaction txn = {};
    ASSERT_EQ(
        install_transaction_init(&txn, source.c_str(), target.c_str(), install_strategy::CopyReplace, &failing_ops),
        RESULT_OK);
    RESULT result = install_binary(&txn);

    EXPECT_TRUE(RESULT_IS(result, CAT_INSTALL, E_ROLLED_BACK));
    EXPECT_EQ(txn.phase, install_phase::RolledBack);
    EXPECT_EQ(read_file(target), "old binary");
    EXPECT_FALSE(txn.backup_retained);
    EXPECT_FALSE(file_exists(target + BACKUP_SUFFIX_COPY));
}

TEST_F(InstallTest, RenameReplaceStagesCopyAcrossFilesystems) {
    cross_device = true;

    autofree_txn install_transaction txn = {};
    ASSERT_EQ(
        install_transaction_init(&txn, source.c_str(), target.c_str(), install_strategy::RenameReplace, &failing_ops),
        RESULT_OK);
    ASSERT_EQ(install_binary(&txn), RESULT_OK);

    EXPECT_EQ(txn.phase, install_phase::Committed);
    ASSERT_NE(txn.staged_copy, nullptr);
    EXPECT_EQ(txn.staged_copy, target + ".new");
    EXPECT_TRUE(txn.source_consumed);
    EXPECT_EQ(read_file(target), "new binary");
    EXPECT_TRUE(is_exec_file(target.c_str()));
    EXPECT_FALSE(file_exists(target + ".new"));
    EXPECT_EQ(read_file(target + BACKUP_SUFFIX_RENAME), "old binary");
    /* only the staged copy was moved, the download stays with the caller */
    EXPECT_EQ(read_file(source), "new binary");
}

TEST_F(InstallTest, RenameReplaceRemovesStagedCopyAfterRollback) {
    cross_device = true;
    fail_next(target, 1);

    {
        autofree_txn install_transaction txn = {};
        ASSERT_EQ(install_transaction_init(&txn, source.c_str(), target.c_str(), install_strategy::RenameReplace,
                                           &failing_ops),
                  RESULT_OK);
        RESULT result = install_binary(&txn);

        EXPECT_TRUE(RESULT_IS(result, CAT_INSTALL, E_ROLLED_BACK));
        EXPECT_TRUE(file_exists(target + ".new"));
    }

    EXPECT_FALSE(file_exists(target + ".new"));
    EXPECT_EQ(read_file(target), "old binary");
    EXPECT_FALSE(file_exists(target + BACKUP_SUFFIX_RENAME));
}

TEST_F(InstallTest, FailedStagingChangesNothing) {
    cross_device = true;
    fail_next(target + ".new", 1);

    {
        autofree_txn install_transaction txn = {};
        ASSERT_EQ(install_transaction_init(&txn, source.c_str(), target.c_str(), install_strategy::RenameReplace,
                                           &failing_ops),
                  RESULT_OK);
        RESULT result = install_binary(&txn);

        EXPECT_TRUE(RESULT_IS(result, CAT_FILESYSTEM, E_IO_ERROR));
        EXPECT_EQ(txn.phase, install_phase::Idle);
    }

    EXPECT_EQ(read_file(target), "old binary");
    EXPECT_FALSE(file_exists(target + ".new"));
    EXPECT_FALSE(file_exists(target + BACKUP_SUFFIX_RENAME));
}

TEST_F(InstallTest, FailedBackupLeavesTargetUntouched) {
    torn_writes = false;
    for (install_strategy strategy : {install_strategy::CopyReplace, install_strategy::RenameReplace}) {
        const char *suffix = strategy == install_strategy::CopyReplace ? BACKUP_SUFFIX_COPY : BACKUP_SUFFIX_RENAME;
        fail_next(target + suffix, 1);

        autofree_txn install_transaction txn = {};
        ASSERT_EQ(install_transaction_init(&txn, source.c_str(), target.c_str(), strategy, &failing_ops), RESULT_OK);
        RESULT result = install_binary(&txn);

        EXPECT_TRUE(FAILED(result)) << install_strategy_name(strategy);
        EXPECT_EQ(txn.phase, install_phase::Staged) << install_strategy_name(strategy);
        EXPECT_EQ(read_file(target), "old binary");
        EXPECT_EQ(read_file(source), "new binary");
        EXPECT_FALSE(file_exists(target + suffix));
    }
}

TEST_F(InstallTest, TransactionRunsOnlyOnce) {
    autofree_txn install_transaction txn = {};
    ASSERT_EQ(install_transaction_init(&txn, source.c_str(), target.c_str(), install_strategy::CopyReplace, nullptr),
              RESULT_OK);
    ASSERT_EQ(install_binary(&txn), RESULT_OK);
    EXPECT_TRUE(RESULT_IS(install_binary(&txn), CAT_INSTALL, E_INVALID_ARG));
}

TEST(InstallStrategy, MatchesPlatform) {
#ifdef _WIN32
    EXPECT_EQ(select_install_strategy(), install_strategy::RenameReplace);
#else
    EXPECT_EQ(select_install_strategy(), install_strategy::CopyReplace);
#endif
    EXPECT_STREQ(install_phase_name(install_phase::RolledBack), "rolled back");
}
