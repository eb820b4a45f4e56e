/*
 * Shared header for helper functions
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstring>
#include <string>
#include <strings.h>
#include <sys/stat.h>

#include "result.hpp"

#define PROG_NAME "branchd"

#define BUFFER_SIZE 8192

/* Length of a hex encoded SHA-256 digest, without the terminator */
#define SHA256_HEX_LEN 64

/* case sensitive */
#define STRING_EQUALS(string1, string2) (strcmp(string1, string2) == 0)
/* lowercase string equals (case insensitive) */
#define LCSTRING_EQUALS(string1, string2) (strcasecmp(string1, string2) == 0)

void _append_sep_impl(char *result_ptr[], const char *separator, int num_strings, ...);

#define COUNT_JOIN_ARGS(...) (sizeof((const char *[]){__VA_ARGS__}) / sizeof(const char *))

/* Join strings with a `sep` separator into the first argument (`result`)
 * Any previous value of `result` is freed */
#define append_sep(result, sep, ...)                                                                                   \
    _append_sep_impl(&(result), sep, COUNT_JOIN_ARGS(__VA_ARGS__) __VA_OPT__(, ) __VA_ARGS__)

/* Join paths with a `/` separator into the first argument (`result`) */
#define join_paths(result, ...) append_sep(result, "/", __VA_ARGS__)

/* Ensure a directory exists and is writable, creating it if necessary
 * Will create parent directories as needed (like mkdir -p)
 * Returns RESULT_OK on success, error RESULT on failure */
RESULT ensure_dir(const char *path);

/* Expands shell paths like ~ to their full equivalents (using wordexp)
 * Returns a newly allocated string that must be freed by the caller
 * Returns nullptr on failure */
char *expand_path(const char *path);

/* Absolute, symlink-free path of the running executable
 * Returns a newly allocated string that must be freed by the caller
 * Returns nullptr on failure (errno is set) */
char *get_self_path(void);

/* Create an empty file in the system temporary directory
 * `name_template` must contain "XXXXXX", e.g. "branchd-update-XXXXXX"
 * On success `*path` is a newly allocated string that must be freed by the caller
 * Returns RESULT_OK on success, error RESULT on failure */
RESULT make_temp_file(const char *name_template, char **path);

/* Calculates a sha256sum for a file and puts it in `hash_str` (lowercase hex)
 * Returns RESULT_OK on success, error RESULT on failure */
RESULT calculate_sha256(const char *file_path, char hash_str[SHA256_HEX_LEN + 1]);

/* Mark a file as executable, adding execute bits wherever read bits are set
 * Returns RESULT_OK on success, error RESULT on failure */
RESULT make_executable(const char *file_path);

/* A helper to download a file from `url` to `output_path` with libcurl
 * headers: nullptr-terminated array of strings for HTTP headers (can be nullptr)
 * timeout: total transfer timeout in seconds
 * Shows a progress meter on the terminal. The output file is removed on failure.
 * Returns RESULT_OK on success
 *         CAT_NETWORK/E_NETWORK_ERROR or E_TIMEOUT on transport failure
 *         CAT_NETWORK/E_HTTP_STATUS on a non-2xx response */
RESULT download_file(const char *url, const char *output_path, const char *headers[], long timeout);

/* Same as download_file(), but collects the response body in memory */
RESULT download_to_string(const char *url, std::string &output, const char *headers[], long timeout);

/* Is the file a real executable file? */
static inline bool is_exec_file(const char *path) {
    struct stat file_stat;
    if (stat(path, &file_stat) != 0 || !S_ISREG(file_stat.st_mode) || (file_stat.st_mode & S_IXUSR) == 0)
        return false;
    return true;
}
