/*
 * Shared helper functions
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cerrno>
#include <climits>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>
#include <wordexp.h>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

#include <curl/curl.h>

#define G_LOG_DOMAIN "glib"
#include <glib.h>

#include "log.hpp"
#include "macros.hpp"
#include "util.hpp"

/* glib/libcurl specific cleanup */
static forceinline void cleanup_gerror(void *p) {
    GError **error = (GError **)p;
    if (error && *error) {
        g_error_free(*error);
        *error = nullptr;
    }
}

static forceinline void cleanup_checksum(void *p) {
    GChecksum **checksum = (GChecksum **)p;
    if (checksum && *checksum) {
        g_checksum_free(*checksum);
        *checksum = nullptr;
    }
}

static forceinline void cleanup_curl(void *p) {
    CURL **curl = (CURL **)p;
    if (curl && *curl) {
        curl_easy_cleanup(*curl);
        *curl = nullptr;
    }
}

static forceinline void cleanup_slist(void *p) {
    struct curl_slist **list = (struct curl_slist **)p;
    if (list && *list) {
        curl_slist_free_all(*list);
        *list = nullptr;
    }
}

#define autofree_gerror [[gnu::cleanup(cleanup_gerror)]]
#define autofree_checksum [[gnu::cleanup(cleanup_checksum)]]
#define autocleanup_curl [[gnu::cleanup(cleanup_curl)]]
#define autofree_slist [[gnu::cleanup(cleanup_slist)]]

#define CONNECT_TIMEOUT 5L

void _append_sep_impl(char *result_ptr[], const char *separator, int num_strings, ...) {
    const size_t sep_len = strlen(separator);
    const char sep_char = sep_len == 1 ? separator[0] : '\0';
    std::string joined;
    va_list args;

    va_start(args, num_strings);
    for (int i = 0; i < num_strings; i++) {
        const char *piece = va_arg(args, const char *);
        if (!piece)
            continue;
        if (i > 0) {
            /* Don't double up single-character separators (e.g. "a/" + "/b") */
            if (sep_char && !joined.empty() && joined.back() == sep_char)
                joined.pop_back();
            if (sep_char && piece[0] == sep_char)
                piece++;
            joined.append(separator, sep_len);
        }
        joined.append(piece);
    }
    va_end(args);

    free(*result_ptr);
    *result_ptr = strdup(joined.c_str());
}

RESULT ensure_dir(const char *path) {
    if (!path || !path[0])
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_INVALID_ARG);

    struct stat st;
    if (stat(path, &st) == 0) {
        if (!S_ISDIR(st.st_mode))
            return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_NOT_DIR);
        if (access(path, W_OK) != 0)
            return result_from_errno();
        return RESULT_OK;
    }

    autofree char *tmp = strdup(path);
    if (!tmp)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    /* Walk every component, creating what's missing */
    for (char *p = tmp + 1; *p; p++) {
        if (*p != '/')
            continue;
        *p = '\0';
        if (mkdir(tmp, 0755) != 0 && errno != EEXIST)
            return result_from_errno();
        *p = '/';
    }
    if (mkdir(tmp, 0755) != 0 && errno != EEXIST)
        return result_from_errno();

    return RESULT_OK;
}

char *expand_path(const char *path) {
    if (!path)
        return nullptr;

    wordexp_t p;
    if (wordexp(path, &p, WRDE_NOCMD) != 0)
        return nullptr;

    char *expanded = nullptr;
    if (p.we_wordc > 0)
        expanded = strdup(p.we_wordv[0]);

    wordfree(&p);
    return expanded;
}

char *get_self_path(void) {
#ifdef __APPLE__
    char raw_path[PATH_MAX];
    uint32_t size = sizeof(raw_path);
    if (_NSGetExecutablePath(raw_path, &size) != 0) {
        errno = ENAMETOOLONG;
        return nullptr;
    }
    return realpath(raw_path, nullptr);
#else
    return realpath("/proc/self/exe", nullptr);
#endif
}

RESULT make_temp_file(const char *name_template, char **path) {
    if (!name_template || !path)
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_INVALID_ARG);

    *path = nullptr;
    autofree_gerror GError *error = nullptr;
    gchar *name = nullptr;

    int fd = g_file_open_tmp(name_template, &name, &error);
    if (fd < 0) {
        LOG_ERROR("Failed to create temporary file in %s: %s", g_get_tmp_dir(), error ? error->message : "unknown");
        g_free(name);
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_IO_ERROR);
    }
    close(fd);

    *path = strdup(name);
    g_free(name);
    if (!*path)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    return RESULT_OK;
}

RESULT calculate_sha256(const char *file_path, char hash_str[SHA256_HEX_LEN + 1]) {
    if (!file_path || !hash_str)
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_INVALID_ARG);

    hash_str[0] = '\0';

    autoclose FILE *fp = fopen(file_path, "rb");
    if (!fp)
        return result_from_errno();

    autofree_checksum GChecksum *checksum = g_checksum_new(G_CHECKSUM_SHA256);
    if (!checksum)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    unsigned char buffer[BUFFER_SIZE];
    size_t bytes_read;
    while ((bytes_read = fread(buffer, 1, BUFFER_SIZE, fp)) > 0)
        g_checksum_update(checksum, buffer, (gssize)bytes_read);

    if (ferror(fp))
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_IO_ERROR);

    g_strlcpy(hash_str, g_checksum_get_string(checksum), SHA256_HEX_LEN + 1);
    return RESULT_OK;
}

RESULT make_executable(const char *file_path) {
    struct stat st;

    if (stat(file_path, &st) != 0)
        return result_from_errno();

    /* Add executable bits matching read bits */
    mode_t new_mode = st.st_mode;
    if (new_mode & S_IRUSR)
        new_mode |= S_IXUSR;
    if (new_mode & S_IRGRP)
        new_mode |= S_IXGRP;
    if (new_mode & S_IROTH)
        new_mode |= S_IXOTH;

    if (chmod(file_path, new_mode) != 0)
        return result_from_errno();

    return RESULT_OK;
}

static size_t write_to_file(char *ptr, size_t size, size_t nmemb, void *userdata) {
    return fwrite(ptr, size, nmemb, (FILE *)userdata) * size;
}

static size_t write_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *buffer = static_cast<std::string *>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

static int progress_callback(void *clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    const char *operation = (const char *)clientp;
    if (dltotal > 0)
        log_progress(operation, (double)dlnow * 100.0 / (double)dltotal, (int)dlnow, (int)dltotal);
    return 0;
}

static RESULT result_from_curl(CURLcode code) {
    switch (code) {
    case CURLE_OK:
        return RESULT_OK;
    case CURLE_OPERATION_TIMEDOUT:
        return MAKE_RESULT(SEV_ERROR, CAT_NETWORK, E_TIMEOUT);
    case CURLE_OUT_OF_MEMORY:
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);
    case CURLE_WRITE_ERROR:
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_IO_ERROR);
    default:
        return MAKE_RESULT(SEV_ERROR, CAT_NETWORK, E_NETWORK_ERROR);
    }
}

/* Shared transfer setup for both download flavours */
static RESULT perform_transfer(const char *url, const char *headers[], long timeout, curl_write_callback writer,
                               void *writer_data, const char *progress_label) {
    static const bool curl_ready = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    if (!curl_ready) {
        LOG_ERROR("Unable to initialize libcurl");
        return MAKE_RESULT(SEV_ERROR, CAT_NETWORK, E_NOT_READY);
    }

    autocleanup_curl CURL *curl = curl_easy_init();
    if (!curl)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    autofree_slist struct curl_slist *header_list = nullptr;
    for (int i = 0; headers && headers[i]; i++) {
        struct curl_slist *appended = curl_slist_append(header_list, headers[i]);
        if (!appended)
            return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);
        header_list = appended;
    }

    char error_buffer[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl, CURLOPT_URL, url);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, UPDATE_USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writer);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, writer_data);
    if (header_list)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    if (progress_label) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, (void *)progress_label);
    }

    CURLcode rc = curl_easy_perform(curl);
    if (progress_label)
        log_progress_end();

    if (rc != CURLE_OK) {
        LOG_ERROR("Request to %s failed: %s", url, error_buffer[0] ? error_buffer : curl_easy_strerror(rc));
        return result_from_curl(rc);
    }

    /* file:// and other non-HTTP schemes report 0 */
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status != 0 && (status < 200 || status > 299)) {
        LOG_ERROR("Request to %s returned HTTP status %ld", url, status);
        return MAKE_RESULT(SEV_ERROR, CAT_NETWORK, E_HTTP_STATUS);
    }

    return RESULT_OK;
}

RESULT download_file(const char *url, const char *output_path, const char *headers[], long timeout) {
    if (!url || !output_path)
        return MAKE_RESULT(SEV_ERROR, CAT_NETWORK, E_INVALID_ARG);

    RESULT result;

    /* Scoped so the file is closed before a failed download gets removed */
    {
        autoclose FILE *fp = fopen(output_path, "wb");
        if (!fp)
            return result_from_errno();

        LOG_DEBUG("Downloading %s to %s", url, output_path);
        result = perform_transfer(url, headers, timeout, write_to_file, fp, "Downloading");

        if (SUCCEEDED(result) && fflush(fp) != 0)
            result = result_from_errno();
    }

    if (FAILED(result))
        unlink(output_path);

    return result;
}

RESULT download_to_string(const char *url, std::string &output, const char *headers[], long timeout) {
    if (!url)
        return MAKE_RESULT(SEV_ERROR, CAT_NETWORK, E_INVALID_ARG);

    output.clear();
    LOG_DEBUG("Fetching %s", url);
    RESULT result = perform_transfer(url, headers, timeout, write_to_string, &output, nullptr);
    if (FAILED(result))
        output.clear();

    return result;
}
