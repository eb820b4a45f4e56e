/*
 * Error handling subsystem
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <cerrno>

#include "result.hpp"

RESULT result_from_errno(void) {
    switch (errno) {
    case 0:
        return RESULT_OK;
    case ENOENT:
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_FILE_NOT_FOUND);
    case EACCES:
    case EPERM:
    case EROFS:
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_ACCESS_DENIED);
    case EEXIST:
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_ALREADY_EXISTS);
    case ENOTDIR:
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_NOT_DIR);
    case EBUSY:
    case ETXTBSY:
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_BUSY);
    case EIO:
    case ENOSPC:
    case EDQUOT:
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_IO_ERROR);
    case ENOMEM:
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);
    case EINVAL:
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_INVALID_ARG);
    case ENOSYS:
    case EXDEV:
    case EOPNOTSUPP:
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_NOT_SUPPORTED);
    case ETIMEDOUT:
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_TIMEOUT);
    case EINTR:
    case ECANCELED:
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_CANCELED);
    default:
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_UNKNOWN);
    }
}

const char *result_to_string(RESULT result) {
    if (result == RESULT_OK)
        return "Success";

    const int category = RESULT_CATEGORY(result);
    const int code = RESULT_CODE(result);

    /* Codes whose meaning depends on where they came from */
    if (category == CAT_JSON && code == E_PARSE_ERROR)
        return "Malformed release information";
    if (category == CAT_UPDATE && code == E_PARSE_ERROR)
        return "Malformed checksum manifest";
    if (category == CAT_UPDATE && code == E_NOT_SUPPORTED)
        return "Unsupported platform";

    switch (code) {
    case E_UNKNOWN:
        return "Unknown error";
    case E_INVALID_ARG:
        return "Invalid argument";
    case E_OUT_OF_MEMORY:
        return "Out of memory";
    case E_FILE_NOT_FOUND:
        return "File not found";
    case E_ACCESS_DENIED:
        return "Access denied";
    case E_ALREADY_EXISTS:
        return "Already exists";
    case E_NOT_SUPPORTED:
        return "Operation not supported";
    case E_IO_ERROR:
        return "I/O error";
    case E_TIMEOUT:
        return "Operation timed out";
    case E_NOT_READY:
        return "Not ready";
    case E_NOT_FOUND:
        return "Not found";
    case E_CANCELED:
        return "Operation canceled";
    case E_BUSY:
        return "Resource busy";
    case E_NETWORK_ERROR:
        return "Network error";
    case E_PARSE_ERROR:
        return "Parse error";
    case E_NOT_DIR:
        return "Not a directory";
    case E_HTTP_STATUS:
        return "Unexpected HTTP status";
    case E_UPDATE_AVAILABLE:
        return "Update available";
    case E_UPDATE_PERFORMED:
        return "Update performed";
    case E_UP_TO_DATE:
        return "Already up to date";
    case E_DOWNLOAD_FAILED:
        return "Download failed";
    case E_CHECKSUM_MISMATCH:
        return "Checksum mismatch";
    case E_ROLLED_BACK:
        return "Install failed, previous version restored";
    case E_RECOVERY_REQUIRED:
        return "Install failed and could not be rolled back, manual recovery required";
    default:
        return "Unrecognized result";
    }
}
