/*
 * Logging subsystem implementation
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <cerrno>
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <unistd.h>

#define G_LOG_DOMAIN "libnotify"
#include "libnotify/notify.h"

#include "branchdconfig.hpp"
#include "log.hpp"
#include "macros.hpp"
#include "util.hpp"

#include "fmt/printf.h"

static FILE *log_file = nullptr;
static Level current_log_level = Level::Info;
static bool terminal_output = false;
static gboolean notify_initialized = FALSE;

/* Color codes for terminal output */
#define COLOR_RESET "\033[0m"
#define COLOR_SYSTEM "\033[36m"
#define COLOR_RED "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_GREEN "\033[32m"
#define COLOR_BLUE "\033[34m"
#define COLOR_CYAN "\033[36m"

static constexpr const char *const level_strings[] = {"\0", "SYSTEM", "ERROR", "WARN", "INFO", "DEBUG", "DOWN"};
static constexpr const char *const level_colors[] = {"\0",        COLOR_SYSTEM, COLOR_RED, COLOR_YELLOW,
                                                     COLOR_GREEN, COLOR_BLUE,   COLOR_CYAN};

static_assert(sizeof(level_strings) == sizeof(level_colors), "each log level string should have a corresponding color");

/* Parse log level from string, anything unrecognized means Info */
static Level parse_log_level(const char *level_str) {
    if (!level_str)
        return Level::Info;

    if (LCSTRING_EQUALS(level_str, "none"))
        return Level::None;
    if (LCSTRING_EQUALS(level_str, "error"))
        return Level::Error;
    if (LCSTRING_EQUALS(level_str, "warn") || LCSTRING_EQUALS(level_str, "warning"))
        return Level::Warning;
    if (LCSTRING_EQUALS(level_str, "debug"))
        return Level::Debug;

    return Level::Info;
}

static void format_timestamp(char *buffer, size_t size) {
    time_t now = time(nullptr);
    struct tm tm_info;
    localtime_r(&now, &tm_info);
    strftime(buffer, size, "%Y-%m-%d %H:%M:%S", &tm_info);
}

RESULT log_init(void) {
    autofree char *log_file_path = nullptr;
    terminal_output = !!isatty(STDOUT_FILENO);

    /* localtime_r() is not required to call tzset(3) itself */
    tzset();

    const char *log_level_env = getenv("BRANCHD_LOG_LEVEL");
    if (log_level_env)
        log_set_level(parse_log_level(log_level_env));

    notify_initialized = notify_init(PROG_NAME);

    if (current_log_level == Level::None)
        return MAKE_RESULT(SEV_SUCCESS, CAT_CONFIG, E_CANCELED);

    const char *log_file_env = getenv("BRANCHD_LOG_FILE");
    if (log_file_env)
        log_file_path = strdup(log_file_env);
    else if (config::branchd_dir)
        join_paths(log_file_path, config::branchd_dir, PROG_NAME ".log");

    if (!log_file_path)
        return RESULT_OK;

    log_file = fopen(log_file_path, "a");
    if (!log_file) {
        RESULT result = result_from_errno();
        fmt::fprintf(stderr, "Failed to open log file %s: %s\n", log_file_path, strerror(errno));
        return result;
    }

    char time_str[64];
    format_timestamp(time_str, sizeof(time_str));
    fmt::fprintf(log_file, "=== Log session started at %s ===\n", time_str);
    fflush(log_file);

    return RESULT_OK;
}

void log_cleanup(void) {
    if (log_file) {
        char time_str[64];
        format_timestamp(time_str, sizeof(time_str));
        fmt::fprintf(log_file, "=== Log session ended at %s ===\n\n", time_str);
        fflush(log_file);

        fclose(log_file);
        log_file = nullptr;
    }

    if (notify_initialized) {
        notify_uninit();
        notify_initialized = FALSE;
    }
}

void log_set_level(Level level) {
    if (level >= Level::None && level <= Level::Debug)
        current_log_level = level;
}

static void show_notification(const char *message) {
    NotifyNotification *notif = notify_notification_new(PROG_NAME, message, "dialog-information");
    if (!notif)
        return;

    notify_notification_set_urgency(notif, NOTIFY_URGENCY_CRITICAL);
    notify_notification_set_timeout(notif, 30000); /* 30 seconds */

    GError *error = nullptr;
    if (!notify_notification_show(notif, &error) && error) {
        /* no desktop session, the terminal/log copy is enough */
        g_error_free(error);
    }

    g_object_unref(G_OBJECT(notif));
}

void _log_message(Level level, const char *file, int line, const char *format, ...) {
    if (level > current_log_level && level != Level::System)
        return;

    autofree char *message = nullptr;
    va_list args;
    va_start(args, format);
    int len = vasprintf(&message, format, args);
    va_end(args);
    if (len < 0) {
        message = nullptr;
        return;
    }

    if (level == Level::System && notify_initialized)
        show_notification(message);

    if (terminal_output) {
        FILE *output = (level <= Level::Warning) ? stderr : stdout;
        fmt::fprintf(output, "%s[%s]%s %s\n", level_colors[static_cast<size_t>(level)],
                     level_strings[static_cast<size_t>(level)], COLOR_RESET, message);
    } else if (level <= Level::Error && level != Level::None) {
        /* Diagnostics still need to reach a redirected stderr */
        fmt::fprintf(stderr, "%s: %s\n", PROG_NAME, message);
    }

    if (log_file && level != Level::Progress) {
        char timestamp[32];
        format_timestamp(timestamp, sizeof(timestamp));

        /* Get just the filename without the path */
        const char *filename = strrchr(file, '/');
        if (filename)
            filename++; /* Skip the slash */
        else
            filename = file;

        fmt::fprintf(log_file, "[%s] %s %s:%d: %s\n", level_strings[static_cast<size_t>(level)], timestamp, filename,
                     line, message);
        fflush(log_file);
    }
}

void _log_result(Level level, const char *file, int line, RESULT result, const char *context) {
    if (SUCCEEDED(result) && level < Level::Debug)
        return;
    if (level > current_log_level)
        return;

    const char *result_str = result_to_string(result);

    if (context && context[0] != '\0')
        _log_message(level, file, line, "%s: %s (0x%08X)", context, result_str, (unsigned)result);
    else
        _log_message(level, file, line, "Result: %s (0x%08X)", result_str, (unsigned)result);

    if (current_log_level == Level::Debug) {
        const int severity = RESULT_SEVERITY(result);
        const int category = RESULT_CATEGORY(result);
        const int code = RESULT_CODE(result);

        _log_message(Level::Debug, file, line, "  Details: Severity=%d, Category=%d, Code=0x%04X", severity, category,
                     code);
    }
}

static time_t last_progress_update = 0;

/* Progress printer for curl downloads */
void log_progress(const char *operation, double percentage, int bytes_done, int bytes_total) {
    if (!terminal_output)
        return;

    /* Limit update frequency to 1hz */
    time_t now = time(nullptr);
    if (now - last_progress_update < 1 && bytes_done < bytes_total && bytes_done > 0)
        return;

    last_progress_update = now;

    const int bar_width = 30;
    const int filled_width = (int)((percentage / 100.0) * bar_width);

    fmt::fprintf(stdout, "\r%s[%s]%s %-20.20s [", level_colors[static_cast<size_t>(Level::Progress)],
                 level_strings[static_cast<size_t>(Level::Progress)], COLOR_RESET, operation);

    for (int i = 0; i < bar_width; i++)
        fputc(i < filled_width ? '=' : (i == filled_width ? '>' : ' '), stdout);

    if (bytes_total > 0) {
        const char *units[] = {"B", "KB", "MB", "GB"};
        int unit_idx = 0;
        double size_now = bytes_done;
        double size_total = bytes_total;

        while (size_total >= 1024 && unit_idx < 3) {
            size_now /= 1024;
            size_total /= 1024;
            unit_idx++;
        }
        fmt::fprintf(stdout, "] %3d%% (%.1f/%.1f %s)", (int)percentage, size_now, size_total, units[unit_idx]);
    } else {
        fmt::fprintf(stdout, "] %3d%%", (int)percentage);
    }

    fflush(stdout);
}

void log_progress_end(void) {
    if (terminal_output && last_progress_update > 0) {
        fmt::fprintf(stdout, "\n");
        fflush(stdout);
        last_progress_update = 0;
    }
}
