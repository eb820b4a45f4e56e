/*
 * branchd command line entry point
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include "branchdconfig.hpp"
#include "log.hpp"
#include "result.hpp"
#include "update.hpp"
#include "util.hpp"

#include "fmt/compile.h"
#include "fmt/core.h"
#include "fmt/printf.h"

using namespace fmt::literals;

static void print_usage(const char *invocation) {
    fmt::print(R"_(Usage: {1} <command>
Commands:
  update    Check for, download, verify and install the latest {0} release
  check     Check for a newer release without installing it
  version   Print the version of {0} and exit
  help      Display this help and exit

Environment variables:
  BRANCHD_LOG_LEVEL     Control the verbosity of the logging output. Valid values are:
                        - 'none'     Turn off all logging
                        - 'error'    Show only critical errors that prevent proper operation
                        - 'warn'     Show warnings and errors
                        - 'info'     Show normal operational information and all of the above (default)
                        - 'debug'    Show detailed debugging information and all of the above

  BRANCHD_LOG_FILE      Specify a custom path for the log file (default: $BRANCHD_INSTALL_DIR/{0}.log)
  BRANCHD_INSTALL_DIR   Override the program directory of $XDG_DATA_HOME/{0} or $HOME/.local/share/{0}
  BRANCHD_RELEASES_URL  Registry endpoint for the latest release (default: {2})
  BRANCHD_DOWNLOAD_URL  Base URL of release artifacts (default: {3})
)_"_cf,
               PROG_NAME, invocation, DEFAULT_RELEASES_URL, DEFAULT_DOWNLOAD_URL);
}

struct options {
    unsigned version : 1; /* 1 = print the version string and exit */
    unsigned help : 1;    /* 1 = show help and exit */
    unsigned check : 1;   /* 1 = check for updates */
    unsigned update : 1;  /* 1 = check for and apply updates */
};

/* Parse the command verb */
static RESULT parse_option(const char *option, struct options *opts) {
    if (!opts || !option || !option[0])
        return MAKE_RESULT(SEV_ERROR, CAT_CONFIG, E_INVALID_ARG);

    if (LCSTRING_EQUALS(option, "version") || LCSTRING_EQUALS(option, "--version")) {
        opts->version = 1;
    } else if (LCSTRING_EQUALS(option, "help") || LCSTRING_EQUALS(option, "--help") || LCSTRING_EQUALS(option, "-h")) {
        opts->help = 1;
    } else if (LCSTRING_EQUALS(option, "check")) {
        opts->check = 1;
    } else if (LCSTRING_EQUALS(option, "update")) {
        opts->update = 1;
    } else {
        return MAKE_RESULT(SEV_ERROR, CAT_CONFIG, E_NOT_FOUND);
    }

    return RESULT_OK;
}

int main(int argc, char *argv[]) {
    struct options opts = {};
    RESULT result;

    if (argc != 2) {
        print_usage(argv[0]);
        return argc < 2 ? 0 : 1;
    }

    result = parse_option(argv[1], &opts);
    if (FAILED(result)) {
        fmt::fprintf(stderr, "Unknown command: %s\n", argv[1]);
        print_usage(argv[0]);
        return 1;
    }

    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (opts.version) {
        fmt::printf("%s version %s\n", PROG_NAME, VERSION);
        return 0;
    }

    /* Logging only needs the program directory, so carry on without it */
    if (FAILED(config::setup_prog_dir()))
        fmt::fprintf(stderr, "Warning: The program directory is unusable, not logging to a file\n");

    config::setup_endpoints();

    result = log_init();
    if (FAILED(result) && (RESULT_CODE(result) != E_CANCELED))
        fmt::fprintf(stderr, "Warning: Failed to initialize logging to file: %s\n", result_to_string(result));

    LOG_DEBUG(PROG_NAME " %s, program directory: %s", VERSION, config::branchd_dir ? config::branchd_dir : "(none)");

    result = handle_updates(opts.check, opts.update);
    if (FAILED(result)) {
        LOG_RESULT(Level::Error, result, "Update unsuccessful");
    } else if (RESULT_CODE(result) == E_UPDATE_PERFORMED) {
        LOG_SYSTEM(PROG_NAME " was updated successfully.");
    }

    log_cleanup();
    return FAILED(result) ? 1 : 0;
}
