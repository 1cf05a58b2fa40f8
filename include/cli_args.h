// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for chitu-sync
 */

#include <string>
#include <vector>

namespace chitusync {

/**
 * @brief What the process should do after startup
 */
enum class CliCommand {
    DAEMON,   ///< Watch and mirror until signalled (default)
    LIST,     ///< Print the board's file listing
    UPLOAD,   ///< Upload one file
    DELETE,   ///< Delete one remote file
    PRINT,    ///< Start printing a remote file
    STOP,     ///< Stop the current job
    STATUS,   ///< Print job status
    INFO,     ///< Board identification
    HOME,     ///< Home Z
    POSITION, ///< Report Z position
    JOG,      ///< Absolute Z move
    FORMAT,   ///< Delete every job file on the board
    SYNC      ///< One full pass, then exit
};

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path; // -c: empty = Config::default_path()
    std::string host;        // --host: overrides printer_ip
    std::string folder;      // --folder: overrides sync_folder

    // Logging
    int verbosity = 0;
    std::string log_dest; // --log-dest: empty = from config / auto
    std::string log_file; // --log-file

    CliCommand command = CliCommand::DAEMON;
    std::vector<std::string> command_args;
    double jog_z = 0.0;
    bool confirmed = false; // --yes for destructive commands

    /// Set when parsing stopped early: 0 after --help/--version, 2 on a usage error
    int exit_code = 0;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true to continue, false if help/version was shown or an error
 *         occurred (see CliArgs::exit_code)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/// Command keyword ("daemon", "list", ...)
const char* cli_command_name(CliCommand command);

/// Version string reported by --version and the daemon banner
const char* chitusync_version();

} // namespace chitusync
