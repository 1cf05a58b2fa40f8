// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifndef CHITUSYNC_VERSION
#define CHITUSYNC_VERSION "0.0.0-dev"
#endif

namespace chitusync {

namespace {

struct CommandEntry {
    const char* name;
    CliCommand command;
    size_t min_args;
    size_t max_args;
};

const CommandEntry COMMANDS[] = {
    {"daemon", CliCommand::DAEMON, 0, 0},     {"list", CliCommand::LIST, 0, 0},
    {"upload", CliCommand::UPLOAD, 1, 2},     {"delete", CliCommand::DELETE, 1, 1},
    {"print", CliCommand::PRINT, 1, 1},       {"stop", CliCommand::STOP, 0, 0},
    {"status", CliCommand::STATUS, 0, 0},     {"info", CliCommand::INFO, 0, 0},
    {"home", CliCommand::HOME, 0, 0},         {"position", CliCommand::POSITION, 0, 0},
    {"jog", CliCommand::JOG, 1, 1},           {"format", CliCommand::FORMAT, 0, 0},
    {"sync", CliCommand::SYNC, 0, 0},
};

const CommandEntry* find_command(const char* name) {
    for (const auto& entry : COMMANDS) {
        if (strcmp(entry.name, name) == 0) {
            return &entry;
        }
    }
    return nullptr;
}

// "-5" or "-.5" after a command is an argument, not an option
bool is_negative_number(const char* arg) {
    return arg[0] == '-' && (isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.');
}

bool usage_error(CliArgs& args) {
    printf("Use --help for usage information\n");
    args.exit_code = 2;
    return false;
}

} // namespace

const char* chitusync_version() {
    return CHITUSYNC_VERSION;
}

const char* cli_command_name(CliCommand command) {
    for (const auto& entry : COMMANDS) {
        if (entry.command == command) {
            return entry.name;
        }
    }
    return "unknown";
}

// Helper to parse double with validation
static bool parse_double(const char* str, double& out, const char* name) {
    char* endptr;
    double val = strtod(str, &endptr);
    if (endptr == str || *endptr != '\0') {
        printf("Error: %s requires a numeric value\n", name);
        return false;
    }
    out = val;
    return true;
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options] [command [args]]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>  Config file (default: $XDG_CONFIG_HOME/chitu-sync/"
           "sync_config.json)\n");
    printf("  --host <ip>          Printer address (overrides printer_ip)\n");
    printf("  --folder <path>      Sync folder (overrides sync_folder)\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  -h, --help           Show this help message\n");
    printf("  -V, --version        Show version information\n");
    printf("\nCommands:\n");
    printf("  daemon               Watch the folder and mirror it to the printer (default)\n");
    printf("  sync                 Run one full mirror pass and exit\n");
    printf("  list                 List job files on the printer\n");
    printf("  upload <file> [name] Upload a file (remote name defaults to the file name)\n");
    printf("  delete <name>        Delete a file from the printer\n");
    printf("  print <name>         Start printing a file already on the printer\n");
    printf("  stop                 Stop the current print\n");
    printf("  status               Show print job status\n");
    printf("  info                 Show board identification\n");
    printf("  home                 Home the Z axis\n");
    printf("  position             Show the Z position\n");
    printf("  jog <z>              Move Z to an absolute position in mm\n");
    printf("  format --yes         Delete every job file on the printer\n");
    printf("\nSignals (daemon):\n");
    printf("  SIGHUP               Reload the config file and restart the pipeline\n");
    printf("  SIGUSR1              Run a full mirror pass now\n");
    printf("  SIGINT, SIGTERM      Shut down\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    const CommandEntry* command = nullptr;

    for (int i = 1; i < argc; i++) {
        // Verbosity: -v, -vv, -vvv or repeated -v
        if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        } else if (argv[i][0] == '-' && argv[i][1] == 'v' &&
                   strspn(argv[i] + 1, "v") == strlen(argv[i] + 1)) {
            args.verbosity += static_cast<int>(strlen(argv[i] + 1));
        }
        // Config file
        else if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                printf("Error: %s requires a path argument\n", argv[i]);
                return usage_error(args);
            }
            args.config_path = argv[++i];
        } else if (strcmp(argv[i], "--host") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --host requires an address\n");
                return usage_error(args);
            }
            args.host = argv[++i];
        } else if (strcmp(argv[i], "--folder") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --folder requires a path argument\n");
                return usage_error(args);
            }
            args.folder = argv[++i];
        }
        // Log destination
        else if (strcmp(argv[i], "--log-dest") == 0 || strncmp(argv[i], "--log-dest=", 11) == 0) {
            const char* value = nullptr;
            if (strncmp(argv[i], "--log-dest=", 11) == 0) {
                value = argv[i] + 11;
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                printf("Error: --log-dest requires an argument\n");
                return usage_error(args);
            }
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "journal" &&
                args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, journal, syslog, file, console\n");
                return usage_error(args);
            }
        } else if (strcmp(argv[i], "--log-file") == 0 || strncmp(argv[i], "--log-file=", 11) == 0) {
            if (strncmp(argv[i], "--log-file=", 11) == 0) {
                args.log_file = argv[i] + 11;
            } else if (i + 1 < argc) {
                args.log_file = argv[++i];
            } else {
                printf("Error: --log-file requires a path argument\n");
                return usage_error(args);
            }
        } else if (strcmp(argv[i], "--yes") == 0) {
            args.confirmed = true;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.exit_code = 0;
            return false;
        }
        // Version
        else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            printf("chitu-sync %s\n", chitusync_version());
            args.exit_code = 0;
            return false;
        }
        // First positional is the command, the rest are its arguments
        else if (argv[i][0] != '-' || (command && is_negative_number(argv[i]))) {
            if (!command) {
                command = find_command(argv[i]);
                if (!command) {
                    printf("Unknown command: %s\n", argv[i]);
                    return usage_error(args);
                }
                args.command = command->command;
            } else {
                args.command_args.push_back(argv[i]);
            }
        }
        // Unknown argument
        else {
            printf("Unknown argument: %s\n", argv[i]);
            return usage_error(args);
        }
    }

    if (command) {
        size_t count = args.command_args.size();
        if (count < command->min_args || count > command->max_args) {
            printf("Error: '%s' takes ", command->name);
            if (command->min_args == command->max_args) {
                printf("%zu argument(s), got %zu\n", command->min_args, count);
            } else {
                printf("%zu-%zu arguments, got %zu\n", command->min_args, command->max_args,
                       count);
            }
            return usage_error(args);
        }
    }

    if (args.command == CliCommand::JOG &&
        !parse_double(args.command_args[0].c_str(), args.jog_z, "jog")) {
        return usage_error(args);
    }

    if (args.command == CliCommand::FORMAT && !args.confirmed) {
        printf("Error: format deletes every file on the printer; pass --yes to confirm\n");
        return usage_error(args);
    }

    return true;
}

} // namespace chitusync
