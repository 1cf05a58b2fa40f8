// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "chitu_protocol.h"
#include "cli_args.h"
#include "command_channel.h"
#include "config.h"
#include "connection_manager.h"
#include "error_reporting.h"
#include "file_transfer_engine.h"
#include "logging_init.h"
#include "print_controller.h"
#include "remote_mirror.h"
#include "sync_engine.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>

using namespace chitusync;

// =============================================================================
// Signal Handling
// =============================================================================

static std::atomic<bool> g_quit{false};
static std::atomic<bool> g_reload{false};
static std::atomic<bool> g_sync_now{false};

static void signal_handler(int sig) {
    switch (sig) {
    case SIGHUP:
        g_reload = true;
        break;
    case SIGUSR1:
        g_sync_now = true;
        break;
    default:
        g_quit = true;
        break;
    }
}

static void setup_signal_handlers() {
    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);
    signal(SIGHUP, signal_handler);
    signal(SIGUSR1, signal_handler);
    signal(SIGPIPE, SIG_IGN);
}

// =============================================================================
// Daemon
// =============================================================================

namespace {

/// Logs engine events; the daemon has no other front end
class LoggingObserver : public SyncObserver {
  public:
    void on_connection_state(ConnectionState old_state, ConnectionState new_state) override {
        if (old_state == ConnectionState::CONNECTING &&
            new_state == ConnectionState::DISCONNECTED) {
            connect_failed_ = true;
        }
    }

    void on_board_info(const BoardInfo& info) override {
        spdlog::info("[Daemon] Printer {} ({}), firmware {}", info.name, info.ip, info.version);
    }

    void on_sync_status(SyncStatus status) override {
        spdlog::info("[Daemon] Sync status: {}", sync_status_name(status));
    }

    void on_plan_finished(const PassSummary& summary) override {
        if (summary.deferred) {
            spdlog::info("[Daemon] Sync deferred until the current print finishes");
            deferred_ = true;
            return;
        }
        spdlog::info("[Daemon] Pass finished: {} ok, {} failed, {} requeued", summary.succeeded,
                     summary.failed, summary.requeued);
        if (summary.failed > 0) {
            failed_ = true;
        }
    }

    void on_operation_result(const PlanOperation& op, const ChituError& error) override {
        if (error.ok()) {
            spdlog::info("[Daemon] {} {}: done", plan_operation_kind_name(op.kind), op.name);
        } else {
            spdlog::warn("[Daemon] {} {}: {}", plan_operation_kind_name(op.kind), op.name,
                         error.user_message());
        }
    }

    void on_transfer_progress(const TransferProgress& progress) override {
        spdlog::trace("[Daemon] {} {:.1f}%", progress.filename, progress.percent());
    }

    void on_print_status(const PrintJobStatus& status) override {
        if (status.is_active()) {
            spdlog::debug("[Daemon] Printing {} {:.1f}%", status.filename,
                          status.progress_percent());
        }
    }

    void on_error(const ChituError& error) override {
        spdlog::error("[Daemon] {}", error.user_message());
    }

    bool connect_failed() const {
        return connect_failed_.load();
    }

    bool failed() const {
        return failed_.load();
    }

    bool deferred() const {
        return deferred_.load();
    }

  private:
    std::atomic<bool> connect_failed_{false};
    std::atomic<bool> deferred_{false};
    std::atomic<bool> failed_{false};
};

SyncConfig build_sync_config(const Config& config, const CliArgs& args) {
    SyncConfig cfg = config.to_sync_config();
    if (!args.host.empty()) {
        cfg.endpoint.host = args.host;
    }
    if (!args.folder.empty()) {
        cfg.sync_folder = Config::expand_home(args.folder);
    }
    return cfg;
}

int run_daemon(Config& config, const CliArgs& args) {
    spdlog::info("[Daemon] chitu-sync {} starting", chitusync_version());

    while (!g_quit) {
        auto observer = std::make_shared<LoggingObserver>();
        auto engine = std::make_unique<SyncEngine>(build_sync_config(config, args), observer);

        ChituError err = engine->start();
        if (err.has_error()) {
            NOTIFY_ERROR("{}", err.user_message());
            spdlog::warn("[Daemon] Pipeline not started; waiting for SIGHUP");
        }

        while (!g_quit && !g_reload) {
            if (g_sync_now.exchange(false) && engine->is_running()) {
                spdlog::info("[Daemon] Manual sync requested");
                engine->request_full_pass("manual");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        engine->stop();
        engine.reset();

        if (g_reload.exchange(false) && !g_quit) {
            spdlog::info("[Daemon] Reloading {}", config.get_path());
            config.init(config.get_path());
            spdlog::set_level(args.verbosity > 0 ? logging::verbosity_to_level(args.verbosity)
                                                 : config.log_level(spdlog::level::info));
        }
    }

    spdlog::info("[Daemon] Shut down");
    return 0;
}

int run_single_pass(Config& config, const CliArgs& args) {
    auto observer = std::make_shared<LoggingObserver>();
    SyncEngine engine(build_sync_config(config, args), observer);

    ChituError err = engine.start();
    if (err.has_error()) {
        NOTIFY_ERROR("{}", err.user_message());
        return 1;
    }

    while (!g_quit && engine.completed_passes() == 0 && !observer->connect_failed() &&
           !observer->deferred()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    bool completed = engine.completed_passes() > 0;
    engine.stop();

    if (observer->deferred() && !completed) {
        NOTIFY_ERROR("{}", ChituError::printer_busy("sync").user_message());
        return 1;
    }
    if (!completed) {
        if (!g_quit) {
            NOTIFY_ERROR("{}", ChituError::connect_failed(engine.config().endpoint.host,
                                                          "no answer to identify")
                                   .user_message());
        }
        return 1;
    }
    return observer->failed() ? 1 : 0;
}

// =============================================================================
// One-shot commands
// =============================================================================

/// Manager and channel for a single command; no event loop, no reconnects
struct BoardLink {
    std::shared_ptr<const BoardProtocol> protocol;
    ConnectionManager manager;
    CommandChannel channel;

    explicit BoardLink(const SyncConfig& cfg)
        : protocol(std::make_shared<ChituProtocol>()), manager(cfg.endpoint, protocol),
          channel(manager, protocol, cfg.endpoint.command_timeout) {}
};

std::string base_name(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

ChituError run_board_command(BoardLink& link, const SyncConfig& cfg, const CliArgs& args) {
    RemoteMirror mirror(link.channel);
    PrintController printer(link.channel, cfg.status_poll_interval);
    const auto& cmd_args = args.command_args;

    switch (args.command) {
    case CliCommand::LIST: {
        RemoteSnapshotPtr files;
        ChituError err = mirror.list_remote(files);
        if (err.ok()) {
            for (const auto& [name, record] : files->records()) {
                printf("%12llu  %s\n", static_cast<unsigned long long>(record.size),
                       name.c_str());
            }
            printf("%zu file(s)\n", files->size());
        }
        return err;
    }
    case CliCommand::UPLOAD: {
        std::string remote_name = cmd_args.size() > 1 ? cmd_args[1] : base_name(cmd_args[0]);
        if (!link.protocol->is_job_file(remote_name)) {
            spdlog::warn("[CLI] {} is not a {} job file", remote_name, link.protocol->family());
        }
        FileTransferEngine transfer(link.channel, cfg.endpoint.chunk_delay);
        int last_percent = -1;
        ChituError err = transfer.upload(
            cmd_args[0], remote_name,
            [&last_percent](const TransferProgress& progress) {
                int percent = static_cast<int>(progress.percent());
                if (percent != last_percent) {
                    last_percent = percent;
                    printf("\r%s %3d%%", progress.filename.c_str(), percent);
                    fflush(stdout);
                }
            },
            &g_quit);
        if (last_percent >= 0) {
            printf("\n");
        }
        return err;
    }
    case CliCommand::DELETE:
        return mirror.delete_remote(cmd_args[0]);
    case CliCommand::PRINT:
        return printer.start_print(cmd_args[0]);
    case CliCommand::STOP:
        return printer.stop_print();
    case CliCommand::STATUS: {
        PrintJobStatus status;
        ChituError err = printer.poll_status(status);
        if (err.ok()) {
            printf("State:    %s\n", print_state_name(status.state));
            if (status.is_active()) {
                printf("Progress: %llu / %llu bytes (%.1f%%)\n",
                       static_cast<unsigned long long>(status.bytes_read),
                       static_cast<unsigned long long>(status.total_bytes),
                       status.progress_percent());
            }
        }
        return err;
    }
    case CliCommand::INFO: {
        BoardInfo info = link.manager.get_board_info();
        printf("Name:     %s\n", info.name.c_str());
        printf("ID:       %s\n", info.id.c_str());
        printf("Firmware: %s\n", info.version.c_str());
        printf("MAC:      %s\n", info.mac.c_str());
        printf("IP:       %s\n", info.ip.c_str());
        return {};
    }
    case CliCommand::HOME:
        return printer.home_z();
    case CliCommand::POSITION: {
        double z = 0.0;
        ChituError err = printer.z_position(z);
        if (err.ok()) {
            printf("Z: %.3f mm\n", z);
        }
        return err;
    }
    case CliCommand::JOG:
        return printer.move_z(args.jog_z);
    case CliCommand::FORMAT: {
        size_t deleted = 0;
        size_t failed = 0;
        ChituError err = mirror.delete_all(deleted, failed);
        printf("Deleted %zu file(s), %zu failed\n", deleted, failed);
        return err;
    }
    case CliCommand::DAEMON:
    case CliCommand::SYNC:
        break;
    }
    return ChituError::invalid_request(cli_command_name(args.command), "not a board command");
}

int run_one_shot(const Config& config, const CliArgs& args) {
    SyncConfig cfg = build_sync_config(config, args);
    if (cfg.endpoint.host.empty() || cfg.endpoint.port == 0) {
        NOTIFY_ERROR("{}", ChituError::config_error("printer address is not set").user_message());
        return 1;
    }

    BoardLink link(cfg);
    ChituError err = link.manager.connect();
    if (err.ok()) {
        err = run_board_command(link, cfg, args);
    }
    link.manager.disconnect();

    if (err.has_error()) {
        NOTIFY_ERROR("{}", err.user_message());
        spdlog::debug("[CLI] {}: {}", err.get_type_string(), err.message);
        return 1;
    }
    return 0;
}

} // namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.exit_code;
    }

    setup_signal_handlers();

    Config* config = Config::get_instance();
    config->init(args.config_path.empty() ? Config::default_path() : args.config_path);

    logging::LogConfig log_config;
    log_config.level = args.verbosity > 0 ? logging::verbosity_to_level(args.verbosity)
                                          : config->log_level(spdlog::level::info);
    log_config.target = args.log_dest.empty() ? logging::LogTarget::Auto
                                              : logging::parse_log_target(args.log_dest);
    log_config.file_path = args.log_file;
    // One-shot commands print their own results; keep the console for errors
    if (args.command != CliCommand::DAEMON && args.command != CliCommand::SYNC &&
        args.verbosity == 0) {
        log_config.level = spdlog::level::warn;
        log_config.target = logging::LogTarget::Console;
    }
    logging::init(log_config);

    if (args.command != CliCommand::DAEMON) {
        set_notification_handler([](NotificationLevel level, const std::string& message) {
            fprintf(stderr, "%s%s\n", level == NotificationLevel::ERROR ? "Error: " : "",
                    message.c_str());
        });
    }

    switch (args.command) {
    case CliCommand::DAEMON:
        return run_daemon(*config, args);
    case CliCommand::SYNC:
        return run_single_pass(*config, args);
    default:
        return run_one_shot(*config, args);
    }
}
