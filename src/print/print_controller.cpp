// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "print_controller.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

namespace chitusync {

PrintController::PrintController(CommandChannel& channel, std::chrono::milliseconds poll_interval)
    : channel_(channel), poll_interval_(poll_interval) {}

PrintController::~PrintController() {
    stop_polling();
}

void PrintController::attach_loop(const hv::EventLoopPtr& loop) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = loop;
}

void PrintController::set_status_callback(StatusCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_callback_ = std::move(cb);
}

void PrintController::set_finished_callback(FinishedCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_callback_ = std::move(cb);
}

PrintJobStatus PrintController::last_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_status_;
}

ChituError PrintController::send_checked(const BoardCommand& cmd, BoardReply& reply) {
    ChituError err = channel_.send(cmd, reply);
    if (err.has_error()) {
        return err;
    }
    if (channel_.protocol().is_rejection(reply)) {
        return ChituError::remote_rejected(cmd.name, reply.first_line());
    }
    return {};
}

ChituError PrintController::poll_status(PrintJobStatus& status) {
    const BoardProtocol& protocol = channel_.protocol();

    BoardReply reply;
    ChituError err = channel_.send(protocol.query_status(), reply);
    if (err.has_error()) {
        if (err.is_connection_level()) {
            stop_polling();
        }
        return err;
    }

    PrintJobStatus parsed = last_status();
    err = protocol.parse_print_status(reply, parsed);
    if (err.has_error()) {
        channel_.report_protocol_error(err);
        stop_polling();
        return err;
    }

    bool was_active = false;
    StatusCallback status_copy;
    FinishedCallback finished_copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_active = last_status_.is_active();
        if (parsed.state == PrintJobStatus::State::IDLE) {
            parsed.filename.clear();
        }
        last_status_ = parsed;
        status_copy = status_callback_;
        finished_copy = finished_callback_;
    }

    if (status_copy) {
        try {
            status_copy(parsed);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[PrintController] Status callback threw: {}", e.what());
        }
    }

    if (parsed.is_active()) {
        start_polling();
    } else {
        stop_polling();
        if (was_active && parsed.state == PrintJobStatus::State::IDLE) {
            spdlog::info("[PrintController] Print finished");
            if (finished_copy) {
                try {
                    finished_copy();
                } catch (const std::exception& e) {
                    LOG_ERROR_INTERNAL("[PrintController] Finished callback threw: {}", e.what());
                }
            }
        }
    }

    status = parsed;
    return {};
}

ChituError PrintController::start_print(const std::string& remote_name) {
    const BoardProtocol& protocol = channel_.protocol();
    BoardCommand cmd = protocol.start_print(remote_name);

    if (remote_name.empty()) {
        return ChituError::invalid_request(cmd.name, "no file name given");
    }

    PrintJobStatus current;
    ChituError err = poll_status(current);
    if (err.has_error()) {
        return err;
    }
    if (current.is_active()) {
        spdlog::warn("[PrintController] Refusing to start {}: printer is {}", remote_name,
                     print_state_name(current.state));
        return ChituError::printer_busy(cmd.name);
    }

    BoardReply reply;
    err = send_checked(cmd, reply);
    if (err.has_error()) {
        return err;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_status_.filename = remote_name;
    }
    spdlog::info("[PrintController] Started printing {}", remote_name);
    start_polling();
    return {};
}

ChituError PrintController::stop_print() {
    BoardReply reply;
    ChituError err = send_checked(channel_.protocol().stop_print(), reply);
    if (err.has_error()) {
        return err;
    }
    spdlog::info("[PrintController] Stop requested");
    return {};
}

ChituError PrintController::home_z() {
    BoardReply reply;
    ChituError err = send_checked(channel_.protocol().home_z(), reply);
    if (err.ok()) {
        spdlog::info("[PrintController] Z homed");
    }
    return err;
}

ChituError PrintController::z_position(double& z_mm) {
    const BoardProtocol& protocol = channel_.protocol();
    BoardReply reply;
    ChituError err = channel_.send(protocol.query_position(), reply);
    if (err.has_error()) {
        return err;
    }
    err = protocol.parse_z_position(reply, z_mm);
    if (err.has_error()) {
        channel_.report_protocol_error(err);
    }
    return err;
}

ChituError PrintController::move_z(double z_mm) {
    BoardCommand cmd = channel_.protocol().move_z(z_mm);
    if (!(z_mm >= Z_MIN_MM && z_mm <= Z_MAX_MM)) {
        return ChituError::invalid_request(
            cmd.name, fmt::format("Z target {} outside soft limits {}-{} mm", z_mm, Z_MIN_MM,
                                  Z_MAX_MM));
    }
    BoardReply reply;
    return send_checked(cmd, reply);
}

void PrintController::start_polling() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loop_ || polling_.load()) {
        return;
    }
    polling_ = true;
    // Called from the reconciliation worker and CLI threads, never the loop's own
    poll_timer_ = loop_->setTimerInLoop(
        static_cast<int>(poll_interval_.count()), [this](hv::TimerID) { on_poll_timer(); },
        INFINITE);
    spdlog::debug("[PrintController] Status polling started ({}ms)", poll_interval_.count());
}

void PrintController::stop_polling() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!polling_.exchange(false)) {
        return;
    }
    if (loop_ && poll_timer_ != INVALID_TIMER_ID) {
        loop_->killTimer(poll_timer_);
    }
    poll_timer_ = INVALID_TIMER_ID;
    spdlog::debug("[PrintController] Status polling stopped");
}

void PrintController::on_poll_timer() {
    if (!polling_.load()) {
        return;
    }
    PrintJobStatus status;
    ChituError err = poll_status(status);
    if (err.has_error()) {
        spdlog::debug("[PrintController] Status poll failed: {}", err.message);
    }
}

} // namespace chitusync
