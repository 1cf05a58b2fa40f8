// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chitu_error.h"
#include "command_channel.h"
#include "sync_types.h"

#include "hv/EventLoop.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace chitusync {

/**
 * @brief Print start/stop, job status polling and Z-axis utilities
 *
 * While a job is active the controller polls the board status on the event
 * loop every status-poll interval and republishes PrintJobStatus. Polling
 * stops when the board reports Idle or the connection drops; the
 * idle-after-active transition fires the print-finished callback.
 *
 * Progress is the board's byte position, reported verbatim.
 */
class PrintController {
  public:
    using StatusCallback = std::function<void(const PrintJobStatus&)>;
    using FinishedCallback = std::function<void()>;

    static constexpr double Z_MIN_MM = 0.0;
    static constexpr double Z_MAX_MM = 200.0;

    PrintController(CommandChannel& channel, std::chrono::milliseconds poll_interval);
    ~PrintController();

    PrintController(const PrintController&) = delete;
    PrintController& operator=(const PrintController&) = delete;

    /// Event loop that hosts the polling timer; without one, callers poll manually
    void attach_loop(const hv::EventLoopPtr& loop);

    /**
     * @brief Start printing a file already on board storage
     *
     * Queries the board first and refuses with PRINTER_BUSY while a job is
     * printing or paused. Starts status polling on success.
     */
    ChituError start_print(const std::string& remote_name);

    /// Stop the current job
    ChituError stop_print();

    /**
     * @brief Query the board once and publish the result
     *
     * Malformed replies are escalated as protocol errors. Starts polling when
     * an active job is observed and fires the finished callback on the
     * active-to-idle transition.
     */
    ChituError poll_status(PrintJobStatus& status);

    /// Most recent status seen by any query
    PrintJobStatus last_status() const;

    /// Home the Z axis
    ChituError home_z();

    /// Current Z position in mm
    ChituError z_position(double& z_mm);

    /// Absolute Z move; INVALID_REQUEST outside Z_MIN_MM..Z_MAX_MM
    ChituError move_z(double z_mm);

    bool is_polling() const {
        return polling_.load();
    }

    void stop_polling();

    void set_status_callback(StatusCallback cb);
    void set_finished_callback(FinishedCallback cb);

  private:
    void start_polling();
    void on_poll_timer();
    ChituError send_checked(const BoardCommand& cmd, BoardReply& reply);

    CommandChannel& channel_;
    const std::chrono::milliseconds poll_interval_;

    mutable std::mutex mutex_;
    PrintJobStatus last_status_;
    StatusCallback status_callback_;
    FinishedCallback finished_callback_;

    hv::EventLoopPtr loop_;
    hv::TimerID poll_timer_ = INVALID_TIMER_ID;
    std::atomic<bool> polling_{false};
};

} // namespace chitusync
