//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Heartbeat dispatch pipeline.
///
/// The dispatcher owns the session state a heartbeat depends on (gate record,
/// settings, platform tag). @ref Dispatcher::prepare runs the gate and argument
/// synthesis when a notification arrives; @ref Dispatcher::launch runs the
/// tracker CLI later, on a scheduler task.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_HEARTBEAT_DISPATCHER_H
#define WAKATIMELS_HEARTBEAT_DISPATCHER_H

#include "wakatimels/Heartbeat/Event.h"
#include "wakatimels/Heartbeat/HeartbeatGate.h"
#include "wakatimels/Heartbeat/ProcessLauncher.h"
#include "wakatimels/Heartbeat/Settings.h"
#include "wakatimels/Heartbeat/Telemetry.h"
#include "wakatimels/Support/SnapshotCell.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wakatimels::heartbeat
{

/// @brief Severity of a dispatcher log line, numbered like LSP `MessageType`.
enum class LogLevel
{
    Error   = 1,
    Warning = 2,
    Info    = 3,
    Log     = 4,
};

/// @brief Receives dispatcher log lines.
using LogSink = std::function<void(LogLevel level, std::string message)>;

/// @brief Construction parameters for @ref Dispatcher.
struct DispatcherOptions final
{
    /// @brief Tracker CLI path or bare program name.
    std::string trackerPath;

    /// @brief Launcher; null selects @ref SubprocessLauncher.
    std::shared_ptr<ProcessLauncher> launcher;

    /// @brief Settings in effect before the first configuration push.
    Settings initialSettings;

    /// @brief Wall-clock source for the gate; empty selects `system_clock::now`.
    WallClock clock;
};

/// @brief Tracker CLI run admitted by the gate, ready to launch.
struct PreparedHeartbeat final
{
    /// @brief Normalized entity.
    std::string uri;

    /// @brief Tracker argv, excluding the program.
    std::vector<std::string> args;

    /// @brief Redacted command line for log lines.
    std::string commandLine;
};

/// @brief Turns events into tracker CLI runs.
class Dispatcher final
{
public:
    /// @brief Creates a dispatcher.
    /// @param[in] options Tracker path, launcher, initial settings and clock.
    /// @param[in] log Log sink; may be empty.
    /// @param[in] metricSink Optional telemetry sink.
    Dispatcher(DispatcherOptions options, LogSink log, HeartbeatMetricSink metricSink = {});

    Dispatcher(const Dispatcher&)            = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// @brief Runs the gate and builds the tracker argv.
    ///
    /// @details Never blocks on a child process. Logs the command line of an
    /// admitted event and records debounced events in telemetry.
    ///
    /// @param[in] event Event to report.
    /// @return The launch to run, or `std::nullopt` when the gate dropped it.
    [[nodiscard]] std::optional<PreparedHeartbeat> prepare(const Event& event);

    /// @brief Runs the tracker CLI and logs the outcome.
    ///
    /// @details Blocks for the lifetime of the child process.
    void launch(const PreparedHeartbeat& heartbeat);

    /// @brief @ref prepare followed by @ref launch on the calling thread.
    void dispatch(const Event& event);

    /// @brief Replaces the settings.
    void updateSettings(Settings settings);

    /// @brief Returns the current settings snapshot.
    [[nodiscard]] SnapshotCell<Settings>::Snapshot settings() const
    {
        return settings_.load();
    }

    /// @brief Replaces the platform tag.
    void setPlatformTag(std::string tag);

    /// @brief Returns the current platform tag snapshot.
    [[nodiscard]] SnapshotCell<std::string>::Snapshot platformTag() const
    {
        return platformTag_.load();
    }

    /// @brief Returns a copy of the gate record.
    [[nodiscard]] CurrentFile currentFile() const
    {
        return gate_.current();
    }

    /// @brief Returns the telemetry recorder.
    [[nodiscard]] const Telemetry& telemetry() const
    {
        return telemetry_;
    }

private:
    void log(LogLevel level, std::string message) const;

    std::string                      trackerPath_;
    std::shared_ptr<ProcessLauncher> launcher_;
    HeartbeatGate                    gate_;
    SnapshotCell<Settings>           settings_;
    SnapshotCell<std::string>        platformTag_;
    Telemetry                        telemetry_;
    LogSink                          log_;
};

}  // namespace wakatimels::heartbeat

#endif  // WAKATIMELS_HEARTBEAT_DISPATCHER_H
