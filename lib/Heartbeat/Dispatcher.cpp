//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the heartbeat dispatch pipeline.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/Heartbeat/Dispatcher.h"

#include "wakatimels/Heartbeat/TrackerArguments.h"
#include "llvm/Support/FormatVariadic.h"

#include <chrono>
#include <utility>

namespace wakatimels::heartbeat
{

Dispatcher::Dispatcher(DispatcherOptions options, LogSink log, HeartbeatMetricSink metricSink)
    : trackerPath_(std::move(options.trackerPath))
    , launcher_(options.launcher ? std::move(options.launcher) : std::make_shared<SubprocessLauncher>())
    , gate_(std::move(options.clock))
    , settings_(std::move(options.initialSettings))
    , log_(std::move(log))
{
    telemetry_.setSink(std::move(metricSink));
}

std::optional<PreparedHeartbeat> Dispatcher::prepare(const Event& event)
{
    const auto decisionTime = gate_.admit(event);
    if (!decisionTime)
    {
        telemetry_.record(HeartbeatMetric{event.uri, HeartbeatOutcome::Debounced, 0U, -1});
        return std::nullopt;
    }

    const auto        settings    = settings_.load();
    const auto        platformTag = platformTag_.load();
    PreparedHeartbeat heartbeat;
    heartbeat.uri         = event.uri;
    heartbeat.args        = buildTrackerArguments(event, *decisionTime, *settings, *platformTag);
    heartbeat.commandLine = renderCommandLine(trackerPath_, heartbeat.args);
    log(LogLevel::Log, "wakatime command: " + heartbeat.commandLine);
    return heartbeat;
}

void Dispatcher::launch(const PreparedHeartbeat& heartbeat)
{
    const auto         start         = std::chrono::steady_clock::now();
    const LaunchResult result        = launcher_->launch(trackerPath_, heartbeat.args);
    const auto         finish        = std::chrono::steady_clock::now();
    const auto         latencyMicros = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(finish - start).count());

    if (!result.launched)
    {
        log(LogLevel::Warning,
            llvm::formatv("wakatime-cli launch failed: {0}, command: {1}", result.errorMessage, heartbeat.commandLine)
                .str());
        telemetry_.record(HeartbeatMetric{heartbeat.uri, HeartbeatOutcome::LaunchFailed, latencyMicros, -1});
        return;
    }

    if (result.exitCode == 0)
    {
        log(LogLevel::Info, "heartbeat sent for " + heartbeat.uri);
    }
    else
    {
        const std::string& detail = result.stderrText.empty() ? result.stdoutText : result.stderrText;
        log(LogLevel::Warning,
            llvm::formatv("wakatime-cli exited with status {0} for {1}: {2}", result.exitCode, heartbeat.uri, detail)
                .str());
    }
    telemetry_.record(HeartbeatMetric{heartbeat.uri, HeartbeatOutcome::Dispatched, latencyMicros, result.exitCode});
}

void Dispatcher::dispatch(const Event& event)
{
    if (const auto heartbeat = prepare(event))
    {
        launch(*heartbeat);
    }
}

void Dispatcher::updateSettings(Settings settings)
{
    settings_.store(std::move(settings));
}

void Dispatcher::setPlatformTag(std::string tag)
{
    platformTag_.store(std::move(tag));
}

void Dispatcher::log(const LogLevel level, std::string message) const
{
    if (log_)
    {
        log_(level, std::move(message));
    }
}

}  // namespace wakatimels::heartbeat
