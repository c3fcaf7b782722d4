//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Heartbeat telemetry aggregation and sink integration.
///
/// This module records one sample per gate decision and forwards it to an
/// optional sink for tracing, tests, and diagnostics.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_HEARTBEAT_TELEMETRY_H
#define WAKATIMELS_HEARTBEAT_TELEMETRY_H

#include "llvm/ADT/StringRef.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace wakatimels::heartbeat
{

/// @brief What happened to an event after the gate.
enum class HeartbeatOutcome
{
    /// @brief The tracker CLI ran.
    Dispatched,

    /// @brief The gate dropped the event.
    Debounced,

    /// @brief The gate admitted the event but the tracker CLI could not be executed.
    LaunchFailed,
};

/// @brief Returns a lowercase name for an outcome.
[[nodiscard]] llvm::StringRef outcomeName(HeartbeatOutcome outcome);

/// @brief Immutable telemetry sample for one event.
struct HeartbeatMetric final
{
    /// @brief Normalized entity of the event.
    std::string entity;

    /// @brief Gate and launch outcome.
    HeartbeatOutcome outcome{HeartbeatOutcome::Debounced};

    /// @brief Launch latency in microseconds, zero when debounced.
    std::uint64_t latencyMicros{0};

    /// @brief Tracker exit status, `-1` when it did not run.
    int exitCode{-1};
};

/// @brief Sink callback invoked for each telemetry sample.
using HeartbeatMetricSink = std::function<void(const HeartbeatMetric&)>;

/// @brief Thread-safe heartbeat telemetry recorder.
class Telemetry final
{
public:
    /// @brief Sets the sink callback for newly recorded metrics.
    /// @param[in] sink Sink callback. Empty sink disables forwarding.
    void setSink(HeartbeatMetricSink sink);

    /// @brief Records one sample.
    /// @param[in] metric Sample to record.
    void record(const HeartbeatMetric& metric);

    /// @brief Returns the number of samples recorded with `outcome`.
    [[nodiscard]] std::uint64_t count(HeartbeatOutcome outcome) const;

private:
    static constexpr std::size_t OutcomeCount = 3;

    mutable std::mutex                      mutex_;
    HeartbeatMetricSink                     sink_;
    std::array<std::uint64_t, OutcomeCount> counts_{};
};

}  // namespace wakatimels::heartbeat

#endif  // WAKATIMELS_HEARTBEAT_TELEMETRY_H
