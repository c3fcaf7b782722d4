//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements heartbeat telemetry recording and sink forwarding.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/Heartbeat/Telemetry.h"

#include <utility>

namespace wakatimels::heartbeat
{

llvm::StringRef outcomeName(const HeartbeatOutcome outcome)
{
    switch (outcome)
    {
    case HeartbeatOutcome::Dispatched:
        return "dispatched";
    case HeartbeatOutcome::Debounced:
        return "debounced";
    case HeartbeatOutcome::LaunchFailed:
        return "launch_failed";
    }
    return "unknown";
}

void Telemetry::setSink(HeartbeatMetricSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::record(const HeartbeatMetric& metric)
{
    HeartbeatMetricSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[static_cast<std::size_t>(metric.outcome)];
        sink = sink_;
    }
    if (sink)
    {
        sink(metric);
    }
}

std::uint64_t Telemetry::count(const HeartbeatOutcome outcome) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_[static_cast<std::size_t>(outcome)];
}

}  // namespace wakatimels::heartbeat
