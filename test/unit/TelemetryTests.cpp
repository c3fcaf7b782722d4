//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <vector>

#include "wakatimels/Heartbeat/Telemetry.h"

bool runTelemetryTests()
{
    using namespace wakatimels::heartbeat;

    if (outcomeName(HeartbeatOutcome::Dispatched) != "dispatched" ||
        outcomeName(HeartbeatOutcome::Debounced) != "debounced" ||
        outcomeName(HeartbeatOutcome::LaunchFailed) != "launch_failed")
    {
        std::cerr << "unexpected outcome names\n";
        return false;
    }

    Telemetry telemetry;
    telemetry.record(HeartbeatMetric{"/a.rs", HeartbeatOutcome::Dispatched, 1200U, 0});

    std::vector<HeartbeatMetric> samples;
    telemetry.setSink([&samples](const HeartbeatMetric& metric) { samples.push_back(metric); });
    telemetry.record(HeartbeatMetric{"/a.rs", HeartbeatOutcome::Debounced, 0U, -1});
    telemetry.record(HeartbeatMetric{"/b.rs", HeartbeatOutcome::LaunchFailed, 35U, -1});
    telemetry.record(HeartbeatMetric{"/b.rs", HeartbeatOutcome::Dispatched, 900U, 102});

    if (telemetry.count(HeartbeatOutcome::Dispatched) != 2U || telemetry.count(HeartbeatOutcome::Debounced) != 1U ||
        telemetry.count(HeartbeatOutcome::LaunchFailed) != 1U)
    {
        std::cerr << "unexpected telemetry counters\n";
        return false;
    }

    if (samples.size() != 3U || samples[0].outcome != HeartbeatOutcome::Debounced || samples[2].exitCode != 102 ||
        samples[1].entity != "/b.rs" || samples[1].latencyMicros != 35U)
    {
        std::cerr << "sink should receive samples recorded after it was set\n";
        return false;
    }

    telemetry.setSink({});
    telemetry.record(HeartbeatMetric{"/c.rs", HeartbeatOutcome::Debounced, 0U, -1});
    if (samples.size() != 3U || telemetry.count(HeartbeatOutcome::Debounced) != 2U)
    {
        std::cerr << "empty sink should disable forwarding but keep counting\n";
        return false;
    }

    return true;
}
