//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the heartbeat debounce rule.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/Heartbeat/HeartbeatGate.h"

#include <algorithm>
#include <utility>

namespace wakatimels::heartbeat
{

HeartbeatGate::HeartbeatGate(WallClock clock)
    : clock_(clock ? std::move(clock) : WallClock([]() { return std::chrono::system_clock::now(); }))
{
    current_.timestamp = clock_();
}

std::optional<std::chrono::system_clock::time_point> HeartbeatGate::admit(const Event& event)
{
    std::lock_guard<std::mutex> lock(mutex_);

    // A wall clock stepping backwards must not rewind the record.
    const auto now = std::max(clock_(), current_.timestamp);

    if (event.uri == current_.uri && now - current_.timestamp < DebounceWindow && event.isWrite)
    {
        return std::nullopt;
    }

    current_.uri       = event.uri;
    current_.timestamp = now;
    return now;
}

CurrentFile HeartbeatGate::current() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

}  // namespace wakatimels::heartbeat
