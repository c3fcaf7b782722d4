//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Debouncing gate that decides whether an event becomes a heartbeat.
///
/// The gate owns the single "last dispatched" record. A write to the file that
/// was last dispatched is dropped while it falls inside the debounce window;
/// every other event dispatches and moves the record forward.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_HEARTBEAT_HEARTBEAT_GATE_H
#define WAKATIMELS_HEARTBEAT_HEARTBEAT_GATE_H

#include "wakatimels/Heartbeat/Event.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace wakatimels::heartbeat
{

/// @brief Wall-clock source.
using WallClock = std::function<std::chrono::system_clock::time_point()>;

/// @brief Interval inside which repeated writes to the same file are dropped.
inline constexpr std::chrono::minutes DebounceWindow{2};

/// @brief Last dispatched heartbeat.
struct CurrentFile final
{
    /// @brief Entity of the last dispatch, empty before the first one.
    std::string uri;

    /// @brief Decision time of the last dispatch; construction time initially.
    std::chrono::system_clock::time_point timestamp;
};

/// @brief Serializes heartbeat admission decisions.
class HeartbeatGate final
{
public:
    /// @brief Creates a gate and stamps the record with the current time.
    /// @param[in] clock Wall-clock source. Empty selects `system_clock::now`.
    explicit HeartbeatGate(WallClock clock = {});

    HeartbeatGate(const HeartbeatGate&)            = delete;
    HeartbeatGate& operator=(const HeartbeatGate&) = delete;

    /// @brief Applies the debounce rule and records the dispatch.
    ///
    /// @details Holds the gate lock across the comparison and the record
    /// update only. A non-empty result means the caller must attempt a launch;
    /// the record has already advanced regardless of how that launch ends.
    ///
    /// @param[in] event Incoming event.
    /// @return Decision time when the event dispatches, `std::nullopt` when dropped.
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> admit(const Event& event);

    /// @brief Returns a copy of the record taken under the gate lock.
    [[nodiscard]] CurrentFile current() const;

private:
    WallClock          clock_;
    mutable std::mutex mutex_;
    CurrentFile        current_;
};

}  // namespace wakatimels::heartbeat

#endif  // WAKATIMELS_HEARTBEAT_HEARTBEAT_GATE_H
