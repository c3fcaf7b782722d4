//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Tracker CLI argument synthesis.
///
/// Flag names and their order are the external contract with `wakatime-cli`.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_HEARTBEAT_TRACKER_ARGUMENTS_H
#define WAKATIMELS_HEARTBEAT_TRACKER_ARGUMENTS_H

#include "wakatimels/Heartbeat/Event.h"
#include "wakatimels/Heartbeat/Settings.h"
#include "llvm/ADT/StringRef.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace wakatimels::heartbeat
{

/// @brief Builds the `--plugin` identifier for an editor client.
///
/// @details Produces `<name>[/<version>] <name>-wakatime/<serverVersion>`.
///
/// @param[in] clientName `clientInfo.name` from `initialize`.
/// @param[in] clientVersion Optional `clientInfo.version`.
/// @param[in] serverVersion This server's package version.
/// @return Platform tag.
[[nodiscard]] std::string formatPlatformTag(llvm::StringRef                   clientName,
                                            const std::optional<std::string>& clientVersion,
                                            llvm::StringRef                   serverVersion);

/// @brief Builds the tracker CLI argument vector, without the program name.
/// @param[in] event Event being reported.
/// @param[in] now Decision time from the gate.
/// @param[in] settings Settings snapshot.
/// @param[in] platformTag Platform tag snapshot; empty omits `--plugin`.
/// @return Arguments in contract order.
[[nodiscard]] std::vector<std::string> buildTrackerArguments(const Event&                          event,
                                                             std::chrono::system_clock::time_point now,
                                                             const Settings&                       settings,
                                                             llvm::StringRef                       platformTag);

/// @brief Renders a command line for log output.
///
/// @details The value after `--key` is replaced with `<redacted>`. Arguments
/// containing whitespace or quotes are double-quoted.
///
/// @param[in] program Program path.
/// @param[in] args Arguments without the program name.
/// @return Printable command line.
[[nodiscard]] std::string renderCommandLine(llvm::StringRef program, const std::vector<std::string>& args);

}  // namespace wakatimels::heartbeat

#endif  // WAKATIMELS_HEARTBEAT_TRACKER_ARGUMENTS_H
