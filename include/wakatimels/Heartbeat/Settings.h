//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Tracker credentials forwarded on every heartbeat.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_HEARTBEAT_SETTINGS_H
#define WAKATIMELS_HEARTBEAT_SETTINGS_H

#include <optional>
#include <string>

namespace wakatimels::heartbeat
{

/// @brief Tracker settings, replaced as a whole on each configuration push.
struct Settings final
{
    /// @brief Value for `--key`.
    std::optional<std::string> apiKey;

    /// @brief Value for `--api-url`.
    std::optional<std::string> apiUrl;
};

}  // namespace wakatimels::heartbeat

#endif  // WAKATIMELS_HEARTBEAT_SETTINGS_H
