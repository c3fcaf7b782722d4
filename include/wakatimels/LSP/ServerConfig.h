//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Configuration model for the WakaTime language server.
///
/// Startup configuration comes from command-line flags; tracker settings are
/// later replaced by `workspace/didChangeConfiguration` notifications.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_LSP_SERVER_CONFIG_H
#define WAKATIMELS_LSP_SERVER_CONFIG_H

#include "wakatimels/Heartbeat/Settings.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <string>

namespace wakatimels::lsp
{

/// @brief Startup configuration for `wakatime-ls`.
struct ServerConfig final
{
    /// @brief Default number of heartbeat worker threads.
    static constexpr unsigned DefaultWorkerCount = 4;

    /// @brief Tracker CLI path from `--wakatime-cli`.
    std::string trackerCliPath;

    /// @brief Settings seeded from `--key` and `--api-url`.
    heartbeat::Settings initialSettings;

    /// @brief Initial heartbeat worker thread count from `--jobs`.
    unsigned workerCount{DefaultWorkerCount};
};

/// @brief What `main` should do after parsing flags.
enum class StartupAction
{
    /// @brief Serve LSP over stdio.
    Serve,

    /// @brief Print the version and exit.
    PrintVersion,

    /// @brief Print usage and exit.
    PrintHelp,
};

/// @brief Parses command-line flags (without the program name).
///
/// @details Accepts `--flag value` and `--flag=value`. `--help` and
/// `--version` short-circuit required-flag checks.
///
/// @param[in] args Arguments after `argv[0]`.
/// @param[out] config Parsed configuration; valid when the action is `Serve`.
/// @return Startup action, or a usage error.
[[nodiscard]] llvm::Expected<StartupAction> parseServerArguments(llvm::ArrayRef<llvm::StringRef> args,
                                                                 ServerConfig&                   config);

/// @brief Prints command-line usage.
/// @param[in] os Output stream.
void printServerUsage(llvm::raw_ostream& os);

/// @brief Decodes settings from `workspace/didChangeConfiguration` params.
///
/// @details `settings` must be an object. `api_key` and `api_url` may be
/// absent, `null`, or strings; any other type fails the decode. Unknown keys
/// are ignored. On success `settings` is replaced as a whole.
///
/// @param[in] params Notification params.
/// @param[in,out] settings Settings to replace; untouched on failure.
/// @param[out] error Failure reason.
/// @return `true` when params decoded.
[[nodiscard]] bool applyDidChangeConfiguration(const llvm::json::Value& params,
                                               heartbeat::Settings&     settings,
                                               std::string&             error);

}  // namespace wakatimels::lsp

#endif  // WAKATIMELS_LSP_SERVER_CONFIG_H
