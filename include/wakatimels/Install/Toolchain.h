//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Locating the language server and tracker CLI binaries.
///
/// Release archives are named after a per-binary target triple. Installed
/// copies live under `<install-dir>/<binary>-<version>/`. The locator prefers
/// binaries on `PATH`, then a cached path, then the newest installed version.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_INSTALL_TOOLCHAIN_H
#define WAKATIMELS_INSTALL_TOOLCHAIN_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace wakatimels::install
{

enum class HostOs
{
    MacOS,
    Linux,
    Windows,
    Unknown,
};

enum class HostArch
{
    Aarch64,
    X86_64,
    Unknown,
};

/// @brief Operating system and architecture a binary must run on.
struct HostPlatform final
{
    HostOs   os{HostOs::Unknown};
    HostArch arch{HostArch::Unknown};

    /// @brief Textual triple the platform was derived from, for diagnostics.
    std::string triple;
};

/// @brief Binaries the launcher has to find.
enum class Binary
{
    /// @brief `wakatime-cli`.
    TrackerCli,

    /// @brief `wakatime-ls`.
    LanguageServer,
};

/// @brief Derives a platform from an LLVM target triple string.
[[nodiscard]] HostPlatform platformFromTriple(llvm::StringRef triple);

/// @brief Returns the platform of the running process.
[[nodiscard]] HostPlatform detectHostPlatform();

/// @brief Returns `wakatime-cli` or `wakatime-ls`.
[[nodiscard]] llvm::StringRef binaryName(Binary binary);

/// @brief Appends `.exe` on Windows.
[[nodiscard]] std::string executableName(llvm::StringRef name, const HostPlatform& platform);

/// @brief Returns the release target triple of a binary.
///
/// @details The tracker CLI uses `wakatime-cli-<os>-<arch>` with Go-style
/// names (`darwin`, `arm64`); the server uses `wakatime-ls-<arch>-<os>` with
/// Rust-style names (`aarch64`, `apple-darwin`).
///
/// @return Triple, or an error for an unsupported OS or architecture.
[[nodiscard]] llvm::Expected<std::string> targetTriple(Binary binary, const HostPlatform& platform);

/// @brief Returns `<triple>.zip`.
[[nodiscard]] llvm::Expected<std::string> releaseAssetName(Binary binary, const HostPlatform& platform);

/// @brief Returns the file name inside an installed version directory.
///
/// @details The tracker CLI archive holds the executable-named triple; the
/// server archive holds the executable-named binary.
[[nodiscard]] llvm::Expected<std::string> installedFileName(Binary binary, const HostPlatform& platform);

/// @brief Looks up a program name on `PATH`.
using ProgramFinder = std::function<std::optional<std::string>(llvm::StringRef name)>;

/// @brief Resolves binary locations for one host.
class ToolchainLocator final
{
public:
    /// @param[in] platform Host platform.
    /// @param[in] installDir Directory holding `<binary>-<version>` directories.
    /// @param[in] finder `PATH` lookup; empty selects `llvm::sys::findProgramByName`.
    ToolchainLocator(HostPlatform platform, std::string installDir, ProgramFinder finder = {});

    /// @brief Returns the newest installed copy under the install directory.
    [[nodiscard]] std::optional<std::string> findInstalled(Binary binary) const;

    /// @brief Resolves a binary.
    ///
    /// @details Order: `PATH` by executable name; for the server, `PATH` by
    /// executable-named triple; `cachedPath` when it is a regular file; the
    /// newest installed version.
    ///
    /// @param[in] binary Binary to find.
    /// @param[in] cachedPath Previously resolved path, if any.
    /// @return Path, or an error naming the release asset to install.
    [[nodiscard]] llvm::Expected<std::string> resolve(Binary                            binary,
                                                      const std::optional<std::string>& cachedPath = std::nullopt) const;

    [[nodiscard]] const HostPlatform& platform() const
    {
        return platform_;
    }

private:
    HostPlatform  platform_;
    std::string   installDir_;
    ProgramFinder finder_;
};

/// @brief Process command that starts the language server.
struct ServerCommand final
{
    std::string              program;
    std::vector<std::string> args;
};

/// @brief Builds `<server> --wakatime-cli <absolute tracker path>`.
///
/// @details A relative tracker path is made absolute against the current
/// directory. On Windows a leading `/` is trimmed from the tracker path.
[[nodiscard]] llvm::Expected<ServerCommand> buildServerCommand(llvm::StringRef     serverPath,
                                                               llvm::StringRef     trackerPath,
                                                               const HostPlatform& platform);

}  // namespace wakatimels::install

#endif  // WAKATIMELS_INSTALL_TOOLCHAIN_H
