//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements binary naming and resolution for the launcher.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/Install/Toolchain.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Triple.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Host.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Program.h"
#include "llvm/Support/VersionTuple.h"

#include <system_error>
#include <utility>

namespace wakatimels::install
{
namespace
{

llvm::Error unsupportedPlatform(const HostPlatform& platform, const llvm::Twine& what)
{
    return llvm::createStringError(std::make_error_code(std::errc::not_supported),
                                   "unsupported " + what + ": " + platform.triple);
}

std::optional<std::string> findOnSystemPath(const llvm::StringRef name)
{
    llvm::ErrorOr<std::string> found = llvm::sys::findProgramByName(name);
    if (!found)
    {
        return std::nullopt;
    }
    return *found;
}

/// Parses `<binary>-<version>` with an optional `v` before the version.
std::optional<llvm::VersionTuple> parseVersionDirectory(llvm::StringRef directoryName, const llvm::StringRef binary)
{
    if (!directoryName.consume_front(binary) || !directoryName.consume_front("-"))
    {
        return std::nullopt;
    }
    directoryName.consume_front("v");
    llvm::VersionTuple version;
    if (directoryName.empty() || version.tryParse(directoryName))
    {
        return std::nullopt;
    }
    return version;
}

}  // namespace

HostPlatform platformFromTriple(const llvm::StringRef triple)
{
    const llvm::Triple parsed(triple);

    HostPlatform platform;
    platform.triple = triple.str();
    if (parsed.isOSDarwin())
    {
        platform.os = HostOs::MacOS;
    }
    else if (parsed.isOSLinux())
    {
        platform.os = HostOs::Linux;
    }
    else if (parsed.isOSWindows())
    {
        platform.os = HostOs::Windows;
    }

    switch (parsed.getArch())
    {
    case llvm::Triple::aarch64:
        platform.arch = HostArch::Aarch64;
        break;
    case llvm::Triple::x86_64:
        platform.arch = HostArch::X86_64;
        break;
    default:
        break;
    }
    return platform;
}

HostPlatform detectHostPlatform()
{
    return platformFromTriple(llvm::sys::getProcessTriple());
}

llvm::StringRef binaryName(const Binary binary)
{
    switch (binary)
    {
    case Binary::TrackerCli:
        return "wakatime-cli";
    case Binary::LanguageServer:
        return "wakatime-ls";
    }
    return "wakatime-ls";
}

std::string executableName(const llvm::StringRef name, const HostPlatform& platform)
{
    if (platform.os == HostOs::Windows)
    {
        return name.str() + ".exe";
    }
    return name.str();
}

llvm::Expected<std::string> targetTriple(const Binary binary, const HostPlatform& platform)
{
    const bool tracker = binary == Binary::TrackerCli;

    llvm::StringRef arch;
    switch (platform.arch)
    {
    case HostArch::Aarch64:
        arch = tracker ? "arm64" : "aarch64";
        break;
    case HostArch::X86_64:
        arch = tracker ? "amd64" : "x86_64";
        break;
    case HostArch::Unknown:
        return unsupportedPlatform(platform, "architecture");
    }

    llvm::StringRef os;
    switch (platform.os)
    {
    case HostOs::MacOS:
        os = tracker ? "darwin" : "apple-darwin";
        break;
    case HostOs::Linux:
        os = tracker ? "linux" : "unknown-linux-gnu";
        break;
    case HostOs::Windows:
        os = tracker ? "windows" : "pc-windows-msvc";
        break;
    case HostOs::Unknown:
        return unsupportedPlatform(platform, "operating system");
    }

    if (tracker)
    {
        return (binaryName(binary) + "-" + os + "-" + arch).str();
    }
    return (binaryName(binary) + "-" + arch + "-" + os).str();
}

llvm::Expected<std::string> releaseAssetName(const Binary binary, const HostPlatform& platform)
{
    llvm::Expected<std::string> triple = targetTriple(binary, platform);
    if (!triple)
    {
        return triple.takeError();
    }
    return *triple + ".zip";
}

llvm::Expected<std::string> installedFileName(const Binary binary, const HostPlatform& platform)
{
    if (binary == Binary::LanguageServer)
    {
        return executableName(binaryName(binary), platform);
    }
    llvm::Expected<std::string> triple = targetTriple(binary, platform);
    if (!triple)
    {
        return triple.takeError();
    }
    return executableName(*triple, platform);
}

ToolchainLocator::ToolchainLocator(HostPlatform platform, std::string installDir, ProgramFinder finder)
    : platform_(std::move(platform))
    , installDir_(std::move(installDir))
    , finder_(finder ? std::move(finder) : ProgramFinder(findOnSystemPath))
{
}

std::optional<std::string> ToolchainLocator::findInstalled(const Binary binary) const
{
    if (installDir_.empty())
    {
        return std::nullopt;
    }

    llvm::Expected<std::string> fileName = installedFileName(binary, platform_);
    if (!fileName)
    {
        llvm::consumeError(fileName.takeError());
        return std::nullopt;
    }

    std::optional<llvm::VersionTuple> newestVersion;
    std::optional<std::string>        newestPath;

    std::error_code ec;
    for (llvm::sys::fs::directory_iterator it(installDir_, ec), end; !ec && it != end; it.increment(ec))
    {
        const llvm::StringRef directoryName = llvm::sys::path::filename(it->path());
        const auto            version       = parseVersionDirectory(directoryName, binaryName(binary));
        if (!version)
        {
            continue;
        }

        llvm::SmallString<256> candidate(it->path());
        llvm::sys::path::append(candidate, *fileName);
        if (!llvm::sys::fs::is_regular_file(candidate))
        {
            continue;
        }

        if (!newestVersion || *newestVersion < *version)
        {
            newestVersion = *version;
            newestPath    = candidate.str().str();
        }
    }
    return newestPath;
}

llvm::Expected<std::string> ToolchainLocator::resolve(const Binary binary, const std::optional<std::string>& cachedPath) const
{
    if (auto found = finder_(executableName(binaryName(binary), platform_)))
    {
        return std::move(*found);
    }

    llvm::Expected<std::string> triple = targetTriple(binary, platform_);
    if (!triple)
    {
        return triple.takeError();
    }

    if (binary == Binary::LanguageServer)
    {
        if (auto found = finder_(executableName(*triple, platform_)))
        {
            return std::move(*found);
        }
    }

    if (cachedPath && llvm::sys::fs::is_regular_file(*cachedPath))
    {
        return *cachedPath;
    }

    if (auto installed = findInstalled(binary))
    {
        return std::move(*installed);
    }

    return llvm::createStringError(std::make_error_code(std::errc::no_such_file_or_directory),
                                   "cannot find " + binaryName(binary) + "; install release asset " + *triple +
                                       ".zip into " + (installDir_.empty() ? std::string("<install-dir>") : installDir_));
}

llvm::Expected<ServerCommand> buildServerCommand(const llvm::StringRef serverPath,
                                                 const llvm::StringRef trackerPath,
                                                 const HostPlatform&   platform)
{
    llvm::SmallString<256> absoluteTracker(trackerPath);
    if (const std::error_code ec = llvm::sys::fs::make_absolute(absoluteTracker))
    {
        return llvm::createStringError(ec, "cannot make '" + trackerPath + "' absolute: " + ec.message());
    }

    llvm::StringRef tracker = absoluteTracker.str();
    if (platform.os == HostOs::Windows)
    {
        tracker = tracker.ltrim('/');
    }

    ServerCommand command;
    command.program = serverPath.str();
    command.args    = {"--wakatime-cli", tracker.str()};
    return command;
}

}  // namespace wakatimels::install
