//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for `wakatime-ls-launch`.
///
/// Finds `wakatime-ls` and `wakatime-cli` and starts the server with the
/// tracker path, passing stdio through so the editor talks to the server
/// directly.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/Heartbeat/TrackerArguments.h"
#include "wakatimels/Install/Toolchain.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/Program.h"
#include "llvm/Support/raw_ostream.h"

#include <string>
#include <system_error>

namespace
{

void printUsage(llvm::raw_ostream& os)
{
    os << "Usage: wakatime-ls-launch [--install-dir <DIR>] [--print-command]\n\n"
       << "Locates wakatime-ls and wakatime-cli and runs the server over inherited stdio.\n\n"
       << "OPTIONS\n"
       << "  --install-dir <DIR>\n"
       << "      Directory holding <binary>-<version>/ release installs (default: current directory).\n"
       << "  --print-command\n"
       << "      Print the resolved server command instead of running it.\n"
       << "  -h, --help\n"
       << "      Print this help text.\n";
}

}  // namespace

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    std::string installDir;
    bool        printCommand = false;
    for (int i = 1; i < argc; ++i)
    {
        llvm::StringRef arg(argv[i]);
        if (arg == "-h" || arg == "--help")
        {
            printUsage(llvm::errs());
            return 0;
        }
        if (arg == "--print-command")
        {
            printCommand = true;
            continue;
        }
        if (arg.consume_front("--install-dir="))
        {
            installDir = arg.str();
            continue;
        }
        if (arg == "--install-dir")
        {
            if (i + 1 >= argc)
            {
                llvm::errs() << "[wakatime-ls-launch] missing value for --install-dir\n\n";
                printUsage(llvm::errs());
                return 2;
            }
            installDir = argv[++i];
            continue;
        }
        llvm::errs() << "[wakatime-ls-launch] unknown option '" << arg << "'\n\n";
        printUsage(llvm::errs());
        return 2;
    }

    if (installDir.empty())
    {
        llvm::SmallString<256> currentDir;
        if (const std::error_code ec = llvm::sys::fs::current_path(currentDir))
        {
            llvm::errs() << "[wakatime-ls-launch] cannot determine current directory: " << ec.message() << "\n";
            return 1;
        }
        installDir = currentDir.str().str();
    }

    const wakatimels::install::ToolchainLocator locator(wakatimels::install::detectHostPlatform(), installDir);

    llvm::Expected<std::string> trackerPath = locator.resolve(wakatimels::install::Binary::TrackerCli);
    if (!trackerPath)
    {
        llvm::errs() << "[wakatime-ls-launch] " << llvm::toString(trackerPath.takeError()) << "\n";
        return 1;
    }

    llvm::Expected<std::string> serverPath = locator.resolve(wakatimels::install::Binary::LanguageServer);
    if (!serverPath)
    {
        llvm::errs() << "[wakatime-ls-launch] " << llvm::toString(serverPath.takeError()) << "\n";
        return 1;
    }

    llvm::Expected<wakatimels::install::ServerCommand> command =
        wakatimels::install::buildServerCommand(*serverPath, *trackerPath, locator.platform());
    if (!command)
    {
        llvm::errs() << "[wakatime-ls-launch] " << llvm::toString(command.takeError()) << "\n";
        return 1;
    }

    if (printCommand)
    {
        llvm::outs() << wakatimels::heartbeat::renderCommandLine(command->program, command->args) << "\n";
        return 0;
    }

    llvm::SmallVector<llvm::StringRef, 4> processArgs;
    processArgs.push_back(command->program);
    for (const auto& arg : command->args)
    {
        processArgs.push_back(arg);
    }

    std::string errorMessage;
    bool        executionFailed = false;
    const int   status          = llvm::sys::ExecuteAndWait(command->program,
                                                            processArgs,
                                                            /*Env=*/{},
                                                            /*Redirects=*/{},
                                                            /*SecondsToWait=*/0,
                                                            /*MemoryLimit=*/0,
                                                            &errorMessage,
                                                            &executionFailed);
    if (executionFailed || status < 0)
    {
        llvm::errs() << "[wakatime-ls-launch] failed to run " << command->program << ": " << errorMessage << "\n";
        return 1;
    }
    return status;
}
