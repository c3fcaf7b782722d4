//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `wakatime-ls` Language Server Protocol executable.
///
/// The process runs a stdio JSON-RPC loop and turns document activity into
/// `wakatime-cli` heartbeats.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/Heartbeat/Telemetry.h"
#include "wakatimels/LSP/JsonRpcIO.h"
#include "wakatimels/LSP/Server.h"
#include "wakatimels/LSP/ServerConfig.h"
#include "wakatimels/Version.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <iostream>
#include <utility>

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    llvm::SmallVector<llvm::StringRef, 16> args;
    for (int i = 1; i < argc; ++i)
    {
        args.push_back(argv[i]);
    }

    wakatimels::lsp::ServerConfig                  config;
    llvm::Expected<wakatimels::lsp::StartupAction> action = wakatimels::lsp::parseServerArguments(args, config);
    if (!action)
    {
        llvm::errs() << "[wakatime-ls] " << llvm::toString(action.takeError()) << "\n\n";
        wakatimels::lsp::printServerUsage(llvm::errs());
        return 2;
    }

    switch (*action)
    {
    case wakatimels::lsp::StartupAction::PrintVersion:
        llvm::outs() << wakatimels::kServerName << " " << wakatimels::kVersionString << "\n";
        return 0;
    case wakatimels::lsp::StartupAction::PrintHelp:
        wakatimels::lsp::printServerUsage(llvm::errs());
        return 0;
    case wakatimels::lsp::StartupAction::Serve:
        break;
    }

    wakatimels::lsp::ServerOptions options;
    options.config = std::move(config);

    wakatimels::lsp::JsonRpcStdioTransport transport(std::cin, std::cout);
    wakatimels::lsp::Server                server(
        [&transport](llvm::json::Value message) {
            if (!transport.writeMessage(message))
            {
                llvm::errs() << "[wakatime-ls] failed to write JSON-RPC message\n";
            }
        },
        std::move(options),
        [](const wakatimels::heartbeat::HeartbeatMetric& metric) {
            llvm::errs() << "[wakatime-ls][telemetry] entity=" << metric.entity
                         << " outcome=" << wakatimels::heartbeat::outcomeName(metric.outcome)
                         << " latency_us=" << static_cast<std::uint64_t>(metric.latencyMicros)
                         << " exit=" << metric.exitCode << "\n";
        });

    int exitCode = 0;
    while (!server.shouldExit())
    {
        llvm::json::Value                 message(llvm::json::Object{});
        std::string                       error;
        const wakatimels::lsp::ReadStatus status = transport.readMessage(message, error);
        if (status == wakatimels::lsp::ReadStatus::Error)
        {
            llvm::errs() << "[wakatime-ls] " << error << "\n";
            exitCode = 1;
            break;
        }
        if (status == wakatimels::lsp::ReadStatus::EndOfStream)
        {
            // The client went away without `exit`.
            exitCode = server.shutdownRequested() ? 0 : 1;
            break;
        }
        server.handleMessage(message);
    }

    server.shutdown();
    if (server.shouldExit())
    {
        exitCode = server.exitCode();
    }
    return exitCode;
}
