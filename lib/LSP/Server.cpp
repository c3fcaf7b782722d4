//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the WakaTime LSP endpoint.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/LSP/Server.h"

#include "wakatimels/Heartbeat/Event.h"
#include "wakatimels/Heartbeat/TrackerArguments.h"
#include "wakatimels/Version.h"

#include <optional>
#include <string>
#include <utility>

namespace wakatimels::lsp
{
namespace
{

constexpr int JsonRpcErrorMethodNotFound = -32601;

/// LSP `TextDocumentSyncKind.Incremental`.
constexpr int TextDocumentSyncIncremental = 2;

llvm::json::Value cloneJsonId(const llvm::json::Value& id)
{
    if (const auto text = id.getAsString())
    {
        return llvm::json::Value(text->str());
    }
    if (const auto integer = id.getAsInteger())
    {
        return llvm::json::Value(*integer);
    }
    if (const auto number = id.getAsNumber())
    {
        return llvm::json::Value(*number);
    }
    return llvm::json::Value(nullptr);
}

MessageType messageTypeFor(const heartbeat::LogLevel level)
{
    switch (level)
    {
    case heartbeat::LogLevel::Error:
        return MessageType::Error;
    case heartbeat::LogLevel::Warning:
        return MessageType::Warning;
    case heartbeat::LogLevel::Info:
        return MessageType::Info;
    case heartbeat::LogLevel::Log:
        return MessageType::Log;
    }
    return MessageType::Log;
}

heartbeat::DispatcherOptions makeDispatcherOptions(ServerOptions& options)
{
    heartbeat::DispatcherOptions dispatcherOptions;
    dispatcherOptions.trackerPath     = std::move(options.config.trackerCliPath);
    dispatcherOptions.launcher        = std::move(options.launcher);
    dispatcherOptions.initialSettings = std::move(options.config.initialSettings);
    dispatcherOptions.clock           = std::move(options.clock);
    return dispatcherOptions;
}

}  // namespace

Server::Server(SendMessageFn sendMessage, ServerOptions options, heartbeat::HeartbeatMetricSink metricSink)
    : channel_(std::make_shared<ClientChannel>(std::move(sendMessage)))
    , dispatcher_(std::make_shared<heartbeat::Dispatcher>(
          makeDispatcherOptions(options),
          [channel = channel_](const heartbeat::LogLevel level, std::string message) {
              channel->logMessage(messageTypeFor(level), std::move(message));
          },
          std::move(metricSink)))
    , scheduler_(options.config.workerCount,
                 [channel = channel_](const std::string& taskName, const std::string& errorMessage) {
                     channel->logMessage(MessageType::Error, "heartbeat task " + taskName + " failed: " + errorMessage);
                 })
{
}

Server::~Server()
{
    shutdown();
}

void Server::handleMessage(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        return;
    }

    // Responses to server-initiated requests carry no method and are ignored.
    const auto method = object->getString("method");
    if (!method)
    {
        return;
    }

    if (const auto* id = object->get("id"))
    {
        handleRequest(*object, *method, *id);
        return;
    }

    handleNotification(*object, *method);
}

void Server::handleRequest(const llvm::json::Object& message, const llvm::StringRef method, const llvm::json::Value& id)
{
    if (method == "initialize")
    {
        handleInitialize(message, id);
        return;
    }

    if (method == "shutdown")
    {
        shutdownRequested_ = true;
        state_             = SessionState::ShuttingDown;
        sendResult(id, llvm::json::Value(nullptr));
        return;
    }

    sendError(id, JsonRpcErrorMethodNotFound, "method not found: " + method.str());
}

void Server::handleInitialize(const llvm::json::Object& message, const llvm::json::Value& id)
{
    state_ = SessionState::Initializing;

    const auto* params = message.getObject("params");
    if (const auto* clientInfo = params ? params->getObject("clientInfo") : nullptr)
    {
        if (const auto name = clientInfo->getString("name"))
        {
            std::optional<std::string> version;
            if (const auto versionText = clientInfo->getString("version"))
            {
                version = versionText->str();
            }
            dispatcher_->setPlatformTag(heartbeat::formatPlatformTag(*name, version, kVersionString));
        }
    }

    llvm::json::Object result;
    result["capabilities"] = llvm::json::Object{{"textDocumentSync", TextDocumentSyncIncremental}};
    result["serverInfo"]   = llvm::json::Object{{"name", kServerName}, {"version", kVersionString}};
    sendResult(id, std::move(result));
}

void Server::handleNotification(const llvm::json::Object& message, const llvm::StringRef method)
{
    if (method == "initialized")
    {
        if (state_ == SessionState::Initializing)
        {
            state_ = SessionState::Running;
        }
        logMessage(MessageType::Info, "Wakatime language server initialized");
        return;
    }

    if (method == "textDocument/didOpen")
    {
        scheduleHeartbeat(method, heartbeat::eventFromDidOpen(message.get("params")));
        return;
    }

    if (method == "textDocument/didChange")
    {
        scheduleHeartbeat(method, heartbeat::eventFromDidChange(message.get("params")));
        return;
    }

    if (method == "textDocument/didSave")
    {
        scheduleHeartbeat(method, heartbeat::eventFromDidSave(message.get("params")));
        return;
    }

    if (method == "workspace/didChangeConfiguration")
    {
        const auto* params = message.get("params");
        if (!params)
        {
            logMessage(MessageType::Warning, "ignoring configuration update: missing params");
            return;
        }
        heartbeat::Settings settings;
        std::string         error;
        if (!applyDidChangeConfiguration(*params, settings, error))
        {
            logMessage(MessageType::Warning, "ignoring configuration update: " + error);
            return;
        }
        dispatcher_->updateSettings(std::move(settings));
        logMessage(MessageType::Log, "wakatime settings updated");
        return;
    }

    if (method == "exit")
    {
        if (!shutdownRequested_)
        {
            exitCode_ = 1;
        }
        state_ = SessionState::Exited;
        return;
    }
}

void Server::scheduleHeartbeat(const llvm::StringRef method, std::optional<heartbeat::Event> event)
{
    if (!event)
    {
        logMessage(MessageType::Warning, "ignoring " + method.str() + ": missing textDocument.uri");
        return;
    }

    // Gate decision and argv use the arrival time; only the launch is deferred.
    std::optional<heartbeat::PreparedHeartbeat> heartbeat = dispatcher_->prepare(*event);
    if (!heartbeat)
    {
        return;
    }

    const std::string taskName = method.str() + " " + heartbeat->uri;
    const bool        queued =
        scheduler_.enqueue(taskName, [dispatcher = dispatcher_, heartbeat = std::move(*heartbeat)]() {
            dispatcher->launch(heartbeat);
        });
    if (!queued)
    {
        logMessage(MessageType::Log, "heartbeat dropped after shutdown: " + taskName);
    }
}

std::shared_ptr<const std::string> Server::platformTag() const
{
    return dispatcher_->platformTag();
}

std::shared_ptr<const heartbeat::Settings> Server::settings() const
{
    return dispatcher_->settings();
}

heartbeat::CurrentFile Server::currentFile() const
{
    return dispatcher_->currentFile();
}

const heartbeat::Telemetry& Server::telemetry() const
{
    return dispatcher_->telemetry();
}

bool Server::waitForIdle(const std::chrono::milliseconds timeout) const
{
    return scheduler_.waitForIdle(timeout);
}

void Server::shutdown()
{
    scheduler_.shutdown();
    channel_->close();
}

void Server::sendResult(const llvm::json::Value& id, llvm::json::Value result)
{
    channel_->send(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", cloneJsonId(id)},
        {"result", std::move(result)},
    });
}

void Server::sendError(const llvm::json::Value& id, const int code, std::string message)
{
    channel_->send(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"id", cloneJsonId(id)},
        {"error", llvm::json::Object{{"code", code}, {"message", std::move(message)}}},
    });
}

void Server::logMessage(const MessageType type, std::string message)
{
    channel_->logMessage(type, std::move(message));
}

}  // namespace wakatimels::lsp
