//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// LSP endpoint of the WakaTime language server.
///
/// The server answers the lifecycle requests, turns document notifications
/// into heartbeat tasks and applies configuration pushes. It never publishes
/// diagnostics; the only outbound notifications are `window/logMessage`.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_LSP_SERVER_H
#define WAKATIMELS_LSP_SERVER_H

#include "wakatimels/Heartbeat/Dispatcher.h"
#include "wakatimels/Heartbeat/ProcessLauncher.h"
#include "wakatimels/Heartbeat/Telemetry.h"
#include "wakatimels/LSP/ClientChannel.h"
#include "wakatimels/LSP/ServerConfig.h"
#include "wakatimels/LSP/TaskScheduler.h"
#include "llvm/Support/JSON.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace wakatimels::lsp
{

/// @brief Lifecycle state of an LSP session.
enum class SessionState
{
    Uninitialized,
    Initializing,
    Running,
    ShuttingDown,
    Exited,
};

/// @brief Construction parameters for @ref Server.
struct ServerOptions final
{
    /// @brief Parsed startup configuration.
    ServerConfig config;

    /// @brief Launcher override; null selects the subprocess launcher.
    std::shared_ptr<heartbeat::ProcessLauncher> launcher;

    /// @brief Wall-clock override for the heartbeat gate.
    heartbeat::WallClock clock;
};

class Server final
{
public:
    /// @brief Outbound transport callback for JSON-RPC responses/notifications.
    using SendMessageFn = ClientChannel::SendMessageFn;

    /// @brief Constructs the server and starts its heartbeat workers.
    /// @param[in] sendMessage Outbound message sink.
    /// @param[in] options Configuration, launcher and clock.
    /// @param[in] metricSink Optional heartbeat telemetry sink.
    Server(SendMessageFn sendMessage, ServerOptions options, heartbeat::HeartbeatMetricSink metricSink = {});
    ~Server();

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    /// @brief Handles one incoming JSON-RPC message.
    /// @param[in] message Parsed message object.
    void handleMessage(const llvm::json::Value& message);

    /// @brief Returns whether an `exit` notification was observed.
    [[nodiscard]] bool shouldExit() const
    {
        return state_ == SessionState::Exited;
    }

    /// @brief Returns the LSP-conformant process exit code.
    /// @return `0` after orderly `shutdown`+`exit`, otherwise `1`.
    [[nodiscard]] int exitCode() const
    {
        return exitCode_;
    }

    /// @brief Returns whether `shutdown` has been requested.
    [[nodiscard]] bool shutdownRequested() const
    {
        return shutdownRequested_;
    }

    /// @brief Returns the session state.
    [[nodiscard]] SessionState state() const
    {
        return state_;
    }

    /// @brief Returns the platform tag snapshot.
    [[nodiscard]] std::shared_ptr<const std::string> platformTag() const;

    /// @brief Returns the tracker settings snapshot.
    [[nodiscard]] std::shared_ptr<const heartbeat::Settings> settings() const;

    /// @brief Returns a copy of the gate record.
    [[nodiscard]] heartbeat::CurrentFile currentFile() const;

    /// @brief Returns the heartbeat telemetry recorder.
    [[nodiscard]] const heartbeat::Telemetry& telemetry() const;

    /// @brief Blocks until no heartbeat task is queued or running.
    /// @param[in] timeout Upper bound on the wait.
    /// @return `true` when the workers went idle.
    [[nodiscard]] bool waitForIdle(std::chrono::milliseconds timeout) const;

    /// @brief Drops queued heartbeats, releases workers and closes the channel.
    void shutdown();

private:
    void handleRequest(const llvm::json::Object& message, llvm::StringRef method, const llvm::json::Value& id);
    void handleNotification(const llvm::json::Object& message, llvm::StringRef method);
    void handleInitialize(const llvm::json::Object& message, const llvm::json::Value& id);
    void scheduleHeartbeat(llvm::StringRef method, std::optional<heartbeat::Event> event);

    void sendResult(const llvm::json::Value& id, llvm::json::Value result);
    void sendError(const llvm::json::Value& id, int code, std::string message);
    void logMessage(MessageType type, std::string message);

    std::shared_ptr<ClientChannel>         channel_;
    std::shared_ptr<heartbeat::Dispatcher> dispatcher_;
    TaskScheduler                          scheduler_;
    std::atomic<SessionState>              state_{SessionState::Uninitialized};
    std::atomic_bool                       shutdownRequested_{false};
    int                                    exitCode_{0};
};

}  // namespace wakatimels::lsp

#endif  // WAKATIMELS_LSP_SERVER_H
