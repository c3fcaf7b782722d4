//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Outbound message channel to the LSP client.
///
/// Scheduler tasks and the message loop share one channel. Messages are
/// forwarded one at a time; after @ref ClientChannel::close they are dropped so
/// tasks outliving the session never touch a destroyed transport.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_LSP_CLIENT_CHANNEL_H
#define WAKATIMELS_LSP_CLIENT_CHANNEL_H

#include "llvm/Support/JSON.h"

#include <functional>
#include <mutex>
#include <string>

namespace wakatimels::lsp
{

/// @brief LSP `window/logMessage` severity.
enum class MessageType
{
    Error   = 1,
    Warning = 2,
    Info    = 3,
    Log     = 4,
};

/// @brief Serialized, closable sink for outbound JSON-RPC messages.
class ClientChannel final
{
public:
    /// @brief Outbound transport callback for JSON-RPC responses/notifications.
    using SendMessageFn = std::function<void(llvm::json::Value message)>;

    /// @brief Creates a channel over a transport callback.
    /// @param[in] sendMessage Outbound message sink.
    explicit ClientChannel(SendMessageFn sendMessage);

    ClientChannel(const ClientChannel&)            = delete;
    ClientChannel& operator=(const ClientChannel&) = delete;

    /// @brief Forwards one message unless the channel is closed.
    void send(llvm::json::Value message);

    /// @brief Sends a JSON-RPC notification.
    /// @param[in] method Notification method.
    /// @param[in] params Notification params.
    void notify(std::string method, llvm::json::Value params);

    /// @brief Sends `window/logMessage`.
    /// @param[in] type Message severity.
    /// @param[in] message Message text.
    void logMessage(MessageType type, std::string message);

    /// @brief Stops forwarding. Blocks until an in-flight send returns.
    void close();

    /// @brief Returns whether @ref close was called.
    [[nodiscard]] bool isClosed() const;

private:
    mutable std::mutex mutex_;
    SendMessageFn      sendMessage_;
    bool               closed_{false};
};

}  // namespace wakatimels::lsp

#endif  // WAKATIMELS_LSP_CLIENT_CHANNEL_H
