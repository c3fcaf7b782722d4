//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the outbound LSP client channel.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/LSP/ClientChannel.h"

#include <utility>

namespace wakatimels::lsp
{

ClientChannel::ClientChannel(SendMessageFn sendMessage)
    : sendMessage_(std::move(sendMessage))
{
}

void ClientChannel::send(llvm::json::Value message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !sendMessage_)
    {
        return;
    }
    sendMessage_(std::move(message));
}

void ClientChannel::notify(std::string method, llvm::json::Value params)
{
    send(llvm::json::Object{
        {"jsonrpc", "2.0"},
        {"method", std::move(method)},
        {"params", std::move(params)},
    });
}

void ClientChannel::logMessage(const MessageType type, std::string message)
{
    notify("window/logMessage",
           llvm::json::Object{
               {"type", static_cast<int>(type)},
               {"message", std::move(message)},
           });
}

void ClientChannel::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool ClientChannel::isClosed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace wakatimels::lsp
