//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Stdio JSON-RPC framing utilities for Language Server Protocol transport.
///
/// Messages are encoded with `Content-Length` framing over stdio and decoded
/// into LLVM JSON values. End of input between messages is reported apart
/// from framing errors so the caller can pick an exit status.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_LSP_JSON_RPC_IO_H
#define WAKATIMELS_LSP_JSON_RPC_IO_H

#include "llvm/Support/JSON.h"

#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <string>

namespace wakatimels::lsp
{

/// @brief Outcome of reading one frame.
enum class ReadStatus
{
    /// @brief A complete message was parsed.
    Message,

    /// @brief Input ended cleanly before any header of a new frame.
    EndOfStream,

    /// @brief The frame was malformed or truncated.
    Error,
};

/// @brief JSON-RPC stdio transport with `Content-Length` framing.
class JsonRpcStdioTransport final
{
public:
    /// @brief Largest accepted payload in bytes.
    static constexpr std::size_t MaxContentLength = 64U * 1024U * 1024U;

    /// @brief Creates a transport over input and output streams.
    /// @param[in] in Input stream.
    /// @param[in] out Output stream.
    JsonRpcStdioTransport(std::istream& in, std::ostream& out);

    /// @brief Reads one framed JSON-RPC message.
    /// @param[out] message Parsed JSON payload.
    /// @param[out] error Parsing/framing error text when status is `Error`.
    /// @return Read outcome.
    [[nodiscard]] ReadStatus readMessage(llvm::json::Value& message, std::string& error);

    /// @brief Writes one framed JSON-RPC message.
    /// @param[in] message JSON payload to write.
    /// @return `true` when write succeeds.
    [[nodiscard]] bool writeMessage(const llvm::json::Value& message);

private:
    std::istream& input_;
    std::ostream& output_;
    std::mutex    writeMutex_;
};

}  // namespace wakatimels::lsp

#endif  // WAKATIMELS_LSP_JSON_RPC_IO_H
