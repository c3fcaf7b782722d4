//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `Content-Length` framed JSON-RPC stdio transport.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/LSP/JsonRpcIO.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#include <istream>
#include <limits>
#include <ostream>
#include <string>

namespace wakatimels::lsp
{
namespace
{

/// Header names are case-insensitive; other headers (`Content-Type`) are skipped.
bool parseContentLengthHeader(const std::string& line, std::size_t& contentLength)
{
    llvm::StringRef header = line;
    if (!header.consume_front_insensitive("Content-Length:"))
    {
        return false;
    }
    header = header.trim();
    if (header.empty())
    {
        return false;
    }
    std::size_t value = 0;
    for (const char ch : header)
    {
        if (ch < '0' || ch > '9')
        {
            return false;
        }
        const auto digit = static_cast<std::size_t>(ch - '0');
        if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10U)
        {
            return false;
        }
        value = value * 10U + digit;
    }
    contentLength = value;
    return true;
}

}  // namespace

JsonRpcStdioTransport::JsonRpcStdioTransport(std::istream& in, std::ostream& out)
    : input_(in)
    , output_(out)
{
}

ReadStatus JsonRpcStdioTransport::readMessage(llvm::json::Value& message, std::string& error)
{
    std::size_t contentLength = 0U;
    bool        hasHeaders    = false;
    bool        terminated    = false;
    std::string line;
    while (std::getline(input_, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            if (!hasHeaders)
            {
                // Tolerate stray blank lines between frames.
                continue;
            }
            terminated = true;
            break;
        }

        hasHeaders = true;
        if (std::size_t parsedLength = 0; parseContentLengthHeader(line, parsedLength))
        {
            contentLength = parsedLength;
        }
    }

    if (!hasHeaders)
    {
        return ReadStatus::EndOfStream;
    }

    if (!terminated)
    {
        error = "unterminated JSON-RPC header block";
        return ReadStatus::Error;
    }

    if (contentLength == 0U)
    {
        error = "missing Content-Length header";
        return ReadStatus::Error;
    }

    if (contentLength > MaxContentLength)
    {
        error = "Content-Length exceeds limit: " + std::to_string(contentLength);
        return ReadStatus::Error;
    }

    std::string payload(contentLength, '\0');
    input_.read(payload.data(), static_cast<std::streamsize>(contentLength));
    if (input_.gcount() != static_cast<std::streamsize>(contentLength))
    {
        error = "truncated JSON-RPC payload";
        return ReadStatus::Error;
    }

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(payload);
    if (!parsed)
    {
        error = "invalid JSON payload: " + llvm::toString(parsed.takeError());
        return ReadStatus::Error;
    }

    message = std::move(*parsed);
    return ReadStatus::Message;
}

bool JsonRpcStdioTransport::writeMessage(const llvm::json::Value& message)
{
    std::string              payload;
    llvm::raw_string_ostream payloadStream(payload);
    payloadStream << message;
    payloadStream.flush();

    std::lock_guard<std::mutex> lock(writeMutex_);
    output_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
    output_.flush();
    return static_cast<bool>(output_);
}

}  // namespace wakatimels::lsp
