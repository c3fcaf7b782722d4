//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Editor activity events derived from LSP document notifications.
///
/// An event is built per `textDocument/didOpen`, `didChange` and `didSave`
/// notification and consumed by the heartbeat dispatcher.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_HEARTBEAT_EVENT_H
#define WAKATIMELS_HEARTBEAT_EVENT_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>

namespace wakatimels::heartbeat
{

/// @brief One unit of editor activity.
struct Event final
{
    /// @brief Normalized document identifier passed as `--entity`.
    std::string uri;

    /// @brief True only for save notifications.
    bool isWrite{false};

    /// @brief LSP `languageId`, set on open only.
    std::optional<std::string> language;

    /// @brief Zero-based line of the first change range start.
    std::optional<std::uint64_t> lineno;

    /// @brief Character offset of the first change range start.
    std::optional<std::uint64_t> cursorPos;
};

/// @brief Strips `scheme://` and `userinfo@` from a document URI.
///
/// @details Host and path are kept as-is, without percent-decoding. A URI with
/// a scheme but no authority (`untitled:Untitled-1`) loses `scheme:`. Text
/// without a valid scheme is returned unchanged.
///
/// @param[in] uri Document URI from the client.
/// @return Entity string.
[[nodiscard]] std::string normalizeDocumentUri(llvm::StringRef uri);

/// @brief Builds an event from `textDocument/didOpen` params.
/// @param[in] params Notification params, may be null.
/// @return Event, or `std::nullopt` when `textDocument.uri` is missing.
[[nodiscard]] std::optional<Event> eventFromDidOpen(const llvm::json::Value* params);

/// @brief Builds an event from `textDocument/didChange` params.
/// @param[in] params Notification params, may be null.
/// @return Event, or `std::nullopt` when `textDocument.uri` is missing.
[[nodiscard]] std::optional<Event> eventFromDidChange(const llvm::json::Value* params);

/// @brief Builds an event from `textDocument/didSave` params.
/// @param[in] params Notification params, may be null.
/// @return Event, or `std::nullopt` when `textDocument.uri` is missing.
[[nodiscard]] std::optional<Event> eventFromDidSave(const llvm::json::Value* params);

}  // namespace wakatimels::heartbeat

#endif  // WAKATIMELS_HEARTBEAT_EVENT_H
