//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements event construction from LSP document notifications.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/Heartbeat/Event.h"

#include "llvm/ADT/StringExtras.h"

namespace wakatimels::heartbeat
{
namespace
{

/// RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
bool isValidScheme(llvm::StringRef scheme)
{
    if (scheme.empty() || !llvm::isAlpha(scheme.front()))
    {
        return false;
    }
    for (const char ch : scheme.drop_front())
    {
        if (!llvm::isAlnum(ch) && ch != '+' && ch != '-' && ch != '.')
        {
            return false;
        }
    }
    return true;
}

const llvm::json::Object* paramsObject(const llvm::json::Value* params)
{
    return params ? params->getAsObject() : nullptr;
}

std::optional<std::string> parseTextDocumentUri(const llvm::json::Object& params)
{
    const auto* textDocument = params.getObject("textDocument");
    if (!textDocument)
    {
        return std::nullopt;
    }
    const auto uri = textDocument->getString("uri");
    if (!uri)
    {
        return std::nullopt;
    }
    return uri->str();
}

/// Only the first entry of `contentChanges` is consulted; a change without
/// `range` is a full-text replacement and carries no position.
void applyFirstChangeRange(const llvm::json::Object& params, Event& event)
{
    const auto* changes = params.getArray("contentChanges");
    if (!changes || changes->empty())
    {
        return;
    }
    const auto* firstChange = changes->front().getAsObject();
    if (!firstChange)
    {
        return;
    }
    const auto* range = firstChange->getObject("range");
    const auto* start = range ? range->getObject("start") : nullptr;
    if (!start)
    {
        return;
    }
    const auto line      = start->getInteger("line");
    const auto character = start->getInteger("character");
    if (!line || !character || *line < 0 || *character < 0)
    {
        return;
    }
    event.lineno    = static_cast<std::uint64_t>(*line);
    event.cursorPos = static_cast<std::uint64_t>(*character);
}

}  // namespace

std::string normalizeDocumentUri(const llvm::StringRef uri)
{
    const std::size_t colon = uri.find(':');
    if (colon == llvm::StringRef::npos || !isValidScheme(uri.take_front(colon)))
    {
        return uri.str();
    }

    llvm::StringRef rest = uri.drop_front(colon + 1);
    if (!rest.consume_front("//"))
    {
        return rest.str();
    }

    // Userinfo ends at the last '@' inside the authority.
    const std::size_t authorityEnd = rest.find_first_of("/?#");
    const std::size_t at           = rest.take_front(authorityEnd).rfind('@');
    if (at != llvm::StringRef::npos)
    {
        rest = rest.drop_front(at + 1);
    }
    return rest.str();
}

std::optional<Event> eventFromDidOpen(const llvm::json::Value* params)
{
    const auto* object = paramsObject(params);
    if (!object)
    {
        return std::nullopt;
    }
    const auto uri = parseTextDocumentUri(*object);
    if (!uri)
    {
        return std::nullopt;
    }

    Event event;
    event.uri     = normalizeDocumentUri(*uri);
    event.isWrite = false;
    if (const auto* textDocument = object->getObject("textDocument"))
    {
        if (const auto languageId = textDocument->getString("languageId"))
        {
            event.language = languageId->str();
        }
    }
    return event;
}

std::optional<Event> eventFromDidChange(const llvm::json::Value* params)
{
    const auto* object = paramsObject(params);
    if (!object)
    {
        return std::nullopt;
    }
    const auto uri = parseTextDocumentUri(*object);
    if (!uri)
    {
        return std::nullopt;
    }

    Event event;
    event.uri     = normalizeDocumentUri(*uri);
    event.isWrite = false;
    applyFirstChangeRange(*object, event);
    return event;
}

std::optional<Event> eventFromDidSave(const llvm::json::Value* params)
{
    const auto* object = paramsObject(params);
    if (!object)
    {
        return std::nullopt;
    }
    const auto uri = parseTextDocumentUri(*object);
    if (!uri)
    {
        return std::nullopt;
    }

    Event event;
    event.uri     = normalizeDocumentUri(*uri);
    event.isWrite = true;
    return event;
}

}  // namespace wakatimels::heartbeat
