//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements tracker CLI argument synthesis and command-line rendering.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/Heartbeat/TrackerArguments.h"

#include "llvm/Support/raw_ostream.h"

#include <cstdint>

namespace wakatimels::heartbeat
{
namespace
{

constexpr llvm::StringRef RedactedValue = "<redacted>";

bool needsQuoting(llvm::StringRef arg)
{
    return arg.empty() || arg.find_first_of(" \t\n\"'") != llvm::StringRef::npos;
}

void appendQuoted(llvm::raw_ostream& os, llvm::StringRef arg)
{
    if (!needsQuoting(arg))
    {
        os << arg;
        return;
    }
    os << '"';
    for (const char ch : arg)
    {
        if (ch == '"' || ch == '\\')
        {
            os << '\\';
        }
        os << ch;
    }
    os << '"';
}

}  // namespace

std::string formatPlatformTag(const llvm::StringRef             clientName,
                              const std::optional<std::string>& clientVersion,
                              const llvm::StringRef             serverVersion)
{
    std::string              tag;
    llvm::raw_string_ostream os(tag);
    os << clientName;
    if (clientVersion)
    {
        os << '/' << *clientVersion;
    }
    os << ' ' << clientName << "-wakatime/" << serverVersion;
    os.flush();
    return tag;
}

std::vector<std::string> buildTrackerArguments(const Event&                                event,
                                               const std::chrono::system_clock::time_point now,
                                               const Settings&                             settings,
                                               const llvm::StringRef                       platformTag)
{
    // Whole seconds only; the tracker accepts fractional values but none are sent.
    const std::int64_t unixSeconds =
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    std::vector<std::string> args;
    args.reserve(20);
    args.emplace_back("--time");
    args.push_back(std::to_string(unixSeconds));
    args.emplace_back("--write");
    args.emplace_back(event.isWrite ? "true" : "false");
    args.emplace_back("--entity");
    args.push_back(event.uri);

    if (!platformTag.empty())
    {
        args.emplace_back("--plugin");
        args.push_back(platformTag.str());
    }

    if (settings.apiKey)
    {
        args.emplace_back("--key");
        args.push_back(*settings.apiKey);
    }

    if (settings.apiUrl)
    {
        args.emplace_back("--api-url");
        args.push_back(*settings.apiUrl);
    }

    if (event.language)
    {
        args.emplace_back("--language");
        args.push_back(*event.language);
    }
    else
    {
        args.emplace_back("--guess-language");
    }

    if (event.lineno)
    {
        args.emplace_back("--lineno");
        args.push_back(std::to_string(*event.lineno));
    }

    if (event.cursorPos)
    {
        args.emplace_back("--cursorpos");
        args.push_back(std::to_string(*event.cursorPos));
    }

    return args;
}

std::string renderCommandLine(const llvm::StringRef program, const std::vector<std::string>& args)
{
    std::string              rendered;
    llvm::raw_string_ostream os(rendered);
    appendQuoted(os, program);

    bool redactNext = false;
    for (const std::string& arg : args)
    {
        os << ' ';
        if (redactNext)
        {
            os << RedactedValue;
            redactNext = false;
            continue;
        }
        appendQuoted(os, arg);
        redactNext = arg == "--key";
    }
    os.flush();
    return rendered;
}

}  // namespace wakatimels::heartbeat
