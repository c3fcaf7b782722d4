//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements startup flag parsing and configuration updates from LSP
/// notifications.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/LSP/ServerConfig.h"

#include <optional>
#include <system_error>
#include <utility>

namespace wakatimels::lsp
{
namespace
{

constexpr unsigned MaxWorkerCount = 64;

llvm::Error usageError(const llvm::Twine& message)
{
    return llvm::createStringError(std::make_error_code(std::errc::invalid_argument), message);
}

bool decodeOptionalString(const llvm::json::Object&   settings,
                          llvm::StringRef             key,
                          std::optional<std::string>& out,
                          std::string&                error)
{
    const auto* value = settings.get(key);
    if (!value || value->kind() == llvm::json::Value::Null)
    {
        out.reset();
        return true;
    }
    const auto text = value->getAsString();
    if (!text)
    {
        error = "'" + key.str() + "' must be a string";
        return false;
    }
    out = text->str();
    return true;
}

}  // namespace

llvm::Expected<StartupAction> parseServerArguments(const llvm::ArrayRef<llvm::StringRef> args, ServerConfig& config)
{
    ServerConfig parsed;
    bool         hasTrackerPath = false;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const llvm::StringRef arg = args[i];
        if (arg == "-h" || arg == "--help")
        {
            return StartupAction::PrintHelp;
        }
        if (arg == "-V" || arg == "--version")
        {
            return StartupAction::PrintVersion;
        }

        llvm::StringRef                name = arg;
        std::optional<llvm::StringRef> inlineValue;
        if (arg.take_front(2) == "--")
        {
            const auto [key, value] = arg.split('=');
            if (key.size() != arg.size())
            {
                name        = key;
                inlineValue = value;
            }
        }

        const auto takeValue = [&]() -> llvm::Expected<llvm::StringRef> {
            llvm::StringRef value;
            if (inlineValue)
            {
                value = *inlineValue;
            }
            else if (i + 1 < args.size())
            {
                value = args[++i];
            }
            else
            {
                return usageError("missing value for " + name);
            }
            if (value.empty())
            {
                return usageError("empty value for " + name);
            }
            return value;
        };

        if (name == "-p" || name == "--wakatime-cli")
        {
            llvm::Expected<llvm::StringRef> value = takeValue();
            if (!value)
            {
                return value.takeError();
            }
            parsed.trackerCliPath = value->str();
            hasTrackerPath        = true;
            continue;
        }

        if (name == "-k" || name == "--key")
        {
            llvm::Expected<llvm::StringRef> value = takeValue();
            if (!value)
            {
                return value.takeError();
            }
            parsed.initialSettings.apiKey = value->str();
            continue;
        }

        if (name == "--api-url")
        {
            llvm::Expected<llvm::StringRef> value = takeValue();
            if (!value)
            {
                return value.takeError();
            }
            parsed.initialSettings.apiUrl = value->str();
            continue;
        }

        if (name == "-j" || name == "--jobs")
        {
            llvm::Expected<llvm::StringRef> value = takeValue();
            if (!value)
            {
                return value.takeError();
            }
            unsigned workers = 0;
            if (value->getAsInteger(10, workers) || workers == 0 || workers > MaxWorkerCount)
            {
                return usageError("invalid value for " + name + ": '" + *value + "' (expected 1.." +
                                  llvm::Twine(MaxWorkerCount) + ")");
            }
            parsed.workerCount = workers;
            continue;
        }

        return usageError("unknown option '" + arg + "'");
    }

    if (!hasTrackerPath)
    {
        return usageError("missing required option --wakatime-cli <PATH>");
    }

    config = std::move(parsed);
    return StartupAction::Serve;
}

void printServerUsage(llvm::raw_ostream& os)
{
    os << "Usage: wakatime-ls --wakatime-cli <PATH> [options]\n\n"
       << "Language server that reports editor activity to WakaTime through wakatime-cli.\n"
       << "Speaks LSP over stdin/stdout.\n\n"
       << "OPTIONS\n"
       << "  -p, --wakatime-cli <PATH>\n"
       << "      Tracker CLI executable. A bare name is looked up on PATH. Required.\n"
       << "  -k, --key <KEY>\n"
       << "      API key used until the client pushes settings.\n"
       << "  --api-url <URL>\n"
       << "      API URL used until the client pushes settings.\n"
       << "  -j, --jobs <N>\n"
       << "      Heartbeat workers started up front; more start when all are busy (default: "
       << ServerConfig::DefaultWorkerCount << ").\n"
       << "  -V, --version\n"
       << "      Print version and exit.\n"
       << "  -h, --help\n"
       << "      Print this help text.\n\n"
       << "EXIT STATUS\n"
       << "  0 after shutdown+exit, 1 on transport failure or exit without shutdown, 2 on invalid usage.\n";
}

bool applyDidChangeConfiguration(const llvm::json::Value& params, heartbeat::Settings& settings, std::string& error)
{
    const auto* paramsObject = params.getAsObject();
    if (!paramsObject)
    {
        error = "params is not an object";
        return false;
    }

    const auto* settingsValue = paramsObject->get("settings");
    if (!settingsValue)
    {
        error = "missing 'settings'";
        return false;
    }

    const auto* settingsObject = settingsValue->getAsObject();
    if (!settingsObject)
    {
        error = "'settings' is not an object";
        return false;
    }

    heartbeat::Settings decoded;
    if (!decodeOptionalString(*settingsObject, "api_key", decoded.apiKey, error) ||
        !decodeOptionalString(*settingsObject, "api_url", decoded.apiUrl, error))
    {
        return false;
    }

    settings = std::move(decoded);
    return true;
}

}  // namespace wakatimels::lsp
