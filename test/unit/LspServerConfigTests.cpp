//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "wakatimels/LSP/ServerConfig.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace
{

llvm::json::Value parseJson(const std::string& text)
{
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(text);
    if (!parsed)
    {
        std::cerr << "invalid JSON test fixture\n";
        std::abort();
    }
    return std::move(*parsed);
}

/// Returns the usage error text, or an empty string when parsing succeeded.
std::string parseFailure(const std::vector<llvm::StringRef>& args)
{
    wakatimels::lsp::ServerConfig                  config;
    llvm::Expected<wakatimels::lsp::StartupAction> action = wakatimels::lsp::parseServerArguments(args, config);
    if (action)
    {
        return {};
    }
    return llvm::toString(action.takeError());
}

}  // namespace

bool runLspServerConfigTests()
{
    using namespace wakatimels::lsp;

    {
        ServerConfig                       config;
        const std::vector<llvm::StringRef> args{
            "--wakatime-cli", "/opt/wakatime-cli", "--key=K", "--api-url", "https://api.example", "-j", "2"};
        llvm::Expected<StartupAction>      action = parseServerArguments(args, config);
        if (!action || *action != StartupAction::Serve)
        {
            if (!action)
            {
                std::cerr << llvm::toString(action.takeError()) << "\n";
            }
            std::cerr << "expected full flag set to parse\n";
            return false;
        }
        if (config.trackerCliPath != "/opt/wakatime-cli" || !config.initialSettings.apiKey ||
            *config.initialSettings.apiKey != "K" || !config.initialSettings.apiUrl ||
            *config.initialSettings.apiUrl != "https://api.example" || config.workerCount != 2U)
        {
            std::cerr << "unexpected parsed configuration\n";
            return false;
        }
    }

    {
        ServerConfig                       config;
        const std::vector<llvm::StringRef> args{"-p", "wakatime-cli"};
        llvm::Expected<StartupAction>      action = parseServerArguments(args, config);
        if (!action || *action != StartupAction::Serve || config.trackerCliPath != "wakatime-cli" ||
            config.initialSettings.apiKey || config.initialSettings.apiUrl ||
            config.workerCount != ServerConfig::DefaultWorkerCount)
        {
            if (!action)
            {
                llvm::consumeError(action.takeError());
            }
            std::cerr << "expected minimal flag set to use defaults\n";
            return false;
        }
    }

    {
        ServerConfig                       config;
        const std::vector<llvm::StringRef> versionArgs{"--unknown", "-V"};
        llvm::Expected<StartupAction>      failed = parseServerArguments(versionArgs, config);
        if (failed)
        {
            std::cerr << "unknown flag before --version should fail\n";
            return false;
        }
        llvm::consumeError(failed.takeError());

        const std::vector<llvm::StringRef> helpArgs{"--help"};
        llvm::Expected<StartupAction>      help = parseServerArguments(helpArgs, config);
        const std::vector<llvm::StringRef> shortVersion{"-V"};
        llvm::Expected<StartupAction>      version = parseServerArguments(shortVersion, config);
        if (!help || *help != StartupAction::PrintHelp || !version || *version != StartupAction::PrintVersion)
        {
            if (!help)
            {
                llvm::consumeError(help.takeError());
            }
            if (!version)
            {
                llvm::consumeError(version.takeError());
            }
            std::cerr << "--help and -V should not require --wakatime-cli\n";
            return false;
        }
    }

    {
        const std::string missing = parseFailure({"--key", "K"});
        const std::string unknown = parseFailure({"-p", "cli", "--verbose"});
        const std::string noValue = parseFailure({"-p"});
        const std::string empty   = parseFailure({"--wakatime-cli="});
        const std::string zero    = parseFailure({"-p", "cli", "--jobs", "0"});
        const std::string garbage = parseFailure({"-p", "cli", "--jobs=many"});
        if (missing.find("missing required option --wakatime-cli") == std::string::npos ||
            unknown.find("unknown option '--verbose'") == std::string::npos ||
            noValue.find("missing value for -p") == std::string::npos ||
            empty.find("empty value for --wakatime-cli") == std::string::npos ||
            zero.find("invalid value for --jobs") == std::string::npos ||
            garbage.find("invalid value for --jobs: 'many'") == std::string::npos)
        {
            std::cerr << "unexpected usage errors: [" << missing << "] [" << unknown << "] [" << noValue << "] ["
                      << empty << "] [" << zero << "] [" << garbage << "]\n";
            return false;
        }
    }

    {
        std::string              usage;
        llvm::raw_string_ostream os(usage);
        printServerUsage(os);
        os.flush();
        if (usage.find("--wakatime-cli <PATH>") == std::string::npos || usage.find("--jobs") == std::string::npos)
        {
            std::cerr << "usage text should list the flags\n";
            return false;
        }
    }

    {
        wakatimels::heartbeat::Settings settings;
        std::string                     error;
        if (!applyDidChangeConfiguration(parseJson(R"({"settings":{"api_key":"K","api_url":"https://api.example",)"
                                                   R"("editor_theme":"dark"}})"),
                                         settings,
                                         error))
        {
            std::cerr << "expected settings decode to succeed: " << error << "\n";
            return false;
        }
        if (!settings.apiKey || *settings.apiKey != "K" || !settings.apiUrl ||
            *settings.apiUrl != "https://api.example")
        {
            std::cerr << "unexpected decoded settings\n";
            return false;
        }

        // Absent and null fields clear the previous values.
        if (!applyDidChangeConfiguration(parseJson(R"({"settings":{"api_url":null}})"), settings, error) ||
            settings.apiKey || settings.apiUrl)
        {
            std::cerr << "settings push should replace the whole value\n";
            return false;
        }

        settings.apiKey = "keep";
        const std::vector<std::string> invalid{
            R"({"settings":{"api_key":42}})",
            R"({"settings":{"api_url":["x"]}})",
            R"({"settings":"K"})",
            R"({"other":{}})",
            R"([1])",
        };
        for (const std::string& text : invalid)
        {
            error.clear();
            if (applyDidChangeConfiguration(parseJson(text), settings, error) || error.empty())
            {
                std::cerr << "expected decode failure for " << text << "\n";
                return false;
            }
            if (!settings.apiKey || *settings.apiKey != "keep")
            {
                std::cerr << "failed decode must keep prior settings\n";
                return false;
            }
        }
    }

    return true;
}
