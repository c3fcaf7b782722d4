//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements child-process launching through LLVM's program utilities.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/Heartbeat/ProcessLauncher.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FileUtilities.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Program.h"

#include <system_error>

namespace wakatimels::heartbeat
{
namespace
{

std::string readCapturedOutput(llvm::StringRef path)
{
    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return {};
    }
    return (*buffer)->getBuffer().rtrim().str();
}

}  // namespace

llvm::Expected<std::string> resolveProgramPath(const llvm::StringRef program)
{
    if (program.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "empty program path");
    }

    if (llvm::sys::path::has_parent_path(program))
    {
        if (!llvm::sys::fs::can_execute(program))
        {
            return llvm::createStringError(std::make_error_code(std::errc::permission_denied),
                                           "'" + program + "' is not an executable file");
        }
        return program.str();
    }

    llvm::ErrorOr<std::string> found = llvm::sys::findProgramByName(program);
    if (!found)
    {
        return llvm::createStringError(found.getError(), "cannot find '" + program + "' on PATH");
    }
    return std::move(*found);
}

LaunchResult SubprocessLauncher::launch(const llvm::StringRef program, const std::vector<std::string>& args)
{
    LaunchResult result;

    llvm::Expected<std::string> executable = resolveProgramPath(program);
    if (!executable)
    {
        result.errorMessage = llvm::toString(executable.takeError());
        return result;
    }

    llvm::SmallString<128> stdoutPath;
    llvm::SmallString<128> stderrPath;
    if (const std::error_code ec = llvm::sys::fs::createTemporaryFile("wakatime-ls-stdout", "txt", stdoutPath))
    {
        result.errorMessage = "cannot create output capture file: " + ec.message();
        return result;
    }
    const llvm::FileRemover stdoutRemover(stdoutPath);
    if (const std::error_code ec = llvm::sys::fs::createTemporaryFile("wakatime-ls-stderr", "txt", stderrPath))
    {
        result.errorMessage = "cannot create error capture file: " + ec.message();
        return result;
    }
    const llvm::FileRemover stderrRemover(stderrPath);

    std::vector<llvm::StringRef> argv;
    argv.reserve(args.size() + 1U);
    argv.emplace_back(*executable);
    for (const std::string& arg : args)
    {
        argv.emplace_back(arg);
    }

    std::string waitError;
    bool        executionFailed = false;
    const int   exitCode        = llvm::sys::ExecuteAndWait(*executable,
                                                   argv,
                                                   {},
                                                   {llvm::StringRef(""), stdoutPath.str(), stderrPath.str()},
                                                   0,
                                                   0,
                                                   &waitError,
                                                   &executionFailed);
    if (executionFailed)
    {
        result.errorMessage = waitError.empty() ? "failed to execute " + *executable : waitError;
        return result;
    }

    result.launched     = true;
    result.exitCode     = exitCode;
    result.errorMessage = std::move(waitError);
    result.stdoutText   = readCapturedOutput(stdoutPath);
    result.stderrText   = readCapturedOutput(stderrPath);
    return result;
}

}  // namespace wakatimels::heartbeat
