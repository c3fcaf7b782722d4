//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Child-process launching for tracker CLI invocations.
///
/// A launch spawns the program, waits for it to exit, and captures its output.
/// Failures are reported in the result, never thrown.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_HEARTBEAT_PROCESS_LAUNCHER_H
#define WAKATIMELS_HEARTBEAT_PROCESS_LAUNCHER_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace wakatimels::heartbeat
{

/// @brief Outcome of one child-process run.
struct LaunchResult final
{
    /// @brief False when the program could not be located or executed.
    bool launched{false};

    /// @brief Exit status; `-1` when not launched, `-2` when the child crashed.
    int exitCode{-1};

    /// @brief Spawn/wait failure description.
    std::string errorMessage;

    /// @brief Captured standard output.
    std::string stdoutText;

    /// @brief Captured standard error.
    std::string stderrText;

    /// @brief Returns whether the child ran and exited with status zero.
    [[nodiscard]] bool succeeded() const
    {
        return launched && exitCode == 0;
    }
};

/// @brief Spawns a program and waits for it.
class ProcessLauncher
{
public:
    virtual ~ProcessLauncher() = default;

    /// @brief Runs `program` with `args` and blocks until it exits.
    /// @param[in] program Program path or bare name.
    /// @param[in] args Arguments without the program name.
    /// @return Launch outcome.
    [[nodiscard]] virtual LaunchResult launch(llvm::StringRef program, const std::vector<std::string>& args) = 0;
};

/// @brief Launcher backed by `llvm::sys::ExecuteAndWait`.
///
/// @details Standard input reads from the null device; standard output and
/// error go to temporary files that are read back and removed.
class SubprocessLauncher final : public ProcessLauncher
{
public:
    [[nodiscard]] LaunchResult launch(llvm::StringRef program, const std::vector<std::string>& args) override;
};

/// @brief Resolves a program to an executable path.
///
/// @details A name without a directory component is looked up on `PATH`.
///
/// @param[in] program Program path or bare name.
/// @return Executable path, or an error naming the program.
[[nodiscard]] llvm::Expected<std::string> resolveProgramPath(llvm::StringRef program);

}  // namespace wakatimels::heartbeat

#endif  // WAKATIMELS_HEARTBEAT_PROCESS_LAUNCHER_H
