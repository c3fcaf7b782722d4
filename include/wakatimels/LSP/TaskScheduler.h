//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Growing worker pool for heartbeat launches.
///
/// Each admitted heartbeat becomes one task. Tasks run concurrently and are
/// never cancelled once started. When every worker is busy, enqueueing starts
/// another one, so a hung child process costs one worker and never holds up
/// later tasks. Shutdown drops whatever is still queued and detaches workers
/// that are busy waiting on a child process.
///
//===----------------------------------------------------------------------===//
#ifndef WAKATIMELS_LSP_TASK_SCHEDULER_H
#define WAKATIMELS_LSP_TASK_SCHEDULER_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace wakatimels::lsp
{

/// @brief Unit of scheduled work.
using Task = std::function<void()>;

/// @brief Callback invoked when a task throws.
using TaskFailureHandler = std::function<void(const std::string& taskName, const std::string& errorMessage)>;

/// @brief Worker pool running named fire-and-forget tasks.
class TaskScheduler final
{
public:
    /// @brief Starts the initial worker threads.
    /// @param[in] workerCount Number of workers started up front; zero is
    /// treated as one. The pool grows past it when all workers are busy.
    /// @param[in] onFailure Handler for exceptions escaping a task.
    explicit TaskScheduler(unsigned workerCount, TaskFailureHandler onFailure = {});
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&)            = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    /// @brief Enqueues work for execution.
    /// @param[in] name Task name used in failure reports.
    /// @param[in] task Task body.
    /// @return `true` when queued; `false` after @ref shutdown.
    [[nodiscard]] bool enqueue(std::string name, Task task);

    /// @brief Blocks until no task is queued or running.
    /// @param[in] timeout Upper bound on the wait.
    /// @return `true` when the pool went idle within `timeout`.
    [[nodiscard]] bool waitForIdle(std::chrono::milliseconds timeout) const;

    /// @brief Returns queued plus running task count.
    [[nodiscard]] std::size_t pendingCount() const;

    /// @brief Drops queued tasks and releases the workers.
    ///
    /// @details Idle workers exit. Busy workers are detached and finish their
    /// current task on their own; shutdown does not wait for them.
    void shutdown();

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

}  // namespace wakatimels::lsp

#endif  // WAKATIMELS_LSP_TASK_SCHEDULER_H
