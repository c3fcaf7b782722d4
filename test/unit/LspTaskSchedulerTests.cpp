//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "wakatimels/LSP/TaskScheduler.h"

bool runLspTaskSchedulerTests()
{
    using wakatimels::lsp::TaskScheduler;

    {
        // Tasks overlap across workers.
        std::mutex              mutex;
        std::condition_variable cv;
        int                     started = 0;
        bool                    release = false;
        TaskScheduler           scheduler(4);
        for (int i = 0; i < 3; ++i)
        {
            const bool queued = scheduler.enqueue("blocking", [&mutex, &cv, &started, &release]() {
                std::unique_lock<std::mutex> lock(mutex);
                ++started;
                cv.notify_all();
                cv.wait(lock, [&release]() { return release; });
            });
            if (!queued)
            {
                std::cerr << "expected enqueue to succeed\n";
                return false;
            }
        }

        {
            std::unique_lock<std::mutex> lock(mutex);
            if (!cv.wait_for(lock, std::chrono::seconds(3), [&started]() { return started == 3; }))
            {
                std::cerr << "expected three tasks to run concurrently, saw " << started << "\n";
                return false;
            }
        }
        if (scheduler.pendingCount() != 3U || scheduler.waitForIdle(std::chrono::milliseconds(20)))
        {
            std::cerr << "running tasks should count as pending\n";
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            release = true;
        }
        cv.notify_all();
        if (!scheduler.waitForIdle(std::chrono::seconds(3)) || scheduler.pendingCount() != 0U)
        {
            std::cerr << "expected scheduler to go idle after release\n";
            return false;
        }
    }

    {
        // Exceptions are reported and do not kill the worker.
        std::mutex    mutex;
        std::string   failedTask;
        std::string   failure;
        TaskScheduler scheduler(1, [&mutex, &failedTask, &failure](const std::string& name, const std::string& error) {
            std::lock_guard<std::mutex> lock(mutex);
            failedTask = name;
            failure    = error;
        });

        std::atomic<int> completed{0};
        const bool       queuedThrow =
            scheduler.enqueue("didSave /a.rs", []() { throw std::runtime_error("tracker exploded"); });
        const bool queuedAfter = scheduler.enqueue("didSave /b.rs", [&completed]() { completed.fetch_add(1); });
        if (!queuedThrow || !queuedAfter || !scheduler.waitForIdle(std::chrono::seconds(3)))
        {
            std::cerr << "expected both tasks to run\n";
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex);
        if (failedTask != "didSave /a.rs" || failure != "tracker exploded" || completed.load() != 1)
        {
            std::cerr << "expected failure report and continued processing\n";
            return false;
        }
    }

    {
        // A busy worker does not hold up later tasks; shutdown does not wait for it.
        auto          release  = std::make_shared<std::atomic_bool>(false);
        auto          finished = std::make_shared<std::atomic_bool>(false);
        auto          started  = std::make_shared<std::atomic_bool>(false);
        auto          followUp = std::make_shared<std::atomic<int>>(0);
        TaskScheduler scheduler(1);

        if (!scheduler.enqueue("busy",
                               [release, finished, started]() {
                                   started->store(true);
                                   while (!release->load())
                                   {
                                       std::this_thread::sleep_for(std::chrono::milliseconds(1));
                                   }
                                   finished->store(true);
                               }) ||
            !scheduler.enqueue("follow-up", [followUp]() { followUp->fetch_add(1); }))
        {
            std::cerr << "expected enqueue to succeed\n";
            return false;
        }

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while ((!started->load() || followUp->load() == 0) && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (!started->load() || followUp->load() != 1)
        {
            std::cerr << "task queued behind a busy worker should run on a new worker\n";
            release->store(true);
            return false;
        }

        const auto shutdownStart = std::chrono::steady_clock::now();
        scheduler.shutdown();
        if (std::chrono::steady_clock::now() - shutdownStart > std::chrono::seconds(1) || finished->load())
        {
            std::cerr << "shutdown should not wait for the busy task\n";
            release->store(true);
            return false;
        }
        if (scheduler.enqueue("late", []() {}))
        {
            std::cerr << "enqueue after shutdown should be rejected\n";
            release->store(true);
            return false;
        }

        release->store(true);
        const auto finishDeadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (!finished->load() && std::chrono::steady_clock::now() < finishDeadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (!finished->load())
        {
            std::cerr << "detached task should finish on its own\n";
            return false;
        }
    }

    return true;
}
