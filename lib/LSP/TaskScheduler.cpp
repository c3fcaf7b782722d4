//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the heartbeat worker pool.
///
//===----------------------------------------------------------------------===//

#include "wakatimels/LSP/TaskScheduler.h"

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace wakatimels::lsp
{

// Workers hold their own reference to Impl so a detached worker can outlive
// the TaskScheduler that started it.
class TaskScheduler::Impl final : public std::enable_shared_from_this<TaskScheduler::Impl>
{
public:
    explicit Impl(TaskFailureHandler onFailure)
        : onFailure_(std::move(onFailure))
    {
    }

    void start(const unsigned workerCount)
    {
        const unsigned              count = workerCount == 0 ? 1U : workerCount;
        std::lock_guard<std::mutex> lock(mutex_);
        workers_.reserve(count);
        for (unsigned i = 0; i < count; ++i)
        {
            spawnWorkerLocked();
        }
    }

    bool enqueue(std::string name, Task task)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return false;
            }
            queue_.push_back(WorkItem{std::move(name), std::move(task)});
            if (queue_.size() > idle_)
            {
                spawnWorkerLocked();
            }
        }
        workCv_.notify_one();
        return true;
    }

    bool waitForIdle(const std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return idleCv_.wait_for(lock, timeout, [this]() { return queue_.empty() && running_ == 0; });
    }

    std::size_t pendingCount()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size() + running_;
    }

    void shutdown()
    {
        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return;
            }
            stopping_ = true;
            queue_.clear();
            workers.swap(workers_);
        }
        workCv_.notify_all();
        idleCv_.notify_all();
        for (auto& worker : workers)
        {
            if (worker.joinable())
            {
                worker.detach();
            }
        }
    }

private:
    struct WorkItem final
    {
        std::string name;
        Task        task;
    };

    // Every queued item must have an idle worker to take it, so a task never
    // waits behind one blocked on a child process.
    void spawnWorkerLocked()
    {
        const std::shared_ptr<Impl> self = shared_from_this();
        ++idle_;
        workers_.emplace_back([self]() { self->run(); });
    }

    void run()
    {
        while (true)
        {
            WorkItem item;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                workCv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                if (stopping_)
                {
                    return;
                }
                item = std::move(queue_.front());
                queue_.pop_front();
                --idle_;
                ++running_;
            }

            std::string failure;
            try
            {
                item.task();
            } catch (const std::exception& ex)
            {
                failure = ex.what();
            } catch (...)
            {
                failure = "unknown exception";
            }

            if (!failure.empty() && onFailure_)
            {
                onFailure_(item.name, failure);
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                --running_;
                ++idle_;
            }
            idleCv_.notify_all();
        }
    }

    TaskFailureHandler       onFailure_;
    std::mutex               mutex_;
    std::condition_variable  workCv_;
    std::condition_variable  idleCv_;
    std::deque<WorkItem>     queue_;
    std::vector<std::thread> workers_;
    std::size_t              running_{0};
    std::size_t              idle_{0};
    bool                     stopping_{false};
};

TaskScheduler::TaskScheduler(const unsigned workerCount, TaskFailureHandler onFailure)
    : impl_(std::make_shared<Impl>(std::move(onFailure)))
{
    impl_->start(workerCount);
}

TaskScheduler::~TaskScheduler()
{
    impl_->shutdown();
}

bool TaskScheduler::enqueue(std::string name, Task task)
{
    return impl_->enqueue(std::move(name), std::move(task));
}

bool TaskScheduler::waitForIdle(const std::chrono::milliseconds timeout) const
{
    return impl_->waitForIdle(timeout);
}

std::size_t TaskScheduler::pendingCount() const
{
    return impl_->pendingCount();
}

void TaskScheduler::shutdown()
{
    impl_->shutdown();
}

}  // namespace wakatimels::lsp
