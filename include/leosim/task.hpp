/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __LEOSIM_TASK_HPP
#define __LEOSIM_TASK_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace leosim {

// The status of a background task
enum class TaskStatus {
    Idle,
    Running,
    Done,
    Failed
};

std::string_view toString(TaskStatus status);

/**
 * Runs one unit of work at a time on a worker thread.
 *
 * The status moves Idle -> Running -> Done or Failed and is only written by
 * the task itself. A finished task can be started again.
 */
class BackgroundTask {
public:
    BackgroundTask() = default;
    ~BackgroundTask();

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    /**
     * Starts the work on a new thread.
     * @return false if the task is already running
     * @throws std::system_error if the worker thread can't be created
     */
    bool start(std::function<void()> work);

    TaskStatus status() const;

    /** Message of the exception that failed the last run, empty otherwise. */
    std::string error() const;

    /** Blocks until the current run, if any, has finished. */
    void wait();

private:
    std::atomic<TaskStatus> _status = TaskStatus::Idle;
    std::thread worker;
    std::mutex workerMutex;
    mutable std::mutex errorMutex;
    std::string lastError;

    void fail(const std::string &message);
};

}

#endif
