/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <leosim/task.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <system_error>

using spdlog::info;

namespace leosim {

std::string_view toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Idle: return "idle";
        case TaskStatus::Running: return "in-progress";
        case TaskStatus::Done: return "done";
        case TaskStatus::Failed: return "error";
    }
    return "unknown";
}

BackgroundTask::~BackgroundTask() {
    wait();
}

bool BackgroundTask::start(std::function<void()> work) {
    TaskStatus expected = _status.load();
    do {
        if (expected == TaskStatus::Running) {
            return false;
        }
    } while (!_status.compare_exchange_weak(expected, TaskStatus::Running));

    std::lock_guard<std::mutex> lock(workerMutex);
    if (worker.joinable()) {
        worker.join();
    }
    {
        std::lock_guard<std::mutex> errorLock(errorMutex);
        lastError.clear();
    }

    try {
        worker = std::thread([this, work = std::move(work)] {
            try {
                work();
                _status.store(TaskStatus::Done);
                info("Background task finished.");
            } catch (const std::exception &e) {
                fail(e.what());
            } catch (...) {
                fail("unknown error");
            }
        });
    } catch (const std::system_error &e) {
        spdlog::error("Couldn't start background task: {}", e.what());
        _status.store(TaskStatus::Idle);
        throw;
    }
    return true;
}

void BackgroundTask::fail(const std::string &message) {
    {
        std::lock_guard<std::mutex> errorLock(errorMutex);
        lastError = message;
    }
    spdlog::error("Background task failed: {}", message);
    _status.store(TaskStatus::Failed);
}

TaskStatus BackgroundTask::status() const {
    return _status.load();
}

std::string BackgroundTask::error() const {
    std::lock_guard<std::mutex> lock(errorMutex);
    return lastError;
}

void BackgroundTask::wait() {
    std::lock_guard<std::mutex> lock(workerMutex);
    if (worker.joinable()) {
        worker.join();
    }
}

}
