/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <leosim/task.hpp>

#include <atomic>
#include <future>
#include <stdexcept>

namespace leosim {
namespace {

TEST(TaskTest, StatusNames) {
    EXPECT_EQ(toString(TaskStatus::Idle), "idle");
    EXPECT_EQ(toString(TaskStatus::Running), "in-progress");
    EXPECT_EQ(toString(TaskStatus::Done), "done");
    EXPECT_EQ(toString(TaskStatus::Failed), "error");
}

TEST(TaskTest, RunsToCompletion) {
    BackgroundTask task;
    EXPECT_EQ(task.status(), TaskStatus::Idle);

    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<int> runs = 0;

    ASSERT_TRUE(task.start([released, &runs] {
        released.wait();
        ++runs;
    }));
    EXPECT_EQ(task.status(), TaskStatus::Running);

    // A second start is rejected while the first is still running
    EXPECT_FALSE(task.start([&runs] { runs += 100; }));

    release.set_value();
    task.wait();
    EXPECT_EQ(task.status(), TaskStatus::Done);
    EXPECT_EQ(runs.load(), 1);
    EXPECT_TRUE(task.error().empty());
}

TEST(TaskTest, ReportsFailure) {
    BackgroundTask task;
    ASSERT_TRUE(task.start([] { throw std::runtime_error("element generation failed"); }));
    task.wait();
    EXPECT_EQ(task.status(), TaskStatus::Failed);
    EXPECT_EQ(task.error(), "element generation failed");
}

TEST(TaskTest, ReportsNonStandardFailure) {
    BackgroundTask task;
    ASSERT_TRUE(task.start([] { throw 42; }));
    task.wait();
    EXPECT_EQ(task.status(), TaskStatus::Failed);
    EXPECT_EQ(task.error(), "unknown error");

    // The task can still be started afterwards
    ASSERT_TRUE(task.start([] {}));
    task.wait();
    EXPECT_EQ(task.status(), TaskStatus::Done);
}

TEST(TaskTest, RestartsAfterFinishing) {
    BackgroundTask task;
    ASSERT_TRUE(task.start([] { throw std::runtime_error("first run"); }));
    task.wait();
    ASSERT_EQ(task.status(), TaskStatus::Failed);

    std::atomic<bool> ran = false;
    ASSERT_TRUE(task.start([&ran] { ran = true; }));
    task.wait();
    EXPECT_TRUE(ran.load());
    EXPECT_EQ(task.status(), TaskStatus::Done);
    EXPECT_TRUE(task.error().empty());
}

TEST(TaskTest, WaitWithoutStart) {
    BackgroundTask task;
    task.wait();
    EXPECT_EQ(task.status(), TaskStatus::Idle);
}

}
}
