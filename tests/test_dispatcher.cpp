/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

#include "clipforge/dispatcher.hpp"

namespace clipforge {
namespace {

// One-shot gate the test thread opens to release blocked tasks.
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

TEST(DispatcherTest, RunsTaskAndSignalsCompletion) {
    Dispatcher dispatcher;
    std::atomic<bool> ran{false};
    TaskHandle handle = dispatcher.dispatch("simple", [&ran](const CancelToken&) { ran.store(true); });
    ASSERT_TRUE(handle.valid());
    handle.wait();
    EXPECT_TRUE(ran.load());
    EXPECT_TRUE(handle.finished());
}

TEST(DispatcherTest, TasksRunConcurrentlyWithoutLimit) {
    Dispatcher dispatcher;
    Gate gate;
    std::atomic<int> started{0};
    std::vector<TaskHandle> handles;
    for (int i = 0; i < 8; ++i) {
        handles.push_back(dispatcher.dispatch("blocked-" + std::to_string(i), [&](const CancelToken&) {
            started.fetch_add(1);
            gate.wait();
        }));
    }

    // Every task is running at once before any is released
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (started.load() < 8 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(started.load(), 8);
    EXPECT_EQ(dispatcher.activeCount(), 8u);
    for (const auto& handle : handles) {
        EXPECT_FALSE(handle.finished());
    }

    gate.open();
    for (const auto& handle : handles) handle.wait();
}

TEST(DispatcherTest, TaskExceptionsAreContained) {
    Dispatcher dispatcher;
    TaskHandle handle = dispatcher.dispatch("throws", [](const CancelToken&) {
        throw std::runtime_error("task blew up");
    });
    ASSERT_TRUE(handle.valid());
    handle.wait();
    EXPECT_TRUE(handle.finished());

    TaskHandle next = dispatcher.dispatch("after", [](const CancelToken&) {});
    EXPECT_TRUE(next.valid());
    next.wait();
}

TEST(DispatcherTest, ShutdownJoinsAndRefusesNewWork) {
    Dispatcher dispatcher;
    std::atomic<bool> finished{false};
    TaskHandle handle = dispatcher.dispatch("slow", [&finished](const CancelToken&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        finished.store(true);
    });
    ASSERT_TRUE(handle.valid());

    dispatcher.shutdown();
    EXPECT_TRUE(finished.load());
    EXPECT_FALSE(dispatcher.isRunning());
    EXPECT_EQ(dispatcher.activeCount(), 0u);

    TaskHandle refused = dispatcher.dispatch("late", [](const CancelToken&) {});
    EXPECT_FALSE(refused.valid());
}

TEST(DispatcherTest, CancellationIsRecordedOnly) {
    Dispatcher dispatcher;
    Gate gate;
    std::atomic<bool> sawCancel{false};
    TaskHandle handle = dispatcher.dispatch("cancel", [&](const CancelToken& token) {
        gate.wait();
        sawCancel.store(token.cancelled());
    });
    handle.cancel();
    EXPECT_TRUE(handle.token->cancelled());
    gate.open();
    handle.wait();
    EXPECT_TRUE(sawCancel.load());
}

TEST(DispatcherTest, InvalidTaskIsRefused) {
    Dispatcher dispatcher;
    EXPECT_FALSE(dispatcher.dispatch("null", Dispatcher::Task{}).valid());
}

}
}
