/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace clipforge {

// Cancellation request flag. Tasks may poll it; the render pipeline currently does not.
class CancelToken {
public:
    void cancel() noexcept;
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct TaskHandle {
    std::shared_future<void> done;
    std::shared_ptr<CancelToken> token;

    [[nodiscard]] bool valid() const noexcept { return done.valid(); }
    [[nodiscard]] bool finished() const;
    void wait() const;
    void cancel() const noexcept;
};

// Runs each task on its own thread, started immediately. There is no
// concurrency limit. Finished threads are joined on later dispatches and
// at shutdown.
class Dispatcher {
public:
    using Task = std::function<void(const CancelToken&)>;

    Dispatcher() noexcept;
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = delete;
    Dispatcher& operator=(Dispatcher&&) = delete;

    // Invalid handle when the dispatcher is shut down or the thread cannot start.
    [[nodiscard]] TaskHandle dispatch(const std::string& name, Task task) noexcept;

    // Waits for every outstanding task. Further dispatches are refused.
    void shutdown() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return !shutdown_.load(); }
    [[nodiscard]] std::size_t activeCount() const noexcept;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void reapFinished();

    std::atomic<bool> shutdown_{false};
    std::atomic<std::uint64_t> nextTaskId_{0};

    mutable std::mutex workersMutex_;
    std::vector<Worker> workers_;
};

}
