/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "clipforge/dispatcher.hpp"
#include "clipforge/logger.hpp"
#include <chrono>

namespace clipforge {

void CancelToken::cancel() noexcept {
    if (!cancelled_.exchange(true)) {
        LOG_INFO("Cancellation requested (not observed by the render pipeline)");
    }
}

bool TaskHandle::finished() const {
    return done.valid() && done.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void TaskHandle::wait() const {
    if (done.valid()) {
        done.wait();
    }
}

void TaskHandle::cancel() const noexcept {
    if (token) {
        token->cancel();
    }
}

Dispatcher::Dispatcher() noexcept {
    LOG_DEBUG("Dispatcher created");
}

Dispatcher::~Dispatcher() {
    shutdown();
}

TaskHandle Dispatcher::dispatch(const std::string& name, Task task) noexcept {
    if (shutdown_.load()) {
        LOG_WARN("Cannot dispatch task to stopped dispatcher: " + name);
        return {};
    }
    if (!task) {
        LOG_ERROR("Invalid task provided: " + name);
        return {};
    }

    try {
        reapFinished();

        auto promise = std::make_shared<std::promise<void>>();
        auto finished = std::make_shared<std::atomic<bool>>(false);
        auto token = std::make_shared<CancelToken>();
        const std::uint64_t taskId = nextTaskId_.fetch_add(1) + 1;

        TaskHandle handle;
        handle.done = promise->get_future().share();
        handle.token = token;

        std::lock_guard<std::mutex> lock(workersMutex_);
        if (shutdown_.load()) {
            LOG_WARN("Dispatcher stopped before task could start: " + name);
            return {};
        }
        std::thread thread([name, taskId, promise, finished, token, task = std::move(task)]() {
            // Name this thread for logging
            setThreadName(getThreadName(taskId));
            LOG_DEBUG("Task started: " + name);

            try {
                task(*token);
            } catch (const std::exception& e) {
                LOG_ERROR("Task error: " + std::string(e.what()) + " (task: " + name + ")");
            } catch (...) {
                LOG_ERROR("Unknown task error (task: " + name + ")");
            }

            LOG_DEBUG("Task finished: " + name);
            clearThreadName();
            promise->set_value();
            finished->store(true);
        });
        workers_.push_back(Worker{std::move(thread), finished});
        return handle;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start task " + name + ": " + std::string(e.what()));
        return {};
    } catch (...) {
        LOG_ERROR("Failed to start task: " + name);
        return {};
    }
}

void Dispatcher::shutdown() noexcept {
    if (shutdown_.exchange(true)) {
        return;
    }

    LOG_DEBUG("Stopping dispatcher...");

    std::vector<Worker> pending;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        pending.swap(workers_);
    }

    for (auto& worker : pending) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    LOG_DEBUG("Dispatcher stopped (" + std::to_string(pending.size()) + " tasks joined)");
}

std::size_t Dispatcher::activeCount() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(workersMutex_);
        std::size_t active = 0;
        for (const auto& worker : workers_) {
            if (!worker.finished->load()) ++active;
        }
        return active;
    } catch (...) {
        return 0;
    }
}

void Dispatcher::reapFinished() {
    std::lock_guard<std::mutex> lock(workersMutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->finished->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

}
