/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "clipforge/combine.hpp"
#include "clipforge/config.hpp"
#include "clipforge/dispatcher.hpp"
#include "clipforge/records.hpp"
#include "clipforge/render.hpp"
#include "clipforge/store.hpp"

namespace clipforge {

// Prompt in, scene source out. Throws to report a generation failure.
using CodeGenerator = std::function<std::string(const std::string& prompt)>;

enum class PreconditionError : uint8_t {
    None = 0,
    SceneNotFound,
    ProjectNotFound,
    MissingCode,
    NoScenes,
    SceneNotReady,
    DispatchFailed
};

struct SubmitResult {
    bool ok = false;
    PreconditionError error = PreconditionError::None;
    std::string message;
    Job job;              // snapshot taken at submission (pending)
    TaskHandle handle;
    explicit operator bool() const noexcept { return ok; }
};

struct SceneResult {
    bool ok = false;
    PreconditionError error = PreconditionError::None;
    std::string message;
    Scene scene;
    explicit operator bool() const noexcept { return ok; }
};

// Drives render jobs against a Store. Preconditions are checked on the
// caller's thread; everything after submission runs on a dispatched task and
// reports only through the Job and Scene records.
class Orchestrator {
public:
    Orchestrator(Store& store, Renderer& renderer, Combiner& combiner, const Config& config,
                 CodeGenerator generator = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    [[nodiscard]] SubmitResult submitSceneRender(const SceneId& sceneId) noexcept;
    [[nodiscard]] SubmitResult submitExport(const ProjectId& projectId) noexcept;
    [[nodiscard]] SubmitResult submitRenderAll(const ProjectId& projectId) noexcept;

    // Synchronous. Without code the generator is asked for it.
    [[nodiscard]] SceneResult createScene(const ProjectId& projectId, const std::string& prompt,
                                          const std::optional<std::string>& code = std::nullopt) noexcept;
    [[nodiscard]] SceneResult regenerateScene(const SceneId& sceneId,
                                              const std::optional<std::string>& prompt = std::nullopt) noexcept;

    [[nodiscard]] std::optional<Job> job(const JobId& jobId) const { return store_.job(jobId); }

    // Blocks until the job's task has finished. False for unknown jobs.
    bool wait(const JobId& jobId);

    // Task handles still held. Finished ones are dropped on the next
    // submission or once waited on.
    [[nodiscard]] std::size_t trackedJobs() const;

    void shutdown() noexcept;

private:
    struct Outcome {
        bool ok = false;
        std::string message;
    };

    [[nodiscard]] SubmitResult launch(Job job, std::function<void(const Job&)> body) noexcept;
    [[nodiscard]] Outcome renderScene(const Scene& scene) noexcept;
    void failJob(const JobId& jobId, const std::string& message) noexcept;
    void completeJob(const JobId& jobId, const std::string& outputLocator) noexcept;
    void setPhase(const JobId& jobId, const std::string& label, int progress) noexcept;
    [[nodiscard]] std::string generateCode(const std::string& prompt) const;

    Store& store_;
    Renderer& renderer_;
    Combiner& combiner_;
    Config config_;
    CodeGenerator generator_;
    Dispatcher dispatcher_;

    mutable std::mutex handlesMutex_;
    std::unordered_map<JobId, TaskHandle> handles_;
};

[[nodiscard]] const char* toString(PreconditionError error) noexcept;

}
