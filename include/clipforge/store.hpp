/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "clipforge/records.hpp"

namespace clipforge {

// In-memory registry of projects, scenes and jobs.
//
// Readers always receive copies. Writers pass a mutation that is applied to
// a copy under the lock and published only if the record's invariants still
// hold, so a concurrent reader never observes a half-applied update:
//   - a completed scene has a video locator
//   - a terminal job is never modified again
//   - job progress never decreases and stays within 0..100
class Store {
public:
    using SceneMutation = std::function<void(Scene&)>;
    using JobMutation = std::function<void(Job&)>;

    Store() = default;

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;
    Store(Store&&) = delete;
    Store& operator=(Store&&) = delete;

    [[nodiscard]] Project createProject(const std::string& name, const std::string& description = "");
    [[nodiscard]] std::optional<Project> project(const ProjectId& id) const;
    bool setProjectAudio(const ProjectId& id, const std::optional<std::string>& audioLocator);
    bool removeProject(const ProjectId& id);

    // Appends a scene after the project's current last order index.
    [[nodiscard]] std::optional<Scene> addScene(const ProjectId& projectId, const std::string& prompt,
                                                const std::optional<std::string>& code,
                                                SceneStatus status = SceneStatus::Pending);
    [[nodiscard]] std::optional<Scene> scene(const SceneId& id) const;
    // Scenes referenced by the project, ordered by orderIndex. Dangling references are skipped.
    [[nodiscard]] std::vector<Scene> scenesOf(const ProjectId& projectId) const;
    bool updateScene(const SceneId& id, const SceneMutation& mutate);
    // Moves a scene to orderIndex, swapping with the scene that held it.
    bool moveScene(const SceneId& id, int orderIndex);
    bool removeScene(const SceneId& id);

    [[nodiscard]] Job createJob(JobKind kind, const std::optional<SceneId>& sceneId,
                                const std::optional<ProjectId>& projectId);
    [[nodiscard]] std::optional<Job> job(const JobId& id) const;
    [[nodiscard]] std::vector<Job> jobs() const;
    bool updateJob(const JobId& id, const JobMutation& mutate);

private:
    [[nodiscard]] static std::string generateId(const char* prefix);

    mutable std::mutex mutex_;
    std::unordered_map<ProjectId, Project> projects_;
    std::unordered_map<SceneId, Scene> scenes_;
    std::unordered_map<JobId, Job> jobs_;
};

}
