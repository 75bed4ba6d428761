/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "clipforge/store.hpp"
#include "clipforge/logger.hpp"
#include <algorithm>
#include <atomic>
#include <sstream>
#include <unistd.h>

namespace clipforge {

std::string Store::generateId(const char* prefix) {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << prefix << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

Project Store::createProject(const std::string& name, const std::string& description) {
    Project project;
    project.id = generateId("proj_");
    project.name = name;
    project.description = description;
    project.createdAt = std::chrono::system_clock::now();
    project.updatedAt = project.createdAt;

    std::lock_guard<std::mutex> lock(mutex_);
    projects_[project.id] = project;
    LOG_DEBUG("Project created: " + project.id);
    return project;
}

std::optional<Project> Store::project(const ProjectId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(id);
    if (it == projects_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Store::setProjectAudio(const ProjectId& id, const std::optional<std::string>& audioLocator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(id);
    if (it == projects_.end()) {
        return false;
    }
    it->second.audioLocator = audioLocator;
    it->second.updatedAt = std::chrono::system_clock::now();
    return true;
}

bool Store::removeProject(const ProjectId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(id);
    if (it == projects_.end()) {
        return false;
    }
    for (const auto& sceneId : it->second.sceneIds) {
        scenes_.erase(sceneId);
    }
    projects_.erase(it);
    LOG_DEBUG("Project removed: " + id);
    return true;
}

std::optional<Scene> Store::addScene(const ProjectId& projectId, const std::string& prompt,
                                     const std::optional<std::string>& code, SceneStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(projectId);
    if (it == projects_.end()) {
        return std::nullopt;
    }
    Project& project = it->second;

    // max + 1 rather than count, so indices stay unique after removals
    int nextIndex = 0;
    for (const auto& sceneId : project.sceneIds) {
        auto sit = scenes_.find(sceneId);
        if (sit != scenes_.end()) {
            nextIndex = std::max(nextIndex, sit->second.orderIndex + 1);
        }
    }

    Scene scene;
    scene.id = generateId("scene_");
    scene.projectId = projectId;
    scene.prompt = prompt;
    scene.code = code;
    scene.status = status;
    scene.orderIndex = nextIndex;
    scene.createdAt = std::chrono::system_clock::now();
    scene.updatedAt = scene.createdAt;

    scenes_[scene.id] = scene;
    project.sceneIds.push_back(scene.id);
    project.updatedAt = scene.createdAt;
    LOG_DEBUG("Scene created: " + scene.id + " (project " + projectId + ", index " +
              std::to_string(nextIndex) + ")");
    return scene;
}

std::optional<Scene> Store::scene(const SceneId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scenes_.find(id);
    if (it == scenes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Scene> Store::scenesOf(const ProjectId& projectId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Scene> out;
    auto it = projects_.find(projectId);
    if (it == projects_.end()) {
        return out;
    }
    for (const auto& sceneId : it->second.sceneIds) {
        auto sit = scenes_.find(sceneId);
        if (sit != scenes_.end()) {
            out.push_back(sit->second);
        }
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const Scene& a, const Scene& b) { return a.orderIndex < b.orderIndex; });
    return out;
}

bool Store::updateScene(const SceneId& id, const SceneMutation& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scenes_.find(id);
    if (it == scenes_.end()) {
        return false;
    }

    Scene next = it->second;
    mutate(next);
    next.id = it->second.id;
    next.projectId = it->second.projectId;
    next.orderIndex = it->second.orderIndex;

    if (next.status == SceneStatus::Completed && !next.videoLocator) {
        LOG_ERROR("Rejected scene update: " + id + " completed without a video locator");
        return false;
    }

    next.updatedAt = std::chrono::system_clock::now();
    it->second = std::move(next);
    return true;
}

bool Store::moveScene(const SceneId& id, int orderIndex) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scenes_.find(id);
    if (it == scenes_.end() || orderIndex < 0) {
        return false;
    }
    auto pit = projects_.find(it->second.projectId);
    if (pit != projects_.end()) {
        for (const auto& otherId : pit->second.sceneIds) {
            auto oit = scenes_.find(otherId);
            if (oit != scenes_.end() && otherId != id && oit->second.orderIndex == orderIndex) {
                oit->second.orderIndex = it->second.orderIndex;
                oit->second.updatedAt = std::chrono::system_clock::now();
                break;
            }
        }
    }
    it->second.orderIndex = orderIndex;
    it->second.updatedAt = std::chrono::system_clock::now();
    return true;
}

bool Store::removeScene(const SceneId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scenes_.find(id);
    if (it == scenes_.end()) {
        return false;
    }
    auto pit = projects_.find(it->second.projectId);
    if (pit != projects_.end()) {
        auto& ids = pit->second.sceneIds;
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        pit->second.updatedAt = std::chrono::system_clock::now();
    }
    scenes_.erase(it);
    LOG_DEBUG("Scene removed: " + id);
    return true;
}

Job Store::createJob(JobKind kind, const std::optional<SceneId>& sceneId,
                     const std::optional<ProjectId>& projectId) {
    Job job;
    job.id = generateId("job_");
    job.kind = kind;
    job.targetSceneId = sceneId;
    job.targetProjectId = projectId;
    job.status = JobStatus::Pending;
    job.phaseLabel = "pending";
    job.progress = 0;
    job.createdAt = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    jobs_[job.id] = job;
    return job;
}

std::optional<Job> Store::job(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Job> Store::jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> out;
    out.reserve(jobs_.size());
    for (const auto& entry : jobs_) {
        out.push_back(entry.second);
    }
    std::sort(out.begin(), out.end(),
              [](const Job& a, const Job& b) { return a.createdAt < b.createdAt; });
    return out;
}

bool Store::updateJob(const JobId& id, const JobMutation& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return false;
    }
    const Job& current = it->second;
    if (isTerminal(current.status)) {
        LOG_WARN("Ignoring update to finished job " + id + " (" + toString(current.status) + ")");
        return false;
    }

    Job next = current;
    mutate(next);
    next.id = current.id;
    next.kind = current.kind;
    next.createdAt = current.createdAt;
    next.progress = std::min(100, std::max(next.progress, current.progress));

    it->second = std::move(next);
    return true;
}

}
