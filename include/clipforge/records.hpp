/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "clipforge/types.hpp"

namespace clipforge {

using Timestamp = std::chrono::system_clock::time_point;

struct Scene {
    SceneId id;
    ProjectId projectId;
    std::string prompt;
    std::optional<std::string> code;
    SceneStatus status = SceneStatus::Pending;
    std::optional<std::string> videoLocator;
    std::optional<std::string> thumbnailLocator;
    double durationSeconds = 0.0;
    int orderIndex = 0;
    std::optional<std::string> error;
    Timestamp createdAt;
    Timestamp updatedAt;

    [[nodiscard]] bool hasCode() const noexcept { return code.has_value() && !code->empty(); }
    [[nodiscard]] bool hasArtifact() const noexcept {
        return status == SceneStatus::Completed && videoLocator.has_value();
    }
};

struct Project {
    ProjectId id;
    std::string name;
    std::string description;
    std::vector<SceneId> sceneIds;      // insertion order; combine order comes from Scene::orderIndex
    std::optional<std::string> audioLocator;
    Timestamp createdAt;
    Timestamp updatedAt;
};

struct Job {
    JobId id;
    JobKind kind = JobKind::SceneRender;
    std::optional<SceneId> targetSceneId;
    std::optional<ProjectId> targetProjectId;
    JobStatus status = JobStatus::Pending;
    std::string phaseLabel;
    int progress = 0;
    std::optional<std::string> outputLocator;
    std::optional<std::string> error;
    Timestamp createdAt;
};

}
