/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "clipforge/types.hpp"

namespace clipforge {

const char* toString(SceneStatus status) noexcept {
    switch (status) {
        case SceneStatus::Pending: return "pending";
        case SceneStatus::Generating: return "generating";
        case SceneStatus::Rendering: return "rendering";
        case SceneStatus::Completed: return "completed";
        case SceneStatus::Failed: return "failed";
        default: return "unknown";
    }
}

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Running: return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        default: return "unknown";
    }
}

const char* toString(JobKind kind) noexcept {
    switch (kind) {
        case JobKind::SceneRender: return "single-scene-render";
        case JobKind::ExportCombine: return "export-combine";
        case JobKind::RenderAllAndCombine: return "render-all-and-combine";
        default: return "unknown";
    }
}

}
