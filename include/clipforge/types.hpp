/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace clipforge {

// Opaque identifiers (string-based; generated by the Store).
using JobId = std::string;
using SceneId = std::string;
using ProjectId = std::string;

enum class SceneStatus : std::uint8_t { Pending, Generating, Rendering, Completed, Failed };

// Job lifecycle. Completed and Failed are terminal.
enum class JobStatus : std::uint8_t { Pending, Running, Completed, Failed };

enum class JobKind : std::uint8_t { SceneRender, ExportCombine, RenderAllAndCombine };

[[nodiscard]] const char* toString(SceneStatus status) noexcept;
[[nodiscard]] const char* toString(JobStatus status) noexcept;
[[nodiscard]] const char* toString(JobKind kind) noexcept;

[[nodiscard]] inline bool isTerminal(JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

} // namespace clipforge
