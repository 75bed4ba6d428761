/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "clipforge/artifacts.hpp"
#include "clipforge/config.hpp"
#include "clipforge/types.hpp"

namespace clipforge {

enum class RenderError : uint8_t {
    None = 0,
    EngineFailed,
    NoArtifact,
    WorkspaceError
};

struct RenderResult {
    bool ok = false;
    RenderError error = RenderError::None;
    std::string message;
    std::string videoLocator;
    std::optional<std::string> thumbnailLocator;
    double durationSeconds = 0.0;
    explicit operator bool() const noexcept { return ok; }
};

class Renderer {
public:
    virtual ~Renderer() = default;
    [[nodiscard]] virtual RenderResult render(const std::string& code, const SceneId& sceneId) noexcept = 0;
};

// Runs one scene script through the external engine inside a private
// workspace and publishes <sceneId>.mp4 (plus a best-effort thumbnail)
// into the output store.
class EngineRenderer final : public Renderer {
public:
    EngineRenderer(const Config& config, const ArtifactStore& artifacts);

    EngineRenderer(const EngineRenderer&) = delete;
    EngineRenderer& operator=(const EngineRenderer&) = delete;

    [[nodiscard]] RenderResult render(const std::string& code, const SceneId& sceneId) noexcept override;

    // Container duration in seconds; the configured fallback when probing fails.
    [[nodiscard]] double probeDuration(const std::filesystem::path& video) const noexcept;

private:
    [[nodiscard]] std::optional<std::filesystem::path> findArtifact(const std::filesystem::path& mediaDir,
                                                                   const SceneId& sceneId) const;
    [[nodiscard]] std::optional<std::string> extractThumbnail(const std::filesystem::path& video,
                                                              const SceneId& sceneId) const noexcept;

    Config config_;
    const ArtifactStore& artifacts_;
};

[[nodiscard]] const char* toString(RenderError error) noexcept;

}
