/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "clipforge/artifacts.hpp"
#include "clipforge/config.hpp"
#include "clipforge/records.hpp"

namespace clipforge {

enum class CombineError : uint8_t {
    None = 0,
    NoScenes,
    NoArtifacts,
    ConcatFailed,
    WorkspaceError
};

struct CombineResult {
    bool ok = false;
    CombineError error = CombineError::None;
    std::string message;
    std::string videoLocator;
    explicit operator bool() const noexcept { return ok; }
};

class Combiner {
public:
    virtual ~Combiner() = default;
    // scenes must already be in order index order
    [[nodiscard]] virtual CombineResult combine(const std::vector<Scene>& scenes, const ProjectId& projectId,
                                                const std::optional<std::string>& audioLocator) noexcept = 0;
};

// Stream-copy concatenation of scene artifacts with an optional audio track,
// published as <projectId>_final.mp4.
class MediaCombiner final : public Combiner {
public:
    MediaCombiner(const Config& config, const ArtifactStore& artifacts);

    MediaCombiner(const MediaCombiner&) = delete;
    MediaCombiner& operator=(const MediaCombiner&) = delete;

    [[nodiscard]] CombineResult combine(const std::vector<Scene>& scenes, const ProjectId& projectId,
                                        const std::optional<std::string>& audioLocator) noexcept override;

    // One concat demuxer line: file '<path>' with embedded quotes escaped.
    [[nodiscard]] static std::string manifestEntry(const std::string& path);

private:
    Config config_;
    const ArtifactStore& artifacts_;
};

[[nodiscard]] const char* toString(CombineError error) noexcept;

}
